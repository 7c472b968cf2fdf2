#include <gtest/gtest.h>

#include <string>

#include "MediaType.hpp"
#include "ExpectReaderError.hpp"

TEST(MediaType, Plain)
{
  hpr::MediaType mediaType = hpr::ParseMediaType("application/octet-stream");
  EXPECT_EQ("application/octet-stream", mediaType.type);
  EXPECT_TRUE(mediaType.parameters.empty());
}

TEST(MediaType, Parameters)
{
  hpr::MediaType mediaType = hpr::ParseMediaType("Multipart/ByteRanges; Boundary=3d6b6a416f9b5 ;charset=\"a;b\\\"c\"");
  EXPECT_EQ("multipart/byteranges", mediaType.type);
  ASSERT_TRUE(mediaType.parameter("boundary"));
  EXPECT_EQ("3d6b6a416f9b5", *mediaType.parameter("boundary"));
  EXPECT_EQ("a;b\"c", *mediaType.parameter("charset"));
  EXPECT_FALSE(mediaType.parameter("q"));
}

TEST(MediaType, Malformed)
{
  EXPECT_READER_ERROR(hpr::ParseMediaType(""), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseMediaType("multipart"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseMediaType("multipart/"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseMediaType("text/plain; boundary"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseMediaType("text/plain; boundary=\"abc"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseMediaType("text/plain; a=1; a=2"), hpr::ErrorCode::ParseFailed);
}

TEST(ContentRange, Parse)
{
  hpr::ContentRange range = hpr::ParseContentRange("bytes 131072-262143/300000");
  EXPECT_EQ(131072u, range.start);
  EXPECT_EQ(262143u, range.end);
  ASSERT_TRUE(range.totalSize);
  EXPECT_EQ(300000u, *range.totalSize);

  range = hpr::ParseContentRange(" bytes 0-0/*");
  EXPECT_EQ(0u, range.start);
  EXPECT_EQ(0u, range.end);
  EXPECT_FALSE(range.totalSize);
}

TEST(ContentRange, Malformed)
{
  EXPECT_READER_ERROR(hpr::ParseContentRange("0-10/100"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseContentRange("bytes 10-0/100"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseContentRange("bytes -10/100"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseContentRange("bytes 0-10"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseContentRange("bytes */100"), hpr::ErrorCode::ParseFailed);
  EXPECT_READER_ERROR(hpr::ParseContentRange("bytes 0-99999999999999999999999/1"), hpr::ErrorCode::ParseFailed);
}

TEST(ContentRange, MalformedReportsLocation)
{
  try
  {
    hpr::ParseContentRange("bytes 10-0/100");
    FAIL() << "ParseFailed expected";
  }
  catch (hpr::ReaderError const & e)
  {
    EXPECT_EQ(hpr::ErrorCode::ParseFailed, e.code());
    EXPECT_EQ(0u, std::string(e.message()).find("Malformed response at ")) << e.message();
    EXPECT_NE(std::string::npos, std::string(e.message()).find("MediaType.cpp")) << e.message();
  }
}
