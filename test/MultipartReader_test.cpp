#include <gtest/gtest.h>

#include <string>
#include <vector>
#include "hpr/ReaderError.hpp"
#include "MultipartReader.hpp"

namespace
{
  std::vector<std::string> ReadParts(std::string const & body, std::string const & boundary)
  {
    std::vector<std::string> parts;
    hpr::MultipartReader reader(body, boundary);
    hpr::MultipartReader::Part part;
    while (reader.nextPart(part))
      parts.push_back(std::string(part.data, part.size));
    return parts;
  }
}

TEST(MultipartReader, Basic)
{
  std::string const body =
    "\r\n--XYZ\r\n"
    "Content-Type: text/plain\r\n"
    "Content-Range: bytes 0-3/10\r\n"
    "\r\n"
    "0123"
    "\r\n--XYZ\r\n"
    "content-range: bytes 6-9/10\r\n"
    "\r\n"
    "6789"
    "\r\n--XYZ--\r\n";

  hpr::MultipartReader reader(body, "XYZ");
  hpr::MultipartReader::Part part;
  ASSERT_TRUE(reader.nextPart(part));
  EXPECT_EQ("0123", std::string(part.data, part.size));
  ASSERT_NE(nullptr, part.header("Content-Range"));
  EXPECT_EQ("bytes 0-3/10", *part.header("content-range"));
  EXPECT_EQ("text/plain", *part.header("Content-Type"));

  ASSERT_TRUE(reader.nextPart(part));
  EXPECT_EQ("6789", std::string(part.data, part.size));
  EXPECT_EQ("bytes 6-9/10", *part.header("Content-Range"));
  EXPECT_EQ(nullptr, part.header("Content-Type"));

  EXPECT_FALSE(reader.nextPart(part));
  EXPECT_FALSE(reader.nextPart(part));
}

TEST(MultipartReader, BinaryBodyWithLineBreaks)
{
  std::string payload("\r\n--XY\r\n\0\n--X", 13);
  std::string body = "--XYZ\r\n\r\n" + payload + "\r\n--XYZ--";
  EXPECT_EQ(std::vector<std::string>{payload}, ReadParts(body, "XYZ"));
}

TEST(MultipartReader, PreambleAndBareLF)
{
  std::string const body =
    "This is a preamble --XYZ not at line start\n"
    "--XYZ  \n"
    "Content-Range: bytes 0-1/2\n"
    "\n"
    "ab"
    "\n--XYZ--";
  EXPECT_EQ(std::vector<std::string>{"ab"}, ReadParts(body, "XYZ"));
}

TEST(MultipartReader, EmptyBody)
{
  std::string const body = "--XYZ\r\n\r\n\r\n--XYZ\r\n\r\nz\r\n--XYZ--\r\n";
  EXPECT_EQ((std::vector<std::string>{"", "z"}), ReadParts(body, "XYZ"));
}

TEST(MultipartReader, BrokenFraming)
{
  auto expectParseFailed = [](std::string const & body)
  {
    try
    {
      ReadParts(body, "XYZ");
      ADD_FAILURE() << "No error for: " << body;
    }
    catch (hpr::ReaderError const & e)
    {
      EXPECT_EQ(hpr::ErrorCode::ParseFailed, e.code()) << body;
    }
  };

  expectParseFailed("");
  expectParseFailed("no delimiter at all");
  expectParseFailed("--XYZ\r\nContent-Range: bytes 0-1/2\r\n");         // headers not terminated
  expectParseFailed("--XYZ\r\n\r\nabc");                                 // truncated body
  expectParseFailed("--XYZ\r\nbroken header\r\n\r\nabc\r\n--XYZ--");
  expectParseFailed("--XYZ garbage\r\n\r\nabc\r\n--XYZ--");
  expectParseFailed("--XYZ");
}

TEST(MultipartReader, EmptyBoundary)
{
  std::string const body("--\r\n\r\n");
  EXPECT_THROW(hpr::MultipartReader(body, ""), hpr::ReaderError);
}
