#ifndef _HPR_API_DEFS_H
#define _HPR_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef HPR_API_EXPORTS
#    define HPR_API_DECL __declspec (dllexport)
#  else
#    define HPR_API_DECL __declspec (dllimport)
#  endif
#else
#  define HPR_API_DECL __attribute__((visibility("default")))
#endif

#endif
