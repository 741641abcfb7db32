#ifndef _SPLITFILE_API_DEFS_H
#define _SPLITFILE_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef SPLITFILE_API_EXPORTS
#    define SPLITFILE_API_DECL __declspec (dllexport)
#  else
#    define SPLITFILE_API_DECL __declspec (dllimport)
#  endif
#else
#  define SPLITFILE_API_DECL __attribute__((visibility("default")))
#endif

#endif
