#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef recache_EXPORTS
#ifdef __GNUC__
#define RECACHE_EXPORT __attribute__ ((dllexport))
#else
#define RECACHE_EXPORT __declspec(dllexport)
#define DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define RECACHE_EXPORT __attribute__ ((dllimport))
#else
#define RECACHE_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define RECACHE_EXPORT __attribute__ ((visibility ("default")))
#else
#define RECACHE_EXPORT
#endif
#endif

#ifdef DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
