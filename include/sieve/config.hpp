#pragma once
#ifndef SIEVE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define SIEVE_PLATFORM_WINDOWS 1
#else
#define SIEVE_PLATFORM_WINDOWS 0
#endif
#if SIEVE_PLATFORM_WINDOWS
#if defined(SIEVE_BUILD_SHARED)
#define SIEVE_API __declspec(dllexport)
#elif defined(SIEVE_SHARED)
#define SIEVE_API __declspec(dllimport)
#else
#define SIEVE_API
#endif
#else
#if defined(SIEVE_BUILD_SHARED) || defined(SIEVE_SHARED)
#if __GNUC__ >= 4
#define SIEVE_API __attribute__((visibility("default")))
#else
#define SIEVE_API
#endif // __GNUC__
#else
#define SIEVE_API
#endif // SIEVE_BUILD_SHARED || SIEVE_SHARED
#endif // SIEVE_PLATFORM_WINDOWS
#endif // SIEVE_API

// Nesting limit used by `decode_string` when parsing and by error rendering
// when pretty-printing an offending value. Override with -DSIEVE_DEFAULT_MAX_DEPTH=N
#ifndef SIEVE_DEFAULT_MAX_DEPTH
#define SIEVE_DEFAULT_MAX_DEPTH 512
#endif

// Indentation used when an offending value is printed inside a decode error
#ifndef SIEVE_ERROR_DUMP_INDENT
#define SIEVE_ERROR_DUMP_INDENT 4
#endif
