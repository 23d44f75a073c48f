#pragma once
#ifndef STANZA_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define STANZA_PLATFORM_WINDOWS 1
#else
#define STANZA_PLATFORM_WINDOWS 0
#endif
#if STANZA_PLATFORM_WINDOWS
#if defined(STANZA_BUILD_SHARED)
#define STANZA_API __declspec(dllexport)
#elif defined(STANZA_SHARED)
#define STANZA_API __declspec(dllimport)
#else
#define STANZA_API
#endif
#else
#if defined(STANZA_BUILD_SHARED) || defined(STANZA_SHARED)
#if __GNUC__ >= 4
#define STANZA_API __attribute__((visibility("default")))
#else
#define STANZA_API
#endif // __GNUC__
#else
#define STANZA_API
#endif // STANZA_BUILD_SHARED || STANZA_SHARED
#endif // STANZA_PLATFORM_WINDOWS
#endif // STANZA_API
