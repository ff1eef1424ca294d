#pragma once

#if defined(_WIN32) || defined(WIN32)
#define CROCKID_EXPORT __declspec(dllexport)
#else
#define CROCKID_EXPORT __attribute__((visibility("default")))
#endif
#define CROCKID_C_API extern "C" CROCKID_EXPORT

#ifdef __GNUC__
#define CROCKID_WARN_UNUSED __attribute__((warn_unused_result))
#else
#define CROCKID_WARN_UNUSED
#endif
