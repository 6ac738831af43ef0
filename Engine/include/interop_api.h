#pragma once

#if defined(_WIN32)
    #if defined(ENGRAM_EXPORT)
        #define ENGRAM_API __declspec(dllexport)
    #else
        #define ENGRAM_API __declspec(dllimport)
    #endif
#else
    #define ENGRAM_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage, "<Kind>: <message>"
ENGRAM_API const char* engram_get_last_error();
ENGRAM_API const char* engram_get_version();

// =============================================================================
//  Bundle Reader
// =============================================================================

typedef void* h_bundle_reader_t;

// Parse a bundle held in memory (JSON text, not NUL terminated)
ENGRAM_API h_bundle_reader_t engram_reader_open(const char* bundle_text, size_t len);
ENGRAM_API h_bundle_reader_t engram_reader_open_file(const char* path);
ENGRAM_API void engram_reader_destroy(h_bundle_reader_t handle);

ENGRAM_API size_t engram_reader_file_count(h_bundle_reader_t handle);

// Name of file index, owned by the reader; NULL when out of range
ENGRAM_API const char* engram_reader_file_name(h_bundle_reader_t handle, size_t index);

// Rebuild a named payload. *out_data must be released with engram_free_buffer.
ENGRAM_API bool engram_reader_reconstruct(h_bundle_reader_t handle, const char* name,
                                          uint8_t** out_data, size_t* out_len);

ENGRAM_API void engram_free_buffer(uint8_t* data);

#ifdef __cplusplus
}
#endif
