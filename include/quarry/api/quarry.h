#pragma once

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
extern "C" {
#else
#include <stddef.h>
#include <stdint.h>
#endif

#ifndef QUARRY_API
#if defined(_WIN32) && !defined(QUARRY_STATIC)
#ifdef quarry_EXPORTS
#define QUARRY_API __declspec(dllexport)
#else
#define QUARRY_API __declspec(dllimport)
#endif
#else
#define QUARRY_API __attribute__((visibility("default")))
#endif
#endif

/**
 * Stable error codes. Values never change between releases.
 */
typedef enum quarry_error_code {
    QUARRY_ERROR_SUCCESS = 0,
    QUARRY_ERROR_GENERIC = 1,
    QUARRY_ERROR_PANIC = 2,
    QUARRY_ERROR_INVALID_ARGUMENT = 3,
    QUARRY_ERROR_IO = 4,
    QUARRY_ERROR_PARSING = 5,
    QUARRY_ERROR_OCR = 6,
    QUARRY_ERROR_MISSING_DEPENDENCY = 7,
    QUARRY_ERROR_VALIDATION = 8,
    QUARRY_ERROR_UNSUPPORTED_FORMAT = 9,
    QUARRY_ERROR_CACHE = 10,
    QUARRY_ERROR_IMAGE_PROCESSING = 11,
    QUARRY_ERROR_PLUGIN = 12
} quarry_error_code;

/**
 * Structured description of the calling thread's last error.
 * Allocated by the library; release with quarry_free_error_details().
 * String members are NULL when absent.
 */
typedef struct quarry_error_details {
    int32_t code;
    char* kind;
    char* message;
    char* plugin_name;
    char* dependency;
    char* source_file;
    char* source_function;
    uint32_t line;
    char* info;
    char* fault_trace;
} quarry_error_details;

/**
 * Extraction. `mime_type` and `config_json` are nullable; NULL config uses
 * the settings loaded from quarry.json and the environment. Returns the
 * result as a JSON string owned by the caller (quarry_free_string), or NULL
 * on failure, in which case the thread's last error is set.
 */
QUARRY_API char* quarry_extract_file(const char* path, const char* mime_type,
                                     const char* config_json);
QUARRY_API char* quarry_extract_bytes(const uint8_t* data, size_t length, const char* mime_type,
                                      const char* config_json);

/**
 * Batch extraction. Returns a JSON array in input order; each element is
 * either {"ok": <result>} or {"error": <error details>}.
 */
QUARRY_API char* quarry_batch_extract_files(const char* const* paths, size_t count,
                                            const char* config_json);
/* `mime_types` is nullable, as are its elements */
QUARRY_API char* quarry_batch_extract_bytes(const uint8_t* const* data, const size_t* lengths,
                                            const char* const* mime_types, size_t count,
                                            const char* config_json);

QUARRY_API void quarry_free_string(char* s);

/* Last error of the calling thread */
QUARRY_API int32_t quarry_last_error_code(void);
QUARRY_API const char* quarry_last_error_message(void);
QUARRY_API quarry_error_details* quarry_last_error_details(void);
QUARRY_API void quarry_free_error_details(quarry_error_details* details);
/* JSON of the most recent captured fault, or NULL; free with quarry_free_string */
QUARRY_API char* quarry_last_panic_context(void);

/* Error taxonomy helpers */
QUARRY_API int32_t quarry_classify_error(const char* message);
QUARRY_API const char* quarry_error_code_name(int32_t code);
QUARRY_API int32_t quarry_error_code_success(void);
QUARRY_API int32_t quarry_error_code_generic(void);
QUARRY_API int32_t quarry_error_code_panic(void);
QUARRY_API int32_t quarry_error_code_invalid_argument(void);
QUARRY_API int32_t quarry_error_code_io(void);
QUARRY_API int32_t quarry_error_code_parsing(void);
QUARRY_API int32_t quarry_error_code_ocr(void);
QUARRY_API int32_t quarry_error_code_missing_dependency(void);
QUARRY_API int32_t quarry_error_code_validation(void);
QUARRY_API int32_t quarry_error_code_unsupported_format(void);
QUARRY_API int32_t quarry_error_code_cache(void);
QUARRY_API int32_t quarry_error_code_image_processing(void);
QUARRY_API int32_t quarry_error_code_plugin(void);

/* Cache; both return QUARRY_ERROR_SUCCESS / NULL conventions as above */
QUARRY_API int32_t quarry_clear_cache(void);
QUARRY_API char* quarry_cache_stats(void);

/**
 * Registry listing. `kind` is one of "validators", "post_processors",
 * "ocr_backends", "document_extractors", "embedding_backends".
 * Returns a JSON array of names.
 */
QUARRY_API char* quarry_list_plugins(const char* kind);
QUARRY_API int32_t quarry_clear_plugins(const char* kind);
QUARRY_API char* quarry_supported_mime_types(void);
QUARRY_API char* quarry_detect_mime_type(const char* path);

/**
 * OCR language queries against a registered backend ("tesseract" when built
 * with it). quarry_get_ocr_languages returns a JSON array of language codes.
 * quarry_is_language_supported returns 1 or 0, and -1 with the last error set
 * when the backend is unknown. Multi-language requests ("eng+deu") need every
 * part supported.
 */
QUARRY_API char* quarry_get_ocr_languages(const char* backend);
QUARRY_API int32_t quarry_is_language_supported(const char* backend, const char* language);

/*
 * Plugins implemented in C.
 *
 * Each table is copied at registration. `user_data` is passed back to every
 * callback, which may run on any worker thread. Callbacks return
 * QUARRY_ERROR_SUCCESS or another quarry_error_code; on failure they may
 * store a message in *out_message. Strings a callback hands back through an
 * out-parameter are released with the table's `free_string` (nullable when
 * the callback never allocates). `destroy` (nullable) runs once the library
 * drops its last reference: after unregistration, after replacement, or when
 * a registration that got past argument checks is refused.
 *
 * Registration returns QUARRY_ERROR_SUCCESS or an error code with the
 * thread's last error set. A name that is already registered is replaced.
 */
typedef void (*quarry_free_string_fn)(void* user_data, char* s);
typedef void (*quarry_destroy_fn)(void* user_data);

typedef enum quarry_processing_stage {
    QUARRY_STAGE_EARLY = 0,
    QUARRY_STAGE_MIDDLE = 1,
    QUARRY_STAGE_LATE = 2
} quarry_processing_stage;

typedef struct quarry_validator_vtable {
    void* user_data;
    /* `result_json` is the finished result; anything but success rejects it */
    int32_t (*validate)(void* user_data, const char* result_json, char** out_message);
    quarry_free_string_fn free_string;
    quarry_destroy_fn destroy;
} quarry_validator_vtable;

typedef struct quarry_post_processor_vtable {
    void* user_data;
    /* Stores the rewritten result JSON in *out_result_json; leaving it NULL keeps the result */
    int32_t (*process)(void* user_data, const char* result_json, char** out_result_json,
                       char** out_message);
    quarry_free_string_fn free_string;
    quarry_destroy_fn destroy;
} quarry_post_processor_vtable;

typedef struct quarry_ocr_backend_vtable {
    void* user_data;
    /* Encoded image in, UTF-8 text out; *out_confidence (0..1) starts at 1 */
    int32_t (*process_image)(void* user_data, const uint8_t* image, size_t length,
                             const char* language, char** out_text, double* out_confidence,
                             char** out_message);
    quarry_free_string_fn free_string;
    quarry_destroy_fn destroy;
} quarry_ocr_backend_vtable;

typedef struct quarry_document_extractor_vtable {
    void* user_data;
    /* Stores result JSON (at least {"content": ...}) in *out_result_json */
    int32_t (*extract)(void* user_data, const uint8_t* data, size_t length, const char* mime_type,
                       const char* config_json, char** out_result_json, char** out_message);
    quarry_free_string_fn free_string;
    quarry_destroy_fn destroy;
} quarry_document_extractor_vtable;

QUARRY_API int32_t quarry_register_validator(const char* name,
                                             const quarry_validator_vtable* vtable,
                                             int32_t priority);
QUARRY_API int32_t quarry_unregister_validator(const char* name);

QUARRY_API int32_t quarry_register_post_processor(const char* name,
                                                  const quarry_post_processor_vtable* vtable,
                                                  int32_t stage, int32_t priority);
QUARRY_API int32_t quarry_unregister_post_processor(const char* name);

QUARRY_API int32_t quarry_register_ocr_backend(const char* name,
                                               const quarry_ocr_backend_vtable* vtable,
                                               const char* const* languages,
                                               size_t language_count, int32_t priority);
QUARRY_API int32_t quarry_unregister_ocr_backend(const char* name);

QUARRY_API int32_t quarry_register_document_extractor(
    const char* name, const quarry_document_extractor_vtable* vtable,
    const char* const* mime_types, size_t mime_type_count, int32_t priority);
QUARRY_API int32_t quarry_unregister_document_extractor(const char* name);

QUARRY_API const char* quarry_version(void);

#ifdef __cplusplus
}
#endif
