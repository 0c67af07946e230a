/**
 * @file wsf_structured_error.h
 * @brief whisper-safe - Structured Error Record
 *
 * The most recent failure on each thread is kept in a thread-local record
 * with its source location and up to three key/value details
 * (e.g. "input_len" / "output_len" for a length mismatch).
 *
 * Usage:
 *   return WSF_SET_ERROR(WSF_ERROR_BUFFER_OVERFLOW, "tokenize wrote past capacity");
 */

#ifndef WSF_STRUCTURED_ERROR_H
#define WSF_STRUCTURED_ERROR_H

#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define WSF_MAX_ERROR_MESSAGE 512
#define WSF_MAX_ERROR_KEY 64
#define WSF_MAX_ERROR_VALUE 128
#define WSF_MAX_ERROR_DETAILS 3

typedef struct wsf_error {
    wsf_result_t code;
    char message[WSF_MAX_ERROR_MESSAGE];

    /** Status returned by the native engine, 0 if none */
    int32_t native_code;

    char source_file[128];
    int32_t source_line;
    char source_function[64];

    char detail_keys[WSF_MAX_ERROR_DETAILS][WSF_MAX_ERROR_KEY];
    char detail_values[WSF_MAX_ERROR_DETAILS][WSF_MAX_ERROR_VALUE];
} wsf_error_t;

/**
 * @brief Record an error as the calling thread's last error and log it
 *
 * @return code, so callers can write `return wsf_set_error(...)`
 */
wsf_result_t wsf_set_error(wsf_result_t code, const char* message);

/**
 * @brief Same as wsf_set_error, also recording the source location
 */
wsf_result_t wsf_set_error_at(wsf_result_t code, const char* message, const char* file,
                              int32_t line, const char* function);

/**
 * @brief printf-style variant of wsf_set_error
 */
wsf_result_t wsf_set_errorf(wsf_result_t code, const char* format, ...);

/**
 * @brief Attach a key/value detail to the last error
 *
 * @param index Slot 0-2; out-of-range indices are ignored
 */
void wsf_last_error_set_detail(int32_t index, const char* key, const char* value);

/**
 * @brief Integer convenience for wsf_last_error_set_detail
 */
void wsf_last_error_set_detail_int(int32_t index, const char* key, int64_t value);

/**
 * @brief Record the native status code on the last error
 */
void wsf_last_error_set_native_code(int32_t native_code);

/**
 * @brief Last error recorded on this thread, or NULL if cleared
 */
const wsf_error_t* wsf_get_last_error(void);

void wsf_clear_last_error(void);

/**
 * @brief Look up a detail value by key
 *
 * @return The value, or NULL if the key is not present
 */
const char* wsf_error_detail(const wsf_error_t* error, const char* key);

/**
 * @brief Format an error for display
 *
 * @return Allocated string; free with free()
 */
char* wsf_error_to_string(const wsf_error_t* error);

#define WSF_SET_ERROR(code, message) \
    wsf_set_error_at((code), (message), __FILE__, __LINE__, __func__)

#ifdef __cplusplus
}
#endif

#endif /* WSF_STRUCTURED_ERROR_H */
