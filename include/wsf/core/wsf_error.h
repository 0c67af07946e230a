/**
 * @file wsf_error.h
 * @brief whisper-safe - Error Codes
 *
 * Error codes are negative and grouped in ranges:
 *   -100 to -199  Pointer and string validation
 *   -200 to -299  Audio conversion contract
 *   -300 to -399  Native engine failures
 *   -400 to -499  Caller contract and configuration
 */

#ifndef WSF_ERROR_H
#define WSF_ERROR_H

#include "wsf/core/wsf_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define WSF_SUCCESS ((wsf_result_t)0)

// =============================================================================
// POINTER / STRING VALIDATION (-100 to -199)
// =============================================================================

/** Native code returned a null pointer where data was expected */
#define WSF_ERROR_NULL_POINTER ((wsf_result_t)-100)
/** No NUL terminator found within the search bound */
#define WSF_ERROR_INVALID_STRING ((wsf_result_t)-101)
/** Bytes are not well-formed UTF-8 */
#define WSF_ERROR_INVALID_UTF8 ((wsf_result_t)-102)
/** Native code reported more elements written than the buffer capacity */
#define WSF_ERROR_BUFFER_OVERFLOW ((wsf_result_t)-103)

// =============================================================================
// AUDIO CONVERSION (-200 to -299)
// =============================================================================

#define WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH ((wsf_result_t)-200)
/** Interleaved stereo input has an odd number of samples */
#define WSF_ERROR_HALF_SAMPLE_MISSING ((wsf_result_t)-201)

// =============================================================================
// NATIVE ENGINE FAILURES (-300 to -399)
// =============================================================================

#define WSF_ERROR_MODEL_LOAD_FAILED ((wsf_result_t)-300)
#define WSF_ERROR_STATE_INIT_FAILED ((wsf_result_t)-301)
#define WSF_ERROR_DECODE_FAILED ((wsf_result_t)-302)
#define WSF_ERROR_TOKENIZE_FAILED ((wsf_result_t)-303)
#define WSF_ERROR_VAD_FAILED ((wsf_result_t)-304)

// =============================================================================
// CALLER CONTRACT / CONFIGURATION (-400 to -499)
// =============================================================================

#define WSF_ERROR_INVALID_ARGUMENT ((wsf_result_t)-400)
#define WSF_ERROR_INDEX_OUT_OF_BOUNDS ((wsf_result_t)-401)
/** A segment or token view was used after its session decoded again */
#define WSF_ERROR_STALE_VIEW ((wsf_result_t)-402)
#define WSF_ERROR_INVALID_CONFIG ((wsf_result_t)-403)
#define WSF_ERROR_NOT_SUPPORTED ((wsf_result_t)-404)

#define WSF_SUCCEEDED(result) ((result) >= 0)
#define WSF_FAILED(result) ((result) < 0)

/**
 * @brief Static human-readable message for an error code
 */
const char* wsf_error_message(wsf_result_t code);

/**
 * @brief Kind name of an error code (e.g. "BufferOverflow", "NativeFailure")
 */
const char* wsf_error_kind_name(wsf_result_t code);

/**
 * @brief Error category derived from the code range
 */
const char* wsf_error_category(wsf_result_t code);

/**
 * @brief Whether a code is a routine outcome rather than a fault
 *
 * Expected codes are recorded as the last error but not logged at Error level.
 */
wsf_bool_t wsf_error_is_expected(wsf_result_t code);

#ifdef __cplusplus
}
#endif

#endif /* WSF_ERROR_H */
