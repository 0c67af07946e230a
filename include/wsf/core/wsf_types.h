/**
 * @file wsf_types.h
 * @brief whisper-safe - Common Types
 *
 * Fixed-width types shared by the C and C++ surfaces of the library.
 */

#ifndef WSF_TYPES_H
#define WSF_TYPES_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Status code returned by every fallible operation (0 = success, < 0 = error) */
typedef int32_t wsf_result_t;

typedef int32_t wsf_bool_t;

#define WSF_TRUE 1
#define WSF_FALSE 0

/** Vocabulary token id, same width as whisper_token */
typedef int32_t wsf_token_id_t;

/** Sample rate every PCM buffer handed to the engine must use */
#define WSF_SAMPLE_RATE 16000

#ifdef __cplusplus
}
#endif

#endif /* WSF_TYPES_H */
