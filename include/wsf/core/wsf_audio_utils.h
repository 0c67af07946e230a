/**
 * @file wsf_audio_utils.h
 * @brief whisper-safe - Audio Conversion Helpers
 *
 * The engine consumes 32-bit float mono PCM at WSF_SAMPLE_RATE. These helpers
 * convert the common capture formats into that layout. Output buffers are
 * caller-allocated and must match the expected length exactly.
 */

#ifndef WSF_AUDIO_UTILS_H
#define WSF_AUDIO_UTILS_H

#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Convert signed 16-bit PCM to float PCM in [-1, 1)
 *
 * Each output sample is input / 32768.
 *
 * @param input 16-bit samples
 * @param input_len Number of input samples
 * @param output Float samples (caller-allocated)
 * @param output_len Number of output samples, must equal input_len
 * @return WSF_SUCCESS, WSF_ERROR_NULL_POINTER, or
 *         WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH (details "input_len", "output_len")
 */
wsf_result_t wsf_convert_integer_to_float_audio(const int16_t* input, size_t input_len,
                                                float* output, size_t output_len);

/**
 * @brief Downmix interleaved stereo float PCM to mono by averaging each frame
 *
 * @param input Interleaved L/R samples
 * @param input_len Number of input samples (must be even)
 * @param output Mono samples (caller-allocated)
 * @param output_len Must equal input_len / 2
 * @return WSF_SUCCESS, WSF_ERROR_NULL_POINTER,
 *         WSF_ERROR_HALF_SAMPLE_MISSING (detail "input_len") for odd input, or
 *         WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH where "input_len" is the frame count
 */
wsf_result_t wsf_convert_stereo_to_mono_audio(const float* input, size_t input_len,
                                              float* output, size_t output_len);

#ifdef __cplusplus
}
#endif

#endif /* WSF_AUDIO_UTILS_H */
