/**
 * @file wsf_audio_utils.cpp
 * @brief whisper-safe - Audio Conversion Helpers Implementation
 */

#include "wsf/core/wsf_audio_utils.h"

#include "wsf/core/wsf_structured_error.h"

static constexpr float INT16_SCALE = 32768.0f;

static wsf_result_t length_mismatch(size_t input_len, size_t output_len) {
    wsf_set_errorf(WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH,
                   "Input/output length mismatch: input_len=%zu output_len=%zu", input_len,
                   output_len);
    wsf_last_error_set_detail_int(0, "input_len", static_cast<int64_t>(input_len));
    wsf_last_error_set_detail_int(1, "output_len", static_cast<int64_t>(output_len));
    return WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH;
}

wsf_result_t wsf_convert_integer_to_float_audio(const int16_t* input, size_t input_len,
                                                float* output, size_t output_len) {
    if (input_len != output_len) {
        return length_mismatch(input_len, output_len);
    }
    if (input_len == 0) {
        return WSF_SUCCESS;
    }
    if (!input || !output) {
        return WSF_SET_ERROR(WSF_ERROR_NULL_POINTER, "Audio buffer is null");
    }

    const int16_t* __restrict in = input;
    float* __restrict out = output;
    for (size_t i = 0; i < input_len; ++i) {
        out[i] = static_cast<float>(in[i]) / INT16_SCALE;
    }

    return WSF_SUCCESS;
}

wsf_result_t wsf_convert_stereo_to_mono_audio(const float* input, size_t input_len,
                                              float* output, size_t output_len) {
    if (input_len % 2 != 0) {
        wsf_set_errorf(WSF_ERROR_HALF_SAMPLE_MISSING,
                       "Stereo input has an odd number of samples: %zu", input_len);
        wsf_last_error_set_detail_int(0, "input_len", static_cast<int64_t>(input_len));
        return WSF_ERROR_HALF_SAMPLE_MISSING;
    }

    const size_t frames = input_len / 2;
    if (output_len != frames) {
        return length_mismatch(frames, output_len);
    }
    if (frames == 0) {
        return WSF_SUCCESS;
    }
    if (!input || !output) {
        return WSF_SET_ERROR(WSF_ERROR_NULL_POINTER, "Audio buffer is null");
    }

    for (size_t i = 0; i < frames; ++i) {
        output[i] = (input[2 * i] + input[2 * i + 1]) / 2.0f;
    }

    return WSF_SUCCESS;
}
