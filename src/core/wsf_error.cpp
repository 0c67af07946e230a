/**
 * @file wsf_error.cpp
 * @brief whisper-safe - Error Code Messages and Categories
 */

#include "wsf/core/wsf_error.h"

extern "C" {

const char* wsf_error_message(wsf_result_t code) {
    switch (code) {
        case WSF_SUCCESS:
            return "Success";
        case WSF_ERROR_NULL_POINTER:
            return "Native code returned a null pointer";
        case WSF_ERROR_INVALID_STRING:
            return "No string terminator found within the allowed length";
        case WSF_ERROR_INVALID_UTF8:
            return "String is not valid UTF-8";
        case WSF_ERROR_BUFFER_OVERFLOW:
            return "Native code reported more elements than the buffer holds";
        case WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH:
            return "Input and output buffer lengths do not match";
        case WSF_ERROR_HALF_SAMPLE_MISSING:
            return "Stereo input has an odd number of samples";
        case WSF_ERROR_MODEL_LOAD_FAILED:
            return "Failed to load model";
        case WSF_ERROR_STATE_INIT_FAILED:
            return "Failed to create decode state";
        case WSF_ERROR_DECODE_FAILED:
            return "Decode failed";
        case WSF_ERROR_TOKENIZE_FAILED:
            return "Tokenization failed";
        case WSF_ERROR_VAD_FAILED:
            return "Voice activity detection failed";
        case WSF_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case WSF_ERROR_INDEX_OUT_OF_BOUNDS:
            return "Index out of bounds";
        case WSF_ERROR_STALE_VIEW:
            return "View refers to an earlier decode result";
        case WSF_ERROR_INVALID_CONFIG:
            return "Invalid configuration";
        case WSF_ERROR_NOT_SUPPORTED:
            return "Not supported by the linked engine";
        default:
            return "Unknown error";
    }
}

const char* wsf_error_kind_name(wsf_result_t code) {
    switch (code) {
        case WSF_SUCCESS:
            return "Success";
        case WSF_ERROR_NULL_POINTER:
            return "NullPointer";
        case WSF_ERROR_INVALID_STRING:
            return "InvalidString";
        case WSF_ERROR_INVALID_UTF8:
            return "InvalidUtf8";
        case WSF_ERROR_BUFFER_OVERFLOW:
            return "BufferOverflow";
        case WSF_ERROR_INPUT_OUTPUT_LENGTH_MISMATCH:
            return "InputOutputLengthMismatch";
        case WSF_ERROR_HALF_SAMPLE_MISSING:
            return "HalfSampleMissing";
        case WSF_ERROR_INVALID_ARGUMENT:
            return "InvalidArgument";
        case WSF_ERROR_INDEX_OUT_OF_BOUNDS:
            return "IndexOutOfBounds";
        case WSF_ERROR_STALE_VIEW:
            return "StaleView";
        case WSF_ERROR_INVALID_CONFIG:
            return "InvalidConfig";
        case WSF_ERROR_NOT_SUPPORTED:
            return "NotSupported";
        default:
            break;
    }
    if (code >= -399 && code <= -300) return "NativeFailure";
    return "Unknown";
}

const char* wsf_error_category(wsf_result_t code) {
    if (code >= -199 && code <= -100) return "Validation";
    if (code >= -299 && code <= -200) return "Audio";
    if (code >= -399 && code <= -300) return "Native";
    if (code >= -499 && code <= -400) return "Contract";

    if (code == WSF_SUCCESS) return "Success";

    return "Unknown";
}

wsf_bool_t wsf_error_is_expected(wsf_result_t code) {
    switch (code) {
        case WSF_ERROR_INVALID_UTF8:
        case WSF_ERROR_STALE_VIEW:
        case WSF_ERROR_INDEX_OUT_OF_BOUNDS:
        case WSF_ERROR_INVALID_CONFIG:
            return WSF_TRUE;
        default:
            return WSF_FALSE;
    }
}

}  // extern "C"
