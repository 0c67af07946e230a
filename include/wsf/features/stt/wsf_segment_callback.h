/**
 * @file wsf_segment_callback.h
 * @brief whisper-safe - Decode Callbacks
 *
 * Callbacks run synchronously on the decoding thread, in segment order,
 * before WhisperState::full() returns. They only ever receive owned copies
 * of what the engine reported, after every pointer and index has been
 * checked.
 *
 * An exception thrown from a callback stops further callbacks for that
 * decode and is rethrown from WhisperState::full() once the engine returns.
 */

#ifndef WSF_SEGMENT_CALLBACK_H
#define WSF_SEGMENT_CALLBACK_H

#include <cstdint>
#include <functional>
#include <string>

#include "wsf/core/wsf_error.h"

namespace whispersafe {

struct SegmentCallbackData {
    int segment = 0;
    int64_t start_timestamp = 0;  // centiseconds
    int64_t end_timestamp = 0;    // centiseconds
    std::string text;
};

/**
 * status is WSF_SUCCESS, or WSF_ERROR_INVALID_UTF8 with empty text when the
 * segment text is not valid UTF-8.
 */
using SegmentCallback = std::function<void(wsf_result_t status, const SegmentCallbackData& data)>;

/** Invalid UTF-8 in the text is replaced with U+FFFD */
using LossySegmentCallback = std::function<void(const SegmentCallbackData& data)>;

/** progress is clamped to 0..100 */
using ProgressCallback = std::function<void(int progress)>;

}  // namespace whispersafe

#endif  // WSF_SEGMENT_CALLBACK_H
