/**
 * @file segment_trampoline.cpp
 * @brief whisper-safe - Engine-to-host callback entry points
 *
 * Nothing arriving from the engine is trusted: the binding pointer, the
 * context/state identity, the new-segment count, each segment index and
 * each text pointer are checked before any host code runs. A failed check
 * skips the segment; the decode itself carries on.
 */

#include "segment_trampoline.h"

#include <string>
#include <utility>

#include "speech_filter.h"
#include "wsf/core/wsf_logger.h"
#include "wsf/ffi/wsf_cstring_guard.h"

namespace whispersafe {

static const char* LOG_CAT = "FFI.Callback";

static void dispatch_segment(SegmentBinding* binding, int index) {
    const NativeApi& api = *binding->api;
    const Utf8Policy policy = binding->lossy ? Utf8Policy::Lossy : Utf8Policy::Strict;

    std::string text;
    wsf_result_t status = guard_string(api.segment_text(binding->state, index),
                                       binding->limits->max_segment_text_len, policy, &text);
    if (status != WSF_SUCCESS && status != WSF_ERROR_INVALID_UTF8) {
        WSF_LOG_WARNING(LOG_CAT, "Skipping segment %d: %s", index, wsf_error_message(status));
        binding->skipped++;
        return;
    }

    SegmentCallbackData data;
    data.segment = index;
    data.start_timestamp = api.segment_t0(binding->state, index);
    data.end_timestamp = api.segment_t1(binding->state, index);
    if (binding->speech_spans) {
        data.start_timestamp = map_speech_time(*binding->speech_spans, data.start_timestamp);
        data.end_timestamp = map_speech_time(*binding->speech_spans, data.end_timestamp);
    }
    data.text = std::move(text);

    if (binding->lossy) {
        (*binding->lossy)(data);
    } else {
        (*binding->strict)(status, data);
    }
    binding->delivered++;
}

void segment_trampoline(whisper_context* ctx, whisper_state* state, int n_new, void* user_data) {
    if (!user_data) {
        WSF_LOG_WARNING(LOG_CAT, "Segment callback invoked without user data");
        return;
    }

    auto* binding = static_cast<SegmentBinding*>(user_data);
    if (binding->error) {
        return;
    }
    if (ctx != binding->ctx || state != binding->state) {
        WSF_LOG_WARNING(LOG_CAT, "Segment callback for a different context or state, ignoring");
        return;
    }

    const int n_segments = binding->api->full_n_segments(state);
    if (n_segments < 0 || n_new < 0 || n_new > n_segments) {
        WSF_LOG_WARNING(LOG_CAT, "Invalid segment counts from engine: n_new=%d n_segments=%d",
                        n_new, n_segments);
        return;
    }

    // Host exceptions must not unwind through engine frames; keep the first
    // one and let WhisperState::full() rethrow it
    try {
        for (int i = n_segments - n_new; i < n_segments; ++i) {
            dispatch_segment(binding, i);
        }
    } catch (...) {
        binding->error = std::current_exception();
        WSF_LOG_DEBUG(LOG_CAT, "Segment callback threw, remaining segments skipped");
    }
}

void progress_trampoline(whisper_context* ctx, whisper_state* state, int progress,
                         void* user_data) {
    if (!user_data) {
        WSF_LOG_WARNING(LOG_CAT, "Progress callback invoked without user data");
        return;
    }

    auto* binding = static_cast<ProgressBinding*>(user_data);
    if (binding->error) {
        return;
    }
    if (ctx != binding->ctx || state != binding->state) {
        WSF_LOG_WARNING(LOG_CAT, "Progress callback for a different context or state, ignoring");
        return;
    }

    if (progress < 0) progress = 0;
    if (progress > 100) progress = 100;

    try {
        (*binding->callback)(progress);
    } catch (...) {
        binding->error = std::current_exception();
    }
}

}  // namespace whispersafe
