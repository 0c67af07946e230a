/**
 * @file segment_trampoline.h
 * @brief whisper-safe - Engine-to-host callback entry points
 *
 * The bindings live on the stack of WhisperState::full() and are handed to
 * the engine as callback user data for that single call only.
 */

#ifndef WSF_SEGMENT_TRAMPOLINE_H
#define WSF_SEGMENT_TRAMPOLINE_H

#include <whisper.h>

#include <exception>
#include <vector>

#include "wsf/core/wsf_config.h"
#include "wsf/features/stt/wsf_segment_callback.h"
#include "wsf/features/stt/wsf_state.h"
#include "wsf/ffi/wsf_native_api.h"

namespace whispersafe {

struct SegmentBinding {
    const NativeApi* api = nullptr;
    whisper_context* ctx = nullptr;
    whisper_state* state = nullptr;
    const GuardLimits* limits = nullptr;
    // Non-empty when the decode runs over VAD-filtered audio
    const std::vector<SpeechSpan>* speech_spans = nullptr;

    // Exactly one of these is set
    const SegmentCallback* strict = nullptr;
    const LossySegmentCallback* lossy = nullptr;

    // First exception thrown while dispatching; stops further dispatch
    std::exception_ptr error;
    int delivered = 0;
    int skipped = 0;
};

struct ProgressBinding {
    whisper_context* ctx = nullptr;
    whisper_state* state = nullptr;
    const ProgressCallback* callback = nullptr;
    std::exception_ptr error;
};

void segment_trampoline(whisper_context* ctx, whisper_state* state, int n_new, void* user_data);

void progress_trampoline(whisper_context* ctx, whisper_state* state, int progress,
                         void* user_data);

}  // namespace whispersafe

#endif  // WSF_SEGMENT_TRAMPOLINE_H
