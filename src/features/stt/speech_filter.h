/**
 * @file speech_filter.h
 * @brief whisper-safe - Speech-only audio for in-decode VAD
 *
 * whisper_full_with_state() ignores the vad fields of its parameter record,
 * so WhisperState::full() runs the VAD pass itself: the speech spans are
 * copied into one buffer, separated by a short silence, and every timestamp
 * the engine reports for that buffer is mapped back onto the caller's audio.
 */

#ifndef WSF_SPEECH_FILTER_H
#define WSF_SPEECH_FILTER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "wsf/features/stt/wsf_state.h"
#include "wsf/features/vad/wsf_vad.h"

namespace whispersafe {

/** Silence inserted between two speech spans, in samples (0.1 s) */
static constexpr int64_t SPEECH_GAP_SAMPLES = WSF_SAMPLE_RATE / 10;

/**
 * Build the speech-only buffer. Each span is extended by samples_overlap
 * seconds and clipped to the input. Spans that end up empty are dropped.
 */
void filter_speech(const std::vector<VadSegment>& segments, float samples_overlap,
                   const float* samples, size_t n_samples, std::vector<float>* speech,
                   std::vector<SpeechSpan>* spans);

/**
 * Map a timestamp of the speech-only buffer (centiseconds) onto the
 * original audio. Times inside a gap map to the end of the span before it.
 * Negative times (unset token timestamps) and empty maps pass through.
 */
int64_t map_speech_time(const std::vector<SpeechSpan>& spans, int64_t t);

}  // namespace whispersafe

#endif  // WSF_SPEECH_FILTER_H
