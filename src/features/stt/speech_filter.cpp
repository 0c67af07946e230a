/**
 * @file speech_filter.cpp
 * @brief whisper-safe - Speech-only audio for in-decode VAD
 */

#include "speech_filter.h"

#include <algorithm>

namespace whispersafe {

// Engine timestamps are in centiseconds
static constexpr int64_t SAMPLES_PER_CS = WSF_SAMPLE_RATE / 100;

void filter_speech(const std::vector<VadSegment>& segments, float samples_overlap,
                   const float* samples, size_t n_samples, std::vector<float>* speech,
                   std::vector<SpeechSpan>* spans) {
    speech->clear();
    spans->clear();

    const int64_t total = static_cast<int64_t>(n_samples);
    const int64_t overlap =
        samples_overlap > 0.0f ? static_cast<int64_t>(samples_overlap * WSF_SAMPLE_RATE) : 0;

    for (const VadSegment& segment : segments) {
        const int64_t start = std::clamp<int64_t>(
            static_cast<int64_t>(segment.start * static_cast<float>(SAMPLES_PER_CS)), 0, total);
        const int64_t end = std::clamp<int64_t>(
            static_cast<int64_t>(segment.end * static_cast<float>(SAMPLES_PER_CS)) + overlap, 0,
            total);
        if (end <= start) {
            continue;
        }

        if (!speech->empty()) {
            speech->insert(speech->end(), static_cast<size_t>(SPEECH_GAP_SAMPLES), 0.0f);
        }

        SpeechSpan span;
        span.processed_start = static_cast<int64_t>(speech->size());
        span.original_start = start;
        span.length = end - start;
        spans->push_back(span);

        speech->insert(speech->end(), samples + start, samples + end);
    }
}

int64_t map_speech_time(const std::vector<SpeechSpan>& spans, int64_t t) {
    if (spans.empty() || t < 0) {
        return t;
    }

    const int64_t position = t * SAMPLES_PER_CS;
    auto it = std::upper_bound(
        spans.begin(), spans.end(), position,
        [](int64_t value, const SpeechSpan& span) { return value < span.processed_start; });
    if (it == spans.begin()) {
        return spans.front().original_start / SAMPLES_PER_CS;
    }
    --it;

    const int64_t offset = std::min(position - it->processed_start, it->length);
    return (it->original_start + offset) / SAMPLES_PER_CS;
}

}  // namespace whispersafe
