/**
 * @file wsf_state.h
 * @brief whisper-safe - Decode State and Result Views
 *
 * A WhisperState owns one whisper_state. It may be moved to another thread
 * but must not be used from two threads at once; share a WhisperContext and
 * give each thread its own state instead, or guard one state with a mutex.
 *
 * Segment and Token are lightweight views into the most recent decode
 * result. Each accessor re-checks the view against the current result, and
 * views taken before a later full() call fail with WSF_ERROR_STALE_VIEW.
 * A view must not outlive its WhisperState; use to_owned() to keep data.
 */

#ifndef WSF_STATE_H
#define WSF_STATE_H

#include <whisper.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_types.h"
#include "wsf/features/stt/wsf_context.h"
#include "wsf/features/stt/wsf_full_params.h"
#include "wsf/ffi/wsf_native_api.h"

namespace whispersafe {

class WhisperState;

// =============================================================================
// OWNED RESULT TYPES
// =============================================================================

struct TokenData {
    wsf_token_id_t id = 0;
    wsf_token_id_t tid = 0;  // timestamp token id
    float p = 0.0f;
    float plog = 0.0f;
    float pt = 0.0f;
    float ptsum = 0.0f;
    int64_t t0 = -1;
    int64_t t1 = -1;
    int64_t t_dtw = -1;
    float vlen = 0.0f;
};

struct OwnedToken {
    int index = 0;
    wsf_token_id_t id = 0;
    float p = 0.0f;
    TokenData data;
    std::string text;  // invalid UTF-8 replaced with U+FFFD
    std::vector<uint8_t> bytes;
    std::vector<TokenCandidate> candidates;
};

struct OwnedSegment {
    int index = 0;
    int64_t start_timestamp = 0;  // centiseconds
    int64_t end_timestamp = 0;    // centiseconds
    float no_speech_prob = 0.0f;
    bool speaker_turn_next = false;
    std::string text;  // invalid UTF-8 replaced with U+FFFD
    std::vector<OwnedToken> tokens;
};

// =============================================================================
// VIEWS
// =============================================================================

class Token {
   public:
    Token() = default;

    int segment_index() const { return segment_; }
    int index() const { return index_; }

    wsf_result_t id(wsf_token_id_t* out) const;
    wsf_result_t probability(float* out) const;
    wsf_result_t data(TokenData* out) const;

    // Token pieces can split a multi-byte character, so strict text() may
    // fail where bytes() succeeds
    wsf_result_t text(std::string* out) const;
    wsf_result_t text_lossy(std::string* out) const;
    wsf_result_t bytes(std::vector<uint8_t>* out) const;

    /** 0 unless the decode captured top candidates */
    wsf_result_t n_top_candidates(int* out) const;
    wsf_result_t top_candidate(int index, TokenCandidate* out) const;
    wsf_result_t all_top_candidates(std::vector<TokenCandidate>* out) const;

    wsf_result_t to_owned(OwnedToken* out) const;

   private:
    friend class Segment;
    Token(const WhisperState* state, int segment, int index, uint64_t generation)
        : state_(state), segment_(segment), index_(index), generation_(generation) {}

    wsf_result_t validate() const;
    const char* raw_text() const;

    const WhisperState* state_ = nullptr;
    int segment_ = -1;
    int index_ = -1;
    uint64_t generation_ = 0;
};

class Segment {
   public:
    Segment() = default;

    int index() const { return index_; }

    wsf_result_t start_timestamp(int64_t* out) const;
    wsf_result_t end_timestamp(int64_t* out) const;
    wsf_result_t no_speech_probability(float* out) const;
    wsf_result_t next_segment_speaker_turn(bool* out) const;

    wsf_result_t text(std::string* out) const;
    wsf_result_t text_lossy(std::string* out) const;
    wsf_result_t text_bytes(std::vector<uint8_t>* out) const;

    wsf_result_t n_tokens(int* out) const;
    wsf_result_t get_token(int index, Token* out) const;

    wsf_result_t to_owned(OwnedSegment* out) const;

   private:
    friend class WhisperState;
    Segment(const WhisperState* state, int index, uint64_t generation)
        : state_(state), index_(index), generation_(generation) {}

    wsf_result_t validate() const;

    const WhisperState* state_ = nullptr;
    int index_ = -1;
    uint64_t generation_ = 0;
};

/**
 * One speech span of an in-decode VAD pass, in samples. processed_start is
 * its position in the speech-only buffer, original_start in the input.
 */
struct SpeechSpan {
    int64_t processed_start = 0;
    int64_t original_start = 0;
    int64_t length = 0;
};

// =============================================================================
// WHISPER STATE
// =============================================================================

class WhisperState {
   public:
    ~WhisperState();

    WhisperState(const WhisperState&) = delete;
    WhisperState& operator=(const WhisperState&) = delete;

    /**
     * Run the full encode/decode pipeline over mono float PCM at
     * WSF_SAMPLE_RATE. Segment and progress callbacks in params run on this
     * thread before the call returns; an exception thrown by one of them is
     * rethrown here after the engine returns.
     *
     * With VAD enabled in params only the detected speech is decoded, and
     * result timestamps refer to the input audio. Without speech the result
     * is empty and the engine is not called.
     *
     * @return WSF_SUCCESS, WSF_ERROR_INVALID_ARGUMENT, WSF_ERROR_NOT_SUPPORTED
     *         (backtrack options without engine support),
     *         WSF_ERROR_MODEL_LOAD_FAILED / WSF_ERROR_VAD_FAILED from the VAD
     *         pass or WSF_ERROR_DECODE_FAILED (native status on the last error)
     */
    wsf_result_t full(const FullParams& params, const float* samples, size_t n_samples);

    wsf_result_t full(const FullParams& params, const std::vector<float>& samples) {
        return full(params, samples.data(), samples.size());
    }

    /** Segments in the current result; 0 before the first decode */
    int full_n_segments() const;

    /** Language id detected or used by the last decode */
    wsf_result_t full_lang_id(int* out) const;

    wsf_result_t get_segment(int index, Segment* out) const;

    /** Owned copy of every segment and token in the current result */
    wsf_result_t segments(std::vector<OwnedSegment>* out) const;

    /** Incremented by every full() call; views carry the value they were made at */
    uint64_t generation() const { return generation_; }

    /** True once a full() call has succeeded on this state */
    bool has_encoding() const { return has_encoding_; }

    const WhisperContext& context() const { return *context_; }

    /** Speech spans of the last decode; empty unless it ran with VAD */
    const std::vector<SpeechSpan>& speech_spans() const { return speech_spans_; }

   private:
    friend class WhisperContext;
    friend class Segment;
    friend class Token;

    WhisperState(std::shared_ptr<const WhisperContext> context, whisper_state* state);

    wsf_result_t check_segment(int segment, uint64_t generation) const;
    wsf_result_t check_token(int segment, int token, uint64_t generation) const;
    wsf_result_t check_token_ids(const std::vector<wsf_token_id_t>& tokens,
                                 const char* field) const;

    wsf_result_t filter_with_vad(const FullParams& params, const float* samples,
                                 size_t n_samples, std::vector<float>* speech,
                                 std::vector<SpeechSpan>* spans);

    int64_t to_input_time(int64_t t) const;

    const NativeApi& api() const { return context_->api(); }

    std::shared_ptr<const WhisperContext> context_;
    whisper_state* state_;
    uint64_t generation_ = 0;
    bool has_encoding_ = false;

    // In-decode VAD: the model is loaded on first use and kept while the path is unchanged
    std::unique_ptr<VadContext> vad_;
    std::vector<SpeechSpan> speech_spans_;
    bool no_speech_ = false;
};

}  // namespace whispersafe

#endif  // WSF_STATE_H
