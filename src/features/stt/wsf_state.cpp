/**
 * @file wsf_state.cpp
 * @brief whisper-safe - Decode State and Result Views Implementation
 */

#include "wsf/features/stt/wsf_state.h"

#include <climits>
#include <exception>
#include <utility>

#include "full_params_view.h"
#include "segment_trampoline.h"
#include "speech_filter.h"
#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/ffi/wsf_cstring_guard.h"

namespace whispersafe {

static const char* LOG_CAT = "STT.State";

static wsf_result_t null_output() {
    return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "View accessor output is null");
}

// =============================================================================
// WHISPER STATE
// =============================================================================

WhisperState::WhisperState(std::shared_ptr<const WhisperContext> context, whisper_state* state)
    : context_(std::move(context)), state_(state) {}

WhisperState::~WhisperState() {
    // Runs before context_ releases its reference, so the model is still alive
    if (state_) {
        api().free_state(state_);
        state_ = nullptr;
    }
}

wsf_result_t WhisperState::check_token_ids(const std::vector<wsf_token_id_t>& tokens,
                                           const char* field) const {
    const int vocab = context_->n_vocab();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] < 0 || tokens[i] >= vocab) {
            wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "%s[%zu] = %d outside vocabulary of %d",
                           field, i, tokens[i], vocab);
            wsf_last_error_set_detail(0, "field", field);
            wsf_last_error_set_detail_int(1, "token", tokens[i]);
            return WSF_ERROR_INVALID_ARGUMENT;
        }
    }
    return WSF_SUCCESS;
}

wsf_result_t WhisperState::filter_with_vad(const FullParams& params, const float* samples,
                                           size_t n_samples, std::vector<float>* speech,
                                           std::vector<SpeechSpan>* spans) {
    if (!params.vad_model_path_ || params.vad_model_path_->empty()) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "VAD is enabled without vad_model_path");
    }

    if (!vad_ || vad_->model_path() != *params.vad_model_path_) {
        vad_.reset();
        VadContextParams vad_params;
        vad_params.n_threads = params.native_.n_threads;
        wsf_result_t rc = VadContext::create(*params.vad_model_path_, vad_params, &vad_, &api());
        if (rc != WSF_SUCCESS) return rc;
    }

    const VadParams vad_params = VadParams::from_native(params.native_.vad_params);
    std::vector<VadSegment> segments;
    wsf_result_t rc = vad_->segments_from_samples(vad_params, samples, n_samples, &segments);
    if (rc != WSF_SUCCESS) return rc;

    filter_speech(segments, vad_params.samples_overlap, samples, n_samples, speech, spans);
    WSF_LOG_DEBUG(LOG_CAT, "VAD kept %zu of %zu samples in %zu spans", speech->size(),
                  n_samples, spans->size());
    return WSF_SUCCESS;
}

int64_t WhisperState::to_input_time(int64_t t) const {
    return map_speech_time(speech_spans_, t);
}

wsf_result_t WhisperState::full(const FullParams& params, const float* samples,
                                size_t n_samples) {
    if (!samples && n_samples > 0) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Sample buffer is null");
    }
    if (n_samples > static_cast<size_t>(INT_MAX)) {
        return wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Too many samples: %zu", n_samples);
    }
    if (params.requires_backtrack() && !WSF_HAVE_BACKTRACK) {
        return WSF_SET_ERROR(WSF_ERROR_NOT_SUPPORTED,
                             "Forced tokens, skip_encode and top candidates need the "
                             "backtrack build of whisper.cpp");
    }
    if (params.skip_encode() && !has_encoding_) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT,
                             "skip_encode requires a prior successful decode on this state");
    }

    wsf_result_t rc = check_token_ids(params.prompt_tokens(), "prompt_tokens");
    if (rc != WSF_SUCCESS) return rc;
    rc = check_token_ids(params.forced_tokens(), "forced_tokens");
    if (rc != WSF_SUCCESS) return rc;

    const bool use_vad = params.native_.vad;
    std::vector<float> speech;
    std::vector<SpeechSpan> spans;
    if (use_vad) {
        rc = filter_with_vad(params, samples, n_samples, &speech, &spans);
        if (rc != WSF_SUCCESS) return rc;
    }

    whisper_context* ctx = context_->native_handle();

    SegmentBinding segment_binding;
    segment_binding.api = &api();
    segment_binding.ctx = ctx;
    segment_binding.state = state_;
    segment_binding.limits = &context_->limits();
    segment_binding.speech_spans = &speech_spans_;
    if (params.segment_callback_) {
        segment_binding.strict = &params.segment_callback_;
    } else if (params.lossy_segment_callback_) {
        segment_binding.lossy = &params.lossy_segment_callback_;
    }

    ProgressBinding progress_binding;
    progress_binding.ctx = ctx;
    progress_binding.state = state_;
    progress_binding.callback = params.progress_callback_ ? &params.progress_callback_ : nullptr;

    // Earlier views refer to the result this call is about to replace
    generation_++;
    speech_spans_ = std::move(spans);
    no_speech_ = use_vad && speech.empty();
    if (no_speech_) {
        WSF_LOG_INFO(LOG_CAT, "No speech detected in %zu samples", n_samples);
        return WSF_SUCCESS;
    }
    if (use_vad) {
        samples = speech.data();
        n_samples = speech.size();
    }

    int native_rc;
    {
        FullParamsView view(params, params.has_segment_callback() ? &segment_binding : nullptr,
                            progress_binding.callback ? &progress_binding : nullptr);
        native_rc = api().full_with_state(ctx, state_, view.native(), samples,
                                          static_cast<int>(n_samples));
    }
    has_encoding_ = has_encoding_ || native_rc == 0;

    if (segment_binding.skipped > 0) {
        WSF_LOG_WARNING(LOG_CAT, "%d segments failed validation and were not delivered",
                        segment_binding.skipped);
    }
    if (segment_binding.error) {
        std::rethrow_exception(segment_binding.error);
    }
    if (progress_binding.error) {
        std::rethrow_exception(progress_binding.error);
    }

    if (native_rc != 0) {
        wsf_set_errorf(WSF_ERROR_DECODE_FAILED, "whisper_full failed with status %d", native_rc);
        wsf_last_error_set_native_code(native_rc);
        return WSF_ERROR_DECODE_FAILED;
    }

    WSF_LOG_DEBUG(LOG_CAT, "Decoded %zu samples into %d segments", n_samples,
                  full_n_segments());
    return WSF_SUCCESS;
}

int WhisperState::full_n_segments() const {
    if (no_speech_) {
        return 0;
    }
    const int n = api().full_n_segments(state_);
    if (n < 0) {
        WSF_LOG_WARNING(LOG_CAT, "Engine reported %d segments, treating as 0", n);
        return 0;
    }
    return n;
}

wsf_result_t WhisperState::full_lang_id(int* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Language id output is null");
    }
    const int id = api().full_lang_id(state_);
    const int max_id = api().lang_max_id();
    if (id < 0 || id > max_id) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Engine reported language id %d", id);
        wsf_last_error_set_detail_int(0, "lang_id", id);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    *out = id;
    return WSF_SUCCESS;
}

wsf_result_t WhisperState::check_segment(int segment, uint64_t generation) const {
    if (generation != generation_) {
        return WSF_SET_ERROR(WSF_ERROR_STALE_VIEW,
                             "Segment view was taken before the latest decode");
    }
    const int n_segments = full_n_segments();
    if (segment < 0 || segment >= n_segments) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Segment %d outside [0, %d)", segment,
                       n_segments);
        wsf_last_error_set_detail_int(0, "segment", segment);
        wsf_last_error_set_detail_int(1, "n_segments", n_segments);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    return WSF_SUCCESS;
}

wsf_result_t WhisperState::check_token(int segment, int token, uint64_t generation) const {
    wsf_result_t rc = check_segment(segment, generation);
    if (rc != WSF_SUCCESS) return rc;

    const int n_tokens = api().full_n_tokens(state_, segment);
    if (token < 0 || token >= n_tokens) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Token %d outside [0, %d) in segment %d",
                       token, n_tokens, segment);
        wsf_last_error_set_detail_int(0, "token", token);
        wsf_last_error_set_detail_int(1, "n_tokens", n_tokens);
        wsf_last_error_set_detail_int(2, "segment", segment);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    return WSF_SUCCESS;
}

wsf_result_t WhisperState::get_segment(int index, Segment* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment output is null");
    }
    wsf_result_t rc = check_segment(index, generation_);
    if (rc != WSF_SUCCESS) return rc;

    *out = Segment(this, index, generation_);
    return WSF_SUCCESS;
}

wsf_result_t WhisperState::segments(std::vector<OwnedSegment>* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment output is null");
    }

    const int n_segments = full_n_segments();
    std::vector<OwnedSegment> result;
    result.reserve(static_cast<size_t>(n_segments));
    for (int i = 0; i < n_segments; ++i) {
        Segment segment(this, i, generation_);
        OwnedSegment owned;
        wsf_result_t rc = segment.to_owned(&owned);
        if (rc != WSF_SUCCESS) return rc;
        result.push_back(std::move(owned));
    }
    *out = std::move(result);
    return WSF_SUCCESS;
}

// =============================================================================
// SEGMENT VIEW
// =============================================================================

wsf_result_t Segment::validate() const {
    if (!state_) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment view is not bound");
    }
    return state_->check_segment(index_, generation_);
}

wsf_result_t Segment::start_timestamp(int64_t* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->to_input_time(state_->api().segment_t0(state_->state_, index_));
    return WSF_SUCCESS;
}

wsf_result_t Segment::end_timestamp(int64_t* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->to_input_time(state_->api().segment_t1(state_->state_, index_));
    return WSF_SUCCESS;
}

wsf_result_t Segment::no_speech_probability(float* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->api().segment_no_speech_prob(state_->state_, index_);
    return WSF_SUCCESS;
}

wsf_result_t Segment::next_segment_speaker_turn(bool* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->api().segment_speaker_turn_next(state_->state_, index_);
    return WSF_SUCCESS;
}

wsf_result_t Segment::text(std::string* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(state_->api().segment_text(state_->state_, index_),
                        state_->context_->limits().max_segment_text_len, Utf8Policy::Strict,
                        out);
}

wsf_result_t Segment::text_lossy(std::string* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(state_->api().segment_text(state_->state_, index_),
                        state_->context_->limits().max_segment_text_len, Utf8Policy::Lossy, out);
}

wsf_result_t Segment::text_bytes(std::vector<uint8_t>* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_bytes(state_->api().segment_text(state_->state_, index_),
                       state_->context_->limits().max_segment_text_len, out);
}

wsf_result_t Segment::n_tokens(int* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    const int n = state_->api().full_n_tokens(state_->state_, index_);
    *out = n < 0 ? 0 : n;
    return WSF_SUCCESS;
}

wsf_result_t Segment::get_token(int index, Token* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Token output is null");
    }
    if (!state_) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment view is not bound");
    }
    wsf_result_t rc = state_->check_token(index_, index, generation_);
    if (rc != WSF_SUCCESS) return rc;

    *out = Token(state_, index_, index, generation_);
    return WSF_SUCCESS;
}

wsf_result_t Segment::to_owned(OwnedSegment* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment output is null");
    }

    OwnedSegment owned;
    owned.index = index_;
    wsf_result_t rc;
    if ((rc = start_timestamp(&owned.start_timestamp)) != WSF_SUCCESS ||
        (rc = end_timestamp(&owned.end_timestamp)) != WSF_SUCCESS ||
        (rc = no_speech_probability(&owned.no_speech_prob)) != WSF_SUCCESS ||
        (rc = next_segment_speaker_turn(&owned.speaker_turn_next)) != WSF_SUCCESS ||
        (rc = text_lossy(&owned.text)) != WSF_SUCCESS) {
        return rc;
    }

    int count = 0;
    if ((rc = n_tokens(&count)) != WSF_SUCCESS) return rc;
    owned.tokens.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        Token token;
        OwnedToken owned_token;
        if ((rc = get_token(i, &token)) != WSF_SUCCESS ||
            (rc = token.to_owned(&owned_token)) != WSF_SUCCESS) {
            return rc;
        }
        owned.tokens.push_back(std::move(owned_token));
    }

    *out = std::move(owned);
    return WSF_SUCCESS;
}

// =============================================================================
// TOKEN VIEW
// =============================================================================

wsf_result_t Token::validate() const {
    if (!state_) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Token view is not bound");
    }
    return state_->check_token(segment_, index_, generation_);
}

const char* Token::raw_text() const {
    return state_->api().token_text(state_->context_->native_handle(), state_->state_, segment_,
                                    index_);
}

wsf_result_t Token::id(wsf_token_id_t* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->api().token_id(state_->state_, segment_, index_);
    return WSF_SUCCESS;
}

wsf_result_t Token::probability(float* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    *out = state_->api().token_p(state_->state_, segment_, index_);
    return WSF_SUCCESS;
}

wsf_result_t Token::data(TokenData* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;

    const whisper_token_data native = state_->api().token_data(state_->state_, segment_, index_);
    out->id = native.id;
    out->tid = native.tid;
    out->p = native.p;
    out->plog = native.plog;
    out->pt = native.pt;
    out->ptsum = native.ptsum;
    out->t0 = state_->to_input_time(native.t0);
    out->t1 = state_->to_input_time(native.t1);
    out->t_dtw = state_->to_input_time(native.t_dtw);
    out->vlen = native.vlen;
    return WSF_SUCCESS;
}

wsf_result_t Token::text(std::string* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(raw_text(), state_->context_->limits().max_token_text_len,
                        Utf8Policy::Strict, out);
}

wsf_result_t Token::text_lossy(std::string* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(raw_text(), state_->context_->limits().max_token_text_len,
                        Utf8Policy::Lossy, out);
}

wsf_result_t Token::bytes(std::vector<uint8_t>* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;
    return guard_bytes(raw_text(), state_->context_->limits().max_token_text_len, out);
}

wsf_result_t Token::n_top_candidates(int* out) const {
    if (!out) return null_output();
    wsf_result_t rc = validate();
    if (rc != WSF_SUCCESS) return rc;

    const NativeApi& api = state_->api();
    if (!api.n_top_candidates || !api.top_candidate) {
        *out = 0;
        return WSF_SUCCESS;
    }
    const int n = api.n_top_candidates(state_->state_, segment_, index_);
    *out = n < 0 ? 0 : n;
    return WSF_SUCCESS;
}

wsf_result_t Token::top_candidate(int index, TokenCandidate* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Candidate output is null");
    }
    int n = 0;
    wsf_result_t rc = n_top_candidates(&n);
    if (rc != WSF_SUCCESS) return rc;
    if (index < 0 || index >= n) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Candidate %d outside [0, %d)", index, n);
        wsf_last_error_set_detail_int(0, "candidate", index);
        wsf_last_error_set_detail_int(1, "n_candidates", n);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    *out = state_->api().top_candidate(state_->state_, segment_, index_, index);
    return WSF_SUCCESS;
}

wsf_result_t Token::all_top_candidates(std::vector<TokenCandidate>* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Candidate output is null");
    }
    int n = 0;
    wsf_result_t rc = n_top_candidates(&n);
    if (rc != WSF_SUCCESS) return rc;

    std::vector<TokenCandidate> candidates;
    candidates.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        candidates.push_back(state_->api().top_candidate(state_->state_, segment_, index_, i));
    }
    *out = std::move(candidates);
    return WSF_SUCCESS;
}

wsf_result_t Token::to_owned(OwnedToken* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Token output is null");
    }

    OwnedToken owned;
    owned.index = index_;
    wsf_result_t rc;
    if ((rc = id(&owned.id)) != WSF_SUCCESS || (rc = probability(&owned.p)) != WSF_SUCCESS ||
        (rc = data(&owned.data)) != WSF_SUCCESS || (rc = bytes(&owned.bytes)) != WSF_SUCCESS ||
        (rc = all_top_candidates(&owned.candidates)) != WSF_SUCCESS) {
        return rc;
    }
    owned.text = utf8_lossy(reinterpret_cast<const char*>(owned.bytes.data()), owned.bytes.size());

    *out = std::move(owned);
    return WSF_SUCCESS;
}

}  // namespace whispersafe
