/**
 * @file wsf_native_api.cpp
 * @brief whisper-safe - Native Engine Function Table bound to libwhisper
 */

#include "wsf/ffi/wsf_native_api.h"

#include <string>

#include "wsf/core/wsf_logger.h"

namespace whispersafe {

// =============================================================================
// LOG CALLBACK
// =============================================================================

static void whisper_log_callback(ggml_log_level level, const char* text, void* user_data) {
    (void)user_data;

    // Strip trailing newlines for cleaner logging
    std::string msg(text ? text : "");
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }
    if (msg.empty())
        return;

    if (level == GGML_LOG_LEVEL_ERROR) {
        WSF_LOG_ERROR("Whisper.GGML", "%s", msg.c_str());
    } else if (level == GGML_LOG_LEVEL_WARN) {
        WSF_LOG_WARNING("Whisper.GGML", "%s", msg.c_str());
    } else if (level == GGML_LOG_LEVEL_INFO) {
        WSF_LOG_DEBUG("Whisper.GGML", "%s", msg.c_str());
    } else {
        WSF_LOG_TRACE("Whisper.GGML", "%s", msg.c_str());
    }
}

void install_native_log_hook(const NativeApi* api) {
    const NativeApi& native = resolve_api(api);
    if (native.log_set) {
        native.log_set(whisper_log_callback, nullptr);
    }
}

// =============================================================================
// DEFAULT TABLE
// =============================================================================

static NativeApi make_default_api() {
    NativeApi api{};

    api.init_from_file = [](const char* path, whisper_context_params params) {
        return whisper_init_from_file_with_params(path, params);
    };
    api.init_from_buffer = [](void* buffer, size_t buffer_size, whisper_context_params params) {
        return whisper_init_from_buffer_with_params(buffer, buffer_size, params);
    };
    api.free_context = [](whisper_context* ctx) { whisper_free(ctx); };
    api.init_state = [](whisper_context* ctx) { return whisper_init_state(ctx); };
    api.free_state = [](whisper_state* state) { whisper_free_state(state); };

    api.tokenize = [](whisper_context* ctx, const char* text, whisper_token* tokens, int n_max) {
        return whisper_tokenize(ctx, text, tokens, n_max);
    };
    api.n_vocab = [](whisper_context* ctx) { return whisper_n_vocab(ctx); };
    api.is_multilingual = [](whisper_context* ctx) { return whisper_is_multilingual(ctx); };
    api.token_to_str = [](whisper_context* ctx, whisper_token token) {
        return whisper_token_to_str(ctx, token);
    };
    api.lang_max_id = []() { return whisper_lang_max_id(); };
    api.lang_id = [](const char* lang) { return whisper_lang_id(lang); };
    api.lang_str = [](int id) { return whisper_lang_str(id); };
    api.lang_str_full = [](int id) { return whisper_lang_str_full(id); };

    api.full_with_state = [](whisper_context* ctx, whisper_state* state,
                             whisper_full_params params, const float* samples, int n_samples) {
        return whisper_full_with_state(ctx, state, params, samples, n_samples);
    };
    api.full_n_segments = [](whisper_state* state) {
        return whisper_full_n_segments_from_state(state);
    };
    api.full_lang_id = [](whisper_state* state) { return whisper_full_lang_id_from_state(state); };
    api.segment_t0 = [](whisper_state* state, int i_segment) -> int64_t {
        return whisper_full_get_segment_t0_from_state(state, i_segment);
    };
    api.segment_t1 = [](whisper_state* state, int i_segment) -> int64_t {
        return whisper_full_get_segment_t1_from_state(state, i_segment);
    };
    api.segment_speaker_turn_next = [](whisper_state* state, int i_segment) -> bool {
        return whisper_full_get_segment_speaker_turn_next_from_state(state, i_segment);
    };
    api.segment_no_speech_prob = [](whisper_state* state, int i_segment) -> float {
        return whisper_full_get_segment_no_speech_prob_from_state(state, i_segment);
    };
    api.segment_text = [](whisper_state* state, int i_segment) {
        return whisper_full_get_segment_text_from_state(state, i_segment);
    };
    api.full_n_tokens = [](whisper_state* state, int i_segment) {
        return whisper_full_n_tokens_from_state(state, i_segment);
    };
    api.token_text = [](whisper_context* ctx, whisper_state* state, int i_segment, int i_token) {
        return whisper_full_get_token_text_from_state(ctx, state, i_segment, i_token);
    };
    api.token_id = [](whisper_state* state, int i_segment, int i_token) {
        return whisper_full_get_token_id_from_state(state, i_segment, i_token);
    };
    api.token_data = [](whisper_state* state, int i_segment, int i_token) {
        return whisper_full_get_token_data_from_state(state, i_segment, i_token);
    };
    api.token_p = [](whisper_state* state, int i_segment, int i_token) -> float {
        return whisper_full_get_token_p_from_state(state, i_segment, i_token);
    };
#if WSF_HAVE_BACKTRACK
    api.n_top_candidates = [](whisper_state* state, int i_segment, int i_token) {
        return whisper_full_n_top_candidates_from_state(state, i_segment, i_token);
    };
    api.top_candidate = [](whisper_state* state, int i_segment, int i_token, int i_candidate) {
        const whisper_token_candidate c =
            whisper_full_get_top_candidate_from_state(state, i_segment, i_token, i_candidate);
        TokenCandidate candidate;
        candidate.id = c.id;
        candidate.p = c.p;
        candidate.plog = c.plog;
        return candidate;
    };
#endif

    api.vad_init_from_file = [](const char* path, whisper_vad_context_params params) {
        return whisper_vad_init_from_file_with_params(path, params);
    };
    api.vad_free = [](whisper_vad_context* vctx) { whisper_vad_free(vctx); };
    api.vad_detect_speech = [](whisper_vad_context* vctx, const float* samples,
                               int n_samples) -> bool {
        return whisper_vad_detect_speech(vctx, samples, n_samples);
    };
    api.vad_n_probs = [](whisper_vad_context* vctx) { return whisper_vad_n_probs(vctx); };
    api.vad_probs = [](whisper_vad_context* vctx) { return whisper_vad_probs(vctx); };
    api.vad_segments_from_probs = [](whisper_vad_context* vctx, whisper_vad_params params) {
        return whisper_vad_segments_from_probs(vctx, params);
    };
    api.vad_segments_from_samples = [](whisper_vad_context* vctx, whisper_vad_params params,
                                       const float* samples, int n_samples) {
        return whisper_vad_segments_from_samples(vctx, params, samples, n_samples);
    };
    api.vad_segments_n_segments = [](whisper_vad_segments* segments) {
        return whisper_vad_segments_n_segments(segments);
    };
    api.vad_segment_t0 = [](whisper_vad_segments* segments, int i_segment) -> float {
        return whisper_vad_segments_get_segment_t0(segments, i_segment);
    };
    api.vad_segment_t1 = [](whisper_vad_segments* segments, int i_segment) -> float {
        return whisper_vad_segments_get_segment_t1(segments, i_segment);
    };
    api.vad_free_segments = [](whisper_vad_segments* segments) {
        whisper_vad_free_segments(segments);
    };

    api.print_system_info = []() { return whisper_print_system_info(); };
    api.version = []() { return whisper_version(); };
    api.log_set = [](ggml_log_callback callback, void* user_data) {
        whisper_log_set(callback, user_data);
    };

    return api;
}

const NativeApi& default_native_api() {
    static const NativeApi api = make_default_api();
    return api;
}

}  // namespace whispersafe
