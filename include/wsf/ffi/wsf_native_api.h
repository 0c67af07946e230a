/**
 * @file wsf_native_api.h
 * @brief whisper-safe - Native Engine Function Table
 *
 * Every call this library makes into whisper.cpp goes through a NativeApi
 * table. default_native_api() binds the linked libwhisper; tests bind a
 * substitute engine to drive the boundary checks with malformed results.
 *
 * The top-candidate entries come from the backtrack extensions of the
 * engine and are null unless the library is built with
 * WSF_HAVE_BACKTRACK=1.
 */

#ifndef WSF_NATIVE_API_H
#define WSF_NATIVE_API_H

#include <whisper.h>

#include <cstddef>
#include <cstdint>

#include "wsf/core/wsf_types.h"

#ifndef WSF_HAVE_BACKTRACK
#define WSF_HAVE_BACKTRACK 0
#endif

namespace whispersafe {

/** Alternative token considered at a position, with its probability */
struct TokenCandidate {
    wsf_token_id_t id = 0;
    float p = 0.0f;
    float plog = 0.0f;
};

struct NativeApi {
    // -------------------------------------------------------------------------
    // Model and state lifetime
    // -------------------------------------------------------------------------
    whisper_context* (*init_from_file)(const char* path, whisper_context_params params);
    whisper_context* (*init_from_buffer)(void* buffer, size_t buffer_size,
                                         whisper_context_params params);
    void (*free_context)(whisper_context* ctx);
    whisper_state* (*init_state)(whisper_context* ctx);
    void (*free_state)(whisper_state* state);

    // -------------------------------------------------------------------------
    // Vocabulary and languages
    // -------------------------------------------------------------------------
    int (*tokenize)(whisper_context* ctx, const char* text, whisper_token* tokens, int n_max);
    int (*n_vocab)(whisper_context* ctx);
    int (*is_multilingual)(whisper_context* ctx);
    const char* (*token_to_str)(whisper_context* ctx, whisper_token token);
    int (*lang_max_id)();
    int (*lang_id)(const char* lang);
    const char* (*lang_str)(int id);
    const char* (*lang_str_full)(int id);

    // -------------------------------------------------------------------------
    // Decode and results
    // -------------------------------------------------------------------------
    int (*full_with_state)(whisper_context* ctx, whisper_state* state, whisper_full_params params,
                           const float* samples, int n_samples);
    int (*full_n_segments)(whisper_state* state);
    int (*full_lang_id)(whisper_state* state);
    int64_t (*segment_t0)(whisper_state* state, int i_segment);
    int64_t (*segment_t1)(whisper_state* state, int i_segment);
    bool (*segment_speaker_turn_next)(whisper_state* state, int i_segment);
    float (*segment_no_speech_prob)(whisper_state* state, int i_segment);
    const char* (*segment_text)(whisper_state* state, int i_segment);
    int (*full_n_tokens)(whisper_state* state, int i_segment);
    const char* (*token_text)(whisper_context* ctx, whisper_state* state, int i_segment,
                              int i_token);
    whisper_token (*token_id)(whisper_state* state, int i_segment, int i_token);
    whisper_token_data (*token_data)(whisper_state* state, int i_segment, int i_token);
    float (*token_p)(whisper_state* state, int i_segment, int i_token);
    int (*n_top_candidates)(whisper_state* state, int i_segment, int i_token);
    TokenCandidate (*top_candidate)(whisper_state* state, int i_segment, int i_token,
                                    int i_candidate);

    // -------------------------------------------------------------------------
    // Voice activity detection
    // -------------------------------------------------------------------------
    whisper_vad_context* (*vad_init_from_file)(const char* path,
                                               whisper_vad_context_params params);
    void (*vad_free)(whisper_vad_context* vctx);
    bool (*vad_detect_speech)(whisper_vad_context* vctx, const float* samples, int n_samples);
    int (*vad_n_probs)(whisper_vad_context* vctx);
    float* (*vad_probs)(whisper_vad_context* vctx);
    whisper_vad_segments* (*vad_segments_from_probs)(whisper_vad_context* vctx,
                                                     whisper_vad_params params);
    whisper_vad_segments* (*vad_segments_from_samples)(whisper_vad_context* vctx,
                                                       whisper_vad_params params,
                                                       const float* samples, int n_samples);
    int (*vad_segments_n_segments)(whisper_vad_segments* segments);
    float (*vad_segment_t0)(whisper_vad_segments* segments, int i_segment);
    float (*vad_segment_t1)(whisper_vad_segments* segments, int i_segment);
    void (*vad_free_segments)(whisper_vad_segments* segments);

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------
    const char* (*print_system_info)();
    const char* (*version)();
    void (*log_set)(ggml_log_callback callback, void* user_data);
};

/**
 * Table bound to the linked libwhisper. Valid for the life of the process.
 */
const NativeApi& default_native_api();

/**
 * Resolve an optional caller-supplied table, falling back to the default.
 */
inline const NativeApi& resolve_api(const NativeApi* api) {
    return api ? *api : default_native_api();
}

/**
 * Route the engine's log output into whispersafe::Logger
 * (category "Whisper.GGML").
 */
void install_native_log_hook(const NativeApi* api = nullptr);

}  // namespace whispersafe

#endif  // WSF_NATIVE_API_H
