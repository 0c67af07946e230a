/**
 * @file wsf_full_params.h
 * @brief whisper-safe - Decode Parameter Set
 *
 * FullParams describes one decode invocation. Every string and array the
 * engine reads through a pointer is copied into storage owned by the
 * FullParams; the pointers themselves are only derived inside
 * WhisperState::full() for the duration of the engine call.
 *
 * Usage:
 *   FullParams params = FullParams::greedy();
 *   params.set_language("en");
 *   params.set_segment_callback_lossy([](const SegmentCallbackData& s) { ... });
 *   state->full(params, pcm.data(), pcm.size());
 */

#ifndef WSF_FULL_PARAMS_H
#define WSF_FULL_PARAMS_H

#include <nlohmann/json.hpp>
#include <whisper.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_types.h"
#include "wsf/features/stt/wsf_segment_callback.h"
#include "wsf/features/vad/wsf_vad.h"

namespace whispersafe {

enum class SamplingStrategy { Greedy, BeamSearch };

using GrammarRule = std::vector<whisper_grammar_element>;

class FullParamsView;
class WhisperState;

class FullParams {
   public:
    explicit FullParams(SamplingStrategy strategy = SamplingStrategy::Greedy);

    static FullParams greedy(int best_of = 1);
    static FullParams beam_search(int beam_size = 5, float patience = -1.0f);

    SamplingStrategy strategy() const;
    void set_strategy(SamplingStrategy strategy);

    // =========================================================================
    // Scalar options
    // =========================================================================

    void set_best_of(int best_of) { native_.greedy.best_of = best_of; }
    void set_beam_size(int beam_size) { native_.beam_search.beam_size = beam_size; }
    void set_patience(float patience) { native_.beam_search.patience = patience; }

    void set_n_threads(int n_threads) { native_.n_threads = n_threads; }
    void set_n_max_text_ctx(int n) { native_.n_max_text_ctx = n; }
    void set_offset_ms(int offset_ms) { native_.offset_ms = offset_ms; }
    void set_duration_ms(int duration_ms) { native_.duration_ms = duration_ms; }
    void set_audio_ctx(int audio_ctx) { native_.audio_ctx = audio_ctx; }

    void set_translate(bool v) { native_.translate = v; }
    void set_no_context(bool v) { native_.no_context = v; }
    void set_no_timestamps(bool v) { native_.no_timestamps = v; }
    void set_single_segment(bool v) { native_.single_segment = v; }
    void set_detect_language(bool v) { native_.detect_language = v; }
    void set_debug_mode(bool v) { native_.debug_mode = v; }
    void set_tdrz_enable(bool v) { native_.tdrz_enable = v; }

    void set_print_special(bool v) { native_.print_special = v; }
    void set_print_progress(bool v) { native_.print_progress = v; }
    void set_print_realtime(bool v) { native_.print_realtime = v; }
    void set_print_timestamps(bool v) { native_.print_timestamps = v; }

    // Token-level timestamps
    void set_token_timestamps(bool v) { native_.token_timestamps = v; }
    void set_thold_pt(float v) { native_.thold_pt = v; }
    void set_thold_ptsum(float v) { native_.thold_ptsum = v; }
    void set_max_len(int max_len) { native_.max_len = max_len; }
    void set_split_on_word(bool v) { native_.split_on_word = v; }
    void set_max_tokens(int max_tokens) { native_.max_tokens = max_tokens; }

    void set_suppress_blank(bool v) { native_.suppress_blank = v; }
    void set_suppress_nst(bool v) { native_.suppress_nst = v; }

    void set_temperature(float v) { native_.temperature = v; }
    void set_temperature_inc(float v) { native_.temperature_inc = v; }
    void set_max_initial_ts(float v) { native_.max_initial_ts = v; }
    void set_length_penalty(float v) { native_.length_penalty = v; }
    void set_entropy_thold(float v) { native_.entropy_thold = v; }
    void set_logprob_thold(float v) { native_.logprob_thold = v; }
    void set_no_speech_thold(float v) { native_.no_speech_thold = v; }

    // In-decode voice activity detection. WhisperState::full() loads the model
    // from vad_model_path and decodes only the detected speech.
    void set_vad_enabled(bool v) { native_.vad = v; }
    void set_vad_params(const VadParams& params) { native_.vad_params = params.to_native(); }

    const whisper_full_params& scalars() const { return native_; }

    // =========================================================================
    // Owned strings
    //
    // Setters reject strings containing an interior NUL with
    // WSF_ERROR_INVALID_ARGUMENT. Each set replaces the previous copy; each
    // clear drops it and the engine sees a null pointer.
    // =========================================================================

    /** "auto" or an empty language requests detection */
    wsf_result_t set_language(const std::string& language);
    void clear_language() { language_.reset(); }
    const std::optional<std::string>& language() const { return language_; }

    wsf_result_t set_initial_prompt(const std::string& prompt);
    void clear_initial_prompt() { initial_prompt_.reset(); }
    const std::optional<std::string>& initial_prompt() const { return initial_prompt_; }

    wsf_result_t set_suppress_regex(const std::string& regex);
    void clear_suppress_regex() { suppress_regex_.reset(); }
    const std::optional<std::string>& suppress_regex() const { return suppress_regex_; }

    wsf_result_t set_vad_model_path(const std::string& path);
    void clear_vad_model_path() { vad_model_path_.reset(); }
    const std::optional<std::string>& vad_model_path() const { return vad_model_path_; }

    // =========================================================================
    // Owned token arrays (an empty array is the same as clearing)
    // =========================================================================

    void set_prompt_tokens(std::vector<wsf_token_id_t> tokens);
    void clear_prompt_tokens() { prompt_tokens_.clear(); prompt_tokens_.shrink_to_fit(); }
    const std::vector<wsf_token_id_t>& prompt_tokens() const { return prompt_tokens_; }

    /**
     * Token sequence the decoder is forced to emit before sampling resumes.
     * Requires the backtrack build of the engine.
     */
    void set_forced_tokens(std::vector<wsf_token_id_t> tokens);
    void clear_forced_tokens() { forced_tokens_.clear(); forced_tokens_.shrink_to_fit(); }
    const std::vector<wsf_token_id_t>& forced_tokens() const { return forced_tokens_; }

    // =========================================================================
    // Grammar
    // =========================================================================

    /**
     * Each rule must be non-empty and end with WHISPER_GRETYPE_END, and
     * start_rule must index a rule. An empty rule set clears the grammar.
     */
    wsf_result_t set_grammar(std::vector<GrammarRule> rules, size_t start_rule,
                             float penalty = 100.0f);
    void clear_grammar();
    const std::vector<GrammarRule>& grammar_rules() const { return grammar_rules_; }

    // =========================================================================
    // Backtrack extensions
    // =========================================================================

    /** Reuse the previous encoding of the state and only re-run the decoder */
    void set_skip_encode(bool v) { skip_encode_ = v; }
    bool skip_encode() const { return skip_encode_; }

    void set_capture_top_candidates(bool v) { capture_top_candidates_ = v; }
    bool capture_top_candidates() const { return capture_top_candidates_; }

    wsf_result_t set_n_top_candidates(int n);
    int n_top_candidates() const { return n_top_candidates_; }

    /** True if any option needs an engine built with the backtrack extensions */
    bool requires_backtrack() const;

    // =========================================================================
    // Callbacks (at most one segment callback is active)
    // =========================================================================

    void set_segment_callback(SegmentCallback callback);
    void set_segment_callback_lossy(LossySegmentCallback callback);
    void clear_segment_callback();
    bool has_segment_callback() const;

    void set_progress_callback(ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }
    void clear_progress_callback() { progress_callback_ = nullptr; }

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * Apply options from JSON. Nothing is applied if any key is invalid.
     *
     * Accepts every scalar option above by its setter name without "set_",
     * plus "strategy" ("greedy" | "beam_search"), "language",
     * "initial_prompt", "suppress_regex", "vad", "vad_model_path",
     * "vad_params" (object), "prompt_tokens" and "forced_tokens" (int arrays),
     * "skip_encode", "capture_top_candidates" and "n_top_candidates".
     */
    wsf_result_t apply_json(const nlohmann::json& config);

    /** Number of owned string/array copies currently held */
    size_t owned_field_count() const;

   private:
    friend class FullParamsView;
    friend class WhisperState;

    // Pointer and callback fields are always null here
    whisper_full_params native_;

    std::optional<std::string> language_;
    std::optional<std::string> initial_prompt_;
    std::optional<std::string> suppress_regex_;
    std::optional<std::string> vad_model_path_;

    std::vector<wsf_token_id_t> prompt_tokens_;
    std::vector<wsf_token_id_t> forced_tokens_;

    std::vector<GrammarRule> grammar_rules_;
    size_t grammar_start_rule_ = 0;
    float grammar_penalty_ = 100.0f;

    bool skip_encode_ = false;
    bool capture_top_candidates_ = false;
    int n_top_candidates_ = 0;

    SegmentCallback segment_callback_;
    LossySegmentCallback lossy_segment_callback_;
    ProgressCallback progress_callback_;
};

}  // namespace whispersafe

#endif  // WSF_FULL_PARAMS_H
