/**
 * @file wsf_full_params.cpp
 * @brief whisper-safe - Decode Parameter Set Implementation
 */

#include "wsf/features/stt/wsf_full_params.h"

#include <cfloat>
#include <climits>
#include <cstdint>
#include <utility>

#include "full_params_view.h"
#include "segment_trampoline.h"
#include "wsf/core/wsf_config.h"
#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"

namespace whispersafe {

static const char* LOG_CAT = "STT.Params";

namespace {

whisper_sampling_strategy to_native(SamplingStrategy strategy) {
    return strategy == SamplingStrategy::BeamSearch ? WHISPER_SAMPLING_BEAM_SEARCH
                                                    : WHISPER_SAMPLING_GREEDY;
}

// Strings pass through the engine as C strings, so an interior NUL would
// silently truncate them
wsf_result_t check_c_string(const std::string& value, const char* field) {
    if (value.find('\0') != std::string::npos) {
        wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "%s contains an interior NUL", field);
        wsf_last_error_set_detail(0, "field", field);
        return WSF_ERROR_INVALID_ARGUMENT;
    }
    return WSF_SUCCESS;
}

wsf_result_t read_token_array(const nlohmann::json& json, const char* key,
                              std::vector<wsf_token_id_t>* out) {
    if (!json.contains(key)) return WSF_SUCCESS;
    const auto& value = json[key];
    if (!value.is_array()) {
        return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' must be an array", key);
    }

    std::vector<wsf_token_id_t> tokens;
    tokens.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_number_integer()) {
            return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG,
                                  "Config key '%s' must contain integers", key);
        }
        const int64_t id = item.get<int64_t>();
        if (id < 0 || id > INT32_MAX) {
            return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Token id %lld out of range in '%s'",
                                  static_cast<long long>(id), key);
        }
        tokens.push_back(static_cast<wsf_token_id_t>(id));
    }
    *out = std::move(tokens);
    return WSF_SUCCESS;
}

}  // namespace

// =============================================================================
// CONSTRUCTION
// =============================================================================

FullParams::FullParams(SamplingStrategy strategy)
    : native_(whisper_full_default_params(to_native(strategy))) {
    // Take an owned copy of the engine's default language, then strip every
    // pointer so the stored record never aliases anything
    if (native_.language) {
        language_ = std::string(native_.language);
    }
    native_.language = nullptr;
    native_.initial_prompt = nullptr;
    native_.suppress_regex = nullptr;
    native_.prompt_tokens = nullptr;
    native_.prompt_n_tokens = 0;
    native_.vad_model_path = nullptr;

    native_.grammar_rules = nullptr;
    native_.n_grammar_rules = 0;
    native_.i_start_rule = 0;

    native_.new_segment_callback = nullptr;
    native_.new_segment_callback_user_data = nullptr;
    native_.progress_callback = nullptr;
    native_.progress_callback_user_data = nullptr;
    native_.encoder_begin_callback = nullptr;
    native_.encoder_begin_callback_user_data = nullptr;
    native_.abort_callback = nullptr;
    native_.abort_callback_user_data = nullptr;
    native_.logits_filter_callback = nullptr;
    native_.logits_filter_callback_user_data = nullptr;
}

FullParams FullParams::greedy(int best_of) {
    FullParams params(SamplingStrategy::Greedy);
    params.set_best_of(best_of);
    return params;
}

FullParams FullParams::beam_search(int beam_size, float patience) {
    FullParams params(SamplingStrategy::BeamSearch);
    params.set_beam_size(beam_size);
    params.set_patience(patience);
    return params;
}

SamplingStrategy FullParams::strategy() const {
    return native_.strategy == WHISPER_SAMPLING_BEAM_SEARCH ? SamplingStrategy::BeamSearch
                                                            : SamplingStrategy::Greedy;
}

void FullParams::set_strategy(SamplingStrategy strategy) {
    native_.strategy = to_native(strategy);
}

// =============================================================================
// OWNED FIELDS
// =============================================================================

wsf_result_t FullParams::set_language(const std::string& language) {
    wsf_result_t rc = check_c_string(language, "language");
    if (rc != WSF_SUCCESS) return rc;
    language_ = language;
    return WSF_SUCCESS;
}

wsf_result_t FullParams::set_initial_prompt(const std::string& prompt) {
    wsf_result_t rc = check_c_string(prompt, "initial_prompt");
    if (rc != WSF_SUCCESS) return rc;
    initial_prompt_ = prompt;
    return WSF_SUCCESS;
}

wsf_result_t FullParams::set_suppress_regex(const std::string& regex) {
    wsf_result_t rc = check_c_string(regex, "suppress_regex");
    if (rc != WSF_SUCCESS) return rc;
    suppress_regex_ = regex;
    return WSF_SUCCESS;
}

wsf_result_t FullParams::set_vad_model_path(const std::string& path) {
    wsf_result_t rc = check_c_string(path, "vad_model_path");
    if (rc != WSF_SUCCESS) return rc;
    vad_model_path_ = path;
    return WSF_SUCCESS;
}

void FullParams::set_prompt_tokens(std::vector<wsf_token_id_t> tokens) {
    if (tokens.empty()) {
        clear_prompt_tokens();
        return;
    }
    prompt_tokens_ = std::move(tokens);
}

void FullParams::set_forced_tokens(std::vector<wsf_token_id_t> tokens) {
    if (tokens.empty()) {
        clear_forced_tokens();
        return;
    }
    forced_tokens_ = std::move(tokens);
}

wsf_result_t FullParams::set_grammar(std::vector<GrammarRule> rules, size_t start_rule,
                                     float penalty) {
    if (rules.empty()) {
        clear_grammar();
        return WSF_SUCCESS;
    }
    if (start_rule >= rules.size()) {
        wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Grammar start rule %zu out of %zu rules",
                       start_rule, rules.size());
        wsf_last_error_set_detail_int(0, "start_rule", static_cast<int64_t>(start_rule));
        wsf_last_error_set_detail_int(1, "n_rules", static_cast<int64_t>(rules.size()));
        return WSF_ERROR_INVALID_ARGUMENT;
    }
    for (size_t i = 0; i < rules.size(); ++i) {
        // The engine walks each rule until it reaches an END element
        if (rules[i].empty() || rules[i].back().type != WHISPER_GRETYPE_END) {
            wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Grammar rule %zu is not END-terminated",
                           i);
            wsf_last_error_set_detail_int(0, "rule", static_cast<int64_t>(i));
            return WSF_ERROR_INVALID_ARGUMENT;
        }
    }

    grammar_rules_ = std::move(rules);
    grammar_start_rule_ = start_rule;
    grammar_penalty_ = penalty;
    return WSF_SUCCESS;
}

void FullParams::clear_grammar() {
    grammar_rules_.clear();
    grammar_rules_.shrink_to_fit();
    grammar_start_rule_ = 0;
}

wsf_result_t FullParams::set_n_top_candidates(int n) {
    if (n < 0) {
        wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "n_top_candidates must be >= 0, got %d", n);
        return WSF_ERROR_INVALID_ARGUMENT;
    }
    n_top_candidates_ = n;
    return WSF_SUCCESS;
}

bool FullParams::requires_backtrack() const {
    return skip_encode_ || capture_top_candidates_ || !forced_tokens_.empty();
}

size_t FullParams::owned_field_count() const {
    size_t count = 0;
    if (language_) count++;
    if (initial_prompt_) count++;
    if (suppress_regex_) count++;
    if (vad_model_path_) count++;
    if (!prompt_tokens_.empty()) count++;
    if (!forced_tokens_.empty()) count++;
    if (!grammar_rules_.empty()) count++;
    return count;
}

// =============================================================================
// CALLBACKS
// =============================================================================

void FullParams::set_segment_callback(SegmentCallback callback) {
    lossy_segment_callback_ = nullptr;
    segment_callback_ = std::move(callback);
}

void FullParams::set_segment_callback_lossy(LossySegmentCallback callback) {
    segment_callback_ = nullptr;
    lossy_segment_callback_ = std::move(callback);
}

void FullParams::clear_segment_callback() {
    segment_callback_ = nullptr;
    lossy_segment_callback_ = nullptr;
}

bool FullParams::has_segment_callback() const {
    return static_cast<bool>(segment_callback_) || static_cast<bool>(lossy_segment_callback_);
}

// =============================================================================
// JSON CONFIGURATION
// =============================================================================

wsf_result_t FullParams::apply_json(const nlohmann::json& json) {
    wsf_result_t rc = config::require_object(json, "decode");
    if (rc != WSF_SUCCESS) return rc;

    FullParams updated(*this);
    whisper_full_params& n = updated.native_;

    if (json.contains("strategy")) {
        std::string strategy;
        if ((rc = config::read_string(json, "strategy", &strategy)) != WSF_SUCCESS) return rc;
        if (strategy == "greedy") {
            updated.set_strategy(SamplingStrategy::Greedy);
        } else if (strategy == "beam_search") {
            updated.set_strategy(SamplingStrategy::BeamSearch);
        } else {
            return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Unknown strategy '%s'",
                                  strategy.c_str());
        }
    }

    const struct {
        const char* key;
        bool* field;
    } bools[] = {
        {"translate", &n.translate},
        {"no_context", &n.no_context},
        {"no_timestamps", &n.no_timestamps},
        {"single_segment", &n.single_segment},
        {"detect_language", &n.detect_language},
        {"debug_mode", &n.debug_mode},
        {"tdrz_enable", &n.tdrz_enable},
        {"print_special", &n.print_special},
        {"print_progress", &n.print_progress},
        {"print_realtime", &n.print_realtime},
        {"print_timestamps", &n.print_timestamps},
        {"token_timestamps", &n.token_timestamps},
        {"split_on_word", &n.split_on_word},
        {"suppress_blank", &n.suppress_blank},
        {"suppress_nst", &n.suppress_nst},
        {"vad", &n.vad},
        {"skip_encode", &updated.skip_encode_},
        {"capture_top_candidates", &updated.capture_top_candidates_},
    };
    for (const auto& option : bools) {
        if ((rc = config::read_bool(json, option.key, option.field)) != WSF_SUCCESS) return rc;
    }

    const struct {
        const char* key;
        int* field;
        int min_value;
        int max_value;
    } ints[] = {
        {"best_of", &n.greedy.best_of, 1, INT_MAX},
        {"beam_size", &n.beam_search.beam_size, 1, INT_MAX},
        {"n_threads", &n.n_threads, 1, 1024},
        {"n_max_text_ctx", &n.n_max_text_ctx, 0, INT_MAX},
        {"offset_ms", &n.offset_ms, 0, INT_MAX},
        {"duration_ms", &n.duration_ms, 0, INT_MAX},
        {"audio_ctx", &n.audio_ctx, 0, INT_MAX},
        {"max_len", &n.max_len, 0, INT_MAX},
        {"max_tokens", &n.max_tokens, 0, INT_MAX},
        {"n_top_candidates", &updated.n_top_candidates_, 0, INT_MAX},
    };
    for (const auto& option : ints) {
        if ((rc = config::read_int(json, option.key, option.min_value, option.max_value,
                                   option.field)) != WSF_SUCCESS) {
            return rc;
        }
    }

    const struct {
        const char* key;
        float* field;
        float min_value;
    } floats[] = {
        {"patience", &n.beam_search.patience, -FLT_MAX},
        {"temperature", &n.temperature, 0.0f},
        {"temperature_inc", &n.temperature_inc, 0.0f},
        {"thold_pt", &n.thold_pt, 0.0f},
        {"thold_ptsum", &n.thold_ptsum, 0.0f},
        {"max_initial_ts", &n.max_initial_ts, 0.0f},
        {"length_penalty", &n.length_penalty, -FLT_MAX},
        {"entropy_thold", &n.entropy_thold, -FLT_MAX},
        {"logprob_thold", &n.logprob_thold, -FLT_MAX},
        {"no_speech_thold", &n.no_speech_thold, -FLT_MAX},
    };
    for (const auto& option : floats) {
        if ((rc = config::read_float(json, option.key, option.min_value, FLT_MAX, option.field)) !=
            WSF_SUCCESS) {
            return rc;
        }
    }

    const struct {
        const char* key;
        std::optional<std::string>* field;
    } strings[] = {
        {"language", &updated.language_},
        {"initial_prompt", &updated.initial_prompt_},
        {"suppress_regex", &updated.suppress_regex_},
        {"vad_model_path", &updated.vad_model_path_},
    };
    for (const auto& option : strings) {
        if (!json.contains(option.key)) continue;
        std::string value;
        if ((rc = config::read_string(json, option.key, &value)) != WSF_SUCCESS) return rc;
        if (value.find('\0') != std::string::npos) {
            return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' contains a NUL",
                                  option.key);
        }
        if (value.empty()) {
            option.field->reset();
        } else {
            *option.field = std::move(value);
        }
    }

    if (json.contains("prompt_tokens")) {
        std::vector<wsf_token_id_t> tokens;
        if ((rc = read_token_array(json, "prompt_tokens", &tokens)) != WSF_SUCCESS) return rc;
        updated.set_prompt_tokens(std::move(tokens));
    }
    if (json.contains("forced_tokens")) {
        std::vector<wsf_token_id_t> tokens;
        if ((rc = read_token_array(json, "forced_tokens", &tokens)) != WSF_SUCCESS) return rc;
        updated.set_forced_tokens(std::move(tokens));
    }

    if (json.contains("vad_params")) {
        VadParams vad = VadParams::from_native(n.vad_params);
        if ((rc = VadParams::from_json(json["vad_params"], &vad)) != WSF_SUCCESS) return rc;
        n.vad_params = vad.to_native();
    }

    *this = std::move(updated);
    WSF_LOG_DEBUG(LOG_CAT, "Applied decode config with %zu keys", json.size());
    return WSF_SUCCESS;
}

// =============================================================================
// NATIVE VIEW
// =============================================================================

FullParamsView::FullParamsView(const FullParams& params, SegmentBinding* segment_binding,
                               ProgressBinding* progress_binding)
    : native_(params.native_) {
    native_.language = params.language_ ? params.language_->c_str() : nullptr;
    native_.initial_prompt = params.initial_prompt_ ? params.initial_prompt_->c_str() : nullptr;
    native_.suppress_regex = params.suppress_regex_ ? params.suppress_regex_->c_str() : nullptr;
    // WhisperState::full() runs the VAD pass before the engine call
    native_.vad = false;
    native_.vad_model_path = nullptr;

    if (!params.prompt_tokens_.empty()) {
        native_.prompt_tokens = params.prompt_tokens_.data();
        native_.prompt_n_tokens = static_cast<int>(params.prompt_tokens_.size());
    }

    if (!params.grammar_rules_.empty()) {
        grammar_ptrs_.reserve(params.grammar_rules_.size());
        for (const auto& rule : params.grammar_rules_) {
            grammar_ptrs_.push_back(rule.data());
        }
        native_.grammar_rules = grammar_ptrs_.data();
        native_.n_grammar_rules = grammar_ptrs_.size();
        native_.i_start_rule = params.grammar_start_rule_;
        native_.grammar_penalty = params.grammar_penalty_;
    }

#if WSF_HAVE_BACKTRACK
    native_.skip_encode = params.skip_encode_;
    native_.capture_top_candidates = params.capture_top_candidates_;
    native_.n_top_candidates = params.n_top_candidates_;
    if (!params.forced_tokens_.empty()) {
        native_.forced_tokens = params.forced_tokens_.data();
        native_.n_forced_tokens = static_cast<int>(params.forced_tokens_.size());
    } else {
        native_.forced_tokens = nullptr;
        native_.n_forced_tokens = 0;
    }
#endif

    if (segment_binding) {
        native_.new_segment_callback = segment_trampoline;
        native_.new_segment_callback_user_data = segment_binding;
    }
    if (progress_binding) {
        native_.progress_callback = progress_trampoline;
        native_.progress_callback_user_data = progress_binding;
    }
}

}  // namespace whispersafe
