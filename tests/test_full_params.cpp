/**
 * @file test_full_params.cpp
 * @brief Tests for decode parameter ownership, validation and JSON config
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "fake_native_api.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/features/stt/wsf_context.h"
#include "wsf/features/stt/wsf_full_params.h"
#include "wsf/features/stt/wsf_state.h"

using namespace whispersafe;
using nlohmann::json;

namespace {

class FullParamsTest : public ::testing::Test {
   protected:
    void SetUp() override {
        fake::reset();
        ASSERT_EQ(WhisperContext::create_from_file("model.bin", ContextParams(), &context_,
                                                   &fake::api()),
                  WSF_SUCCESS);
        ASSERT_EQ(context_->create_state(&state_), WSF_SUCCESS);
    }

    std::shared_ptr<WhisperContext> context_;
    std::unique_ptr<WhisperState> state_;
    std::vector<float> pcm_ = std::vector<float>(1600, 0.0f);
};

std::vector<GrammarRule> yes_no_grammar() {
    // root ::= "y" | "n"
    GrammarRule root = {
        {WHISPER_GRETYPE_CHAR, 'y'},
        {WHISPER_GRETYPE_ALT, 0},
        {WHISPER_GRETYPE_CHAR, 'n'},
        {WHISPER_GRETYPE_END, 0},
    };
    return {root};
}

}  // namespace

// =============================================================================
// DEFAULTS
// =============================================================================

TEST(FullParamsDefaults, OwnsDefaultLanguageAndNoPointers) {
    FullParams params;
    ASSERT_TRUE(params.language().has_value());
    EXPECT_EQ(*params.language(), "en");
    EXPECT_EQ(params.owned_field_count(), 1u);

    const whisper_full_params& scalars = params.scalars();
    EXPECT_EQ(scalars.language, nullptr);
    EXPECT_EQ(scalars.initial_prompt, nullptr);
    EXPECT_EQ(scalars.prompt_tokens, nullptr);
    EXPECT_EQ(scalars.grammar_rules, nullptr);
    EXPECT_EQ(scalars.new_segment_callback, nullptr);
    EXPECT_EQ(scalars.progress_callback, nullptr);
}

TEST(FullParamsDefaults, StrategyFactories) {
    FullParams greedy = FullParams::greedy(3);
    EXPECT_EQ(greedy.strategy(), SamplingStrategy::Greedy);
    EXPECT_EQ(greedy.scalars().greedy.best_of, 3);

    FullParams beam = FullParams::beam_search(4, 1.5f);
    EXPECT_EQ(beam.strategy(), SamplingStrategy::BeamSearch);
    EXPECT_EQ(beam.scalars().beam_search.beam_size, 4);
    EXPECT_FLOAT_EQ(beam.scalars().beam_search.patience, 1.5f);
}

// =============================================================================
// OWNED STRINGS AND ARRAYS
// =============================================================================

TEST(FullParamsOwnership, RepeatedSetsKeepOneCopy) {
    FullParams params;
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(params.set_initial_prompt("prompt " + std::to_string(i)), WSF_SUCCESS);
    }
    EXPECT_EQ(params.owned_field_count(), 2u);  // language + prompt
    EXPECT_EQ(*params.initial_prompt(), "prompt 999");

    params.clear_initial_prompt();
    params.clear_language();
    EXPECT_EQ(params.owned_field_count(), 0u);
}

TEST(FullParamsOwnership, RepeatedLanguageSetsThenDestroy) {
    std::unique_ptr<FullParams> params(new FullParams());
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(params->set_language(i % 2 ? "de" : "fr"), WSF_SUCCESS);
    }
    EXPECT_EQ(params->owned_field_count(), 1u);
    EXPECT_EQ(*params->language(), "de");
    params.reset();
}

TEST(FullParamsOwnership, InteriorNulIsRejected) {
    FullParams params;
    const std::string bad("en\0de", 5);
    EXPECT_EQ(params.set_language(bad), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "field"), "language");
    EXPECT_EQ(*params.language(), "en");

    EXPECT_EQ(params.set_initial_prompt(bad), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(params.set_suppress_regex(bad), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(params.set_vad_model_path(bad), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_FALSE(params.initial_prompt().has_value());
}

TEST(FullParamsOwnership, EmptyTokenArrayClears) {
    FullParams params;
    params.set_prompt_tokens({1, 2, 3});
    EXPECT_EQ(params.prompt_tokens().size(), 3u);
    EXPECT_EQ(params.owned_field_count(), 2u);

    params.set_prompt_tokens({});
    EXPECT_TRUE(params.prompt_tokens().empty());
    EXPECT_EQ(params.owned_field_count(), 1u);
}

TEST(FullParamsOwnership, CopiesAreIndependent) {
    FullParams a;
    ASSERT_EQ(a.set_initial_prompt("first"), WSF_SUCCESS);
    FullParams b = a;
    ASSERT_EQ(b.set_initial_prompt("second"), WSF_SUCCESS);
    EXPECT_EQ(*a.initial_prompt(), "first");
    EXPECT_EQ(*b.initial_prompt(), "second");
}

// =============================================================================
// GRAMMAR
// =============================================================================

TEST(FullParamsGrammar, AcceptsTerminatedRules) {
    FullParams params;
    ASSERT_EQ(params.set_grammar(yes_no_grammar(), 0), WSF_SUCCESS);
    EXPECT_EQ(params.grammar_rules().size(), 1u);

    ASSERT_EQ(params.set_grammar({}, 0), WSF_SUCCESS);
    EXPECT_TRUE(params.grammar_rules().empty());
}

TEST(FullParamsGrammar, RejectsUnterminatedRule) {
    FullParams params;
    std::vector<GrammarRule> rules = yes_no_grammar();
    rules.push_back({{WHISPER_GRETYPE_CHAR, 'x'}});

    EXPECT_EQ(params.set_grammar(rules, 0), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "rule"), "1");
    EXPECT_TRUE(params.grammar_rules().empty());

    rules.back() = {};
    EXPECT_EQ(params.set_grammar(rules, 0), WSF_ERROR_INVALID_ARGUMENT);
}

TEST(FullParamsGrammar, RejectsStartRuleOutOfRange) {
    FullParams params;
    EXPECT_EQ(params.set_grammar(yes_no_grammar(), 1), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "n_rules"), "1");
}

// =============================================================================
// CALLBACKS AND BACKTRACK OPTIONS
// =============================================================================

TEST(FullParamsCallbacks, StrictAndLossyAreExclusive) {
    FullParams params;
    EXPECT_FALSE(params.has_segment_callback());

    params.set_segment_callback([](wsf_result_t, const SegmentCallbackData&) {});
    EXPECT_TRUE(params.has_segment_callback());
    params.set_segment_callback_lossy([](const SegmentCallbackData&) {});
    EXPECT_TRUE(params.has_segment_callback());

    params.clear_segment_callback();
    EXPECT_FALSE(params.has_segment_callback());
}

TEST(FullParamsBacktrack, RequiresBacktrack) {
    FullParams params;
    EXPECT_FALSE(params.requires_backtrack());
    EXPECT_EQ(params.set_n_top_candidates(-1), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(params.set_n_top_candidates(5), WSF_SUCCESS);
    EXPECT_FALSE(params.requires_backtrack());

    params.set_forced_tokens({7});
    EXPECT_TRUE(params.requires_backtrack());
    params.clear_forced_tokens();

    params.set_capture_top_candidates(true);
    EXPECT_TRUE(params.requires_backtrack());
}

// =============================================================================
// JSON
// =============================================================================

TEST(FullParamsJson, AppliesOptions) {
    FullParams params;
    const json config = json::parse(R"({
        "strategy": "beam_search",
        "beam_size": 3,
        "n_threads": 2,
        "translate": true,
        "temperature": 0.2,
        "language": "de",
        "initial_prompt": "Glossary: whisper",
        "prompt_tokens": [5, 6],
        "vad": true,
        "vad_params": { "threshold": 0.6 }
    })");

    ASSERT_EQ(params.apply_json(config), WSF_SUCCESS);
    EXPECT_EQ(params.strategy(), SamplingStrategy::BeamSearch);
    EXPECT_EQ(params.scalars().beam_search.beam_size, 3);
    EXPECT_EQ(params.scalars().n_threads, 2);
    EXPECT_TRUE(params.scalars().translate);
    EXPECT_FLOAT_EQ(params.scalars().temperature, 0.2f);
    EXPECT_EQ(*params.language(), "de");
    EXPECT_EQ(*params.initial_prompt(), "Glossary: whisper");
    EXPECT_EQ(params.prompt_tokens(), (std::vector<wsf_token_id_t>{5, 6}));
    EXPECT_TRUE(params.scalars().vad);
    EXPECT_FLOAT_EQ(params.scalars().vad_params.threshold, 0.6f);
}

TEST(FullParamsJson, EmptyStringClears) {
    FullParams params;
    ASSERT_EQ(params.apply_json(json{{"language", ""}}), WSF_SUCCESS);
    EXPECT_FALSE(params.language().has_value());
}

TEST(FullParamsJson, InvalidKeyAppliesNothing) {
    FullParams params;
    const json config = {{"n_threads", 2}, {"language", "de"}, {"beam_size", 0}};

    EXPECT_EQ(params.apply_json(config), WSF_ERROR_INVALID_CONFIG);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "key"), "beam_size");
    EXPECT_EQ(*params.language(), "en");
    EXPECT_EQ(params.scalars().n_threads, FullParams().scalars().n_threads);
}

TEST(FullParamsJson, RejectsBadTokensAndStrategy) {
    FullParams params;
    EXPECT_EQ(params.apply_json(json{{"prompt_tokens", {1, -2}}}), WSF_ERROR_INVALID_CONFIG);
    EXPECT_EQ(params.apply_json(json{{"prompt_tokens", "1 2"}}), WSF_ERROR_INVALID_CONFIG);
    EXPECT_EQ(params.apply_json(json{{"strategy", "sampling"}}), WSF_ERROR_INVALID_CONFIG);
    EXPECT_EQ(params.apply_json(json::array()), WSF_ERROR_INVALID_CONFIG);
    EXPECT_TRUE(params.prompt_tokens().empty());
}

// =============================================================================
// NATIVE RECORD SEEN BY THE ENGINE
// =============================================================================

TEST_F(FullParamsTest, EngineSeesOwnedCopies) {
    FullParams params;
    ASSERT_EQ(params.set_language("de"), WSF_SUCCESS);
    {
        std::string temporary = "spoken prompt";
        ASSERT_EQ(params.set_initial_prompt(temporary), WSF_SUCCESS);
        temporary.assign(temporary.size(), '#');
    }
    params.set_prompt_tokens({11, 12, 13});
    ASSERT_EQ(params.set_grammar(yes_no_grammar(), 0), WSF_SUCCESS);

    ASSERT_EQ(state_->full(params, pcm_), WSF_SUCCESS);

    const fake::Engine& engine = fake::engine();
    EXPECT_EQ(engine.full_calls, 1);
    EXPECT_EQ(engine.last_n_samples, 1600);
    EXPECT_FALSE(engine.language_null);
    EXPECT_EQ(engine.language, "de");
    EXPECT_EQ(engine.initial_prompt, "spoken prompt");
    EXPECT_EQ(engine.prompt_tokens, (std::vector<whisper_token>{11, 12, 13}));
    EXPECT_EQ(engine.n_grammar_rules, 1u);
    EXPECT_FALSE(engine.had_segment_callback);
    EXPECT_FALSE(engine.had_progress_callback);
}

TEST_F(FullParamsTest, ClearedFieldsReachEngineAsNull) {
    FullParams params;
    params.clear_language();
    ASSERT_EQ(state_->full(params, pcm_), WSF_SUCCESS);
    EXPECT_TRUE(fake::engine().language_null);
    EXPECT_TRUE(fake::engine().initial_prompt_null);
    EXPECT_TRUE(fake::engine().prompt_tokens.empty());
}

TEST_F(FullParamsTest, PromptTokensOutsideVocabularyAreRejected) {
    FullParams params;
    params.set_prompt_tokens({1, fake::engine().n_vocab});
    EXPECT_EQ(state_->full(params, pcm_), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "field"), "prompt_tokens");
    EXPECT_EQ(fake::engine().full_calls, 0);
}

#if !WSF_HAVE_BACKTRACK
TEST_F(FullParamsTest, BacktrackOptionsNeedEngineSupport) {
    FullParams params;
    params.set_forced_tokens({1, 2});
    EXPECT_EQ(state_->full(params, pcm_), WSF_ERROR_NOT_SUPPORTED);
    EXPECT_EQ(fake::engine().full_calls, 0);
}
#else
TEST_F(FullParamsTest, SkipEncodeNeedsPriorDecode) {
    FullParams params;
    params.set_skip_encode(true);
    EXPECT_EQ(state_->full(params, pcm_), WSF_ERROR_INVALID_ARGUMENT);

    ASSERT_EQ(state_->full(FullParams(), pcm_), WSF_SUCCESS);
    EXPECT_EQ(state_->full(params, pcm_), WSF_SUCCESS);
}
#endif
