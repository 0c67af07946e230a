/**
 * @file test_context_state.cpp
 * @brief Tests for model/state lifetime, tokenization and result views
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_native_api.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/features/stt/wsf_context.h"
#include "wsf/features/stt/wsf_full_params.h"
#include "wsf/features/stt/wsf_state.h"

using namespace whispersafe;

namespace {

fake::Token make_token(whisper_token id, float p, const std::string& text) {
    fake::Token token;
    token.id = id;
    token.p = p;
    token.text = text;
    return token;
}

fake::Segment two_token_segment(int64_t t0, int64_t t1, const std::string& text) {
    fake::Segment segment;
    segment.t0 = t0;
    segment.t1 = t1;
    segment.text = text;
    segment.tokens = {make_token(50, 0.9f, " He"), make_token(51, 0.8f, "llo")};
    return segment;
}

class ContextStateTest : public ::testing::Test {
   protected:
    void SetUp() override {
        fake::reset();
        ASSERT_EQ(WhisperContext::create_from_file("model.bin", ContextParams(), &context_,
                                                   &fake::api()),
                  WSF_SUCCESS);
    }

    std::unique_ptr<WhisperState> new_state() {
        std::unique_ptr<WhisperState> state;
        EXPECT_EQ(context_->create_state(&state), WSF_SUCCESS);
        return state;
    }

    std::shared_ptr<WhisperContext> context_;
    std::vector<float> pcm_ = std::vector<float>(3200, 0.0f);
};

}  // namespace

// =============================================================================
// LOADING
// =============================================================================

TEST(ContextLoad, FailureIsReportedWithPath) {
    fake::reset();
    fake::engine().fail_init = true;

    std::shared_ptr<WhisperContext> context;
    EXPECT_EQ(WhisperContext::create_from_file("/models/missing.bin", ContextParams(), &context,
                                               &fake::api()),
              WSF_ERROR_MODEL_LOAD_FAILED);
    EXPECT_EQ(context, nullptr);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "path"), "/models/missing.bin");
}

TEST(ContextLoad, InvalidPathNeverReachesEngine) {
    fake::reset();
    std::shared_ptr<WhisperContext> context;
    EXPECT_EQ(WhisperContext::create_from_file("", ContextParams(), &context, &fake::api()),
              WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(WhisperContext::create_from_file(std::string("a\0b", 3), ContextParams(), &context,
                                               &fake::api()),
              WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(fake::engine().contexts_alive.load(), 0);
}

TEST(ContextLoad, FromBuffer) {
    fake::reset();
    const std::vector<uint8_t> model(64, 0x42);
    std::shared_ptr<WhisperContext> context;
    ASSERT_EQ(WhisperContext::create_from_buffer(model.data(), model.size(), ContextParams(),
                                                 &context, &fake::api()),
              WSF_SUCCESS);
    EXPECT_EQ(fake::engine().contexts_alive.load(), 1);

    EXPECT_EQ(WhisperContext::create_from_buffer(nullptr, 10, ContextParams(), &context,
                                                 &fake::api()),
              WSF_ERROR_INVALID_ARGUMENT);
}

TEST(ContextLoad, StateInitFailure) {
    fake::reset();
    std::shared_ptr<WhisperContext> context;
    ASSERT_EQ(WhisperContext::create_from_file("model.bin", ContextParams(), &context,
                                               &fake::api()),
              WSF_SUCCESS);
    fake::engine().fail_state = true;

    std::unique_ptr<WhisperState> state;
    EXPECT_EQ(context->create_state(&state), WSF_ERROR_STATE_INIT_FAILED);
    EXPECT_EQ(state, nullptr);
}

// =============================================================================
// LIFETIME
// =============================================================================

TEST_F(ContextStateTest, StateKeepsModelAlive) {
    std::unique_ptr<WhisperState> state = new_state();
    context_.reset();
    EXPECT_EQ(fake::engine().contexts_alive.load(), 1);

    // Still usable without the caller's reference
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    state.reset();
    EXPECT_EQ(fake::engine().contexts_alive.load(), 0);
    EXPECT_EQ(fake::engine().states_alive.load(), 0);

    const std::vector<std::string>& events = fake::engine().events;
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "free_state");
    EXPECT_EQ(events[1], "free_context");
}

TEST_F(ContextStateTest, FreshStateHasNoSegments) {
    std::unique_ptr<WhisperState> state = new_state();
    EXPECT_EQ(state->full_n_segments(), 0);
    EXPECT_FALSE(state->has_encoding());

    Segment segment;
    EXPECT_EQ(state->get_segment(0, &segment), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
}

TEST_F(ContextStateTest, StateMovedToAnotherThread) {
    std::unique_ptr<WhisperState> state = new_state();
    int n_segments = -1;
    std::thread worker([&state, &n_segments] { n_segments = state->full_n_segments(); });
    worker.join();
    EXPECT_EQ(n_segments, 0);
}

TEST_F(ContextStateTest, ConcurrentStatesShareOneModel) {
    fake::engine().derive_from_samples = true;
    fake::engine().samples_segments = 3;

    constexpr int kThreads = 4;
    constexpr int kRounds = 20;
    std::vector<std::unique_ptr<WhisperState>> states;
    std::vector<std::vector<float>> audio;
    for (int i = 0; i < kThreads; ++i) {
        states.push_back(new_state());
        audio.push_back(std::vector<float>(1600 * (i + 1), static_cast<float>(i + 1)));
    }

    std::vector<wsf_result_t> results(kThreads, WSF_ERROR_DECODE_FAILED);
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&, i] {
            for (int round = 0; round < kRounds; ++round) {
                results[i] = states[i]->full(FullParams(), audio[i]);
                if (results[i] != WSF_SUCCESS) return;
            }
        });
    }
    for (auto& worker : workers) worker.join();

    for (int i = 0; i < kThreads; ++i) {
        ASSERT_EQ(results[i], WSF_SUCCESS);

        std::vector<OwnedSegment> segments;
        ASSERT_EQ(states[i]->segments(&segments), WSF_SUCCESS);
        ASSERT_EQ(segments.size(), 3u) << "state " << i;
        for (size_t j = 0; j < segments.size(); ++j) {
            EXPECT_EQ(segments[j].text,
                      " voice " + std::to_string(i + 1) + " #" + std::to_string(j))
                << "state " << i;
        }
    }
    EXPECT_EQ(fake::engine().states_alive.load(), kThreads);
}

// =============================================================================
// DECODE
// =============================================================================

TEST_F(ContextStateTest, DecodeFailureCarriesNativeStatus) {
    fake::engine().full_status = -6;
    std::unique_ptr<WhisperState> state = new_state();

    EXPECT_EQ(state->full(FullParams(), pcm_), WSF_ERROR_DECODE_FAILED);
    EXPECT_EQ(wsf_get_last_error()->native_code, -6);
    EXPECT_FALSE(state->has_encoding());
}

TEST_F(ContextStateTest, NullSamplesRejected) {
    std::unique_ptr<WhisperState> state = new_state();
    EXPECT_EQ(state->full(FullParams(), nullptr, 10), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(fake::engine().full_calls, 0);
}

TEST_F(ContextStateTest, DetectedLanguage) {
    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    fake::engine().lang_id = 1;
    int id = -1;
    ASSERT_EQ(state->full_lang_id(&id), WSF_SUCCESS);
    EXPECT_EQ(id, 1);

    fake::engine().lang_id = 42;
    EXPECT_EQ(state->full_lang_id(&id), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
}

// =============================================================================
// TOKENIZE
// =============================================================================

TEST_F(ContextStateTest, TokenizeWithinLimit) {
    std::vector<wsf_token_id_t> tokens;
    ASSERT_EQ(context_->tokenize("one two three", 8, &tokens), WSF_SUCCESS);
    EXPECT_EQ(tokens, (std::vector<wsf_token_id_t>{100, 101, 102}));
}

TEST_F(ContextStateTest, TokenizeReportsRequiredCount) {
    std::vector<wsf_token_id_t> tokens;
    EXPECT_EQ(context_->tokenize("one two three", 1, &tokens), WSF_ERROR_TOKENIZE_FAILED);
    EXPECT_TRUE(tokens.empty());

    const wsf_error_t* err = wsf_get_last_error();
    EXPECT_STREQ(wsf_error_detail(err, "required_tokens"), "3");
    EXPECT_STREQ(wsf_error_detail(err, "max_tokens"), "1");
}

TEST_F(ContextStateTest, TokenizeOverflowFromEngine) {
    fake::engine().tokenize_return = 9;
    std::vector<wsf_token_id_t> tokens;
    EXPECT_EQ(context_->tokenize("one two", 4, &tokens), WSF_ERROR_BUFFER_OVERFLOW);
    EXPECT_TRUE(tokens.empty());
}

TEST_F(ContextStateTest, TokenizeRejectsInteriorNul) {
    std::vector<wsf_token_id_t> tokens;
    EXPECT_EQ(context_->tokenize(std::string("a\0b", 3), 4, &tokens), WSF_ERROR_INVALID_ARGUMENT);
}

TEST_F(ContextStateTest, VocabularyLookup) {
    fake::engine().vocab_text = {"<|endoftext|>", " hi", "\xE2\x82"};

    std::string text;
    ASSERT_EQ(context_->token_to_str(1, &text), WSF_SUCCESS);
    EXPECT_EQ(text, " hi");

    EXPECT_EQ(context_->token_to_str(2, &text), WSF_ERROR_INVALID_UTF8);
    ASSERT_EQ(context_->token_to_str_lossy(2, &text), WSF_SUCCESS);
    EXPECT_EQ(text, "\xEF\xBF\xBD");

    std::vector<uint8_t> bytes;
    ASSERT_EQ(context_->token_to_bytes(2, &bytes), WSF_SUCCESS);
    EXPECT_EQ(bytes.size(), 2u);

    EXPECT_EQ(context_->token_to_str(-1, &text), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
    EXPECT_EQ(context_->token_to_str(context_->n_vocab(), &text), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
    EXPECT_TRUE(context_->is_multilingual());
}

// =============================================================================
// RESULT VIEWS
// =============================================================================

TEST_F(ContextStateTest, SegmentAndTokenViews) {
    fake::Segment segment = two_token_segment(10, 250, " Hello");
    segment.no_speech_prob = 0.25f;
    segment.speaker_turn_next = true;
    fake::engine().result = {segment};

    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);
    ASSERT_EQ(state->full_n_segments(), 1);

    Segment view;
    ASSERT_EQ(state->get_segment(0, &view), WSF_SUCCESS);

    int64_t t0 = 0;
    int64_t t1 = 0;
    float no_speech = 0.0f;
    bool turn = false;
    std::string text;
    int n_tokens = 0;
    ASSERT_EQ(view.start_timestamp(&t0), WSF_SUCCESS);
    ASSERT_EQ(view.end_timestamp(&t1), WSF_SUCCESS);
    ASSERT_EQ(view.no_speech_probability(&no_speech), WSF_SUCCESS);
    ASSERT_EQ(view.next_segment_speaker_turn(&turn), WSF_SUCCESS);
    ASSERT_EQ(view.text(&text), WSF_SUCCESS);
    ASSERT_EQ(view.n_tokens(&n_tokens), WSF_SUCCESS);
    EXPECT_EQ(t0, 10);
    EXPECT_EQ(t1, 250);
    EXPECT_FLOAT_EQ(no_speech, 0.25f);
    EXPECT_TRUE(turn);
    EXPECT_EQ(text, " Hello");
    EXPECT_EQ(n_tokens, 2);

    Token token;
    ASSERT_EQ(view.get_token(1, &token), WSF_SUCCESS);
    wsf_token_id_t id = 0;
    float p = 0.0f;
    ASSERT_EQ(token.id(&id), WSF_SUCCESS);
    ASSERT_EQ(token.probability(&p), WSF_SUCCESS);
    ASSERT_EQ(token.text(&text), WSF_SUCCESS);
    EXPECT_EQ(id, 51);
    EXPECT_FLOAT_EQ(p, 0.8f);
    EXPECT_EQ(text, "llo");

    TokenData data;
    ASSERT_EQ(token.data(&data), WSF_SUCCESS);
    EXPECT_EQ(data.id, 51);
    EXPECT_EQ(data.t0, 10);

    EXPECT_EQ(view.get_token(2, &token), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
    EXPECT_EQ(view.get_token(-1, &token), WSF_ERROR_INDEX_OUT_OF_BOUNDS);
    EXPECT_EQ(fake::engine().out_of_range_reads.load(), 0);
}

TEST_F(ContextStateTest, ViewsGoStaleAfterNextDecode) {
    fake::engine().result = {two_token_segment(0, 100, " Hello")};
    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    Segment segment;
    Token token;
    ASSERT_EQ(state->get_segment(0, &segment), WSF_SUCCESS);
    ASSERT_EQ(segment.get_token(0, &token), WSF_SUCCESS);

    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    std::string text;
    wsf_token_id_t id = 0;
    EXPECT_EQ(segment.text(&text), WSF_ERROR_STALE_VIEW);
    EXPECT_EQ(token.id(&id), WSF_ERROR_STALE_VIEW);

    // A fresh view over the new result works
    ASSERT_EQ(state->get_segment(0, &segment), WSF_SUCCESS);
    EXPECT_EQ(segment.text(&text), WSF_SUCCESS);
}

TEST_F(ContextStateTest, UnboundViewsFail) {
    Segment segment;
    Token token;
    std::string text;
    EXPECT_EQ(segment.text(&text), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.text(&text), WSF_ERROR_INVALID_ARGUMENT);
}

TEST_F(ContextStateTest, NullOutputsAreRejected) {
    fake::engine().result = {two_token_segment(0, 100, " Hello")};
    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    Segment segment;
    Token token;
    ASSERT_EQ(state->get_segment(0, &segment), WSF_SUCCESS);
    ASSERT_EQ(segment.get_token(0, &token), WSF_SUCCESS);

    EXPECT_EQ(segment.start_timestamp(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.end_timestamp(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.no_speech_probability(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.next_segment_speaker_turn(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.text(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.text_lossy(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.text_bytes(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(segment.n_tokens(nullptr), WSF_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(token.id(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.probability(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.data(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.text(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.text_lossy(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.bytes(nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(token.n_top_candidates(nullptr), WSF_ERROR_INVALID_ARGUMENT);

    // The views themselves are still good
    int64_t t1 = 0;
    ASSERT_EQ(segment.end_timestamp(&t1), WSF_SUCCESS);
    EXPECT_EQ(t1, 100);
}

TEST_F(ContextStateTest, NullSegmentTextIsReported) {
    fake::Segment segment = two_token_segment(0, 100, "");
    segment.null_text = true;
    fake::engine().result = {segment};

    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    Segment view;
    ASSERT_EQ(state->get_segment(0, &view), WSF_SUCCESS);
    std::string text;
    EXPECT_EQ(view.text(&text), WSF_ERROR_NULL_POINTER);
    EXPECT_EQ(view.text_lossy(&text), WSF_ERROR_NULL_POINTER);
}

TEST_F(ContextStateTest, PartialUtf8TokenKeepsBytes) {
    fake::Segment segment;
    segment.text = " \xE2\x82\xAC";
    segment.tokens = {make_token(60, 0.5f, " \xE2\x82"), make_token(61, 0.5f, "\xAC")};
    fake::engine().result = {segment};

    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    Segment view;
    Token token;
    ASSERT_EQ(state->get_segment(0, &view), WSF_SUCCESS);
    ASSERT_EQ(view.get_token(0, &token), WSF_SUCCESS);

    std::string text;
    std::vector<uint8_t> bytes;
    EXPECT_EQ(token.text(&text), WSF_ERROR_INVALID_UTF8);
    ASSERT_EQ(token.bytes(&bytes), WSF_SUCCESS);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x20, 0xE2, 0x82}));

    // Joining the pieces restores the segment text
    Token next;
    std::vector<uint8_t> next_bytes;
    ASSERT_EQ(view.get_token(1, &next), WSF_SUCCESS);
    ASSERT_EQ(next.bytes(&next_bytes), WSF_SUCCESS);
    bytes.insert(bytes.end(), next_bytes.begin(), next_bytes.end());
    ASSERT_EQ(view.text(&text), WSF_SUCCESS);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), text);
}

TEST_F(ContextStateTest, TopCandidates) {
    fake::Segment segment = two_token_segment(0, 100, " Hello");
    segment.tokens[0].candidates = {{50, 0.7f, -0.36f}, {77, 0.2f, -1.6f}};
    fake::engine().result = {segment};

    std::unique_ptr<WhisperState> state = new_state();
    ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);

    Segment view;
    Token token;
    ASSERT_EQ(state->get_segment(0, &view), WSF_SUCCESS);
    ASSERT_EQ(view.get_token(0, &token), WSF_SUCCESS);

    int n = 0;
    ASSERT_EQ(token.n_top_candidates(&n), WSF_SUCCESS);
    EXPECT_EQ(n, 2);

    TokenCandidate candidate;
    ASSERT_EQ(token.top_candidate(1, &candidate), WSF_SUCCESS);
    EXPECT_EQ(candidate.id, 77);
    EXPECT_FLOAT_EQ(candidate.p, 0.2f);
    EXPECT_EQ(token.top_candidate(2, &candidate), WSF_ERROR_INDEX_OUT_OF_BOUNDS);

    std::vector<TokenCandidate> all;
    ASSERT_EQ(token.all_top_candidates(&all), WSF_SUCCESS);
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(fake::engine().out_of_range_reads.load(), 0);
}

TEST_F(ContextStateTest, OwnedSegmentsOutliveState) {
    fake::engine().result = {two_token_segment(0, 100, " Hello"),
                             two_token_segment(100, 180, " again")};

    std::vector<OwnedSegment> segments;
    {
        std::unique_ptr<WhisperState> state = new_state();
        ASSERT_EQ(state->full(FullParams(), pcm_), WSF_SUCCESS);
        ASSERT_EQ(state->segments(&segments), WSF_SUCCESS);
    }

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[1].index, 1);
    EXPECT_EQ(segments[1].start_timestamp, 100);
    EXPECT_EQ(segments[1].text, " again");
    ASSERT_EQ(segments[0].tokens.size(), 2u);
    EXPECT_EQ(segments[0].tokens[0].text, " He");
    EXPECT_EQ(segments[0].tokens[1].id, 51);
}
