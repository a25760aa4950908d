#include <gtest/gtest.h>
#include <docsum/batch_summarizer.h>
#include <docsum/errors.h>
#include "fake_backend.h"

#include <map>
#include <mutex>

using namespace docsum;
using docsum::testing::FakeBackend;
using docsum::testing::MapTemplateProvider;

class BatchSummarizerTest : public ::testing::Test {
protected:
    // Each document's text is its id; the final prompt is just the text.
    std::unique_ptr<ReduceCoordinator> MakeCoordinator(std::shared_ptr<GenerationBackend> backend) {
        auto templates = std::make_shared<MapTemplateProvider>(std::map<std::string, std::string>{
            {kFinalSummaryPrompt, "{{content}}"},
        });
        return std::make_unique<ReduceCoordinator>(ReduceOptions{}, std::move(backend), templates);
    }

    // Counts calls per prompt; fails the first `failures[prompt]` calls with `kind`.
    FakeBackend::Responder Flaky(std::map<std::string, int> failures, BackendErrorKind kind) {
        return [this, failures, kind](const std::string& prompt, const CancellationToken&) {
            std::lock_guard<std::mutex> lock(mutex);
            int attempt = ++attempts[prompt];
            auto it = failures.find(prompt);
            if (it != failures.end() && attempt <= it->second) {
                throw BackendError(kind, "transient failure for " + prompt);
            }
            return "summary of " + prompt;
        };
    }

    std::mutex mutex;
    std::map<std::string, int> attempts;
};

TEST_F(BatchSummarizerTest, SummarizesInInputOrder) {
    auto backend = std::make_shared<FakeBackend>(Flaky({}, BackendErrorKind::Network));
    auto coordinator = MakeCoordinator(backend);
    BatchSummarizer batch(*coordinator);

    std::vector<std::pair<size_t, size_t>> progress;
    BatchResult result = batch.run({{"a", "alpha", {}}, {"b", "beta", {}}, {"c", "gamma", {}}},
                                   [&](size_t current, size_t total) { progress.emplace_back(current, total); });

    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_EQ(result.outcomes[0].id, "a");
    EXPECT_EQ(result.outcomes[0].result.summary, "summary of alpha");
    EXPECT_EQ(result.outcomes[2].result.summary, "summary of gamma");
    EXPECT_EQ(result.succeeded, 3u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(progress, (std::vector<std::pair<size_t, size_t>>{{1, 3}, {2, 3}, {3, 3}}));
    EXPECT_GE(result.processing_time_ms, 0.0);
}

TEST_F(BatchSummarizerTest, RetriesTransientFailures) {
    auto backend = std::make_shared<FakeBackend>(Flaky({{"beta", 1}}, BackendErrorKind::Network));
    auto coordinator = MakeCoordinator(backend);

    BatchOptions options;
    options.max_attempts = 3;
    BatchSummarizer batch(*coordinator, options);

    BatchResult result = batch.run({{"a", "alpha", {}}, {"b", "beta", {}}});

    EXPECT_EQ(result.succeeded, 2u);
    EXPECT_EQ(result.outcomes[0].attempts, 1);
    EXPECT_EQ(result.outcomes[1].attempts, 2);
    EXPECT_EQ(result.outcomes[1].result.summary, "summary of beta");
    EXPECT_EQ(backend->call_count(), 3u);
}

TEST_F(BatchSummarizerTest, GivesUpAfterMaxAttempts) {
    auto backend = std::make_shared<FakeBackend>(Flaky({{"beta", 10}}, BackendErrorKind::RateLimit));
    auto coordinator = MakeCoordinator(backend);

    BatchOptions options;
    options.max_attempts = 2;
    BatchSummarizer batch(*coordinator, options);

    BatchResult result = batch.run({{"b", "beta", {}}, {"c", "gamma", {}}});

    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.succeeded, 1u);
    EXPECT_EQ(result.outcomes[0].attempts, 2);
    EXPECT_FALSE(result.outcomes[0].result.success());
    EXPECT_TRUE(result.outcomes[0].result.retryable);
    EXPECT_TRUE(result.outcomes[1].result.success());
}

TEST_F(BatchSummarizerTest, PermanentFailuresAreNotRetried) {
    auto backend = std::make_shared<FakeBackend>(Flaky({{"alpha", 1}}, BackendErrorKind::Auth));
    auto coordinator = MakeCoordinator(backend);

    BatchOptions options;
    options.max_attempts = 5;
    BatchSummarizer batch(*coordinator, options);

    BatchResult result = batch.run({{"a", "alpha", {}}});

    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.outcomes[0].attempts, 1);
    EXPECT_FALSE(result.outcomes[0].result.retryable);
    EXPECT_NE(result.outcomes[0].result.error.find("authentication error"), std::string::npos);
    EXPECT_EQ(backend->call_count(), 1u);
}

TEST_F(BatchSummarizerTest, CancelledBatchFailsRemainingDocuments) {
    auto backend = std::make_shared<FakeBackend>(Flaky({}, BackendErrorKind::Network));
    auto coordinator = MakeCoordinator(backend);
    BatchSummarizer batch(*coordinator);

    CancellationToken token;
    token.cancel();
    BatchResult result = batch.run({{"a", "alpha", {}}, {"b", "beta", {}}}, nullptr, token);

    EXPECT_EQ(result.failed, 2u);
    EXPECT_EQ(backend->call_count(), 0u);
}

TEST_F(BatchSummarizerTest, RejectsZeroAttempts) {
    auto coordinator = MakeCoordinator(std::make_shared<SimulatedBackend>());
    BatchOptions options;
    options.max_attempts = 0;
    EXPECT_THROW((BatchSummarizer{*coordinator, options}), std::invalid_argument);
}
