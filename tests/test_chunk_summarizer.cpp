#include <gtest/gtest.h>
#include <docsum/chunk_summarizer.h>
#include <docsum/errors.h>
#include "fake_backend.h"

#include <chrono>
#include <thread>

using namespace docsum;
using docsum::testing::FakeBackend;

namespace {

std::shared_ptr<FakeBackend> EchoBackend() {
    return std::make_shared<FakeBackend>([](const std::string& prompt, const CancellationToken&) {
        return "summary of: " + prompt;
    });
}

} // namespace

TEST(ChunkSummarizerTest, SubstitutesContentAndVariables) {
    auto backend = EchoBackend();
    ChunkSummarizer summarizer(backend);

    std::string result = summarizer.summarize("the text", "Title: {{ title }}\n{{content}}", {{"title", "Notes"}});

    EXPECT_EQ(result, "summary of: Title: Notes\nthe text");
    ASSERT_EQ(backend->call_count(), 1u);
    EXPECT_EQ(backend->prompts()[0], "Title: Notes\nthe text");
}

TEST(ChunkSummarizerTest, AppendsTextWhenTemplateHasNoContentPlaceholder) {
    ChunkSummarizer summarizer(EchoBackend());
    EXPECT_EQ(summarizer.build_prompt("body", "Summarize this.", {}), "Summarize this.\n\nbody");
}

TEST(ChunkSummarizerTest, CallerContentVariableWins) {
    ChunkSummarizer summarizer(EchoBackend());
    EXPECT_EQ(summarizer.build_prompt("body", "[{{content}}]", {{"content", "override"}}), "[override]");
}

TEST(ChunkSummarizerTest, UnknownPlaceholdersStayVerbatim) {
    ChunkSummarizer summarizer(EchoBackend());
    EXPECT_EQ(summarizer.build_prompt("body", "{{missing}}: {{content}}", {}), "{{missing}}: body");
}

TEST(ChunkSummarizerTest, SimulatedBackendReturnsSentinel) {
    ChunkSummarizer summarizer(std::make_shared<SimulatedBackend>());
    EXPECT_TRUE(summarizer.simulated());
    EXPECT_EQ(summarizer.summarize("anything", "{{content}}", {}), kSimulatedSummary);
}

TEST(ChunkSummarizerTest, BackendErrorsPropagate) {
    auto backend = std::make_shared<FakeBackend>([](const std::string&, const CancellationToken&) -> std::string {
        throw BackendError(BackendErrorKind::RateLimit, "slow down", 429);
    });
    ChunkSummarizer summarizer(backend);

    try {
        summarizer.summarize("text", "{{content}}", {});
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::RateLimit);
        EXPECT_EQ(e.http_status(), 429);
    }
}

TEST(ChunkSummarizerTest, ForeignExceptionsBecomeBackendErrors) {
    auto backend = std::make_shared<FakeBackend>([](const std::string&, const CancellationToken&) -> std::string {
        throw std::runtime_error("socket closed");
    });
    ChunkSummarizer summarizer(backend);

    try {
        summarizer.summarize("text", "{{content}}", {});
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::Api);
        EXPECT_NE(std::string(e.what()).find("socket closed"), std::string::npos);
    }
}

TEST(ChunkSummarizerTest, LateReplyIsATimeout) {
    auto backend = std::make_shared<FakeBackend>([](const std::string&, const CancellationToken&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        return std::string("too late");
    });
    ChunkSummarizer summarizer(backend, std::chrono::milliseconds(10));

    try {
        summarizer.summarize("text", "{{content}}", {});
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::Timeout);
    }
}

TEST(ChunkSummarizerTest, EmptyReplyIsInvalid) {
    auto backend = std::make_shared<FakeBackend>([](const std::string&, const CancellationToken&) {
        return std::string("  \n");
    });
    ChunkSummarizer summarizer(backend);

    try {
        summarizer.summarize("text", "{{content}}", {});
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::InvalidResponse);
    }
}

TEST(ChunkSummarizerTest, CancelledTokenSkipsTheCall) {
    auto backend = EchoBackend();
    ChunkSummarizer summarizer(backend);

    CancellationToken token;
    token.cancel();

    EXPECT_THROW(summarizer.summarize("text", "{{content}}", {}, token), CancelledError);
    EXPECT_EQ(backend->call_count(), 0u);
}

TEST(ChunkSummarizerTest, RejectsMissingBackendAndBadTimeout) {
    EXPECT_THROW(ChunkSummarizer{nullptr}, std::invalid_argument);
    EXPECT_THROW((ChunkSummarizer{EchoBackend(), std::chrono::milliseconds(0)}), std::invalid_argument);
}
