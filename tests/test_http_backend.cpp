#include <gtest/gtest.h>
#include <docsum/errors.h>
#include <docsum/http_backend.h>

#include <nlohmann/json.hpp>

using namespace docsum;
using json = nlohmann::json;

namespace {

// Returns a canned response and remembers the request it was given.
class RecordingHttpClient : public HttpClient {
public:
    explicit RecordingHttpClient(HttpResponse response) : response_(std::move(response)) {}

    HttpResponse post_json(const std::string& url,
                           const std::map<std::string, std::string>& headers,
                           const std::string& body,
                           std::chrono::milliseconds timeout,
                           const AbortCheck& should_abort) override {
        last_url = url;
        last_headers = headers;
        last_body = body;
        last_timeout = timeout;
        aborted = should_abort && should_abort();
        calls++;
        return response_;
    }

    std::string last_url;
    std::map<std::string, std::string> last_headers;
    std::string last_body;
    std::chrono::milliseconds last_timeout{0};
    bool aborted = false;
    int calls = 0;

private:
    HttpResponse response_;
};

HttpResponse reply(long status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

std::string completion(const std::string& content) {
    json body = {
        {"id", "chatcmpl-1"},
        {"choices", json::array({
            {{"index", 0}, {"message", {{"role", "assistant"}, {"content", content}}}}
        })}
    };
    return body.dump();
}

OpenAiOptions options_with_key() {
    OpenAiOptions options;
    options.base_url = "https://llm.example.com/v1/";
    options.api_key = "sk-test";
    options.model = "test-model";
    return options;
}

} // namespace

class OpenAiBackendTest : public ::testing::Test {
protected:
    std::string generate_with(HttpResponse response) {
        client = std::make_shared<RecordingHttpClient>(std::move(response));
        OpenAiCompatibleBackend backend(options_with_key(), client);
        GenerationRequest request;
        request.prompt = "Summarize this.";
        request.timeout = std::chrono::milliseconds(1500);
        return backend.generate(request, token);
    }

    BackendErrorKind error_kind_for(HttpResponse response) {
        try {
            generate_with(std::move(response));
        } catch (const BackendError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a BackendError";
        return BackendErrorKind::Api;
    }

    std::shared_ptr<RecordingHttpClient> client;
    CancellationToken token;
};

TEST_F(OpenAiBackendTest, ReturnsMessageContent) {
    EXPECT_EQ(generate_with(reply(200, completion("A short summary."))), "A short summary.");
}

TEST_F(OpenAiBackendTest, SendsChatCompletionRequest) {
    generate_with(reply(200, completion("ok")));

    EXPECT_EQ(client->last_url, "https://llm.example.com/v1/chat/completions");
    EXPECT_EQ(client->last_headers.at("Authorization"), "Bearer sk-test");
    EXPECT_EQ(client->last_timeout.count(), 1500);

    json body = json::parse(client->last_body);
    EXPECT_EQ(body["model"], "test-model");
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["messages"][0]["content"], "Summarize this.");
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.3);
    EXPECT_DOUBLE_EQ(body["top_p"].get<double>(), 0.9);
    EXPECT_EQ(body["max_tokens"], 1000);
}

TEST_F(OpenAiBackendTest, NoAuthorizationWithoutKey) {
    auto recording = std::make_shared<RecordingHttpClient>(reply(200, completion("ok")));
    OpenAiOptions options;
    options.base_url = "http://localhost:11434/v1";
    OpenAiCompatibleBackend backend(options, recording);

    backend.generate(GenerationRequest{"hi"}, token);

    EXPECT_EQ(recording->last_headers.count("Authorization"), 0u);
    EXPECT_EQ(recording->last_url, "http://localhost:11434/v1/chat/completions");
}

TEST_F(OpenAiBackendTest, StatusCodesMapToErrorKinds) {
    EXPECT_EQ(error_kind_for(reply(401, "bad key")), BackendErrorKind::Auth);
    EXPECT_EQ(error_kind_for(reply(403, "forbidden")), BackendErrorKind::Auth);
    EXPECT_EQ(error_kind_for(reply(404, "no such model")), BackendErrorKind::ModelNotFound);
    EXPECT_EQ(error_kind_for(reply(429, "slow down")), BackendErrorKind::RateLimit);
    EXPECT_EQ(error_kind_for(reply(500, "oops")), BackendErrorKind::Api);
    EXPECT_EQ(error_kind_for(reply(302, "")), BackendErrorKind::Api);
}

TEST_F(OpenAiBackendTest, ErrorCarriesStatusAndRetryAfter) {
    HttpResponse limited = reply(429, "slow down");
    limited.headers["retry-after"] = "20";

    try {
        generate_with(limited);
        FAIL() << "expected a BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.http_status(), 429);
        EXPECT_NE(std::string(e.what()).find("retry after 20s"), std::string::npos);
    }
}

TEST_F(OpenAiBackendTest, LongErrorBodiesAreShortened) {
    try {
        generate_with(reply(500, std::string(5000, 'x')));
        FAIL() << "expected a BackendError";
    } catch (const BackendError& e) {
        EXPECT_LT(std::string(e.what()).size(), 600u);
    }
}

TEST_F(OpenAiBackendTest, TransportFailures) {
    HttpResponse timed_out;
    timed_out.timeout = true;
    EXPECT_EQ(error_kind_for(timed_out), BackendErrorKind::Timeout);

    HttpResponse unreachable;
    unreachable.network_error = true;
    unreachable.network_error_message = "Couldn't connect to server";
    EXPECT_EQ(error_kind_for(unreachable), BackendErrorKind::Network);
}

TEST_F(OpenAiBackendTest, MalformedRepliesAreInvalidResponses) {
    EXPECT_EQ(error_kind_for(reply(200, "<html>")), BackendErrorKind::InvalidResponse);
    EXPECT_EQ(error_kind_for(reply(200, R"({"choices": []})")), BackendErrorKind::InvalidResponse);
    EXPECT_EQ(error_kind_for(reply(200, R"({"choices": [{"message": {}}]})")),
              BackendErrorKind::InvalidResponse);
    EXPECT_EQ(error_kind_for(reply(200, R"({"choices": [{"message": {"content": 7}}]})")),
              BackendErrorKind::InvalidResponse);
}

TEST_F(OpenAiBackendTest, AbortedTransferIsCancellation) {
    HttpResponse aborted;
    aborted.cancelled = true;
    EXPECT_THROW(generate_with(aborted), CancelledError);
}

TEST_F(OpenAiBackendTest, CancelledTokenSkipsTheRequest) {
    token.cancel();
    EXPECT_THROW(generate_with(reply(200, completion("ok"))), CancelledError);
    EXPECT_EQ(client->calls, 0);
}

TEST_F(OpenAiBackendTest, AbortCheckFollowsToken) {
    auto recording = std::make_shared<RecordingHttpClient>(reply(200, completion("ok")));
    OpenAiCompatibleBackend backend(options_with_key(), recording);

    backend.generate(GenerationRequest{"hi"}, token);
    EXPECT_FALSE(recording->aborted);
}

TEST(OpenAiBackend, NameAndValidation) {
    OpenAiOptions options;
    options.model = "gpt-test";
    OpenAiCompatibleBackend backend(options, std::make_shared<RecordingHttpClient>(HttpResponse{}));

    EXPECT_EQ(backend.name(), "openai:gpt-test");
    EXPECT_FALSE(backend.simulated());
    EXPECT_THROW(OpenAiCompatibleBackend(options, nullptr), std::invalid_argument);
}

TEST(OpenAiBackend, ParseContent) {
    EXPECT_EQ(OpenAiCompatibleBackend::parse_content(completion("text")), "text");
    EXPECT_THROW(OpenAiCompatibleBackend::parse_content("{}"), BackendError);
}

TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
    CurlHttpClient client;
    int polls = 0;

    HttpResponse response = client.post_json("http://127.0.0.1:1/chat/completions", {}, "{}",
                                             std::chrono::milliseconds(5000),
                                             [&polls]() { polls++; return false; });

    EXPECT_TRUE(response.network_error) << response.network_error_message;
    EXPECT_FALSE(response.cancelled);
    EXPECT_FALSE(response.timeout);
    EXPECT_EQ(response.status, 0);
}
