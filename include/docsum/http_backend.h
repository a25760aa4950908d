#pragma once

#include "docsum/generation_backend.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace docsum {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    bool timeout = false;
    bool cancelled = false;
    bool network_error = false;
    std::string network_error_message;
};

// Polled while a request is in flight; returning true aborts the transfer.
using AbortCheck = std::function<bool()>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post_json(const std::string& url,
                                   const std::map<std::string, std::string>& headers,
                                   const std::string& body,
                                   std::chrono::milliseconds timeout,
                                   const AbortCheck& should_abort) = 0;
};

// libcurl transport. Each call uses its own easy handle.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    HttpResponse post_json(const std::string& url,
                           const std::map<std::string, std::string>& headers,
                           const std::string& body,
                           std::chrono::milliseconds timeout,
                           const AbortCheck& should_abort) override;
};

struct OpenAiOptions {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    double temperature = 0.3;
    double top_p = 0.9;
    int max_tokens = 1000;
};

// Chat-completions backend for OpenAI and compatible servers.
class OpenAiCompatibleBackend final : public GenerationBackend {
public:
    explicit OpenAiCompatibleBackend(OpenAiOptions options,
                                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

    std::string generate(const GenerationRequest& request,
                         const CancellationToken& cancellation) override;

    std::string name() const override { return "openai:" + options_.model; }

    // Exposed for tests.
    std::string build_body(const std::string& prompt) const;
    static std::string parse_content(const std::string& body);

private:
    void check_status(const HttpResponse& response) const;

    OpenAiOptions options_;
    std::shared_ptr<HttpClient> http_client_;
};

} // namespace docsum
