#include "docsum/http_backend.h"
#include "docsum/errors.h"
#include "docsum/logging.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace docsum {

namespace {

constexpr const char* kComponent = "OpenAiBackend";
constexpr size_t kMaxErrorBody = 500;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto total = size * nmemb;
    auto* output = static_cast<std::string*>(userdata);
    output->append(ptr, total);
    return total;
}

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(begin, end - begin);
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const auto total = size * nitems;
    std::string header(buffer, total);
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    const auto separator = header.find(':');
    if (separator != std::string::npos) {
        std::string key = trim(header.substr(0, separator));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[key] = trim(header.substr(separator + 1));
    }

    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* should_abort = static_cast<const AbortCheck*>(userdata);
    return (*should_abort && (*should_abort)()) ? 1 : 0;
}

std::string shorten(const std::string& body) {
    if (body.size() <= kMaxErrorBody) {
        return body;
    }
    return body.substr(0, kMaxErrorBody) + "...";
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::map<std::string, std::string>& headers,
                                       const std::string& body,
                                       std::chrono::milliseconds timeout,
                                       const AbortCheck& should_abort) {
    HttpResponse response;
    AbortCheck abort_check = should_abort;

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        response.network_error = true;
        response.network_error_message = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "docsum/1.0");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &abort_check);

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    for (const auto& [key, value] : headers) {
        const std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        response.timeout = true;
    } else if (code == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
    } else if (code != CURLE_OK) {
        response.network_error = true;
        response.network_error_message = curl_easy_strerror(code);
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = status;
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

OpenAiCompatibleBackend::OpenAiCompatibleBackend(OpenAiOptions options,
                                                 std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
    if (!http_client_) {
        throw std::invalid_argument("OpenAiCompatibleBackend requires an HTTP client");
    }
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string OpenAiCompatibleBackend::build_body(const std::string& prompt) const {
    nlohmann::json body = {
        {"model", options_.model},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", options_.temperature},
        {"top_p", options_.top_p},
        {"max_tokens", options_.max_tokens}
    };
    return body.dump();
}

std::string OpenAiCompatibleBackend::parse_content(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw BackendError(BackendErrorKind::InvalidResponse, "reply is not valid JSON");
    }

    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw BackendError(BackendErrorKind::InvalidResponse, "reply has no choices");
    }

    const auto& message = json["choices"][0].value("message", nlohmann::json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw BackendError(BackendErrorKind::InvalidResponse, "reply has no message content");
    }

    return message["content"].get<std::string>();
}

void OpenAiCompatibleBackend::check_status(const HttpResponse& response) const {
    const int status = static_cast<int>(response.status);

    if (response.timeout) {
        throw BackendError(BackendErrorKind::Timeout, "request timed out");
    }
    if (response.network_error) {
        throw BackendError(BackendErrorKind::Network, response.network_error_message);
    }
    if (status == 401 || status == 403) {
        throw BackendError(BackendErrorKind::Auth, shorten(response.body), status);
    }
    if (status == 404) {
        throw BackendError(BackendErrorKind::ModelNotFound, options_.model + ": " + shorten(response.body), status);
    }
    if (status == 429) {
        std::string message = shorten(response.body);
        auto it = response.headers.find("retry-after");
        if (it != response.headers.end()) {
            message += " (retry after " + it->second + "s)";
        }
        throw BackendError(BackendErrorKind::RateLimit, message, status);
    }
    if (status < 200 || status >= 300) {
        throw BackendError(BackendErrorKind::Api, "status " + std::to_string(status) + ": " + shorten(response.body), status);
    }
}

std::string OpenAiCompatibleBackend::generate(const GenerationRequest& request,
                                              const CancellationToken& cancellation) {
    cancellation.throw_if_cancelled("generation cancelled before the request");

    std::map<std::string, std::string> headers;
    if (!options_.api_key.empty()) {
        headers["Authorization"] = "Bearer " + options_.api_key;
    }

    const std::string url = options_.base_url + "/chat/completions";
    log_debug(kComponent, "POST " + url + " (model " + options_.model + ")");

    HttpResponse response = http_client_->post_json(
        url, headers, build_body(request.prompt), request.timeout,
        [&cancellation]() { return cancellation.is_cancelled(); });

    if (response.cancelled) {
        throw CancelledError("generation request aborted");
    }
    check_status(response);

    return parse_content(response.body);
}

} // namespace docsum
