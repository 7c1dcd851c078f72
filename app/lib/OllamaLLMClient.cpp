#include "OllamaLLMClient.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <curl/curl.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <utility>

namespace {

size_t write_body_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

int cancellation_progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* cancellation = static_cast<const CancellationToken*>(clientp);
    return cancellation && cancellation->is_cancelled() ? 1 : 0;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

std::string normalize_host(std::string host)
{
    host = Utils::trim_copy(std::move(host));
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    if (host.find("://") == std::string::npos) {
        host = "http://" + host;
    }
    return host;
}

LLMError error_from_curl(CURLcode code, const std::string& url)
{
    const std::string detail = std::string(curl_easy_strerror(code)) + " (" + url + ")";
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        return LLMError(LLMError::Kind::Cancelled, "Request cancelled: " + detail);
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        return LLMError(LLMError::Kind::Timeout, "Request timed out: " + detail);
    }
    return LLMError(LLMError::Kind::ConnectionFailed, "Connection failed: " + detail);
}

Json::Value parse_body(const std::string& body)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw LLMError(LLMError::Kind::InvalidResponse,
                       "Ollama returned malformed JSON: " + Utils::trim_copy(errors));
    }
    return root;
}

std::string error_message_from_body(const std::string& body)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (reader->parse(body.data(), body.data() + body.size(), &root, &errors) &&
        root.isObject() && root["error"].isString()) {
        return root["error"].asString();
    }
    return body;
}

} // namespace

OllamaLLMClient::OllamaLLMClient(Config config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(logger ? std::move(logger) : Logger::get_logger("llm_logger"))
{
    config_.host = normalize_host(config_.host);
    if (config_.timeout_seconds <= 0) {
        config_.timeout_seconds = 120;
    }
}

std::string OllamaLLMClient::identifier() const
{
    return "ollama:" + config_.host;
}

bool OllamaLLMClient::is_available()
{
    try {
        const auto result = perform_request("GET", "/api/tags", std::string(), config_.connect_timeout_seconds);
        return result.status == 200;
    } catch (const LLMError& ex) {
        if (logger_) {
            logger_->debug("Ollama at {} is not reachable: {}", config_.host, ex.what());
        }
        return false;
    }
}

std::string OllamaLLMClient::complete(const std::string& prompt, const LLMOptions& options)
{
    return generate(prompt, options, false);
}

std::string OllamaLLMClient::complete_json(const std::string& prompt, const LLMOptions& options)
{
    return generate(prompt, options, true);
}

std::vector<std::string> OllamaLLMClient::available_models()
{
    const auto result = perform_request("GET", "/api/tags", std::string(), config_.connect_timeout_seconds);
    if (result.status != 200) {
        throw LLMError(LLMError::Kind::InvalidResponse,
                       "Listing models failed with HTTP " + std::to_string(result.status));
    }
    const Json::Value root = parse_body(result.body);
    if (!root.isObject()) {
        throw LLMError(LLMError::Kind::InvalidResponse, "Unexpected /api/tags payload");
    }
    std::vector<std::string> models;
    for (const auto& entry : root["models"]) {
        if (entry["name"].isString()) {
            models.push_back(entry["name"].asString());
        }
    }
    return models;
}

void OllamaLLMClient::warmup(const std::string& model)
{
    LLMOptions options = LLMOptions::deterministic(model.empty() ? config_.default_model : model);
    options.max_tokens = 1;
    try {
        generate("Hello", options, false);
        if (logger_) {
            logger_->info("Warmed up model '{}'", options.model);
        }
    } catch (const LLMError& ex) {
        if (logger_) {
            logger_->warn("Warmup of model '{}' failed: {}", options.model, ex.what());
        }
    }
}

std::string OllamaLLMClient::build_generate_body(const std::string& prompt,
                                                 const LLMOptions& options,
                                                 bool json_format) const
{
    Json::Value body(Json::objectValue);
    body["model"] = options.model.empty() ? config_.default_model : options.model;
    body["prompt"] = prompt;
    body["stream"] = false;
    if (json_format) {
        body["format"] = "json";
    }

    Json::Value opts(Json::objectValue);
    opts["temperature"] = options.temperature;
    opts["top_p"] = options.top_p;
    opts["num_predict"] = options.max_tokens;
    if (!options.stop_sequences.empty()) {
        Json::Value stop(Json::arrayValue);
        for (const auto& seq : options.stop_sequences) {
            stop.append(seq);
        }
        opts["stop"] = stop;
    }
    body["options"] = opts;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

std::string OllamaLLMClient::generate(const std::string& prompt, const LLMOptions& options, bool json_format)
{
    const std::string body = build_generate_body(prompt, options, json_format);
    if (logger_) {
        logger_->debug("POST {}/api/generate model='{}' prompt_chars={} json={}",
                       config_.host, options.model, prompt.size(), json_format);
    }

    const CancellationToken* cancellation = options.cancellation ? &*options.cancellation : nullptr;
    const auto result = perform_request("POST", "/api/generate", body, config_.timeout_seconds, cancellation);

    if (result.status == 404) {
        throw LLMError(LLMError::Kind::ModelNotFound,
                       "Model '" + options.model + "' not found: " + error_message_from_body(result.body));
    }
    if (result.status == 429) {
        throw LLMError(LLMError::Kind::RateLimited, "Ollama is rate limiting requests");
    }
    if (result.status != 200) {
        throw LLMError(LLMError::Kind::InvalidResponse,
                       "Ollama returned HTTP " + std::to_string(result.status) + ": " +
                           error_message_from_body(result.body));
    }

    const Json::Value root = parse_body(result.body);
    if (root.isObject() && root["error"].isString()) {
        const std::string message = root["error"].asString();
        if (Utils::to_lower_copy(message).find("not found") != std::string::npos) {
            throw LLMError(LLMError::Kind::ModelNotFound, message);
        }
        throw LLMError(LLMError::Kind::InvalidResponse, message);
    }
    if (!root.isObject() || !root["response"].isString()) {
        throw LLMError(LLMError::Kind::InvalidResponse, "Ollama reply is missing the 'response' field");
    }

    std::string text = root["response"].asString();
    if (logger_) {
        logger_->debug("Ollama replied with {} chars", text.size());
    }
    return text;
}

OllamaLLMClient::HttpResult OllamaLLMClient::perform_request(const std::string& method,
                                                             const std::string& path,
                                                             const std::string& body,
                                                             long timeout_seconds,
                                                             const CancellationToken* cancellation) const
{
    const std::string url = config_.host + path;
    if (cancellation && cancellation->is_cancelled()) {
        throw error_from_curl(CURLE_ABORTED_BY_CALLBACK, url);
    }

#ifdef FILE_TAXONOMY_TEST_BUILD
    if (const auto& probe = TestHooks::http_transport_probe()) {
        const TestHooks::HttpResponse response = probe({method, url, body, timeout_seconds});
        if (response.curl_code != CURLE_OK) {
            throw error_from_curl(response.curl_code, url);
        }
        if (cancellation && cancellation->is_cancelled()) {
            throw error_from_curl(CURLE_ABORTED_BY_CALLBACK, url);
        }
        return HttpResult{response.status, response.body};
    }
#endif

    ensure_curl_initialized();
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw LLMError(LLMError::Kind::ConnectionFailed, "Failed to initialize curl");
    }

    std::string response_body;
    std::unique_ptr<curl_slist, HeaderListDeleter> headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "file-taxonomy/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    if (cancellation) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, cancellation_progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, cancellation);
    }

    if (method == "POST") {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        if (logger_) {
            logger_->warn("{} {} failed: {}", method, url, curl_easy_strerror(code));
        }
        throw error_from_curl(code, url);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return HttpResult{status, std::move(response_body)};
}
