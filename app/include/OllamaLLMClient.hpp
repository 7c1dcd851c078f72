#ifndef OLLAMA_LLM_CLIENT_HPP
#define OLLAMA_LLM_CLIENT_HPP

#include "ILLMClient.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

// ILLMClient backed by an Ollama server's /api/generate endpoint.
class OllamaLLMClient : public ILLMClient {
public:
    struct Config {
        std::string host{"http://127.0.0.1:11434"};
        std::string default_model{"llama3.2"};
        long timeout_seconds{120};
        long connect_timeout_seconds{5};
    };

    explicit OllamaLLMClient(Config config, std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string identifier() const override;
    bool is_available() override;
    std::string complete(const std::string& prompt, const LLMOptions& options) override;
    std::string complete_json(const std::string& prompt, const LLMOptions& options) override;

    std::vector<std::string> available_models();
    void warmup(const std::string& model);

    const Config& config() const { return config_; }

private:
    struct HttpResult {
        long status{0};
        std::string body;
    };

    std::string generate(const std::string& prompt, const LLMOptions& options, bool json_format);
    HttpResult perform_request(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               long timeout_seconds,
                               const CancellationToken* cancellation = nullptr) const;
    std::string build_generate_body(const std::string& prompt,
                                    const LLMOptions& options,
                                    bool json_format) const;

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
