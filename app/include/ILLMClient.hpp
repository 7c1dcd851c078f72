#ifndef ILLM_CLIENT_HPP
#define ILLM_CLIENT_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

struct LLMOptions {
    std::string model{"llama3.2"};
    double temperature{0.3};
    int max_tokens{2000};
    double top_p{0.9};
    std::vector<std::string> stop_sequences;
    // When set and tripped, clients abandon the request with LLMError::Kind::Cancelled.
    std::optional<CancellationToken> cancellation;

    static LLMOptions defaults(const std::string& model = "llama3.2") {
        return LLMOptions{model, 0.3, 2000, 0.9, {}, std::nullopt};
    }

    static LLMOptions creative(const std::string& model = "llama3.2") {
        return LLMOptions{model, 0.8, 2000, 0.95, {}, std::nullopt};
    }

    static LLMOptions deterministic(const std::string& model = "llama3.2") {
        return LLMOptions{model, 0.0, 1000, 1.0, {}, std::nullopt};
    }
};

class ILLMClient {
public:
    virtual ~ILLMClient() = default;

    virtual std::string identifier() const = 0;
    virtual bool is_available() = 0;
    // Both calls throw LLMError on transport failure.
    virtual std::string complete(const std::string& prompt, const LLMOptions& options) = 0;
    virtual std::string complete_json(const std::string& prompt, const LLMOptions& options) = 0;
};

#endif
