#ifndef LLM_ERRORS_HPP
#define LLM_ERRORS_HPP

#include <stdexcept>
#include <string>

class LLMError : public std::runtime_error {
public:
    enum class Kind {
        ConnectionFailed,
        InvalidResponse,
        Timeout,
        ModelNotFound,
        RateLimited,
        Cancelled
    };

    LLMError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

#endif
