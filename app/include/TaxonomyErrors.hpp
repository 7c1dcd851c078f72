#ifndef TAXONOMY_ERRORS_HPP
#define TAXONOMY_ERRORS_HPP

#include <stdexcept>
#include <string>

class TaxonomyError : public std::runtime_error {
public:
    enum class Kind {
        NoFilesProvided,
        InvalidResponse,
        LLMUnavailable,
        ParsingFailed,
        MaxDepthExceeded
    };

    TaxonomyError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class TaxonomyPipelineError : public std::runtime_error {
public:
    enum class Kind {
        DepthConstraintViolation,
        SuggestionNotFound,
        SuggestionAlreadyProcessed,
        UserEditedNodeProtected,
        GuardrailViolation,
        StaleSuggestion
    };

    TaxonomyPipelineError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& message)
        : std::runtime_error(message) {}
};

class ScanError : public std::runtime_error {
public:
    enum class Kind {
        FolderNotFound,
        NotADirectory,
        AccessDenied
    };

    ScanError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

#endif
