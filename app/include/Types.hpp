#ifndef TYPES_HPP
#define TYPES_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using NodeId = std::uint64_t;
constexpr NodeId kInvalidNodeId = 0;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class FileTypeHint {
    Document,
    Video,
    Audio,
    Image,
    Archive,
    Application,
    Other
};

inline std::string to_string(FileTypeHint hint) {
    switch (hint) {
        case FileTypeHint::Document: return "document";
        case FileTypeHint::Video: return "video";
        case FileTypeHint::Audio: return "audio";
        case FileTypeHint::Image: return "image";
        case FileTypeHint::Archive: return "archive";
        case FileTypeHint::Application: return "application";
        case FileTypeHint::Other: return "other";
        default: return "other";
    }
}

// Folder name used when a theme is fanned out by file type.
inline std::string display_name(FileTypeHint hint) {
    switch (hint) {
        case FileTypeHint::Document: return "Documents";
        case FileTypeHint::Video: return "Videos";
        case FileTypeHint::Audio: return "Audio";
        case FileTypeHint::Image: return "Images";
        case FileTypeHint::Archive: return "Archives";
        case FileTypeHint::Application: return "Applications";
        case FileTypeHint::Other: return "Other";
        default: return "Other";
    }
}

enum class AssignmentSource {
    Filename,
    Content,
    User,
    Memory,
    GraphRAG
};

inline std::string to_string(AssignmentSource source) {
    switch (source) {
        case AssignmentSource::Filename: return "filename";
        case AssignmentSource::Content: return "content";
        case AssignmentSource::User: return "user";
        case AssignmentSource::Memory: return "memory";
        case AssignmentSource::GraphRAG: return "graphRAG";
        default: return "filename";
    }
}

inline AssignmentSource assignment_source_from_string(const std::string& value) {
    if (value == "content") return AssignmentSource::Content;
    if (value == "user") return AssignmentSource::User;
    if (value == "memory") return AssignmentSource::Memory;
    if (value == "graphRAG") return AssignmentSource::GraphRAG;
    return AssignmentSource::Filename;
}

enum class RefinementState {
    Initial,
    Refining,
    Refined,
    UserEdited ///< Terminal; set only by an explicit user action.
};

inline std::string to_string(RefinementState state) {
    switch (state) {
        case RefinementState::Initial: return "initial";
        case RefinementState::Refining: return "refining";
        case RefinementState::Refined: return "refined";
        case RefinementState::UserEdited: return "userEdited";
        default: return "initial";
    }
}

inline RefinementState refinement_state_from_string(const std::string& value) {
    if (value == "refining") return RefinementState::Refining;
    if (value == "refined") return RefinementState::Refined;
    if (value == "userEdited") return RefinementState::UserEdited;
    return RefinementState::Initial;
}

struct ScannedFile {
    std::string id;
    std::string name;
    std::string path;
    std::string relative_path;
    std::string extension;
    std::uintmax_t size{0};
    TimePoint created_at{};
    TimePoint modified_at{};
};

struct FileAssignment {
    std::uint64_t id{0};
    std::string file_id;
    NodeId category_id{kInvalidNodeId};
    std::string url;
    std::string filename;
    double confidence{0.0};
    bool needs_deep_analysis{false};
    AssignmentSource source{AssignmentSource::Filename};
    TimePoint assigned_at{};
};

// Text, tags and timing pulled out of a file by an inspector.
struct ContentSignal {
    std::string kind;
    std::string text_cue;
    std::vector<std::string> scene_tags;
    std::vector<std::string> detected_objects;
    std::optional<double> duration_seconds;
};

// Copies share one flag, so a token handed to a worker can be tripped from anywhere.
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

#endif
