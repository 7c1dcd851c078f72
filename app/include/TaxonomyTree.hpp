#ifndef TAXONOMY_TREE_HPP
#define TAXONOMY_TREE_HPP

#include "Types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Json { class Value; }

using CategoryPath = std::vector<std::string>;

struct TaxonomyNode {
    NodeId id{kInvalidNodeId};
    std::string name;
    std::optional<std::string> suggested_name;
    NodeId parent{kInvalidNodeId};
    std::vector<NodeId> children;
    std::vector<FileAssignment> files;
    double confidence{1.0};
    bool is_user_created{false};
    RefinementState refinement_state{RefinementState::Initial};
    std::map<std::string, std::string> metadata;

    bool is_root() const { return parent == kInvalidNodeId; }
    bool is_leaf() const { return children.empty(); }
    bool is_user_edited() const { return refinement_state == RefinementState::UserEdited; }
};

struct FileLocation {
    NodeId node_id{kInvalidNodeId};
    FileAssignment assignment;
};

struct TaxonomyStatistics {
    std::size_t category_count{0};
    int max_depth{0};
    std::size_t total_files{0};
    std::size_t files_needing_deep_analysis{0};
    std::size_t uncategorized_files{0};
    double average_confidence{0.0};
    std::size_t user_created_categories{0};
    std::size_t inferred_categories{0};
};

// Category tree stored as an arena of nodes keyed by id. Parent and child links are ids.
// Every file id has at most one active assignment; file_index_ maps it to the owning node.
// Not synchronized: concurrent callers go through SharedTaxonomy.
class TaxonomyTree {
public:
    explicit TaxonomyTree(std::string root_name = "Files", std::string source_folder_name = std::string());

    NodeId root_id() const { return root_id_; }
    const TaxonomyNode& root() const;
    const TaxonomyNode* node(NodeId id) const;
    bool contains(NodeId id) const;

    std::optional<NodeId> find(const CategoryPath& path) const;
    NodeId find_or_create(const CategoryPath& path, bool user_created = false);
    NodeId find_or_create_child(NodeId parent, const std::string& name, bool user_created = false);
    std::optional<NodeId> find_child(NodeId parent, const std::string& name) const;

    // Structural mutators. Each returns false (or an empty result) when a referenced node is missing.
    bool remove_category(const CategoryPath& path);
    bool remove_node(NodeId id);
    bool rename_category(const CategoryPath& path, const std::string& new_name);
    bool rename_node(NodeId id, const std::string& new_name);
    bool merge_categories(const CategoryPath& source, const CategoryPath& target);
    // Children of source that share a name with a child of target are merged into it.
    bool merge_nodes(NodeId source, NodeId target);
    // Folds every non-user-edited descendant into id. Returns the number of nodes removed.
    std::size_t collapse_subtree(NodeId id);
    std::vector<NodeId> split_category(const CategoryPath& path, const std::vector<std::string>& names);
    std::vector<NodeId> split_node(NodeId id, const std::vector<std::string>& names);
    bool move_node(NodeId id, NodeId new_parent);

    // File mutators. All of them keep a single active assignment per file id.
    NodeId assign_file(NodeId target, FileAssignment assignment);
    NodeId reassign_file(const std::string& file_id,
                         const CategoryPath& new_path,
                         double confidence,
                         AssignmentSource source = AssignmentSource::Content);
    NodeId reassign_file(const std::string& file_id,
                         NodeId target,
                         double confidence,
                         AssignmentSource source = AssignmentSource::Content);
    bool move_file(const std::string& file_id, NodeId target);
    bool remove_file(const std::string& file_id);
    bool set_needs_deep_analysis(const std::string& file_id, bool value);

    bool set_refinement_state(NodeId id, RefinementState state);
    bool set_suggested_name(NodeId id, const std::string& name);
    bool set_confidence(NodeId id, double confidence);
    bool set_metadata(NodeId id, const std::string& key, const std::string& value);

    CategoryPath path_of(NodeId id) const;
    std::string path_string(NodeId id, const std::string& separator = "/") const;
    int depth_of(NodeId id) const;
    int max_depth() const;
    bool is_descendant(NodeId candidate, NodeId ancestor) const;

    std::vector<NodeId> all_categories() const;
    std::size_t category_count() const;
    std::size_t total_file_count() const;
    std::size_t total_file_count(NodeId id) const;
    std::vector<FileAssignment> all_assignments() const;
    std::vector<FileAssignment> files_under(NodeId id) const;
    std::optional<FileLocation> locate_file(const std::string& file_id) const;
    std::optional<double> confidence_for_file(const std::string& file_id) const;
    std::vector<FileAssignment> files_needing_deep_analysis() const;
    std::size_t uncategorized_file_count() const;
    TaxonomyStatistics statistics() const;

    TimePoint created_at() const { return created_at_; }
    TimePoint modified_at() const { return modified_at_; }
    const std::string& source_folder_name() const { return source_folder_name_; }
    void set_source_folder_name(std::string name);
    bool is_verified() const { return is_verified_; }
    void set_verified(bool verified);

    Json::Value to_json() const;
    // Throws TaxonomyError(ParsingFailed) for documents that do not describe a tree.
    static TaxonomyTree from_json(const Json::Value& document);

private:
    TaxonomyNode* mutable_node(NodeId id);
    NodeId allocate_node(const std::string& name, NodeId parent, bool user_created);
    void detach_from_parent(NodeId id);
    void adopt_child(NodeId new_parent, NodeId child_id);
    void erase_file_entry(const std::string& file_id);
    CategoryPath strip_root_name(const CategoryPath& path) const;
    void touch();

    std::unordered_map<NodeId, TaxonomyNode> nodes_;
    std::unordered_map<std::string, NodeId> file_index_;
    NodeId root_id_{kInvalidNodeId};
    NodeId next_node_id_{1};
    std::uint64_t next_assignment_id_{1};
    TimePoint created_at_;
    TimePoint modified_at_;
    std::string source_folder_name_;
    bool is_verified_{false};
};

#endif
