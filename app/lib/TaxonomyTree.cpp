#include "TaxonomyTree.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <json/json.h>

#include <algorithm>
#include <functional>
#include <utility>

namespace {
constexpr double kUncategorizedConfidence = 0.75;

double clamp_confidence(double value) {
    return std::clamp(value, 0.0, 1.0);
}

Json::Value assignment_to_json(const FileAssignment& assignment) {
    Json::Value value(Json::objectValue);
    value["id"] = static_cast<Json::UInt64>(assignment.id);
    value["file_id"] = assignment.file_id;
    value["url"] = assignment.url;
    value["filename"] = assignment.filename;
    value["confidence"] = assignment.confidence;
    value["needs_deep_analysis"] = assignment.needs_deep_analysis;
    value["source"] = to_string(assignment.source);
    value["assigned_at"] = Utils::format_timestamp(assignment.assigned_at);
    return value;
}

FileAssignment assignment_from_json(const Json::Value& value, NodeId owner) {
    if (!value.isObject() || !value["file_id"].isString()) {
        throw TaxonomyError(TaxonomyError::Kind::ParsingFailed, "File assignment is missing file_id");
    }
    FileAssignment assignment;
    assignment.id = value.get("id", Json::UInt64(0)).asUInt64();
    assignment.file_id = value["file_id"].asString();
    assignment.category_id = owner;
    assignment.url = value.get("url", "").asString();
    assignment.filename = value.get("filename", assignment.file_id).asString();
    assignment.confidence = clamp_confidence(value.get("confidence", 0.0).asDouble());
    assignment.needs_deep_analysis = value.get("needs_deep_analysis", false).asBool();
    assignment.source = assignment_source_from_string(value.get("source", "filename").asString());
    assignment.assigned_at = Utils::parse_timestamp(value.get("assigned_at", "").asString())
                                 .value_or(Clock::now());
    return assignment;
}
} // namespace

TaxonomyTree::TaxonomyTree(std::string root_name, std::string source_folder_name)
    : created_at_(Clock::now()),
      modified_at_(created_at_),
      source_folder_name_(std::move(source_folder_name))
{
    root_name = Utils::trim_copy(std::move(root_name));
    root_id_ = allocate_node(root_name.empty() ? "Files" : root_name, kInvalidNodeId, false);
}

const TaxonomyNode& TaxonomyTree::root() const
{
    return nodes_.at(root_id_);
}

const TaxonomyNode* TaxonomyTree::node(NodeId id) const
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

TaxonomyNode* TaxonomyTree::mutable_node(NodeId id)
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

bool TaxonomyTree::contains(NodeId id) const
{
    return nodes_.find(id) != nodes_.end();
}

NodeId TaxonomyTree::allocate_node(const std::string& name, NodeId parent, bool user_created)
{
    const NodeId id = next_node_id_++;
    TaxonomyNode created;
    created.id = id;
    created.name = name;
    created.parent = parent;
    created.is_user_created = user_created;
    nodes_.emplace(id, std::move(created));
    if (auto* parent_node = mutable_node(parent)) {
        parent_node->children.push_back(id);
    }
    return id;
}

void TaxonomyTree::detach_from_parent(NodeId id)
{
    const auto* current = node(id);
    if (!current) {
        return;
    }
    if (auto* parent = mutable_node(current->parent)) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    }
}

void TaxonomyTree::erase_file_entry(const std::string& file_id)
{
    auto it = file_index_.find(file_id);
    if (it == file_index_.end()) {
        return;
    }
    if (auto* owner = mutable_node(it->second)) {
        auto& files = owner->files;
        files.erase(std::remove_if(files.begin(), files.end(),
                                   [&file_id](const FileAssignment& entry) {
                                       return entry.file_id == file_id;
                                   }),
                    files.end());
    }
    file_index_.erase(it);
}

CategoryPath TaxonomyTree::strip_root_name(const CategoryPath& path) const
{
    if (!path.empty() && path.front() == root().name) {
        return CategoryPath(path.begin() + 1, path.end());
    }
    return path;
}

// Same-named siblings are combined so names stay unique under a parent.
void TaxonomyTree::adopt_child(NodeId new_parent, NodeId child_id)
{
    auto* child = mutable_node(child_id);
    auto* parent = mutable_node(new_parent);
    if (!child || !parent) {
        return;
    }
    if (auto existing = find_child(new_parent, child->name); existing && *existing != child_id) {
        merge_nodes(child_id, *existing);
        return;
    }
    child->parent = new_parent;
    parent->children.push_back(child_id);
}

void TaxonomyTree::touch()
{
    modified_at_ = Clock::now();
}

std::optional<NodeId> TaxonomyTree::find_child(NodeId parent, const std::string& name) const
{
    const auto* parent_node = node(parent);
    if (!parent_node) {
        return std::nullopt;
    }
    for (NodeId child_id : parent_node->children) {
        const auto* child = node(child_id);
        if (child && child->name == name) {
            return child_id;
        }
    }
    return std::nullopt;
}

std::optional<NodeId> TaxonomyTree::find(const CategoryPath& path) const
{
    NodeId current = root_id_;
    for (const auto& component : strip_root_name(path)) {
        if (Utils::trim_copy(component).empty()) {
            continue;
        }
        auto next = find_child(current, component);
        if (!next) {
            return std::nullopt;
        }
        current = *next;
    }
    return current;
}

NodeId TaxonomyTree::find_or_create_child(NodeId parent, const std::string& name, bool user_created)
{
    if (!contains(parent) || Utils::trim_copy(name).empty()) {
        return kInvalidNodeId;
    }
    if (auto existing = find_child(parent, name)) {
        return *existing;
    }
    const NodeId created = allocate_node(name, parent, user_created);
    touch();
    return created;
}

NodeId TaxonomyTree::find_or_create(const CategoryPath& path, bool user_created)
{
    NodeId current = root_id_;
    for (const auto& component : strip_root_name(path)) {
        if (Utils::trim_copy(component).empty()) {
            continue;
        }
        current = find_or_create_child(current, component, user_created);
    }
    return current;
}

bool TaxonomyTree::remove_category(const CategoryPath& path)
{
    auto id = find(path);
    return id && remove_node(*id);
}

bool TaxonomyTree::remove_node(NodeId id)
{
    auto* removed = mutable_node(id);
    if (!removed || removed->is_root()) {
        return false;
    }
    auto* parent = mutable_node(removed->parent);
    if (!parent) {
        return false;
    }

    const NodeId parent_id = parent->id;
    detach_from_parent(id);
    for (auto& assignment : removed->files) {
        assignment.category_id = parent_id;
        file_index_[assignment.file_id] = parent_id;
        parent->files.push_back(std::move(assignment));
    }
    const std::vector<NodeId> children = removed->children;
    for (NodeId child_id : children) {
        adopt_child(parent_id, child_id);
    }
    nodes_.erase(id);
    touch();
    return true;
}

bool TaxonomyTree::rename_category(const CategoryPath& path, const std::string& new_name)
{
    auto id = find(path);
    return id && rename_node(*id, new_name);
}

bool TaxonomyTree::rename_node(NodeId id, const std::string& new_name)
{
    auto* target = mutable_node(id);
    const std::string trimmed = Utils::trim_copy(new_name);
    if (!target || trimmed.empty()) {
        return false;
    }
    target->name = trimmed;
    touch();
    return true;
}

bool TaxonomyTree::merge_categories(const CategoryPath& source, const CategoryPath& target)
{
    auto source_id = find(source);
    auto target_id = find(target);
    return source_id && target_id && merge_nodes(*source_id, *target_id);
}

bool TaxonomyTree::merge_nodes(NodeId source, NodeId target)
{
    if (source == target) {
        return false;
    }
    auto* source_node = mutable_node(source);
    auto* target_node = mutable_node(target);
    if (!source_node || !target_node || source_node->is_root()) {
        return false;
    }
    if (is_descendant(target, source)) {
        return false;
    }

    detach_from_parent(source);
    for (auto& assignment : source_node->files) {
        assignment.category_id = target;
        file_index_[assignment.file_id] = target;
        target_node->files.push_back(std::move(assignment));
    }
    const std::vector<NodeId> children = source_node->children;
    for (NodeId child_id : children) {
        adopt_child(target, child_id);
    }
    nodes_.erase(source);
    touch();
    return true;
}

std::size_t TaxonomyTree::collapse_subtree(NodeId id)
{
    const auto* collapsed = node(id);
    if (!collapsed) {
        return 0;
    }
    std::size_t removed = 0;
    const std::vector<NodeId> children = collapsed->children;
    for (NodeId child_id : children) {
        const auto* child = node(child_id);
        if (!child || child->is_user_edited()) {
            continue;
        }
        removed += collapse_subtree(child_id);
        if (remove_node(child_id)) {
            ++removed;
        }
    }
    return removed;
}

std::vector<NodeId> TaxonomyTree::split_category(const CategoryPath& path, const std::vector<std::string>& names)
{
    auto id = find(path);
    if (!id) {
        return {};
    }
    return split_node(*id, names);
}

std::vector<NodeId> TaxonomyTree::split_node(NodeId id, const std::vector<std::string>& names)
{
    std::vector<NodeId> created;
    if (!contains(id)) {
        return created;
    }
    for (const auto& raw_name : names) {
        const std::string name = Utils::trim_copy(raw_name);
        if (name.empty()) {
            continue;
        }
        const NodeId child = find_or_create_child(id, name, true);
        if (auto* child_node = mutable_node(child)) {
            child_node->is_user_created = true;
        }
        created.push_back(child);
    }
    touch();
    return created;
}

bool TaxonomyTree::move_node(NodeId id, NodeId new_parent)
{
    auto* moved = mutable_node(id);
    auto* parent = mutable_node(new_parent);
    if (!moved || !parent || moved->is_root() || id == new_parent || is_descendant(new_parent, id)) {
        return false;
    }
    if (moved->parent == new_parent) {
        return true;
    }
    detach_from_parent(id);
    moved->parent = new_parent;
    parent->children.push_back(id);
    touch();
    return true;
}

NodeId TaxonomyTree::assign_file(NodeId target, FileAssignment assignment)
{
    auto* owner = mutable_node(target);
    if (!owner || assignment.file_id.empty()) {
        return kInvalidNodeId;
    }
    erase_file_entry(assignment.file_id);

    assignment.category_id = target;
    assignment.confidence = clamp_confidence(assignment.confidence);
    if (assignment.id == 0) {
        assignment.id = next_assignment_id_++;
    } else {
        next_assignment_id_ = std::max(next_assignment_id_, assignment.id + 1);
    }
    if (assignment.assigned_at == TimePoint{}) {
        assignment.assigned_at = Clock::now();
    }
    file_index_[assignment.file_id] = target;
    owner->files.push_back(std::move(assignment));
    touch();
    return target;
}

NodeId TaxonomyTree::reassign_file(const std::string& file_id,
                                   const CategoryPath& new_path,
                                   double confidence,
                                   AssignmentSource source)
{
    const NodeId target = find_or_create(new_path);
    return reassign_file(file_id, target, confidence, source);
}

NodeId TaxonomyTree::reassign_file(const std::string& file_id,
                                   NodeId target,
                                   double confidence,
                                   AssignmentSource source)
{
    if (!contains(target) || file_id.empty()) {
        return kInvalidNodeId;
    }

    FileAssignment fresh;
    fresh.file_id = file_id;
    fresh.filename = file_id;
    if (auto prior = locate_file(file_id)) {
        fresh.url = prior->assignment.url;
        fresh.filename = prior->assignment.filename;
    }
    fresh.confidence = confidence;
    fresh.needs_deep_analysis = false;
    fresh.source = source;
    fresh.assigned_at = Clock::now();
    return assign_file(target, std::move(fresh));
}

bool TaxonomyTree::move_file(const std::string& file_id, NodeId target)
{
    auto location = locate_file(file_id);
    if (!location || !contains(target)) {
        return false;
    }
    if (location->node_id == target) {
        return true;
    }
    return assign_file(target, std::move(location->assignment)) != kInvalidNodeId;
}

bool TaxonomyTree::remove_file(const std::string& file_id)
{
    if (file_index_.find(file_id) == file_index_.end()) {
        return false;
    }
    erase_file_entry(file_id);
    touch();
    return true;
}

bool TaxonomyTree::set_needs_deep_analysis(const std::string& file_id, bool value)
{
    auto it = file_index_.find(file_id);
    if (it == file_index_.end()) {
        return false;
    }
    auto* owner = mutable_node(it->second);
    if (!owner) {
        return false;
    }
    for (auto& assignment : owner->files) {
        if (assignment.file_id == file_id) {
            assignment.needs_deep_analysis = value;
            touch();
            return true;
        }
    }
    return false;
}

bool TaxonomyTree::set_refinement_state(NodeId id, RefinementState state)
{
    auto* target = mutable_node(id);
    if (!target) {
        return false;
    }
    // userEdited is a one-way lock.
    if (target->is_user_edited() && state != RefinementState::UserEdited) {
        return false;
    }
    target->refinement_state = state;
    touch();
    return true;
}

bool TaxonomyTree::set_suggested_name(NodeId id, const std::string& name)
{
    auto* target = mutable_node(id);
    if (!target) {
        return false;
    }
    target->suggested_name = name;
    touch();
    return true;
}

bool TaxonomyTree::set_confidence(NodeId id, double confidence)
{
    auto* target = mutable_node(id);
    if (!target) {
        return false;
    }
    target->confidence = clamp_confidence(confidence);
    touch();
    return true;
}

bool TaxonomyTree::set_metadata(NodeId id, const std::string& key, const std::string& value)
{
    auto* target = mutable_node(id);
    if (!target) {
        return false;
    }
    target->metadata[key] = value;
    touch();
    return true;
}

CategoryPath TaxonomyTree::path_of(NodeId id) const
{
    CategoryPath path;
    const auto* current = node(id);
    while (current && !current->is_root()) {
        path.push_back(current->name);
        current = node(current->parent);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::string TaxonomyTree::path_string(NodeId id, const std::string& separator) const
{
    return Utils::join(path_of(id), separator);
}

int TaxonomyTree::depth_of(NodeId id) const
{
    const auto* current = node(id);
    if (!current) {
        return -1;
    }
    int depth = 0;
    while (!current->is_root()) {
        ++depth;
        current = node(current->parent);
        if (!current) {
            break;
        }
    }
    return depth;
}

int TaxonomyTree::max_depth() const
{
    int deepest = 0;
    for (const auto& [id, entry] : nodes_) {
        if (entry.is_leaf()) {
            deepest = std::max(deepest, depth_of(id));
        }
    }
    return deepest;
}

bool TaxonomyTree::is_descendant(NodeId candidate, NodeId ancestor) const
{
    const auto* current = node(candidate);
    while (current && !current->is_root()) {
        if (current->parent == ancestor) {
            return true;
        }
        current = node(current->parent);
    }
    return false;
}

std::vector<NodeId> TaxonomyTree::all_categories() const
{
    std::vector<NodeId> ordered;
    ordered.reserve(nodes_.size());
    std::vector<NodeId> stack(root().children.rbegin(), root().children.rend());
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        const auto* current = node(id);
        if (!current) {
            continue;
        }
        ordered.push_back(id);
        stack.insert(stack.end(), current->children.rbegin(), current->children.rend());
    }
    return ordered;
}

std::size_t TaxonomyTree::category_count() const
{
    return nodes_.size() - 1;
}

std::size_t TaxonomyTree::total_file_count() const
{
    return total_file_count(root_id_);
}

std::size_t TaxonomyTree::total_file_count(NodeId id) const
{
    const auto* current = node(id);
    if (!current) {
        return 0;
    }
    std::size_t total = current->files.size();
    for (NodeId child : current->children) {
        total += total_file_count(child);
    }
    return total;
}

std::vector<FileAssignment> TaxonomyTree::all_assignments() const
{
    return files_under(root_id_);
}

std::vector<FileAssignment> TaxonomyTree::files_under(NodeId id) const
{
    std::vector<FileAssignment> collected;
    std::function<void(NodeId)> visit = [&](NodeId current_id) {
        const auto* current = node(current_id);
        if (!current) {
            return;
        }
        collected.insert(collected.end(), current->files.begin(), current->files.end());
        for (NodeId child : current->children) {
            visit(child);
        }
    };
    visit(id);
    return collected;
}

std::optional<FileLocation> TaxonomyTree::locate_file(const std::string& file_id) const
{
    auto it = file_index_.find(file_id);
    if (it == file_index_.end()) {
        return std::nullopt;
    }
    const auto* owner = node(it->second);
    if (!owner) {
        return std::nullopt;
    }
    for (const auto& assignment : owner->files) {
        if (assignment.file_id == file_id) {
            return FileLocation{owner->id, assignment};
        }
    }
    return std::nullopt;
}

std::optional<double> TaxonomyTree::confidence_for_file(const std::string& file_id) const
{
    auto location = locate_file(file_id);
    if (!location) {
        return std::nullopt;
    }
    return location->assignment.confidence;
}

std::vector<FileAssignment> TaxonomyTree::files_needing_deep_analysis() const
{
    auto files = all_assignments();
    files.erase(std::remove_if(files.begin(), files.end(),
                               [](const FileAssignment& entry) { return !entry.needs_deep_analysis; }),
                files.end());
    return files;
}

std::size_t TaxonomyTree::uncategorized_file_count() const
{
    const auto& files = root().files;
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [](const FileAssignment& entry) {
        return entry.confidence < kUncategorizedConfidence;
    }));
}

TaxonomyStatistics TaxonomyTree::statistics() const
{
    TaxonomyStatistics stats;
    stats.category_count = category_count();
    stats.max_depth = max_depth();
    stats.uncategorized_files = uncategorized_file_count();

    const auto files = all_assignments();
    stats.total_files = files.size();
    double confidence_sum = 0.0;
    for (const auto& entry : files) {
        confidence_sum += entry.confidence;
        if (entry.needs_deep_analysis) {
            ++stats.files_needing_deep_analysis;
        }
    }
    stats.average_confidence = files.empty() ? 0.0 : confidence_sum / static_cast<double>(files.size());

    for (const auto& [id, entry] : nodes_) {
        if (entry.is_root()) {
            continue;
        }
        if (entry.is_user_created) {
            ++stats.user_created_categories;
        } else {
            ++stats.inferred_categories;
        }
    }
    return stats;
}

void TaxonomyTree::set_source_folder_name(std::string name)
{
    source_folder_name_ = std::move(name);
    touch();
}

void TaxonomyTree::set_verified(bool verified)
{
    is_verified_ = verified;
    touch();
}

Json::Value TaxonomyTree::to_json() const
{
    std::function<Json::Value(NodeId)> encode = [&](NodeId id) {
        const auto& current = nodes_.at(id);
        Json::Value value(Json::objectValue);
        value["id"] = static_cast<Json::UInt64>(current.id);
        value["name"] = current.name;
        if (current.suggested_name) {
            value["suggested_name"] = *current.suggested_name;
        }
        value["confidence"] = current.confidence;
        value["is_user_created"] = current.is_user_created;
        value["refinement_state"] = to_string(current.refinement_state);
        value["file_count"] = static_cast<Json::UInt64>(total_file_count(id));

        Json::Value metadata(Json::objectValue);
        for (const auto& [key, entry] : current.metadata) {
            metadata[key] = entry;
        }
        value["metadata"] = metadata;

        Json::Value files(Json::arrayValue);
        for (const auto& assignment : current.files) {
            files.append(assignment_to_json(assignment));
        }
        value["files"] = files;

        Json::Value children(Json::arrayValue);
        for (NodeId child : current.children) {
            children.append(encode(child));
        }
        value["children"] = children;
        return value;
    };

    Json::Value document(Json::objectValue);
    document["root"] = encode(root_id_);
    document["created_at"] = Utils::format_timestamp(created_at_);
    document["modified_at"] = Utils::format_timestamp(modified_at_);
    document["source_folder_name"] = source_folder_name_;
    document["is_verified"] = is_verified_;
    return document;
}

TaxonomyTree TaxonomyTree::from_json(const Json::Value& document)
{
    if (!document.isObject() || !document["root"].isObject() || !document["root"]["name"].isString()) {
        throw TaxonomyError(TaxonomyError::Kind::ParsingFailed, "Taxonomy document has no root node");
    }

    TaxonomyTree tree(document["root"]["name"].asString(), document.get("source_folder_name", "").asString());
    tree.nodes_.clear();
    tree.file_index_.clear();
    tree.next_node_id_ = 1;

    std::function<NodeId(const Json::Value&, NodeId)> decode = [&](const Json::Value& value, NodeId parent) {
        if (!value.isObject() || !value["name"].isString()) {
            throw TaxonomyError(TaxonomyError::Kind::ParsingFailed, "Taxonomy node is missing a name");
        }
        NodeId id = value.get("id", Json::UInt64(0)).asUInt64();
        if (id == kInvalidNodeId || tree.contains(id)) {
            id = tree.next_node_id_;
        }
        tree.next_node_id_ = std::max(tree.next_node_id_, id + 1);

        TaxonomyNode decoded;
        decoded.id = id;
        decoded.name = value["name"].asString();
        decoded.parent = parent;
        if (value["suggested_name"].isString()) {
            decoded.suggested_name = value["suggested_name"].asString();
        }
        decoded.confidence = clamp_confidence(value.get("confidence", 1.0).asDouble());
        decoded.is_user_created = value.get("is_user_created", false).asBool();
        decoded.refinement_state = refinement_state_from_string(value.get("refinement_state", "initial").asString());
        const Json::Value& metadata = value["metadata"];
        if (metadata.isObject()) {
            for (const auto& key : metadata.getMemberNames()) {
                decoded.metadata[key] = metadata[key].asString();
            }
        }
        tree.nodes_.emplace(id, std::move(decoded));
        if (auto* parent_node = tree.mutable_node(parent)) {
            parent_node->children.push_back(id);
        }

        for (const auto& file_value : value["files"]) {
            FileAssignment assignment = assignment_from_json(file_value, id);
            tree.erase_file_entry(assignment.file_id);
            if (assignment.id == 0) {
                assignment.id = tree.next_assignment_id_;
            }
            tree.next_assignment_id_ = std::max(tree.next_assignment_id_, assignment.id + 1);
            tree.file_index_[assignment.file_id] = id;
            tree.mutable_node(id)->files.push_back(std::move(assignment));
        }
        for (const auto& child_value : value["children"]) {
            decode(child_value, id);
        }
        return id;
    };

    tree.root_id_ = decode(document["root"], kInvalidNodeId);
    tree.is_verified_ = document.get("is_verified", false).asBool();
    if (auto created = Utils::parse_timestamp(document.get("created_at", "").asString())) {
        tree.created_at_ = *created;
    }
    tree.modified_at_ = Utils::parse_timestamp(document.get("modified_at", "").asString())
                            .value_or(tree.created_at_);
    return tree;
}
