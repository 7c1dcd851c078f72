#include "TaxonomyBuilder.hpp"
#include "ILLMClient.hpp"
#include "KeywordExtractor.hpp"
#include "LLMResponseParser.hpp"
#include "MergeSplitGatekeeper.hpp"
#include "SemanticThemeClusterer.hpp"
#include "SharedTaxonomy.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <utility>

namespace {

constexpr double kInstantConfidence = 0.7;
constexpr std::size_t kNamingSampleSize = 20;
constexpr std::size_t kMergeSampleSize = 5;
constexpr std::size_t kMaxMergeSuggestions = 5;
constexpr std::size_t kStructureSampleSize = 30;
constexpr const char* kNoMergesSentinel = "NO_MERGES";

FileAssignment make_assignment(const ExtractedKeywords& file)
{
    FileAssignment assignment;
    assignment.file_id = file.file_id;
    assignment.url = file.source_path;
    assignment.filename = file.original_filename;
    assignment.confidence = kInstantConfidence;
    assignment.needs_deep_analysis = false;
    assignment.source = AssignmentSource::Filename;
    return assignment;
}

NodeId add_category(TaxonomyTree& tree, NodeId parent, const std::string& name)
{
    const NodeId id = tree.find_or_create_child(parent, name);
    tree.set_confidence(id, kInstantConfidence);
    return id;
}

void place_files(TaxonomyTree& tree,
                 NodeId parent,
                 const std::vector<ExtractedKeywords>& files,
                 const FileTypeGroups& by_type,
                 bool separate_file_types)
{
    if (separate_file_types && !by_type.empty()) {
        for (const auto& [type, typed_files] : by_type) {
            const NodeId type_node = add_category(tree, parent, display_name(type));
            for (const auto& file : typed_files) {
                tree.assign_file(type_node, make_assignment(file));
            }
        }
        return;
    }
    for (const auto& file : files) {
        tree.assign_file(parent, make_assignment(file));
    }
}

std::string split_arrow(const std::string& line, std::string& right)
{
    static const std::string kAsciiArrow = "->";
    static const std::string kUnicodeArrow = "\xE2\x86\x92";
    auto pos = line.find(kAsciiArrow);
    std::size_t width = kAsciiArrow.size();
    if (pos == std::string::npos) {
        pos = line.find(kUnicodeArrow);
        width = kUnicodeArrow.size();
    }
    if (pos == std::string::npos) {
        return std::string();
    }
    right = Utils::trim_copy(line.substr(pos + width));
    return Utils::trim_copy(line.substr(0, pos));
}

} // namespace

std::string to_string(RefinementPhase phase)
{
    switch (phase) {
        case RefinementPhase::RefiningNames: return "refining_names";
        case RefinementPhase::SuggestingMerges: return "suggesting_merges";
        case RefinementPhase::Merging: return "merging";
        case RefinementPhase::InferringStructure: return "inferring_structure";
        case RefinementPhase::Complete: return "complete";
        case RefinementPhase::Cancelled: return "cancelled";
        default: return "refining_names";
    }
}

TaxonomyBuilder::TaxonomyBuilder(TaxonomyBuilderConfig config,
                                 std::shared_ptr<MergeSplitGatekeeper> gatekeeper,
                                 std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      gatekeeper_(gatekeeper ? std::move(gatekeeper)
                             : std::make_shared<MergeSplitGatekeeper>(UserEditGuardrails(true, logger), logger)),
      logger_(std::move(logger))
{
}

TaxonomyBuilder::~TaxonomyBuilder()
{
    cancel_refinement();
    if (worker_.joinable()) {
        worker_.join();
    }
}

TaxonomyTree TaxonomyBuilder::build_instant(const std::vector<ScannedFile>& files,
                                            const std::string& root_name) const
{
    if (files.empty()) {
        throw TaxonomyError(TaxonomyError::Kind::NoFilesProvided, "No files provided for taxonomy inference");
    }

    const auto started = std::chrono::steady_clock::now();
    const KeywordExtractor extractor(config_.use_stemming ? KeywordExtractor::Config::quality()
                                                          : KeywordExtractor::Config::fast());
    const auto extracted = extractor.extract_batch(files);

    auto clusterer_config = SemanticThemeClusterer::Config::with_target_count(config_.target_category_count,
                                                                             config_.separate_file_types);
    clusterer_config.min_files_per_theme = config_.min_files_per_theme;
    clusterer_config.theme_similarity_threshold = config_.theme_similarity_threshold;
    const SemanticThemeClusterer clusterer(clusterer_config);
    const auto themes = clusterer.cluster(extracted);

    TaxonomyTree tree(root_name);
    for (const auto& theme : themes) {
        const NodeId theme_node = add_category(tree, tree.root_id(), theme.name);
        if (theme.has_sub_themes()) {
            for (const auto& sub_theme : theme.sub_themes) {
                const NodeId sub_node = add_category(tree, theme_node, sub_theme.name);
                place_files(tree, sub_node, sub_theme.files, sub_theme.file_type_groups,
                            config_.separate_file_types);
            }
        } else {
            place_files(tree, theme_node, theme.files, theme.file_type_groups, config_.separate_file_types);
        }
    }

    if (logger_) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger_->info("Instant taxonomy: {} files in {} categories ({} themes) in {} ms",
                      tree.total_file_count(), tree.category_count(), themes.size(), elapsed.count());
    }
    return tree;
}

bool TaxonomyBuilder::start_refinement(std::shared_ptr<SharedTaxonomy> taxonomy, std::shared_ptr<ILLMClient> llm)
{
    if (!taxonomy || !llm) {
        if (logger_) {
            logger_->warn("Refinement requested without a taxonomy or LLM client");
        }
        return false;
    }

    std::thread previous;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (refining_) {
            if (logger_) {
                logger_->warn("Refinement already in progress");
            }
            return false;
        }
        refining_ = true;
        cancellation_ = token;
        previous = std::move(worker_);
    }
    if (previous.joinable()) {
        previous.join();
    }

    if (logger_) {
        logger_->info("Starting LLM refinement with {}", llm->identifier());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    worker_ = std::thread([this, taxonomy, llm, token]() {
        try {
            run_refinement(*taxonomy, *llm, token);
        } catch (const std::exception& ex) {
            if (logger_) {
                logger_->error("Refinement aborted: {}", ex.what());
            }
        }
        {
            std::lock_guard<std::mutex> done_lock(state_mutex_);
            refining_ = false;
        }
        state_cv_.notify_all();
    });
    return true;
}

void TaxonomyBuilder::cancel_refinement()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (refining_) {
        cancellation_.cancel();
        if (logger_) {
            logger_->info("Refinement cancellation requested");
        }
    }
}

bool TaxonomyBuilder::wait_for_refinement(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return !refining_; });
}

bool TaxonomyBuilder::is_refining() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return refining_;
}

void TaxonomyBuilder::run_refinement(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation)
{
    const auto started = std::chrono::steady_clock::now();
    const std::size_t refined = refine_names(taxonomy, llm, cancellation);

    if (!cancellation.is_cancelled()) {
        suggest_merges(taxonomy, llm, cancellation);
    }

    const std::size_t total = taxonomy.read([](const TaxonomyTree& tree) { return tree.category_count(); });
    if (cancellation.is_cancelled()) {
        publish(RefinementPhase::Cancelled, total, refined, std::string());
        if (logger_) {
            logger_->info("Refinement cancelled after {} categories", refined);
        }
        return;
    }

    publish(RefinementPhase::Complete, total, refined, std::string());
    if (logger_) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger_->info("Refinement complete in {} ms: {} categories renamed", elapsed.count(), refined);
    }
}

std::size_t TaxonomyBuilder::refine_names(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation)
{
    const auto categories = taxonomy.read([](const TaxonomyTree& tree) {
        std::vector<NodeId> ids;
        for (NodeId id : tree.all_categories()) {
            const auto* node = tree.node(id);
            if (node && !node->is_user_edited()) {
                ids.push_back(id);
            }
        }
        return ids;
    });

    const std::size_t total = categories.size();
    const std::size_t batch_size = std::max<std::size_t>(1, config_.refinement_batch_size);
    std::size_t refined = 0;

    for (std::size_t index = 0; index < total; ++index) {
        if (cancellation.is_cancelled()) {
            return refined;
        }
        if (refine_category(taxonomy, llm, categories[index])) {
            ++refined;
            const std::string name = taxonomy.read([&](const TaxonomyTree& tree) {
                const auto* node = tree.node(categories[index]);
                return node ? node->name : std::string();
            });
            publish(RefinementPhase::RefiningNames, total, refined, name);
        }
        if ((index + 1) % batch_size == 0 && logger_) {
            logger_->debug("Naming pass: {}/{} categories processed", index + 1, total);
        }
        if (!pause_between_requests(cancellation)) {
            return refined;
        }
    }
    return refined;
}

bool TaxonomyBuilder::refine_category(SharedTaxonomy& taxonomy, ILLMClient& llm, NodeId node_id)
{
    struct Snapshot {
        bool eligible{false};
        std::string name;
        std::vector<std::string> filenames;
    };

    const Snapshot snapshot = taxonomy.write([&](TaxonomyTree& tree) {
        Snapshot result;
        const auto* node = tree.node(node_id);
        if (!node || node->is_user_edited()) {
            return result;
        }
        result.eligible = true;
        result.name = node->name;
        for (const auto& file : tree.files_under(node_id)) {
            if (result.filenames.size() >= kNamingSampleSize) {
                break;
            }
            result.filenames.push_back(file.filename);
        }
        tree.set_refinement_state(node_id, RefinementState::Refining);
        return result;
    });
    if (!snapshot.eligible) {
        if (logger_) {
            logger_->debug("Skipping category {}: missing or user-edited", node_id);
        }
        return false;
    }

    LLMOptions options = LLMOptions::defaults(config_.refinement_model);
    options.temperature = 0.3;
    options.max_tokens = 50;

    std::string suggested;
    try {
        suggested = clean_category_name(llm.complete(build_naming_prompt(snapshot.name, snapshot.filenames), options));
    } catch (const std::exception& ex) {
        if (logger_) {
            logger_->warn("Failed to refine category '{}': {}", snapshot.name, ex.what());
        }
        taxonomy.write([&](TaxonomyTree& tree) {
            const auto* node = tree.node(node_id);
            if (node && node->refinement_state == RefinementState::Refining) {
                tree.set_refinement_state(node_id, RefinementState::Initial);
            }
        });
        return false;
    }

    return taxonomy.write([&](TaxonomyTree& tree) {
        const auto* node = tree.node(node_id);
        if (!node || node->is_user_edited()) {
            return false;
        }
        if (suggested.empty()) {
            tree.set_refinement_state(node_id, RefinementState::Initial);
            return false;
        }
        tree.set_suggested_name(node_id, suggested);
        if (config_.apply_refined_names && suggested != node->name) {
            const std::string previous = node->name;
            const auto sibling = tree.find_child(node->parent, suggested);
            if (sibling && *sibling != node_id) {
                if (logger_) {
                    logger_->debug("Keeping '{}': sibling '{}' already exists", previous, suggested);
                }
            } else {
                tree.set_metadata(node_id, "original_name", previous);
                tree.rename_node(node_id, suggested);
                if (logger_) {
                    logger_->info("Renamed '{}' -> '{}'", previous, suggested);
                }
            }
        }
        tree.set_refinement_state(node_id, RefinementState::Refined);
        return true;
    });
}

void TaxonomyBuilder::suggest_merges(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation)
{
    struct Candidate {
        NodeId id{kInvalidNodeId};
        std::string name;
        std::size_t file_count{0};
        std::vector<std::string> sample;
    };

    const auto candidates = taxonomy.read([&](const TaxonomyTree& tree) {
        std::vector<Candidate> found;
        for (NodeId id : tree.all_categories()) {
            const auto* node = tree.node(id);
            if (!node || node->is_root() || node->is_user_edited()) {
                continue;
            }
            const std::size_t count = tree.total_file_count(id);
            if (count >= config_.merge_file_threshold) {
                continue;
            }
            Candidate candidate{id, node->name, count, {}};
            for (const auto& file : tree.files_under(id)) {
                if (candidate.sample.size() >= kMergeSampleSize) {
                    break;
                }
                candidate.sample.push_back(file.filename);
            }
            found.push_back(std::move(candidate));
        }
        return found;
    });

    const std::size_t total = taxonomy.read([](const TaxonomyTree& tree) { return tree.category_count(); });
    publish(RefinementPhase::SuggestingMerges, total, 0, std::string());
    if (candidates.size() < 2) {
        if (logger_) {
            logger_->info("Not enough merge candidates (found {})", candidates.size());
        }
        return;
    }

    std::vector<std::string> lines;
    lines.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        lines.push_back(fmt::format("- {} ({} files): {}", candidate.name, candidate.file_count,
                                    Utils::join(candidate.sample, ", ")));
    }

    LLMOptions options = LLMOptions::defaults(config_.refinement_model);
    options.temperature = 0.3;
    options.max_tokens = 300;

    std::vector<MergeGrouping> groupings;
    try {
        groupings = parse_merge_suggestions(llm.complete(build_merge_prompt(lines), options));
    } catch (const std::exception& ex) {
        if (logger_) {
            logger_->warn("Failed to get merge suggestions: {}", ex.what());
        }
        return;
    }
    if (logger_) {
        logger_->info("LLM proposed {} merge(s) across {} small categories", groupings.size(), candidates.size());
    }

    std::set<NodeId> consumed;
    for (const auto& grouping : groupings) {
        if (cancellation.is_cancelled()) {
            return;
        }

        MergeSuggestion suggestion;
        taxonomy.read([&](const TaxonomyTree& tree) {
            for (const auto& source : grouping.sources) {
                const std::string wanted = Utils::to_lower_copy(source);
                for (const auto& candidate : candidates) {
                    if (consumed.count(candidate.id) || !tree.contains(candidate.id) ||
                        Utils::to_lower_copy(candidate.name) != wanted) {
                        continue;
                    }
                    const bool related = std::any_of(
                        suggestion.source_nodes.begin(), suggestion.source_nodes.end(), [&](NodeId chosen) {
                            return chosen == candidate.id || tree.is_descendant(candidate.id, chosen) ||
                                   tree.is_descendant(chosen, candidate.id);
                        });
                    if (related) {
                        continue;
                    }
                    suggestion.source_nodes.push_back(candidate.id);
                    suggestion.source_names.push_back(candidate.name);
                    break;
                }
            }
            if (!suggestion.source_nodes.empty()) {
                suggestion.new_target_parent = tree.node(suggestion.source_nodes.front())->parent;
            }
        });

        if (suggestion.source_nodes.size() < 2) {
            if (logger_) {
                logger_->debug("Could not resolve enough sources for merge into '{}'", grouping.merged_name);
            }
            continue;
        }

        suggestion.target_name = Utils::sanitize_path_label(grouping.merged_name);
        if (suggestion.target_name.empty()) {
            continue;
        }
        suggestion.reason = "Small related categories";
        suggestion.confidence = kInstantConfidence;

        try {
            const std::string id = gatekeeper_->suggest_merge(suggestion, taxonomy);
            const AutoApplyResult applied = gatekeeper_->auto_apply_merge(id, taxonomy);
            if (!applied.applied) {
                if (logger_) {
                    logger_->info("Merge into '{}' vetoed: {}", suggestion.target_name, applied.reason);
                }
                continue;
            }
            consumed.insert(suggestion.source_nodes.begin(), suggestion.source_nodes.end());
            const NodeId merged = applied.nodes.empty() ? kInvalidNodeId : applied.nodes.front();
            if (merged == kInvalidNodeId) {
                continue;
            }
            consumed.insert(merged);
            publish(RefinementPhase::Merging, total, consumed.size(), suggestion.target_name);

            // The merged category holds its sources' files flat before structure is inferred.
            taxonomy.write([&](TaxonomyTree& tree) {
                const auto* node = tree.node(merged);
                if (node && !node->is_user_edited() && !node->is_user_created) {
                    tree.collapse_subtree(merged);
                }
            });
            infer_sub_structure(taxonomy, llm, merged);
            taxonomy.write([&](TaxonomyTree& tree) {
                const auto* node = tree.node(merged);
                if (node && !node->is_user_edited()) {
                    tree.set_refinement_state(merged, RefinementState::Refined);
                }
            });
        } catch (const TaxonomyPipelineError& ex) {
            if (logger_) {
                logger_->warn("Skipping merge into '{}': {}", suggestion.target_name, ex.what());
            }
        } catch (const std::exception& ex) {
            if (logger_) {
                logger_->error("Merge into '{}' failed: {}", suggestion.target_name, ex.what());
            }
        }
    }
}

void TaxonomyBuilder::infer_sub_structure(SharedTaxonomy& taxonomy, ILLMClient& llm, NodeId merged_node)
{
    const auto direct_files = taxonomy.read([&](const TaxonomyTree& tree) {
        const auto* node = tree.node(merged_node);
        return node ? node->files : std::vector<FileAssignment>();
    });
    if (direct_files.size() <= config_.sub_structure_threshold) {
        return;
    }

    std::vector<std::string> filenames;
    for (const auto& file : direct_files) {
        if (filenames.size() >= kStructureSampleSize) {
            break;
        }
        filenames.push_back(file.filename);
    }

    LLMOptions options = LLMOptions::defaults(config_.refinement_model);
    options.temperature = 0.3;
    options.max_tokens = 500;

    std::optional<std::vector<SubcategoryProposal>> proposals;
    try {
        proposals = parse_sub_structure(llm.complete_json(build_structure_prompt(filenames), options));
    } catch (const std::exception& ex) {
        if (logger_) {
            logger_->warn("Sub-structure request failed: {}", ex.what());
        }
        return;
    }
    if (!proposals) {
        if (logger_) {
            logger_->info("Unusable sub-structure reply; keeping files flat");
        }
        return;
    }

    const std::size_t created = taxonomy.write([&](TaxonomyTree& tree) {
        const auto* node = tree.node(merged_node);
        if (!node || node->is_user_edited()) {
            return std::size_t{0};
        }
        std::vector<FileAssignment> remaining = node->files;
        std::size_t subcategories = 0;
        for (const auto& proposal : *proposals) {
            const std::string name = Utils::sanitize_path_label(proposal.name);
            if (name.empty()) {
                continue;
            }
            NodeId child = kInvalidNodeId;
            for (const auto& wanted : proposal.files) {
                const std::string lowered = Utils::to_lower_copy(Utils::trim_copy(wanted));
                auto match = std::find_if(remaining.begin(), remaining.end(), [&](const FileAssignment& file) {
                    return Utils::to_lower_copy(file.filename) == lowered;
                });
                if (match == remaining.end()) {
                    continue;
                }
                if (child == kInvalidNodeId) {
                    child = add_category(tree, merged_node, name);
                    ++subcategories;
                }
                tree.move_file(match->file_id, child);
                remaining.erase(match);
            }
        }
        return subcategories;
    });

    const std::size_t total = taxonomy.read([](const TaxonomyTree& tree) { return tree.category_count(); });
    publish(RefinementPhase::InferringStructure, total, created, std::string());
    if (logger_) {
        logger_->info("Inferred {} subcategories for merged category {}", created, merged_node);
    }
}

bool TaxonomyBuilder::pause_between_requests(const CancellationToken& cancellation) const
{
    const auto until = std::chrono::steady_clock::now() + config_.refinement_delay;
    while (std::chrono::steady_clock::now() < until) {
        if (cancellation.is_cancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return !cancellation.is_cancelled();
}

void TaxonomyBuilder::publish(RefinementPhase phase, std::size_t total, std::size_t refined, const std::string& current)
{
    RefinementProgress progress;
    progress.phase = phase;
    progress.total_categories = total;
    progress.refined_categories = std::min(refined, total);
    progress.current_category = current;
    progress_.push(std::move(progress));
}

std::string TaxonomyBuilder::build_naming_prompt(const std::string& current_name,
                                                 const std::vector<std::string>& filenames)
{
    std::ostringstream prompt;
    prompt << "Suggest a SHORT, descriptive folder name (2-4 words max) for files like these:\n";
    for (const auto& name : filenames) {
        prompt << name << '\n';
    }
    prompt << "\nCurrent name: " << current_name << "\n\n"
           << "Return ONLY the suggested name, nothing else. Be concise.";
    return prompt.str();
}

std::string TaxonomyBuilder::build_merge_prompt(const std::vector<std::string>& candidate_lines)
{
    std::ostringstream prompt;
    prompt << "Analyze these small categories and suggest which should be merged together.\n"
           << "Categories:\n";
    for (const auto& line : candidate_lines) {
        prompt << line << '\n';
    }
    prompt << "\nRules:\n"
           << "1. Only merge categories that are semantically related\n"
           << "2. Suggest a good name for the merged category\n"
           << "3. Return ONLY in this exact format, one per line:\n"
           << "   SOURCE1 + SOURCE2 -> MERGED_NAME\n"
           << "4. Maximum " << kMaxMergeSuggestions << " suggestions\n"
           << "5. If categories shouldn't be merged, return \"" << kNoMergesSentinel << "\"\n\n"
           << "Examples:\n"
           << "Card Tricks + Card Magic -> Card Magic\n"
           << "Cooking + Recipes -> Cooking & Recipes";
    return prompt.str();
}

std::string TaxonomyBuilder::build_structure_prompt(const std::vector<std::string>& filenames)
{
    std::ostringstream prompt;
    prompt << "Group these files into 2-4 logical subcategories:\n";
    for (const auto& name : filenames) {
        prompt << name << '\n';
    }
    prompt << "\nReturn ONLY in this JSON format:\n"
           << "{\n"
           << "  \"subcategories\": [\n"
           << "    {\"name\": \"SubcategoryName\", \"files\": [\"file1.pdf\", \"file2.mp4\"]}\n"
           << "  ]\n"
           << "}";
    return prompt.str();
}

std::string TaxonomyBuilder::clean_category_name(const std::string& response)
{
    return Utils::sanitize_path_label(LLMResponseParser::clean_single_line(response));
}

std::vector<MergeGrouping> TaxonomyBuilder::parse_merge_suggestions(const std::string& response)
{
    std::vector<MergeGrouping> groupings;
    std::istringstream stream(LLMResponseParser::strip_markdown_fences(response));
    std::string line;
    while (std::getline(stream, line) && groupings.size() < kMaxMergeSuggestions) {
        line = Utils::trim_copy(line);
        if (line.empty() || line == kNoMergesSentinel) {
            continue;
        }
        if (line.rfind("- ", 0) == 0 || line.rfind("* ", 0) == 0) {
            line = Utils::trim_copy(line.substr(2));
        }

        std::string merged_name;
        const std::string left = split_arrow(line, merged_name);
        if (left.empty() || merged_name.empty()) {
            continue;
        }

        MergeGrouping grouping;
        grouping.merged_name = merged_name;
        std::istringstream sources(left);
        std::string source;
        while (std::getline(sources, source, '+')) {
            source = Utils::trim_copy(source);
            if (!source.empty()) {
                grouping.sources.push_back(source);
            }
        }
        if (grouping.sources.size() >= 2) {
            groupings.push_back(std::move(grouping));
        }
    }
    return groupings;
}

std::optional<std::vector<SubcategoryProposal>> TaxonomyBuilder::parse_sub_structure(const std::string& response)
{
    const JsonParseResult parsed = LLMResponseParser::parse_json_object(response);
    if (!parsed.ok()) {
        return std::nullopt;
    }
    const Json::Value& subcategories = (*parsed.value)["subcategories"];
    if (!subcategories.isArray()) {
        return std::nullopt;
    }

    std::vector<SubcategoryProposal> proposals;
    for (const auto& entry : subcategories) {
        if (!entry.isObject() || !entry["name"].isString() || !entry["files"].isArray()) {
            continue;
        }
        SubcategoryProposal proposal;
        proposal.name = Utils::trim_copy(entry["name"].asString());
        for (const auto& file : entry["files"]) {
            if (file.isString()) {
                proposal.files.push_back(file.asString());
            }
        }
        if (!proposal.name.empty()) {
            proposals.push_back(std::move(proposal));
        }
    }
    return proposals;
}
