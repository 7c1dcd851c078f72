#include "DeepAnalysisTaskManager.hpp"
#include "DeepAnalyzer.hpp"
#include "DepthEnforcer.hpp"
#include "FilenameScanner.hpp"
#include "Logger.hpp"
#include "OllamaLLMClient.hpp"
#include "Settings.hpp"
#include "SharedTaxonomy.hpp"
#include "TaxonomyBuilder.hpp"
#include "TaxonomyErrors.hpp"
#include "TaxonomyRepository.hpp"
#include "TextContentInspector.hpp"
#include "Utils.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct CommandLine {
    std::string folder;
    std::string root_name;
    bool refine{false};
    bool deep{false};
    std::optional<int> max_depth;
    bool flatten{false};
    std::string export_file;
    bool save{false};
};

void print_node(const TaxonomyTree& tree, NodeId id, int indent)
{
    const TaxonomyNode* node = tree.node(id);
    if (!node) {
        return;
    }
    std::cout << fmt::format("{:{}}{} ({} files", "", indent * 2, node->name, tree.total_file_count(id));
    if (node->suggested_name && *node->suggested_name != node->name) {
        std::cout << fmt::format(", suggested: {}", *node->suggested_name);
    }
    std::cout << ")\n";
    for (const NodeId child : node->children) {
        print_node(tree, child, indent + 1);
    }
}

void print_statistics(const TaxonomyStatistics& stats)
{
    std::cout << fmt::format("\nCategories: {} ({} inferred, {} user created)\n",
                             stats.category_count, stats.inferred_categories, stats.user_created_categories);
    std::cout << fmt::format("Files: {} ({} uncategorized, {} need deep analysis)\n",
                             stats.total_files, stats.uncategorized_files, stats.files_needing_deep_analysis);
    std::cout << fmt::format("Max depth: {}, average confidence: {:.2f}\n", stats.max_depth, stats.average_confidence);
}

void run_refinement(TaxonomyBuilder& builder,
                    const std::shared_ptr<SharedTaxonomy>& taxonomy,
                    const std::shared_ptr<ILLMClient>& llm,
                    const std::shared_ptr<spdlog::logger>& logger)
{
    if (!builder.start_refinement(taxonomy, llm)) {
        return;
    }
    while (!builder.wait_for_refinement(std::chrono::milliseconds(250))) {
        for (const auto& progress : builder.progress().drain()) {
            if (logger) {
                logger->info("Refinement {}: {:.0f}% {}", to_string(progress.phase),
                             progress.percentage(), progress.current_category);
            }
        }
    }
    for (const auto& progress : builder.progress().drain()) {
        if (logger) {
            logger->info("Refinement {}", to_string(progress.phase));
        }
    }
}

void run_deep_analysis(const Settings& settings,
                       const std::shared_ptr<SharedTaxonomy>& taxonomy,
                       const std::shared_ptr<ILLMClient>& llm,
                       TaxonomyRepository* repository,
                       const std::shared_ptr<spdlog::logger>& logger)
{
    const auto analyzer_config = settings.make_analyzer_config();
    auto analyzer = std::make_shared<DeepAnalyzer>(analyzer_config, llm,
                                                   std::make_shared<TextContentInspector>(logger),
                                                   Logger::get_logger("llm_logger"));
    DeepAnalysisTaskManager manager(settings.make_task_manager_config(), analyzer, taxonomy, logger);

    const auto enqueued = manager.enqueue_low_confidence_files(*taxonomy, analyzer_config.confidence_threshold);
    if (enqueued == 0) {
        std::cout << "No files need deep analysis\n";
        return;
    }

    manager.start();
    while (!manager.wait_until_finished(std::chrono::milliseconds(500))) {
        const auto status = manager.status();
        std::cout << fmt::format("\rDeep analysis: {}/{} done, {} running", status.completed + status.failed,
                                 status.total, status.running)
                  << std::flush;
    }
    std::cout << "\n";

    std::size_t moved = 0;
    for (const auto& event : manager.events().drain()) {
        if (event.kind == TaskEventKind::FileRecategorized && logger) {
            logger->info("Moved {}: {} -> {}", event.file_id, Utils::join(event.old_path, "/"),
                         Utils::join(event.new_path, "/"));
        }
    }
    std::size_t unrecorded = 0;
    for (const auto& task : manager.completed_tasks()) {
        if (task.recategorized) {
            ++moved;
        }
        if (repository && !repository->record_task(task)) {
            ++unrecorded;
        }
    }
    if (unrecorded > 0 && logger) {
        logger->warn("{} analysis result(s) could not be written to the ledger", unrecorded);
    }
    std::cout << fmt::format("Deep analysis finished: {} file(s) recategorized\n", moved);
}

bool export_tree(const TaxonomyTree& tree, const std::string& path)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    out << Json::writeString(writer, tree.to_json()) << "\n";
    return static_cast<bool>(out);
}

int run(const CommandLine& options)
{
    auto core_logger = Logger::get_logger("core_logger");

    Settings settings;
    if (!settings.load() && !settings.save()) {
        std::cerr << "Could not write default settings to " << settings.get_config_path() << "\n";
    }
    if (options.max_depth) {
        settings.set_max_depth(*options.max_depth);
    }
    if (options.flatten) {
        settings.set_depth_mode(DepthEnforcementMode::Flatten);
    }

    FilenameScanner scanner(ScanOptions(), core_logger);
    const auto scan = scanner.scan_with_hierarchy(options.folder);
    const auto files = scan.all_files();
    if (files.empty()) {
        std::cerr << "No files found in " << scan.folder_path << "\n";
        return 1;
    }

    TaxonomyBuilder builder(settings.make_builder_config(), nullptr, core_logger);
    TaxonomyTree tree = builder.build_instant(files, options.root_name.empty() ? scan.folder_name : options.root_name);
    tree.set_source_folder_name(scan.folder_name);
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    std::unique_ptr<TaxonomyRepository> repository;
    if (options.save || options.deep) {
        repository = std::make_unique<TaxonomyRepository>(settings.get_config_dir());
        if (!repository->is_open()) {
            std::cerr << "Database unavailable at " << repository->database_path() << "\n";
            repository.reset();
        }
    }

    if (options.refine || options.deep) {
        auto llm = std::make_shared<OllamaLLMClient>(settings.make_ollama_config());
        if (!llm->is_available()) {
            std::cerr << "Ollama is not reachable at " << settings.get_ollama_host() << "\n";
        } else {
            if (options.refine) {
                run_refinement(builder, taxonomy, llm, core_logger);
                if (repository && !repository->save_suggestions(builder.gatekeeper().all_merges(),
                                                                builder.gatekeeper().all_splits())) {
                    std::cerr << "Failed to store merge suggestions\n";
                }
            }
            if (options.deep) {
                run_deep_analysis(settings, taxonomy, llm, repository.get(), core_logger);
            }
        }
    }

    const DepthEnforcer enforcer(settings.make_depth_config(), core_logger);
    enforcer.enforce(*taxonomy);

    const TaxonomyTree result = taxonomy->snapshot();
    print_node(result, result.root_id(), 0);
    print_statistics(result.statistics());

    if (!options.export_file.empty()) {
        if (!export_tree(result, options.export_file)) {
            std::cerr << "Failed to write " << options.export_file << "\n";
            return 1;
        }
        std::cout << "Exported taxonomy to " << options.export_file << "\n";
    }
    if (options.save && repository) {
        const auto id = repository->save_snapshot(result);
        if (!id) {
            std::cerr << "Failed to save snapshot to " << repository->database_path() << "\n";
            return 1;
        }
        if (!repository->record_audit("snapshot", result.source_folder_name(), fmt::format("snapshot {}", *id))) {
            std::cerr << "Failed to record snapshot in the audit log\n";
        }
        std::cout << "Saved snapshot " << *id << " to " << repository->database_path() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Infer a category taxonomy for a folder of files"};
    CommandLine options;
    int max_depth = 0;

    app.add_option("folder", options.folder, "Folder to scan")->required();
    app.add_option("--root-name", options.root_name, "Name of the root category");
    app.add_flag("--refine", options.refine, "Refine category names and merge small categories with Ollama");
    app.add_flag("--deep", options.deep, "Run content analysis on low-confidence files");
    auto* depth_option = app.add_option("--max-depth", max_depth, "Maximum category depth")
                             ->check(CLI::Range(1, 32));
    app.add_flag("--flatten", options.flatten, "Fold categories deeper than the maximum into their parents");
    app.add_option("--export", options.export_file, "Write the taxonomy as JSON");
    app.add_flag("--save", options.save, "Store a snapshot in the local database");

    CLI11_PARSE(app, argc, argv);
    if (depth_option->count() > 0) {
        options.max_depth = max_depth;
    }

    Logger::setup_loggers();
    int exit_code = 1;
    try {
        exit_code = run(options);
    } catch (const ScanError& ex) {
        std::cerr << ex.what() << "\n";
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Unhandled error: {}", ex.what());
        }
        std::cerr << "Error: " << ex.what() << "\n";
    }
    Logger::shutdown();
    return exit_code;
}
