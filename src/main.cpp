#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "MappingLedger.hpp"
#include "PostProcessHooks.hpp"
#include "RelocationPipeline.hpp"
#include "RollbackManager.hpp"
#include "TransferOrchestrator.hpp"

namespace {
constexpr std::size_t kShownFailures = 5;

CancellationToken g_cancellation;

void handleInterrupt(int) {
    g_cancellation.cancel();
}

struct CommandLine {
    std::string configRoot = ".";
    std::vector<std::string> sources;
    std::string target;
    bool dryRun = false;
    std::string operation;
    bool rollback = false;
    std::string rollbackFile;
    bool deleteSources = false;
    bool showHelp = false;
};

void printUsage() {
    std::cout << "Usage: DatasetRelocator [options]\n"
              << "  --config <dir>          Directory containing config/relocator.json (default: .)\n"
              << "  --sources <dir>...      One or more source root directories\n"
              << "  --target <dir>          Target directory\n"
              << "  --dry-run               Preview names without touching any file\n"
              << "  --operation copy|move   Transfer mode\n"
              << "  --delete-sources        After a copy, delete sources whose copy exists\n"
              << "  --rollback [mapping]    Undo a run (default: newest ledger in <target>/logs)\n"
              << "  -h, --help              Show this help" << std::endl;
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cli.showHelp = true;
        } else if (arg == "--config" && i + 1 < argc) {
            cli.configRoot = argv[++i];
        } else if (arg == "--sources") {
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                cli.sources.emplace_back(argv[++i]);
            }
            if (cli.sources.empty()) {
                std::cerr << "Error: --sources requires at least one directory" << std::endl;
                return false;
            }
        } else if (arg == "--target" && i + 1 < argc) {
            cli.target = argv[++i];
        } else if (arg == "--dry-run") {
            cli.dryRun = true;
        } else if (arg == "--operation" && i + 1 < argc) {
            cli.operation = argv[++i];
        } else if (arg == "--delete-sources") {
            cli.deleteSources = true;
        } else if (arg == "--rollback") {
            cli.rollback = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                cli.rollbackFile = argv[++i];
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

int runRollback(const CommandLine& cli, const RelocatorConfig& config) {
    RollbackManager manager = cli.rollbackFile.empty()
        ? RollbackManager::forLatestSnapshot(MappingLedger::logsDirFor(config.targetDir))
        : RollbackManager(cli.rollbackFile);

    if (!manager.canRollback()) {
        std::cerr << "No mapping file available for rollback." << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Rolling back `" << manager.mappingFile().string() << "`..." << std::endl;
    const RollbackResult result = manager.rollbackOperations();
    if (!result.success) {
        std::cerr << "Rollback failed: " << result.error << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Rollback finished: " << result.successCount << " reversed, " << result.failedCount << " failed." << std::endl;
    for (const auto& error : result.errors) {
        std::cerr << "  " << error << std::endl;
    }
    return result.failedCount == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

void printSummary(const RelocationResult& result) {
    std::cout << std::endl << "Done." << std::endl;
    std::cout << "Succeeded: " << result.successCount << " file(s)" << std::endl;
    std::cout << "Failed: " << result.failedCount << " file(s)" << std::endl;
    if (result.skippedCount > 0) {
        std::cout << "Already processed: " << result.skippedCount << " file(s)" << std::endl;
    }
    std::cout << "Total size: " << std::fixed << std::setprecision(2)
              << static_cast<double>(result.totalBytes) / (1024.0 * 1024.0) << " MB" << std::endl;

    if (result.cancelled) {
        std::cout << "Interrupted: " << result.notAttempted << " file(s) not attempted." << std::endl;
    }

    if (!result.failed.empty()) {
        std::cout << std::endl << "Failed files:" << std::endl;
        for (std::size_t i = 0; i < result.failed.size() && i < kShownFailures; ++i) {
            std::cout << "  " << result.failed[i].record.filename << ": " << result.failed[i].error << std::endl;
        }
        if (result.failed.size() > kShownFailures) {
            std::cout << "  ... and " << (result.failed.size() - kShownFailures) << " more" << std::endl;
        }
    }

    if (!result.mappingFile.empty()) {
        std::cout << "Mapping ledger: " << result.mappingFile.string() << std::endl;
    }
}
} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli)) {
        printUsage();
        return EXIT_FAILURE;
    }
    if (cli.showHelp) {
        printUsage();
        return EXIT_SUCCESS;
    }

    ConfigParser parser;
    if (!parser.load(cli.configRoot)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    RelocatorConfig& config = parser.mutableConfig();
    if (!cli.sources.empty()) {
        config.sourceDirs = cli.sources;
    }
    if (!cli.target.empty()) {
        config.targetDir = cli.target;
    }
    if (cli.dryRun) {
        config.dryRun = true;
    }
    if (!cli.operation.empty() && !parseOperationKind(cli.operation, config.operation)) {
        std::cerr << "Error: --operation must be copy or move" << std::endl;
        return EXIT_FAILURE;
    }

    if (cli.rollback) {
        if (cli.rollbackFile.empty() && config.targetDir.empty()) {
            std::cerr << "Rollback needs a mapping file or a target directory." << std::endl;
            return EXIT_FAILURE;
        }
        return runRollback(cli, config);
    }

    if (config.sourceDirs.empty() || config.targetDir.empty()) {
        std::cerr << "Source directories and a target directory are required." << std::endl;
        printUsage();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handleInterrupt);

    try {
        RelocationPipeline pipeline(config);
        const RelocationResult result = pipeline.run(config.sourceDirs, config.targetDir, &g_cancellation);
        printSummary(result);

        if (cli.deleteSources && !config.dryRun && !result.cancelled) {
            deleteCopiedSources(result.processed, config.operation);
        }

        return result.failedCount == 0 && !result.cancelled ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
