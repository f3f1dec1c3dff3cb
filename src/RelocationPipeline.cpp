#include "RelocationPipeline.hpp"

#include "ConflictResolver.hpp"
#include "FileScanner.hpp"
#include "MappingLedger.hpp"
#include "ResumeFilter.hpp"

#include <iostream>
#include <system_error>

namespace {

// Names of everything already in the target directory; an unreadable or missing directory yields none.
std::vector<std::string> existingTargetNames(const std::filesystem::path& targetDir) {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(targetDir, ec);
    if (ec) {
        return names;
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) {
            std::cerr << "Warning: unable to list `" << targetDir.string() << "`: " << ec.message() << std::endl;
            break;
        }
    }
    return names;
}

} // namespace

RelocationPipeline::RelocationPipeline(RelocatorConfig config)
    : m_config(std::move(config)),
      m_naming(m_config.naming),
      m_thumbnailRefresher(ThumbnailRefresher::create(m_config.thumbnailRefresh)) {
    if (m_config.workers < 1) {
        throw ConfigurationError("workers must be at least 1");
    }
    if (m_config.hashDedup != HashDedupMode::Off) {
        std::cerr << "Warning: `hash_dedup` is accepted but not applied; all files are transferred." << std::endl;
    }
}

void RelocationPipeline::setThumbnailRefresher(std::unique_ptr<ThumbnailRefresher> refresher) {
    m_thumbnailRefresher = refresher ? std::move(refresher) : std::make_unique<NoThumbnailRefresh>();
}

RelocationResult RelocationPipeline::run(const std::vector<std::string>& sourceDirs, const std::filesystem::path& targetDir,
                                         const CancellationToken* cancellation) {
    std::cout << "Scanning " << sourceDirs.size() << " source director" << (sourceDirs.size() == 1 ? "y" : "ies") << "..." << std::endl;
    FileScanner scanner(m_config);
    std::vector<FileRecord> records = scanner.scanDirectories(sourceDirs);
    std::cout << "Found " << records.size() << " file(s)." << std::endl;
    return process(std::move(records), targetDir, cancellation);
}

std::vector<FileRecord> RelocationPipeline::planNames(std::vector<FileRecord> records) const {
    std::vector<FileRecord> named = m_naming.generateNames(std::move(records));
    ConflictResolver::resolve(named);
    return named;
}

RelocationResult RelocationPipeline::process(std::vector<FileRecord> records, const std::filesystem::path& targetDir,
                                             const CancellationToken* cancellation) {
    RelocationResult result;
    result.scannedCount = records.size();

    std::vector<FileRecord> named = planNames(std::move(records));

    const std::filesystem::path logsDir = MappingLedger::logsDirFor(targetDir);
    ResumePartition partition = ResumeFilter::fromLatestSnapshot(logsDir).apply(std::move(named));
    result.skippedCount = partition.skipped.size();

    // Skipped records keep the targets they already own; the rest must not land on anything in the directory.
    ConflictResolver::resolve(partition.retained, existingTargetNames(targetDir));

    TransferOptions options;
    options.operation = m_config.operation;
    options.dryRun = m_config.dryRun;
    options.workers = m_config.workers;
    options.verifyAlgorithm = m_config.hashAlgorithm;
    TransferOrchestrator orchestrator(options, targetDir);

    TransferSummary summary;
    if (m_config.dryRun) {
        summary = orchestrator.execute(std::move(partition.retained));
    } else {
        MappingLedger ledger(logsDir);
        for (const auto& entry : partition.skipped) {
            ledger.carryForward(entry);
        }

        summary = orchestrator.execute(std::move(partition.retained), &ledger, cancellation);

        if (ledger.save()) {
            result.mappingFile = ledger.snapshotPath();
        } else {
            std::cerr << "Warning: the mapping ledger for this run could not be saved; resume and rollback will not see it." << std::endl;
        }
    }

    result.successCount = summary.successCount;
    result.failedCount = summary.failedCount;
    result.totalBytes = summary.totalBytes;
    result.processed = std::move(summary.processed);
    result.failed = std::move(summary.failed);
    result.cancelled = summary.cancelled;
    result.notAttempted = summary.notAttempted;

    if (!m_config.dryRun && !result.processed.empty()) {
        runHooks(targetDir, result.processed);
    }

    return result;
}

void RelocationPipeline::runHooks(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) {
    bool refreshed = false;
    try {
        refreshed = m_thumbnailRefresher->refresh(targetDir, processed);
    } catch (const std::exception& e) {
        std::cerr << "Warning: thumbnail refresh (" << m_thumbnailRefresher->name() << ") failed: " << e.what() << std::endl;
    }

    if (!refreshed) {
        showManualRefreshTips(targetDir);
    }
}
