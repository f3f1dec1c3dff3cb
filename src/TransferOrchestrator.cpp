#include "TransferOrchestrator.hpp"

#include "WorkerPool.hpp"

#include <future>
#include <iostream>
#include <system_error>

namespace {
constexpr std::size_t kPreviewLimit = 10;
}

TransferOrchestrator::TransferOrchestrator(TransferOptions options, std::filesystem::path targetDir)
    : m_options(options), m_targetDir(std::move(targetDir)), m_mover(options.verifyAlgorithm) {}

TransferSummary TransferOrchestrator::execute(std::vector<FileRecord> records, MappingLedger* ledger,
                                              const CancellationToken* cancellation) {
    if (m_options.dryRun) {
        return previewDryRun(std::move(records));
    }

    TransferSummary summary;

    std::error_code mkdirErr;
    std::filesystem::create_directories(m_targetDir, mkdirErr);
    if (mkdirErr) {
        std::cerr << "Failed to create target directory `" << m_targetDir.string() << "`: " << mkdirErr.message() << std::endl;
        const std::string error = "target directory unavailable: " + mkdirErr.message();
        for (auto& record : records) {
            record.operation = m_options.operation;
            collect(TransferFailure{std::move(record), error, nowEpochSeconds()}, summary, ledger);
        }
        return summary;
    }

    std::cout << (m_options.operation == OperationKind::Move ? "Moving " : "Copying ") << records.size()
              << " file(s) with " << m_options.workers << " worker(s)..." << std::endl;

    {
        WorkerPool pool(static_cast<std::size_t>(m_options.workers));
        std::vector<std::future<void>> pending;
        pending.reserve(records.size());

        for (std::size_t i = 0; i < records.size(); ++i) {
            if (cancellation && cancellation->cancelled()) {
                std::lock_guard<std::mutex> lock(m_resultMutex);
                summary.notAttempted += records.size() - i;
                break;
            }

            pending.push_back(pool.enqueue([this, record = std::move(records[i]), &summary, ledger, cancellation]() mutable {
                if (cancellation && cancellation->cancelled()) {
                    std::lock_guard<std::mutex> lock(m_resultMutex);
                    ++summary.notAttempted;
                    return;
                }
                collect(transferOne(std::move(record)), summary, ledger);
            }));
        }

        for (auto& task : pending) {
            task.get();
        }
    }

    summary.cancelled = cancellation && cancellation->cancelled();
    if (summary.cancelled) {
        std::cerr << "Transfer interrupted: " << summary.notAttempted << " file(s) were not attempted." << std::endl;
    }
    return summary;
}

TransferOutcome TransferOrchestrator::transferOne(FileRecord record) const {
    const std::filesystem::path sourcePath(record.fullPath);
    const std::filesystem::path targetPath = m_targetDir / record.newName;
    record.operation = m_options.operation;

    std::string error;
    bool ok = false;
    try {
        ok = m_options.operation == OperationKind::Move
            ? m_mover.moveFile(sourcePath, targetPath, error)
            : m_mover.copyFile(sourcePath, targetPath, error);
    } catch (const std::exception& e) {
        ok = false;
        error = e.what();
    }

    if (!ok) {
        return TransferFailure{std::move(record), error, nowEpochSeconds()};
    }

    record.targetPath = targetPath.string();
    record.completedAt = nowEpochSeconds();
    return TransferSuccess{std::move(record)};
}

void TransferOrchestrator::collect(TransferOutcome outcome, TransferSummary& summary, MappingLedger* ledger) {
    std::lock_guard<std::mutex> lock(m_resultMutex);

    if (auto* success = std::get_if<TransferSuccess>(&outcome)) {
        FileRecord& record = success->record;
        std::cout << (record.operation == OperationKind::Move ? "Moved `" : "Copied `") << record.fullPath
                  << "` -> `" << record.targetPath << "`" << std::endl;
        if (ledger) {
            ledger->recordOutcome(record, true);
        }
        ++summary.successCount;
        summary.totalBytes += record.sizeBytes;
        summary.processed.push_back(std::move(record));
        return;
    }

    auto& failure = std::get<TransferFailure>(outcome);
    std::cerr << "Failed to " << toString(failure.record.operation) << " `" << failure.record.fullPath << "`: "
              << failure.error << std::endl;
    if (ledger) {
        failure.record.completedAt = failure.timestamp;
        ledger->recordOutcome(failure.record, false, failure.error);
    }
    ++summary.failedCount;
    summary.failed.push_back(std::move(failure));
}

TransferSummary TransferOrchestrator::previewDryRun(std::vector<FileRecord> records) const {
    std::cout << "=== Dry run preview ===" << std::endl;
    std::cout << "Target directory: " << m_targetDir.string() << std::endl;
    std::cout << "Operation: " << toString(m_options.operation) << std::endl;
    std::cout << "Files: " << records.size() << std::endl;

    TransferSummary summary;
    const double now = nowEpochSeconds();
    for (std::size_t i = 0; i < records.size(); ++i) {
        FileRecord& record = records[i];
        if (i < kPreviewLimit) {
            std::cout << "  " << (i + 1) << ". " << record.filename << " -> " << record.newName << std::endl;
        }
        record.operation = m_options.operation;
        record.targetPath = (m_targetDir / record.newName).string();
        record.completedAt = now;
        summary.totalBytes += record.sizeBytes;
    }
    if (records.size() > kPreviewLimit) {
        std::cout << "  ... and " << (records.size() - kPreviewLimit) << " more" << std::endl;
    }

    summary.successCount = records.size();
    summary.processed = std::move(records);
    return summary;
}
