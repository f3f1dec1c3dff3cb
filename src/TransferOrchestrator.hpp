#ifndef TRANSFER_ORCHESTRATOR_HPP
#define TRANSFER_ORCHESTRATOR_HPP

#include "ContentHasher.hpp"
#include "FileMover.hpp"
#include "FileRecord.hpp"
#include "MappingLedger.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

// Set from a signal handler or another thread; checked before each transfer starts.
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool cancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

struct TransferSuccess {
    FileRecord record;
};

struct TransferFailure {
    FileRecord record;
    std::string error;
    double timestamp = 0.0;
};

using TransferOutcome = std::variant<TransferSuccess, TransferFailure>;

struct TransferSummary {
    std::size_t successCount = 0;
    std::size_t failedCount = 0;
    std::uintmax_t totalBytes = 0;
    // Both lists are in completion order.
    std::vector<FileRecord> processed;
    std::vector<TransferFailure> failed;
    bool cancelled = false;
    // Records never started because of cancellation.
    std::size_t notAttempted = 0;
};

struct TransferOptions {
    OperationKind operation = OperationKind::Copy;
    bool dryRun = false;
    int workers = 8;
    HashAlgorithm verifyAlgorithm = HashAlgorithm::Md5;
};

// Runs copy/move for every record on a bounded worker pool. A failing file is
// reported in `failed` and never stops the batch.
class TransferOrchestrator {
public:
    TransferOrchestrator(TransferOptions options, std::filesystem::path targetDir);

    // Transfer all records; every attempt is also recorded in `ledger` when given.
    TransferSummary execute(std::vector<FileRecord> records, MappingLedger* ledger = nullptr,
                            const CancellationToken* cancellation = nullptr);

    // One attempt; never throws.
    TransferOutcome transferOne(FileRecord record) const;

private:
    TransferSummary previewDryRun(std::vector<FileRecord> records) const;
    void collect(TransferOutcome outcome, TransferSummary& summary, MappingLedger* ledger);

    TransferOptions m_options;
    std::filesystem::path m_targetDir;
    FileMover m_mover;
    std::mutex m_resultMutex;
};

#endif
