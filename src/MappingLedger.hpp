#ifndef MAPPING_LEDGER_HPP
#define MAPPING_LEDGER_HPP

#include "FileRecord.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

// One transfer attempt as persisted in a ledger snapshot.
struct MappingEntry {
    std::string operationId;
    std::string sourcePath;
    std::string targetPath;
    OperationKind operation = OperationKind::Copy;
    double timestamp = 0.0;
    bool success = false;
    std::string error;
    std::uintmax_t fileSize = 0;
    std::string newName;
};

// Snapshot contents keyed by operation id.
using LedgerSnapshot = std::map<std::string, MappingEntry>;

// The operation id is the JSON key and is not repeated inside the value.
void to_json(nlohmann::json& j, const MappingEntry& entry);
void from_json(const nlohmann::json& j, MappingEntry& entry);

// Collects the outcome of every transfer attempt of one run and writes it as
// <target>/logs/mapping_<YYYYmmdd_HHMMSS>.json. Entries are never changed once saved.
class MappingLedger {
public:
    explicit MappingLedger(std::filesystem::path logsDir);

    // Record a finished attempt; safe to call from several workers.
    void recordOutcome(const FileRecord& record, bool success, const std::string& error = {});
    // Copy an entry from the previous snapshot for a record this run skipped.
    void carryForward(const MappingEntry& entry);
    // Write the snapshot (creating the logs directory); returns false on I/O errors.
    bool save();

    // Path of the written snapshot; empty until save() succeeds.
    const std::filesystem::path& snapshotPath() const;
    LedgerSnapshot entries() const;

    static std::filesystem::path logsDirFor(const std::filesystem::path& targetDir);
    // Newest mapping_*.json by modification time (ties broken by file name).
    static std::optional<std::filesystem::path> findLatestSnapshot(const std::filesystem::path& logsDir);
    // Parse a snapshot file; logs and returns nullopt when it is missing or corrupt.
    static std::optional<LedgerSnapshot> loadSnapshot(const std::filesystem::path& snapshotFile);

private:
    std::filesystem::path uniqueSnapshotPath() const;

    std::filesystem::path m_logsDir;
    std::filesystem::path m_snapshotPath;
    mutable std::mutex m_mutex;
    LedgerSnapshot m_entries;
};

#endif
