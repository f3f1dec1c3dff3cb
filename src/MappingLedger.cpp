#include "MappingLedger.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr char kSnapshotPrefix[] = "mapping_";
constexpr char kSnapshotExtension[] = ".json";

std::string currentTimestampTag() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y%m%d_%H%M%S");
    return out.str();
}

bool isSnapshotName(const std::string& name) {
    const std::string prefix = kSnapshotPrefix;
    const std::string extension = kSnapshotExtension;
    return name.size() > prefix.size() + extension.size() &&
        name.compare(0, prefix.size(), prefix) == 0 &&
        name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}
}

void to_json(json& j, const MappingEntry& entry) {
    j = json{
        {"source_path", entry.sourcePath},
        {"target_path", entry.targetPath},
        {"operation", toString(entry.operation)},
        {"timestamp", entry.timestamp},
        {"success", entry.success},
        {"error", entry.error},
        {"file_size", entry.fileSize},
        {"new_name", entry.newName}};
}

void from_json(const json& j, MappingEntry& entry) {
    j.at("source_path").get_to(entry.sourcePath);
    j.at("target_path").get_to(entry.targetPath);
    j.at("success").get_to(entry.success);

    const std::string operation = j.at("operation").get<std::string>();
    if (!parseOperationKind(operation, entry.operation)) {
        throw std::invalid_argument("unknown operation `" + operation + "`");
    }

    entry.timestamp = j.value("timestamp", 0.0);
    entry.error = j.value("error", std::string{});
    entry.fileSize = j.value("file_size", std::uintmax_t{0});
    entry.newName = j.value("new_name", std::string{});
}

MappingLedger::MappingLedger(std::filesystem::path logsDir)
    : m_logsDir(std::move(logsDir)) {}

void MappingLedger::recordOutcome(const FileRecord& record, bool success, const std::string& error) {
    MappingEntry entry;
    entry.operationId = operationIdFor(record);
    entry.sourcePath = record.fullPath;
    entry.targetPath = record.targetPath;
    entry.operation = record.operation;
    entry.timestamp = record.completedAt > 0.0 ? record.completedAt : nowEpochSeconds();
    entry.success = success;
    entry.error = error;
    entry.fileSize = record.sizeBytes;
    entry.newName = record.newName;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[entry.operationId] = std::move(entry);
}

void MappingLedger::carryForward(const MappingEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // An attempt made during this run always wins over the carried entry.
    m_entries.emplace(entry.operationId, entry);
}

bool MappingLedger::save() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    std::filesystem::create_directories(m_logsDir, ec);
    if (ec) {
        std::cerr << "Failed to create log directory `" << m_logsDir.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    json data = json::object();
    for (const auto& [operationId, entry] : m_entries) {
        data[operationId] = entry;
    }

    const std::filesystem::path finalPath = uniqueSnapshotPath();
    std::filesystem::path tempPath = finalPath;
    tempPath += ".tmp";

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "Failed to open ledger file `" << tempPath.string() << "` for writing." << std::endl;
            return false;
        }
        out << data.dump(2);
        out.flush();
        if (!out) {
            std::cerr << "Failed to write ledger file `" << tempPath.string() << "`." << std::endl;
            return false;
        }
    }

    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "Failed to finalize ledger file `" << finalPath.string() << "`: " << ec.message() << std::endl;
        std::error_code removeErr;
        std::filesystem::remove(tempPath, removeErr);
        return false;
    }

    m_snapshotPath = finalPath;
    std::cout << "Mapping ledger saved to `" << m_snapshotPath.string() << "` (" << m_entries.size() << " entries)." << std::endl;
    return true;
}

const std::filesystem::path& MappingLedger::snapshotPath() const {
    return m_snapshotPath;
}

LedgerSnapshot MappingLedger::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

std::filesystem::path MappingLedger::logsDirFor(const std::filesystem::path& targetDir) {
    return targetDir / "logs";
}

std::filesystem::path MappingLedger::uniqueSnapshotPath() const {
    const std::string tag = currentTimestampTag();
    std::filesystem::path candidate = m_logsDir / (kSnapshotPrefix + tag + kSnapshotExtension);

    std::error_code ec;
    for (int attempt = 1; std::filesystem::exists(candidate, ec); ++attempt) {
        candidate = m_logsDir / (kSnapshotPrefix + tag + "_" + std::to_string(attempt) + kSnapshotExtension);
    }
    return candidate;
}

std::optional<std::filesystem::path> MappingLedger::findLatestSnapshot(const std::filesystem::path& logsDir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(logsDir, ec)) {
        return std::nullopt;
    }

    std::optional<std::filesystem::path> latest;
    std::filesystem::file_time_type latestTime{};

    std::filesystem::directory_iterator iter(logsDir, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << logsDir.string() << "`: " << ec.message() << std::endl;
        return std::nullopt;
    }

    for (const auto& entry : iter) {
        std::error_code entryErr;
        if (!entry.is_regular_file(entryErr) || entryErr) {
            continue;
        }

        const std::string name = entry.path().filename().string();
        if (!isSnapshotName(name)) {
            continue;
        }

        const auto modified = entry.last_write_time(entryErr);
        if (entryErr) {
            continue;
        }

        if (!latest || modified > latestTime ||
            (modified == latestTime && name > latest->filename().string())) {
            latest = entry.path();
            latestTime = modified;
        }
    }

    return latest;
}

std::optional<LedgerSnapshot> MappingLedger::loadSnapshot(const std::filesystem::path& snapshotFile) {
    std::ifstream in(snapshotFile);
    if (!in) {
        std::cerr << "Unable to open mapping file `" << snapshotFile.string() << "`." << std::endl;
        return std::nullopt;
    }

    LedgerSnapshot snapshot;
    try {
        json data;
        in >> data;
        if (!data.is_object()) {
            std::cerr << "Mapping file `" << snapshotFile.string() << "` is not a JSON object." << std::endl;
            return std::nullopt;
        }

        for (auto it = data.begin(); it != data.end(); ++it) {
            MappingEntry entry = it.value().get<MappingEntry>();
            entry.operationId = it.key();
            snapshot.emplace(it.key(), std::move(entry));
        }
    } catch (const std::exception& e) {
        std::cerr << "Unable to read mapping file `" << snapshotFile.string() << "`: " << e.what() << std::endl;
        return std::nullopt;
    }

    return snapshot;
}
