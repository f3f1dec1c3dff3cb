#include "RollbackManager.hpp"

#include "FileMover.hpp"
#include "MappingLedger.hpp"

#include <iostream>
#include <system_error>

RollbackManager::RollbackManager(std::filesystem::path mappingFile)
    : m_mappingFile(std::move(mappingFile)) {}

RollbackManager RollbackManager::forLatestSnapshot(const std::filesystem::path& logsDir) {
    const auto latest = MappingLedger::findLatestSnapshot(logsDir);
    return RollbackManager(latest ? *latest : std::filesystem::path{});
}

bool RollbackManager::canRollback() const {
    std::error_code ec;
    return !m_mappingFile.empty() && std::filesystem::is_regular_file(m_mappingFile, ec) && !ec;
}

RollbackResult RollbackManager::rollbackOperations() const {
    RollbackResult result;
    if (!canRollback()) {
        result.error = "mapping file does not exist: `" + m_mappingFile.string() + "`";
        return result;
    }

    const auto snapshot = MappingLedger::loadSnapshot(m_mappingFile);
    if (!snapshot) {
        result.error = "unable to read mapping file `" + m_mappingFile.string() + "`";
        return result;
    }

    for (const auto& [operationId, entry] : *snapshot) {
        if (!entry.success || entry.targetPath.empty()) {
            continue;
        }

        const std::filesystem::path sourcePath(entry.sourcePath);
        const std::filesystem::path targetPath(entry.targetPath);

        std::error_code ec;
        const bool targetExists = std::filesystem::exists(targetPath, ec);
        if (ec) {
            ++result.failedCount;
            result.errors.push_back(operationId + ": " + ec.message());
            continue;
        }
        if (!targetExists) {
            continue;
        }

        // A copy whose source was deleted afterwards is the only one left, so it goes back like a move.
        bool restore = entry.operation == OperationKind::Move;
        if (!restore) {
            const bool sourceExists = std::filesystem::exists(sourcePath, ec);
            if (ec) {
                ++result.failedCount;
                result.errors.push_back(operationId + ": " + ec.message());
                continue;
            }
            restore = !sourceExists;
        }

        if (restore) {
            const auto parent = sourcePath.parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    ++result.failedCount;
                    result.errors.push_back(operationId + ": unable to recreate `" + parent.string() + "`: " + ec.message());
                    continue;
                }
            }

            std::string error;
            if (!FileMover::relocate(targetPath, sourcePath, error)) {
                ++result.failedCount;
                result.errors.push_back(operationId + ": " + error);
                continue;
            }
            std::cout << "Restored `" << sourcePath.string() << "`" << std::endl;
        } else {
            std::filesystem::remove(targetPath, ec);
            if (ec) {
                ++result.failedCount;
                result.errors.push_back(operationId + ": " + ec.message());
                continue;
            }
            std::cout << "Removed copy `" << targetPath.string() << "`" << std::endl;
        }

        ++result.successCount;
    }

    result.success = true;
    return result;
}
