#ifndef ROLLBACK_MANAGER_HPP
#define ROLLBACK_MANAGER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct RollbackResult {
    // False only when the mapping file itself could not be used.
    bool success = false;
    std::size_t successCount = 0;
    std::size_t failedCount = 0;
    std::vector<std::string> errors;
    std::string error;
};

// Reverses the successful entries of a ledger snapshot. Moves are moved back,
// copies are deleted unless their source is gone, in which case they are moved
// back too. Entries whose target is already gone count as undone.
class RollbackManager {
public:
    explicit RollbackManager(std::filesystem::path mappingFile);

    // Rollback against the newest snapshot in `logsDir`, if there is one.
    static RollbackManager forLatestSnapshot(const std::filesystem::path& logsDir);

    bool canRollback() const;
    RollbackResult rollbackOperations() const;

    const std::filesystem::path& mappingFile() const { return m_mappingFile; }

private:
    std::filesystem::path m_mappingFile;
};

#endif
