#ifndef RELOCATION_PIPELINE_HPP
#define RELOCATION_PIPELINE_HPP

#include "ConfigParser.hpp"
#include "FileRecord.hpp"
#include "NamingEngine.hpp"
#include "PostProcessHooks.hpp"
#include "TransferOrchestrator.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct RelocationResult {
    std::size_t successCount = 0;
    std::size_t failedCount = 0;
    std::uintmax_t totalBytes = 0;
    std::vector<FileRecord> processed;
    std::vector<TransferFailure> failed;

    std::size_t scannedCount = 0;
    // Records dropped because an earlier run already transferred them.
    std::size_t skippedCount = 0;
    bool cancelled = false;
    std::size_t notAttempted = 0;
    // Empty for dry runs or when the ledger could not be written.
    std::filesystem::path mappingFile;
};

// scan -> name -> resolve conflicts -> resume filter -> resolve against the target directory
// -> transfer -> ledger -> hooks.
class RelocationPipeline {
public:
    // Throws ConfigurationError when the naming settings are invalid.
    explicit RelocationPipeline(RelocatorConfig config);

    // Replaces the thumbnail strategy chosen from the configuration.
    void setThumbnailRefresher(std::unique_ptr<ThumbnailRefresher> refresher);

    RelocationResult run(const std::vector<std::string>& sourceDirs, const std::filesystem::path& targetDir,
                         const CancellationToken* cancellation = nullptr);
    // Same as run() for records that were already scanned and ordered.
    RelocationResult process(std::vector<FileRecord> records, const std::filesystem::path& targetDir,
                             const CancellationToken* cancellation = nullptr);

    // Naming followed by conflict resolution, without touching the file system.
    std::vector<FileRecord> planNames(std::vector<FileRecord> records) const;

    const RelocatorConfig& config() const { return m_config; }

private:
    void runHooks(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed);

    RelocatorConfig m_config;
    NamingEngine m_naming;
    std::unique_ptr<ThumbnailRefresher> m_thumbnailRefresher;
};

#endif
