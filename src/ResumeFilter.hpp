#ifndef RESUME_FILTER_HPP
#define RESUME_FILTER_HPP

#include "FileRecord.hpp"
#include "MappingLedger.hpp"

#include <filesystem>
#include <vector>

struct ResumePartition {
    std::vector<FileRecord> retained;
    // Previous successful entries whose targets are still present.
    std::vector<MappingEntry> skipped;
};

// Drops records that a previous run already transferred durably.
class ResumeFilter {
public:
    ResumeFilter() = default;
    explicit ResumeFilter(LedgerSnapshot previous);

    // Uses the newest snapshot under `logsDir`; an absent or unreadable ledger filters nothing.
    static ResumeFilter fromLatestSnapshot(const std::filesystem::path& logsDir);

    // A record is skipped only when its entry succeeded and the target still exists.
    ResumePartition apply(std::vector<FileRecord> records) const;

    bool empty() const { return m_previous.empty(); }

private:
    LedgerSnapshot m_previous;
};

#endif
