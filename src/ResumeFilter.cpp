#include "ResumeFilter.hpp"

#include <iostream>
#include <system_error>

ResumeFilter::ResumeFilter(LedgerSnapshot previous)
    : m_previous(std::move(previous)) {}

ResumeFilter ResumeFilter::fromLatestSnapshot(const std::filesystem::path& logsDir) {
    const auto latest = MappingLedger::findLatestSnapshot(logsDir);
    if (!latest) {
        return ResumeFilter();
    }

    auto snapshot = MappingLedger::loadSnapshot(*latest);
    if (!snapshot) {
        std::cerr << "Warning: ignoring unreadable mapping file `" << latest->string() << "` for resume." << std::endl;
        return ResumeFilter();
    }

    std::cout << "Resuming against `" << latest->string() << "` (" << snapshot->size() << " entries)." << std::endl;
    return ResumeFilter(std::move(*snapshot));
}

ResumePartition ResumeFilter::apply(std::vector<FileRecord> records) const {
    ResumePartition partition;
    if (m_previous.empty()) {
        partition.retained = std::move(records);
        return partition;
    }

    for (auto& record : records) {
        auto it = m_previous.find(operationIdFor(record));
        if (it != m_previous.end() && it->second.success && !it->second.targetPath.empty()) {
            std::error_code ec;
            if (std::filesystem::exists(it->second.targetPath, ec) && !ec) {
                std::cout << "Skipping already processed file `" << record.filename << "`." << std::endl;
                partition.skipped.push_back(it->second);
                continue;
            }
        }
        partition.retained.push_back(std::move(record));
    }

    if (!partition.skipped.empty()) {
        std::cout << "Skipped " << partition.skipped.size() << " already processed file(s)." << std::endl;
    }
    return partition;
}
