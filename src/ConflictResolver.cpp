#include "ConflictResolver.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

void ConflictResolver::resolve(std::vector<FileRecord>& records) {
    resolve(records, {});
}

void ConflictResolver::resolve(std::vector<FileRecord>& records, const std::vector<std::string>& occupiedNames) {
    std::unordered_map<std::string, std::size_t> nameCounts;
    for (const auto& name : occupiedNames) {
        nameCounts[collisionKey(name)] = 1;
    }

    for (auto& record : records) {
        const std::size_t seen = ++nameCounts[collisionKey(record.newName)];
        if (seen == 1) {
            continue;
        }

        // A rewritten name may itself be taken already; keep counting until it is free.
        std::size_t index = seen - 1;
        std::string candidate = withDuplicateSuffix(record.newName, index);
        while (nameCounts.count(collisionKey(candidate)) != 0) {
            candidate = withDuplicateSuffix(record.newName, ++index);
        }

        record.newName = std::move(candidate);
        nameCounts[collisionKey(record.newName)] = 1;
    }
}

std::string ConflictResolver::withDuplicateSuffix(const std::string& name, std::size_t index) {
    const std::string suffix = "__dup" + std::to_string(index);
    const std::size_t dot = name.rfind('.');
    if (dot == std::string::npos) {
        return name + suffix;
    }
    return name.substr(0, dot) + suffix + name.substr(dot);
}

std::string ConflictResolver::collisionKey(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return key;
}
