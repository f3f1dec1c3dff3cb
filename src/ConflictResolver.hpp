#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include "FileRecord.hpp"

#include <string>
#include <vector>

// Second pass over named records that makes every newName unique in the target
// directory. The Nth occurrence of a name gets `__dup{N-1}` before its last extension.
class ConflictResolver {
public:
    // Rewrites colliding names in place, in the order the records were named.
    static void resolve(std::vector<FileRecord>& records);
    // Same, treating `occupiedNames` (entries already in the target directory) as taken.
    static void resolve(std::vector<FileRecord>& records, const std::vector<std::string>& occupiedNames);

    // Inserts `__dup<index>` before the last '.' (or appends it when there is none).
    static std::string withDuplicateSuffix(const std::string& name, std::size_t index);

private:
    // Names differing only by ASCII case collide on case-insensitive file systems.
    static std::string collisionKey(const std::string& name);
};

#endif
