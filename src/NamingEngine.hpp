#ifndef NAMING_ENGINE_HPP
#define NAMING_ENGINE_HPP

#include "ConfigParser.hpp"
#include "ContentHasher.hpp"
#include "FileRecord.hpp"

#include <string>
#include <unordered_map>
#include <vector>

// Monotonic per-scope counters for one naming pass.
class SequenceCounter {
public:
    explicit SequenceCounter(long long start);

    // Returns the next value for `scopeKey`, beginning at the configured start.
    long long next(const std::string& scopeKey);

private:
    long long m_start;
    std::unordered_map<std::string, long long> m_issued;
};

// Derives new file names from a template of {parent}, {orig}, {seq} and {ext}.
// Names are a pure function of the parent group, the rank inside the scope and
// the configuration, so the same ordered input always yields the same names.
class NamingEngine {
public:
    // Validates the configuration; throws ConfigurationError on any invalid setting.
    explicit NamingEngine(NamingConfig config);

    // Returns `records` with newName assigned, sequencing in the order given.
    std::vector<FileRecord> generateNames(std::vector<FileRecord> records) const;

    // Grouping key for per-parent sequencing: parent name plus optional path hash.
    std::string parentKey(const FileRecord& record) const;

    // Replace reserved characters, guard device names and trim spaces/dots.
    static std::string sanitizeFilename(const std::string& filename);
    // Collapse every run of characters outside word/CJK characters into one '_'.
    static std::string slugify(const std::string& text);
    // Keep at most `maxChars` UTF-8 code points.
    static std::string truncateCodePoints(const std::string& text, std::size_t maxChars);

private:
    enum class Token {
        Literal,
        Parent,
        Orig,
        Seq,
        Ext
    };

    struct TemplatePart {
        Token token;
        std::string literal;
    };

    void parseTemplate(const std::string& nameTemplate);
    std::string renderName(const FileRecord& record, const std::string& seq) const;

    std::string parentName(const FileRecord& record) const;
    std::string parentPathHash(const FileRecord& record) const;
    std::string processParent(const FileRecord& record) const;
    std::string processOrig(const FileRecord& record) const;
    std::string formatSeq(long long value, std::size_t scopeTotal) const;
    static std::string processExt(const FileRecord& record);

    NamingConfig m_config;
    std::vector<TemplatePart> m_parts;
    bool m_globalScope = false;
    bool m_autoWidth = true;
    std::size_t m_fixedWidth = 0;
    char m_padChar = '0';
    bool m_slugParent = true;
    ContentHasher m_pathHasher{HashAlgorithm::Md5};
};

#endif
