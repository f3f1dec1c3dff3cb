#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "ContentHasher.hpp"
#include "FileRecord.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Invalid naming or pipeline settings; raised before any record is processed.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SortOrder {
    Natural,
    MtimeAsc,
    MtimeDesc,
    CtimeAsc,
    CtimeDesc
};

enum class ThumbnailRefreshMode {
    Off,
    TouchTimestamps,
    ShellNotify,
    ClearCache
};

enum class HashDedupMode {
    Off,
    KeepFirst,
    SuffixAll
};

// Sequence numbering options; the string fields are validated by NamingEngine.
struct SeqConfig {
    std::string scope = "per_parent";
    long long start = 1;
    std::string width = "auto";
    std::string padChar = "0";
};

struct NamingConfig {
    std::string nameTemplate = "{parent}_{orig}_{seq}{ext}";
    SeqConfig seq;
    std::string parentStrategy = "slug";
    bool parentHashSuffix = false;
    int origMaxLen = 32;
    int parentMaxLen = 12;
};

struct RelocatorConfig {
    std::vector<std::string> sourceDirs;
    std::string targetDir;

    // Normalized to lower-case with a leading dot; empty accepts every file.
    std::vector<std::string> includeExtensions;
    SortOrder order = SortOrder::Natural;
    OperationKind operation = OperationKind::Copy;
    bool dryRun = false;

    NamingConfig naming;

    ThumbnailRefreshMode thumbnailRefresh = ThumbnailRefreshMode::Off;

    int workers = 8;
    HashDedupMode hashDedup = HashDedupMode::Off;
    HashAlgorithm hashAlgorithm = HashAlgorithm::Md5;
};

// Parses config/relocator.json and exposes the resolved relocation settings.
class ConfigParser {
public:
    // Read-only access to the loaded configuration (defaults until a load succeeds).
    const RelocatorConfig& getConfig() const;
    // Mutable access for command-line overrides applied after loading.
    RelocatorConfig& mutableConfig();
    // Load <configRoot>/config/relocator.json; a missing file keeps the defaults.
    bool load(const std::string& configRoot);
    // Load an explicit JSON file; returns false on I/O or validation errors.
    bool loadFile(const std::filesystem::path& configPath);

    // Normalize extensions (trim whitespace, enforce dot prefix, lower-case).
    static std::string normalizeExtension(std::string extension);

private:
    // Collect placeholder tokens (legacy `user` plus the `placeholders` map).
    void loadPlaceholders(const nlohmann::json& data);
    // Replace {{key}} tokens, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    bool parsePaths(const nlohmann::json& data, RelocatorConfig& config) const;
    bool parseGeneral(const nlohmann::json& section, RelocatorConfig& config) const;
    bool parseNaming(const nlohmann::json& section, NamingConfig& naming) const;
    bool parseThumbnail(const nlohmann::json& section, RelocatorConfig& config) const;
    bool parsePerf(const nlohmann::json& section, RelocatorConfig& config) const;

    RelocatorConfig m_config;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
