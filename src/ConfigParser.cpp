#include "ConfigParser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
// Reads `key` from `section` into `out` when present; logs and fails on a type mismatch.
template <typename T>
bool readOptional(const json& section, const char* key, const std::string& sectionName, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return true;
    }

    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        std::cerr << "Invalid `" << sectionName << "." << key << "`: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool requireObject(const json& data, const char* key, const json*& out) {
    out = nullptr;
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }
    if (!it->is_object()) {
        std::cerr << "Invalid configuration: `" << key << "` must be an object." << std::endl;
        return false;
    }
    out = &*it;
    return true;
}
}

const RelocatorConfig& ConfigParser::getConfig() const {
    return m_config;
}

RelocatorConfig& ConfigParser::mutableConfig() {
    return m_config;
}

bool ConfigParser::load(const std::string& configRoot) {
    // relocator.json lives in a config folder beside the working/config root.
    std::filesystem::path configPath = std::filesystem::path(configRoot) / "config" / "relocator.json";

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (ec) {
            std::cerr << "Unable to check configuration file `" << configPath.string() << "`: " << ec.message() << std::endl;
            return false;
        }
        std::cout << "No configuration file at `" << configPath.string() << "`, using defaults." << std::endl;
        return true;
    }

    return loadFile(configPath);
}

bool ConfigParser::loadFile(const std::filesystem::path& configPath) {
    std::ifstream jsonFile(configPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << configPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: top level must be an object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    RelocatorConfig config;
    const json* general = nullptr;
    const json* naming = nullptr;
    const json* thumbnail = nullptr;
    const json* perf = nullptr;
    if (!requireObject(data, "general", general) || !requireObject(data, "naming", naming) ||
        !requireObject(data, "thumbnail", thumbnail) || !requireObject(data, "perf", perf)) {
        return false;
    }

    if (!parsePaths(data, config)) {
        return false;
    }
    if (general && !parseGeneral(*general, config)) {
        return false;
    }
    if (naming && !parseNaming(*naming, config.naming)) {
        return false;
    }
    if (thumbnail && !parseThumbnail(*thumbnail, config)) {
        return false;
    }
    if (perf && !parsePerf(*perf, config)) {
        return false;
    }

    m_config = std::move(config);
    std::cout << "Loaded configuration from " << configPath << std::endl;
    return true;
}

bool ConfigParser::parsePaths(const json& data, RelocatorConfig& config) const {
    std::vector<std::string> sources;
    if (!readOptional(data, "source_dirs", "root", sources)) {
        return false;
    }
    for (const auto& source : sources) {
        std::string resolved = applyPlaceholders(source);
        if (resolved.empty()) {
            std::cerr << "Invalid configuration: `source_dirs` entries cannot be empty." << std::endl;
            return false;
        }
        config.sourceDirs.push_back(std::move(resolved));
    }

    std::string target;
    if (!readOptional(data, "target_dir", "root", target)) {
        return false;
    }
    config.targetDir = applyPlaceholders(target);
    return true;
}

bool ConfigParser::parseGeneral(const json& section, RelocatorConfig& config) const {
    if (auto it = section.find("include_ext"); it != section.end() && !it->is_null()) {
        std::vector<std::string> raw;
        if (it->is_string()) {
            // Accept the comma-separated form as well as a JSON array.
            std::stringstream stream(it->get<std::string>());
            std::string item;
            while (std::getline(stream, item, ',')) {
                raw.push_back(item);
            }
        } else if (!readOptional(section, "include_ext", "general", raw)) {
            return false;
        }

        for (auto& ext : raw) {
            std::string normalized = normalizeExtension(std::move(ext));
            if (!normalized.empty()) {
                config.includeExtensions.push_back(std::move(normalized));
            }
        }
    }

    std::string order = "natural";
    if (!readOptional(section, "order", "general", order)) {
        return false;
    }
    if (order == "natural") {
        config.order = SortOrder::Natural;
    } else if (order == "mtime_asc") {
        config.order = SortOrder::MtimeAsc;
    } else if (order == "mtime_desc") {
        config.order = SortOrder::MtimeDesc;
    } else if (order == "ctime_asc") {
        config.order = SortOrder::CtimeAsc;
    } else if (order == "ctime_desc") {
        config.order = SortOrder::CtimeDesc;
    } else {
        std::cerr << "Invalid `general.order`: `" << order << "`." << std::endl;
        return false;
    }

    std::string operation = toString(config.operation);
    if (!readOptional(section, "operation", "general", operation)) {
        return false;
    }
    if (!parseOperationKind(operation, config.operation)) {
        std::cerr << "Invalid `general.operation`: `" << operation << "` (expected copy or move)." << std::endl;
        return false;
    }

    return readOptional(section, "dry_run", "general", config.dryRun);
}

bool ConfigParser::parseNaming(const json& section, NamingConfig& naming) const {
    if (!readOptional(section, "template", "naming", naming.nameTemplate) ||
        !readOptional(section, "seq_scope", "naming", naming.seq.scope) ||
        !readOptional(section, "seq_start", "naming", naming.seq.start) ||
        !readOptional(section, "seq_pad_char", "naming", naming.seq.padChar) ||
        !readOptional(section, "parent_strategy", "naming", naming.parentStrategy) ||
        !readOptional(section, "parent_hash_suffix", "naming", naming.parentHashSuffix) ||
        !readOptional(section, "orig_maxlen", "naming", naming.origMaxLen) ||
        !readOptional(section, "parent_maxlen", "naming", naming.parentMaxLen)) {
        return false;
    }

    // seq_width may be written as a number or as a string ("auto" / "4").
    if (auto it = section.find("seq_width"); it != section.end() && !it->is_null()) {
        if (it->is_number_integer()) {
            naming.seq.width = std::to_string(it->get<long long>());
        } else if (it->is_string()) {
            naming.seq.width = it->get<std::string>();
        } else {
            std::cerr << "Invalid `naming.seq_width`: expected \"auto\" or an integer." << std::endl;
            return false;
        }
    }

    return true;
}

bool ConfigParser::parseThumbnail(const json& section, RelocatorConfig& config) const {
    std::string refresh = "off";
    if (!readOptional(section, "refresh", "thumbnail", refresh)) {
        return false;
    }

    if (refresh == "off") {
        config.thumbnailRefresh = ThumbnailRefreshMode::Off;
    } else if (refresh == "touch") {
        config.thumbnailRefresh = ThumbnailRefreshMode::TouchTimestamps;
    } else if (refresh == "shell") {
        config.thumbnailRefresh = ThumbnailRefreshMode::ShellNotify;
    } else if (refresh == "cache_clear" || refresh == "cache_clear_confirmed") {
        config.thumbnailRefresh = ThumbnailRefreshMode::ClearCache;
    } else {
        std::cerr << "Invalid `thumbnail.refresh`: `" << refresh << "`." << std::endl;
        return false;
    }
    return true;
}

bool ConfigParser::parsePerf(const json& section, RelocatorConfig& config) const {
    if (!readOptional(section, "workers", "perf", config.workers)) {
        return false;
    }
    if (config.workers < 1) {
        std::cerr << "Invalid `perf.workers`: must be at least 1." << std::endl;
        return false;
    }

    std::string dedup = "off";
    if (!readOptional(section, "hash_dedup", "perf", dedup)) {
        return false;
    }
    if (dedup == "off") {
        config.hashDedup = HashDedupMode::Off;
    } else if (dedup == "keep_first") {
        config.hashDedup = HashDedupMode::KeepFirst;
    } else if (dedup == "suffix_all") {
        config.hashDedup = HashDedupMode::SuffixAll;
    } else {
        std::cerr << "Invalid `perf.hash_dedup`: `" << dedup << "`." << std::endl;
        return false;
    }

    std::string algo = "md5";
    if (!readOptional(section, "hash_algo", "perf", algo)) {
        return false;
    }
    if (!ContentHasher::parseAlgorithm(algo, config.hashAlgorithm)) {
        std::cerr << "Invalid `perf.hash_algo`: `" << algo << "` (expected md5 or sha1)." << std::endl;
        return false;
    }
    return true;
}

std::string ConfigParser::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    auto addPlaceholder = [this](const std::string& key, const json& value) {
        if (!value.is_string()) {
            std::cerr << "Placeholder `" << key << "` must be a string." << std::endl;
            return;
        }
        m_placeholders[key] = value.get<std::string>();
    };

    if (auto userIt = data.find("user"); userIt != data.end()) {
        addPlaceholder("user", *userIt);
    }

    if (auto placeholdersIt = data.find("placeholders"); placeholdersIt != data.end()) {
        if (!placeholdersIt->is_object()) {
            std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        } else {
            for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
                addPlaceholder(it.key(), it.value());
            }
        }
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
