#include "NamingEngine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace {
constexpr char32_t kInvalidCodePoint = 0xFFFD;
constexpr std::size_t kPathHashLength = 4;
constexpr std::size_t kMaxFixedWidth = 64;

constexpr std::array<const char*, 22> kReservedDeviceNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

// Decodes the code point starting at `pos` and returns its byte length.
std::size_t decodeUtf8(const std::string& text, std::size_t pos, char32_t& codePoint) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    char32_t value = lead;

    if (lead < 0x80) {
        codePoint = value;
        return 1;
    }
    if ((lead >> 5) == 0x6) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead >> 4) == 0xE) {
        length = 3;
        value = lead & 0x0F;
    } else if ((lead >> 3) == 0x1E) {
        length = 4;
        value = lead & 0x07;
    } else {
        codePoint = kInvalidCodePoint;
        return 1;
    }

    if (pos + length > text.size()) {
        codePoint = kInvalidCodePoint;
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next >> 6) != 0x2) {
            codePoint = kInvalidCodePoint;
            return 1;
        }
        value = (value << 6) | (next & 0x3F);
    }

    codePoint = value;
    return length;
}

// Word characters are letters, digits and '_' in any script; CJK ideographs always qualify.
bool isWordCodePoint(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
    }
    if (cp >= 0x4E00 && cp <= 0x9FFF) {
        return true;
    }
    if (cp == kInvalidCodePoint) {
        return false;
    }
    if (cp <= 0xBF) {
        return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    }
    if (cp == 0xD7 || cp == 0xF7) {
        return false;
    }
    if (cp >= 0x2000 && cp <= 0x2BFF) {
        return false;
    }
    if ((cp >= 0x3000 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x303F)) {
        return false;
    }
    if (cp >= 0xFE30 && cp <= 0xFE6F) {
        return false;
    }
    if ((cp >= 0xFF00 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
        return false;
    }
    if (cp >= 0x1F000 && cp <= 0x1FAFF) {
        return false;
    }
    return true;
}

std::string toUpperAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return text;
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::size_t decimalWidth(std::size_t count) {
    return std::to_string(count).size();
}
}

SequenceCounter::SequenceCounter(long long start)
    : m_start(start) {}

long long SequenceCounter::next(const std::string& scopeKey) {
    long long& issued = m_issued[scopeKey];
    ++issued;
    return issued + m_start - 1;
}

NamingEngine::NamingEngine(NamingConfig config)
    : m_config(std::move(config)) {
    const SeqConfig& seq = m_config.seq;

    if (seq.scope == "global") {
        m_globalScope = true;
    } else if (seq.scope != "per_parent") {
        throw ConfigurationError("seq_scope must be `per_parent` or `global`, got `" + seq.scope + "`");
    }

    if (seq.width == "auto") {
        m_autoWidth = true;
    } else {
        const bool numeric = !seq.width.empty() &&
            std::all_of(seq.width.begin(), seq.width.end(), [](unsigned char ch) { return std::isdigit(ch); });
        if (!numeric || seq.width.size() > 3 || std::stoul(seq.width) > kMaxFixedWidth) {
            throw ConfigurationError("seq_width must be `auto` or a digit count up to 64, got `" + seq.width + "`");
        }
        m_autoWidth = false;
        m_fixedWidth = std::stoul(seq.width);
    }

    if (seq.padChar.size() != 1) {
        throw ConfigurationError("seq_pad_char must be a single character, got `" + seq.padChar + "`");
    }
    m_padChar = seq.padChar.front();

    if (m_config.parentStrategy == "keep") {
        m_slugParent = false;
    } else if (m_config.parentStrategy != "slug") {
        throw ConfigurationError("parent_strategy must be `slug` or `keep`, got `" + m_config.parentStrategy + "`");
    }

    if (m_config.origMaxLen < 1 || m_config.parentMaxLen < 1) {
        throw ConfigurationError("orig_maxlen and parent_maxlen must be positive");
    }

    parseTemplate(m_config.nameTemplate);
}

void NamingEngine::parseTemplate(const std::string& nameTemplate) {
    m_parts.clear();
    std::string literal;

    auto flushLiteral = [&]() {
        if (!literal.empty()) {
            m_parts.push_back({Token::Literal, literal});
            literal.clear();
        }
    };

    for (std::size_t i = 0; i < nameTemplate.size(); ++i) {
        const char ch = nameTemplate[i];
        if (ch == '}') {
            if (i + 1 < nameTemplate.size() && nameTemplate[i + 1] == '}') {
                literal.push_back('}');
                ++i;
                continue;
            }
            throw ConfigurationError("unmatched `}` in template `" + nameTemplate + "`");
        }
        if (ch != '{') {
            literal.push_back(ch);
            continue;
        }
        if (i + 1 < nameTemplate.size() && nameTemplate[i + 1] == '{') {
            literal.push_back('{');
            ++i;
            continue;
        }

        const std::size_t close = nameTemplate.find('}', i + 1);
        if (close == std::string::npos) {
            throw ConfigurationError("unterminated placeholder in template `" + nameTemplate + "`");
        }

        const std::string name = nameTemplate.substr(i + 1, close - i - 1);
        Token token;
        if (name == "parent") {
            token = Token::Parent;
        } else if (name == "orig") {
            token = Token::Orig;
        } else if (name == "seq") {
            token = Token::Seq;
        } else if (name == "ext") {
            token = Token::Ext;
        } else {
            throw ConfigurationError("unknown template placeholder `{" + name + "}`");
        }

        flushLiteral();
        m_parts.push_back({token, {}});
        i = close;
    }
    flushLiteral();
}

std::vector<FileRecord> NamingEngine::generateNames(std::vector<FileRecord> records) const {
    // Totals per scope drive the auto width, so they are counted before any name is issued.
    std::unordered_map<std::string, std::size_t> parentCounts;
    for (const auto& record : records) {
        ++parentCounts[parentKey(record)];
    }

    SequenceCounter counter(m_config.seq.start);
    for (auto& record : records) {
        std::string seq;
        if (m_globalScope) {
            seq = formatSeq(counter.next(std::string{}), records.size());
        } else {
            const std::string key = parentKey(record);
            seq = formatSeq(counter.next(key), parentCounts[key]);
        }
        record.newName = sanitizeFilename(renderName(record, seq));
    }

    return records;
}

std::string NamingEngine::renderName(const FileRecord& record, const std::string& seq) const {
    std::string name;
    for (const auto& part : m_parts) {
        switch (part.token) {
        case Token::Literal:
            name += part.literal;
            break;
        case Token::Parent:
            name += processParent(record);
            break;
        case Token::Orig:
            name += processOrig(record);
            break;
        case Token::Seq:
            name += seq;
            break;
        case Token::Ext:
            name += processExt(record);
            break;
        }
    }
    return name;
}

std::string NamingEngine::parentName(const FileRecord& record) const {
    if (record.parentPath.empty() || record.parentPath == ".") {
        return {};
    }
    return std::filesystem::path(record.parentPath).filename().string();
}

std::string NamingEngine::parentPathHash(const FileRecord& record) const {
    const std::string parentPath = record.parentPath.empty() ? std::string(".") : record.parentPath;
    return m_pathHasher.hashString(parentPath).substr(0, kPathHashLength);
}

std::string NamingEngine::parentKey(const FileRecord& record) const {
    const std::string name = parentName(record);
    if (m_config.parentHashSuffix) {
        return name + "_" + parentPathHash(record);
    }
    return name.empty() ? std::string("root") : name;
}

std::string NamingEngine::processParent(const FileRecord& record) const {
    std::string parent = parentName(record);
    if (parent.empty()) {
        parent = "root";
    }

    if (m_slugParent) {
        parent = slugify(parent);
    }
    parent = truncateCodePoints(parent, static_cast<std::size_t>(m_config.parentMaxLen));

    if (m_config.parentHashSuffix) {
        parent += "-" + parentPathHash(record);
    }

    return parent.empty() ? std::string("unknown") : parent;
}

std::string NamingEngine::processOrig(const FileRecord& record) const {
    std::string orig = truncateCodePoints(slugify(record.stem), static_cast<std::size_t>(m_config.origMaxLen));
    return orig.empty() ? std::string("unnamed") : orig;
}

std::string NamingEngine::formatSeq(long long value, std::size_t scopeTotal) const {
    const std::size_t width = m_autoWidth ? decimalWidth(scopeTotal) : m_fixedWidth;
    const std::string sign = value < 0 ? "-" : "";
    const std::string digits = std::to_string(value < 0 ? -value : value);

    std::string result = sign;
    if (sign.size() + digits.size() < width) {
        result.append(width - sign.size() - digits.size(), m_padChar);
    }
    result += digits;
    return result;
}

std::string NamingEngine::processExt(const FileRecord& record) {
    return toLowerAscii(record.extension);
}

std::string NamingEngine::sanitizeFilename(const std::string& filename) {
    std::string result = filename;
    for (auto& ch : result) {
        switch (ch) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            ch = '_';
            break;
        default:
            break;
        }
    }

    const std::string namePart = toUpperAscii(result.substr(0, result.find('.')));
    for (const char* reserved : kReservedDeviceNames) {
        if (namePart == reserved) {
            result.insert(result.begin(), '_');
            break;
        }
    }

    const std::size_t first = result.find_first_not_of(" .");
    if (first == std::string::npos) {
        return "unnamed";
    }
    const std::size_t last = result.find_last_not_of(" .");
    return result.substr(first, last - first + 1);
}

std::string NamingEngine::slugify(const std::string& text) {
    std::string result;
    bool lastWasSeparator = false;

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t codePoint = 0;
        const std::size_t length = decodeUtf8(text, pos, codePoint);
        if (isWordCodePoint(codePoint)) {
            result.append(text, pos, length);
            lastWasSeparator = false;
        } else if (!lastWasSeparator) {
            result.push_back('_');
            lastWasSeparator = true;
        }
        pos += length;
    }

    return result;
}

std::string NamingEngine::truncateCodePoints(const std::string& text, std::size_t maxChars) {
    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < text.size() && count < maxChars) {
        char32_t codePoint = 0;
        pos += decodeUtf8(text, pos, codePoint);
        ++count;
    }
    return text.substr(0, pos);
}
