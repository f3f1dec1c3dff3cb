#include "ContentHasher.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace {
constexpr std::size_t kReadBufferBytes = 64 * 1024;
constexpr char kHexChars[] = "0123456789abcdef";

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

const EVP_MD* digestFor(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha1 ? EVP_sha1() : EVP_md5();
}
}

ContentHasher::ContentHasher(HashAlgorithm algorithm)
    : m_algorithm(algorithm) {}

bool ContentHasher::parseAlgorithm(const std::string& text, HashAlgorithm& out) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (lowered == "md5") {
        out = HashAlgorithm::Md5;
        return true;
    }
    if (lowered == "sha1" || lowered == "sha-1") {
        out = HashAlgorithm::Sha1;
        return true;
    }
    return false;
}

std::string ContentHasher::hashString(const std::string& data) const {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), digestFor(m_algorithm), nullptr) != 1) {
        return {};
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        return {};
    }

    return bytesToHex(digest, digestLength);
}

std::string ContentHasher::hashFile(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return {};
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), digestFor(m_algorithm), nullptr) != 1) {
        return {};
    }

    std::vector<char> buffer(kReadBufferBytes);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytesRead = file.gcount();
        if (bytesRead > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(bytesRead)) != 1) {
            return {};
        }
    }

    if (file.bad()) {
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        return {};
    }

    return bytesToHex(digest, digestLength);
}

std::string ContentHasher::bytesToHex(const unsigned char* data, unsigned int length) {
    std::string result;
    result.resize(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result[i * 2] = kHexChars[data[i] >> 4];
        result[i * 2 + 1] = kHexChars[data[i] & 0x0F];
    }
    return result;
}
