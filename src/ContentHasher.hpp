#ifndef CONTENT_HASHER_HPP
#define CONTENT_HASHER_HPP

#include <filesystem>
#include <string>

enum class HashAlgorithm {
    Md5,
    Sha1
};

// Hex digests over strings and file contents, backed by OpenSSL EVP.
class ContentHasher {
public:
    explicit ContentHasher(HashAlgorithm algorithm = HashAlgorithm::Md5);

    // Digest of the raw bytes of `data`; empty on library failure.
    std::string hashString(const std::string& data) const;
    // Streams the file through the digest; empty when the file cannot be read.
    std::string hashFile(const std::filesystem::path& filePath) const;

    HashAlgorithm algorithm() const { return m_algorithm; }

    // Parses "md5" / "sha1" (case-insensitive); returns false for anything else.
    static bool parseAlgorithm(const std::string& text, HashAlgorithm& out);

private:
    static std::string bytesToHex(const unsigned char* data, unsigned int length);

    HashAlgorithm m_algorithm;
};

#endif
