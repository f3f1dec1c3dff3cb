#include "FileMover.hpp"

#include <iostream>
#include <system_error>

FileMover::FileMover(HashAlgorithm verifyAlgorithm)
    : m_hasher(verifyAlgorithm) {}

bool FileMover::copyFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const {
    std::error_code ec;
    const bool targetExists = std::filesystem::exists(targetPath, ec);
    if (ec) {
        error = "unable to inspect target: " + ec.message();
        return false;
    }
    if (targetExists) {
        std::error_code sameErr;
        const bool sameFile = std::filesystem::equivalent(sourcePath, targetPath, sameErr);
        error = sameFile && !sameErr ? "source and target are the same file" : "target already exists";
        return false;
    }

    std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::none, ec);
    if (ec) {
        // Anything at the target now was written by this call, unless another writer raced us to it.
        if (ec != std::errc::file_exists) {
            discardTarget(targetPath);
        }
        error = "copy failed: " + ec.message();
        return false;
    }

    const auto modified = std::filesystem::last_write_time(sourcePath, ec);
    if (!ec) {
        std::filesystem::last_write_time(targetPath, modified, ec);
    }
    if (ec) {
        discardTarget(targetPath);
        error = "unable to copy timestamps: " + ec.message();
        return false;
    }

    const auto sourceStatus = std::filesystem::status(sourcePath, ec);
    if (!ec) {
        std::filesystem::permissions(targetPath, sourceStatus.permissions(), std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        discardTarget(targetPath);
        error = "unable to copy permissions: " + ec.message();
        return false;
    }

    return true;
}

bool FileMover::moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const {
    if (!copyFile(sourcePath, targetPath, error)) {
        return false;
    }

    if (!verifyIntegrity(sourcePath, targetPath, error)) {
        discardTarget(targetPath);
        return false;
    }

    std::error_code removeErr;
    if (!std::filesystem::remove(sourcePath, removeErr) || removeErr) {
        // The source stays authoritative, so the verified copy is withdrawn.
        discardTarget(targetPath);
        error = "unable to remove source after verified copy: " +
            (removeErr ? removeErr.message() : std::string("file vanished"));
        return false;
    }

    return true;
}

bool FileMover::verifyIntegrity(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const {
    std::error_code sourceErr;
    std::error_code targetErr;
    const auto sourceSize = std::filesystem::file_size(sourcePath, sourceErr);
    const auto targetSize = std::filesystem::file_size(targetPath, targetErr);
    if (sourceErr || targetErr) {
        error = "integrity verification failed: " + (sourceErr ? sourceErr : targetErr).message();
        return false;
    }

    if (sourceSize != targetSize) {
        error = "integrity verification failed: size mismatch (" + std::to_string(sourceSize) + " vs " +
            std::to_string(targetSize) + " bytes)";
        return false;
    }

    const std::string sourceDigest = m_hasher.hashFile(sourcePath);
    const std::string targetDigest = m_hasher.hashFile(targetPath);
    if (sourceDigest.empty() || targetDigest.empty()) {
        error = "integrity verification failed: unable to hash file contents";
        return false;
    }
    if (sourceDigest != targetDigest) {
        error = "integrity verification failed: content hash mismatch";
        return false;
    }

    return true;
}

bool FileMover::relocate(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error) {
    std::error_code renameErr;
    std::filesystem::rename(from, to, renameErr);
    if (!renameErr) {
        return true;
    }

    if (renameErr == std::errc::cross_device_link) {
        std::error_code copyErr;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, copyErr);
        if (copyErr) {
            discardTarget(to);
            error = "cross-device copy failed: " + copyErr.message();
            return false;
        }

        std::error_code removeErr;
        std::filesystem::remove(from, removeErr);
        if (removeErr) {
            error = "copied but unable to remove `" + from.string() + "`: " + removeErr.message();
            return false;
        }
        return true;
    }

    error = renameErr.message();
    return false;
}

void FileMover::discardTarget(const std::filesystem::path& targetPath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(targetPath, ec)) {
        return;
    }

    std::filesystem::remove(targetPath, ec);
    if (ec) {
        std::cerr << "Failed to remove partial target `" << targetPath.string() << "`: " << ec.message() << std::endl;
    }
}
