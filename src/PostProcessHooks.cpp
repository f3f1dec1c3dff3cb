#include "PostProcessHooks.hpp"

#include "ContentHasher.hpp"

#include <cstdlib>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#endif

namespace {
constexpr const char* kThumbnailSizes[] = {"normal", "large", "x-large", "xx-large"};

bool isUriSafe(unsigned char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/';
}
}

std::unique_ptr<ThumbnailRefresher> ThumbnailRefresher::create(ThumbnailRefreshMode mode) {
    switch (mode) {
    case ThumbnailRefreshMode::TouchTimestamps:
        return std::make_unique<TouchTimestampRefresher>();
    case ThumbnailRefreshMode::ShellNotify:
        return std::make_unique<ShellNotifyRefresher>();
    case ThumbnailRefreshMode::ClearCache:
        return std::make_unique<ThumbnailCacheCleaner>();
    case ThumbnailRefreshMode::Off:
        break;
    }
    return std::make_unique<NoThumbnailRefresh>();
}

bool NoThumbnailRefresh::refresh(const std::filesystem::path&, const std::vector<FileRecord>&) {
    return true;
}

bool TouchTimestampRefresher::refresh(const std::filesystem::path&, const std::vector<FileRecord>& processed) {
    const auto now = std::filesystem::file_time_type::clock::now();
    std::size_t touched = 0;

    for (const auto& record : processed) {
        if (record.targetPath.empty()) {
            continue;
        }

        std::error_code ec;
        if (!std::filesystem::exists(record.targetPath, ec)) {
            continue;
        }
        std::filesystem::last_write_time(record.targetPath, now, ec);
        if (ec) {
            std::cerr << "Unable to update timestamp of `" << record.targetPath << "`: " << ec.message() << std::endl;
            continue;
        }
        ++touched;
    }

    std::cout << "Updated timestamps of " << touched << " file(s)." << std::endl;
    return true;
}

bool ShellNotifyRefresher::refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>&) {
#ifdef _WIN32
    const std::wstring wideTarget = targetDir.wstring();
    SHChangeNotify(SHCNE_UPDATEDIR, SHCNF_PATHW, wideTarget.c_str(), nullptr);
    std::cout << "Sent shell change notification for `" << targetDir.string() << "`." << std::endl;
    return true;
#else
    std::error_code ec;
    std::filesystem::last_write_time(targetDir, std::filesystem::file_time_type::clock::now(), ec);
    if (ec) {
        std::cerr << "Unable to notify file managers about `" << targetDir.string() << "`: " << ec.message() << std::endl;
        return false;
    }
    std::cout << "Bumped directory timestamp of `" << targetDir.string() << "`." << std::endl;
    return true;
#endif
}

std::filesystem::path ThumbnailCacheCleaner::cacheRoot() {
#ifdef _WIN32
    const char* localAppData = std::getenv("LOCALAPPDATA");
    if (!localAppData || !*localAppData) {
        return {};
    }
    return std::filesystem::path(localAppData) / "Microsoft" / "Windows" / "Explorer";
#else
    if (const char* xdgCache = std::getenv("XDG_CACHE_HOME"); xdgCache && *xdgCache) {
        return std::filesystem::path(xdgCache) / "thumbnails";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".cache" / "thumbnails";
    }
    return {};
#endif
}

std::string ThumbnailCacheCleaner::fileUri(const std::filesystem::path& absolutePath) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string uri = "file://";
    for (unsigned char ch : absolutePath.generic_string()) {
        if (isUriSafe(ch)) {
            uri.push_back(static_cast<char>(ch));
        } else {
            uri.push_back('%');
            uri.push_back(kHex[ch >> 4]);
            uri.push_back(kHex[ch & 0x0F]);
        }
    }
    return uri;
}

bool ThumbnailCacheCleaner::refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) {
    const std::filesystem::path root = cacheRoot();
    std::error_code ec;
    if (root.empty() || !std::filesystem::is_directory(root, ec)) {
        std::cerr << "Thumbnail cache directory not found." << std::endl;
        return false;
    }

    std::size_t removed = 0;
#ifdef _WIN32
    (void)targetDir;
    (void)processed;
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("thumbcache_", 0) != 0 || entry.path().extension() != ".db") {
            continue;
        }
        std::error_code removeErr;
        if (std::filesystem::remove(entry.path(), removeErr)) {
            ++removed;
        } else if (removeErr) {
            std::cerr << "Unable to delete cache file `" << entry.path().string() << "`: " << removeErr.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "Unable to enumerate `" << root.string() << "`: " << ec.message() << std::endl;
        return false;
    }
#else
    (void)targetDir;
    const ContentHasher uriHasher(HashAlgorithm::Md5);
    for (const auto& record : processed) {
        if (record.targetPath.empty()) {
            continue;
        }

        std::error_code absErr;
        const std::filesystem::path absolute = std::filesystem::absolute(record.targetPath, absErr);
        if (absErr) {
            continue;
        }

        const std::string thumbName = uriHasher.hashString(fileUri(absolute.lexically_normal())) + ".png";
        for (const char* size : kThumbnailSizes) {
            std::error_code removeErr;
            if (std::filesystem::remove(root / size / thumbName, removeErr)) {
                ++removed;
            }
        }
    }
#endif

    std::cout << "Removed " << removed << " cached thumbnail file(s)." << std::endl;
    return true;
}

void showManualRefreshTips(const std::filesystem::path& targetDir) {
    std::cout << "Automatic thumbnail refresh failed. To refresh manually:" << std::endl;
    std::cout << "  1. Reload the folder in your file manager (F5)." << std::endl;
    std::cout << "  2. Switch the view mode and back." << std::endl;
    std::cout << "  3. Restart the file manager or desktop shell." << std::endl;
    std::cout << "Target directory: " << targetDir.string() << std::endl;
}

SourceDeletionResult deleteCopiedSources(const std::vector<FileRecord>& processed, OperationKind operation) {
    SourceDeletionResult result;
    if (operation != OperationKind::Copy) {
        return result;
    }

    for (const auto& record : processed) {
        if (record.fullPath.empty() || record.targetPath.empty()) {
            continue;
        }

        std::error_code ec;
        if (!std::filesystem::exists(record.targetPath, ec) || !std::filesystem::exists(record.fullPath, ec)) {
            continue;
        }

        if (std::filesystem::remove(record.fullPath, ec) && !ec) {
            ++result.deleted;
        } else {
            ++result.failed;
            std::cerr << "Unable to delete source `" << record.fullPath << "`: " << ec.message() << std::endl;
        }
    }

    std::cout << "Source deletion finished: " << result.deleted << " deleted, " << result.failed << " failed." << std::endl;
    return result;
}
