#include "deltaledger/Layout.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace deltaledger {
namespace layout {

std::string snapshotPath(const std::string& rootDir) {
    return (fs::path(rootDir) / "data" / "Full.snapshot").string();
}

std::string devicesDir(const std::string& rootDir) {
    return (fs::path(rootDir) / "devices").string();
}

std::string writerDir(const std::string& rootDir, const std::string& writerGuid) {
    return (fs::path(devicesDir(rootDir)) / writerGuid).string();
}

std::string metadataPath(const std::string& rootDir, const std::string& writerGuid) {
    return (fs::path(writerDir(rootDir, writerGuid)) / (writerGuid + kMetadataExtension)).string();
}

std::string join(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

} // namespace layout
} // namespace deltaledger
