#pragma once

#include <string>

namespace deltaledger {
namespace layout {

// <root>/data/Full.snapshot
std::string snapshotPath(const std::string& rootDir);

// <root>/devices
std::string devicesDir(const std::string& rootDir);

// <root>/devices/<guid>
std::string writerDir(const std::string& rootDir, const std::string& writerGuid);

// <root>/devices/<guid>/<guid>.meta
std::string metadataPath(const std::string& rootDir, const std::string& writerGuid);

std::string join(const std::string& dir, const std::string& name);

constexpr const char* kMetadataExtension = ".meta";
constexpr const char* kSegmentExtension = ".delta";

} // namespace layout
} // namespace deltaledger
