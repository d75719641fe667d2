#pragma once

#include <memory>
#include <string>
#include <vector>

namespace deltaledger {

// Filesystem operations the engine needs. Supplied by the caller so that
// locking and backups stay outside the core. Failures throw FileSystemError.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual bool isDirectory(const std::string& path) const = 0;

    // Entry names (not paths) in no particular order.
    virtual std::vector<std::string> listDirectory(const std::string& path) const = 0;

    virtual std::string readFile(const std::string& path) const = 0;

    // Write to a temporary sibling, then rename over the target.
    virtual void writeFileAtomic(const std::string& path, const std::string& contents) = 0;

    virtual void createDirectories(const std::string& path) = 0;

    // Returns false if the file did not exist.
    virtual bool removeFile(const std::string& path) = 0;
};

// std::filesystem backed implementation.
class LocalFileSystem : public FileSystem {
public:
    bool exists(const std::string& path) const override;
    bool isDirectory(const std::string& path) const override;
    std::vector<std::string> listDirectory(const std::string& path) const override;
    std::string readFile(const std::string& path) const override;
    void writeFileAtomic(const std::string& path, const std::string& contents) override;
    void createDirectories(const std::string& path) override;
    bool removeFile(const std::string& path) override;
};

std::shared_ptr<FileSystem> defaultFileSystem();

} // namespace deltaledger
