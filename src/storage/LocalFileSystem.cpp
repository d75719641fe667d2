#include "deltaledger/FileSystem.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include "deltaledger/Errors.hpp"

namespace fs = std::filesystem;

namespace deltaledger {

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<std::string> LocalFileSystem::listDirectory(const std::string& path) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) throw FileSystemError(path, "cannot list directory (" + ec.message() + ")");
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) throw FileSystemError(path, "directory listing failed (" + ec.message() + ")");
        names.push_back(it->path().filename().string());
    }
    return names;
}

std::string LocalFileSystem::readFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw FileSystemError(path, "cannot open file for reading");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw FileSystemError(path, "read failed");
    return buffer.str();
}

void LocalFileSystem::writeFileAtomic(const std::string& path, const std::string& contents) {
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";

    // leftover from a crashed write
    std::error_code ec;
    fs::remove(tmp, ec);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw FileSystemError(tmp.string(), "cannot open file for writing");
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw FileSystemError(tmp.string(), "write failed");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FileSystemError(path, "rename failed (" + ec.message() + ")");
    }
}

void LocalFileSystem::createDirectories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw FileSystemError(path, "cannot create directory (" + ec.message() + ")");
}

bool LocalFileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        std::cerr << "LocalFileSystem: failed to remove " << path << " (" << ec.message() << ")\n";
        return false;
    }
    return removed;
}

std::shared_ptr<FileSystem> defaultFileSystem() {
    static std::shared_ptr<FileSystem> instance = std::make_shared<LocalFileSystem>();
    return instance;
}

} // namespace deltaledger
