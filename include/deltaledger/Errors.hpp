#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace deltaledger {

// Error taxonomy. Recoverable kinds are caught at the layer that raised them
// and recorded by value in a LoadReport; the rest reach the caller.

class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& msg) : std::runtime_error(msg) {}
};

class LoadError : public LedgerError {
public:
    explicit LoadError(const std::string& msg) : LedgerError(msg) {}
};

class MalformedSnapshotError : public LoadError {
public:
    explicit MalformedSnapshotError(const std::string& msg) : LoadError("malformed snapshot: " + msg) {}
};

class MalformedDeltaError : public LoadError {
public:
    MalformedDeltaError(const std::string& segment, const std::string& msg)
        : LoadError("malformed delta " + segment + ": " + msg), segment_(segment) {}

    const std::string& segment() const { return segment_; }

private:
    std::string segment_;
};

class UnknownEntityTypeError : public LedgerError {
public:
    UnknownEntityTypeError(const std::string& entityType, const std::string& entityId)
        : LedgerError("unknown entity type '" + entityType + "' for entity " + entityId),
          entityType_(entityType), entityId_(entityId) {}

    const std::string& entityType() const { return entityType_; }
    const std::string& entityId() const { return entityId_; }

private:
    std::string entityType_;
    std::string entityId_;
};

class DeviceMetadataCorruptError : public LedgerError {
public:
    DeviceMetadataCorruptError(const std::string& path, const std::string& msg)
        : LedgerError("device metadata " + path + ": " + msg), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class CommitError : public LedgerError {
public:
    explicit CommitError(const std::string& msg) : LedgerError(msg) {}
};

class WriteConflictError : public CommitError {
public:
    explicit WriteConflictError(const std::string& msg) : CommitError("write conflict: " + msg) {}
};

class VersionGapError : public LedgerError {
public:
    VersionGapError(const std::string& segment, uint64_t expectedStart, uint64_t actualStart)
        : LedgerError("version gap at " + segment + ": expected start " + std::to_string(expectedStart) +
                      ", found " + std::to_string(actualStart)),
          segment_(segment), expectedStart_(expectedStart), actualStart_(actualStart) {}

    const std::string& segment() const { return segment_; }
    uint64_t expectedStart() const { return expectedStart_; }
    uint64_t actualStart() const { return actualStart_; }

private:
    std::string segment_;
    uint64_t expectedStart_;
    uint64_t actualStart_;
};

class FileSystemError : public LedgerError {
public:
    FileSystemError(const std::string& path, const std::string& msg)
        : LedgerError(msg + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace deltaledger
