#pragma once

#include <stdexcept>
#include <string>

// Base for every engine failure. code() is stable and goes out on the wire.
class SemdexError : public std::runtime_error {
public:
    SemdexError(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

class DuplicateIdError : public SemdexError {
public:
    explicit DuplicateIdError(const std::string& id)
        : SemdexError("DUPLICATE_ID", "Document id already present: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class CorruptSnapshotError : public SemdexError {
public:
    CorruptSnapshotError(const std::string& path, const std::string& reason)
        : SemdexError("CORRUPT_SNAPSHOT", "Corrupt snapshot " + path + ": " + reason) {}
};

class SnapshotIoError : public SemdexError {
public:
    explicit SnapshotIoError(const std::string& message)
        : SemdexError("SNAPSHOT_IO", message) {}
};

class DimensionMismatchError : public SemdexError {
public:
    DimensionMismatchError(size_t expected, size_t got)
        : SemdexError("DIMENSION_MISMATCH",
                      "Vector dimension mismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(got)) {}
    explicit DimensionMismatchError(const std::string& message)
        : SemdexError("DIMENSION_MISMATCH", message) {}
};

class EmbeddingError : public SemdexError {
public:
    explicit EmbeddingError(const std::string& message)
        : SemdexError("EMBEDDING_FAILED", message) {}
};

class ConfigError : public SemdexError {
public:
    explicit ConfigError(const std::string& message)
        : SemdexError("INVALID_CONFIG", message) {}
};
