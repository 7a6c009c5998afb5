#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "metadata.hpp"

// Snapshot file layout (native byte order):
//   char[8]   magic "SDXSNAP1"
//   uint32    format version
//   uint32    dim
//   uint32    count
//   float32   count * dim raw vectors, row i = position i
//   uint64    length of the JSON document table
//   bytes     {"documents": [{"id", "content", "metadata", "position"}, ...]}
// Readers ignore unknown JSON keys; later versions keep this prefix.

constexpr uint32_t kSnapshotVersion = 1;

struct SnapshotDocument {
    std::string id;
    std::string content;
    Metadata metadata;
};

struct SnapshotData {
    std::vector<float> data;                 // Contiguous float array: [v0[0..dim-1], v1[0..dim-1], ...]
    std::vector<SnapshotDocument> documents; // documents[i] owns row i
    uint32_t dim = 0;
    uint32_t count = 0;
};

// Writes to path + ".tmp" and renames over path. Throws SnapshotIoError.
void save_snapshot(const std::string& path, const SnapshotData& snapshot);

// nullopt when path does not exist. Throws CorruptSnapshotError when the file
// is present but cannot be decoded.
std::optional<SnapshotData> load_snapshot(const std::string& path);

// L2 norm of a vector
float compute_norm(const float* vector, uint32_t dim);
