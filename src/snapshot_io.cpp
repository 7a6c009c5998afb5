#include "snapshot_io.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <atomic>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char kMagic[8] = {'S', 'D', 'X', 'S', 'N', 'A', 'P', '1'};
constexpr size_t kHeaderSize = sizeof(kMagic) + 3 * sizeof(uint32_t);
constexpr uint32_t kMaxDim = 100000;
constexpr uint32_t kMaxCount = 100000000;

template <typename T>
void write_pod(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool read_pod(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return !in.fail();
}

}

void save_snapshot(const std::string& path, const SnapshotData& snapshot) {
    if (snapshot.documents.size() != snapshot.count ||
        snapshot.data.size() != static_cast<size_t>(snapshot.count) * snapshot.dim) {
        throw SnapshotIoError("Snapshot is inconsistent: count=" + std::to_string(snapshot.count) +
                              ", documents=" + std::to_string(snapshot.documents.size()));
    }

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw SnapshotIoError("Failed to create directory " + target.parent_path().string() +
                                  ": " + ec.message());
        }
    }

    json table;
    table["documents"] = json::array();
    for (uint32_t i = 0; i < snapshot.count; i++) {
        const auto& doc = snapshot.documents[i];
        table["documents"].push_back({
            {"id", doc.id},
            {"content", doc.content},
            {"metadata", doc.metadata.to_json()},
            {"position", i}
        });
    }
    std::string table_bytes = table.dump();

    // Each writer gets its own temporary file; the rename is atomic, so the last save wins
    static std::atomic<uint64_t> save_counter{0};
    std::string tmp_path = path + ".tmp." +
                           std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id())) +
                           "." + std::to_string(save_counter.fetch_add(1));
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw SnapshotIoError("Failed to open snapshot for writing: " + tmp_path);
        }

        out.write(kMagic, sizeof(kMagic));
        write_pod(out, kSnapshotVersion);
        write_pod(out, snapshot.dim);
        write_pod(out, snapshot.count);
        out.write(reinterpret_cast<const char*>(snapshot.data.data()),
                  static_cast<std::streamsize>(snapshot.data.size() * sizeof(float)));
        write_pod(out, static_cast<uint64_t>(table_bytes.size()));
        out.write(table_bytes.data(), static_cast<std::streamsize>(table_bytes.size()));

        out.flush();
        if (out.fail()) {
            throw SnapshotIoError("Failed to write snapshot: " + tmp_path);
        }
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw SnapshotIoError("Failed to move snapshot into place: " + path);
    }

    LOG_INFO("Saved snapshot: " + std::to_string(snapshot.count) + " documents, dim=" +
             std::to_string(snapshot.dim) + " -> " + path);
}

std::optional<SnapshotData> load_snapshot(const std::string& path) {
    if (!fs::exists(path)) {
        LOG_INFO("Snapshot file does not exist: " + path);
        return std::nullopt;
    }

    std::error_code ec;
    auto file_size = fs::file_size(path, ec);
    if (ec) {
        throw CorruptSnapshotError(path, "cannot stat: " + ec.message());
    }
    if (file_size < kHeaderSize) {
        throw CorruptSnapshotError(path, "file too small (size: " + std::to_string(file_size) + ")");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CorruptSnapshotError(path, "cannot be opened");
    }

    char magic[sizeof(kMagic)];
    file.read(magic, sizeof(magic));
    if (file.fail() || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw CorruptSnapshotError(path, "bad magic");
    }

    uint32_t version, dim, count;
    if (!read_pod(file, version) || !read_pod(file, dim) || !read_pod(file, count)) {
        throw CorruptSnapshotError(path, "failed to read header");
    }
    if (version == 0) {
        throw CorruptSnapshotError(path, "invalid version 0");
    }
    if (version > kSnapshotVersion) {
        LOG_WARN("Snapshot " + path + " has newer version " + std::to_string(version) +
                 ", reading known fields only");
    }
    if (dim > kMaxDim) {
        throw CorruptSnapshotError(path, "invalid dimension in header: " + std::to_string(dim));
    }
    if (count > kMaxCount || (count > 0 && dim == 0)) {
        throw CorruptSnapshotError(path, "invalid count in header: " + std::to_string(count));
    }

    size_t total_floats = static_cast<size_t>(count) * static_cast<size_t>(dim);
    size_t expected_min = kHeaderSize + total_floats * sizeof(float) + sizeof(uint64_t);
    if (file_size < expected_min) {
        throw CorruptSnapshotError(path, "smaller than expected: expected at least " +
                                   std::to_string(expected_min) + " bytes, got " +
                                   std::to_string(file_size));
    }

    SnapshotData snapshot;
    snapshot.dim = dim;
    snapshot.count = count;
    snapshot.data.resize(total_floats);

    file.read(reinterpret_cast<char*>(snapshot.data.data()),
              static_cast<std::streamsize>(total_floats * sizeof(float)));
    if (file.fail() || file.gcount() != static_cast<std::streamsize>(total_floats * sizeof(float))) {
        throw CorruptSnapshotError(path, "incomplete vector data");
    }

    uint64_t table_size = 0;
    if (!read_pod(file, table_size)) {
        throw CorruptSnapshotError(path, "missing document table length");
    }
    if (table_size > file_size - expected_min) {
        throw CorruptSnapshotError(path, "document table length exceeds file size");
    }

    std::string table_bytes(static_cast<size_t>(table_size), '\0');
    file.read(table_bytes.data(), static_cast<std::streamsize>(table_size));
    if (file.fail()) {
        throw CorruptSnapshotError(path, "incomplete document table");
    }

    try {
        json table = json::parse(table_bytes);
        const json& docs = table.at("documents");
        if (!docs.is_array() || docs.size() != count) {
            throw CorruptSnapshotError(path, "document table does not match vector count");
        }

        snapshot.documents.resize(count);
        std::vector<bool> seen(count, false);
        for (const auto& entry : docs) {
            uint32_t position = entry.at("position").get<uint32_t>();
            if (position >= count || seen[position]) {
                throw CorruptSnapshotError(path, "bad document position " + std::to_string(position));
            }
            seen[position] = true;

            SnapshotDocument& doc = snapshot.documents[position];
            doc.id = entry.at("id").get<std::string>();
            doc.content = entry.at("content").get<std::string>();
            doc.metadata = Metadata::from_json(entry.value("metadata", json::object()));
        }
    } catch (const json::exception& e) {
        throw CorruptSnapshotError(path, std::string("bad document table: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw CorruptSnapshotError(path, std::string("bad metadata: ") + e.what());
    }

    LOG_INFO("Loaded snapshot: " + std::to_string(count) + " documents, dim=" + std::to_string(dim));
    return snapshot;
}

float compute_norm(const float* vector, uint32_t dim) {
    float sum_squares = 0.0f;
    for (uint32_t i = 0; i < dim; i++) {
        sum_squares += vector[i] * vector[i];
    }
    return std::sqrt(sum_squares);
}
