#include "storage.hpp"
#include "errors.hpp"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace storage {

std::string sanitize_component(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (ch == '/' || ch == '\\' || ch == ':' || c < 0x20 || c == 0x7F) {
            out += '_';
        } else {
            out += ch;
        }
    }

    // Trim surrounding whitespace
    auto first = out.find_first_not_of(" \t");
    if (first == std::string::npos) return "unnamed";
    out = out.substr(first, out.find_last_not_of(" \t") - first + 1);

    if (out == "." || out == "..") return "unnamed";
    return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point when, const char* format) {
    auto t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

void write_file(const fs::path& path, const uint8_t* data, std::size_t size) {
    std::error_code ec;
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw errors::StorageError("Could not create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw errors::StorageError("Could not open file for writing: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file.close();
    if (!file) {
        throw errors::StorageError("Write failed: " + path.string());
    }
}

// ─── ImageStore ─────────────────────────────────────────────────────────────

ImageStore::ImageStore(fs::path root) : root_(std::move(root)) {}

TransferPaths ImageStore::prepare(const std::string& identity, const std::string& filename,
                                  std::chrono::system_clock::time_point started) const {
    TransferPaths paths;
    paths.filename = sanitize_component(filename);
    paths.stamp = format_timestamp(started, "%Y%m%d_%H%M%S");

    fs::path identity_dir = root_ / sanitize_component(identity);
    std::string stem = fs::path(paths.filename).stem().string();
    if (stem.empty()) stem = paths.filename;

    paths.images_dir = identity_dir / "images";
    paths.frames_dir = identity_dir / "frames" / (stem + "_" + paths.stamp);
    return paths;
}

fs::path ImageStore::save_raw_frame(const TransferPaths& paths, const protocol::FrameHeader& header,
                                    const uint8_t* frame, std::size_t size) const {
    char name[64];
    std::snprintf(name, sizeof(name), "frame_%04u_%u_%u.bin",
                  static_cast<unsigned>(header.frame_index),
                  static_cast<unsigned>(header.row),
                  static_cast<unsigned>(header.col));
    fs::path path = paths.frames_dir / name;
    write_file(path, frame, size);
    return path;
}

fs::path ImageStore::save_image(const TransferPaths& paths, const std::vector<uint8_t>& bytes) const {
    fs::path path = paths.images_dir / paths.filename;
    write_file(path, bytes.data(), bytes.size());
    return path;
}

fs::path ImageStore::save_diagnostic(const TransferPaths& paths, const std::string& prefix,
                                     const std::vector<uint8_t>& bytes) const {
    fs::path path = paths.frames_dir / (prefix + "_" + paths.filename + "_" + paths.stamp + ".bin");
    write_file(path, bytes.data(), bytes.size());
    return path;
}

} // namespace storage
