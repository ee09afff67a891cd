#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "protocol/frame.hpp"

namespace storage {

// Reduces an identity or filename to one safe path component: separators
// and control characters become '_', "." and ".." are refused, empty
// input becomes "unnamed".
std::string sanitize_component(const std::string& name);

// strftime-style formatting of a wall-clock time in local time
std::string format_timestamp(std::chrono::system_clock::time_point when, const char* format);

// Where the files of one image transfer go
struct TransferPaths {
    std::filesystem::path images_dir;  // <root>/<identity>/images
    std::filesystem::path frames_dir;  // <root>/<identity>/frames/<stem>_<stamp>
    std::string filename;              // sanitized target filename
    std::string stamp;                 // YYYYmmdd_HHMMSS
};

// Receiver output tree. Directories are created on first write.
// All writes throw errors::StorageError on failure.
class ImageStore {
public:
    explicit ImageStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    TransferPaths prepare(const std::string& identity, const std::string& filename,
                          std::chrono::system_clock::time_point started) const;

    // frame_<idx:04>_<row>_<col>.bin with the frame exactly as received
    std::filesystem::path save_raw_frame(const TransferPaths& paths, const protocol::FrameHeader& header,
                                         const uint8_t* frame, std::size_t size) const;

    std::filesystem::path save_image(const TransferPaths& paths, const std::vector<uint8_t>& bytes) const;

    // <prefix>_<filename>_<stamp>.bin in the transfer's frames directory
    std::filesystem::path save_diagnostic(const TransferPaths& paths, const std::string& prefix,
                                          const std::vector<uint8_t>& bytes) const;

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const uint8_t* data, std::size_t size);

} // namespace storage
