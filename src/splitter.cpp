#include "grid/splitter.hpp"
#include "protocol/frame.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace grid {

ChunkSplitter::ChunkSplitter(std::shared_ptr<const std::vector<uint8_t>> data, uint32_t frame_size, uint32_t columns)
    : data_(std::move(data)), frame_size_(frame_size), columns_(columns), payload_size_(0), total_frames_(0) {
    if (!data_) {
        throw std::invalid_argument("ChunkSplitter requires image data");
    }
    if (frame_size_ <= protocol::HEADER_SIZE) {
        throw errors::ConfigurationError("frame size " + std::to_string(frame_size_) +
                                         " leaves no room for payload; it must exceed the " +
                                         std::to_string(protocol::HEADER_SIZE) + "-byte header");
    }
    if (columns_ == 0 || columns_ > protocol::MAX_FIELD_VALUE) {
        throw errors::ConfigurationError("column count must be between 1 and 65535, got " +
                                         std::to_string(columns_));
    }

    payload_size_ = frame_size_ - protocol::HEADER_SIZE;
    total_frames_ = (data_->size() + payload_size_ - 1) / payload_size_;

    if (total_frames_ > protocol::MAX_FIELD_VALUE) {
        throw errors::ConfigurationError("image of " + std::to_string(data_->size()) + " bytes needs " +
                                         std::to_string(total_frames_) +
                                         " frames; raise the frame size (limit is 65535 frames)");
    }
}

ChunkSplitter::ChunkSplitter(std::vector<uint8_t> data, uint32_t frame_size, uint32_t columns)
    : ChunkSplitter(std::make_shared<const std::vector<uint8_t>>(std::move(data)), frame_size, columns) {}

Frame ChunkSplitter::frame_at(std::size_t index) const {
    if (index >= total_frames_) {
        throw std::out_of_range("frame index " + std::to_string(index) + " beyond " +
                                std::to_string(total_frames_) + " frames");
    }

    Frame frame;
    frame.index = index;
    frame.row = static_cast<uint16_t>(index / columns_);
    frame.col = static_cast<uint16_t>(index % columns_);

    auto header = protocol::serialize_header(protocol::make_header(
        static_cast<uint32_t>(index), frame.row, frame.col, static_cast<uint32_t>(total_frames_)));

    // Zero-filled, so the final chunk comes out padded
    frame.bytes.assign(frame_size_, 0);
    std::memcpy(frame.bytes.data(), header.data(), header.size());

    std::size_t offset = index * payload_size_;
    std::size_t len = std::min(payload_size_, data_->size() - offset);
    std::memcpy(frame.bytes.data() + protocol::HEADER_SIZE, data_->data() + offset, len);

    return frame;
}

} // namespace grid
