#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <vector>

namespace grid {

// One wire-ready frame: header + zero-padded payload
struct Frame {
    std::size_t index;
    uint16_t row;
    uint16_t col;
    std::vector<uint8_t> bytes;
};

// Slices an encoded image into fixed-size frames laid out row-major on a
// grid `columns` wide. Frames are generated on demand from the shared
// input, so iterating again regenerates identical frames.
class ChunkSplitter {
public:
    // Throws errors::ConfigurationError when frame_size leaves no payload,
    // columns is outside 1..65535, or the image needs more than 65535 frames.
    ChunkSplitter(std::shared_ptr<const std::vector<uint8_t>> data, uint32_t frame_size, uint32_t columns);
    ChunkSplitter(std::vector<uint8_t> data, uint32_t frame_size, uint32_t columns);

    uint32_t frame_size() const { return frame_size_; }
    uint32_t columns() const { return columns_; }
    std::size_t payload_size() const { return payload_size_; }
    std::size_t total_frames() const { return total_frames_; }
    std::size_t data_size() const { return data_->size(); }

    Frame frame_at(std::size_t index) const;

    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Frame;
        using difference_type = std::ptrdiff_t;
        using pointer = const Frame*;
        using reference = Frame;

        const_iterator(const ChunkSplitter* owner, std::size_t index) : owner_(owner), index_(index) {}

        Frame operator*() const { return owner_->frame_at(index_); }
        const_iterator& operator++() { ++index_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index_; return tmp; }
        bool operator==(const const_iterator& other) const { return index_ == other.index_ && owner_ == other.owner_; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const ChunkSplitter* owner_;
        std::size_t index_;
    };

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, total_frames_); }

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
    uint32_t frame_size_;
    uint32_t columns_;
    std::size_t payload_size_;
    std::size_t total_frames_;
};

} // namespace grid
