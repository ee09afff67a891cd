#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace grid {

enum class ReconstructionState {
    AWAITING_FIRST_FRAME,
    ACCUMULATING,
    COMPLETE,
    ABORTED
};

enum class FrameStatus {
    ACCEPTED,  // filled a new grid position
    REPLACED,  // position already held a chunk; overwritten
    COMPLETED, // this frame filled the last expected position
    IGNORED    // arrived after COMPLETE or ABORTED
};

struct Reconstruction {
    std::vector<uint8_t> bytes;
    std::vector<std::string> warnings; // one per grid position never received
    std::size_t rows = 0;
    std::size_t columns = 0;
};

const char* to_string(ReconstructionState state);

// Accumulates the frames of one image keyed by (row, col).
// Not thread-safe: each handling unit owns its own instance.
class GridReconstructor {
public:
    explicit GridReconstructor(uint32_t frame_size, std::string label = "image");

    // frame must be exactly frame_size bytes (errors::ProtocolError otherwise)
    FrameStatus accept(const uint8_t* frame, std::size_t size);
    FrameStatus accept(const std::vector<uint8_t>& frame) { return accept(frame.data(), frame.size()); }

    // Stream ended before completion
    void abort();

    ReconstructionState state() const { return state_; }
    bool complete() const { return state_ == ReconstructionState::COMPLETE; }
    std::size_t received_count() const { return chunks_.size(); }
    std::size_t expected_total_frames() const { return expected_total_frames_; }
    std::size_t payload_size() const { return payload_size_; }
    int max_row() const { return max_row_; }
    int max_col() const { return max_col_; }

    // total_frames disagreements seen so far
    const std::vector<std::string>& mismatch_warnings() const { return mismatch_warnings_; }

    // Concatenates chunks row-major over 0..max_row x 0..max_col. Any absent
    // position contributes nothing and adds a warning, except the unfilled
    // tail of a partial last row (linear index >= expected total frames):
    // those cells were never sent, so they are skipped without a warning.
    // With no total known yet every absent cell warns.
    Reconstruction reconstruct() const;

private:
    using Position = std::pair<uint16_t, uint16_t>;

    std::size_t payload_size_;
    std::string label_;
    ReconstructionState state_ = ReconstructionState::AWAITING_FIRST_FRAME;
    std::size_t expected_total_frames_ = 0;
    int max_row_ = -1;
    int max_col_ = -1;
    std::map<Position, std::vector<uint8_t>> chunks_;
    std::vector<std::string> mismatch_warnings_;
};

} // namespace grid
