#include "grid/reconstruction.hpp"
#include "protocol/frame.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include <algorithm>

namespace grid {

const char* to_string(ReconstructionState state) {
    switch (state) {
        case ReconstructionState::AWAITING_FIRST_FRAME: return "awaiting first frame";
        case ReconstructionState::ACCUMULATING: return "accumulating";
        case ReconstructionState::COMPLETE: return "complete";
        case ReconstructionState::ABORTED: return "aborted";
    }
    return "unknown";
}

GridReconstructor::GridReconstructor(uint32_t frame_size, std::string label)
    : payload_size_(0), label_(std::move(label)) {
    if (frame_size <= protocol::HEADER_SIZE) {
        throw errors::ProtocolError("frame size " + std::to_string(frame_size) + " carries no payload");
    }
    payload_size_ = frame_size - protocol::HEADER_SIZE;
}

FrameStatus GridReconstructor::accept(const uint8_t* frame, std::size_t size) {
    if (size != payload_size_ + protocol::HEADER_SIZE) {
        throw errors::ProtocolError("frame of " + std::to_string(size) + " bytes, expected " +
                                    std::to_string(payload_size_ + protocol::HEADER_SIZE));
    }
    if (state_ == ReconstructionState::COMPLETE || state_ == ReconstructionState::ABORTED) {
        return FrameStatus::IGNORED;
    }

    protocol::FrameHeader header = protocol::deserialize_header(frame);

    if (state_ == ReconstructionState::AWAITING_FIRST_FRAME) {
        expected_total_frames_ = header.total_frames;
        state_ = ReconstructionState::ACCUMULATING;
        event_log::info("Expecting " + std::to_string(expected_total_frames_) + " total frames for " + label_);
        if (expected_total_frames_ == 0) {
            event_log::warn("First frame of " + label_ + " declares zero total frames; transfer cannot complete");
        }
    } else if (header.total_frames != expected_total_frames_) {
        std::string warning = "Total frames mismatch for " + label_ + ": expected " +
                              std::to_string(expected_total_frames_) + ", got " +
                              std::to_string(header.total_frames) + " in frame (R:" +
                              std::to_string(header.row) + ", C:" + std::to_string(header.col) +
                              "). Continuing with first received total.";
        event_log::warn(warning);
        mismatch_warnings_.push_back(std::move(warning));
    }

    const uint8_t* payload = frame + protocol::HEADER_SIZE;
    Position position{header.row, header.col};
    auto result = chunks_.insert_or_assign(position, std::vector<uint8_t>(payload, payload + payload_size_));

    max_row_ = std::max(max_row_, static_cast<int>(header.row));
    max_col_ = std::max(max_col_, static_cast<int>(header.col));

    if (chunks_.size() == expected_total_frames_) {
        state_ = ReconstructionState::COMPLETE;
        return FrameStatus::COMPLETED;
    }
    return result.second ? FrameStatus::ACCEPTED : FrameStatus::REPLACED;
}

void GridReconstructor::abort() {
    if (state_ != ReconstructionState::COMPLETE) {
        state_ = ReconstructionState::ABORTED;
    }
}

Reconstruction GridReconstructor::reconstruct() const {
    Reconstruction out;
    if (chunks_.empty()) return out;

    out.rows = static_cast<std::size_t>(max_row_ + 1);
    out.columns = static_cast<std::size_t>(max_col_ + 1);
    out.bytes.reserve(chunks_.size() * payload_size_);

    for (std::size_t r = 0; r < out.rows; ++r) {
        for (std::size_t c = 0; c < out.columns; ++c) {
            auto it = chunks_.find(Position{static_cast<uint16_t>(r), static_cast<uint16_t>(c)});
            if (it != chunks_.end()) {
                out.bytes.insert(out.bytes.end(), it->second.begin(), it->second.end());
                continue;
            }
            // Unfilled cells after the last chunk of a partial final row
            std::size_t linear = r * out.columns + c;
            if (expected_total_frames_ > 0 && linear >= expected_total_frames_) continue;

            std::string warning = "Missing chunk at (Row:" + std::to_string(r) + ", Col:" +
                                  std::to_string(c) + ") during reconstruction for " + label_ +
                                  ". Inserting empty bytes.";
            event_log::error(warning);
            out.warnings.push_back(std::move(warning));
        }
    }
    return out;
}

} // namespace grid
