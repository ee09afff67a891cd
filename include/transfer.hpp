#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "connection.hpp"
#include "grid/splitter.hpp"
#include "protocol/handshake.hpp"

namespace transfer {

// Progress callback: frames_sent, total_frames
using FrameProgressCallback = std::function<void(std::size_t, std::size_t)>;

enum class TransferState {
    COMPLETED,
    CANCELLED,
    FAILED
};

const char* to_string(TransferState state);

class FrameStreamSender {
public:
    // Throws errors::ConfigurationError (fields) or errors::TransportError
    static void send_handshake(networking::Connection& conn, const protocol::Handshake& handshake);

    // Writes every frame back to back in splitter order. A write failure
    // throws errors::TransportError and the remaining frames are dropped.
    // cancel_flag is checked between frames.
    static TransferState send_frames(networking::Connection& conn, const grid::ChunkSplitter& splitter,
                                     FrameProgressCallback progress_cb = nullptr,
                                     const std::atomic<bool>* cancel_flag = nullptr);
};

class FrameStreamReceiver {
public:
    // Reads exactly HANDSHAKE_SIZE bytes. Throws errors::ProtocolError naming
    // the field the peer closed before, or for an unusable frame size.
    static protocol::Handshake receive_handshake(networking::Connection& conn, uint32_t max_frame_size);

    // Fills frame (already sized to frame_size). Returns false when the
    // peer closed the stream before or during the frame.
    static bool receive_frame(networking::Connection& conn, std::vector<uint8_t>& frame);
};

} // namespace transfer
