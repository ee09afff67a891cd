#include "transfer.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include <array>
#include <chrono>

namespace transfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::COMPLETED: return "completed";
        case TransferState::CANCELLED: return "cancelled";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

void FrameStreamSender::send_handshake(networking::Connection& conn, const protocol::Handshake& handshake) {
    auto buf = protocol::serialize_handshake(handshake);
    conn.write_all(buf.data(), buf.size());
}

TransferState FrameStreamSender::send_frames(networking::Connection& conn, const grid::ChunkSplitter& splitter,
                                             FrameProgressCallback progress_cb,
                                             const std::atomic<bool>* cancel_flag) {
    const std::size_t total = splitter.total_frames();
    std::size_t sent = 0;
    auto last_cb_time = std::chrono::steady_clock::now();

    for (const grid::Frame& frame : splitter) {
        if (cancel_flag && cancel_flag->load()) {
            event_log::warn("Sending cancelled after " + std::to_string(sent) + "/" + std::to_string(total) + " frames");
            return TransferState::CANCELLED;
        }

        conn.write_all(frame.bytes.data(), frame.bytes.size());
        ++sent;

        if (progress_cb) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
            if (elapsed_since_cb >= 300 || sent == total) {
                progress_cb(sent, total);
                last_cb_time = now;
            }
        }
    }
    return TransferState::COMPLETED;
}

protocol::Handshake FrameStreamReceiver::receive_handshake(networking::Connection& conn, uint32_t max_frame_size) {
    std::array<uint8_t, protocol::HANDSHAKE_SIZE> buf{};
    uint8_t* identity_field = buf.data();
    uint8_t* filename_field = identity_field + protocol::IDENTITY_FIELD_SIZE;
    uint8_t* size_field = filename_field + protocol::FILENAME_FIELD_SIZE;

    if (conn.read_exact(identity_field, protocol::IDENTITY_FIELD_SIZE) < protocol::IDENTITY_FIELD_SIZE) {
        throw errors::ProtocolError("Connection closed before identity", errors::HandshakeStage::IDENTITY);
    }
    if (conn.read_exact(filename_field, protocol::FILENAME_FIELD_SIZE) < protocol::FILENAME_FIELD_SIZE) {
        throw errors::ProtocolError("Connection closed before filename", errors::HandshakeStage::FILENAME);
    }
    if (conn.read_exact(size_field, protocol::FRAME_SIZE_FIELD_SIZE) < protocol::FRAME_SIZE_FIELD_SIZE) {
        throw errors::ProtocolError("Connection closed before size", errors::HandshakeStage::FRAME_SIZE);
    }

    protocol::Handshake handshake;
    handshake.identity = protocol::decode_text_field(identity_field, protocol::IDENTITY_FIELD_SIZE);
    handshake.filename = protocol::decode_text_field(filename_field, protocol::FILENAME_FIELD_SIZE);
    handshake.frame_size = protocol::decode_frame_size(size_field);

    protocol::validate_frame_size(handshake.frame_size, max_frame_size);
    return handshake;
}

bool FrameStreamReceiver::receive_frame(networking::Connection& conn, std::vector<uint8_t>& frame) {
    std::size_t got = conn.read_exact(frame.data(), frame.size());
    if (got == frame.size()) return true;
    if (got > 0) {
        event_log::warn("Connection from " + conn.peer() + " closed mid-frame (" + std::to_string(got) +
                        " of " + std::to_string(frame.size()) + " bytes)");
    }
    return false;
}

} // namespace transfer
