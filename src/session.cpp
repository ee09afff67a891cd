#include "session.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "protocol/frame.hpp"
#include <chrono>
#include <vector>

namespace session {

const char* to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "none";
        case FailureReason::PROTOCOL_ERROR: return "protocol error";
        case FailureReason::TRANSPORT_ERROR: return "transport error";
        case FailureReason::INCOMPLETE_TRANSFER: return "incomplete transfer";
        case FailureReason::DECODE_ERROR: return "decode error";
        case FailureReason::STORAGE_ERROR: return "storage error";
        case FailureReason::CANCELLED: return "cancelled";
    }
    return "unknown";
}

ReceiveSession::ReceiveSession(networking::Connection& conn, const storage::ImageStore& store,
                               imaging::ImageCodec& codec, SharedState shared,
                               const ReceiverCallbacks& callbacks, SessionSettings settings)
    : conn_(conn), store_(store), codec_(codec), shared_(shared),
      callbacks_(callbacks), settings_(settings) {}

TransferOutcome ReceiveSession::run() {
    TransferOutcome outcome;
    outcome.identity = conn_.peer();

    try {
        protocol::Handshake handshake = transfer::FrameStreamReceiver::receive_handshake(conn_, settings_.max_frame_size);
        outcome.identity = handshake.identity.empty() ? "unnamed" : handshake.identity;
        outcome.filename = handshake.filename;

        event_log::info("Transmitter '" + outcome.identity + "' (" + conn_.peer() + ") sending '" +
                        outcome.filename + "', frame size " + std::to_string(handshake.frame_size));
        if (callbacks_.on_status) {
            callbacks_.on_status("Receiving " + outcome.filename + " from " + outcome.identity);
        }

        paths_ = store_.prepare(outcome.identity, outcome.filename, std::chrono::system_clock::now());
        engine_.emplace(handshake.frame_size, outcome.identity + "/" + outcome.filename);

        receive_frames(outcome);
        if (!engine_->complete()) {
            engine_->abort();
            fail(outcome, FailureReason::INCOMPLETE_TRANSFER,
                 "Stream ended after " + std::to_string(outcome.received_frames) + " of " +
                 std::to_string(outcome.expected_frames) + " frames");
            dump_partial(outcome);
        } else {
            finish(outcome);
        }
    } catch (const errors::ProtocolError& e) {
        fail(outcome, FailureReason::PROTOCOL_ERROR, e.what());
    } catch (const errors::CancelledError& e) {
        if (engine_) engine_->abort();
        fail(outcome, FailureReason::CANCELLED, e.what());
        dump_partial(outcome);
    } catch (const errors::TransportError& e) {
        if (engine_) engine_->abort();
        fail(outcome, FailureReason::TRANSPORT_ERROR, e.what());
        dump_partial(outcome);
    } catch (const errors::StorageError& e) {
        fail(outcome, FailureReason::STORAGE_ERROR, e.what());
    }

    conn_.close();

    if (outcome.state != transfer::TransferState::COMPLETED && callbacks_.on_transfer_failed) {
        callbacks_.on_transfer_failed(outcome.identity, outcome.reason, outcome.detail);
    }
    return outcome;
}

void ReceiveSession::receive_frames(TransferOutcome& outcome) {
    grid::GridReconstructor& engine = *engine_;
    std::vector<uint8_t> frame(engine.payload_size() + protocol::HEADER_SIZE);

    while (!engine.complete()) {
        if (!transfer::FrameStreamReceiver::receive_frame(conn_, frame)) break;

        grid::FrameStatus status = engine.accept(frame);
        outcome.received_frames = engine.received_count();
        outcome.expected_frames = engine.expected_total_frames();

        if (status == grid::FrameStatus::REPLACED) {
            protocol::FrameHeader header = protocol::deserialize_header(frame.data());
            event_log::warn("Duplicate chunk at (R:" + std::to_string(header.row) + ", C:" +
                            std::to_string(header.col) + ") from " + outcome.identity + "; replaced");
        }

        if (settings_.keep_raw_frames) {
            try {
                store_.save_raw_frame(*paths_, protocol::deserialize_header(frame.data()), frame.data(), frame.size());
            } catch (const errors::StorageError& e) {
                event_log::error(std::string("Could not save raw frame: ") + e.what());
            }
        }

        if (callbacks_.on_frame_progress) {
            callbacks_.on_frame_progress(outcome.identity, outcome.received_frames, outcome.expected_frames);
        }
    }
}

void ReceiveSession::finish(TransferOutcome& outcome) {
    if (conn_.available() > 0) {
        event_log::warn("Unexpected data from " + outcome.identity + " after all " +
                        std::to_string(outcome.expected_frames) + " frames; closing connection");
    }

    grid::Reconstruction rebuilt = engine_->reconstruct();
    event_log::info("Reassembled " + outcome.filename + " from " + outcome.identity + ": " +
                    std::to_string(rebuilt.bytes.size()) + " bytes in a " + std::to_string(rebuilt.rows) +
                    "x" + std::to_string(rebuilt.columns) + " grid");

    imaging::ImagePtr image;
    try {
        image = codec_.decode(rebuilt.bytes);
    } catch (const errors::DecodeError& e) {
        fail(outcome, FailureReason::DECODE_ERROR, e.what());
        try {
            outcome.diagnostic_path = store_.save_diagnostic(*paths_, "FAILED_DECODE", rebuilt.bytes).string();
            event_log::warn("Saved raw combined bytes to " + outcome.diagnostic_path + " for inspection");
        } catch (const errors::StorageError& se) {
            event_log::error(std::string("Could not save undecodable bytes: ") + se.what());
        }
        return;
    }

    protocol::TransferRecord record;
    record.identity = outcome.identity;
    record.filename = outcome.filename;
    record.save_path = store_.save_image(*paths_, rebuilt.bytes).string();
    record.timestamp = storage::format_timestamp(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
    record.frames = static_cast<uint32_t>(outcome.received_frames);
    record.bytes = rebuilt.bytes.size();
    record.digest = digest::fingerprint(rebuilt.bytes);
    record.slot = static_cast<int>(shared_.slots.assign(outcome.identity, image));

    try {
        shared_.history.append(record);
    } catch (const errors::StorageError& e) {
        event_log::error(std::string("Transfer history not written: ") + e.what());
    }

    event_log::info("Saved " + record.save_path + " [" + digest::short_fingerprint(record.digest) + "]");

    outcome.state = transfer::TransferState::COMPLETED;
    outcome.reason = FailureReason::NONE;
    outcome.record = record;
    outcome.image = image;

    if (callbacks_.on_transfer_complete) {
        callbacks_.on_transfer_complete(outcome.identity, image, record);
    }
}

void ReceiveSession::dump_partial(TransferOutcome& outcome) {
    if (!engine_ || !paths_ || engine_->received_count() == 0) return;

    grid::Reconstruction partial = engine_->reconstruct();
    try {
        outcome.diagnostic_path = store_.save_diagnostic(*paths_, "PARTIAL", partial.bytes).string();
        event_log::warn("Partial data (" + std::to_string(engine_->received_count()) + " frames) kept at " +
                        outcome.diagnostic_path);
    } catch (const errors::StorageError& e) {
        event_log::error(std::string("Could not save partial data: ") + e.what());
    }
}

TransferOutcome& ReceiveSession::fail(TransferOutcome& outcome, FailureReason reason, const std::string& detail) {
    outcome.state = (reason == FailureReason::CANCELLED) ? transfer::TransferState::CANCELLED
                                                         : transfer::TransferState::FAILED;
    outcome.reason = reason;
    outcome.detail = detail;
    if (engine_) {
        outcome.received_frames = engine_->received_count();
        outcome.expected_frames = engine_->expected_total_frames();
    }
    event_log::error("Transfer from " + outcome.identity + " failed (" + to_string(reason) + "): " + detail);
    return outcome;
}

} // namespace session
