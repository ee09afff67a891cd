#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "connection.hpp"
#include "feed_slots.hpp"
#include "grid/reconstruction.hpp"
#include "imaging.hpp"
#include "protocol/transfer_record.hpp"
#include "storage.hpp"
#include "transfer.hpp"
#include "transfer_history.hpp"

namespace session {

enum class FailureReason {
    NONE,
    PROTOCOL_ERROR,
    TRANSPORT_ERROR,
    INCOMPLETE_TRANSFER,
    DECODE_ERROR,
    STORAGE_ERROR,
    CANCELLED
};

const char* to_string(FailureReason reason);

struct TransferOutcome {
    transfer::TransferState state = transfer::TransferState::FAILED;
    FailureReason reason = FailureReason::NONE;
    std::string identity;         // peer address until the handshake names it
    std::string filename;
    std::string detail;
    std::string diagnostic_path;  // raw or partial bytes kept for inspection
    std::size_t received_frames = 0;
    std::size_t expected_frames = 0;
    protocol::TransferRecord record;  // filled on success
    imaging::ImagePtr image;          // filled on success
};

struct ReceiverCallbacks {
    std::function<void(const std::string& identity, std::size_t received, std::size_t expected)> on_frame_progress;
    std::function<void(const std::string& identity, imaging::ImagePtr image,
                       const protocol::TransferRecord& record)> on_transfer_complete;
    std::function<void(const std::string& identity, FailureReason reason,
                       const std::string& detail)> on_transfer_failed;
    std::function<void(const std::string&)> on_status;
};

// State every handling unit shares. Owned by whoever runs the receiver.
struct SharedState {
    feed::FeedSlotTable& slots;
    history::TransferHistory& history;
};

struct SessionSettings {
    uint32_t max_frame_size = 16 * 1024 * 1024;
    bool keep_raw_frames = true;
};

// One connection, one image: handshake, frames, reconstruction, decode,
// persist, feed slot update. Per-session failures end up in the outcome,
// never in an exception.
class ReceiveSession {
public:
    ReceiveSession(networking::Connection& conn, const storage::ImageStore& store,
                   imaging::ImageCodec& codec, SharedState shared,
                   const ReceiverCallbacks& callbacks, SessionSettings settings);

    TransferOutcome run();

private:
    void receive_frames(TransferOutcome& outcome);
    void finish(TransferOutcome& outcome);
    void dump_partial(TransferOutcome& outcome);
    TransferOutcome& fail(TransferOutcome& outcome, FailureReason reason, const std::string& detail);

    networking::Connection& conn_;
    const storage::ImageStore& store_;
    imaging::ImageCodec& codec_;
    SharedState shared_;
    const ReceiverCallbacks& callbacks_;
    SessionSettings settings_;

    std::optional<storage::TransferPaths> paths_;
    std::optional<grid::GridReconstructor> engine_;
};

} // namespace session
