#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "connection.hpp"
#include "imaging.hpp"
#include "session.hpp"
#include "storage.hpp"
#include "transfer.hpp"

namespace networking {

using StatusCallback = std::function<void(const std::string&)>;

// Progress callback: filename, frames_sent, total_frames
using ProgressCallback = std::function<void(const std::string&, std::size_t, std::size_t)>;

struct TransmitterCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
    std::function<void(const std::string& filename)> on_complete;
    std::function<void(const std::string& filename, const std::string& error)> on_error;
};

// Accepts transmitters and runs one ReceiveSession per connection on its
// own thread. The feed slot table and transfer history in `shared` are
// the only state the sessions have in common.
class ConnectionManager {
public:
    // Throws errors::ConfigurationError if cfg does not validate
    ConnectionManager(config::ReceiverConfig cfg, imaging::ImageCodec& codec,
                      session::SharedState shared, session::ReceiverCallbacks callbacks = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Binds and starts the accept loop. Throws errors::TransportError if
    // the address cannot be bound.
    void start();

    // Stops accepting, lets running sessions finish or abort at a frame
    // boundary, waits up to drain_timeout_ms, then forces the rest out.
    // Returns the peers that had not finished within the drain timeout.
    std::vector<std::string> stop();

    bool is_running() const { return running_; }
    unsigned short port() const { return port_; }
    std::size_t active_sessions() const;

private:
    struct Unit {
        std::unique_ptr<Connection> conn;
        std::string peer;
        std::thread thread;
        bool done = false;
    };

    void accept_loop();
    void launch(std::unique_ptr<Connection> conn);
    void run_unit(Unit& unit);
    void reap_finished();

    config::ReceiverConfig cfg_;
    imaging::ImageCodec& codec_;
    session::SharedState shared_;
    session::ReceiverCallbacks callbacks_;
    storage::ImageStore store_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> aborting_{false};
    std::atomic<unsigned short> port_{0};

    mutable std::mutex units_mutex_;
    std::condition_variable units_cv_;
    std::list<std::unique_ptr<Unit>> units_;
};

// Sends images to a receiver, one connection per image.
class Transmitter {
public:
    // Throws errors::ConfigurationError if cfg does not validate. codec is
    // only needed when cfg.reencode is set.
    explicit Transmitter(config::TransmitterConfig cfg, imaging::ImageCodec* codec = nullptr);

    const config::TransmitterConfig& config() const { return cfg_; }

    // Connect, handshake, stream every frame. Throws errors::TransportError,
    // errors::ConfigurationError, errors::StorageError (unreadable file) or
    // errors::DecodeError (re-encode of a non-image).
    transfer::TransferState send_file(const std::string& path, const TransmitterCallbacks& callbacks = {},
                                      const std::atomic<bool>* cancel_flag = nullptr);
    transfer::TransferState send_bytes(std::vector<uint8_t> bytes, const std::string& filename,
                                       const TransmitterCallbacks& callbacks = {},
                                       const std::atomic<bool>* cancel_flag = nullptr);

    // Sends the files in order. A failed file is reported through
    // on_error and the batch continues. Returns how many were delivered.
    std::size_t send_files(const std::vector<std::string>& paths, const TransmitterCallbacks& callbacks = {},
                           const std::atomic<bool>* cancel_flag = nullptr);

private:
    config::TransmitterConfig cfg_;
    imaging::ImageCodec* codec_;
};

} // namespace networking
