#include "networking.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "grid/splitter.hpp"
#include "protocol/handshake.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

using boost::asio::ip::tcp;

namespace networking {

// ─── ConnectionManager ──────────────────────────────────────────────────────

ConnectionManager::ConnectionManager(config::ReceiverConfig cfg, imaging::ImageCodec& codec,
                                     session::SharedState shared, session::ReceiverCallbacks callbacks)
    : cfg_(std::move(cfg)), codec_(codec), shared_(shared), callbacks_(std::move(callbacks)),
      store_(cfg_.output_dir), acceptor_(io_context_) {
    cfg_.validate();
}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::start() {
    if (running_) return;

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(cfg_.host, ec);
    if (ec) {
        throw errors::ConfigurationError("Invalid listen address '" + cfg_.host + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, cfg_.port);
    std::string where = cfg_.host + ":" + std::to_string(cfg_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw errors::TransportError("Could not listen on " + where + ": " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();

    stopping_ = false;
    aborting_ = false;
    running_ = true;
    accept_thread_ = std::thread([this]() { accept_loop(); });

    event_log::info("Receiver listening on " + cfg_.host + ":" + std::to_string(port_.load()) +
                    ", saving to " + store_.root().string());
    if (callbacks_.on_status) callbacks_.on_status("Listening on port " + std::to_string(port_.load()));
}

void ConnectionManager::accept_loop() {
    const auto poll = std::chrono::milliseconds(cfg_.accept_poll_ms);

    while (!stopping_) {
        auto conn = std::make_unique<Connection>();
        bool finished = false;
        boost::system::error_code accept_ec;

        acceptor_.async_accept(conn->socket(), [&finished, &accept_ec](const boost::system::error_code& ec) {
            finished = true;
            accept_ec = ec;
        });

        // Poll so the stop flag is seen at least once per interval
        while (!finished) {
            io_context_.restart();
            io_context_.run_for(poll);
            reap_finished();
            if (!finished && stopping_) {
                boost::system::error_code ignored;
                acceptor_.cancel(ignored);
                io_context_.restart();
                io_context_.run();
            }
        }

        if (accept_ec) {
            if (accept_ec != boost::asio::error::operation_aborted) {
                event_log::error("Accept failed: " + accept_ec.message());
            }
            continue;
        }

        conn->accepted();
        event_log::info("Accepted connection from " + conn->peer());
        launch(std::move(conn));
    }

    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

void ConnectionManager::launch(std::unique_ptr<Connection> conn) {
    conn->set_idle_timeout(std::chrono::milliseconds(cfg_.idle_timeout_ms));
    conn->set_stop_flags(&stopping_, &aborting_);

    auto unit = std::make_unique<Unit>();
    Unit* raw = unit.get();
    raw->peer = conn->peer();
    raw->conn = std::move(conn);

    std::lock_guard<std::mutex> lock(units_mutex_);
    units_.push_back(std::move(unit));
    raw->thread = std::thread([this, raw]() { run_unit(*raw); });
}

void ConnectionManager::run_unit(Unit& unit) {
    session::SessionSettings settings;
    settings.max_frame_size = cfg_.max_frame_size;
    settings.keep_raw_frames = cfg_.keep_raw_frames;

    try {
        session::ReceiveSession receive_session(*unit.conn, store_, codec_, shared_, callbacks_, settings);
        session::TransferOutcome outcome = receive_session.run();
        if (outcome.state == transfer::TransferState::COMPLETED && callbacks_.on_status) {
            callbacks_.on_status("Received " + outcome.filename + " from " + outcome.identity);
        }
    } catch (const std::exception& e) {
        event_log::error("Session with " + unit.peer + " terminated: " + e.what());
        unit.conn->close();
    }

    {
        std::lock_guard<std::mutex> lock(units_mutex_);
        unit.done = true;
    }
    units_cv_.notify_all();
}

void ConnectionManager::reap_finished() {
    std::list<std::unique_ptr<Unit>> finished;
    {
        std::lock_guard<std::mutex> lock(units_mutex_);
        for (auto it = units_.begin(); it != units_.end();) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = units_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& unit : finished) {
        if (unit->thread.joinable()) unit->thread.join();
    }
}

std::vector<std::string> ConnectionManager::stop() {
    if (!running_.exchange(false)) return {};

    stopping_ = true;
    if (accept_thread_.joinable()) accept_thread_.join();
    event_log::info("Receiver stopped accepting; " + std::to_string(active_sessions()) + " session(s) winding down");

    std::vector<std::string> stragglers;
    {
        std::unique_lock<std::mutex> lock(units_mutex_);
        units_cv_.wait_for(lock, std::chrono::milliseconds(cfg_.drain_timeout_ms), [this]() {
            for (const auto& unit : units_) {
                if (!unit->done) return false;
            }
            return true;
        });
        for (const auto& unit : units_) {
            if (!unit->done) stragglers.push_back(unit->peer);
        }
    }

    for (const auto& peer : stragglers) {
        event_log::warn("Session with " + peer + " did not finish within " +
                        std::to_string(cfg_.drain_timeout_ms) + " ms; aborting it");
    }
    aborting_ = true;

    std::list<std::unique_ptr<Unit>> remaining;
    {
        std::lock_guard<std::mutex> lock(units_mutex_);
        remaining.swap(units_);
    }
    for (auto& unit : remaining) {
        if (unit->thread.joinable()) unit->thread.join();
    }

    if (callbacks_.on_status) callbacks_.on_status("Receiver stopped");
    return stragglers;
}

std::size_t ConnectionManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(units_mutex_);
    std::size_t active = 0;
    for (const auto& unit : units_) {
        if (!unit->done) ++active;
    }
    return active;
}

// ─── Transmitter ────────────────────────────────────────────────────────────

Transmitter::Transmitter(config::TransmitterConfig cfg, imaging::ImageCodec* codec)
    : cfg_(std::move(cfg)), codec_(codec) {
    cfg_.validate();
    if (cfg_.reencode && !codec_) {
        throw errors::ConfigurationError("re-encoding before send needs an image codec");
    }
}

transfer::TransferState Transmitter::send_file(const std::string& path, const TransmitterCallbacks& callbacks,
                                               const std::atomic<bool>* cancel_flag) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::StorageError("Could not open file for reading: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw errors::StorageError("Could not read " + path);
    }
    return send_bytes(std::move(bytes), std::filesystem::path(path).filename().string(), callbacks, cancel_flag);
}

transfer::TransferState Transmitter::send_bytes(std::vector<uint8_t> bytes, const std::string& filename,
                                                const TransmitterCallbacks& callbacks,
                                                const std::atomic<bool>* cancel_flag) {
    std::string send_name = filename;
    if (cfg_.reencode) {
        imaging::ImagePtr image = codec_->decode(bytes);
        bytes = codec_->encode(*image, "jpeg", cfg_.jpeg_quality);
        send_name = std::filesystem::path(filename).stem().string() + ".jpg";
    }

    // Everything that can be rejected is checked before connecting
    if (bytes.empty()) {
        throw errors::ConfigurationError(send_name + " is empty; a zero-frame transfer can never complete");
    }
    protocol::Handshake handshake{cfg_.identity, send_name, cfg_.frame_size};
    protocol::serialize_handshake(handshake);
    grid::ChunkSplitter splitter(std::move(bytes), cfg_.frame_size, cfg_.columns);

    event_log::info("Generated " + std::to_string(splitter.total_frames()) + " frames for " + send_name +
                    " (" + std::to_string(splitter.data_size()) + " bytes, " +
                    std::to_string(cfg_.frame_size) + " bytes per frame, " +
                    std::to_string(cfg_.columns) + " columns)");

    Connection conn;
    conn.connect(cfg_.host, cfg_.port, std::chrono::milliseconds(cfg_.connect_timeout_ms));
    if (callbacks.on_status) callbacks.on_status("Connected to " + conn.peer() + ". Sending " + send_name + "...");

    transfer::FrameStreamSender::send_handshake(conn, handshake);

    transfer::FrameProgressCallback progress;
    if (callbacks.on_progress) {
        progress = [&callbacks, &send_name](std::size_t sent, std::size_t total) {
            callbacks.on_progress(send_name, sent, total);
        };
    }
    transfer::TransferState state = transfer::FrameStreamSender::send_frames(conn, splitter, progress, cancel_flag);
    conn.close();

    if (state == transfer::TransferState::COMPLETED) {
        event_log::info("Sent all " + std::to_string(splitter.total_frames()) + " frames of " + send_name +
                        " to " + cfg_.host + ":" + std::to_string(cfg_.port));
        if (callbacks.on_complete) callbacks.on_complete(send_name);
    }
    return state;
}

std::size_t Transmitter::send_files(const std::vector<std::string>& paths, const TransmitterCallbacks& callbacks,
                                    const std::atomic<bool>* cancel_flag) {
    std::size_t delivered = 0;
    for (const auto& path : paths) {
        if (cancel_flag && cancel_flag->load()) break;

        std::string name = std::filesystem::path(path).filename().string();
        try {
            transfer::TransferState state = send_file(path, callbacks, cancel_flag);
            if (state == transfer::TransferState::COMPLETED) {
                ++delivered;
            } else if (state == transfer::TransferState::CANCELLED) {
                break;
            }
        } catch (const std::exception& e) {
            event_log::error("Failed to send " + name + ": " + e.what());
            if (callbacks.on_error) callbacks.on_error(name, e.what());
        }
    }
    return delivered;
}

} // namespace networking
