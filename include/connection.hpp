#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <boost/asio.hpp>

namespace networking {

// A TCP stream with its own io_context so every blocking operation can be
// bounded: reads run asynchronously under io_context::run_for and are
// abandoned on idle timeout or a stop request.
class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Throws errors::TransportError on resolve/connect failure or timeout
    void connect(const std::string& host, unsigned short port, std::chrono::milliseconds timeout);

    // For acceptors: accept into socket(), then call accepted()
    boost::asio::ip::tcp::socket& socket() { return socket_; }
    void accepted();

    void set_idle_timeout(std::chrono::milliseconds timeout) { idle_timeout_ = timeout; }
    void set_poll_interval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

    // wind_down is honoured only before the first byte of a read, so a
    // frame already in flight is read to the end. abort is honoured at
    // once. Either raises errors::CancelledError.
    void set_stop_flags(const std::atomic<bool>* wind_down, const std::atomic<bool>* abort);

    // Fills size bytes. Returns fewer only if the peer closed the stream.
    // Throws errors::TransportError on idle timeout or socket error.
    std::size_t read_exact(uint8_t* data, std::size_t size);

    // Throws errors::TransportError
    void write_all(const uint8_t* data, std::size_t size);

    // Bytes already received and not yet read
    std::size_t available();

    const std::string& peer() const { return peer_; }
    bool is_open() const { return socket_.is_open(); }
    void close();

private:
    bool stop_requested(std::size_t bytes_so_far) const;
    void cancel_pending();

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::string peer_ = "unknown";
    std::chrono::milliseconds idle_timeout_{60000};
    std::chrono::milliseconds poll_interval_{200};
    const std::atomic<bool>* wind_down_ = nullptr;
    const std::atomic<bool>* abort_ = nullptr;
};

} // namespace networking
