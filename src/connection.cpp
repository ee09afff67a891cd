#include "connection.hpp"
#include "errors.hpp"

using boost::asio::ip::tcp;

namespace networking {

Connection::Connection() : socket_(io_context_) {}

Connection::~Connection() {
    close();
}

void Connection::connect(const std::string& host, unsigned short port, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw errors::TransportError("Could not resolve " + host + ": " + ec.message());
    }

    ec = boost::asio::error::would_block;
    boost::asio::async_connect(socket_, endpoints,
        [&ec](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });

    io_context_.restart();
    io_context_.run_for(timeout);

    if (ec == boost::asio::error::would_block) {
        // Closing (not cancelling) stops the connect from trying further endpoints
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_context_.restart();
        io_context_.run();
        throw errors::TransportError("Timed out connecting to " + host + ":" + std::to_string(port));
    }
    if (ec) {
        close();
        throw errors::TransportError("Could not connect to " + host + ":" + std::to_string(port) +
                                     ": " + ec.message());
    }
    accepted();
}

void Connection::accepted() {
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (!ec) {
        peer_ = remote.address().to_string() + ":" + std::to_string(remote.port());
    }
}

void Connection::set_stop_flags(const std::atomic<bool>* wind_down, const std::atomic<bool>* abort) {
    wind_down_ = wind_down;
    abort_ = abort;
}

bool Connection::stop_requested(std::size_t bytes_so_far) const {
    if (abort_ && abort_->load()) return true;
    return bytes_so_far == 0 && wind_down_ && wind_down_->load();
}

void Connection::cancel_pending() {
    boost::system::error_code ignored;
    socket_.cancel(ignored);
    // Let the aborted handler run so it no longer refers to our stack
    io_context_.restart();
    io_context_.run();
}

std::size_t Connection::read_exact(uint8_t* data, std::size_t size) {
    std::size_t total = 0;
    auto last_activity = std::chrono::steady_clock::now();

    while (total < size) {
        if (stop_requested(total)) {
            throw errors::CancelledError("Stop requested while waiting for data from " + peer_);
        }

        boost::system::error_code ec = boost::asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(boost::asio::buffer(data + total, size - total),
            [&ec, &received](const boost::system::error_code& result, std::size_t bytes) {
                ec = result;
                received = bytes;
            });

        io_context_.restart();
        while (ec == boost::asio::error::would_block) {
            io_context_.run_for(poll_interval_);
            if (ec != boost::asio::error::would_block) break;

            if (stop_requested(total)) {
                cancel_pending();
                throw errors::CancelledError("Stop requested while waiting for data from " + peer_);
            }
            if (std::chrono::steady_clock::now() - last_activity >= idle_timeout_) {
                cancel_pending();
                throw errors::TransportError("No data from " + peer_ + " for " +
                                             std::to_string(idle_timeout_.count() / 1000) + "s");
            }
        }

        if (ec == boost::asio::error::eof) return total;
        if (ec) {
            throw errors::TransportError("Read from " + peer_ + " failed: " + ec.message());
        }
        total += received;
        last_activity = std::chrono::steady_clock::now();
    }
    return total;
}

void Connection::write_all(const uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
    if (ec) {
        throw errors::TransportError("Write to " + peer_ + " failed: " + ec.message());
    }
}

std::size_t Connection::available() {
    boost::system::error_code ec;
    std::size_t n = socket_.available(ec);
    return ec ? 0 : n;
}

void Connection::close() {
    if (!socket_.is_open()) return;
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

} // namespace networking
