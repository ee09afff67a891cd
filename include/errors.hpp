#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Which handshake field the peer failed to deliver
enum class HandshakeStage {
    IDENTITY,
    FILENAME,
    FRAME_SIZE,
    COMPLETE
};

const char* to_string(HandshakeStage stage);

// Malformed or short handshake, invalid frame size. Fatal to the session.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what,
                           HandshakeStage stage = HandshakeStage::COMPLETE)
        : std::runtime_error(what), stage_(stage) {}

    HandshakeStage stage() const { return stage_; }

private:
    HandshakeStage stage_;
};

// Socket timeout, reset or close in the middle of a read or write.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The codec could not parse the reconstructed bytes.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Settings that can never work (frame too small, bad slot index, ...).
// Raised before any network I/O.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Output directory or file could not be written.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A stop request reached a handling unit between frames.
class CancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
