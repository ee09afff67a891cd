#include "errors.hpp"

namespace errors {

const char* to_string(HandshakeStage stage) {
    switch (stage) {
        case HandshakeStage::IDENTITY: return "closed before identity";
        case HandshakeStage::FILENAME: return "closed before filename";
        case HandshakeStage::FRAME_SIZE: return "closed before size";
        case HandshakeStage::COMPLETE: return "handshake complete";
    }
    return "unknown";
}

} // namespace errors
