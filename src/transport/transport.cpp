#include "nocturne/transport/transport.hpp"

namespace nocturne::transport {

const char* transportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stream:  return "stream";
        case TransportKind::Message: return "message";
    }
    return "unknown";
}

std::string TransportTarget::toString() const {
    if (mode == Mode::Listen) {
        return "listen " + local.toString();
    }
    if (local.empty()) {
        return "connect " + remote.toString();
    }
    return "connect " + remote.toString() + " from " + local.toString();
}

} // namespace nocturne::transport
