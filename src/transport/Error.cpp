#include <a2s/transport/Error.hpp>
#include <fmt/format.h>

namespace a2s {

QueryError::QueryError(const qsox::Error& err) : m_kind(err) {
    // a socket read timeout is the only way a wait for a datagram can expire
    if (err == qsox::Error::TimedOut || err == qsox::Error::WouldBlock) {
        m_kind = CustomKind{CustomCode::TimedOut};
    }
}

std::string_view QueryError::CustomKind::message() const {
    switch (code) {
        case CustomCode::TimedOut: return "Timed out waiting for a response";
        case CustomCode::MalformedPacket: return "Malformed packet, required fields could not be decoded";
        case CustomCode::ReassemblyMismatch: return "Split packet fragment belongs to a different response";
        case CustomCode::DuplicateFragment: return "Split packet fragment received twice with different contents";
        case CustomCode::InvalidSplitHeader: return "Invalid split packet header";
        case CustomCode::InvalidMarker: return "Packet starts with an unknown framing marker";
        case CustomCode::CompressedResponse: return "Compressed split responses are not supported";
        case CustomCode::ChallengeError: return "Server answered a challenged request with another challenge";
        case CustomCode::UnexpectedHeader: return "Unexpected response header";
        case CustomCode::ZeroLengthMessage: return "Zero length datagram received";
        case CustomCode::DatagramTooLarge: return "Datagram too large, it may have been truncated";
        case CustomCode::InvalidEndpoint: return "Invalid server endpoint";
    }

    a2s::unreachable();
}

bool QueryError::is(CustomCode code) const {
    auto kind = std::get_if<CustomKind>(&m_kind);
    return kind && kind->code == code;
}

bool QueryError::isTimeout() const {
    return this->is(CustomCode::TimedOut);
}

std::string QueryError::message() const {
#define FOR_MSG(t, msg) if (std::holds_alternative<t>(m_kind)) { return fmt::format(msg, std::get<t>(m_kind).message()); } else

    FOR_MSG(qsox::Error, "Socket error: {}")
    FOR_MSG(ResolverError, "Resolver error: {}")
    FOR_MSG(ByteReaderError, "Error decoding packet: {}")
    FOR_MSG(ByteWriterError, "Error encoding request: {}")
    FOR_MSG(CustomKind, "{}")
    /* else */ {
        return "Unknown query error";
    }

#undef FOR_MSG
}

}
