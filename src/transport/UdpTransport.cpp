#include <a2s/transport/UdpTransport.hpp>
#include <a2s/Log.hpp>

#include <qsox/BaseSocket.hpp>
#include <algorithm>

using qsox::SocketAddress;
using namespace asp::time;

namespace a2s {

UdpTransport::UdpTransport(qsox::UdpSocket socket) : m_socket(std::move(socket)) {}

UdpTransport::~UdpTransport() {}

QueryResult<std::shared_ptr<UdpTransport>> UdpTransport::connect(
    const SocketAddress& address,
    const Duration& timeout
) {
    GEODE_UNWRAP(qsox::initSockets());

    auto socket = GEODE_UNWRAP(qsox::UdpSocket::bindAny(address.isV6()));
    GEODE_UNWRAP(socket.connect(address));

    log::debug("Opened query socket to {}", address.toString());

    auto transport = std::shared_ptr<UdpTransport>(new UdpTransport(std::move(socket)));
    transport->setTimeout(timeout);

    return Ok(std::move(transport));
}

QueryResult<> UdpTransport::sendDatagram(std::span<const uint8_t> data) {
    GEODE_UNWRAP(m_socket.send(data.data(), data.size()));
    return Ok();
}

QueryResult<size_t> UdpTransport::receiveDatagram(uint8_t* buffer, size_t size, const Duration& timeout) {
    // a zero read timeout would block forever
    uint64_t millis = std::max<uint64_t>(timeout.millis(), 1);

    if (m_readTimeoutMillis != millis) {
        GEODE_UNWRAP(m_socket.setReadTimeout(millis));
        m_readTimeoutMillis = millis;
    }

    size_t bytesRead = GEODE_UNWRAP(m_socket.recv(buffer, size));
    return Ok(bytesRead);
}

}
