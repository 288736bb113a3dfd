#pragma once

#include "BaseTransport.hpp"

#include <qsox/UdpSocket.hpp>
#include <qsox/SocketAddress.hpp>
#include <memory>

namespace a2s {

/// A UDP socket connected to a single query endpoint. The socket is closed on destruction.
class UdpTransport : public BaseTransport {
public:
    ~UdpTransport() override;
    UdpTransport(UdpTransport&&) = default;
    UdpTransport& operator=(UdpTransport&&) = default;

    static QueryResult<std::shared_ptr<UdpTransport>> connect(
        const qsox::SocketAddress& address,
        const asp::time::Duration& timeout
    );

protected:
    QueryResult<> sendDatagram(std::span<const uint8_t> data) override;
    QueryResult<size_t> receiveDatagram(uint8_t* buffer, size_t size, const asp::time::Duration& timeout) override;

private:
    qsox::UdpSocket m_socket;
    uint64_t m_readTimeoutMillis = 0;

    UdpTransport(qsox::UdpSocket socket);
};

}
