#pragma once

#include <qsox/SocketAddress.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <stdint.h>

namespace a2s {

enum class EndpointParseError {
    Success,
    Empty,
    InvalidPort,
};

/// Splits a textual endpoint into its address and port parts.
/// Accepts `host`, `host:port`, `1.2.3.4`, `1.2.3.4:port`, `::1`, `[::1]` and `[::1]:port`.
/// Host names are not resolved here, see `resolveEndpoint`.
class EndpointParser {
public:
    EndpointParser(std::string_view endpoint);

    EndpointParseError result() const;

    bool isIpWithPort() const;
    bool isIp() const;
    bool isDomain() const;
    bool isDomainWithPort() const;

    const qsox::SocketAddress& asIpWithPort() const;
    const qsox::IpAddress& asIp() const;
    std::string_view asDomain() const;
    const std::pair<std::string_view, uint16_t>& asDomainWithPort() const;

    /// The address this endpoint names, if it is a literal IP. Missing ports are filled in with `defaultPort`.
    std::optional<qsox::SocketAddress> socketAddress(uint16_t defaultPort) const;

private:
    std::string_view m_endpoint;
    EndpointParseError m_result = EndpointParseError::Success;

    std::optional<std::variant<
        qsox::SocketAddress, // ip with port
        qsox::IpAddress, // ip
        std::string_view, // domain
        std::pair<std::string_view, uint16_t> // domain with port
    >> m_value;

    void parse();
};

}
