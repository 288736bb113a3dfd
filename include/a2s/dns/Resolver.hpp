#pragma once

#include <a2s/transport/Error.hpp>
#include <a2s/protocol/constants.hpp>
#include <qsox/SocketAddress.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace a2s {

/// Looks up the A and AAAA records of `hostname`. The addresses are ordered by family,
/// with the preferred family first. Fails only if neither lookup produced an address.
QueryResult<std::vector<qsox::SocketAddress>> resolveHost(const std::string& hostname, uint16_t port, bool preferIpv6);

/// Turns a textual endpoint into a single socket address, resolving host names when needed.
QueryResult<qsox::SocketAddress> resolveEndpoint(
    std::string_view endpoint,
    bool preferIpv6 = false,
    uint16_t defaultPort = DEFAULT_PORT
);

}
