#include <a2s/dns/Resolver.hpp>
#include <a2s/dns/EndpointParser.hpp>
#include <a2s/Log.hpp>

#include <qsox/BaseSocket.hpp>
#include <qsox/Resolver.hpp>
#include <algorithm>
#include <optional>

using qsox::SocketAddress;

static void sortAddresses(std::vector<SocketAddress>& addrs, bool preferIpv6) {
    std::stable_sort(addrs.begin(), addrs.end(), [&](const auto& a, const auto& b) {
        if (a.isV6() && !b.isV6()) {
            return preferIpv6;
        } else if (!a.isV6() && b.isV6()) {
            return !preferIpv6;
        }

        return false;
    });
}

namespace a2s {

QueryResult<std::vector<SocketAddress>> resolveHost(const std::string& hostname, uint16_t port, bool preferIpv6) {
    GEODE_UNWRAP(qsox::initSockets());

    std::vector<SocketAddress> out;
    std::optional<ResolverError> lastError;

    auto handleError = [&](ResolverError err, std::string_view record) {
        if (err != ResolverError::NoData && err != ResolverError::UnknownHost) {
            log::warn("Failed to resolve {} record for {}: {}", record, hostname, err.message());
        }
        lastError = err;
    };

    if (auto res = qsox::resolver::resolveIpv4(hostname)) {
        out.push_back(SocketAddress{res.unwrap(), port});
    } else {
        handleError(res.unwrapErr(), "A");
    }

    if (auto res = qsox::resolver::resolveIpv6(hostname)) {
        out.push_back(SocketAddress{res.unwrap(), port});
    } else {
        handleError(res.unwrapErr(), "AAAA");
    }

    if (out.empty()) {
        return Err(lastError.value_or(ResolverError::NoData));
    }

    sortAddresses(out, preferIpv6);

    log::debug("Resolved {} addresses for {}", out.size(), hostname);

    return Ok(std::move(out));
}

QueryResult<SocketAddress> resolveEndpoint(std::string_view endpoint, bool preferIpv6, uint16_t defaultPort) {
    EndpointParser parser{endpoint};

    if (parser.result() != EndpointParseError::Success) {
        log::warn("Invalid endpoint '{}'", endpoint);
        return Err(QueryError::InvalidEndpoint);
    }

    if (auto addr = parser.socketAddress(defaultPort)) {
        return Ok(*addr);
    }

    std::string hostname;
    uint16_t port = defaultPort;

    if (parser.isDomainWithPort()) {
        auto& [host, p] = parser.asDomainWithPort();
        hostname = std::string(host);
        port = p;
    } else {
        hostname = std::string(parser.asDomain());
    }

    auto addrs = GEODE_UNWRAP(resolveHost(hostname, port, preferIpv6));
    return Ok(addrs.front());
}

}
