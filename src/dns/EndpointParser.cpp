#include <a2s/dns/EndpointParser.hpp>

#include <charconv>
#include <string>

namespace a2s {

EndpointParser::EndpointParser(std::string_view endpoint) : m_endpoint(endpoint) {
    this->parse();
}

void EndpointParser::parse() {
    auto url = m_endpoint;

    while (!url.empty() && (url.front() == ' ' || url.front() == '\t')) {
        url.remove_prefix(1);
    }

    while (!url.empty() && (url.back() == ' ' || url.back() == '\t')) {
        url.remove_suffix(1);
    }

    if (url.empty()) {
        m_result = EndpointParseError::Empty;
        return;
    }

    bool hasPort = false;
    auto colonPos = url.find_last_of(':');

    if (url.starts_with('[')) {
        // bracketed ipv6, the port can only follow the closing bracket
        auto closing = url.find(']');
        if (closing == url.npos) {
            m_result = EndpointParseError::InvalidPort;
            return;
        }

        hasPort = closing + 1 < url.size();
        if (hasPort && url[closing + 1] != ':') {
            m_result = EndpointParseError::InvalidPort;
            return;
        }
    } else if (colonPos != url.npos) {
        // a bare ipv6 address contains colons but has no port
        hasPort = !qsox::Ipv6Address::parse(std::string(url));
    }

    std::optional<uint16_t> port;
    if (hasPort) {
        auto portStr = url.substr(colonPos + 1);
        uint16_t p;

        auto res = std::from_chars(portStr.data(), portStr.data() + portStr.size(), p);
        if (portStr.empty() || res.ec != std::errc() || res.ptr != portStr.data() + portStr.size()) {
            m_result = EndpointParseError::InvalidPort;
            return;
        }

        url.remove_suffix(portStr.size() + 1);
        port = p;
    }

    if (url.starts_with('[') && url.ends_with(']')) {
        url.remove_prefix(1);
        url.remove_suffix(1);
    }

    if (url.empty()) {
        m_result = EndpointParseError::Empty;
        return;
    }

    if (auto address = qsox::IpAddress::parse(std::string(url))) {
        if (port) {
            m_value = qsox::SocketAddress{*address, *port};
        } else {
            m_value = *address;
        }
    } else if (port) {
        m_value = std::make_pair(url, *port);
    } else {
        m_value = url;
    }
}

EndpointParseError EndpointParser::result() const {
    return m_result;
}

bool EndpointParser::isIpWithPort() const {
    return m_value && std::holds_alternative<qsox::SocketAddress>(*m_value);
}

bool EndpointParser::isIp() const {
    return m_value && std::holds_alternative<qsox::IpAddress>(*m_value);
}

bool EndpointParser::isDomain() const {
    return m_value && std::holds_alternative<std::string_view>(*m_value);
}

bool EndpointParser::isDomainWithPort() const {
    return m_value && std::holds_alternative<std::pair<std::string_view, uint16_t>>(*m_value);
}

const qsox::SocketAddress& EndpointParser::asIpWithPort() const {
    return std::get<qsox::SocketAddress>(*m_value);
}

const qsox::IpAddress& EndpointParser::asIp() const {
    return std::get<qsox::IpAddress>(*m_value);
}

std::string_view EndpointParser::asDomain() const {
    return std::get<std::string_view>(*m_value);
}

const std::pair<std::string_view, uint16_t>& EndpointParser::asDomainWithPort() const {
    return std::get<std::pair<std::string_view, uint16_t>>(*m_value);
}

std::optional<qsox::SocketAddress> EndpointParser::socketAddress(uint16_t defaultPort) const {
    if (this->isIpWithPort()) {
        return this->asIpWithPort();
    } else if (this->isIp()) {
        return qsox::SocketAddress{this->asIp(), defaultPort};
    }

    return std::nullopt;
}

}
