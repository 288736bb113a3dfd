#include <a2s/Query.hpp>
#include <a2s/transport/UdpTransport.hpp>
#include <a2s/protocol/ChallengeExchange.hpp>
#include <a2s/protocol/decode.hpp>
#include <a2s/dns/Resolver.hpp>
#include <a2s/util/assert.hpp>
#include <a2s/Log.hpp>

using namespace asp::time;

namespace a2s {

QueryClient::QueryClient(std::shared_ptr<BaseTransport> transport, QueryOptions options)
    : m_transport(std::move(transport)), m_options(options)
{
    A2S_ASSERT(m_transport != nullptr);
    m_transport->setTimeout(m_options.timeout);
}

QueryResult<QueryClient> QueryClient::connect(const qsox::SocketAddress& address, QueryOptions options) {
    auto transport = GEODE_UNWRAP(UdpTransport::connect(address, options.timeout));
    return Ok(QueryClient{std::move(transport), options});
}

QueryResult<QueryClient> QueryClient::connect(std::string_view endpoint, QueryOptions options) {
    auto address = GEODE_UNWRAP(resolveEndpoint(endpoint, options.preferIpv6));
    return connect(address, options);
}

QueryResult<ServerInfo> QueryClient::info() {
    GEODE_UNWRAP(m_transport->sendRequest(A2S_INFO, A2S_INFO_PAYLOAD));
    auto packet = GEODE_UNWRAP(m_transport->receiveResponse());

    auto info = GEODE_UNWRAP(decodeInfo(packet, m_options.infoHeader));
    log::debug("Server '{}' answered info in {}ms", info.name, info.ping.millis());

    return Ok(std::move(info));
}

QueryResult<Rules> QueryClient::rules() {
    ChallengeExchange exchange{A2S_RULES, m_options.rulesHeader};
    auto packet = GEODE_UNWRAP(exchange.run(*m_transport));

    return decodeRules(packet, m_options.rulesHeader);
}

QueryResult<std::vector<PlayerEntry>> QueryClient::players() {
    ChallengeExchange exchange{A2S_PLAYER, m_options.playersHeader};
    auto packet = GEODE_UNWRAP(exchange.run(*m_transport));

    return decodePlayers(packet, m_options.playersHeader);
}

const QueryOptions& QueryClient::options() const {
    return m_options;
}

BaseTransport& QueryClient::transport() {
    return *m_transport;
}

template <typename Endpoint>
static QueryResult<QueryClient> connectWithTimeout(const Endpoint& endpoint, Duration timeout) {
    return QueryClient::connect(endpoint, QueryOptions { .timeout = timeout });
}

QueryResult<ServerInfo> queryInfo(const qsox::SocketAddress& address, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(address, timeout));
    return client.info();
}

QueryResult<ServerInfo> queryInfo(std::string_view endpoint, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(endpoint, timeout));
    return client.info();
}

QueryResult<Rules> queryRules(const qsox::SocketAddress& address, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(address, timeout));
    return client.rules();
}

QueryResult<Rules> queryRules(std::string_view endpoint, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(endpoint, timeout));
    return client.rules();
}

QueryResult<std::vector<PlayerEntry>> queryPlayers(const qsox::SocketAddress& address, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(address, timeout));
    return client.players();
}

QueryResult<std::vector<PlayerEntry>> queryPlayers(std::string_view endpoint, Duration timeout) {
    auto client = GEODE_UNWRAP(connectWithTimeout(endpoint, timeout));
    return client.players();
}

}
