#pragma once

#include <a2s/transport/BaseTransport.hpp>
#include <a2s/protocol/constants.hpp>
#include <a2s/protocol/records.hpp>

#include <qsox/SocketAddress.hpp>
#include <asp/time/Duration.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace a2s {

struct QueryOptions {
    // applies to every datagram wait, not to the query as a whole
    asp::time::Duration timeout = asp::time::Duration::fromSecs(3);
    uint8_t infoHeader = S2A_INFO;
    uint8_t rulesHeader = S2A_RULES;
    uint8_t playersHeader = S2A_PLAYER;
    bool preferIpv6 = false;
};

/// Queries a single server. Every call performs a fresh exchange, nothing is cached.
class QueryClient {
public:
    QueryClient(std::shared_ptr<BaseTransport> transport, QueryOptions options = {});

    static QueryResult<QueryClient> connect(const qsox::SocketAddress& address, QueryOptions options = {});
    static QueryResult<QueryClient> connect(std::string_view endpoint, QueryOptions options = {});

    QueryResult<ServerInfo> info();
    QueryResult<Rules> rules();
    QueryResult<std::vector<PlayerEntry>> players();

    const QueryOptions& options() const;
    BaseTransport& transport();

private:
    std::shared_ptr<BaseTransport> m_transport;
    QueryOptions m_options;
};

QueryResult<ServerInfo> queryInfo(const qsox::SocketAddress& address, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));
QueryResult<ServerInfo> queryInfo(std::string_view endpoint, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));

QueryResult<Rules> queryRules(const qsox::SocketAddress& address, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));
QueryResult<Rules> queryRules(std::string_view endpoint, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));

QueryResult<std::vector<PlayerEntry>> queryPlayers(const qsox::SocketAddress& address, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));
QueryResult<std::vector<PlayerEntry>> queryPlayers(std::string_view endpoint, asp::time::Duration timeout = asp::time::Duration::fromSecs(3));

}
