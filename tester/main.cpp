#include <iostream>
#include <a2s/Query.hpp>
#include <a2s/Log.hpp>
#include <asp/time.hpp>
#include <fmt/format.h>

using namespace a2s;
using namespace asp::time;

static void printInfo(const ServerInfo& info) {
    fmt::println("Name:        {}", info.name);
    fmt::println("Map:         {}", info.map);
    fmt::println("Game:        {} ({}, app {})", info.game, info.folder, info.appId);
    fmt::println("Players:     {}/{} ({} bots)", info.players, info.maxPlayers, info.bots);
    fmt::println("Server:      {}, {}", info.serverType, info.environment);
    fmt::println("Visibility:  {}, VAC {}", info.visibility, info.vac);
    fmt::println("Version:     {}", info.version);
    if (info.port) fmt::println("Game port:   {}", *info.port);
    if (info.steamId) fmt::println("Steam ID:    {}", *info.steamId);
    if (info.sourceTvPort) fmt::println("SourceTV:    {} on port {}", info.sourceTvName.value_or(""), *info.sourceTvPort);
    if (info.keywords) fmt::println("Keywords:    {}", *info.keywords);
    if (info.gameId) fmt::println("Game ID:     {}", *info.gameId);
    fmt::println("Ping:        {}ms", info.ping.millis());
}

static void printRules(const Rules& rules) {
    for (auto& [name, value] : rules) {
        fmt::println("{} = {}", name, value);
    }
    fmt::println("{} rules", rules.size());
}

static void printPlayers(const std::vector<PlayerEntry>& players) {
    for (auto& entry : players) {
        if (auto player = std::get_if<Player>(&entry)) {
            fmt::println("#{:<3} {:<32} score {:<6} {:.0f}s", player->index, player->name, player->score, player->duration);
        } else {
            fmt::println("#?   (incomplete record in slot {})", std::get<IncompletePlayer>(entry).slot);
        }
    }
    fmt::println("{} players", players.size());
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <address> [info|rules|players] [-v]" << std::endl;
        return 1;
    }

    std::string_view query = "info";
    for (int i = 2; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "-v") {
            a2s::log::setMinLevel(a2s::log::Level::Debug);
        } else {
            query = arg;
        }
    }

    static Instant start = Instant::now();

    a2s::log::setLogFunction([&](a2s::log::Level level, const std::string& message) {
        auto timestr = fmt::format("{:.6f}", start.elapsed().seconds<double>());
        switch (level) {
            case a2s::log::Level::Debug: fmt::println("[{}] [DEBUG] {}", timestr, message); break;
            case a2s::log::Level::Info: fmt::println("[{}] [INFO] {}", timestr, message); break;
            case a2s::log::Level::Warning: fmt::println("[{}] [WARN] {}", timestr, message); break;
            case a2s::log::Level::Error: fmt::println("[{}] [ERROR] {}", timestr, message); break;
        }
    });

    auto cres = QueryClient::connect(std::string_view{argv[1]});
    if (!cres) {
        std::cerr << "Failed to connect: " << cres.unwrapErr().message() << std::endl;
        return 1;
    }

    auto client = std::move(cres).unwrap();

    if (query == "info") {
        auto res = client.info();
        if (!res) {
            std::cerr << "Info query failed: " << res.unwrapErr().message() << std::endl;
            return 1;
        }
        printInfo(res.unwrap());
    } else if (query == "rules") {
        auto res = client.rules();
        if (!res) {
            std::cerr << "Rules query failed: " << res.unwrapErr().message() << std::endl;
            return 1;
        }
        printRules(res.unwrap());
    } else if (query == "players") {
        auto res = client.players();
        if (!res) {
            std::cerr << "Players query failed: " << res.unwrapErr().message() << std::endl;
            return 1;
        }
        printPlayers(res.unwrap());
    } else {
        std::cerr << "Unknown query '" << query << "', expected info, rules or players" << std::endl;
        return 1;
    }

    return 0;
}
