/**
 * @file test_full_session.cpp
 * @brief End-to-end session over both planes against one shared state.
 *
 * Lobby creation and joins go through the HTTP handler, gameplay through the
 * UDP handler; time is driven explicitly.
 */

#include <catch2/catch.hpp>

#include "http_handler.hpp"
#include "udp_handler.hpp"
#include "helpers/mock_datagram_sink.hpp"
#include "helpers/test_utils.hpp"

using namespace ggs;
using namespace test_helpers;
using namespace std::chrono_literals;

namespace {
    http_request make_request(const std::string& method, const std::string& target, const std::string& body) {
        http_request request;
        request.method = method;
        request.target = target;
        request.body = body;
        return request;
    }

    player_id_t join_over_http(http_handler& http, const std::string& code, const std::string& name) {
        auto response = http.handle(make_request("POST", "/lobbies/" + code + "/join",
                                                 "{\"player_name\":\"" + name + "\"}"), t0());
        REQUIRE(response.status == 200);
        picojson::value body;
        REQUIRE(picojson::parse(body, response.body).empty());
        return static_cast<player_id_t>(json_uint(body.get<picojson::object>(), "player_id"));
    }
}

TEST_CASE("Two players meet, shoot, run dry and reload", "[integration]") {
    shared_server_state shared;
    config_manager config("unused.yml");
    config.spawn_dummy_bot = false;
    weapon_database weapons = make_test_weapons(); // weapon 10: six rounds, 500 ms cooldown, 1.5 s reload
    MockDatagramSink sink;
    http_handler http(shared, config);
    udp_handler udp(shared, weapons, sink);

    auto created = http.handle(make_request("POST", "/lobbies", R"({"code":"test","max_players":2,"scene":"w"})"), t0());
    REQUIRE(created.status == 200);

    auto a = join_over_http(http, "test", "Alpha");
    auto b = join_over_http(http, "test", "Bravo");
    REQUIRE(a != b);
    REQUIRE(http.handle(make_request("POST", "/lobbies/test/join", R"({"player_name":"Charlie"})"), t0()).status == 409);

    const auto addr_a = client_endpoint(4001), addr_b = client_endpoint(4002);
    udp.handle_datagram(join_datagram("test", a), addr_a, at_ms(10));
    udp.handle_datagram(join_datagram("test", b), addr_b, at_ms(20));

    SECTION("both players learn of each other") {
        auto joined = sink.of_type("player_joined", addr_a);
        REQUIRE(joined.size() == 1);
        REQUIRE(json_uint(joined[0].content.at("player").get<picojson::object>(), "id") == b);

        auto sync = sink.of_type("state_sync", addr_b);
        REQUIRE(sync.size() == 1);
        const auto& players = sync[0].content.at("players").get<picojson::array>();
        REQUIRE(players.size() == 2);
        REQUIRE(json_uint(players[0].get<picojson::object>(), "id") == a);
        REQUIRE(json_uint(players[1].get<picojson::object>(), "id") == b);
    }

    SECTION("six shots empty the magazine and a reload refills it") {
        udp.handle_datagram(weapon_switch_datagram("test", a, 10), addr_a, at_ms(100));
        REQUIRE(sink.count_type("weapon_switched", addr_b) == 1);

        auto& shooter = shared.state.lobbies.at("test").players.at(a);
        for (int i = 0; i < 6; ++i)
            udp.handle_datagram(shoot_datagram("test", a), addr_a, at_ms(1000 + i * 600));
        REQUIRE(shooter.current_ammo == 0);

        udp.handle_datagram(shoot_datagram("test", a), addr_a, at_ms(10000));
        REQUIRE(shooter.current_ammo == 0);
        REQUIRE(shooter.last_shot_time == at_ms(1000 + 5 * 600));

        udp.handle_datagram(lobby_action("reload", "test", a), addr_a, at_ms(11000));
        REQUIRE(shooter.is_reloading);
        REQUIRE(sink.count_type("reload_started") == 2);

        udp.tick_reloads(at_ms(12000));
        REQUIRE(shooter.current_ammo == 0);

        udp.tick_reloads(at_ms(12500));
        REQUIRE(shooter.current_ammo == 6);
        REQUIRE_FALSE(shooter.is_reloading);
        REQUIRE(sink.count_type("reload_finished", addr_b) == 1);

        sink.clear();
        udp.handle_datagram(lobby_action("request_state", "test", b), addr_b, at_ms(13000));
        auto sync = sink.of_type("state_sync", addr_b);
        REQUIRE(sync.size() == 1);
        const auto& alpha = sync[0].content.at("players").get<picojson::array>()[0].get<picojson::object>();
        REQUIRE(json_uint(alpha, "current_ammo") == 6);
        REQUIRE(json_uint(alpha, "max_ammo") == 6);
        REQUIRE_FALSE(alpha.at("is_reloading").get<bool>());
    }

    SECTION("a silent player is swept and the other is told") {
        udp.handle_datagram(lobby_action("keepalive", "test", b), addr_b, t0() + 29s);
        sink.clear();

        auto result = udp.sweep(t0() + 31s, config.player_inactivity_timeout, config.empty_lobby_grace_period);
        REQUIRE(result.players_removed == 1);
        REQUIRE(sink.count_type("player_left", addr_b) == 1);

        auto info = http.handle(make_request("GET", "/lobbies/test", ""), t0() + 31s);
        picojson::value body;
        REQUIRE(picojson::parse(body, info.body).empty());
        REQUIRE(json_uint(body.get<picojson::object>(), "player_count") == 1);
    }
}
