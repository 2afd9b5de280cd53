/**
 * @file test_config_manager.cpp
 * @brief YAML configuration: defaults, overrides and rejection of bad values.
 */

#include <catch2/catch.hpp>

#include "config_manager.hpp"

using namespace std::chrono_literals;

TEST_CASE("An empty config yields the defaults", "[config]") {
    config_manager config("unused.yml");
    REQUIRE(config.load_from_string("logging_level: error"));

    REQUIRE(config.http_port == 8080);
    REQUIRE(config.udp_port == 8081);
    REQUIRE(config.public_address == "127.0.0.1");
    REQUIRE(config.player_inactivity_timeout == 30s);
    REQUIRE(config.empty_lobby_grace_period == 10s);
    REQUIRE(config.reload_tick_interval == 100ms);
    REQUIRE(config.state_sync_interval == 1000ms);
    REQUIRE(config.default_max_players == 4);
    REQUIRE(config.spawn_dummy_bot);
    REQUIRE(config.get_weapons().size() == 3);
    REQUIRE(config.default_lobbies.size() == 1);
    REQUIRE(config.default_lobbies[0].code == "test");
    REQUIRE(config.default_lobbies[0].max_players == 8);
    REQUIRE(config.default_lobbies[0].scene == "test_world");
}

TEST_CASE("Config values override the defaults", "[config]") {
    config_manager config("unused.yml");
    REQUIRE(config.load_from_string(R"(
logging_level: error
http_port: 9000
udp_port: 9001
public_address: 203.0.113.5
player_inactivity_timeout: 5
state_sync_interval: 0
spawn_dummy_bot: false
default_lobbies:
  - code: Alpha
    max_players: 2
  - code: beta
    scene: docks
weapons:
  - id: 7
    name: Sniper
    damage: 90
    fire_rate: 0.5
    range: 300
    reload_time: 3
    ammo_capacity: 5
)"));

    REQUIRE(config.http_port == 9000);
    REQUIRE(config.udp_port == 9001);
    REQUIRE(config.public_address == "203.0.113.5");
    REQUIRE(config.player_inactivity_timeout == 5s);
    REQUIRE(config.state_sync_interval == 0ms);
    REQUIRE_FALSE(config.spawn_dummy_bot);

    REQUIRE(config.default_lobbies.size() == 2);
    REQUIRE(config.default_lobbies[0].code == "Alpha");
    REQUIRE(config.default_lobbies[0].max_players == 2);
    REQUIRE(config.default_lobbies[1].scene == "docks");
    REQUIRE(config.default_lobbies[1].max_players == ggs::DEFAULT_MAX_PLAYERS);

    REQUIRE(config.get_weapons().size() == 1);
    const auto& sniper = config.get_weapons()[0];
    REQUIRE(sniper.id == 7);
    REQUIRE(sniper.name == "Sniper");
    REQUIRE(sniper.damage == 90);
    REQUIRE(sniper.fire_rate == Approx(0.5f));
    REQUIRE(sniper.ammo_capacity == 5);
}

TEST_CASE("Bad config values are rejected", "[config]") {
    config_manager config("unused.yml");

    SECTION("unparsable YAML") {
        REQUIRE_FALSE(config.load_from_string("http_port: [8080"));
    }
    SECTION("wrong value type") {
        REQUIRE_FALSE(config.load_from_string("logging_level: error\nhttp_port: lots"));
    }
    SECTION("zero port") {
        REQUIRE_FALSE(config.load_from_string("logging_level: error\nudp_port: 0"));
    }
    SECTION("non-positive tick") {
        REQUIRE_FALSE(config.load_from_string("logging_level: error\nreload_tick_interval: 0"));
    }
    SECTION("root is not a map") {
        REQUIRE_FALSE(config.load_from_string("- 1\n- 2"));
    }
    SECTION("default lobby without room for players") {
        REQUIRE_FALSE(config.load_from_string(
            "logging_level: error\ndefault_lobbies: [{code: arena, max_players: 0}]"));
    }
    SECTION("default lobby with an invalid code") {
        REQUIRE_FALSE(config.load_from_string(
            "logging_level: error\ndefault_lobbies: [{code: \"bad code!\", max_players: 4}]"));
    }
}

TEST_CASE("Valid default lobbies are accepted", "[config]") {
    config_manager config("unused.yml");
    REQUIRE(config.load_from_string(
        "logging_level: error\ndefault_lobbies: [{code: arena_1, max_players: 2, scene: desert}]"));
    REQUIRE(config.default_lobbies.size() == 1);
    REQUIRE(config.default_lobbies[0].code == "arena_1");
    REQUIRE(config.default_lobbies[0].max_players == 2);
}

TEST_CASE("The logging level is applied globally", "[config]") {
    config_manager config("unused.yml");
    REQUIRE(config.load_from_string("logging_level: verbose"));
    REQUIRE(ggs::get_logging_level() == ggs::log_level::Verbose);

    REQUIRE(config.load_from_string("logging_level: error"));
    REQUIRE(ggs::get_logging_level() == ggs::log_level::Error);
}
