/**
 * @file test_dummy_bot.cpp
 * @brief The server-owned bot's path.
 */

#include <catch2/catch.hpp>

#include <cmath>

#include "dummy_bot.hpp"
#include "lobby_domain.hpp"
#include "helpers/test_utils.hpp"

using namespace ggs;
using namespace test_helpers;

TEST_CASE("The bot is a knife-wielding player with the reserved id", "[dummy]") {
    auto bot = dummy_bot::create(t0());
    REQUIRE(bot.id == DUMMY_PLAYER_ID);
    REQUIRE(bot.name == DUMMY_PLAYER_NAME);
    REQUIRE(bot.current_weapon_id == DUMMY_WEAPON_ID);
    REQUIRE(bot.is_alive());
}

TEST_CASE("The bot circles the origin", "[dummy]") {
    for (double t: {0.0, 1.0, 2.5, 10.0, 100.0}) {
        auto p = dummy_bot::get_position_at(t);
        REQUIRE(std::hypot(p.x, p.z) == Approx(DUMMY_ORBIT_RADIUS));
        REQUIRE(p.y == Approx(DUMMY_HEIGHT));
    }

    auto start = dummy_bot::get_position_at(0.0);
    REQUIRE(start.x == Approx(DUMMY_ORBIT_RADIUS));
    REQUIRE(start.z == Approx(0.0f).margin(1e-6));
}

TEST_CASE("The path is a pure function of time", "[dummy]") {
    REQUIRE(dummy_bot::get_position_at(3.25) == dummy_bot::get_position_at(3.25));
    const double period = 2.0 * 3.14159265358979323846 / DUMMY_ANGULAR_SPEED;
    auto a = dummy_bot::get_position_at(1.0), b = dummy_bot::get_position_at(1.0 + period);
    REQUIRE(a.x == Approx(b.x).margin(1e-4));
    REQUIRE(a.z == Approx(b.z).margin(1e-4));
}

TEST_CASE("Advancing moves only lobbies with a bot", "[dummy]") {
    server_state state;
    lobby_domain::create_lobby(state, "bots", 4, "world", t0(), true);
    lobby_domain::create_lobby(state, "plain", 4, "world", t0(), false);

    REQUIRE(dummy_bot::advance(state, 2.0) == 1);
    REQUIRE(state.lobbies.at("bots").dummy_player->position == dummy_bot::get_position_at(2.0));
    REQUIRE_FALSE(state.lobbies.at("plain").dummy_player.has_value());
}
