/**
 * @file test_combat_domain.cpp
 * @brief Per-player combat state machine: shooting, damage, reloads and weapon switches.
 */

#include <catch2/catch.hpp>

#include <algorithm>

#include "combat_domain.hpp"
#include "lobby_domain.hpp"
#include "simulator.hpp"
#include "helpers/test_utils.hpp"

using namespace ggs;
using namespace test_helpers;
using namespace std::chrono_literals;

namespace {
    constexpr weapon_id_t PISTOL = 10, KNIFE = 11;

    struct combat_fixture {
        server_state state;
        weapon_database weapons = make_test_weapons();
        player_id_t a = 0, b = 0;

        combat_fixture() {
            lobby_domain::create_lobby(state, "arena", 4, "world", t0());
            lobby_domain::join_lobby(state, "arena", "A", t0(), a);
            lobby_domain::join_lobby(state, "arena", "B", t0(), b);
        }

        player& get(player_id_t id) { return state.lobbies.at("arena").players.at(id); }

        void arm(player_id_t id, weapon_id_t weapon) {
            event_list events;
            REQUIRE(combat_domain::player_switch_weapon(state, weapons, "arena", id, weapon, events) == error_code::None);
        }

        bool shoot(player_id_t id, game_clock::time_point now, event_list& events,
                   std::optional<player_id_t> target = std::nullopt) {
            bool fired = false;
            REQUIRE(combat_domain::player_shoot(state, weapons, "arena", id, now, fired, events, target)
                    == error_code::None);
            return fired;
        }

        bool shoot(player_id_t id, game_clock::time_point now) {
            event_list events;
            return shoot(id, now, events);
        }
    };

    void require_invariants(const server_state& state) {
        for (const auto& [_, l]: state.lobbies) {
            for (const auto& [__, p]: l.players) {
                REQUIRE(p.health <= p.max_health);
                REQUIRE(p.current_ammo <= p.max_ammo);
            }
        }
    }
}

// =============================================================================
// Damageable
// =============================================================================

TEST_CASE("Players report death only on the crossing to zero", "[combat]") {
    player p;
    REQUIRE_FALSE(p.take_damage(60));
    REQUIRE(p.health == 40);
    REQUIRE(p.take_damage(60));
    REQUIRE(p.health == 0);
    REQUIRE_FALSE(p.is_alive());
    REQUIRE_FALSE(p.take_damage(10));
    REQUIRE(p.health == 0);

    p.heal(1000);
    REQUIRE(p.health == p.max_health);
}

// =============================================================================
// player_shoot
// =============================================================================

TEST_CASE_METHOD(combat_fixture, "Shooting consumes ammo and records the shot", "[combat]") {
    arm(a, PISTOL);
    REQUIRE(get(a).current_ammo == 6);

    REQUIRE(shoot(a, at_ms(0)));
    REQUIRE(get(a).current_ammo == 5);
    REQUIRE(get(a).last_shot_time == at_ms(0));
    require_invariants(state);
}

TEST_CASE_METHOD(combat_fixture, "A second shot inside the cooldown is not fired", "[combat]") {
    arm(a, PISTOL); // 2 shots/s: 500 ms cooldown
    REQUIRE(shoot(a, at_ms(0)));
    auto ammo = get(a).current_ammo;

    REQUIRE_FALSE(shoot(a, at_ms(499)));
    REQUIRE(get(a).current_ammo == ammo);
    REQUIRE(get(a).last_shot_time == at_ms(0));

    REQUIRE(shoot(a, at_ms(500)));
    REQUIRE(get(a).current_ammo == ammo - 1);
}

TEST_CASE_METHOD(combat_fixture, "An empty magazine stops firing", "[combat]") {
    arm(a, PISTOL);
    for (int i = 0; i < 6; ++i)
        REQUIRE(shoot(a, at_ms(i * 1000)));
    REQUIRE(get(a).current_ammo == 0);
    REQUIRE_FALSE(shoot(a, at_ms(10000)));
    REQUIRE(get(a).current_ammo == 0);
}

TEST_CASE_METHOD(combat_fixture, "Melee weapons never run dry", "[combat]") {
    arm(a, KNIFE);
    for (int i = 0; i < 20; ++i)
        REQUIRE(shoot(a, at_ms(i * 1000)));
    REQUIRE(get(a).current_ammo == 0);
    REQUIRE(get(a).max_ammo == 0);
}

TEST_CASE_METHOD(combat_fixture, "Shooting is refused while reloading", "[combat]") {
    arm(a, PISTOL);
    REQUIRE(shoot(a, at_ms(0)));
    event_list events;
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, at_ms(100), events) == error_code::None);
    REQUIRE_FALSE(shoot(a, at_ms(1000)));
}

TEST_CASE_METHOD(combat_fixture, "Shooting without a weapon or while dead is invalid", "[combat]") {
    bool fired = true;
    event_list events;
    REQUIRE(combat_domain::player_shoot(state, weapons, "arena", a, t0(), fired, events) == error_code::InvalidOperation);
    REQUIRE_FALSE(fired);

    arm(a, PISTOL);
    get(a).health = 0;
    REQUIRE(combat_domain::player_shoot(state, weapons, "arena", a, t0(), fired, events) == error_code::InvalidOperation);
    REQUIRE_FALSE(fired);
    REQUIRE(get(a).current_ammo == 6);
}

TEST_CASE_METHOD(combat_fixture, "Shooting as an unknown player fails with NotFound", "[combat]") {
    bool fired = true;
    event_list events;
    REQUIRE(combat_domain::player_shoot(state, weapons, "arena", 99, t0(), fired, events) == error_code::NotFound);
    REQUIRE(combat_domain::player_shoot(state, weapons, "nowhere", a, t0(), fired, events) == error_code::NotFound);
    REQUIRE_FALSE(fired);
}

TEST_CASE_METHOD(combat_fixture, "Without a hit claim the stubbed hitscan hits nobody", "[combat]") {
    arm(a, PISTOL);
    event_list events;
    REQUIRE(shoot(a, at_ms(0), events));
    REQUIRE(events.empty());
    REQUIRE(get(b).health == get(b).max_health);
}

TEST_CASE_METHOD(combat_fixture, "Hit claims are checked against stored positions", "[combat]") {
    arm(a, PISTOL); // range 50, 10 damage
    get(a).position = {0, 0, 0};

    SECTION("in range: damage is applied") {
        get(b).position = {30, 0, 40};
        event_list events;
        REQUIRE(shoot(a, at_ms(0), events, b));
        REQUIRE(get(b).health == 90);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == game_event::PlayerDamaged);
        REQUIRE(events[0].player_id == b);
        REQUIRE(events[0].other_id == a);
        REQUIRE(events[0].value == 10);
    }

    SECTION("out of range: the shot fires but misses") {
        get(b).position = {0, 0, 51};
        event_list events;
        REQUIRE(shoot(a, at_ms(0), events, b));
        REQUIRE(events.empty());
        REQUIRE(get(b).health == 100);
    }

    SECTION("claims on oneself, the dummy or strangers are ignored") {
        event_list events;
        REQUIRE(shoot(a, at_ms(0), events, a));
        REQUIRE(shoot(a, at_ms(1000), events, DUMMY_PLAYER_ID));
        REQUIRE(shoot(a, at_ms(2000), events, 99));
        REQUIRE(events.empty());
        REQUIRE(get(a).health == 100);
    }
}

TEST_CASE_METHOD(combat_fixture, "A lethal hit reports the death once", "[combat]") {
    arm(a, PISTOL);
    get(b).health = 15;

    event_list events;
    REQUIRE(shoot(a, at_ms(0), events, b));
    REQUIRE(get(b).health == 5);
    REQUIRE(shoot(a, at_ms(1000), events, b));
    REQUIRE(get(b).health == 0);
    REQUIRE(events.size() == 3);
    REQUIRE(events[2].type == game_event::PlayerDied);
    REQUIRE(events[2].player_id == b);
    REQUIRE(events[2].other_id == a);

    SECTION("the dead are no longer valid targets") {
        events.clear();
        REQUIRE(shoot(a, at_ms(2000), events, b));
        REQUIRE(events.empty());
    }
}

// =============================================================================
// player_take_damage
// =============================================================================

TEST_CASE_METHOD(combat_fixture, "Damage clamps health at zero", "[combat]") {
    event_list events;
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 70, a, events) == error_code::None);
    REQUIRE(get(b).health == 30);
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 70, a, events) == error_code::None);
    REQUIRE(get(b).health == 0);

    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 70, a, events) == error_code::None);
    REQUIRE(get(b).health == 0);

    auto deaths = std::count_if(events.begin(), events.end(),
                                [](const game_event& e) { return e.type == game_event::PlayerDied; });
    REQUIRE(deaths == 1);
    require_invariants(state);
}

TEST_CASE_METHOD(combat_fixture, "Damaging a dead player reports nothing", "[combat]") {
    event_list events;
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 100, a, events) == error_code::None);
    REQUIRE(get(b).health == 0);
    REQUIRE(events.size() == 2);

    events.clear();
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 40, DUMMY_PLAYER_ID, events) == error_code::None);
    REQUIRE(get(b).health == 0);
    REQUIRE(events.empty());
}

TEST_CASE_METHOD(combat_fixture, "Out-of-bounds damage is rejected", "[combat]") {
    event_list events;
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 0, a, events) == error_code::InvalidOperation);
    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 101, a, events) == error_code::InvalidOperation);
    REQUIRE(get(b).health == 100);
    REQUIRE(events.empty());

    REQUIRE(combat_domain::player_take_damage(state, "arena", b, 100, a, events) == error_code::None);
    REQUIRE(get(b).health == 0);
}

TEST_CASE_METHOD(combat_fixture, "Respawning restores the dead only", "[combat]") {
    REQUIRE(combat_domain::respawn_player(state, "arena", b) == error_code::InvalidOperation);
    get(b).health = 0;
    REQUIRE(combat_domain::respawn_player(state, "arena", b) == error_code::None);
    REQUIRE(get(b).health == get(b).max_health);
    REQUIRE(combat_domain::respawn_player(state, "arena", 99) == error_code::NotFound);
}

// =============================================================================
// Reloading
// =============================================================================

TEST_CASE_METHOD(combat_fixture, "A reload completes on the first tick past the reload time", "[combat]") {
    arm(a, PISTOL); // 1.5 s reload
    shoot(a, at_ms(0));
    shoot(a, at_ms(500));
    REQUIRE(get(a).current_ammo == 4);

    event_list events;
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, at_ms(1000), events) == error_code::None);
    REQUIRE(get(a).is_reloading);
    REQUIRE(get(a).reload_started_at == at_ms(1000));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == game_event::ReloadStarted);

    REQUIRE(combat_domain::update_reload_states(state, weapons, at_ms(2499)).empty());
    REQUIRE(get(a).current_ammo == 4);

    auto finished = combat_domain::update_reload_states(state, weapons, at_ms(2500));
    REQUIRE(finished.size() == 1);
    REQUIRE(finished[0].type == game_event::ReloadFinished);
    REQUIRE(finished[0].player_id == a);
    REQUIRE(finished[0].lobby_code == "arena");
    REQUIRE(finished[0].value == 6);
    REQUIRE(get(a).current_ammo == 6);
    REQUIRE_FALSE(get(a).is_reloading);

    SECTION("further ticks change nothing") {
        REQUIRE(combat_domain::update_reload_states(state, weapons, at_ms(5000)).empty());
        REQUIRE(get(a).current_ammo == 6);
        REQUIRE_FALSE(get(a).is_reloading);
    }
}

TEST_CASE_METHOD(combat_fixture, "Reloading twice or with a full magazine is a no-op", "[combat]") {
    arm(a, PISTOL);
    event_list events;
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, t0(), events) == error_code::InvalidOperation);
    REQUIRE_FALSE(get(a).is_reloading);

    shoot(a, at_ms(0));
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, at_ms(100), events) == error_code::None);
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, at_ms(200), events) == error_code::InvalidOperation);
    REQUIRE(get(a).reload_started_at == at_ms(100));
    REQUIRE(events.size() == 1);
}

TEST_CASE_METHOD(combat_fixture, "Reloading a melee weapon or bare hands is a no-op", "[combat]") {
    event_list events;
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, t0(), events) == error_code::InvalidOperation);
    arm(a, KNIFE);
    REQUIRE(combat_domain::player_start_reload(state, "arena", a, t0(), events) == error_code::InvalidOperation);
    REQUIRE(events.empty());
}

// =============================================================================
// Weapon switching
// =============================================================================

TEST_CASE_METHOD(combat_fixture, "Switching weapons grants a full magazine", "[combat]") {
    arm(a, PISTOL);
    shoot(a, at_ms(0));
    REQUIRE(get(a).current_ammo == 5);

    event_list events;
    REQUIRE(combat_domain::player_switch_weapon(state, weapons, "arena", a, KNIFE, events) == error_code::None);
    REQUIRE(get(a).current_weapon_id == KNIFE);
    REQUIRE(get(a).max_ammo == 0);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == game_event::WeaponSwitched);
    REQUIRE(events[0].value == KNIFE);

    REQUIRE(combat_domain::player_switch_weapon(state, weapons, "arena", a, PISTOL, events) == error_code::None);
    REQUIRE(get(a).current_ammo == 6);
    REQUIRE(get(a).max_ammo == 6);
}

TEST_CASE_METHOD(combat_fixture, "Switching cancels a running reload", "[combat]") {
    arm(a, PISTOL);
    shoot(a, at_ms(0));
    event_list events;
    combat_domain::player_start_reload(state, "arena", a, at_ms(100), events);
    arm(a, PISTOL);
    REQUIRE_FALSE(get(a).is_reloading);
    REQUIRE(combat_domain::update_reload_states(state, weapons, at_ms(5000)).empty());
}

TEST_CASE_METHOD(combat_fixture, "Switching to an unknown weapon leaves the player untouched", "[combat]") {
    arm(a, PISTOL);
    shoot(a, at_ms(0));

    event_list events;
    REQUIRE(combat_domain::player_switch_weapon(state, weapons, "arena", a, 77, events) == error_code::NotFound);
    REQUIRE(get(a).current_weapon_id == PISTOL);
    REQUIRE(get(a).current_ammo == 5);
    REQUIRE(events.empty());
}

// =============================================================================
// State sync
// =============================================================================

TEST_CASE_METHOD(combat_fixture, "State sync snapshots every player but the bot", "[combat]") {
    state.lobbies.at("arena").dummy_player = player{.id = DUMMY_PLAYER_ID, .name = "DummyBot"};
    arm(a, PISTOL);
    get(b).health = 42;

    std::vector<player_sync_snapshot> snapshots;
    REQUIRE(combat_domain::get_lobby_state_sync(state, "arena", snapshots) == error_code::None);
    REQUIRE(snapshots.size() == 2);
    REQUIRE(snapshots[0].id == a);
    REQUIRE(snapshots[0].current_weapon_id == PISTOL);
    REQUIRE(snapshots[0].current_ammo == 6);
    REQUIRE(snapshots[1].id == b);
    REQUIRE(snapshots[1].health == 42);

    REQUIRE(combat_domain::get_lobby_state_sync(state, "nowhere", snapshots) == error_code::NotFound);
}

// =============================================================================
// Simulator queries
// =============================================================================

TEST_CASE("The empty world blocks nothing", "[combat]") {
    lobby l;
    REQUIRE(simulator::check_line_of_sight({0, 0, 0}, {100, 0, 0}));
    REQUIRE_FALSE(simulator::check_collision({0, 0, 0}, 1.0f));
    REQUIRE_FALSE(simulator::perform_hitscan(l, 1, {}, {0, 0, -1}, 100.0f).has_value());
}

TEST_CASE("Zero rotation faces down the negative z axis", "[combat]") {
    auto forward = simulator::get_forward_vector({});
    REQUIRE(forward.x == Approx(0.0f).margin(1e-6));
    REQUIRE(forward.y == Approx(0.0f).margin(1e-6));
    REQUIRE(forward.z == Approx(-1.0f));
    REQUIRE(forward.length() == Approx(1.0f));
}
