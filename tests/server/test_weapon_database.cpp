/**
 * @file test_weapon_database.cpp
 * @brief Weapon table validation and lookups.
 */

#include <catch2/catch.hpp>
#include <limits>

#include "weapon_database.hpp"
#include "helpers/test_utils.hpp"

using namespace ggs;
using namespace test_helpers;

TEST_CASE("The stock weapon table", "[weapons]") {
    weapon_database weapons(weapon_database::get_default_weapons());
    REQUIRE(weapons.size() == 3);

    const auto* golden = weapons.get(1);
    REQUIRE(golden != nullptr);
    REQUIRE(golden->name == "Golden Friend");
    REQUIRE(golden->damage == 20);
    REQUIRE(golden->ammo_capacity == 20);

    const auto* knife = weapons.get(3);
    REQUIRE(knife != nullptr);
    REQUIRE(knife->is_melee());
    REQUIRE_FALSE(weapons.get(2)->is_melee());
}

TEST_CASE("Unknown ids and the reserved id are absent", "[weapons]") {
    weapon_database weapons = make_test_weapons();
    REQUIRE(weapons.get(NO_WEAPON) == nullptr);
    REQUIRE(weapons.get(999) == nullptr);
    REQUIRE_FALSE(weapons.contains(999));
    REQUIRE(weapons.contains(10));
}

TEST_CASE("Cooldown and reload durations derive from the stats", "[weapons]") {
    auto pistol = make_pistol();
    REQUIRE(pistol.get_cooldown() == std::chrono::milliseconds(500));
    REQUIRE(pistol.get_reload_duration() == std::chrono::milliseconds(1500));
}

TEST_CASE("Invalid weapons are skipped", "[weapons]") {
    auto reserved = make_pistol(NO_WEAPON);
    auto frozen = make_pistol(20);
    frozen.fire_rate = 0.0f;
    auto slow = make_pistol(21);
    slow.reload_time = -1.0f;
    auto harmless = make_pistol(22);
    harmless.damage = 0;
    auto overkill = make_pistol(23);
    overkill.damage = 101;

    std::string reason;
    for (const auto& weapon: {reserved, frozen, slow, harmless, overkill}) {
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
        REQUIRE_FALSE(reason.empty());
    }

    weapon_database weapons({reserved, frozen, slow, harmless, overkill, make_knife()});
    REQUIRE(weapons.size() == 1);
    REQUIRE(weapons.contains(11));
}

TEST_CASE("Non-finite and out-of-range stats are rejected", "[weapons]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    std::string reason;

    SECTION("NaN reload time") {
        auto weapon = make_pistol(30);
        weapon.reload_time = nan;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("Infinite reload time") {
        auto weapon = make_pistol(31);
        weapon.reload_time = inf;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("Reload time above an hour") {
        auto weapon = make_pistol(32);
        weapon.reload_time = MAX_WEAPON_INTERVAL + 1.0f;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("NaN or infinite fire rate") {
        auto weapon = make_pistol(33);
        weapon.fire_rate = nan;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
        weapon.fire_rate = inf;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("Fire rate so low the cooldown would not fit a duration") {
        auto weapon = make_pistol(34);
        weapon.fire_rate = 1e-30f;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("NaN or infinite range") {
        auto weapon = make_pistol(35);
        weapon.range = nan;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
        weapon.range = inf;
        REQUIRE_FALSE(weapon_database::is_valid(weapon, reason));
    }

    SECTION("Slow but bounded stats are accepted") {
        auto weapon = make_pistol(36);
        weapon.reload_time = MAX_WEAPON_INTERVAL;
        weapon.fire_rate = 0.001f;
        REQUIRE(weapon_database::is_valid(weapon, reason));
    }
}

TEST_CASE("Duplicate ids keep the first entry", "[weapons]") {
    auto first = make_pistol(5);
    auto second = make_pistol(5);
    second.name = "Impostor";

    weapon_database weapons({first, second});
    REQUIRE(weapons.size() == 1);
    REQUIRE(weapons.get(5)->name == "Test Pistol");
}

TEST_CASE("Iteration is ordered by id", "[weapons]") {
    weapon_database weapons({make_knife(30), make_pistol(4), make_pistol(17)});
    std::vector<weapon_id_t> ids;
    for (const auto& [id, _]: weapons)
        ids.push_back(id);
    REQUIRE(ids == std::vector<weapon_id_t>{4, 17, 30});
}
