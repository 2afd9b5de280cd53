#include <cmath>
#include "weapon_database.hpp"

namespace ggs {

weapon_database::weapon_database(const std::vector<weapon_data>& weapons) {
    for (const auto& weapon: weapons) {
        std::string reason;
        if (!is_valid(weapon, reason)) {
            Printf(ansi::BrightRed, "Error: skipping weapon #%u (%s): %s.", weapon.id, weapon.name, reason);
            continue;
        }
        if (!weapons_.try_emplace(weapon.id, weapon).second)
            Printf(ansi::BrightRed, "Error: duplicate weapon id #%u (%s) skipped.", weapon.id, weapon.name);
    }
}

const std::vector<weapon_data>& weapon_database::get_default_weapons() {
    static const std::vector<weapon_data> weapons{
        {.id = 1, .name = "Golden Friend", .damage = 20, .fire_rate = 4.0f, .range = 100.0f,
         .reload_time = 1.0f, .ammo_capacity = 20},
        {.id = 2, .name = "Prototype", .damage = 30, .fire_rate = 2.0f, .range = 150.0f,
         .reload_time = 1.5f, .ammo_capacity = 8},
        {.id = 3, .name = "Combat Knife", .damage = 50, .fire_rate = 1.5f, .range = 3.0f,
         .reload_time = 0.0f, .ammo_capacity = 0},
    };
    return weapons;
}

bool weapon_database::is_valid(const weapon_data& weapon, std::string& reason) {
    if (weapon.id == NO_WEAPON)
        reason = "id 0 is reserved";
    else if (!std::isfinite(weapon.fire_rate) || !std::isfinite(weapon.reload_time) || !std::isfinite(weapon.range))
        reason = "stats must be finite numbers";
    else if (!(weapon.fire_rate > 0.0f) || 1.0f / weapon.fire_rate > MAX_WEAPON_INTERVAL)
        reason = Sprintf("fire rate must allow at least one shot every %.0fs", MAX_WEAPON_INTERVAL);
    else if (weapon.reload_time < 0.0f || weapon.reload_time > MAX_WEAPON_INTERVAL)
        reason = Sprintf("reload time must be within 0~%.0fs", MAX_WEAPON_INTERVAL);
    else if (weapon.range < 0.0f)
        reason = "range must not be negative";
    else if (weapon.damage == 0 || weapon.damage > MAX_DAMAGE_PER_HIT)
        reason = Sprintf("damage must be within 1~%u", MAX_DAMAGE_PER_HIT);
    else
        return true;
    return false;
}

const weapon_data* weapon_database::get(weapon_id_t id) const {
    auto it = weapons_.find(id);
    if (it == weapons_.end())
        return nullptr;
    return &it->second;
}

void weapon_database::print() const {
    for (const auto& [id, weapon]: weapons_) {
        Printf("#%u %s: %u damage, %.2f shots/s, range %.1f, %s",
               id, weapon.name, weapon.damage, weapon.fire_rate, weapon.range,
               weapon.is_melee() ? std::string("melee")
                   : Sprintf("%u rounds, %.2fs reload", weapon.ammo_capacity, weapon.reload_time));
    }
    Printf("%zu weapon%s in total.", weapons_.size(), weapons_.size() == 1 ? "" : "s");
}

}
