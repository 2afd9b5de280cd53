#ifndef GUNGAMESERVER_PLAYER_STATE_HPP
#define GUNGAMESERVER_PLAYER_STATE_HPP
#include <string>
#include "entity.hpp"

namespace ggs {
    // read-only view of one player as carried by state_sync
    struct player_sync_snapshot {
        player_id_t id{};
        vec3 position{}, rotation{};
        uint32_t health{}, max_health{};
        weapon_id_t current_weapon_id{};
        uint32_t current_ammo{}, max_ammo{};
        bool is_reloading = false;

        bool operator==(const player_sync_snapshot&) const = default;

        // compares everything except the transform
        bool same_status(const player_sync_snapshot& other) const noexcept {
            return id == other.id && health == other.health && max_health == other.max_health
                && current_weapon_id == other.current_weapon_id && current_ammo == other.current_ammo
                && max_ammo == other.max_ammo && is_reloading == other.is_reloading;
        }
    };

    struct player_info {
        player_id_t id{};
        std::string name;
    };
}

#endif //GUNGAMESERVER_PLAYER_STATE_HPP
