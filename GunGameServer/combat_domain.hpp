#ifndef GUNGAMESERVER_COMBAT_DOMAIN_HPP
#define GUNGAMESERVER_COMBAT_DOMAIN_HPP
#include <optional>
#include "server_data.hpp"
#include "weapon_database.hpp"

// Per-player combat state machine. Two independent axes:
//   ammo:  Ready -(shoot)-> Ready, Ready -(start_reload)-> Reloading -(tick)-> Ready
//   life:  Alive -(health hits 0)-> Dead -(respawn)-> Alive
namespace ggs::combat_domain {
    // `fired` tells whether the shot left the barrel, not whether it hit.
    // Cooldown, an empty magazine and reloading are not errors: None is returned with `fired == false`.
    // Without a weapon, or while dead, InvalidOperation is returned.
    // A `claimed_target` is only honoured if the target is in range of the stored positions
    // and in line of sight; otherwise the simulator's hitscan decides.
    error_code player_shoot(server_state& state, const weapon_database& weapons, const std::string& code,
                            player_id_t player_id, game_clock::time_point now, bool& fired, event_list& events,
                            std::optional<player_id_t> claimed_target = std::nullopt);

    // Health is clamped at 0; PlayerDied is emitted once per crossing to 0.
    // Amounts of 0 or above MAX_DAMAGE_PER_HIT are rejected with InvalidOperation.
    error_code player_take_damage(server_state& state, const std::string& code, player_id_t player_id,
                                  uint32_t amount, player_id_t attacker_id, event_list& events);

    // InvalidOperation (a no-op) when already reloading or the magazine is full.
    error_code player_start_reload(server_state& state, const std::string& code, player_id_t player_id,
                                   game_clock::time_point now, event_list& events);

    // Finishes every reload whose weapon's reload time has elapsed. The only driver of reload completion.
    // @returns one ReloadFinished event per completed reload
    event_list update_reload_states(server_state& state, const weapon_database& weapons, game_clock::time_point now);

    // Always grants a full magazine of the new weapon and cancels a running reload.
    // NotFound for an unknown weapon id, leaving the player untouched.
    error_code player_switch_weapon(server_state& state, const weapon_database& weapons, const std::string& code,
                                    player_id_t player_id, weapon_id_t weapon_id, event_list& events);

    error_code get_lobby_state_sync(const server_state& state, const std::string& code,
                                    std::vector<player_sync_snapshot>& snapshots);

    // Restores a dead player to full health. InvalidOperation for the living.
    error_code respawn_player(server_state& state, const std::string& code, player_id_t player_id);
}

#endif //GUNGAMESERVER_COMBAT_DOMAIN_HPP
