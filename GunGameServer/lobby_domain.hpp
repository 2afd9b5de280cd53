#ifndef GUNGAMESERVER_LOBBY_DOMAIN_HPP
#define GUNGAMESERVER_LOBBY_DOMAIN_HPP
#include "server_data.hpp"

// Lobby lifecycle over an explicitly passed server_state.
// Callers hold the state lock; nothing in here blocks or does I/O.
namespace ggs::lobby_domain {
    struct cleanup_result {
        std::size_t players_removed = 0;
        std::size_t lobbies_removed = 0;
    };

    // Lobby codes are compared case-insensitively.
    std::string normalize_code(const std::string& code);

    // Fails with Conflict if the code is taken; the state is left untouched then.
    error_code create_lobby(server_state& state, const std::string& code, uint32_t max_players,
                            const std::string& scene, game_clock::time_point now,
                            bool spawn_dummy = false, bool persistent = false);

    // Allocates the next player id. Fails with NotFound or Full.
    error_code join_lobby(server_state& state, const std::string& code, const std::string& player_name,
                          game_clock::time_point now, player_id_t& player_id);

    // Idempotent: leaving twice is not an error.
    void leave_lobby(server_state& state, const std::string& code, player_id_t player_id, event_list& events);

    // Binds (or rebinds) the UDP endpoint and counts as activity.
    error_code set_player_address(server_state& state, const std::string& code, player_id_t player_id,
                                  const asio::ip::udp::endpoint& address, game_clock::time_point now);

    // Marks the player active without touching its binding.
    error_code touch_player(server_state& state, const std::string& code, player_id_t player_id,
                            game_clock::time_point now);

    // Searches every lobby for the player. No plausibility checks on the transform.
    // @returns NotFound if no lobby has the player; `lobby_code` receives the owning lobby otherwise.
    error_code update_player_position(server_state& state, player_id_t player_id, const vec3& position,
                                      const vec3& rotation, game_clock::time_point now, std::string& lobby_code);

    // Evicts players idle for longer than `timeout` (emitting PlayerLeft like an explicit leave),
    // then drops non-persistent lobbies that are empty and older than `grace_period`.
    cleanup_result cleanup_inactive_players(server_state& state, game_clock::time_point now,
                                            game_clock::duration timeout, game_clock::duration grace_period,
                                            event_list& events);

    lobby* get_lobby(server_state& state, const std::string& code);
    const lobby* get_lobby(const server_state& state, const std::string& code);

    player* find_player(server_state& state, const std::string& code, player_id_t player_id);
}

#endif //GUNGAMESERVER_LOBBY_DOMAIN_HPP
