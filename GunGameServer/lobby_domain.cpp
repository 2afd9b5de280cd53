#include "lobby_domain.hpp"
#include "dummy_bot.hpp"

namespace ggs::lobby_domain {

std::string normalize_code(const std::string& code) {
    return string_utils::to_lower(code);
}

error_code create_lobby(server_state& state, const std::string& code, uint32_t max_players,
                        const std::string& scene, game_clock::time_point now,
                        bool spawn_dummy, bool persistent) {
    auto key = normalize_code(code);
    if (state.lobbies.contains(key))
        return error_code::Conflict;

    lobby new_lobby{
        .code = key,
        .max_players = max_players,
        .scene = scene,
        .created_at = now,
        .persistent = persistent,
    };
    if (spawn_dummy)
        new_lobby.dummy_player = dummy_bot::create(now);
    state.lobbies.emplace(key, std::move(new_lobby));
    return error_code::None;
}

error_code join_lobby(server_state& state, const std::string& code, const std::string& player_name,
                      game_clock::time_point now, player_id_t& player_id) {
    auto* target = get_lobby(state, code);
    if (!target)
        return error_code::NotFound;
    if (target->full())
        return error_code::Full;

    player_id = state.next_player_id++;
    target->players.emplace(player_id, player{
        .id = player_id,
        .name = player_name,
        .last_activity = now,
    });
    return error_code::None;
}

void leave_lobby(server_state& state, const std::string& code, player_id_t player_id, event_list& events) {
    auto* target = get_lobby(state, code);
    if (!target)
        return;
    target->client_addresses.erase(player_id);
    if (target->players.erase(player_id) > 0)
        events.push_back({.type = game_event::PlayerLeft, .lobby_code = target->code, .player_id = player_id});
}

error_code set_player_address(server_state& state, const std::string& code, player_id_t player_id,
                              const asio::ip::udp::endpoint& address, game_clock::time_point now) {
    auto* target = get_lobby(state, code);
    if (!target)
        return error_code::NotFound;
    auto* p = target->find_player(player_id);
    if (!p)
        return error_code::NotFound;
    target->client_addresses[player_id] = address;
    p->last_activity = now;
    return error_code::None;
}

error_code touch_player(server_state& state, const std::string& code, player_id_t player_id,
                        game_clock::time_point now) {
    auto* p = find_player(state, code, player_id);
    if (!p)
        return error_code::NotFound;
    p->last_activity = now;
    return error_code::None;
}

error_code update_player_position(server_state& state, player_id_t player_id, const vec3& position,
                                  const vec3& rotation, game_clock::time_point now, std::string& lobby_code) {
    for (auto& [code, l]: state.lobbies) {
        auto* p = l.find_player(player_id);
        if (!p)
            continue;
        p->position = position;
        p->rotation = rotation;
        p->last_activity = now;
        lobby_code = code;
        return error_code::None;
    }
    return error_code::NotFound;
}

cleanup_result cleanup_inactive_players(server_state& state, game_clock::time_point now,
                                        game_clock::duration timeout, game_clock::duration grace_period,
                                        event_list& events) {
    cleanup_result result;
    for (auto lobby_it = state.lobbies.begin(); lobby_it != state.lobbies.end();) {
        auto& [code, l] = *lobby_it;
        for (auto it = l.players.begin(); it != l.players.end();) {
            if (now - it->second.last_activity > timeout) {
                Printf(ansi::BrightYellow, "Removed inactive player #%u (%s) from lobby \"%s\".",
                       it->first, it->second.name, code);
                events.push_back({.type = game_event::PlayerLeft, .lobby_code = code, .player_id = it->first});
                l.client_addresses.erase(it->first);
                it = l.players.erase(it);
                ++result.players_removed;
            } else
                ++it;
        }

        if (l.players.empty() && !l.persistent && now - l.created_at >= grace_period) {
            Printf("Deleted empty lobby \"%s\".", code);
            lobby_it = state.lobbies.erase(lobby_it);
            ++result.lobbies_removed;
        } else
            ++lobby_it;
    }
    return result;
}

lobby* get_lobby(server_state& state, const std::string& code) {
    auto it = state.lobbies.find(normalize_code(code));
    return it == state.lobbies.end() ? nullptr : &it->second;
}

const lobby* get_lobby(const server_state& state, const std::string& code) {
    auto it = state.lobbies.find(normalize_code(code));
    return it == state.lobbies.end() ? nullptr : &it->second;
}

player* find_player(server_state& state, const std::string& code, player_id_t player_id) {
    auto* target = get_lobby(state, code);
    return target ? target->find_player(player_id) : nullptr;
}

}
