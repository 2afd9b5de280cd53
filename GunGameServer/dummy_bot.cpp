#include <cmath>
#include "dummy_bot.hpp"

namespace ggs::dummy_bot {

player create(game_clock::time_point now) {
    player bot{
        .id = DUMMY_PLAYER_ID,
        .name = DUMMY_PLAYER_NAME,
        .position = get_position_at(0.0),
        .current_weapon_id = DUMMY_WEAPON_ID,
        .last_activity = now,
    };
    return bot;
}

vec3 get_position_at(double elapsed_seconds) {
    const double angle = elapsed_seconds * DUMMY_ANGULAR_SPEED;
    return {
        static_cast<float>(DUMMY_ORBIT_RADIUS * std::cos(angle)),
        DUMMY_HEIGHT,
        static_cast<float>(DUMMY_ORBIT_RADIUS * std::sin(angle)),
    };
}

std::size_t advance(server_state& state, double elapsed_seconds) {
    const vec3 position = get_position_at(elapsed_seconds);
    std::size_t moved = 0;
    for (auto& [_, lobby]: state.lobbies) {
        if (!lobby.dummy_player)
            continue;
        lobby.dummy_player->position = position;
        ++moved;
    }
    return moved;
}

}
