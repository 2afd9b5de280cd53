#ifndef GUNGAMESERVER_DUMMY_BOT_HPP
#define GUNGAMESERVER_DUMMY_BOT_HPP
#include "server_data.hpp"

namespace ggs::dummy_bot {
    player create(game_clock::time_point now);

    // Deterministic circle around the origin, parameterized by seconds since server start.
    vec3 get_position_at(double elapsed_seconds);

    // Moves every lobby's bot. @returns how many bots were moved.
    std::size_t advance(server_state& state, double elapsed_seconds);
}

#endif //GUNGAMESERVER_DUMMY_BOT_HPP
