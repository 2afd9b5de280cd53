#ifndef GUNGAMESERVER_SIMULATOR_HPP
#define GUNGAMESERVER_SIMULATOR_HPP
#include <optional>
#include "server_data.hpp"

// World queries used by combat resolution. There is no level geometry on the
// server yet, so every query answers as if the world were empty.
namespace ggs::simulator {
    bool check_line_of_sight(const vec3& from, const vec3& to);

    // @returns the first player hit along the ray, if any
    std::optional<player_id_t> perform_hitscan(const lobby& target_lobby, player_id_t shooter_id,
                                               const vec3& origin, const vec3& direction, float range);

    bool check_collision(const vec3& position, float radius);

    // unit vector for a (pitch, yaw, roll) rotation in radians, -z forward
    vec3 get_forward_vector(const vec3& rotation);
}

#endif //GUNGAMESERVER_SIMULATOR_HPP
