#include <cmath>
#include "simulator.hpp"

namespace ggs::simulator {

bool check_line_of_sight([[maybe_unused]] const vec3& from, [[maybe_unused]] const vec3& to) {
    return true;
}

std::optional<player_id_t> perform_hitscan([[maybe_unused]] const lobby& target_lobby,
                                           [[maybe_unused]] player_id_t shooter_id,
                                           [[maybe_unused]] const vec3& origin,
                                           [[maybe_unused]] const vec3& direction,
                                           [[maybe_unused]] float range) {
    return std::nullopt;
}

bool check_collision([[maybe_unused]] const vec3& position, [[maybe_unused]] float radius) {
    return false;
}

vec3 get_forward_vector(const vec3& rotation) {
    const float pitch = rotation.x, yaw = rotation.y;
    return {
        -std::sin(yaw) * std::cos(pitch),
        std::sin(pitch),
        -std::cos(yaw) * std::cos(pitch),
    };
}

}
