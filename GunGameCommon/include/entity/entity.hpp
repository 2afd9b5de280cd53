#ifndef GUNGAMESERVER_ENTITY_HPP
#define GUNGAMESERVER_ENTITY_HPP
#include <cstdint>
#include <cmath>

namespace ggs {
    typedef uint32_t player_id_t;
    typedef uint32_t weapon_id_t;

    struct vec3 {
        float x = 0.0f, y = 0.0f, z = 0.0f;

        bool operator==(const vec3&) const = default;

        vec3 operator-(const vec3& other) const noexcept {
            return {x - other.x, y - other.y, z - other.z};
        }

        float length() const noexcept {
            return std::sqrt(x * x + y * y + z * z);
        }

        float distance_to(const vec3& other) const noexcept {
            return (*this - other).length();
        }
    };
}

#endif //GUNGAMESERVER_ENTITY_HPP
