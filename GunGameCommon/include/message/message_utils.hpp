#ifndef GUNGAMESERVER_MESSAGE_UTILS_HPP
#define GUNGAMESERVER_MESSAGE_UTILS_HPP
#include <string>
#include <cmath>
#include <limits>
#include <concepts>
#include <optional>
#include "message.hpp"
#include "../entity/player_state.hpp"

namespace ggs::message_utils {
    using picojson::value;

    inline bool read_string(const picojson::object& object, const char* key, std::string& str) {
        auto it = object.find(key);
        if (it == object.end() || !it->second.is<std::string>())
            return false;
        str = it->second.get<std::string>();
        return true;
    }

    // accepts integral JSON numbers only ("3" and "3.0" both pass, "3.5" and "-1" don't)
    template<std::unsigned_integral T>
    inline bool read_uint(const picojson::object& object, const char* key, T& out) {
        auto it = object.find(key);
        if (it == object.end())
            return false;
        if (it->second.is<int64_t>()) {
            int64_t v = it->second.get<int64_t>();
            if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max())
                return false;
            out = static_cast<T>(v);
            return true;
        }
        if (it->second.is<double>()) {
            double v = it->second.get<double>();
            if (v < 0 || v != std::floor(v) || v > static_cast<double>(std::numeric_limits<T>::max()))
                return false;
            out = static_cast<T>(v);
            return true;
        }
        return false;
    }

    inline bool read_float(const picojson::object& object, const char* key, float& out) {
        auto it = object.find(key);
        if (it == object.end() || !it->second.is<double>())
            return false;
        double v = it->second.get<double>();
        if (!std::isfinite(v))
            return false;
        out = static_cast<float>(v);
        return true;
    }

    inline bool read_bool(const picojson::object& object, const char* key, bool& out) {
        auto it = object.find(key);
        if (it == object.end() || !it->second.is<bool>())
            return false;
        out = it->second.get<bool>();
        return true;
    }

    inline bool read_vec3(const picojson::object& object, const char* key, vec3& out) {
        auto it = object.find(key);
        if (it == object.end() || !it->second.is<picojson::object>())
            return false;
        const auto& v = it->second.get<picojson::object>();
        vec3 result;
        if (!read_float(v, "x", result.x) || !read_float(v, "y", result.y) || !read_float(v, "z", result.z))
            return false;
        out = result;
        return true;
    }

    inline value write_uint(uint64_t v) {
        return value(static_cast<int64_t>(v));
    }

    inline value write_vec3(const vec3& v) {
        return value(picojson::object{
            {"x", value(static_cast<double>(v.x))},
            {"y", value(static_cast<double>(v.y))},
            {"z", value(static_cast<double>(v.z))},
        });
    }

    inline value write_player_info(const player_info& info) {
        return value(picojson::object{
            {"id", write_uint(info.id)},
            {"name", value(info.name)},
        });
    }

    inline bool read_player_info(const picojson::object& object, player_info& info) {
        return read_uint(object, "id", info.id) && read_string(object, "name", info.name);
    }

    inline value write_snapshot(const player_sync_snapshot& s) {
        return value(picojson::object{
            {"id", write_uint(s.id)},
            {"position", write_vec3(s.position)},
            {"rotation", write_vec3(s.rotation)},
            {"health", write_uint(s.health)},
            {"max_health", write_uint(s.max_health)},
            {"current_weapon_id", write_uint(s.current_weapon_id)},
            {"current_ammo", write_uint(s.current_ammo)},
            {"max_ammo", write_uint(s.max_ammo)},
            {"is_reloading", value(s.is_reloading)},
        });
    }

    inline bool read_snapshot(const picojson::object& object, player_sync_snapshot& s) {
        return read_uint(object, "id", s.id)
            && read_vec3(object, "position", s.position)
            && read_vec3(object, "rotation", s.rotation)
            && read_uint(object, "health", s.health)
            && read_uint(object, "max_health", s.max_health)
            && read_uint(object, "current_weapon_id", s.current_weapon_id)
            && read_uint(object, "current_ammo", s.current_ammo)
            && read_uint(object, "max_ammo", s.max_ammo)
            && read_bool(object, "is_reloading", s.is_reloading);
    }
}

#endif //GUNGAMESERVER_MESSAGE_UTILS_HPP
