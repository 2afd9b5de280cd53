#ifndef GUNGAMESERVER_WEAPON_DATABASE_HPP
#define GUNGAMESERVER_WEAPON_DATABASE_HPP
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "server_data.hpp"

namespace ggs {
    struct weapon_data {
        weapon_id_t id{};
        std::string name;
        uint32_t damage{};
        float fire_rate{};      // shots per second
        float range{};
        float reload_time{};    // seconds
        uint32_t ammo_capacity{}; // 0: melee, never runs dry

        inline bool is_melee() const noexcept { return ammo_capacity == 0; }

        std::chrono::nanoseconds get_cooldown() const {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::duration<double>(1.0 / fire_rate));
        }

        std::chrono::nanoseconds get_reload_duration() const {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::duration<double>(reload_time));
        }
    };

    // Immutable once constructed.
    class weapon_database {
        std::map<weapon_id_t, weapon_data> weapons_;

    public:
        typedef std::map<weapon_id_t, weapon_data>::const_iterator const_iterator;

        weapon_database() = default;
        // invalid and duplicate entries are logged and skipped
        explicit weapon_database(const std::vector<weapon_data>& weapons);

        static const std::vector<weapon_data>& get_default_weapons();
        static bool is_valid(const weapon_data& weapon, std::string& reason);

        const weapon_data* get(weapon_id_t id) const;
        inline bool contains(weapon_id_t id) const { return weapons_.contains(id); }
        inline std::size_t size() const noexcept { return weapons_.size(); }
        inline bool empty() const noexcept { return weapons_.empty(); }

        const_iterator begin() const { return weapons_.begin(); }
        const_iterator end() const { return weapons_.end(); }

        void print() const;
    };
}

#endif //GUNGAMESERVER_WEAPON_DATABASE_HPP
