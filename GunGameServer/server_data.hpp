#ifndef GUNGAMESERVER_SERVER_DATA_HPP
#define GUNGAMESERVER_SERVER_DATA_HPP
#include <asio/ip/udp.hpp>
#include <chrono>
#include <concepts>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../GunGameCommon/include/common.hpp"

namespace ggs {
    typedef std::chrono::steady_clock game_clock;

    enum class error_code {
        None,
        NotFound,           // lobby, player or weapon absent
        Conflict,           // duplicate lobby code
        Full,               // lobby at capacity
        InvalidOperation,   // an expected no-op, e.g. reloading twice
        MalformedMessage,
    };

    inline const char* error_code_to_string(error_code code) {
        switch (code) {
            case error_code::None: return "none";
            case error_code::NotFound: return "not found";
            case error_code::Conflict: return "conflict";
            case error_code::Full: return "lobby full";
            case error_code::InvalidOperation: return "invalid operation";
            case error_code::MalformedMessage: return "malformed message";
        }
        return "unknown";
    }

    // Things that happened inside a domain call and that the lobby should hear about.
    struct game_event {
        enum kind {
            PlayerLeft,
            PlayerDamaged,  // value: damage, other_id: attacker
            PlayerDied,     // other_id: attacker
            ReloadStarted,
            ReloadFinished, // value: ammo
            WeaponSwitched, // value: weapon id
        };

        kind type;
        std::string lobby_code;
        player_id_t player_id{};
        player_id_t other_id{};
        uint32_t value{};
    };

    typedef std::vector<game_event> event_list;

    template<typename T>
    concept damageable = requires(T t, const T ct, uint32_t amount) {
        { t.take_damage(amount) } -> std::same_as<bool>;
        t.heal(amount);
        { ct.is_alive() } -> std::convertible_to<bool>;
    };

    struct player {
        player_id_t id{};
        std::string name;
        vec3 position{}, rotation{};

        uint32_t health = DEFAULT_MAX_HEALTH, max_health = DEFAULT_MAX_HEALTH;

        weapon_id_t current_weapon_id = NO_WEAPON;
        uint32_t current_ammo = 0, max_ammo = 0;
        bool is_reloading = false;

        std::optional<game_clock::time_point> last_shot_time, reload_started_at;
        game_clock::time_point last_activity{};

        // @returns `true` only when this call took health from a positive value to 0
        bool take_damage(uint32_t amount) {
            if (health == 0)
                return false;
            health = (amount >= health) ? 0 : health - amount;
            return health == 0;
        }

        void heal(uint32_t amount) {
            health = (amount >= max_health - health) ? max_health : health + amount;
        }

        bool is_alive() const noexcept { return health > 0; }

        player_sync_snapshot get_snapshot() const {
            return {
                .id = id, .position = position, .rotation = rotation,
                .health = health, .max_health = max_health,
                .current_weapon_id = current_weapon_id,
                .current_ammo = current_ammo, .max_ammo = max_ammo,
                .is_reloading = is_reloading,
            };
        }
    };

    static_assert(damageable<player>);

    struct lobby {
        std::string code;
        uint32_t max_players = DEFAULT_MAX_PLAYERS;
        std::string scene;
        std::map<player_id_t, player> players;
        std::unordered_map<player_id_t, asio::ip::udp::endpoint> client_addresses;
        std::optional<player> dummy_player;
        game_clock::time_point created_at{};
        // created from the config; never expires while empty
        bool persistent = false;

        inline std::size_t get_player_count() const noexcept { return players.size(); }
        inline bool full() const noexcept { return players.size() >= max_players; }

        player* find_player(player_id_t id) {
            auto it = players.find(id);
            return it == players.end() ? nullptr : &it->second;
        }

        const player* find_player(player_id_t id) const {
            auto it = players.find(id);
            return it == players.end() ? nullptr : &it->second;
        }

        std::vector<player_info> get_roster() const {
            std::vector<player_info> roster;
            roster.reserve(players.size());
            for (const auto& [id, data]: players)
                roster.push_back({id, data.name});
            return roster;
        }
    };

    // The only mutable root of the game world. Keys of `lobbies` are lower-case codes.
    struct server_state {
        std::map<std::string, lobby> lobbies;
        player_id_t next_player_id = 1;
    };

    // One reader/writer lock for the whole world.
    struct shared_server_state {
        mutable std::shared_mutex mutex;
        server_state state;
    };
}

#endif //GUNGAMESERVER_SERVER_DATA_HPP
