#ifndef GUNGAMESERVER_CONFIG_MANAGER_HPP
#define GUNGAMESERVER_CONFIG_MANAGER_HPP
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <string>
#include <vector>
#include "server_data.hpp"
#include "weapon_database.hpp"

class config_manager {
public:
    struct lobby_template {
        std::string code;
        uint32_t max_players = ggs::DEFAULT_MAX_PLAYERS;
        std::string scene = ggs::DEFAULT_SCENE;
    };

private:
    YAML::Node config_;
    std::string path_;
    std::vector<ggs::weapon_data> weapons_ = ggs::weapon_database::get_default_weapons();

    bool apply();

public:
    uint16_t http_port = ggs::DEFAULT_HTTP_PORT, udp_port = ggs::DEFAULT_UDP_PORT;
    std::string public_address = ggs::DEFAULT_PUBLIC_ADDRESS;
    std::chrono::seconds player_inactivity_timeout = ggs::PLAYER_INACTIVITY_TIMEOUT,
                         empty_lobby_grace_period = ggs::EMPTY_LOBBY_GRACE_PERIOD;
    std::chrono::milliseconds cleanup_interval = ggs::CLEANUP_INTERVAL,
                              reload_tick_interval = ggs::RELOAD_TICK_INTERVAL,
                              dummy_tick_interval = ggs::DUMMY_TICK_INTERVAL,
                              state_sync_interval = ggs::STATE_SYNC_INTERVAL; // 0: no periodic sync
    bool spawn_dummy_bot = true;
    uint32_t default_max_players = ggs::DEFAULT_MAX_PLAYERS, max_lobbies = ggs::DEFAULT_MAX_LOBBIES;
    std::string default_scene = ggs::DEFAULT_SCENE;
    std::vector<lobby_template> default_lobbies{{"test", 8, "test_world"}};
    int io_threads = 2;
    ggs::log_level logging_level = ggs::log_level::Important;
    bool auto_flush_log = false;

    explicit config_manager(std::string path = ggs::CONFIG_FILE_NAME): path_(std::move(path)) {}

    // Reads the config file, fills in missing keys with defaults and writes it back.
    bool load();
    // Same as load() but from text, without touching the disk.
    bool load_from_string(const std::string& text);
    void save();

    inline const std::vector<ggs::weapon_data>& get_weapons() const { return weapons_; }
    inline const std::string& get_path() const { return path_; }

    void print() const;
};

#endif //GUNGAMESERVER_CONFIG_MANAGER_HPP
