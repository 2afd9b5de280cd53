#include <fstream>
#include <iomanip>
#include "config_manager.hpp"

using ggs::Printf;

namespace YAML {
    template<>
    struct convert<ggs::weapon_data> {
        static Node encode(const ggs::weapon_data& weapon) {
            Node node;
            node["id"] = weapon.id;
            node["name"] = weapon.name;
            node["damage"] = weapon.damage;
            node["fire_rate"] = weapon.fire_rate;
            node["range"] = weapon.range;
            node["reload_time"] = weapon.reload_time;
            node["ammo_capacity"] = weapon.ammo_capacity;
            return node;
        }

        static bool decode(const Node& node, ggs::weapon_data& weapon) {
            if (!node.IsMap() || !node["id"] || !node["damage"] || !node["fire_rate"])
                return false;
            weapon.id = node["id"].as<ggs::weapon_id_t>();
            weapon.name = node["name"].as<std::string>("Weapon #" + std::to_string(weapon.id));
            weapon.damage = node["damage"].as<uint32_t>();
            weapon.fire_rate = node["fire_rate"].as<float>();
            weapon.range = node["range"].as<float>(0.0f);
            weapon.reload_time = node["reload_time"].as<float>(0.0f);
            weapon.ammo_capacity = node["ammo_capacity"].as<uint32_t>(0);
            return true;
        }
    };

    template<>
    struct convert<config_manager::lobby_template> {
        static Node encode(const config_manager::lobby_template& lobby) {
            Node node;
            node["code"] = lobby.code;
            node["max_players"] = lobby.max_players;
            node["scene"] = lobby.scene;
            return node;
        }

        static bool decode(const Node& node, config_manager::lobby_template& lobby) {
            if (!node.IsMap() || !node["code"])
                return false;
            lobby.code = node["code"].as<std::string>();
            lobby.max_players = node["max_players"].as<uint32_t>(ggs::DEFAULT_MAX_PLAYERS);
            lobby.scene = node["scene"].as<std::string>(ggs::DEFAULT_SCENE);
            return true;
        }
    };
}

namespace {
    template<typename T>
    T yaml_load_value(YAML::Node& node, const char* key, const T& default_v) {
        if (node[key])
            return node[key].as<T>();
        node[key] = default_v;
        return default_v;
    }

    template<typename Duration>
    Duration yaml_load_duration(YAML::Node& node, const char* key, const Duration& default_v) {
        return Duration{yaml_load_value<typename Duration::rep>(node, key, default_v.count())};
    }
}

bool config_manager::load() {
    std::ifstream ifile(path_);
    if (ifile.is_open() && ifile.peek() != std::ifstream::traits_type::eof()) {
        try {
            config_ = YAML::Load(ifile);
        } catch (const std::exception& e) {
            Printf("Error: failed to parse config: %s", e.what());
            return false;
        }
    } else {
        Printf("Config is empty. Generating default config...");
        config_ = YAML::Node(YAML::NodeType::Map);
    }
    ifile.close();

    if (!apply())
        return false;
    save();
    Printf("Config loaded successfully.");
    return true;
}

bool config_manager::load_from_string(const std::string& text) {
    try {
        config_ = text.empty() ? YAML::Node(YAML::NodeType::Map) : YAML::Load(text);
    } catch (const std::exception& e) {
        Printf("Error: failed to parse config: %s", e.what());
        return false;
    }
    return apply();
}

bool config_manager::apply() {
    if (!config_.IsMap()) {
        Printf("Error: config root must be a map.");
        return false;
    }
    try {
        http_port = yaml_load_value(config_, "http_port", http_port);
        udp_port = yaml_load_value(config_, "udp_port", udp_port);
        public_address = yaml_load_value(config_, "public_address", public_address);
        player_inactivity_timeout = yaml_load_duration(config_, "player_inactivity_timeout", player_inactivity_timeout);
        empty_lobby_grace_period = yaml_load_duration(config_, "empty_lobby_grace_period", empty_lobby_grace_period);
        cleanup_interval = yaml_load_duration(config_, "cleanup_interval", cleanup_interval);
        reload_tick_interval = yaml_load_duration(config_, "reload_tick_interval", reload_tick_interval);
        dummy_tick_interval = yaml_load_duration(config_, "dummy_tick_interval", dummy_tick_interval);
        state_sync_interval = yaml_load_duration(config_, "state_sync_interval", state_sync_interval);
        spawn_dummy_bot = yaml_load_value(config_, "spawn_dummy_bot", spawn_dummy_bot);
        default_max_players = yaml_load_value(config_, "default_max_players", default_max_players);
        default_scene = yaml_load_value(config_, "default_scene", default_scene);
        max_lobbies = yaml_load_value(config_, "max_lobbies", max_lobbies);
        default_lobbies = yaml_load_value(config_, "default_lobbies", default_lobbies);
        weapons_ = yaml_load_value(config_, "weapons", weapons_);
        io_threads = yaml_load_value(config_, "io_threads", io_threads);
        auto_flush_log = yaml_load_value(config_, "auto_flush_log", auto_flush_log);

        std::string logging_level_string = yaml_load_value(config_, "logging_level", std::string{"important"});
        if (!ggs::parse_logging_level(logging_level_string, logging_level)) {
            Printf("Warning: unknown logging level \"%s\", using \"important\".", logging_level_string);
            logging_level = ggs::log_level::Important;
        }
    } catch (const std::exception& e) {
        Printf("Error: invalid config value: %s", e.what());
        return false;
    }

    if (http_port == 0 || udp_port == 0) {
        Printf("Error: ports must be non-zero.");
        return false;
    }
    if (cleanup_interval.count() <= 0 || reload_tick_interval.count() <= 0 || dummy_tick_interval.count() <= 0
            || state_sync_interval.count() < 0) {
        Printf("Error: tick intervals must be positive.");
        return false;
    }
    if (default_max_players == 0) {
        Printf("Error: default_max_players must be positive.");
        return false;
    }
    for (const auto& lobby: default_lobbies) {
        if (!ggs::name_validator::is_valid_lobby_code(lobby.code)) {
            Printf("Error: default lobby code \"%s\" is invalid.", lobby.code);
            return false;
        }
        if (lobby.max_players == 0) {
            Printf("Error: default lobby \"%s\" must allow at least one player.", lobby.code);
            return false;
        }
    }
    if (io_threads < 1)
        io_threads = 1;

    role::set_logging_level(logging_level);
    ggs::set_auto_flush_log(auto_flush_log);
    return true;
}

void config_manager::save() {
    std::ofstream config_file(path_);
    if (!config_file.is_open()) {
        Printf("Error: failed to open config file for writing.");
        return;
    }
    auto current_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    config_file << "# Config file for Gun Game Server v" << ggs::current_version.to_string() << " - "
                    << std::put_time(std::localtime(&current_time), "%F %T") << "\n"
                << "# Notes:\n"
                   "# - Public address: the server_ip handed to clients in lobby info.\n"
                   "# - Inactivity timeout and lobby grace period are in seconds; intervals are in milliseconds.\n"
                   "# - State sync interval: set to 0 to only answer explicit state requests.\n"
                   "# - Default lobbies are created at start-up and never expire.\n"
                   "# - Weapons: ammo_capacity 0 marks a melee weapon with unlimited use. Id 0 is reserved.\n"
                   "# - Options for log levels: important, warning, msg, verbose.\n"
                   "# - Auto flush log: whether to automatically flush the log file after each output.\n"
                << std::endl;
    config_file << config_;
    config_file << std::endl;
    config_file.close();
}

void config_manager::print() const {
    Printf("HTTP port: %u, UDP port: %u, public address: %s.", http_port, udp_port, public_address);
    Printf("Inactivity timeout: %llds, empty lobby grace: %llds.",
           (long long) player_inactivity_timeout.count(), (long long) empty_lobby_grace_period.count());
    Printf("Intervals (ms): cleanup %lld, reload %lld, dummy %lld, state sync %lld.",
           (long long) cleanup_interval.count(), (long long) reload_tick_interval.count(),
           (long long) dummy_tick_interval.count(), (long long) state_sync_interval.count());
    Printf("Lobbies: up to %u, default capacity %u, default scene \"%s\", dummy bots %s.",
           max_lobbies, default_max_players, default_scene, spawn_dummy_bot ? "on" : "off");
    Printf("Logging level: %s.", ggs::get_logging_level_name(logging_level));
}
