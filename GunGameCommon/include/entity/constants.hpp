#ifndef GUNGAMESERVER_CONSTANTS_HPP
#define GUNGAMESERVER_CONSTANTS_HPP
#include <chrono>
#include <cstdint>
#include <cstddef>
#include "entity.hpp"
#include "globals.hpp"

namespace ggs {
    constexpr const uint16_t DEFAULT_HTTP_PORT = 8080,
                             DEFAULT_UDP_PORT = 8081;

    constexpr std::chrono::milliseconds RELOAD_TICK_INTERVAL{100},
                                        DUMMY_TICK_INTERVAL{100},
                                        CLEANUP_INTERVAL{5000},
                                        STATE_SYNC_INTERVAL{1000};

    constexpr std::chrono::seconds PLAYER_INACTIVITY_TIMEOUT{30},
                                   EMPTY_LOBBY_GRACE_PERIOD{10};

    // a lobby whose state did not change is still re-synced every n periodic broadcasts
    constexpr const int STATE_SYNC_FORCE_INTERVALS = 5;

    constexpr const std::size_t MAX_DATAGRAM_SIZE = 8192,
                                MAX_HTTP_REQUEST_SIZE = 64 * 1024,
                                MAX_LOBBY_CODE_LENGTH = 32;

    constexpr const uint32_t DEFAULT_MAX_PLAYERS = 4,
                             DEFAULT_MAX_LOBBIES = 1000;
    constexpr const char* DEFAULT_SCENE = "world";
    constexpr const char* DEFAULT_PUBLIC_ADDRESS = "127.0.0.1";

    constexpr const uint32_t DEFAULT_MAX_HEALTH = 100,
                             MAX_DAMAGE_PER_HIT = 100;

    // upper bound for weapon reload times and shot intervals, in seconds
    constexpr const float MAX_WEAPON_INTERVAL = 3600.0f;

    // ids handed out by the server start at 1; 0 is never issued to a client
    constexpr const player_id_t DUMMY_PLAYER_ID = 0;
    constexpr const weapon_id_t NO_WEAPON = 0;

    constexpr const char* DUMMY_PLAYER_NAME = "DummyBot";
    constexpr const weapon_id_t DUMMY_WEAPON_ID = 3;
    constexpr const float DUMMY_ORBIT_RADIUS = 3.0f,
                          DUMMY_ANGULAR_SPEED = 0.5f, // rad/s
                          DUMMY_HEIGHT = 1.0f;

    constexpr const char* CONFIG_FILE_NAME = "config.yml";
}

#endif //GUNGAMESERVER_CONSTANTS_HPP
