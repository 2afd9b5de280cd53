#ifndef GUNGAMESERVER_WEAPON_SWITCH_MSG_HPP
#define GUNGAMESERVER_WEAPON_SWITCH_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    struct weapon_switch_msg: public serializable_message {
        weapon_switch_msg(): serializable_message(message_type::WeaponSwitch) {}

        std::string lobby_code;
        player_id_t player_id{};
        weapon_id_t weapon_id{};

        bool serialize() override {
            content["lobby_code"] = picojson::value(lobby_code);
            content["player_id"] = message_utils::write_uint(player_id);
            content["weapon_id"] = message_utils::write_uint(weapon_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_string(content, "lobby_code", lobby_code)
                && message_utils::read_uint(content, "player_id", player_id)
                && message_utils::read_uint(content, "weapon_id", weapon_id);
        }
    };

    struct weapon_switched_msg: public serializable_message {
        weapon_switched_msg(): serializable_message(message_type::WeaponSwitched) {}

        player_id_t player_id{};
        weapon_id_t weapon_id{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["weapon_id"] = message_utils::write_uint(weapon_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_uint(content, "player_id", player_id)
                && message_utils::read_uint(content, "weapon_id", weapon_id);
        }
    };
}

#endif //GUNGAMESERVER_WEAPON_SWITCH_MSG_HPP
