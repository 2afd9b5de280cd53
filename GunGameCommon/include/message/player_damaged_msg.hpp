#ifndef GUNGAMESERVER_PLAYER_DAMAGED_MSG_HPP
#define GUNGAMESERVER_PLAYER_DAMAGED_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    struct player_damaged_msg: public serializable_message {
        player_damaged_msg(): serializable_message(message_type::PlayerDamaged) {}

        player_id_t player_id{};
        uint32_t damage{};
        player_id_t attacker_id{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["damage"] = message_utils::write_uint(damage);
            content["attacker_id"] = message_utils::write_uint(attacker_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_uint(content, "player_id", player_id)
                && message_utils::read_uint(content, "damage", damage)
                && message_utils::read_uint(content, "attacker_id", attacker_id);
        }
    };

    struct player_died_msg: public serializable_message {
        player_died_msg(): serializable_message(message_type::PlayerDied) {}

        player_id_t player_id{};
        player_id_t attacker_id{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["attacker_id"] = message_utils::write_uint(attacker_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_uint(content, "player_id", player_id)
                && message_utils::read_uint(content, "attacker_id", attacker_id);
        }
    };
}

#endif //GUNGAMESERVER_PLAYER_DAMAGED_MSG_HPP
