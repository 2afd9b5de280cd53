#ifndef GUNGAMESERVER_POSITION_UPDATE_MSG_HPP
#define GUNGAMESERVER_POSITION_UPDATE_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    // Carries no lobby code; the server locates the player by id.
    // A missing rotation reads as zero.
    struct position_update_msg: public serializable_message {
        position_update_msg(): serializable_message(message_type::PositionUpdate) {}

        player_id_t player_id{};
        vec3 position{}, rotation{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["position"] = message_utils::write_vec3(position);
            content["rotation"] = message_utils::write_vec3(rotation);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            if (!message_utils::read_uint(content, "player_id", player_id)
                    || !message_utils::read_vec3(content, "position", position))
                return false;
            if (content.contains("rotation"))
                return message_utils::read_vec3(content, "rotation", rotation);
            rotation = {};
            return true;
        }
    };
}

#endif //GUNGAMESERVER_POSITION_UPDATE_MSG_HPP
