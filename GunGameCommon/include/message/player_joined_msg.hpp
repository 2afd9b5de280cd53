#ifndef GUNGAMESERVER_PLAYER_JOINED_MSG_HPP
#define GUNGAMESERVER_PLAYER_JOINED_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    struct player_joined_msg: public serializable_message {
        player_joined_msg(): serializable_message(message_type::PlayerJoined) {}

        player_info player;

        bool serialize() override {
            content["player"] = message_utils::write_player_info(player);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            auto it = content.find("player");
            if (it == content.end() || !it->second.is<picojson::object>())
                return false;
            return message_utils::read_player_info(it->second.get<picojson::object>(), player);
        }
    };
}

#endif //GUNGAMESERVER_PLAYER_JOINED_MSG_HPP
