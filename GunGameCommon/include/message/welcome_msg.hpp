#ifndef GUNGAMESERVER_WELCOME_MSG_HPP
#define GUNGAMESERVER_WELCOME_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    struct welcome_msg: public serializable_message {
        welcome_msg(): serializable_message(message_type::Welcome) {}

        std::string text = "Connected to lobby";
        std::string lobby_code;
        player_id_t player_id{};

        bool serialize() override {
            content["message"] = picojson::value(text);
            content["lobby_code"] = picojson::value(lobby_code);
            content["player_id"] = message_utils::write_uint(player_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_string(content, "message", text)
                && message_utils::read_string(content, "lobby_code", lobby_code)
                && message_utils::read_uint(content, "player_id", player_id);
        }
    };
}

#endif //GUNGAMESERVER_WELCOME_MSG_HPP
