#ifndef GUNGAMESERVER_SHOOT_MSG_HPP
#define GUNGAMESERVER_SHOOT_MSG_HPP
#include <optional>
#include "message_utils.hpp"

namespace ggs {
    struct shoot_msg: public serializable_message {
        shoot_msg(): serializable_message(message_type::Shoot) {}

        std::string lobby_code;
        player_id_t player_id{};
        // the player the client believes it hit; only a claim, verified server-side
        std::optional<player_id_t> target_id;

        bool serialize() override {
            content["lobby_code"] = picojson::value(lobby_code);
            content["player_id"] = message_utils::write_uint(player_id);
            if (target_id)
                content["target_id"] = message_utils::write_uint(*target_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            if (!message_utils::read_string(content, "lobby_code", lobby_code)
                    || !message_utils::read_uint(content, "player_id", player_id))
                return false;
            target_id.reset();
            if (auto it = content.find("target_id"); it != content.end() && !it->second.is<picojson::null>()) {
                player_id_t target{};
                if (!message_utils::read_uint(content, "target_id", target))
                    return false;
                target_id = target;
            }
            return true;
        }
    };
}

#endif //GUNGAMESERVER_SHOOT_MSG_HPP
