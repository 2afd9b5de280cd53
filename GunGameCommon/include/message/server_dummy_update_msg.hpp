#ifndef GUNGAMESERVER_SERVER_DUMMY_UPDATE_MSG_HPP
#define GUNGAMESERVER_SERVER_DUMMY_UPDATE_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    struct server_dummy_update_msg: public serializable_message {
        server_dummy_update_msg(): serializable_message(message_type::ServerDummyUpdate) {}

        player_id_t player_id{};
        vec3 position{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["position"] = message_utils::write_vec3(position);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_vec3(content, "position", position)
                && message_utils::read_uint(content, "player_id", player_id);
        }
    };
}

#endif //GUNGAMESERVER_SERVER_DUMMY_UPDATE_MSG_HPP
