#ifndef GUNGAMESERVER_LOBBY_ACTION_MSG_HPP
#define GUNGAMESERVER_LOBBY_ACTION_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    // `{"type", "lobby_code", "player_id"}`: the shape shared by most client requests
    template<message_type T>
    struct lobby_action_msg: public serializable_message {
        lobby_action_msg(): serializable_message(T) {}

        std::string lobby_code;
        player_id_t player_id{};

        bool serialize() override {
            content["lobby_code"] = picojson::value(lobby_code);
            content["player_id"] = message_utils::write_uint(player_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_string(content, "lobby_code", lobby_code)
                && message_utils::read_uint(content, "player_id", player_id);
        }
    };

    typedef lobby_action_msg<message_type::Join> join_msg;
    typedef lobby_action_msg<message_type::Leave> leave_msg;
    typedef lobby_action_msg<message_type::Reload> reload_msg;
    typedef lobby_action_msg<message_type::RequestState> request_state_msg;
    typedef lobby_action_msg<message_type::Keepalive> keepalive_msg;
}

#endif //GUNGAMESERVER_LOBBY_ACTION_MSG_HPP
