#ifndef GUNGAMESERVER_PLAYER_EVENT_MSG_HPP
#define GUNGAMESERVER_PLAYER_EVENT_MSG_HPP
#include "message_utils.hpp"

namespace ggs {
    // `{"type", "player_id"}`
    template<message_type T>
    struct player_event_msg: public serializable_message {
        player_event_msg(): serializable_message(T) {}

        player_id_t player_id{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_uint(content, "player_id", player_id);
        }
    };

    typedef player_event_msg<message_type::PlayerLeft> player_left_msg;
    typedef player_event_msg<message_type::ReloadStarted> reload_started_msg;

    struct reload_finished_msg: public serializable_message {
        reload_finished_msg(): serializable_message(message_type::ReloadFinished) {}

        player_id_t player_id{};
        uint32_t ammo{};

        bool serialize() override {
            content["player_id"] = message_utils::write_uint(player_id);
            content["ammo"] = message_utils::write_uint(ammo);
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            return message_utils::read_uint(content, "player_id", player_id)
                && message_utils::read_uint(content, "ammo", ammo);
        }
    };
}

#endif //GUNGAMESERVER_PLAYER_EVENT_MSG_HPP
