#ifndef GUNGAMESERVER_STATE_SYNC_MSG_HPP
#define GUNGAMESERVER_STATE_SYNC_MSG_HPP
#include <vector>
#include "message_utils.hpp"

namespace ggs {
    struct state_sync_msg: public serializable_message {
        state_sync_msg(): serializable_message(message_type::StateSync) {}

        std::vector<player_sync_snapshot> players;

        bool serialize() override {
            picojson::array list;
            list.reserve(players.size());
            for (const auto& snapshot: players)
                list.emplace_back(message_utils::write_snapshot(snapshot));
            content["players"] = picojson::value(std::move(list));
            return serializable_message::serialize();
        }

        bool deserialize() override {
            if (!serializable_message::deserialize())
                return false;
            auto it = content.find("players");
            if (it == content.end() || !it->second.is<picojson::array>())
                return false;
            players.clear();
            for (const auto& element: it->second.get<picojson::array>()) {
                player_sync_snapshot snapshot;
                if (!element.is<picojson::object>()
                        || !message_utils::read_snapshot(element.get<picojson::object>(), snapshot))
                    return false;
                players.push_back(snapshot);
            }
            return true;
        }
    };
}

#endif //GUNGAMESERVER_STATE_SYNC_MSG_HPP
