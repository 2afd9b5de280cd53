#ifndef GUNGAMESERVER_MESSAGE_HPP
#define GUNGAMESERVER_MESSAGE_HPP

#define PICOJSON_USE_INT64
#include <picojson/picojson.h>
#include <string>
#include <string_view>
#include <concepts>
#include <type_traits>
#include "../entity/entity.hpp"

namespace ggs {
    enum class message_type {
        Unknown,

        // client -> server
        Join,
        Leave,
        PositionUpdate, // also relayed server -> client
        Shoot,
        Reload,
        WeaponSwitch,
        RequestState,
        Keepalive,

        // server -> client
        Welcome,
        PlayerJoined,
        PlayerLeft,
        WeaponSwitched,
        PlayerDamaged,
        PlayerDied,
        StateSync,
        ServerDummyUpdate,
        ReloadStarted,
        ReloadFinished,
    };

    inline const char* get_type_name(message_type type) {
        switch (type) {
            case message_type::Join: return "join";
            case message_type::Leave: return "leave";
            case message_type::PositionUpdate: return "position_update";
            case message_type::Shoot: return "shoot";
            case message_type::Reload: return "reload";
            case message_type::WeaponSwitch: return "weapon_switch";
            case message_type::RequestState: return "request_state";
            case message_type::Keepalive: return "keepalive";
            case message_type::Welcome: return "welcome";
            case message_type::PlayerJoined: return "player_joined";
            case message_type::PlayerLeft: return "player_left";
            case message_type::WeaponSwitched: return "weapon_switched";
            case message_type::PlayerDamaged: return "player_damaged";
            case message_type::PlayerDied: return "player_died";
            case message_type::StateSync: return "state_sync";
            case message_type::ServerDummyUpdate: return "server_dummy_update";
            case message_type::ReloadStarted: return "reload_started";
            case message_type::ReloadFinished: return "reload_finished";
            case message_type::Unknown: break;
        }
        return "unknown";
    }

    inline message_type get_message_type(std::string_view name) {
        for (int i = static_cast<int>(message_type::Join); i <= static_cast<int>(message_type::ReloadFinished); ++i) {
            auto type = static_cast<message_type>(i);
            if (name == get_type_name(type))
                return type;
        }
        return message_type::Unknown;
    }

    // Every datagram is one JSON object tagged with a "type" field.
    struct serializable_message {
        explicit serializable_message(message_type type): type(type) {}
        virtual ~serializable_message() = default;

        message_type type;
        picojson::object content;
        std::string raw;

        size_t size() const noexcept { return raw.size(); }
        const char* data() const noexcept { return raw.data(); }

        virtual void clear() {
            content.clear();
            raw.clear();
        }

        // raw text -> JSON object; fails on anything but an object
        static bool parse_object(std::string_view text, picojson::object& out) {
            picojson::value v;
            std::string err;
            picojson::parse(v, text.begin(), text.end(), &err);
            if (!err.empty() || !v.is<picojson::object>())
                return false;
            out = std::move(v.get<picojson::object>());
            return true;
        }

        static message_type get_type(const picojson::object& object) {
            auto it = object.find("type");
            if (it == object.end() || !it->second.is<std::string>())
                return message_type::Unknown;
            return get_message_type(it->second.get<std::string>());
        }

        // entity -> raw
        // derived messages fill `content` first, then call this
        virtual bool serialize() {
            content["type"] = picojson::value(get_type_name(type));
            raw = picojson::value(content).serialize();
            return true;
        }

        // raw -> entity
        // `content` may be filled in directly to skip parsing `raw` again
        virtual bool deserialize() {
            if (content.empty() && !parse_object(raw, content))
                return false;
            return get_type(content) == type;
        }
    };

    template<typename T>
    concept json_message = std::is_base_of_v<serializable_message, T>;
}

#endif //GUNGAMESERVER_MESSAGE_HPP
