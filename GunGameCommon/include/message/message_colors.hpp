#ifndef GUNGAMESERVER_MSG_COLORS_HPP
#define GUNGAMESERVER_MSG_COLORS_HPP
#include "message.hpp"
#include "../utility/ansi_colors.hpp"

namespace ggs {
    inline int color_code(message_type type) {
        using a = ggs::ansi;
        switch (type) {
            case message_type::Join:
            case message_type::Welcome:
            case message_type::PlayerJoined:
                return a::BrightYellow;
            case message_type::Leave:
            case message_type::PlayerLeft:
                return a::BrightYellow | a::Underline;
            case message_type::PlayerDamaged:
                return a::Red;
            case message_type::PlayerDied:
                return a::BrightRed | a::Bold;
            case message_type::WeaponSwitch:
            case message_type::WeaponSwitched:
                return a::BrightBlue;
            case message_type::Reload:
            case message_type::ReloadStarted:
            case message_type::ReloadFinished:
                return a::Xterm256 | 248;
            case message_type::StateSync:
            case message_type::RequestState:
                return a::Italic;
            default:
                return a::Reset;
        }
    }
}

#endif //GUNGAMESERVER_MSG_COLORS_HPP
