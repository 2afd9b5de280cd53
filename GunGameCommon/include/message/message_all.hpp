#ifndef GUNGAMESERVER_MESSAGE_ALL_HPP
#define GUNGAMESERVER_MESSAGE_ALL_HPP

#include "message.hpp"
#include "message_utils.hpp"
#include "message_colors.hpp"
#include "lobby_action_msg.hpp"
#include "position_update_msg.hpp"
#include "shoot_msg.hpp"
#include "weapon_switch_msg.hpp"
#include "welcome_msg.hpp"
#include "player_joined_msg.hpp"
#include "player_event_msg.hpp"
#include "player_damaged_msg.hpp"
#include "state_sync_msg.hpp"
#include "server_dummy_update_msg.hpp"

#endif //GUNGAMESERVER_MESSAGE_ALL_HPP
