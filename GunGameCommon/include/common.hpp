#ifndef GUNGAMESERVER_HEADERS_COMMON_HPP
#define GUNGAMESERVER_HEADERS_COMMON_HPP

#include "entity/constants.hpp"
#include "entity/entity.hpp"
#include "entity/globals.hpp"
#include "entity/player_state.hpp"
#include "entity/version.hpp"
#include "role/role.hpp"
#include "utility/ansi_colors.hpp"
#include "utility/name_validator.hpp"
#include "utility/command_parser.hpp"
#include "utility/console.hpp"
#include "utility/misc.hpp"
#include "utility/string_utils.hpp"
#include "message/message_all.hpp"

#endif //GUNGAMESERVER_HEADERS_COMMON_HPP
