#ifndef GUNGAMESERVER_NAME_VALIDATOR_HPP
#define GUNGAMESERVER_NAME_VALIDATOR_HPP
#include <string>

namespace ggs {
    namespace name_validator {
        inline constexpr const char *valid_chars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=.~() ";
        inline constexpr const char *valid_code_chars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-";

        inline constexpr std::size_t max_length = 20, min_length = 3;

        std::size_t get_invalid_char_pos(const std::string& name);

        inline bool is_of_valid_length(const std::string& name) {
            return (name.length() >= min_length && name.length() <= max_length);
        };

        // Valid player names are 3~20 characters long, contain only characters from
        // valid_chars and are not made up entirely of underscores or spaces.
        bool is_valid(const std::string& name);

        // "Player<random_number>"
        std::string get_random_nickname();

        // Invalid characters are replaced with underscores.
        // Names are truncated or padded with underscores to a valid length;
        // names left with nothing but padding are replaced by a random one.
        std::string get_valid_nickname(std::string name);

        // Lobby codes: 1~MAX_LOBBY_CODE_LENGTH characters of [A-Za-z0-9_-].
        bool is_valid_lobby_code(const std::string& code);
    };
}

#endif //GUNGAMESERVER_NAME_VALIDATOR_HPP
