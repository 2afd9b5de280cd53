#include <random>
#include "entity/constants.hpp"
#include "utility/name_validator.hpp"

namespace ggs::name_validator {
    std::size_t get_invalid_char_pos(const std::string& name) {
        return name.find_first_not_of(valid_chars);
    };

    bool is_valid(const std::string& name) {
        return (get_invalid_char_pos(name) == std::string::npos
                && is_of_valid_length(name)
                && name.find_first_not_of("_ ") != std::string::npos);
    };

    std::string get_random_nickname() {
        thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<int> distribution(0, 9999);
        std::string name(16, 0);
        name.resize(std::snprintf(name.data(), name.size(), "Player%04d", distribution(generator)));
        return name;
    };

    std::string get_valid_nickname(std::string name) {
        if (name.length() > max_length)
            name.resize(max_length);
        else if (name.length() < min_length)
            name.append(min_length - name.length(), '_');
        size_t invalid_pos = std::string::npos;
        while ((invalid_pos = get_invalid_char_pos(name)) != std::string::npos) {
            name[invalid_pos] = '_';
        };
        if (name.find_first_not_of("_ ") == std::string::npos)
            return get_random_nickname();
        return name;
    };

    bool is_valid_lobby_code(const std::string& code) {
        return !code.empty() && code.length() <= MAX_LOBBY_CODE_LENGTH
            && code.find_first_not_of(valid_code_chars) == std::string::npos;
    }
};
