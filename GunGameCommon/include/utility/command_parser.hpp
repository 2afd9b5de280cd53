#ifndef GUNGAMESERVER_COMMAND_PARSER_HPP
#define GUNGAMESERVER_COMMAND_PARSER_HPP
#include <string>
#include <cctype>

namespace ggs {
    class command_parser {
        std::string cmd_;
        std::size_t pos_ = 0;

        void skip_spaces() {
            while (pos_ < cmd_.length() && std::isspace(static_cast<unsigned char>(cmd_[pos_])))
                ++pos_;
        }

    public:
        command_parser(const std::string& cmd = ""): cmd_(cmd) {}

        bool empty() const noexcept {
            return cmd_.find_first_not_of(" \t\n\v\f\r", pos_) == std::string::npos;
        }

        std::string get_next_word(bool lowercase = false) {
            skip_spaces();
            std::string word;
            while (pos_ < cmd_.length() && !std::isspace(static_cast<unsigned char>(cmd_[pos_]))) {
                word += lowercase ? static_cast<char>(std::tolower(static_cast<unsigned char>(cmd_[pos_]))) : cmd_[pos_];
                ++pos_;
            }
            return word;
        }

        std::string get_rest_of_line() {
            skip_spaces();
            std::string rest = cmd_.substr(pos_);
            pos_ = cmd_.length();
            return rest;
        }
    };
}

#endif //GUNGAMESERVER_COMMAND_PARSER_HPP
