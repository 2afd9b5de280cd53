#ifndef GUNGAMESERVER_CONSOLE_HPP
#define GUNGAMESERVER_CONSOLE_HPP
#include "command_parser.hpp"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <mutex>
#include <cstdlib>

namespace ggs {
class console {
    command_parser parser_;
    std::map<std::string, std::function<void()>> commands_;
    std::map<std::string, std::string> descriptions_;
    std::string command_name_;
    std::mutex console_mutex_;

public:
    static inline console* instance = nullptr;

    console();
    ~console();

    static void set_completion_callback(std::function<std::vector<std::string>(const std::vector<std::string>&)> func);

    const std::string get_help_string() const;
    const std::vector<std::string> get_command_list() const;
    const std::vector<std::string> get_command_hints(bool fuzzy_matching = false, const char* cmd = nullptr) const;

    // returns true if the input stream doesn't have any errors.
    static bool read_input(std::string& buf);
    bool execute(const std::string &cmd);

    bool register_command(const std::string &name, const std::function<void()> &handler,
                          const std::string& description = "");
    bool register_aliases(const std::string &name, const std::vector<std::string> &aliases);

    bool empty() const noexcept;
    inline const std::string get_command_name() const { return command_name_; };

    const std::string get_next_word(bool lowercase = false);
    const std::string get_rest_of_line();
    inline int64_t get_next_long() { return std::atoll(get_next_word().c_str()); };
};

}

#endif // GUNGAMESERVER_CONSOLE_HPP
