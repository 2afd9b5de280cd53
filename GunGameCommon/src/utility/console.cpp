#include <iostream>
#include <algorithm>
#include <replxx.hxx>
#include "entity/globals.hpp"
#include "utility/console.hpp"
#include "utility/string_utils.hpp"

namespace ggs {

namespace {
    replxx::Replxx::hints_t command_hint(std::string const& input, int& contextLen, [[maybe_unused]] replxx::Replxx::Color& color) {
        if (!console::instance || input.empty() || input.find_first_of(" \t\n\v\f\r") != std::string::npos)
            return {};
        auto hints = console::instance->get_command_hints(false, input.c_str());
        contextLen = input.length();
        if (hints.size() == 1)
            return hints;
        return {};
    }
}

replxx::Replxx replxx_instance = [] {
    replxx::Replxx instance;

    instance.install_window_change_handler();
    instance.set_complete_on_empty(false);
    instance.set_hint_callback(command_hint);
    instance.set_indent_multiline(true);
    instance.set_ignore_case(false);

    return instance;
}();

console::console() {
    instance = this;
    set_completion_callback([](const std::vector<std::string>& args) -> std::vector<std::string> {
        if (args.size() == 1 && console::instance)
            return console::instance->get_command_hints(false, args[0].c_str());
        return {};
    });
}

console::~console() {
    if (instance == this)
        instance = nullptr;
}

void console::set_completion_callback(std::function<std::vector<std::string>(const std::vector<std::string>&)> func) {
    replxx_instance.set_completion_callback([func](std::string const& input, int& contextLen)
                                            -> replxx::Replxx::completions_t {
        auto words = string_utils::split_strings(input);
        if (words.empty())
            words.emplace_back();
        const auto& last_word = words.back();
        contextLen = last_word.length();
        replxx::Replxx::completions_t completions;
        for (const auto& hint: func(words))
            if (hint.starts_with(last_word)) completions.emplace_back(hint);
        return completions;
    });
}

const std::string console::get_help_string() const {
    std::string help_string;
    for (const auto& [name, _]: commands_) {
        help_string += "\n  " + name;
        if (auto it = descriptions_.find(name); it != descriptions_.end() && !it->second.empty())
            help_string += ": " + it->second;
    }
    return "Available commands:" + help_string;
};

const std::vector<std::string> console::get_command_list() const {
    std::vector<std::string> command_list;
    for (const auto& i: commands_)
        command_list.emplace_back(i.first);
    return command_list;
};

const std::vector<std::string> console::get_command_hints(bool fuzzy_matching, const char* cmd) const {
    std::string start_name(cmd ? cmd : command_name_.c_str());
    if (start_name.empty())
        return {"help"};
    if (fuzzy_matching && start_name.length() > 1)
        start_name.erase((start_name.length() - 1) * 2 / 3 + 1);
    std::string end_name(start_name);
    ++end_name[end_name.length() - 1];
    auto end = commands_.lower_bound(end_name);
    std::vector<std::string> hints;
    for (auto it = commands_.lower_bound(start_name); it != end; it++)
        hints.push_back(it->first);
    return hints;
};

bool console::read_input(std::string &buf) {
    replxx_instance.print("\r\033[0K");
    auto input_cstr = replxx_instance.input("> ");
    if (!input_cstr)
        return false;
    buf.assign(input_cstr);
    if (!buf.empty())
        replxx_instance.history_add(buf);
    return std::cin.good();
}

bool console::execute(const std::string &cmd) {
    std::function<void()> handler;
    {
        std::unique_lock lk(console_mutex_);
        parser_ = command_parser(cmd);
        command_name_ = string_utils::to_lower(parser_.get_next_word());
        auto it = commands_.find(command_name_);
        if (it == commands_.end())
            return false;
        handler = it->second;
    }
    handler();
    return true;
};

bool console::register_command(const std::string &name, const std::function<void()> &handler,
                               const std::string& description) {
    auto name_lower = string_utils::to_lower(name);
    std::unique_lock lk(console_mutex_);
    if (commands_.contains(name_lower))
        return false;
    commands_[name_lower] = handler;
    descriptions_[name_lower] = description;
    return true;
};

bool console::register_aliases(const std::string &name, const std::vector<std::string> &aliases) {
    std::unique_lock lk(console_mutex_);
    auto it = commands_.find(string_utils::to_lower(name));
    if (it == commands_.end())
        return false;
    for (const auto& i: aliases)
        commands_.emplace(string_utils::to_lower(i), it->second);
    return true;
};

bool console::empty() const noexcept {
    return parser_.empty();
};

const std::string console::get_next_word(bool to_lowercase) {
    return parser_.get_next_word(to_lowercase);
};

const std::string console::get_rest_of_line() {
    return parser_.get_rest_of_line();
}

}
