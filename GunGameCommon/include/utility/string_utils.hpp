#ifndef GUNGAMESERVER_STRING_UTILS_HPP
#define GUNGAMESERVER_STRING_UTILS_HPP
#include <vector>
#include <string>
#include <algorithm>
#include <ranges>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace ggs::string_utils {
    inline std::string to_lower(std::string data) {
        std::ranges::transform(data, data.begin(),
                               [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    inline std::string join_strings(const std::vector<std::string>& strings, size_t start = 0, const char* delim = " ") {
        if (strings.size() <= start) return "";
        std::string str = strings[start];
        for (size_t i = start + 1; i < strings.size(); i++)
            str.append(delim + strings[i]);
        return str;
    }

    inline std::vector<std::string> split_strings(const std::string& str, char delim = ' ') {
        std::vector<std::string> parts;
        auto split_view = str | std::views::split(delim);
        for (const auto& part: split_view)
            parts.emplace_back(part.begin(), part.end());
        return parts;
    }

    inline std::string trim(const std::string& str) {
        const auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        const auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }

    inline std::string get_build_time_string() {
        std::stringstream input_ss { __DATE__ }, output_ss {};
        std::tm date_struct{};
        input_ss >> std::get_time(&date_struct, "%b %e %Y");
        output_ss << std::put_time(&date_struct, "%F ") << __TIME__;
        return output_ss.str();
    }
}

#endif //GUNGAMESERVER_STRING_UTILS_HPP
