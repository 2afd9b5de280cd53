#ifndef GUNGAMESERVER_VERSION_HPP
#define GUNGAMESERVER_VERSION_HPP
#include <cstdint>
#include <string>

#define STRINGIFY(x) #x
#define STR(x) STRINGIFY(x)
#ifndef GGS_MAJOR_VER
# define GGS_MAJOR_VER 0
# define GGS_MINOR_VER 3
# define GGS_SUBMINOR_VER 0
#endif

#define GGS_VER_STRING STR(GGS_MAJOR_VER) "." STR(GGS_MINOR_VER) "." STR(GGS_SUBMINOR_VER)

namespace ggs {
    struct version_t {
        uint8_t major{};
        uint8_t minor{};
        uint8_t subminor{};

        const std::string to_string() const {
            return std::to_string(major) + '.' + std::to_string(minor) + '.' + std::to_string(subminor);
        }
    };

    constexpr version_t current_version{GGS_MAJOR_VER, GGS_MINOR_VER, GGS_SUBMINOR_VER};
}

#endif //GUNGAMESERVER_VERSION_HPP
