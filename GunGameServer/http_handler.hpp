#ifndef GUNGAMESERVER_HTTP_HANDLER_HPP
#define GUNGAMESERVER_HTTP_HANDLER_HPP
#include <map>
#include <string>
#include <string_view>
#include "server_data.hpp"
#include "config_manager.hpp"

namespace ggs {
    struct http_request {
        std::string method;
        std::string target; // path only, query string stripped
        std::map<std::string, std::string> headers; // lower-case keys
        std::string body;
    };

    struct http_response {
        int status = 200;
        std::string body;
        std::string content_type = "application/json";

        static http_response json(int status, const picojson::value& value);
        // `{"error": text}`
        static http_response error(int status, const std::string& text);

        // Full response text with CORS headers and `Connection: close`.
        std::string to_string() const;
    };

    const char* get_status_text(int status);

    enum class http_parse_result {
        Complete,
        Incomplete,
        Invalid,
        TooLarge,
    };

    // Parses one request out of `buffer`. Bodies are delimited by Content-Length only.
    http_parse_result parse_http_request(std::string_view buffer, http_request& request);

    // Routes:
    //   POST /lobbies               create
    //   POST /lobbies/{code}/join   join
    //   GET  /lobbies/{code}        lobby info
    //   GET  /lobbies               list
    class http_handler {
    public:
        http_handler(shared_server_state& shared, const config_manager& config):
            shared_(shared), config_(config) {}

        http_response handle(const http_request& request, game_clock::time_point now);

        static int to_http_status(error_code code);

    private:
        shared_server_state& shared_;
        const config_manager& config_;

        http_response create_lobby(const http_request& request, game_clock::time_point now);
        http_response join_lobby(const std::string& code, const http_request& request, game_clock::time_point now);
        http_response get_lobby(const std::string& code);
        http_response list_lobbies();

        picojson::value make_lobby_info(const lobby& l) const;
    };
}

#endif //GUNGAMESERVER_HTTP_HANDLER_HPP
