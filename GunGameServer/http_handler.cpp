#include <charconv>
#include <sstream>
#include "http_handler.hpp"
#include "lobby_domain.hpp"

namespace ggs {

const char* get_status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

http_response http_response::json(int status, const picojson::value& value) {
    return {status, value.serialize()};
}

http_response http_response::error(int status, const std::string& text) {
    picojson::object body;
    body["error"] = picojson::value(text);
    return json(status, picojson::value(body));
}

std::string http_response::to_string() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status << ' ' << get_status_text(status) << "\r\n";
    ss << "Access-Control-Allow-Origin: *\r\n";
    ss << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    ss << "Access-Control-Allow-Headers: Content-Type\r\n";
    if (!body.empty())
        ss << "Content-Type: " << content_type << "\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n\r\n";
    ss << body;
    return ss.str();
}

http_parse_result parse_http_request(std::string_view buffer, http_request& request) {
    auto header_end = buffer.find("\r\n\r\n");
    if (header_end == std::string_view::npos)
        return buffer.size() > MAX_HTTP_REQUEST_SIZE ? http_parse_result::TooLarge : http_parse_result::Incomplete;

    auto line_end = buffer.find("\r\n");
    auto request_line = buffer.substr(0, line_end);
    auto method_end = request_line.find(' ');
    if (method_end == std::string_view::npos || method_end == 0)
        return http_parse_result::Invalid;
    auto target_end = request_line.find(' ', method_end + 1);
    if (target_end == std::string_view::npos || target_end == method_end + 1)
        return http_parse_result::Invalid;
    if (!request_line.substr(target_end + 1).starts_with("HTTP/"))
        return http_parse_result::Invalid;

    http_request parsed;
    parsed.method = std::string(request_line.substr(0, method_end));
    auto target = request_line.substr(method_end + 1, target_end - method_end - 1);
    parsed.target = std::string(target.substr(0, target.find('?')));

    auto pos = line_end + 2;
    while (pos < header_end) {
        auto next = buffer.find("\r\n", pos);
        auto line = buffer.substr(pos, next - pos);
        pos = next + 2;
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return http_parse_result::Invalid;
        parsed.headers[string_utils::to_lower(std::string(line.substr(0, colon)))]
            = string_utils::trim(std::string(line.substr(colon + 1)));
    }

    std::size_t content_length = 0;
    if (auto it = parsed.headers.find("content-length"); it != parsed.headers.end()) {
        const auto& value = it->second;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), content_length);
        if (ec != std::errc() || end != value.data() + value.size())
            return http_parse_result::Invalid;
    }
    if (content_length > MAX_HTTP_REQUEST_SIZE)
        return http_parse_result::TooLarge;

    auto body_start = header_end + 4;
    if (buffer.size() - body_start < content_length)
        return http_parse_result::Incomplete;
    parsed.body = std::string(buffer.substr(body_start, content_length));
    request = std::move(parsed);
    return http_parse_result::Complete;
}

int http_handler::to_http_status(error_code code) {
    switch (code) {
        case error_code::None: return 200;
        case error_code::NotFound: return 404;
        case error_code::Conflict:
        case error_code::Full: return 409;
        default: return 400;
    }
}

http_response http_handler::handle(const http_request& request, game_clock::time_point now) {
    if (request.method == "OPTIONS")
        return {204, ""};

    auto segments = string_utils::split_strings(request.target, '/');
    std::erase(segments, "");
    if (segments.empty() || segments[0] != "lobbies")
        return http_response::error(404, "not found");

    Verbosef("HTTP %s %s", request.method, request.target);
    const bool get = request.method == "GET", post = request.method == "POST";
    switch (segments.size()) {
        case 1:
            if (get) return list_lobbies();
            if (post) return create_lobby(request, now);
            break;
        case 2:
            if (get) return get_lobby(segments[1]);
            break;
        case 3:
            if (segments[2] != "join")
                return http_response::error(404, "not found");
            if (post) return join_lobby(segments[1], request, now);
            break;
        default:
            return http_response::error(404, "not found");
    }
    return http_response::error(405, "method not allowed");
}

http_response http_handler::create_lobby(const http_request& request, game_clock::time_point now) {
    picojson::object body;
    if (!serializable_message::parse_object(request.body, body))
        return http_response::error(400, "request body must be a JSON object");

    std::string code, scene = config_.default_scene;
    uint32_t max_players = config_.default_max_players;
    if (!message_utils::read_string(body, "code", code) || code.empty())
        return http_response::error(400, "missing lobby code");
    if (!name_validator::is_valid_lobby_code(code))
        return http_response::error(400, "invalid lobby code");
    if (body.contains("max_players")
            && (!message_utils::read_uint(body, "max_players", max_players) || max_players == 0))
        return http_response::error(400, "max_players must be a positive integer");
    if (body.contains("scene") && !message_utils::read_string(body, "scene", scene))
        return http_response::error(400, "scene must be a string");

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (state.lobbies.size() >= config_.max_lobbies) {
        Printf("Refused to create lobby \"%s\": lobby limit (%u) reached.", code, config_.max_lobbies);
        return http_response::error(503, "too many lobbies");
    }
    auto result = lobby_domain::create_lobby(state, code, max_players, scene, now, config_.spawn_dummy_bot);
    if (result != error_code::None)
        return http_response::error(to_http_status(result), "lobby already exists");

    const auto* l = lobby_domain::get_lobby(state, code);
    Printf(ansi::BrightGreen, "Created lobby \"%s\" (%u players max, scene \"%s\").",
           l->code, l->max_players, l->scene);
    return http_response::json(200, make_lobby_info(*l));
}

http_response http_handler::join_lobby(const std::string& code, const http_request& request,
                                       game_clock::time_point now) {
    picojson::object body;
    if (!serializable_message::parse_object(request.body, body))
        return http_response::error(400, "request body must be a JSON object");
    std::string name;
    if (!message_utils::read_string(body, "player_name", name))
        return http_response::error(400, "missing player_name");
    name = name_validator::get_valid_nickname(name);

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    player_id_t player_id = 0;
    auto result = lobby_domain::join_lobby(state, code, name, now, player_id);
    switch (result) {
        case error_code::None: break;
        case error_code::Full: return http_response::error(409, "lobby is full");
        default: return http_response::error(to_http_status(result), "lobby not found");
    }

    const auto* l = lobby_domain::get_lobby(state, code);
    Printf(color_code(message_type::PlayerJoined), "%s (#%u) joined lobby \"%s\" (%zu/%u).",
           name, player_id, l->code, l->get_player_count(), l->max_players);

    picojson::object response;
    response["lobby"] = make_lobby_info(*l);
    response["player_id"] = message_utils::write_uint(player_id);
    return http_response::json(200, picojson::value(response));
}

http_response http_handler::get_lobby(const std::string& code) {
    std::shared_lock lk(shared_.mutex);
    const auto* l = lobby_domain::get_lobby(std::as_const(shared_.state), code);
    if (!l)
        return http_response::error(404, "lobby not found");
    return http_response::json(200, make_lobby_info(*l));
}

http_response http_handler::list_lobbies() {
    std::shared_lock lk(shared_.mutex);
    picojson::array list;
    list.reserve(shared_.state.lobbies.size());
    for (const auto& [_, l]: shared_.state.lobbies)
        list.push_back(make_lobby_info(l));
    return http_response::json(200, picojson::value(list));
}

picojson::value http_handler::make_lobby_info(const lobby& l) const {
    picojson::array players;
    for (const auto& info: l.get_roster())
        players.push_back(message_utils::write_player_info(info));

    picojson::object info;
    info["code"] = picojson::value(l.code);
    info["player_count"] = message_utils::write_uint(l.get_player_count());
    info["max_players"] = message_utils::write_uint(l.max_players);
    info["players"] = picojson::value(players);
    info["server_ip"] = picojson::value(config_.public_address);
    info["udp_port"] = message_utils::write_uint(config_.udp_port);
    info["scene"] = picojson::value(l.scene);
    return picojson::value(info);
}

}
