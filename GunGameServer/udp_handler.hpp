#ifndef GUNGAMESERVER_UDP_HANDLER_HPP
#define GUNGAMESERVER_UDP_HANDLER_HPP
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include "server_data.hpp"
#include "weapon_database.hpp"
#include "lobby_domain.hpp"

namespace ggs {
    // Where outbound datagrams go; the real one wraps the UDP socket.
    class datagram_sink {
    public:
        virtual ~datagram_sink() = default;
        virtual void send_to(const asio::ip::udp::endpoint& destination, const std::string& data) = 0;
    };

    // Translates datagrams into domain calls and domain events into datagrams.
    // Every public method takes the state lock itself and sends only after releasing it.
    class udp_handler {
    public:
        struct outgoing_datagram {
            asio::ip::udp::endpoint destination;
            std::string data;
        };
        typedef std::vector<outgoing_datagram> outbox;

        udp_handler(shared_server_state& shared, const weapon_database& weapons, datagram_sink& sink):
            shared_(shared), weapons_(weapons), sink_(sink) {}

        // Unknown or malformed payloads are logged and dropped without touching the state.
        void handle_datagram(std::string_view data, const asio::ip::udp::endpoint& sender,
                             game_clock::time_point now);

        void tick_reloads(game_clock::time_point now);
        lobby_domain::cleanup_result sweep(game_clock::time_point now, game_clock::duration timeout,
                                           game_clock::duration grace_period);
        void tick_dummy_bots(double elapsed_seconds);
        // Lobbies whose player status is unchanged are skipped unless forced or overdue.
        // @returns the number of lobbies synced
        std::size_t broadcast_state_sync(bool force = false);

        error_code kick_player(const std::string& code, player_id_t player_id);
        error_code damage_player(const std::string& code, player_id_t player_id, uint32_t amount);
        error_code respawn_player(const std::string& code, player_id_t player_id);
        error_code sync_lobby(const std::string& code);

        inline std::size_t get_dropped_count() const noexcept { return dropped_count_; }

    private:
        shared_server_state& shared_;
        const weapon_database& weapons_;
        datagram_sink& sink_;
        std::atomic<std::size_t> dropped_count_ = 0;

        struct sync_record {
            std::vector<player_sync_snapshot> players;
            int skipped = 0;
        };
        std::mutex sync_mutex_;
        std::map<std::string, sync_record> last_sync_;

        void on_join(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                     game_clock::time_point now, outbox& out);
        void on_leave(picojson::object&& content, outbox& out);
        void on_position_update(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                                game_clock::time_point now, outbox& out);
        void on_shoot(picojson::object&& content, game_clock::time_point now, outbox& out);
        void on_reload(picojson::object&& content, game_clock::time_point now, outbox& out);
        void on_weapon_switch(picojson::object&& content, game_clock::time_point now, outbox& out);
        void on_request_state(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                              game_clock::time_point now, outbox& out);
        void on_keepalive(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                          game_clock::time_point now);

        template<typename ... Args>
        void drop(const char* fmt, Args&& ... args) {
            ++dropped_count_;
            Warnf(fmt, std::forward<Args>(args)...);
        }

        static void queue(outbox& out, const asio::ip::udp::endpoint& destination, serializable_message& msg);
        static void queue_broadcast(outbox& out, const lobby& target, serializable_message& msg,
                                    std::optional<player_id_t> ignored_player = std::nullopt);
        static void queue_state_sync(outbox& out, const lobby& target,
                                     std::optional<asio::ip::udp::endpoint> destination = std::nullopt);
        static void queue_events(outbox& out, const server_state& state, const event_list& events);
        void flush(outbox& out);
    };
}

#endif //GUNGAMESERVER_UDP_HANDLER_HPP
