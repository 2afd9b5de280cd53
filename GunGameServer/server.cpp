#include <array>
#include <memory>
#include <thread>
#include <vector>
#include <iostream>

#include <asio.hpp>
#include <ya_getopt.h>

#include "../GunGameCommon/include/common.hpp"
#include "server_data.hpp"
#include "config_manager.hpp"
#include "weapon_database.hpp"
#include "lobby_domain.hpp"
#include "combat_domain.hpp"
#include "udp_handler.hpp"
#include "http_handler.hpp"

using asio::ip::tcp;
using asio::ip::udp;

namespace {
    // Sends are synchronous; concurrent handlers are serialized on the mutex.
    class udp_socket_sink: public ggs::datagram_sink {
    public:
        explicit udp_socket_sink(udp::socket& socket): socket_(socket) {}

        void send_to(const udp::endpoint& destination, const std::string& data) override {
            asio::error_code ec;
            std::lock_guard lk(mutex_);
            socket_.send_to(asio::buffer(data), destination, 0, ec);
            if (ec)
                ggs::Verbosef("Failed to send %zu bytes to %s: %s",
                              data.size(), destination.address().to_string(), ec.message());
        }

    private:
        udp::socket& socket_;
        std::mutex mutex_;
    };

    // One request, one response, then the connection is closed.
    class http_session: public std::enable_shared_from_this<http_session> {
    public:
        http_session(tcp::socket socket, ggs::http_handler& handler):
            socket_(std::move(socket)), deadline_(socket_.get_executor()), handler_(handler) {}

        void start() {
            deadline_.expires_after(std::chrono::seconds(10));
            deadline_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
                if (!ec)
                    self->close();
            });
            read();
        }

    private:
        tcp::socket socket_;
        asio::steady_timer deadline_;
        ggs::http_handler& handler_;
        std::array<char, 4096> chunk_{};
        std::string buffer_, response_;

        void read() {
            socket_.async_read_some(asio::buffer(chunk_),
                    [self = shared_from_this()](const asio::error_code& ec, std::size_t length) {
                if (ec)
                    return self->close();
                self->buffer_.append(self->chunk_.data(), length);
                self->process();
            });
        }

        void process() {
            ggs::http_request request;
            switch (ggs::parse_http_request(buffer_, request)) {
                case ggs::http_parse_result::Incomplete:
                    return read();
                case ggs::http_parse_result::Invalid:
                    return respond(ggs::http_response::error(400, "malformed request"));
                case ggs::http_parse_result::TooLarge:
                    return respond(ggs::http_response::error(413, "request too large"));
                case ggs::http_parse_result::Complete:
                    break;
            }
            try {
                respond(handler_.handle(request, ggs::game_clock::now()));
            } catch (const std::exception& e) {
                ggs::Printf(ggs::ansi::BrightRed, "Error: %s %s failed: %s", request.method, request.target, e.what());
                respond(ggs::http_response::error(500, "internal error"));
            }
        }

        void respond(const ggs::http_response& response) {
            response_ = response.to_string();
            asio::async_write(socket_, asio::buffer(response_),
                    [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                if (ec)
                    ggs::Verbosef("Failed to send HTTP response: %s", ec.message());
                self->close();
            });
        }

        void close() {
            deadline_.cancel();
            if (!socket_.is_open())
                return;
            asio::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            if (ec)
                ggs::Verbosef("Error closing HTTP connection: %s", ec.message());
        }
    };
}

class server: public role {
public:
    explicit server(config_manager& config):
            config_(config),
            weapons_(config.get_weapons()),
            udp_socket_(io_ctx_),
            acceptor_(asio::make_strand(io_ctx_)),
            reload_timer_(io_ctx_), cleanup_timer_(io_ctx_), dummy_timer_(io_ctx_), sync_timer_(io_ctx_),
            sink_(udp_socket_),
            udp_(shared_, weapons_, sink_),
            http_(shared_, config_) {}

    void run() override {
        std::vector<std::thread> workers;
        for (int i = 1; i < config_.io_threads; ++i)
            workers.emplace_back([this] { run_io(); });
        run_io();
        for (auto& worker: workers)
            worker.join();
    }

    void shutdown() override {
        Printf("Shutting down...");
        running_ = false;
        io_ctx_.stop();
    }

    bool setup() override {
        if (weapons_.empty()) {
            Printf(ggs::ansi::BrightRed, "Error: no valid weapons configured.");
            notify_started(false);
            return false;
        }

        if (!open_udp_socket() || !open_http_acceptor()) {
            notify_started(false);
            return false;
        }

        start_time_ = ggs::game_clock::now();
        {
            std::unique_lock lk(shared_.mutex);
            for (const auto& t: config_.default_lobbies) {
                auto result = ggs::lobby_domain::create_lobby(shared_.state, t.code, t.max_players, t.scene,
                                                              start_time_, config_.spawn_dummy_bot, true);
                if (result != ggs::error_code::None)
                    Printf("Warning: skipped default lobby \"%s\": %s.", t.code, ggs::error_code_to_string(result));
            }
        }

        receive();
        accept();
        schedule(reload_timer_, config_.reload_tick_interval, [this] {
            udp_.tick_reloads(ggs::game_clock::now());
        });
        schedule(cleanup_timer_, config_.cleanup_interval, [this] { cleanup(); });
        schedule(dummy_timer_, config_.dummy_tick_interval, [this] {
            std::chrono::duration<double> elapsed = ggs::game_clock::now() - start_time_;
            udp_.tick_dummy_bots(elapsed.count());
        });
        if (config_.state_sync_interval.count() > 0)
            schedule(sync_timer_, config_.state_sync_interval, [this] { udp_.broadcast_state_sync(); });

        weapons_.print();
        notify_started(true);
        Printf(ggs::ansi::BrightYellow, "Server (v%s) started: HTTP on port %u, UDP on port %u.",
               ggs::current_version.to_string(), config_.http_port, config_.udp_port);
        return true;
    }

    // Must run after the console is constructed; its constructor installs the plain command completion.
    void install_completion() {
        ggs::console::set_completion_callback([this](const std::vector<std::string>& args) -> std::vector<std::string> {
            switch (args.size()) {
                case 0: return {};
                case 1: return ggs::console::instance->get_command_hints(false, args[0].c_str());
            }
            if (args.size() != 2 || args[0] == "create" || args[0] == "help")
                return {};
            return get_lobby_codes();
        });
    }

    void print_version_info() {
        Printf("Gun game server v%s, built %s.",
               ggs::current_version.to_string(), ggs::string_utils::get_build_time_string());
    }

    void print_lobbies() {
        std::shared_lock lk(shared_.mutex);
        const auto& lobbies = shared_.state.lobbies;
        Printf("%zu lobb%s:", lobbies.size(), lobbies.size() == 1 ? "y" : "ies");
        for (const auto& [code, l]: lobbies) {
            Printf("  %-16s %2zu/%-2u  %-16s%s%s", code, l.get_player_count(), l.max_players, l.scene,
                   l.dummy_player ? "  [bot]" : "", l.persistent ? "  [persistent]" : "");
        }
    }

    void print_players(const std::string& code) {
        std::shared_lock lk(shared_.mutex);
        const auto* l = ggs::lobby_domain::get_lobby(std::as_const(shared_.state), code);
        if (!l) {
            Printf(ggs::ansi::BrightRed, "Error: lobby \"%s\" not found.", code);
            return;
        }
        Printf("%zu player(s) in lobby \"%s\":", l->get_player_count(), l->code);
        for (const auto& [id, p]: l->players) {
            auto address = l->client_addresses.find(id);
            Printf("  #%-4u %-20s HP %3u/%-3u  weapon %u  ammo %u/%u%s  %s",
                   id, p.name, p.health, p.max_health, p.current_weapon_id, p.current_ammo, p.max_ammo,
                   p.is_reloading ? " (reloading)" : "",
                   address == l->client_addresses.end() ? "(unbound)"
                       : address->second.address().to_string() + ':' + std::to_string(address->second.port()));
        }
    }

    void print_weapons() { weapons_.print(); }

    void create_lobby(const std::string& code, uint32_t max_players, const std::string& scene) {
        if (!ggs::name_validator::is_valid_lobby_code(code)) {
            Printf(ggs::ansi::BrightRed, "Error: invalid lobby code \"%s\".", code);
            return;
        }
        std::unique_lock lk(shared_.mutex);
        auto result = ggs::lobby_domain::create_lobby(shared_.state, code, max_players, scene,
                                                      ggs::game_clock::now(), config_.spawn_dummy_bot);
        if (result != ggs::error_code::None)
            Printf(ggs::ansi::BrightRed, "Error: cannot create lobby \"%s\": %s.", code, ggs::error_code_to_string(result));
        else
            Printf(ggs::ansi::BrightGreen, "Created lobby \"%s\" (%u players max, scene \"%s\").",
                   ggs::lobby_domain::normalize_code(code), max_players, scene);
    }

    // Only values that are safe to change while running are taken over.
    void reload_config() {
        config_manager reloaded(config_.get_path());
        if (!reloaded.load()) {
            Printf(ggs::ansi::BrightRed, "Error: failed to reload config.");
            return;
        }
        Printf("Logging level is now \"%s\"; auto flush is %s.",
               ggs::get_logging_level_name(reloaded.logging_level), reloaded.auto_flush_log ? "on" : "off");
    }

    std::vector<std::string> get_lobby_codes() {
        std::shared_lock lk(shared_.mutex);
        std::vector<std::string> codes;
        codes.reserve(shared_.state.lobbies.size());
        for (const auto& [code, _]: shared_.state.lobbies)
            codes.push_back(code);
        return codes;
    }

    inline ggs::udp_handler& get_udp_handler() { return udp_; }
    inline const config_manager& get_config() const { return config_; }

private:
    config_manager& config_;
    const ggs::weapon_database weapons_;
    ggs::shared_server_state shared_;

    asio::io_context io_ctx_;
    udp::socket udp_socket_;
    udp::endpoint remote_endpoint_;
    std::array<char, ggs::MAX_DATAGRAM_SIZE> recv_buffer_{};
    tcp::acceptor acceptor_;
    asio::steady_timer reload_timer_, cleanup_timer_, dummy_timer_, sync_timer_;

    udp_socket_sink sink_;
    ggs::udp_handler udp_;
    ggs::http_handler http_;

    ggs::game_clock::time_point start_time_{};
    std::size_t reported_drops_ = 0;

    void run_io() {
        while (running_) {
            try {
                io_ctx_.run();
                break;
            } catch (const std::exception& e) {
                Printf(ggs::ansi::BrightRed, "Error: unhandled exception in I/O loop: %s", e.what());
            }
        }
    }

    bool open_udp_socket() {
        asio::error_code ec;
        udp::endpoint local(udp::v4(), config_.udp_port);
        udp_socket_.open(local.protocol(), ec);
        if (!ec)
            udp_socket_.bind(local, ec);
        if (ec) {
            Printf(ggs::ansi::BrightRed, "Error: cannot bind UDP port %u: %s", config_.udp_port, ec.message());
            return false;
        }
        return true;
    }

    bool open_http_acceptor() {
        asio::error_code ec;
        tcp::endpoint local(tcp::v4(), config_.http_port);
        acceptor_.open(local.protocol(), ec);
        if (!ec)
            acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(local, ec);
        if (!ec)
            acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            Printf(ggs::ansi::BrightRed, "Error: cannot listen on HTTP port %u: %s", config_.http_port, ec.message());
            return false;
        }
        return true;
    }

    void receive() {
        udp_socket_.async_receive_from(asio::buffer(recv_buffer_), remote_endpoint_,
                [this](const asio::error_code& ec, std::size_t length) {
            if (ec == asio::error::operation_aborted || !running_)
                return;
            if (ec) {
                ggs::Warnf("UDP receive failed: %s", ec.message());
            } else {
                try {
                    udp_.handle_datagram(std::string_view(recv_buffer_.data(), length), remote_endpoint_,
                                         ggs::game_clock::now());
                } catch (const std::exception& e) {
                    Printf(ggs::ansi::BrightRed, "Error: dropped datagram from %s: %s",
                           remote_endpoint_.address().to_string(), e.what());
                }
            }
            receive();
        });
    }

    void accept() {
        acceptor_.async_accept(asio::make_strand(io_ctx_), [this](const asio::error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !running_)
                return;
            if (ec)
                ggs::Warnf("HTTP accept failed: %s", ec.message());
            else
                std::make_shared<http_session>(std::move(socket), http_)->start();
            accept();
        });
    }

    template<typename Task>
    void schedule(asio::steady_timer& timer, std::chrono::milliseconds interval, Task task) {
        timer.expires_after(interval);
        wait(timer, interval, std::move(task));
    }

    template<typename Task>
    void wait(asio::steady_timer& timer, std::chrono::milliseconds interval, Task task) {
        timer.async_wait([this, &timer, interval, task = std::move(task)](const asio::error_code& ec) mutable {
            if (ec || !running_)
                return;
            try {
                task();
            } catch (const std::exception& e) {
                Printf(ggs::ansi::BrightRed, "Error: periodic task failed: %s", e.what());
            }
            timer.expires_at(timer.expiry() + interval);
            wait(timer, interval, std::move(task));
        });
    }

    void cleanup() {
        udp_.sweep(ggs::game_clock::now(), config_.player_inactivity_timeout, config_.empty_lobby_grace_period);
        auto dropped = udp_.get_dropped_count();
        if (dropped > reported_drops_) {
            Printf("Dropped %zu invalid datagram(s) since the last cleanup.", dropped - reported_drops_);
            reported_drops_ = dropped;
        }
    }
};

// parse arguments (config path, ports and help/version/log) with getopt
int parse_args(int argc, char** argv, std::string& config_path, int& http_port, int& udp_port,
               std::string& log_path, bool& dry_run) {
    enum option_values { DryRun = UINT8_MAX + 1 };
    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"http-port", required_argument, 0, 'p'},
        {"udp-port", required_argument, 0, 'u'},
        {"log", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {"dry-run", no_argument, 0, DryRun},
        {0, 0, 0, 0}
    };
    int opt, opt_index = 0;
    while ((opt = getopt_long(argc, argv, "c:p:u:l:hv", long_options, &opt_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'p':
                http_port = atoi(optarg);
                break;
            case 'u':
                udp_port = atoi(optarg);
                break;
            case 'l':
                log_path = optarg;
                break;
            case 'h':
                printf("Usage: %s [OPTION]...\n", argv[0]);
                puts("Options:");
                puts("  -c, --config=PATH\t Read the config from PATH (default: config.yml).");
                puts("  -p, --http-port=PORT\t Serve HTTP on PORT instead of the configured one.");
                puts("  -u, --udp-port=PORT\t Serve UDP on PORT instead of the configured one.");
                puts("  -l, --log=PATH\t Write log to the file at PATH in addition to stdout.");
                puts("  -h, --help\t\t Display this help and exit.");
                puts("  -v, --version\t\t Display version information and exit.");
                puts("      --dry-run\t\t Test the server by starting it and exiting immediately.");
                return -1;
            case 'v':
                puts("Gun game server.");
                printf("Build time: \t%s.\n", ggs::string_utils::get_build_time_string().c_str());
                printf("Version: \t%s.\n", ggs::current_version.to_string().c_str());
                return -1;
            case DryRun:
                dry_run = true;
                break;
        }
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path = ggs::CONFIG_FILE_NAME, log_path;
    int http_port = -1, udp_port = -1;
    bool dry_run = false;
    if (parse_args(argc, argv, config_path, http_port, udp_port, log_path, dry_run) < 0)
        return 0;

    if (http_port == 0 || http_port > UINT16_MAX || udp_port == 0 || udp_port > UINT16_MAX) {
        std::cerr << "Fatal: invalid port number." << std::endl;
        return 1;
    }

    if (!log_path.empty()) {
        FILE* log_file = fopen(log_path.c_str(), "a");
        if (log_file == nullptr) {
            std::cerr << "Fatal: failed to open the log file." << std::endl;
            return 1;
        }
        server::set_log_file(log_file);
    }

    config_manager config(config_path);
    server::Printf("Loading config from %s...", config_path);
    if (!config.load())
        ggs::FatalError("Failed to load config. Please try fixing or emptying it first.");
    if (http_port > 0)
        config.http_port = static_cast<uint16_t>(http_port);
    if (udp_port > 0)
        config.udp_port = static_cast<uint16_t>(udp_port);
    config.print();

    printf("Bootstrapping server...\n");
    fflush(stdout);
    server server(config);
    if (!server.setup())
        ggs::FatalError("Server failed on setup.");
    std::thread server_thread([&server]() { server.run(); });

    ggs::console console;
    server.install_completion();
    auto print_usage = [&](const char* usage) { server.Printf("Usage: \"%s\".", usage); };
    auto report = [&](ggs::error_code result, const std::string& code, ggs::player_id_t id) {
        if (result != ggs::error_code::None)
            server.Printf(ggs::ansi::BrightRed, "Error: #%u in lobby \"%s\": %s.",
                          id, code, ggs::error_code_to_string(result));
        return result == ggs::error_code::None;
    };

    console.register_command("stop", [&] { server.shutdown(); }, "Stop the server.");
    console.register_command("version", [&] { server.print_version_info(); });
    console.register_aliases("version", {"ver"});
    console.register_command("lobbies", [&] { server.print_lobbies(); }, "List lobbies and player counts.");
    console.register_command("players", [&] {
        if (console.empty()) return print_usage("players <lobby>");
        server.print_players(console.get_next_word(true));
    }, "Show the roster of a lobby.");
    console.register_command("weapons", [&] { server.print_weapons(); }, "Show the weapon table.");
    console.register_command("kick", [&] {
        if (console.empty()) return print_usage("kick <lobby> <player_id>");
        auto code = console.get_next_word(true);
        auto id = static_cast<ggs::player_id_t>(console.get_next_long());
        if (report(server.get_udp_handler().kick_player(code, id), code, id))
            server.Printf(ggs::color_code(ggs::message_type::PlayerLeft), "Kicked #%u from lobby \"%s\".", id, code);
    }, "Remove a player from a lobby.");
    console.register_command("damage", [&] {
        if (console.empty()) return print_usage("damage <lobby> <player_id> <amount>");
        auto code = console.get_next_word(true);
        auto id = static_cast<ggs::player_id_t>(console.get_next_long());
        auto amount = static_cast<uint32_t>(std::max<int64_t>(console.get_next_long(), 0));
        if (report(server.get_udp_handler().damage_player(code, id, amount), code, id))
            server.Printf(ggs::color_code(ggs::message_type::PlayerDamaged), "Dealt %u damage to #%u.", amount, id);
    }, "Damage a player as the server.");
    console.register_command("respawn", [&] {
        if (console.empty()) return print_usage("respawn <lobby> <player_id>");
        auto code = console.get_next_word(true);
        auto id = static_cast<ggs::player_id_t>(console.get_next_long());
        if (report(server.get_udp_handler().respawn_player(code, id), code, id))
            server.Printf("Respawned #%u in lobby \"%s\".", id, code);
    }, "Restore a dead player to full health.");
    console.register_command("create", [&] {
        if (console.empty()) return print_usage("create <code> [max_players] [scene]");
        auto code = console.get_next_word();
        auto max_players = server.get_config().default_max_players;
        if (!console.empty()) {
            auto requested = console.get_next_long();
            if (requested <= 0) return print_usage("create <code> [max_players] [scene]");
            max_players = static_cast<uint32_t>(requested);
        }
        auto scene = console.empty() ? server.get_config().default_scene : console.get_rest_of_line();
        server.create_lobby(code, max_players, scene);
    }, "Create a lobby.");
    console.register_command("sync", [&] {
        if (console.empty()) return print_usage("sync <lobby>");
        auto code = console.get_next_word(true);
        if (server.get_udp_handler().sync_lobby(code) != ggs::error_code::None)
            server.Printf(ggs::ansi::BrightRed, "Error: lobby \"%s\" not found.", code);
    }, "Broadcast a state sync to a lobby now.");
    console.register_command("reload", [&] { server.reload_config(); }, "Reload logging settings from the config.");
    console.register_command("flush", [&] { ggs::flush_log(); }, "Flush the log file.");
    console.register_command("help", [&] { server.Printf(console.get_help_string().c_str()); });

    server.wait_till_started();

    if (dry_run)
        server.shutdown();

    while (server.running()) {
        std::string line;
        if (!console.read_input(line)) {
            puts("stop");
            server.shutdown();
            break;
        };
        server.LogFileOutput(("> " + line).c_str());

        if (!console.execute(line) && !console.get_command_name().empty()) {
            std::string extra_text;
            if (auto hints = console.get_command_hints(true); !hints.empty())
                extra_text = " Did you mean: " + ggs::string_utils::join_strings(hints, 0, ", ") + "?";
            server.Printf("Error: unknown command \"%s\".%s", console.get_command_name(), extra_text);
        }
    }

    std::cout << "Stopping..." << std::endl;
    if (server_thread.joinable())
        server_thread.join();

    server::destroy();
    printf("\r");
}
