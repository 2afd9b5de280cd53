#include "udp_handler.hpp"
#include "combat_domain.hpp"
#include "dummy_bot.hpp"

namespace ggs {

namespace {
    template<json_message T>
    bool decode(picojson::object&& content, T& msg) {
        msg.content = std::move(content);
        return msg.deserialize();
    }

    std::string endpoint_string(const asio::ip::udp::endpoint& endpoint) {
        return endpoint.address().to_string() + ':' + std::to_string(endpoint.port());
    }
}

void udp_handler::handle_datagram(std::string_view data, const asio::ip::udp::endpoint& sender,
                                  game_clock::time_point now) {
    picojson::object content;
    if (!serializable_message::parse_object(data, content)) {
        drop("Dropped malformed datagram (%zu bytes) from %s.", data.size(), endpoint_string(sender));
        return;
    }

    outbox out;
    const auto type = serializable_message::get_type(content);
    switch (type) {
        case message_type::Join: on_join(std::move(content), sender, now, out); break;
        case message_type::Leave: on_leave(std::move(content), out); break;
        case message_type::PositionUpdate: on_position_update(std::move(content), sender, now, out); break;
        case message_type::Shoot: on_shoot(std::move(content), now, out); break;
        case message_type::Reload: on_reload(std::move(content), now, out); break;
        case message_type::WeaponSwitch: on_weapon_switch(std::move(content), now, out); break;
        case message_type::RequestState: on_request_state(std::move(content), sender, now, out); break;
        case message_type::Keepalive: on_keepalive(std::move(content), sender, now); break;
        default:
            drop("Dropped datagram of unknown type from %s.", endpoint_string(sender));
            return;
    }
    flush(out);
}

void udp_handler::on_join(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                          game_clock::time_point now, outbox& out) {
    join_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed join from %s.", endpoint_string(sender));

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (lobby_domain::set_player_address(state, msg.lobby_code, msg.player_id, sender, now) != error_code::None)
        return drop("Join from %s for unknown player #%u in lobby \"%s\".", endpoint_string(sender), msg.player_id, msg.lobby_code);

    const auto* l = lobby_domain::get_lobby(state, msg.lobby_code);
    const auto* p = l->find_player(msg.player_id);

    welcome_msg welcome;
    welcome.lobby_code = l->code;
    welcome.player_id = msg.player_id;
    queue(out, sender, welcome);

    player_joined_msg joined;
    joined.player = {p->id, p->name};
    queue_broadcast(out, *l, joined, msg.player_id);
    queue_state_sync(out, *l, sender);

    Printf(color_code(msg.type), "Player #%u (%s) connected to lobby \"%s\" from %s.",
           p->id, p->name, l->code, endpoint_string(sender));
}

void udp_handler::on_leave(picojson::object&& content, outbox& out) {
    leave_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed leave.");

    std::unique_lock lk(shared_.mutex);
    event_list events;
    lobby_domain::leave_lobby(shared_.state, msg.lobby_code, msg.player_id, events);
    queue_events(out, shared_.state, events);
}

void udp_handler::on_position_update(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                                     game_clock::time_point now, outbox& out) {
    position_update_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed position update from %s.", endpoint_string(sender));

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    std::string code;
    if (lobby_domain::update_player_position(state, msg.player_id, msg.position, msg.rotation, now, code) != error_code::None)
        return drop("Position update for unknown player #%u.", msg.player_id);
    lobby_domain::set_player_address(state, code, msg.player_id, sender, now);

    position_update_msg relay;
    relay.player_id = msg.player_id;
    relay.position = msg.position;
    relay.rotation = msg.rotation;
    queue_broadcast(out, *lobby_domain::get_lobby(state, code), relay, msg.player_id);
}

void udp_handler::on_shoot(picojson::object&& content, game_clock::time_point now, outbox& out) {
    shoot_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed shoot.");

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (lobby_domain::touch_player(state, msg.lobby_code, msg.player_id, now) != error_code::None)
        return drop("Shoot from unknown player #%u in lobby \"%s\".", msg.player_id, msg.lobby_code);

    bool fired = false;
    event_list events;
    auto result = combat_domain::player_shoot(state, weapons_, msg.lobby_code, msg.player_id, now,
                                              fired, events, msg.target_id);
    Verbosef("#%u shoot: %s%s.", msg.player_id, fired ? "fired" : "not fired",
             result == error_code::None ? "" : std::string(" (") + error_code_to_string(result) + ')');
    queue_events(out, state, events);
}

void udp_handler::on_reload(picojson::object&& content, game_clock::time_point now, outbox& out) {
    reload_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed reload.");

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (lobby_domain::touch_player(state, msg.lobby_code, msg.player_id, now) != error_code::None)
        return drop("Reload from unknown player #%u in lobby \"%s\".", msg.player_id, msg.lobby_code);

    event_list events;
    if (auto result = combat_domain::player_start_reload(state, msg.lobby_code, msg.player_id, now, events);
            result != error_code::None)
        Verbosef("#%u reload ignored: %s.", msg.player_id, error_code_to_string(result));
    queue_events(out, state, events);
}

void udp_handler::on_weapon_switch(picojson::object&& content, game_clock::time_point now, outbox& out) {
    weapon_switch_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed weapon switch.");

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (lobby_domain::touch_player(state, msg.lobby_code, msg.player_id, now) != error_code::None)
        return drop("Weapon switch from unknown player #%u in lobby \"%s\".", msg.player_id, msg.lobby_code);

    event_list events;
    if (combat_domain::player_switch_weapon(state, weapons_, msg.lobby_code, msg.player_id, msg.weapon_id, events)
            != error_code::None)
        return drop("Player #%u tried to switch to unknown weapon #%u.", msg.player_id, msg.weapon_id);
    queue_events(out, state, events);
}

void udp_handler::on_request_state(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                                   game_clock::time_point now, outbox& out) {
    request_state_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed state request from %s.", endpoint_string(sender));

    std::unique_lock lk(shared_.mutex);
    auto& state = shared_.state;
    if (lobby_domain::touch_player(state, msg.lobby_code, msg.player_id, now) != error_code::None)
        return drop("State request from unknown player #%u in lobby \"%s\".", msg.player_id, msg.lobby_code);
    queue_state_sync(out, *lobby_domain::get_lobby(state, msg.lobby_code), sender);
}

void udp_handler::on_keepalive(picojson::object&& content, const asio::ip::udp::endpoint& sender,
                               game_clock::time_point now) {
    keepalive_msg msg;
    if (!decode(std::move(content), msg))
        return drop("Dropped malformed keepalive from %s.", endpoint_string(sender));

    std::unique_lock lk(shared_.mutex);
    if (lobby_domain::set_player_address(shared_.state, msg.lobby_code, msg.player_id, sender, now) != error_code::None)
        return drop("Keepalive from unknown player #%u in lobby \"%s\".", msg.player_id, msg.lobby_code);
}

void udp_handler::tick_reloads(game_clock::time_point now) {
    outbox out;
    {
        std::unique_lock lk(shared_.mutex);
        auto events = combat_domain::update_reload_states(shared_.state, weapons_, now);
        queue_events(out, shared_.state, events);
    }
    flush(out);
}

lobby_domain::cleanup_result udp_handler::sweep(game_clock::time_point now, game_clock::duration timeout,
                                                game_clock::duration grace_period) {
    outbox out;
    lobby_domain::cleanup_result result;
    {
        std::unique_lock lk(shared_.mutex);
        event_list events;
        result = lobby_domain::cleanup_inactive_players(shared_.state, now, timeout, grace_period, events);
        queue_events(out, shared_.state, events);
    }
    flush(out);
    if (result.players_removed > 0 || result.lobbies_removed > 0)
        Printf("Cleanup: removed %zu inactive player%s, deleted %zu empty lobb%s.",
               result.players_removed, result.players_removed == 1 ? "" : "s",
               result.lobbies_removed, result.lobbies_removed == 1 ? "y" : "ies");
    return result;
}

void udp_handler::tick_dummy_bots(double elapsed_seconds) {
    outbox out;
    {
        std::unique_lock lk(shared_.mutex);
        dummy_bot::advance(shared_.state, elapsed_seconds);
        for (const auto& [_, l]: shared_.state.lobbies) {
            if (!l.dummy_player || l.client_addresses.empty())
                continue;
            server_dummy_update_msg msg;
            msg.player_id = l.dummy_player->id;
            msg.position = l.dummy_player->position;
            queue_broadcast(out, l, msg);
        }
    }
    flush(out);
}

std::size_t udp_handler::broadcast_state_sync(bool force) {
    outbox out;
    std::size_t synced = 0;
    {
        std::shared_lock lk(shared_.mutex);
        std::lock_guard sync_lk(sync_mutex_);
        const auto& lobbies = shared_.state.lobbies;
        std::erase_if(last_sync_, [&lobbies](const auto& entry) { return !lobbies.contains(entry.first); });

        for (const auto& [code, l]: lobbies) {
            if (l.client_addresses.empty())
                continue;
            std::vector<player_sync_snapshot> snapshots;
            combat_domain::get_lobby_state_sync(shared_.state, code, snapshots);

            auto& record = last_sync_[code];
            bool changed = record.players.size() != snapshots.size()
                || !std::equal(snapshots.begin(), snapshots.end(), record.players.begin(),
                               [](const auto& a, const auto& b) { return a.same_status(b); });
            if (!force && !changed && record.skipped + 1 < STATE_SYNC_FORCE_INTERVALS) {
                ++record.skipped;
                continue;
            }
            record.players = snapshots;
            record.skipped = 0;

            state_sync_msg msg;
            msg.players = std::move(snapshots);
            queue_broadcast(out, l, msg);
            ++synced;
        }
    }
    flush(out);
    return synced;
}

error_code udp_handler::kick_player(const std::string& code, player_id_t player_id) {
    outbox out;
    {
        std::unique_lock lk(shared_.mutex);
        if (!lobby_domain::find_player(shared_.state, code, player_id))
            return error_code::NotFound;
        event_list events;
        lobby_domain::leave_lobby(shared_.state, code, player_id, events);
        queue_events(out, shared_.state, events);
    }
    flush(out);
    return error_code::None;
}

error_code udp_handler::damage_player(const std::string& code, player_id_t player_id, uint32_t amount) {
    outbox out;
    error_code result;
    {
        std::unique_lock lk(shared_.mutex);
        event_list events;
        result = combat_domain::player_take_damage(shared_.state, code, player_id, amount, DUMMY_PLAYER_ID, events);
        queue_events(out, shared_.state, events);
    }
    flush(out);
    return result;
}

error_code udp_handler::respawn_player(const std::string& code, player_id_t player_id) {
    outbox out;
    error_code result;
    {
        std::unique_lock lk(shared_.mutex);
        result = combat_domain::respawn_player(shared_.state, code, player_id);
        if (result == error_code::None)
            queue_state_sync(out, *lobby_domain::get_lobby(shared_.state, code));
    }
    flush(out);
    return result;
}

error_code udp_handler::sync_lobby(const std::string& code) {
    outbox out;
    {
        std::shared_lock lk(shared_.mutex);
        const auto* l = lobby_domain::get_lobby(shared_.state, code);
        if (!l)
            return error_code::NotFound;
        queue_state_sync(out, *l);
    }
    flush(out);
    return error_code::None;
}

void udp_handler::queue(outbox& out, const asio::ip::udp::endpoint& destination, serializable_message& msg) {
    msg.serialize();
    out.push_back({destination, msg.raw});
}

void udp_handler::queue_broadcast(outbox& out, const lobby& target, serializable_message& msg,
                                  std::optional<player_id_t> ignored_player) {
    msg.serialize();
    for (const auto& [id, address]: target.client_addresses) {
        if (ignored_player && *ignored_player == id)
            continue;
        out.push_back({address, msg.raw});
    }
}

void udp_handler::queue_state_sync(outbox& out, const lobby& target,
                                   std::optional<asio::ip::udp::endpoint> destination) {
    state_sync_msg msg;
    for (const auto& [_, p]: target.players)
        msg.players.push_back(p.get_snapshot());
    if (destination)
        queue(out, *destination, msg);
    else
        queue_broadcast(out, target, msg);
}

void udp_handler::queue_events(outbox& out, const server_state& state, const event_list& events) {
    for (const auto& event: events) {
        const auto* l = lobby_domain::get_lobby(state, event.lobby_code);
        switch (event.type) {
            case game_event::PlayerLeft: {
                Printf(color_code(message_type::PlayerLeft), "Player #%u left lobby \"%s\".",
                       event.player_id, event.lobby_code);
                if (!l) break;
                player_left_msg msg;
                msg.player_id = event.player_id;
                queue_broadcast(out, *l, msg);
                break;
            }
            case game_event::PlayerDamaged: {
                if (!l) break;
                player_damaged_msg msg;
                msg.player_id = event.player_id;
                msg.damage = event.value;
                msg.attacker_id = event.other_id;
                queue_broadcast(out, *l, msg);
                break;
            }
            case game_event::PlayerDied: {
                if (!l) break;
                player_died_msg msg;
                msg.player_id = event.player_id;
                msg.attacker_id = event.other_id;
                queue_broadcast(out, *l, msg);
                break;
            }
            case game_event::ReloadStarted: {
                if (!l) break;
                reload_started_msg msg;
                msg.player_id = event.player_id;
                queue_broadcast(out, *l, msg);
                break;
            }
            case game_event::ReloadFinished: {
                if (!l) break;
                reload_finished_msg msg;
                msg.player_id = event.player_id;
                msg.ammo = event.value;
                queue_broadcast(out, *l, msg);
                break;
            }
            case game_event::WeaponSwitched: {
                if (!l) break;
                Verbosef("Player #%u switched to weapon #%u.", event.player_id, event.value);
                weapon_switched_msg msg;
                msg.player_id = event.player_id;
                msg.weapon_id = event.value;
                queue_broadcast(out, *l, msg);
                break;
            }
        }
    }
}

void udp_handler::flush(outbox& out) {
    for (const auto& datagram: out)
        sink_.send_to(datagram.destination, datagram.data);
    out.clear();
}

}
