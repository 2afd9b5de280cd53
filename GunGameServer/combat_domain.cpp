#include "combat_domain.hpp"
#include "lobby_domain.hpp"
#include "simulator.hpp"

namespace ggs::combat_domain {

namespace {
    // Confirms a client's hit claim against the server's own view of the world.
    bool confirm_hit(const lobby& l, const player& shooter, player_id_t target_id, const weapon_data& weapon) {
        if (target_id == shooter.id)
            return false;
        const auto* target = l.find_player(target_id);
        if (!target || !target->is_alive())
            return false;
        if (shooter.position.distance_to(target->position) > weapon.range)
            return false;
        return simulator::check_line_of_sight(shooter.position, target->position);
    }

    // The dead take no damage and produce no events.
    void apply_damage(lobby& l, player& target, uint32_t amount, player_id_t attacker_id, event_list& events) {
        if (!target.is_alive())
            return;
        bool died = target.take_damage(amount);
        events.push_back({.type = game_event::PlayerDamaged, .lobby_code = l.code,
                          .player_id = target.id, .other_id = attacker_id, .value = amount});
        if (died) {
            Printf(ansi::BrightRed, "Player #%u (%s) was killed by #%u in lobby \"%s\".",
                   target.id, target.name, attacker_id, l.code);
            events.push_back({.type = game_event::PlayerDied, .lobby_code = l.code,
                              .player_id = target.id, .other_id = attacker_id});
        }
    }
}

error_code player_shoot(server_state& state, const weapon_database& weapons, const std::string& code,
                        player_id_t player_id, game_clock::time_point now, bool& fired, event_list& events,
                        std::optional<player_id_t> claimed_target) {
    fired = false;
    auto* l = lobby_domain::get_lobby(state, code);
    if (!l)
        return error_code::NotFound;
    auto* shooter = l->find_player(player_id);
    if (!shooter)
        return error_code::NotFound;
    const auto* weapon = weapons.get(shooter->current_weapon_id);
    if (!weapon || !shooter->is_alive())
        return error_code::InvalidOperation;

    if (shooter->is_reloading)
        return error_code::None;
    if (!weapon->is_melee() && shooter->current_ammo == 0)
        return error_code::None;
    if (shooter->last_shot_time && now - *shooter->last_shot_time < weapon->get_cooldown())
        return error_code::None;

    if (!weapon->is_melee())
        --shooter->current_ammo;
    shooter->last_shot_time = now;
    fired = true;

    std::optional<player_id_t> hit;
    if (claimed_target) {
        if (confirm_hit(*l, *shooter, *claimed_target, *weapon))
            hit = claimed_target;
        else
            Verbosef("Rejected hit claim of #%u on #%u in lobby \"%s\".", player_id, *claimed_target, l->code);
    } else {
        hit = simulator::perform_hitscan(*l, player_id, shooter->position,
                                         simulator::get_forward_vector(shooter->rotation), weapon->range);
    }

    if (hit) {
        if (auto* target = l->find_player(*hit); target && target->id != player_id)
            apply_damage(*l, *target, weapon->damage, player_id, events);
    }
    return error_code::None;
}

error_code player_take_damage(server_state& state, const std::string& code, player_id_t player_id,
                              uint32_t amount, player_id_t attacker_id, event_list& events) {
    auto* l = lobby_domain::get_lobby(state, code);
    if (!l)
        return error_code::NotFound;
    auto* target = l->find_player(player_id);
    if (!target)
        return error_code::NotFound;
    if (amount == 0 || amount > MAX_DAMAGE_PER_HIT)
        return error_code::InvalidOperation;
    apply_damage(*l, *target, amount, attacker_id, events);
    return error_code::None;
}

error_code player_start_reload(server_state& state, const std::string& code, player_id_t player_id,
                               game_clock::time_point now, event_list& events) {
    auto* l = lobby_domain::get_lobby(state, code);
    if (!l)
        return error_code::NotFound;
    auto* p = l->find_player(player_id);
    if (!p)
        return error_code::NotFound;
    if (p->is_reloading || p->current_ammo >= p->max_ammo)
        return error_code::InvalidOperation;

    p->is_reloading = true;
    p->reload_started_at = now;
    events.push_back({.type = game_event::ReloadStarted, .lobby_code = l->code, .player_id = player_id});
    return error_code::None;
}

event_list update_reload_states(server_state& state, const weapon_database& weapons, game_clock::time_point now) {
    event_list completed;
    for (auto& [code, l]: state.lobbies) {
        for (auto& [id, p]: l.players) {
            if (!p.is_reloading)
                continue;
            const auto* weapon = weapons.get(p.current_weapon_id);
            if (weapon && p.reload_started_at && now - *p.reload_started_at < weapon->get_reload_duration())
                continue;
            p.current_ammo = p.max_ammo;
            p.is_reloading = false;
            p.reload_started_at.reset();
            completed.push_back({.type = game_event::ReloadFinished, .lobby_code = code,
                                 .player_id = id, .value = p.current_ammo});
        }
    }
    return completed;
}

error_code player_switch_weapon(server_state& state, const weapon_database& weapons, const std::string& code,
                                player_id_t player_id, weapon_id_t weapon_id, event_list& events) {
    auto* p = lobby_domain::find_player(state, code, player_id);
    if (!p)
        return error_code::NotFound;
    const auto* weapon = weapons.get(weapon_id);
    if (!weapon)
        return error_code::NotFound;

    p->current_weapon_id = weapon_id;
    p->max_ammo = weapon->ammo_capacity;
    p->current_ammo = p->max_ammo;
    p->is_reloading = false;
    p->reload_started_at.reset();
    events.push_back({.type = game_event::WeaponSwitched, .lobby_code = lobby_domain::normalize_code(code),
                      .player_id = player_id, .value = weapon_id});
    return error_code::None;
}

error_code get_lobby_state_sync(const server_state& state, const std::string& code,
                                std::vector<player_sync_snapshot>& snapshots) {
    const auto* l = lobby_domain::get_lobby(state, code);
    if (!l)
        return error_code::NotFound;
    snapshots.clear();
    snapshots.reserve(l->players.size());
    for (const auto& [_, p]: l->players)
        snapshots.push_back(p.get_snapshot());
    return error_code::None;
}

error_code respawn_player(server_state& state, const std::string& code, player_id_t player_id) {
    auto* p = lobby_domain::find_player(state, code, player_id);
    if (!p)
        return error_code::NotFound;
    if (p->is_alive())
        return error_code::InvalidOperation;
    p->heal(p->max_health);
    return error_code::None;
}

}
