// SPDX-License-Identifier: Apache-2.0
#include "engine/replay.hpp"

#include "common/logger.hpp"

#include <array>
#include <stdexcept>

namespace duel::game {

namespace {

void set_vec(duel::Vec2 *out, Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

duel::MatchStatus status_to_proto(MatchStatus s)
{
    switch (s) {
        case MatchStatus::waiting:
            return duel::MATCH_STATUS_WAITING;
        case MatchStatus::countdown:
            return duel::MATCH_STATUS_COUNTDOWN;
        case MatchStatus::fighting:
            return duel::MATCH_STATUS_FIGHTING;
        case MatchStatus::finished:
            return duel::MATCH_STATUS_FINISHED;
    }
    return duel::MATCH_STATUS_WAITING;
}

} // namespace

duel::ReplayHeader make_replay_header(const std::string &match_id, const GameState &state, const MatchConfig &cfg)
{
    duel::ReplayHeader h;
    h.set_match_id(match_id);
    h.set_tick_rate(cfg.tick_rate);
    h.set_match_duration_sec(cfg.match_duration_sec);
    h.set_seed(cfg.seed);
    h.set_arena_width(cfg.arena_width);
    h.set_arena_height(cfg.arena_height);
    for (const BotState &bot : state.bots) {
        auto *b = h.add_bots();
        b->set_id(bot.id);
        if (!bot.definition)
            continue;
        const BotDefinition &def = *bot.definition;
        b->set_name(def.name);
        b->set_shape(phys::to_string(def.shape));
        b->set_color(def.color);
        b->set_size(def.size);
        b->set_speed(def.speed);
        b->set_armor(def.armor);
        b->set_weapon_type(to_string(def.weapon.type));
        b->set_weapon_damage(def.weapon.damage);
        b->set_weapon_cooldown_ms(def.weapon.cooldown_ms);
        b->set_weapon_range(def.weapon.range);
        b->set_strategy_description(def.strategy_description);
    }
    return h;
}

duel::Snapshot to_proto(const GameState &state)
{
    duel::Snapshot s;
    s.set_tick(state.tick_count);
    s.set_status(status_to_proto(state.status));
    s.set_time_remaining(state.time_remaining);
    if (state.winner)
        s.set_winner(*state.winner);
    for (const BotState &bot : state.bots) {
        auto *b = s.add_bots();
        b->set_id(bot.id);
        set_vec(b->mutable_position(), bot.position);
        b->set_angle(bot.angle);
        set_vec(b->mutable_velocity(), bot.velocity);
        b->set_health(bot.health);
        b->set_max_health(bot.max_health);
        b->set_weapon_cooldown_remaining(bot.weapon_cooldown_remaining);
        b->set_attacking(bot.attacking);
        b->set_attack_animation_frame(bot.attack_animation_frame);
    }
    for (const DamageEvent &ev : state.damage_events) {
        auto *d = s.add_damage_events();
        d->set_attacker_id(ev.attacker_id);
        d->set_target_id(ev.target_id);
        d->set_damage(ev.damage);
        set_vec(d->mutable_position(), ev.position);
        d->set_tick(ev.tick);
    }
    return s;
}

ReplayWriter::ReplayWriter(
    const std::string &path,
    const std::string &match_id,
    const GameState &initial,
    const MatchConfig &cfg)
    : m_path(path)
    , m_out(path, std::ios::binary | std::ios::trunc)
{
    if (!m_out)
        throw std::runtime_error("cannot open replay file for writing: " + path);
    duel::ReplayRecord rec;
    *rec.mutable_header() = make_replay_header(match_id, initial, cfg);
    write_record(rec);
    if (m_failed)
        throw std::runtime_error("cannot write replay header to " + path);
    log::info("[replay] recording {} to {}", match_id, path);
}

ReplayWriter::~ReplayWriter()
{
    if (m_out.is_open())
        m_out.flush();
    log::debug("[replay] closed {} records={}", m_path, m_records);
}

void ReplayWriter::on_update(const GameState &state)
{
    if (m_failed)
        return;
    duel::ReplayRecord rec;
    *rec.mutable_snapshot() = to_proto(state);
    write_record(rec);
    if (state.status == MatchStatus::finished && !m_failed)
        m_out.flush();
}

void ReplayWriter::write_record(const duel::ReplayRecord &rec)
{
    std::string payload;
    if (!rec.SerializeToString(&payload)) {
        m_failed = true;
        log::error("[replay] serialize failed after {} records; recording stopped", m_records);
        return;
    }
    std::string frame = framing::build_frame(payload);
    m_out.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (!m_out) {
        m_failed = true;
        log::error("[replay] write to {} failed after {} records; recording stopped", m_path, m_records);
        return;
    }
    ++m_records;
}

void ReplayReader::feed(const char *data, size_t n)
{
    m_state.feed(data, n);
}

bool ReplayReader::next(duel::ReplayRecord &out)
{
    std::string payload;
    switch (framing::try_extract(m_state, payload)) {
        case framing::ExtractResult::need_more:
            return false;
        case framing::ExtractResult::invalid:
            throw std::runtime_error("replay stream corrupt: bad record length");
        case framing::ExtractResult::frame:
            break;
    }
    if (!out.ParseFromString(payload))
        throw std::runtime_error("replay stream corrupt: record does not parse");
    return true;
}

std::vector<duel::ReplayRecord> read_replay_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open replay file: " + path);
    ReplayReader reader;
    std::vector<duel::ReplayRecord> records;
    std::array<char, 64 * 1024> chunk;
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got <= 0)
            break;
        reader.feed(chunk.data(), static_cast<size_t>(got));
        duel::ReplayRecord rec;
        while (reader.next(rec))
            records.push_back(std::move(rec));
    }
    if (in.bad())
        throw std::runtime_error("read error on replay file: " + path);
    if (reader.buffered_bytes() != 0)
        throw std::runtime_error("replay file truncated: " + path);
    log::debug("[replay] read {} records from {}", records.size(), path);
    return records;
}

} // namespace duel::game
