// SPDX-License-Identifier: Apache-2.0
// replay.hpp - Length-framed protobuf replay files (header record + one snapshot per tick)
#pragma once
#include "common/framing.hpp"
#include "engine/bot_types.hpp"
#include "engine/match.hpp"
#include "engine/match_config.hpp"

#include "duel.pb.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace duel::game {

duel::ReplayHeader make_replay_header(const std::string &match_id, const GameState &state, const MatchConfig &cfg);
duel::Snapshot to_proto(const GameState &state);

// Writes the header on construction and a snapshot record for every published GameState.
// Throws std::runtime_error when the file cannot be opened. Write failures after that are
// logged once and further records are dropped; a match is never interrupted by its replay.
class ReplayWriter : public MatchObserver
{
public:
    ReplayWriter(const std::string &path, const std::string &match_id, const GameState &initial, const MatchConfig &cfg);
    ~ReplayWriter() override;

    void on_update(const GameState &state) override;

    uint64_t records_written() const
    {
        return m_records;
    }
    bool failed() const
    {
        return m_failed;
    }
    const std::string &path() const
    {
        return m_path;
    }

private:
    void write_record(const duel::ReplayRecord &rec);

    std::string m_path;
    std::ofstream m_out;
    uint64_t m_records{0};
    bool m_failed{false};
};

// Incremental reader: feed arbitrary byte chunks, pull complete records.
class ReplayReader
{
public:
    void feed(const char *data, size_t n);
    void feed(const std::string &bytes)
    {
        feed(bytes.data(), bytes.size());
    }
    // False when no complete record is buffered. Throws std::runtime_error on a corrupt
    // length prefix or a payload that does not parse as a ReplayRecord.
    bool next(duel::ReplayRecord &out);
    size_t buffered_bytes() const
    {
        return m_state.buffer.size();
    }

private:
    framing::FrameParseState m_state;
};

// Reads a whole replay file. Throws std::runtime_error on I/O errors, corruption or a
// truncated trailing record.
std::vector<duel::ReplayRecord> read_replay_file(const std::string &path);

} // namespace duel::game
