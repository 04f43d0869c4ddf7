// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "engine/match.hpp"
#include "engine/match_config.hpp"
#include "engine/replay.hpp"
#include "engine/sandbox/sandbox.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duel {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    duel::g_shutdown.store(true);
}

namespace {

struct CliOptions
{
    std::vector<std::string> bot_paths;
    std::string config_path;
    std::string replay_path;
    std::optional<uint64_t> seed;
    bool realtime{false};
    bool countdown{true};
};

void print_usage()
{
    std::cerr << "usage: duel_match <bot_a.yaml> <bot_b.yaml> [--config path] [--replay path] [--seed N] "
                 "[--realtime] [--no-countdown]"
              << std::endl;
}

// Returns nullopt (after printing usage) on malformed arguments.
std::optional<CliOptions> parse_args(int argc, char **argv)
{
    CliOptions opt;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if (a == "--replay" && i + 1 < argc) {
            opt.replay_path = argv[++i];
        } else if (a == "--seed" && i + 1 < argc) {
            try {
                opt.seed = std::stoull(argv[++i]);
            } catch (const std::exception &) {
                duel::log::error("Invalid --seed value '{}'", argv[i]);
                return std::nullopt;
            }
        } else if (a == "--realtime") {
            opt.realtime = true;
        } else if (a == "--no-countdown") {
            opt.countdown = false;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return std::nullopt;
        } else if (!a.empty() && a[0] != '-') {
            opt.bot_paths.push_back(a);
        } else {
            duel::log::error("Unknown or incomplete option '{}'", a);
            print_usage();
            return std::nullopt;
        }
    }
    if (opt.bot_paths.size() != 2) {
        print_usage();
        return std::nullopt;
    }
    return opt;
}

coro::task<void> await_finish(std::shared_ptr<coro::io_scheduler> sched, std::shared_ptr<duel::game::MatchEngine> engine)
{
    co_await sched->schedule();
    using namespace std::chrono_literals;
    while (engine->status() != duel::game::MatchStatus::finished) {
        if (duel::g_shutdown.load()) {
            duel::log::warn("[cli] interrupted, stopping match {}", engine->match_id());
            engine->stop();
            break;
        }
        co_await sched->yield_for(50ms);
    }
    // Let the loop observe the stale generation before the scheduler goes away.
    while (engine->loop_running())
        co_await sched->yield_for(5ms);
    co_return;
}

void run_manual(duel::game::MatchEngine &engine)
{
    engine.start_immediate();
    while (engine.status() != duel::game::MatchStatus::finished) {
        if (duel::g_shutdown.load()) {
            duel::log::warn("[cli] interrupted at tick {}", engine.get_state().tick_count);
            return;
        }
        engine.tick();
    }
}

void print_result(const duel::game::GameState &st)
{
    std::cout << "match finished: status=" << duel::game::to_string(st.status) << " ticks=" << st.tick_count
              << std::endl;
    for (const auto &bot : st.bots) {
        std::cout << "  " << bot.id << " '" << (bot.definition ? bot.definition->name : std::string("?"))
                  << "' health=" << bot.health << "/" << bot.max_health << std::endl;
    }
    if (st.winner) {
        const auto &bots = st.bots;
        const auto &w = bots[0].id == *st.winner ? bots[0] : bots[1];
        std::cout << "winner: " << w.id << " '" << w.definition->name << "'" << std::endl;
    } else if (st.status == duel::game::MatchStatus::finished) {
        std::cout << "result: draw" << std::endl;
    } else {
        std::cout << "result: unfinished" << std::endl;
    }
}

} // namespace

int main(int argc, char **argv)
{
    duel::log::init();
    auto opt = parse_args(argc, argv);
    if (!opt)
        return 2;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        duel::game::MatchConfig cfg;
        if (!opt->config_path.empty())
            duel::game::apply_match_config_overrides(cfg, opt->config_path);
        if (opt->seed) {
            cfg.seed = *opt->seed;
            duel::log::info("CLI override: seed set to {}", cfg.seed);
        }

        auto first = duel::game::load_bot_definition(opt->bot_paths[0]);
        auto second = duel::game::load_bot_definition(opt->bot_paths[1]);
        for (const auto &def : {first, second}) {
            if (auto err = duel::sandbox::check_behavior_syntax(def->behavior_code))
                duel::log::warn("[cli] bot '{}' behavior does not compile and will idle: {}", def->name, *err);
        }

        auto engine = std::make_shared<duel::game::MatchEngine>(first, second, cfg);
        std::shared_ptr<duel::game::ReplayWriter> replay;
        if (!opt->replay_path.empty()) {
            replay = std::make_shared<duel::game::ReplayWriter>(
                opt->replay_path, engine->match_id(), engine->get_state(), engine->config());
            engine->on_update(replay);
        }

        duel::log::info(
            "duel match {} '{}' vs '{}' ({} Hz, {}s, seed {}, {})",
            engine->match_id(),
            first->name,
            second->name,
            cfg.tick_rate,
            cfg.match_duration_sec,
            cfg.seed,
            opt->realtime ? "realtime" : "fast");

        auto wall_start = std::chrono::steady_clock::now();
        if (opt->realtime) {
            auto scheduler = coro::default_executor::io_executor();
            if (opt->countdown)
                engine->start(scheduler);
            else
                engine->start_immediate(scheduler);
            coro::sync_wait(await_finish(scheduler, engine));
        } else {
            run_manual(*engine);
        }
        auto wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - wall_start)
                           .count();

        auto final_state = engine->get_state();
        print_result(final_state);
        if (replay)
            duel::log::info("[replay] {} records written to {}", replay->records_written(), replay->path());
        duel::log::info("match {} done in {} ms", engine->match_id(), wall_ms);
        duel::log::info("{}", duel::metrics::summary_json());
        return final_state.status == duel::game::MatchStatus::finished ? 0 : 3;
    } catch (const YAML::Exception &ex) {
        duel::log::error("YAML error: {}", ex.what());
        return 1;
    } catch (const std::exception &ex) {
        duel::log::error("Fatal: {}", ex.what());
        return 1;
    }
}
