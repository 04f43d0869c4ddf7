// SPDX-License-Identifier: Apache-2.0
// Scheduler-driven lifecycle: countdown, paced ticking, natural finish and stop().
#include "engine/match.hpp"
#include "fake_physics_world.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

using namespace std::chrono_literals;
using namespace duel;

namespace {

std::shared_ptr<const game::BotDefinition> idle_bot(const char *name)
{
    game::BotDefinition d;
    d.name = name;
    d.behavior_code = "api.rotateTo(api.angleTo(api.getEnemyPosition()));";
    return std::make_shared<const game::BotDefinition>(d);
}

std::shared_ptr<game::MatchEngine> make_engine(game::MatchConfig cfg)
{
    return std::make_shared<game::MatchEngine>(
        idle_bot("Left"),
        idle_bot("Right"),
        cfg,
        std::make_unique<test::FakePhysicsWorld>(),
        game::SpawnPoints{{100.f, 300.f}, {400.f, 300.f}});
}

struct TickCounter : game::MatchObserver
{
    void on_update(const game::GameState &s) override
    {
        ticks.fetch_add(1);
        if (s.status == game::MatchStatus::finished)
            finished_seen.store(true);
    }
    std::atomic<int> ticks{0};
    std::atomic<bool> finished_seen{false};
};

coro::task<void> countdown_then_finish(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await sched->schedule();
    game::MatchConfig cfg;
    cfg.match_duration_sec = 0.5f; // 15 ticks at 30 Hz
    cfg.countdown_ms = 150;
    auto engine = make_engine(cfg);
    auto counter = std::make_shared<TickCounter>();
    engine->on_update(counter);

    auto t0 = std::chrono::steady_clock::now();
    engine->start(sched);
    assert(engine->status() == game::MatchStatus::countdown);
    engine->start(sched); // ignored while not waiting
    co_await sched->yield_for(50ms);
    assert(engine->status() == game::MatchStatus::countdown);
    assert(counter->ticks.load() == 0);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (engine->status() != game::MatchStatus::finished && std::chrono::steady_clock::now() < deadline)
        co_await sched->yield_for(10ms);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    assert(engine->status() == game::MatchStatus::finished);
    assert(counter->finished_seen.load());
    auto s = engine->get_state();
    assert(s.tick_count == 15);
    assert(counter->ticks.load() == 15);
    assert(!s.winner);
    // Countdown plus ~14 tick intervals; generous upper bound for loaded CI machines.
    assert(elapsed >= 550ms);
    assert(elapsed < 4s);
    while (engine->loop_running() && std::chrono::steady_clock::now() < deadline)
        co_await sched->yield_for(5ms);
    assert(!engine->loop_running());
    std::cout << "[e2e] countdown match finished after "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << "ms" << std::endl;
    co_return;
}

coro::task<void> stop_halts_loop(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await sched->schedule();
    game::MatchConfig cfg;
    cfg.match_duration_sec = 60.f;
    auto engine = make_engine(cfg);
    engine->start_immediate(sched);
    assert(engine->status() == game::MatchStatus::fighting);
    co_await sched->yield_for(200ms);
    engine->stop();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (engine->loop_running() && std::chrono::steady_clock::now() < deadline)
        co_await sched->yield_for(5ms);
    assert(!engine->loop_running());
    auto halted = engine->get_state();
    assert(halted.tick_count > 0);
    assert(halted.status == game::MatchStatus::fighting); // stop() leaves status alone
    co_await sched->yield_for(150ms);
    assert(engine->get_state().tick_count == halted.tick_count);
    // Manual ticking still works after the loop is gone.
    engine->tick();
    assert(engine->get_state().tick_count == halted.tick_count + 1);
    std::cout << "[e2e] stopped at tick " << halted.tick_count << std::endl;
    co_return;
}

coro::task<void> engine_outlives_caller(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await sched->schedule();
    game::MatchConfig cfg;
    cfg.match_duration_sec = 0.2f;
    std::weak_ptr<game::MatchEngine> weak;
    {
        auto engine = make_engine(cfg);
        weak = engine;
        engine->start_immediate(sched);
    }
    // The running loop holds the engine until the match is over.
    assert(!weak.expired());
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!weak.expired() && std::chrono::steady_clock::now() < deadline)
        co_await sched->yield_for(10ms);
    assert(weak.expired());
    co_return;
}

coro::task<void> run_all(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await countdown_then_finish(sched);
    co_await stop_halts_loop(sched);
    co_await engine_outlives_caller(sched);
    std::cout << "e2e_match_realtime OK" << std::endl;
    co_return;
}

} // namespace

int main()
{
    auto sched = coro::default_executor::io_executor();
    coro::sync_wait(run_all(sched));
    return 0;
}
