#include "task_tree.hpp"
#include "printer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

int main()
{
    constexpr int NTASKS = 20'000; // priority space
    constexpr int WRITERS = 8;     // mixed insert/remove
    constexpr int READERS = 8;     // searches + range scans
    constexpr auto RUN_FOR = std::chrono::seconds(2);

    tavl::TaskTree tasks;
    tavl::util::printer out(std::cout);

    // ── 1. a small worked example ────────────────────────────────────────
    for (int p : {50, 20, 40, 10, 30})
        tasks.insert(tavl::make_task(p, "task-" + std::to_string(p)));
    tasks.insert(tavl::make_task(20, "task-20 (revised)", std::string("ana")));

    tasks.print(std::cout);
    std::cout << "highest priority: " << *tasks.highest_priority() << '\n'
              << "lowest priority:  " << *tasks.lowest_priority() << '\n';
    for (const auto &t : tasks.range_query(20, 40))
        std::cout << "  in [20,40]: " << *t << '\n';
    tasks.remove(20);
    std::cout << "after remove(20): " << tasks.statistics() << "\n\n";
    tasks.clear();

    // ── 2. bulk parallel insert ──────────────────────────────────────────
    std::vector<int> keys(NTASKS);
    std::iota(keys.begin(), keys.end(), 0);
    std::shuffle(keys.begin(), keys.end(), std::mt19937{std::random_device{}()});

    auto ceil_div = [](size_t a, size_t b) { return (a + b - 1) / b; };

    std::vector<std::thread> threads;
    for (int w = 0; w < WRITERS; ++w)
    {
        size_t beg = w * ceil_div(NTASKS, WRITERS);
        size_t end = std::min<size_t>(beg + ceil_div(NTASKS, WRITERS), NTASKS);
        threads.emplace_back([&, beg, end] {
            for (size_t i = beg; i < end; ++i)
                tasks.insert(tavl::make_task(keys[i], "bulk"));
        });
    }
    for (auto &t : threads)
        t.join();
    threads.clear();
    out.print("[phase-1] bulk insert done: {}", tasks.statistics());

    // ── 3. mixed workload with a watchdog ────────────────────────────────
    const auto stop_time = std::chrono::steady_clock::now() + RUN_FOR;
    std::atomic<bool> stop{false};
    std::atomic<bool> broken{false};

    std::thread watchdog([&] {
        while (!stop.load(std::memory_order_acquire))
        {
            if (!tasks.validate())
                broken.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    for (int i = 0; i < WRITERS; ++i)
    {
        threads.emplace_back([&, i] {
            std::mt19937 rng{static_cast<uint32_t>(i * 7919 + 1)};
            std::uniform_int_distribution<int> d(-NTASKS / 4, NTASKS * 5 / 4);
            size_t ops = 0;
            while (std::chrono::steady_clock::now() < stop_time)
            {
                int p = d(rng);
                if (i & 1)
                    tasks.insert(tavl::make_task(p, "writer-" + std::to_string(i)));
                else
                    (void)tasks.remove(p);
                ++ops;
            }
            out.print("writer {} finished {} ops", i, ops);
        });
    }

    for (int i = 0; i < READERS; ++i)
    {
        threads.emplace_back([&, i] {
            std::mt19937 rng{static_cast<uint32_t>(i * 104729 + 3)};
            std::uniform_int_distribution<int> d(-NTASKS / 4, NTASKS * 5 / 4);
            size_t hits = 0, scanned = 0;
            while (std::chrono::steady_clock::now() < stop_time)
            {
                int p = d(rng);
                if (tasks.search(p))
                    ++hits;
                scanned += tasks.range_query(p, p + 16).size();
            }
            out.print("reader {} finished: {} hits, {} tasks scanned", i, hits, scanned);
        });
    }

    for (auto &t : threads)
        t.join();
    stop.store(true, std::memory_order_release);
    watchdog.join();

    // ── 4. final state ───────────────────────────────────────────────────
    auto stats = tasks.statistics();
    out.print("[phase-2] mixed workload finished: {}", stats);
    out.stop();

    if (broken.load() || !tasks.validate() || !stats.balanced)
    {
        std::cerr << "invariant violation detected\n";
        return 1;
    }
    std::cout << "all invariants hold, " << tasks.size() << " tasks in the index\n";
    return 0;
}
