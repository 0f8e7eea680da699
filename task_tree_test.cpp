// task_tree_test.cpp
// Functional tests for the task index and its AVL core.
// -----------------------------------------------------------
// Each test_* function asserts on its own; main() runs them in order and
// reports progress.  Assertions stay active in every build type.

#undef NDEBUG

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "print.hpp"
#include "task_tree.hpp"

using tavl::TaskPtr;
using tavl::TaskStatus;
using tavl::TaskTree;
using tavl::make_task;

namespace
{

std::vector<int> priorities_of(const std::vector<TaskPtr>& tasks)
{
    std::vector<int> out;
    out.reserve(tasks.size());
    for (const auto& t : tasks)
        out.push_back(t->priority());
    return out;
}

bool strictly_ascending(const std::vector<int>& v)
{
    return std::adjacent_find(v.begin(), v.end(),
                              [](int a, int b) { return a >= b; }) == v.end();
}

// Roughly 1.44 * log2(n + 2): the worst case height of an AVL tree with n nodes.
int avl_height_bound(std::size_t n)
{
    return static_cast<int>(std::floor(1.4405 * std::log2(static_cast<double>(n) + 2.0) - 0.3277));
}

void test_worked_example()
{
    TaskTree tree;
    for (int p : {50, 20, 40, 10, 30})
        tree.insert(make_task(p, "task-" + std::to_string(p)));

    assert(tree.size() == 5);
    assert(tree.minimum()->priority() == 10);
    assert(tree.maximum()->priority() == 50);
    assert(tree.highest_priority()->priority() == 10);
    assert(tree.lowest_priority()->priority() == 50);
    assert((priorities_of(tree.in_order()) == std::vector<int>{10, 20, 30, 40, 50}));
    assert((priorities_of(tree.range_query(20, 40)) == std::vector<int>{20, 30, 40}));

    assert(tree.remove(20));
    assert(tree.search(20) == nullptr);
    assert((priorities_of(tree.in_order()) == std::vector<int>{10, 30, 40, 50}));
    assert(tree.validate());
}

void test_empty_tree()
{
    TaskTree tree;
    assert(tree.empty());
    assert(tree.minimum() == nullptr);
    assert(tree.maximum() == nullptr);
    assert(tree.search(1) == nullptr);
    assert(!tree.remove(1));
    assert(tree.in_order().empty());
    assert(tree.range_query(-10, 10).empty());
    assert(tree.height() == 0);

    auto stats = tree.statistics();
    assert(stats.node_count == 0);
    assert(stats.height == 0);
    assert(stats.balanced);
    assert(!stats.min_key && !stats.max_key);
    assert(tree.validate());
}

// Duplicate priority replaces the payload, it never adds a second node.
void test_duplicate_priority_overwrites()
{
    TaskTree tree;
    for (int p : {5, 3, 8, 1, 4})
        tree.insert(make_task(p, "first"));
    int height_before = tree.height();

    auto second = make_task(3, "second", std::string("bo"));
    tree.insert(second);

    assert(tree.size() == 5);
    assert(tree.height() == height_before);
    auto found = tree.search(3);
    assert(found == second);
    assert(found->description() == "second");
    assert(found->assigned_to() && *found->assigned_to() == "bo");

    auto in_order = priorities_of(tree.in_order());
    assert(std::count(in_order.begin(), in_order.end(), 3) == 1);
}

void test_round_trip_search()
{
    TaskTree tree;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dist(-50'000, 50'000);

    std::set<int> inserted;
    std::vector<TaskPtr> handles;
    while (inserted.size() < 2'000)
    {
        int p = dist(rng);
        if (!inserted.insert(p).second)
            continue;
        handles.push_back(make_task(p, "rt-" + std::to_string(p)));
        tree.insert(handles.back());
    }

    for (const auto& t : handles)
    {
        assert(tree.search(t->priority()) == t);
        assert(tree.contains(t->priority()));
    }

    for (int i = 0; i < 2'000; ++i)
    {
        int p = dist(rng);
        if (inserted.count(p) == 0)
        {
            assert(tree.search(p) == nullptr);
            assert(!tree.contains(p));
        }
    }
    assert(tree.size() == inserted.size());
}

void test_range_matches_filtered_traversal()
{
    TaskTree tree;
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> key(0, 5'000);
    for (int i = 0; i < 1'500; ++i)
        tree.insert(make_task(key(rng), "r"));

    const auto all = priorities_of(tree.in_order());
    assert(strictly_ascending(all));

    auto expect = [&all](int lo, int hi) {
        std::vector<int> out;
        for (int p : all)
            if (lo <= p && p <= hi)
                out.push_back(p);
        return out;
    };

    std::uniform_int_distribution<int> bound(-1'000, 6'000);
    for (int i = 0; i < 500; ++i)
    {
        int lo = bound(rng);
        int hi = bound(rng);
        if (lo > hi)
            std::swap(lo, hi);
        assert(priorities_of(tree.range_query(lo, hi)) == expect(lo, hi));
    }

    // single point, ranges entirely outside the keys
    assert(priorities_of(tree.range_query(all.front(), all.front())) == std::vector<int>{all.front()});
    assert(tree.range_query(-1'000, -1).empty());
    assert(tree.range_query(5'001, 9'000).empty());
    assert(tree.range_query(all.back() + 1, all.back() + 1).empty());
}

void test_invalid_arguments_leave_tree_untouched()
{
    TaskTree tree;
    for (int p : {3, 1, 2})
        tree.insert(make_task(p, "x"));

    bool threw = false;
    try
    {
        tree.insert(nullptr);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        (void)tree.range_query(10, 5);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        tree.insert_batch({make_task(7, "ok"), nullptr, make_task(8, "ok")});
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    assert(tree.size() == 3);
    assert(!tree.contains(7) && !tree.contains(8));
    assert((priorities_of(tree.in_order()) == std::vector<int>{1, 2, 3}));
    assert(tree.validate());
}

// Balance and order must hold after every single mutation, not just at the end.
void test_balance_after_every_operation()
{
    TaskTree tree;
    std::mt19937 rng(23);
    std::uniform_int_distribution<int> key(0, 400);
    std::uniform_int_distribution<int> coin(0, 2);
    std::set<int> reference;

    for (int i = 0; i < 4'000; ++i)
    {
        int p = key(rng);
        if (coin(rng) == 0)
        {
            std::size_t before = tree.size();
            bool removed = tree.remove(p);
            assert(removed == (reference.erase(p) == 1));
            if (removed)
            {
                assert(tree.size() == before - 1);
                assert(tree.search(p) == nullptr);
            }
            else
            {
                assert(tree.size() == before);
            }
        }
        else
        {
            tree.insert(make_task(p, "b"));
            reference.insert(p);
        }

        assert(tree.validate());
        assert(tree.statistics().balanced);
    }

    auto keys = priorities_of(tree.in_order());
    assert(std::equal(keys.begin(), keys.end(), reference.begin(), reference.end()));
}

// Deleting nodes with two children, the root, and draining the whole tree.
void test_delete_shapes()
{
    TaskTree tree;
    for (int p = 1; p <= 31; ++p)
        tree.insert(make_task(p, "d"));
    assert(tree.height() == 5); // perfectly balanced after sequential inserts

    int root_like = tree.in_order()[15]->priority();
    assert(tree.remove(root_like));
    assert(!tree.remove(root_like));
    assert(tree.validate());

    for (int p : {8, 24, 4, 12, 20, 28})
    {
        assert(tree.remove(p));
        assert(tree.validate());
    }

    for (const auto& t : tree.in_order())
    {
        assert(tree.remove(t->priority()));
        assert(tree.validate());
    }
    assert(tree.empty());
    assert(tree.height() == 0);
}

void test_height_bound()
{
    const std::size_t n = 10'000;

    // random keys
    {
        TaskTree tree;
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> key(-1'000'000, 1'000'000);
        while (tree.size() < n)
            tree.insert(make_task(key(rng), "h"));
        auto stats = tree.statistics();
        assert(stats.node_count == n);
        assert(stats.balanced);
        assert(stats.height <= avl_height_bound(n));
        assert(stats.height == tree.height());
    }

    // sequential keys 1..n: a plain BST would reach height n here
    {
        TaskTree tree;
        for (int p = 1; p <= static_cast<int>(n); ++p)
            tree.insert(make_task(p, "seq"));
        auto stats = tree.statistics();
        assert(stats.node_count == n);
        assert(stats.balanced);
        assert(stats.height <= avl_height_bound(n));
        assert(stats.height < static_cast<int>(n) / 100);
        assert(*stats.min_key == 1 && *stats.max_key == static_cast<int>(n));
        assert(strictly_ascending(priorities_of(tree.in_order())));
    }

    // descending keys
    {
        TaskTree tree;
        for (int p = static_cast<int>(n); p >= 1; --p)
            tree.insert(make_task(p, "desc"));
        assert(tree.statistics().height <= avl_height_bound(n));
        assert(tree.validate());
    }
}

void test_batch_insert_and_clear()
{
    TaskTree tree;
    tree.insert(make_task(2, "existing"));

    std::vector<TaskPtr> batch;
    for (int p : {5, 1, 2, 9, 5})
        batch.push_back(make_task(p, "batch-" + std::to_string(batch.size())));

    std::size_t created = tree.insert_batch(batch);
    assert(created == 3); // 1, 5, 9 are new; 2 overwritten; second 5 overwrites first
    assert(tree.size() == 4);
    assert(tree.search(5)->description() == "batch-4");
    assert(tree.search(2)->description() == "batch-2");
    assert(tree.validate());

    tree.clear();
    assert(tree.empty());
    assert(tree.minimum() == nullptr);
    assert(tree.statistics().node_count == 0);

    // usable again after reset
    tree.insert(make_task(3, "after clear"));
    assert(tree.size() == 1 && tree.search(3));
}

void test_statistics()
{
    TaskTree tree;
    for (int p : {-7, 100, 3, 42, 0})
        tree.insert(make_task(p, "s"));

    auto stats = tree.statistics();
    assert(stats.node_count == 5);
    assert(stats.height == tree.height());
    assert(stats.height == 3);
    assert(stats.balanced);
    assert(*stats.min_key == -7);
    assert(*stats.max_key == 100);

    std::ostringstream oss;
    oss << stats;
    assert(oss.str() == "nodes=5 height=3 balanced=yes min=-7 max=100");
}

void test_task_record()
{
    auto before = tavl::Task::Clock::now();
    auto t = make_task(4, "write report", std::string("ana"));
    auto after = tavl::Task::Clock::now();

    assert(t->priority() == 4);
    assert(t->status() == TaskStatus::Pending);
    assert(t->created_at() >= before && t->created_at() <= after);
    assert(t->to_string() == "Task(Priority: 4, Description: write report, Assigned: ana, Status: Pending)");

    assert(t->transition(TaskStatus::Pending, TaskStatus::InProgress));
    assert(!t->transition(TaskStatus::Pending, TaskStatus::Done));
    t->set_status(TaskStatus::Done);
    assert(t->status() == TaskStatus::Done);

    auto u = make_task(1, "triage");
    assert(u->to_string() == "Task(Priority: 1, Description: triage, Assigned: Unassigned, Status: Pending)");

    for (TaskStatus s : {TaskStatus::Pending, TaskStatus::InProgress, TaskStatus::Done, TaskStatus::Failed})
        assert(tavl::parse_status(tavl::to_string(s)) == s);
    assert(!tavl::parse_status("Cancelled"));

    // the index never touches status
    TaskTree tree;
    tree.insert(t);
    assert(tree.search(4)->status() == TaskStatus::Done);
}

void test_print()
{
    TaskTree tree;
    std::ostringstream empty;
    tree.print(empty);
    assert(empty.str() == "=== Task Tree (Priority Order) ===\n(empty)\n");

    tree.insert(make_task(2, "beta"));
    tree.insert(make_task(1, "alpha", std::string("cy")));
    std::ostringstream oss;
    tree.print(oss);
    assert(oss.str() ==
           "=== Task Tree (Priority Order) ===\n"
           "Priority 1: alpha [cy, Pending]\n"
           "Priority 2: beta [Unassigned, Pending]\n");
}

void test_generic_core()
{
    tavl::AVLTree<std::string, int> tree(tavl::TreeOptions{true});
    assert(tree.insert("pear", 1));
    assert(tree.insert("apple", 2));
    assert(tree.insert("fig", 3));
    assert(!tree.insert("fig", 4));
    assert(tree.lookup("fig") == 4);
    assert(!tree.lookup("kiwi"));
    assert((tree.range("b", "g") == std::vector<int>{4}));

    std::vector<std::string> keys;
    tree.for_each([&keys](const std::string& k, int) { keys.push_back(k); });
    assert((keys == std::vector<std::string>{"apple", "fig", "pear"}));

    tavl::AVLTree<int, int, std::greater<int>> desc;
    for (int i = 0; i < 100; ++i)
        desc.insert(i, i * i);
    auto vals = desc.in_order();
    assert(vals.front() == 99 * 99 && vals.back() == 0);
    assert(desc.validate());
}

void test_log_format()
{
    using tavl::util::detail::format;
    assert(format("a {} b {}", 1, "two") == "a 1 b two");
    assert(format("no placeholders") == "no placeholders");
    assert(format("{} {}", 1) == "1 ");
    assert(tavl::util::parse_level("debug", tavl::util::Level::Warn) == tavl::util::Level::Debug);
    assert(tavl::util::parse_level("loud", tavl::util::Level::Warn) == tavl::util::Level::Warn);
}

}  // namespace

int main()
{
    tavl::util::println("==== Task Tree Functional Tests ====");

    struct Case
    {
        const char* name;
        void (*fn)();
    };
    const Case cases[] = {
        {"worked example", test_worked_example},
        {"empty tree", test_empty_tree},
        {"duplicate priority overwrites", test_duplicate_priority_overwrites},
        {"round-trip search", test_round_trip_search},
        {"range matches filtered traversal", test_range_matches_filtered_traversal},
        {"invalid arguments", test_invalid_arguments_leave_tree_untouched},
        {"balance after every operation", test_balance_after_every_operation},
        {"delete shapes", test_delete_shapes},
        {"height bound", test_height_bound},
        {"batch insert and clear", test_batch_insert_and_clear},
        {"statistics", test_statistics},
        {"task record", test_task_record},
        {"print", test_print},
        {"generic core", test_generic_core},
        {"log format", test_log_format},
    };

    for (const auto& c : cases)
    {
        c.fn();
        tavl::util::println("  ✔ {}", c.name);
    }

    tavl::util::println("ALL FUNCTIONAL TESTS PASSED");
    return 0;
}
