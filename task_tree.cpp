#include "task_tree.hpp"

#include <stdexcept>
#include <utility>

#include "print.hpp"

namespace tavl
{

    TaskTree::TaskTree(TreeOptions opts) : tree(opts)
    {
        if (opts.verify_each_mutation)
            util::log(util::Level::Info, "task tree: invariant check after every mutation enabled");
    }

    void TaskTree::insert(TaskPtr task)
    {
        if (!task)
            throw std::invalid_argument("insert: task must not be null");

        int priority = task->priority();
        bool created = tree.insert(priority, std::move(task));
        util::log(util::Level::Debug, "task tree: {} priority {}",
                  created ? "inserted" : "overwrote", priority);
    }

    std::size_t TaskTree::insert_batch(const std::vector<TaskPtr> &tasks)
    {
        std::vector<std::pair<int, TaskPtr>> entries;
        entries.reserve(tasks.size());
        for (const auto &task : tasks)
        {
            if (!task)
                throw std::invalid_argument("insert_batch: task must not be null");
            entries.emplace_back(task->priority(), task);
        }

        std::size_t created = tree.insert_batch(entries.begin(), entries.end());
        util::log(util::Level::Debug, "task tree: batch of {} applied, {} new priorities",
                  entries.size(), created);
        return created;
    }

    TaskPtr TaskTree::search(int priority) const
    {
        return tree.lookup(priority).value_or(nullptr);
    }

    bool TaskTree::contains(int priority) const
    {
        return tree.contains(priority);
    }

    bool TaskTree::remove(int priority)
    {
        bool removed = tree.erase(priority);
        if (removed)
            util::log(util::Level::Debug, "task tree: removed priority {}", priority);
        return removed;
    }

    TaskPtr TaskTree::minimum() const
    {
        return tree.min_value().value_or(nullptr);
    }

    TaskPtr TaskTree::maximum() const
    {
        return tree.max_value().value_or(nullptr);
    }

    std::vector<TaskPtr> TaskTree::range_query(int min_priority, int max_priority) const
    {
        if (min_priority > max_priority)
            throw std::invalid_argument("range_query: min priority is greater than max priority");
        return tree.range(min_priority, max_priority);
    }

    std::vector<TaskPtr> TaskTree::in_order() const
    {
        return tree.in_order();
    }

    TaskStatistics TaskTree::statistics() const
    {
        TaskStatistics stats = tree.statistics();
        if (!stats.balanced)
            util::log(util::Level::Error, "task tree: statistics found an unbalanced node ({} nodes, height {})",
                      stats.node_count, stats.height);
        return stats;
    }

    void TaskTree::clear()
    {
        tree.clear();
        util::log(util::Level::Debug, "task tree: cleared");
    }

    void TaskTree::print(std::ostream &os) const
    {
        os << "=== Task Tree (Priority Order) ===\n";
        std::size_t lines = 0;
        tree.for_each([&os, &lines](int priority, const TaskPtr &task) {
            os << "Priority " << priority << ": " << task->description()
               << " [" << (task->assigned_to() ? *task->assigned_to() : "Unassigned")
               << ", " << task->status() << "]\n";
            ++lines;
        });
        if (lines == 0)
            os << "(empty)\n";
    }

    std::ostream &operator<<(std::ostream &os, const TaskStatistics &stats)
    {
        os << "nodes=" << stats.node_count
           << " height=" << stats.height
           << " balanced=" << (stats.balanced ? "yes" : "no");
        if (stats.min_key && stats.max_key)
            os << " min=" << *stats.min_key << " max=" << *stats.max_key;
        return os;
    }

} // namespace tavl
