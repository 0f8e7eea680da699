// task_tree.hpp
// Priority-ordered task index built on the thread-safe AVL core.
// -----------------------------------------------------------
// * One node per priority; inserting a priority that is already present
//   replaces the stored task (last write wins).
// * Lower priority value = higher precedence is a caller convention only:
//   highest_priority() is the minimum key, lowest_priority() the maximum.
// * Results are copies of TaskPtr handles taken under the tree's lock, so
//   every query returns a consistent snapshot.  Node handles never escape.

#ifndef TAVL_TASK_TREE_HPP
#define TAVL_TASK_TREE_HPP

#include <cstddef>
#include <ostream>
#include <vector>

#include "avl_tree.hpp"
#include "task.hpp"

namespace tavl
{

    using TaskStatistics = Statistics<int>;

    class TaskTree
    {
    public:
        explicit TaskTree(TreeOptions opts = TreeOptions::from_env());

        TaskTree(const TaskTree &) = delete;
        TaskTree &operator=(const TaskTree &) = delete;

        /* Throws std::invalid_argument on a null task; the tree is unchanged. */
        void insert(TaskPtr task);

        /* All-or-nothing validation, then one exclusive section for the batch.
         * Returns the number of priorities that were not present before. */
        std::size_t insert_batch(const std::vector<TaskPtr> &tasks);

        /* nullptr when no task has this priority. */
        TaskPtr search(int priority) const;
        bool contains(int priority) const;

        bool remove(int priority);

        /* nullptr on an empty tree. */
        TaskPtr minimum() const;
        TaskPtr maximum() const;
        TaskPtr highest_priority() const { return minimum(); }
        TaskPtr lowest_priority() const { return maximum(); }

        /* Inclusive bounds, ascending order.  min > max throws
         * std::invalid_argument. */
        std::vector<TaskPtr> range_query(int min_priority, int max_priority) const;

        std::vector<TaskPtr> in_order() const;

        TaskStatistics statistics() const;
        std::size_t size() const { return tree.size(); }
        bool empty() const { return tree.empty(); }
        int height() const { return tree.height(); }

        /* Drops every task atomically. */
        void clear();

        bool validate() const { return tree.validate(); }

        /* Human-readable dump, one task per line in priority order. */
        void print(std::ostream &os) const;

    private:
        AVLTree<int, TaskPtr> tree;
    };

    std::ostream &operator<<(std::ostream &os, const TaskStatistics &stats);

} // namespace tavl

#endif // TAVL_TASK_TREE_HPP
