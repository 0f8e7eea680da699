// task.hpp
// Unit of work stored in the task index.
// -----------------------------------------------------------
// Identity (priority, description, assignee, creation time) is fixed at
// construction.  Status is the only mutable field; it is atomic so that
// executors can move a task through its lifecycle while other threads read
// it out of the index.

#ifndef TAVL_TASK_HPP
#define TAVL_TASK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tavl
{

    enum class TaskStatus : uint8_t
    {
        Pending,
        InProgress,
        Done,
        Failed
    };

    const char *to_string(TaskStatus status);

    /* Accepts the names produced by to_string(); std::nullopt otherwise. */
    std::optional<TaskStatus> parse_status(std::string_view name);

    class Task
    {
    public:
        using Clock = std::chrono::system_clock;

        Task(int priority, std::string description,
             std::optional<std::string> assigned_to = std::nullopt);

        Task(const Task &) = delete;
        Task &operator=(const Task &) = delete;

        int priority() const { return priority_; }
        const std::string &description() const { return description_; }
        const std::optional<std::string> &assigned_to() const { return assigned_to_; }
        Clock::time_point created_at() const { return created_at_; }

        TaskStatus status() const { return status_.load(std::memory_order_acquire); }
        void set_status(TaskStatus s) { status_.store(s, std::memory_order_release); }

        /* Moves from `expected` to `desired` only if no one changed it meanwhile. */
        bool transition(TaskStatus expected, TaskStatus desired)
        {
            return status_.compare_exchange_strong(expected, desired, std::memory_order_acq_rel);
        }

        std::string to_string() const;

    private:
        const int priority_;
        const std::string description_;
        const std::optional<std::string> assigned_to_;
        const Clock::time_point created_at_;
        std::atomic<TaskStatus> status_{TaskStatus::Pending};
    };

    using TaskPtr = std::shared_ptr<Task>;

    TaskPtr make_task(int priority, std::string description,
                      std::optional<std::string> assigned_to = std::nullopt);

    std::ostream &operator<<(std::ostream &os, TaskStatus status);
    std::ostream &operator<<(std::ostream &os, const Task &task);

} // namespace tavl

#endif // TAVL_TASK_HPP
