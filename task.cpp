#include "task.hpp"

#include <sstream>
#include <utility>

namespace tavl
{

    const char *to_string(TaskStatus status)
    {
        switch (status)
        {
        case TaskStatus::Pending:    return "Pending";
        case TaskStatus::InProgress: return "InProgress";
        case TaskStatus::Done:       return "Done";
        case TaskStatus::Failed:     return "Failed";
        }
        return "Unknown";
    }

    std::optional<TaskStatus> parse_status(std::string_view name)
    {
        for (TaskStatus s : {TaskStatus::Pending, TaskStatus::InProgress,
                             TaskStatus::Done, TaskStatus::Failed})
        {
            if (name == to_string(s))
                return s;
        }
        return std::nullopt;
    }

    Task::Task(int priority, std::string description,
               std::optional<std::string> assigned_to)
        : priority_(priority),
          description_(std::move(description)),
          assigned_to_(std::move(assigned_to)),
          created_at_(Clock::now())
    {
    }

    std::string Task::to_string() const
    {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    TaskPtr make_task(int priority, std::string description,
                      std::optional<std::string> assigned_to)
    {
        return std::make_shared<Task>(priority, std::move(description), std::move(assigned_to));
    }

    std::ostream &operator<<(std::ostream &os, TaskStatus status)
    {
        return os << to_string(status);
    }

    // Task(Priority: 3, Description: ship, Assigned: ana, Status: Pending)
    std::ostream &operator<<(std::ostream &os, const Task &task)
    {
        os << "Task(Priority: " << task.priority()
           << ", Description: " << task.description()
           << ", Assigned: " << (task.assigned_to() ? *task.assigned_to() : "Unassigned")
           << ", Status: " << task.status() << ')';
        return os;
    }

} // namespace tavl
