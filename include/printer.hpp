#ifndef TAVL_PRINTER_HPP
#define TAVL_PRINTER_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include "print.hpp"

namespace tavl::util
{

// Background line printer.  Worker threads enqueue formatted lines and a single
// consumer thread writes them out, so hot loops never wait on the console.
// Everything enqueued before stop() or destruction is written.
class printer final
{
public:
    inline explicit printer(std::ostream& out) noexcept;
    inline ~printer() noexcept;

    template <typename... Args>
    void print(std::string_view message, const Args&... args)
    {
        this->push(detail::format(message, args...));
    }

    inline void stop() noexcept;

    printer()                          = delete;
    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    void push(std::string value)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                return;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush() noexcept;

    std::ostream&           out_;
    std::deque<std::string> queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    bool                    running_;
    std::thread             printer_thread_;
};

printer::printer(std::ostream& out) noexcept
    : out_(out), running_(true)
{
    this->printer_thread_ = std::thread([this] { this->flush(); });
}

printer::~printer() noexcept
{
    this->stop();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    cv_.notify_one();
    if (this->printer_thread_.joinable()) this->printer_thread_.join();
}

void printer::flush() noexcept
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    while (true)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

        std::deque<std::string> batch;
        batch.swap(queue_);
        bool done = !running_;

        lock.unlock();
        {
            std::lock_guard<std::mutex> console(detail::console_mutex());
            for (const auto& line : batch)
                out_ << line << '\n';
            out_.flush();
        }
        lock.lock();

        if (done && queue_.empty())
            return;
    }
}

}  // namespace tavl::util

#endif  // TAVL_PRINTER_HPP
