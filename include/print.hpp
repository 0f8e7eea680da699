#ifndef TAVL_PRINT_HPP
#define TAVL_PRINT_HPP

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tavl::util
{

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Substitutes each "{}" in order.  Surplus placeholders are dropped, surplus
// arguments are ignored.
template <typename... Args>
std::string format(std::string_view template_str, const Args&... args)
{
    std::ostringstream stream;
    std::vector<std::string> arg_list = {detail::to_string(args)...};

    size_t start_pos = 0;
    size_t arg_index = 0;
    while (start_pos < template_str.size())
    {
        size_t open_brace = template_str.find("{}", start_pos);
        if (open_brace == std::string_view::npos)
        {
            stream << template_str.substr(start_pos);
            break;
        }

        stream << template_str.substr(start_pos, open_brace - start_pos);

        if (arg_index < arg_list.size())
        {
            stream << arg_list[arg_index++];
        }

        start_pos = open_brace + 2;
    }

    return stream.str();
}

inline std::mutex& console_mutex()
{
    static std::mutex mtx;
    return mtx;
}

}  // namespace detail

template <typename... Args>
void println(std::string_view message, const Args&... args)
{
    std::string line = detail::format(message, args...);
    std::lock_guard<std::mutex> lock(detail::console_mutex());
    std::cout << line << std::endl;
}

/*---------------------------------------------------------------------------
 *  Leveled logging
 *---------------------------------------------------------------------------
 *  Messages below the process-wide threshold are discarded before they are
 *  formatted.  The threshold starts from TAVL_LOG_LEVEL (debug, info, warn,
 *  error, off) and defaults to Warn.
 *-------------------------------------------------------------------------*/
enum class Level : int
{
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

inline const char* level_name(Level level)
{
    switch (level)
    {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
    }
    return "unknown";
}

inline Level parse_level(std::string_view name, Level fallback)
{
    for (Level l : {Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off})
    {
        if (name == level_name(l))
            return l;
    }
    return fallback;
}

namespace detail
{

inline std::atomic<int>& threshold()
{
    static std::atomic<int> value{[] {
        const char* env = std::getenv("TAVL_LOG_LEVEL");
        Level l = env ? parse_level(env, Level::Warn) : Level::Warn;
        return static_cast<int>(l);
    }()};
    return value;
}

}  // namespace detail

inline void set_log_level(Level level)
{
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level log_level()
{
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

inline bool log_enabled(Level level)
{
    return level != Level::Off &&
           static_cast<int>(level) >= detail::threshold().load(std::memory_order_relaxed);
}

template <typename... Args>
void log(Level level, std::string_view message, const Args&... args)
{
    if (!log_enabled(level))
        return;

    std::string line = detail::format(message, args...);
    std::lock_guard<std::mutex> lock(detail::console_mutex());
    std::clog << '[' << level_name(level) << "] " << line << '\n';
}

}  // namespace tavl::util

#endif  // TAVL_PRINT_HPP
