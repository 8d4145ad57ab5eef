#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tabhost
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger. Safe to call from the host thread and from the
// window-discovery threads at the same time.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        int                                   thread = 0;   // see thread_tag()
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const
    {
        return static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
    }

    // Small per-thread number, assigned in order of first use. Tells the host
    // thread apart from the window-discovery threads in interleaved output.
    static int thread_tag();

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Exposed for tests; replaces the first "{}" per argument.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                search_from = pos + text.size();
            };
            (replace_next(std::forward<Args>(args)), ...);
        }
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    std::atomic<int>     min_level_{static_cast<int>(LogLevel::Info)};
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else
            return std::to_string(v);
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    log(level, category, format_message(format, std::forward<Args>(args)...));
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define TABHOST_LOG_AT(level, category, ...)                                          \
    do                                                                                \
    {                                                                                 \
        if (::tabhost::Logger::instance().is_enabled(level))                          \
        {                                                                             \
            ::tabhost::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                             \
    } while (0)

#define TABHOST_LOG_TRACE(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Trace, category, __VA_ARGS__)
#define TABHOST_LOG_DEBUG(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Debug, category, __VA_ARGS__)
#define TABHOST_LOG_INFO(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Info, category, __VA_ARGS__)
#define TABHOST_LOG_WARN(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Warning, category, __VA_ARGS__)
#define TABHOST_LOG_ERROR(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Error, category, __VA_ARGS__)
#define TABHOST_LOG_CRITICAL(category, ...) \
    TABHOST_LOG_AT(::tabhost::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace tabhost
