#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace RD {

/**
 * LogConfig — tag filter and on/off switch for TaggedLogger
 *
 * Environment
 * -----------
 * REACTIVEDOM_LOG_ENABLED, REACTIVEDOM_LOG    1/true/on/yes enables output
 * REACTIVEDOM_LOG_CLEAR_DEFAULT_SKIPS         drops the default skip tags
 * REACTIVEDOM_LOG_SKIP_TAGS                   comma list added to the skips
 * REACTIVEDOM_LOG_ENABLE_TAGS                 comma list; when set, a message
 *                                             prints only if all its tags are listed
 */
struct LogConfig {
    bool                  enabled = false;
    std::set<std::string> skipTags{"INFO", "Scheduler", "Cell", "Watch", "Derive", "Dom", "Registry"};
    std::set<std::string> enabledTags{};

    static auto fromEnvironment() -> LogConfig;

    // Whether a message carrying tags passes the filter.
    [[nodiscard]] auto accepts(std::set<std::string> const& tags) const -> bool;
};

class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    explicit TaggedLogger(LogConfig config);
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto config() const -> LogConfig const& { return config_; }

    // "<date time.ms> [tag][tag] [thread] [dir/file:line] message\n"
    static auto formatLine(LogMessage const& msg) -> std::string;

    static std::mutex coutMutex;

private:
    LogConfig                config_;
    std::queue<LogMessage>   messageQueue;
    mutable std::mutex       queueMutex;
    std::condition_variable  cv;
    std::thread              workerThread;
    std::atomic<bool>        running{true};
    std::atomic<bool>        loggingEnabled{false};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber{0};

    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;

    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!config_.accepts(tagSet))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = std::move(tagSet),
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace RD

// Contained faults are always routed through the logger; LogConfig decides whether they print.
#define rd_log_fault(message, ...) ::RD::logger().log_impl(message, std::source_location::current(), "ERROR", ##__VA_ARGS__)

#ifdef RD_LOG_DEBUG
#define rd_log(message, ...) ::RD::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define rd_log(message, ...) ((void)0)
#endif // RD_LOG_DEBUG
