#include "TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace RD {
namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto env_flag(char const* name) -> bool {
    char const* raw = std::getenv(name);
    if (!raw)
        return false;
    std::string value{raw};
    for (auto& ch : value)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return value == "1" || value == "true" || value == "on" || value == "yes";
}

auto trim(std::string_view token) -> std::string_view {
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
        token.remove_prefix(1);
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
        token.remove_suffix(1);
    return token;
}

auto env_tags(char const* name) -> std::set<std::string> {
    std::set<std::string> tags;
    char const*           raw = std::getenv(name);
    if (!raw)
        return tags;
    std::string_view list{raw};
    while (!list.empty()) {
        auto comma = list.find(',');
        auto token = trim(list.substr(0, comma));
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

auto LogConfig::fromEnvironment() -> LogConfig {
    LogConfig config;
    config.enabled = env_flag("REACTIVEDOM_LOG_ENABLED") || env_flag("REACTIVEDOM_LOG");
    if (env_flag("REACTIVEDOM_LOG_CLEAR_DEFAULT_SKIPS"))
        config.skipTags.clear();
    for (auto& tag : env_tags("REACTIVEDOM_LOG_SKIP_TAGS"))
        config.skipTags.insert(tag);
    config.enabledTags = env_tags("REACTIVEDOM_LOG_ENABLE_TAGS");
    return config;
}

auto LogConfig::accepts(std::set<std::string> const& tags) const -> bool {
    if (!this->enabledTags.empty()) {
        for (auto const& tag : tags)
            if (!this->enabledTags.contains(tag))
                return false;
    }
    for (auto const& tag : tags)
        if (this->skipTags.contains(tag))
            return false;
    return true;
}

TaggedLogger::TaggedLogger() : TaggedLogger(LogConfig::fromEnvironment()) {}

TaggedLogger::TaggedLogger(LogConfig config) : config_(std::move(config)), loggingEnabled(config_.enabled) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    std::queue<LogMessage> pending;
    std::unique_lock<std::mutex> lock(this->queueMutex);
    for (;;) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (this->messageQueue.empty())
            return;
        std::swap(pending, this->messageQueue);
        lock.unlock();
        for (; !pending.empty(); pending.pop())
            this->writeToStderr(pending.front());
        lock.lock();
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    std::filesystem::path const path{filepath};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto TaggedLogger::formatLine(LogMessage const& msg) -> std::string {
    using namespace std::chrono;
    auto const millis = duration_cast<milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const time   = system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count()
         << " [" << join_with_impl(msg.tags, "][") << "] [" << msg.threadName << "] ["
         << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << "] " << msg.message << '\n';
    return line.str();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    auto const line = formatLine(msg);
    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto [it, inserted] = threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(nextThreadNumber++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace RD
