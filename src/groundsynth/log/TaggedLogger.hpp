#pragma once
#ifdef GS_LOG_DEBUG
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

namespace GS {

/**
 * Asynchronous tag-filtered logger writing to stderr.
 *
 * Output is off unless GROUNDSYNTH_LOG_ENABLED or GROUNDSYNTH_LOG is set to something other than "0".
 * GROUNDSYNTH_LOG_ENABLE_TAGS and GROUNDSYNTH_LOG_SKIP_TAGS take comma separated tag lists;
 * GROUNDSYNTH_LOG_CLEAR_DEFAULT_SKIPS drops the built-in skip list.
 */
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
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::jthread            workerThread;
    bool                    running = true; // guarded by queueMutex
    std::atomic<bool>       loggingEnabled;
    // Fixed once the environment was read, so log_impl filters without locking.
    std::set<std::string>   skipTags{"INFO", "Rng"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        applyEnvironment() -> void;
    auto        accepts(const std::set<std::string>& tags) const -> bool;
    auto        processQueue() -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto formatLine(const LogMessage& msg) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;

    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!this->accepts(tagSet))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = std::move(tagSet),
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(logMessage));
    this->cv.notify_one();
}

#define gs_log(message, ...) ::GS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace GS

#else
#define gs_log(message, ...) ((void)0)
#endif // GS_LOG_DEBUG
