#ifdef GS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace GS {

namespace {

auto envFlag(const char* name) -> bool {
    const char* value = std::getenv(name);
    return value != nullptr && std::strcmp(value, "0") != 0;
}

auto splitTags(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto token = list.substr(0, comma);
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return tags;
}

// "dataset/DatasetAssembler.cpp" from a full or build-relative path.
auto shortSourcePath(const char* filepath) -> std::string {
    std::filesystem::path path{filepath};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : loggingEnabled(false), nextThreadNumber(0) {
    this->applyEnvironment();
    this->workerThread = std::jthread([this] { this->processQueue(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
    }
    this->cv.notify_one();
    if (this->workerThread.joinable())
        this->workerThread.join();
}

auto TaggedLogger::applyEnvironment() -> void {
    if (envFlag("GROUNDSYNTH_LOG_ENABLED") || envFlag("GROUNDSYNTH_LOG"))
        this->loggingEnabled = true;
    if (envFlag("GROUNDSYNTH_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags.clear();
    if (const char* skip = std::getenv("GROUNDSYNTH_LOG_SKIP_TAGS")) {
        auto extra = splitTags(skip);
        this->skipTags.insert(extra.begin(), extra.end());
    }
    if (const char* enable = std::getenv("GROUNDSYNTH_LOG_ENABLE_TAGS"))
        this->enabledTags = splitTags(enable);
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

// With an enable list every tag of a message must be listed; any skipped tag drops it.
auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
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

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    for (;;) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (this->messageQueue.empty())
            return;

        std::queue<LogMessage> batch;
        batch.swap(this->messageQueue);
        lock.unlock();
        for (; !batch.empty(); batch.pop()) {
            auto line = formatLine(batch.front());
            std::lock_guard<std::mutex> out(coutMutex);
            std::cerr << line << std::flush;
        }
        lock.lock();
    }
}

// "2024-03-01 12:00:00.042 [Assembler][INFO] [Worker-1] [dataset/DatasetAssembler.cpp:120] text"
auto TaggedLogger::formatLine(const LogMessage& msg) -> std::string {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto timeT  = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&timeT, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count()
        << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] [" << shortSourcePath(msg.location.file_name()) << ':'
        << msg.location.line() << "] " << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace GS
#endif // GS_LOG_DEBUG
