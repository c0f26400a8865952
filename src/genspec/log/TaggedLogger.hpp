#ifdef GS_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace GS {

/**
 * Asynchronous logger; messages are queued by the caller and written to
 * stderr by a worker thread.
 *
 * A message is written when logging is enabled, none of its tags is in the
 * skip set and, if an enable set is configured, every one of its tags is in
 * it. The constructor reads its initial configuration from the environment:
 *
 *   GENSPEC_LOG                      1/true/yes/on enables output
 *   GENSPEC_LOG_ENABLE_TAGS          comma separated enable set
 *   GENSPEC_LOG_SKIP_TAGS            comma separated tags added to the skip set
 *   GENSPEC_LOG_CLEAR_DEFAULT_SKIPS  drops the default skip set first
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
    auto setSkipTags(std::set<std::string> tags) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool { return this->enabled.load(std::memory_order_relaxed); }

    // Blocks until every queued message has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    std::size_t             inFlight = 0;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::thread             workerThread;
    bool                    running = true;
    std::atomic<bool>       enabled{false};

    std::set<std::string> skipTags;
    std::set<std::string> enabledTags;
    mutable std::mutex    filterMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    int                                              nextThreadNumber = 0;

    auto        configureFromEnvironment() -> void;
    auto        processQueue() -> void;
    auto        accepts(std::set<std::string> const& tags) const -> bool;
    auto        write(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

// Per-patch and per-line chatter, plus INFO, stay quiet unless asked for.
inline std::set<std::string> const kDefaultSkipTags{"Patch", "Line", "Trace", "INFO"};

// "a, b,,c" -> {"a", "b", "c"}
auto parse_tag_list(std::string_view text) -> std::set<std::string>;

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->loggingEnabled())
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        ++this->inFlight;
    }
    this->cv.notify_one();
}

#define gs_log(message, ...) ::GS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);
void flush_log();

} // namespace GS

#else
#define gs_log(message, ...) ((void)0)
#endif // GS_LOG_DEBUG
