#ifdef GS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace GS {

namespace {

auto env_value(const char* name) -> std::string_view {
    const char* value = std::getenv(name);
    return value ? std::string_view{value} : std::string_view{};
}

auto env_flag(const char* name) -> bool {
    std::string value{env_value(name)};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

} // namespace

auto parse_tag_list(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item  = trim(text.substr(0, comma));
        if (!item.empty())
            tags.emplace(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->configureFromEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
    }
    this->cv.notify_one();
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::configureFromEnvironment() -> void {
    this->enabled.store(env_flag("GENSPEC_LOG"), std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(this->filterMutex);
    if (!env_flag("GENSPEC_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags = kDefaultSkipTags;
    this->skipTags.merge(parse_tag_list(env_value("GENSPEC_LOG_SKIP_TAGS")));
    this->enabledTags = parse_tag_list(env_value("GENSPEC_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    this->enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    this->skipTags = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->write(msg);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();

        if (!this->running)
            return;
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    if (!this->enabledTags.empty()) {
        for (auto const& tag : tags)
            if (!this->enabledTags.contains(tag))
                return false;
    }
    return std::none_of(tags.begin(), tags.end(), [this](std::string const& tag) { return this->skipTags.contains(tag); });
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::write(const LogMessage& msg) const -> void {
    if (!this->accepts(msg.tags))
        return;

    const auto sinceEpoch = msg.timestamp.time_since_epoch();
    const auto millis     = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch) % 1000;
    const auto timeT      = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&timeT, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] " << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << ' '
        << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    if (auto it = this->threadNames.find(id); it != this->threadNames.end())
        return it->second;
    auto name             = "Thread " + std::to_string(this->nextThreadNumber++);
    this->threadNames[id] = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void flush_log() {
    logger().flush();
}

} // namespace GS
#endif // GS_LOG_DEBUG
