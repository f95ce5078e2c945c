#ifdef LP_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cctype>
#include <ctime>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace {

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto is_blank = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n';
    };
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

namespace LP {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : TaggedLogger(std::cerr) {}

TaggedLogger::TaggedLogger(std::ostream& stream)
    : running(true), loggingEnabled(false), output(&stream), nextThreadNumber(0) {
    this->applyEnvironment();
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

auto TaggedLogger::applyEnvironment() -> void {
    if (parse_truthy(std::getenv("LEXPATH_LOG_ENABLED")) || parse_truthy(std::getenv("LEXPATH_LOG")))
        this->loggingEnabled.store(true, std::memory_order_relaxed);
    if (parse_truthy(std::getenv("LEXPATH_LOG_CLEAR_DEFAULT_SKIPS")))
        this->skipTags.clear();
    for (auto& tag : split_tags(std::getenv("LEXPATH_LOG_SKIP_TAGS")))
        this->skipTags.insert(tag);
    this->enabledTags = split_tags(std::getenv("LEXPATH_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    skipTags = std::move(tags);
}

auto TaggedLogger::currentSkipTags() const -> std::set<std::string> {
    std::lock_guard<std::mutex> lock(filterMutex);
    return skipTags;
}

auto TaggedLogger::setOutput(std::ostream& stream) -> void {
    std::lock_guard<std::mutex> lock(coutMutex);
    output = &stream;
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->write(msg);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
    }
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

auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
    std::lock_guard<std::mutex> lock(filterMutex);
    if (!enabledTags.empty())
        for (auto const& tag : tags)
            if (!enabledTags.contains(tag))
                return false;
    for (auto const& tag : tags)
        if (skipTags.contains(tag))
            return false;
    return true;
}

auto TaggedLogger::write(const LogMessage& msg) -> void {
    if (!this->accepts(msg.tags))
        return;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    const auto* nowTm   = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] [" << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << "] "
        << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    *output << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end())
        return it->second;
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

} // namespace LP
#endif // LP_LOG_DEBUG
