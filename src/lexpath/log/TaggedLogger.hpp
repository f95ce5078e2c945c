#pragma once
#ifdef LP_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace LP {

/**
 * Asynchronous logger for the lexical path engine. Records are queued by the
 * calling thread and written by a worker thread as
 * `<time> [tag][tag] [thread] [dir/file:line] message`.
 *
 * The constructor reads `LEXPATH_LOG_ENABLED` / `LEXPATH_LOG`,
 * `LEXPATH_LOG_CLEAR_DEFAULT_SKIPS`, `LEXPATH_LOG_SKIP_TAGS` and
 * `LEXPATH_LOG_ENABLE_TAGS`. A record is written only if none of its tags is
 * skipped and, when an enable list is set, all of its tags are enabled.
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
    explicit TaggedLogger(std::ostream& stream);
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto isLoggingEnabled() const -> bool;

    auto               setSkipTags(std::set<std::string> tags) -> void;
    [[nodiscard]] auto currentSkipTags() const -> std::set<std::string>;

    // The stream must stay alive until it is replaced or the logger is flushed.
    auto setOutput(std::ostream& output) -> void;
    // Blocks until every queued record has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::size_t             inFlight = 0;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::ostream*           output;

    mutable std::mutex    filterMutex;
    std::set<std::string> skipTags{"INFO", "Builder"};
    std::set<std::string> enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        applyEnvironment() -> void;
    auto        processQueue() -> void;
    auto        accepts(const std::set<std::string>& tags) const -> bool;
    auto        write(const LogMessage& msg) -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
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
        this->cv.notify_one();
    }
}

#define lp_log(message, ...) ::LP::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace LP

#else
#define lp_log(message, ...) ((void)0)
#endif // LP_LOG_DEBUG
