#pragma once

#ifdef IV_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace IV {

/*
 * Decides which tagged messages are written. A message is dropped when any
 * of its tags is skipped; when enableTags is non-empty it must also carry at
 * least one of those tags.
 */
struct LogFilter {
    bool                  enabled{false};
    std::set<std::string> enableTags;
    std::set<std::string> skipTags{"Trace"};

    // ICONVAULT_LOG_ENABLED / ICONVAULT_LOG, ICONVAULT_LOG_ENABLE_TAGS,
    // ICONVAULT_LOG_SKIP_TAGS and ICONVAULT_LOG_CLEAR_DEFAULT_SKIPS.
    static auto fromEnvironment() -> LogFilter;

    auto allows(std::vector<std::string> const& tags) const -> bool;
};

// Queues messages and writes them from a background thread.
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           message;
        std::source_location                  location;
    };

    explicit TaggedLogger(LogFilter filter = LogFilter::fromEnvironment(), std::ostream& sink = std::cerr);
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log_impl(std::string const& message, std::source_location const& location, Tags&&... tags) -> void;

    auto enabled() const -> bool { return enabled_.load(std::memory_order_relaxed); }
    auto setEnabled(bool enabled) -> void { enabled_.store(enabled, std::memory_order_relaxed); }

    // Blocks until every queued message has been written.
    auto flush() -> void;

    // Held while a line is written to any sink.
    static std::mutex outputMutex;

private:
    auto enqueue(Entry entry) -> void;
    auto drain() -> void;
    auto write(Entry const& entry) -> void;

    LogFilter const   filter_;
    std::ostream&     sink_;
    std::atomic<bool> enabled_;

    std::mutex              mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::queue<Entry>       queue_;
    std::size_t             pending_{0};
    bool                    stopping_{false};
    std::thread             worker_;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string const& message, std::source_location const& location, Tags&&... tags)
    -> void {
    if (!enabled()) {
        return;
    }
    Entry entry{.timestamp = std::chrono::system_clock::now(),
                .tags      = {std::string(std::forward<Tags>(tags))...},
                .message   = message,
                .location  = location};
    if (!filter_.allows(entry.tags)) {
        return;
    }
    enqueue(std::move(entry));
}

} // namespace IV

#define iv_log(message, ...) ::IV::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define iv_log(message, ...) ((void)0)
#endif // IV_LOG_DEBUG
