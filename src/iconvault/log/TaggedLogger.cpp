#include "log/TaggedLogger.hpp"

#ifdef IV_LOG_DEBUG
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

namespace IV {

namespace {

auto env_value(char const* key) -> std::optional<std::string_view> {
    char const* raw = std::getenv(key);
    if (raw == nullptr) {
        return std::nullopt;
    }
    return std::string_view{raw};
}

auto env_flag(char const* key) -> bool {
    auto value = env_value(key);
    if (!value) {
        return false;
    }
    auto const lowered = Utils::toLower(Utils::trim(*value));
    return !lowered.empty() && lowered != "0" && lowered != "false" && lowered != "no" && lowered != "off";
}

auto tag_list(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    for (auto token : Utils::split(text, ',')) {
        token = Utils::trim(token);
        if (!token.empty()) {
            tags.emplace(token);
        }
    }
    return tags;
}

auto format_entry(TaggedLogger::Entry const& entry) -> std::string {
    auto const time   = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count()
        << " [iconvault]";
    for (auto const& tag : entry.tags) {
        out << '[' << tag << ']';
    }
    out << ' ' << std::filesystem::path{entry.location.file_name()}.filename().string() << ':'
        << entry.location.line() << ' ' << entry.message << '\n';
    return out.str();
}

} // namespace

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter;
    filter.enabled = env_flag("ICONVAULT_LOG_ENABLED") || env_flag("ICONVAULT_LOG");
    if (env_flag("ICONVAULT_LOG_CLEAR_DEFAULT_SKIPS")) {
        filter.skipTags.clear();
    }
    if (auto skip = env_value("ICONVAULT_LOG_SKIP_TAGS")) {
        auto extra = tag_list(*skip);
        filter.skipTags.insert(extra.begin(), extra.end());
    }
    if (auto enable = env_value("ICONVAULT_LOG_ENABLE_TAGS")) {
        filter.enableTags = tag_list(*enable);
    }
    return filter;
}

auto LogFilter::allows(std::vector<std::string> const& tags) const -> bool {
    auto const skipped = std::any_of(tags.begin(), tags.end(), [this](std::string const& tag) {
        return skipTags.contains(tag);
    });
    if (skipped) {
        return false;
    }
    if (enableTags.empty()) {
        return true;
    }
    return std::any_of(tags.begin(), tags.end(), [this](std::string const& tag) {
        return enableTags.contains(tag);
    });
}

std::mutex TaggedLogger::outputMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger(LogFilter filter, std::ostream& sink)
    : filter_{std::move(filter)}
    , sink_{sink}
    , enabled_{filter_.enabled} {
    worker_ = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard const lock{mutex_};
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::flush() -> void {
    std::unique_lock lock{mutex_};
    idle_.wait(lock, [this] { return pending_ == 0; });
}

auto TaggedLogger::enqueue(Entry entry) -> void {
    {
        std::lock_guard const lock{mutex_};
        queue_.push(std::move(entry));
        ++pending_;
    }
    wake_.notify_one();
}

// Remaining messages are written before the worker exits.
auto TaggedLogger::drain() -> void {
    std::unique_lock lock{mutex_};
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        auto entry = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        write(entry);
        lock.lock();
        if (--pending_ == 0) {
            idle_.notify_all();
        }
    }
}

auto TaggedLogger::write(Entry const& entry) -> void {
    auto const line = format_entry(entry);
    std::lock_guard const lock{outputMutex};
    sink_ << line << std::flush;
}

} // namespace IV
#endif // IV_LOG_DEBUG
