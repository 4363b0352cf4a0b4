#ifdef TS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace TS {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
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

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::string_view commaSeparated) -> void {
    std::set<std::string> parsed;
    while (!commaSeparated.empty()) {
        auto const comma = commaSeparated.find(',');
        auto       token = commaSeparated.substr(0, comma);
        if (!token.empty()) {
            parsed.emplace(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        commaSeparated.remove_prefix(comma + 1);
    }
    std::lock_guard<std::mutex> lock(tagsMutex);
    enabledTags = std::move(parsed);
    // An explicit selection overrides the default skip list.
    if (!enabledTags.empty()) {
        skipTags.clear();
    }
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->messageQueue.empty() && !this->writing; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->drained.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            this->writing = true;
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
            this->writing = false;
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

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    {
        std::lock_guard<std::mutex> lock(tagsMutex);
        if (!this->enabledTags.empty()) {
            bool matched = false;
            for (auto const& tag : msg.tags)
                if (this->enabledTags.contains(tag))
                    matched = true;
            if (!matched)
                return;
        }
        for (auto const& skipTag : this->skipTags)
            if (msg.tags.contains(skipTag))
                return;
    }
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";

    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
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

} // namespace TS
#endif // TS_LOG_DEBUG
