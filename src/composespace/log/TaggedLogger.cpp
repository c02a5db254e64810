#ifdef CS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace CS {

std::mutex TaggedLogger::coutMutex;

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(true), nextThreadNumber(0) {
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
    const auto threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            if (!this->shouldSkip(msg)) {
                this->writeToStderr(msg);
            }
            lock.lock();
        }
    }
}

auto TaggedLogger::shouldSkip(const LogMessage& msg) const -> bool {
    for (auto const& tag : msg.tags) {
        if (this->skipTags.contains(tag)) {
            return true;
        }
    }
    return false;
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
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
    oss << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << ' ';
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    std::filesystem::path path(filepath);
    auto                  parent = path.parent_path().filename();
    if (parent.empty()) {
        return path.filename().string();
    }
    return (parent / path.filename()).string();
}

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace CS
#endif // CS_LOG_DEBUG
