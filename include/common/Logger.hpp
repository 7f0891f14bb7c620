#pragma once

#include "common/RingBuffer.hpp"
#include "common/Utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace phoenix {

    enum class LogLevel : uint8_t {
        INFO,
        WARNING,
        ERROR,
        DEBUG
    };

    struct LogEntry {
        uint64_t timestamp; // ns since epoch
        LogLevel level;
        char message[160];
    };

    // Function: AsyncLogger
    // Description: Process-wide logger. Callers format into a fixed entry and push it
    //              to a ring; a writer thread drains it to a file (or stderr when no
    //              file name is given). Entries pushed before start() are kept until
    //              the ring fills, then dropped and counted.
    class AsyncLogger {
    public:
        static AsyncLogger& instance() {
            static AsyncLogger instance;
            return instance;
        }

        void start(const std::string& filename = "") {
            if (running_.exchange(true)) return;
            filename_ = filename;
            thread_ = std::thread(&AsyncLogger::run, this);
        }

        void stop() {
            running_ = false;
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        template<typename... Args>
        void log(LogLevel level, const char* fmt, Args... args) {
            LogEntry entry;
            entry.timestamp = utils::now_ns();
            entry.level = level;
            std::snprintf(entry.message, sizeof(entry.message), fmt, args...);
            enqueue(entry);
        }

        // Overload for no args to fix -Wformat-security
        void log(LogLevel level, const char* msg) {
            LogEntry entry;
            entry.timestamp = utils::now_ns();
            entry.level = level;
            std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
            entry.message[sizeof(entry.message) - 1] = '\0';
            enqueue(entry);
        }

        uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    private:
        AsyncLogger() = default;
        ~AsyncLogger() { stop(); }

        void enqueue(const LogEntry& entry) {
            if (!buffer_.push(entry)) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        void run() {
            std::ofstream file;
            if (!filename_.empty()) {
                file.open(filename_, std::ios::out | std::ios::app);
                if (!file.is_open()) {
                    std::cerr << "[Logger] Cannot open " << filename_ << ", writing to stderr" << std::endl;
                }
            }
            std::ostream& out = file.is_open() ? static_cast<std::ostream&>(file) : std::cerr;

            LogEntry entry;
            while (running_ || !buffer_.empty()) {
                if (buffer_.pop(entry)) {
                    // Format: [Timestamp] [Level] Message
                    out << entry.timestamp << " ";
                    switch (entry.level) {
                        case LogLevel::INFO: out << "[INFO] "; break;
                        case LogLevel::WARNING: out << "[WARN] "; break;
                        case LogLevel::ERROR: out << "[ERROR] "; break;
                        case LogLevel::DEBUG: out << "[DEBUG] "; break;
                    }
                    out << entry.message << "\n";
                } else {
                    out.flush();
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
            out.flush();
        }

        RingBuffer<LogEntry, 4096> buffer_;
        std::atomic<bool> running_{false};
        std::atomic<uint64_t> dropped_{0};
        std::thread thread_;
        std::string filename_;
    };

}

// Macro for easy usage
#define LOG_INFO(fmt, ...) phoenix::AsyncLogger::instance().log(phoenix::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) phoenix::AsyncLogger::instance().log(phoenix::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) phoenix::AsyncLogger::instance().log(phoenix::LogLevel::ERROR, fmt, ##__VA_ARGS__)
