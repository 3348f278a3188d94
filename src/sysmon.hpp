#pragma once

#ifndef __SYSMON_HPP
#define __SYSMON_HPP

#include <mutex>
#include <chrono>
#include <thread>
#include <string>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <optional>
#include <functional>
#include <condition_variable>

#include <log.hpp>

namespace sysmon {

struct cpu_times_t {
    std::uint64_t idle{ 0 };
    std::uint64_t total{ 0 };
};

// aggregate "cpu" line of /proc/stat
inline std::optional<cpu_times_t> read_cpu_times(std::string const& path = "/proc/stat") {
    std::ifstream file(path);
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        LOG_WARNING_FMT( "sysmon: can't read {}", path );
        return std::nullopt;
    }
    std::istringstream in(line);
    std::string label;
    in >> label;
    if (label != "cpu")
        return std::nullopt;
    cpu_times_t times;
    std::uint64_t value{ 0 };
    for (int i = 0; in >> value; ++i) {
        times.total += value;
        if (i == 3 || i == 4)  // idle, iowait
            times.idle += value;
    }
    return times;
}

inline double cpu_percent(cpu_times_t const& prev, cpu_times_t const& curr) {
    if (curr.total <= prev.total)
        return 0.0;
    double const total{ static_cast<double>(curr.total - prev.total) };
    double const idle{ static_cast<double>(curr.idle >= prev.idle ? curr.idle - prev.idle : 0) };
    return 100.0 * (total - idle) / total;
}

struct mem_info_t {
    std::uint64_t total{ 0 };       // bytes
    std::uint64_t available{ 0 };   // bytes
    std::uint64_t used() const { return total > available ? total - available : 0; }
};

inline std::optional<mem_info_t> read_meminfo(std::string const& path = "/proc/meminfo") {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARNING_FMT( "sysmon: can't read {}", path );
        return std::nullopt;
    }
    mem_info_t info;
    bool has_total{ false }, has_available{ false };
    std::string key;
    std::uint64_t kb{ 0 };
    std::string unit;
    while (file >> key >> kb) {
        std::getline(file, unit);
        if (key == "MemTotal:") {
            info.total = kb * 1024;
            has_total = true;
        } else if (key == "MemAvailable:") {
            info.available = kb * 1024;
            has_available = true;
        }
    }
    if (!has_total || !has_available)
        return std::nullopt;
    return info;
}

struct stats_t {
    double cpu_percent{ 0.0 };
    std::uint64_t mem_total{ 0 };
    std::uint64_t mem_used{ 0 };
};

// samples cpu and memory every period on its own thread
class system_monitor {
public:
    explicit system_monitor(std::chrono::seconds period) : period(period) {}
    ~system_monitor() { stop(); }

    system_monitor(const system_monitor&) = delete;
    system_monitor& operator=(const system_monitor&) = delete;

    void start() {
        if (worker.joinable())
            return;
        running = true;
        worker = std::thread([this]() { run(); });
        LOG_INFO_FMT( "sysmon: started, period {}s", period.count() );
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            running = false;
        }
        cv.notify_all();
        if (worker.joinable()) {
            worker.join();
            LOG_INFO_FMT( "sysmon: stopped" );
        }
    }

    // called on the worker thread
    std::function<void(stats_t const&)> on_stats;

    std::string stat_path{ "/proc/stat" };
    std::string meminfo_path{ "/proc/meminfo" };

private:
    void run() {
        auto prev{ read_cpu_times(stat_path) };
        std::unique_lock<std::mutex> lock(mutex);
        while (running) {
            if (cv.wait_for(lock, period, [this]() { return !running; }))
                break;
            lock.unlock();
            sample(prev);
            lock.lock();
        }
    }

    void sample(std::optional<cpu_times_t>& prev) {
        stats_t stats;
        auto const curr{ read_cpu_times(stat_path) };
        if (prev && curr)
            stats.cpu_percent = cpu_percent(*prev, *curr);
        prev = curr;
        if (auto const mem{ read_meminfo(meminfo_path) }) {
            stats.mem_total = mem->total;
            stats.mem_used = mem->used();
        }
        if (on_stats)
            on_stats(stats);
    }

    std::chrono::seconds period;
    std::thread worker;
    std::mutex mutex;
    std::condition_variable cv;
    bool running{ false };
};

} // namespace sysmon

#endif // #ifndef __SYSMON_HPP
