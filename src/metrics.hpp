#pragma once

#ifndef __METRICS_HPP
#define __METRICS_HPP

#include <map>
#include <mutex>
#include <string>

#include <log.hpp>

namespace metrics {

// named gauges rendered in the Prometheus text exposition format
class gauges_t {
public:
    void declare(std::string const& name, std::string const& help) {
        std::lock_guard<std::mutex> lock(mutex);
        gauges[name].help = help;
    }

    void set(std::string const& name, double value) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = gauges.find(name);
        if (it == gauges.end()) {
            LOG_WARNING_FMT( "metrics: undeclared gauge {}", name );
            return;
        }
        it->second.value = value;
    }

    double get(std::string const& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = gauges.find(name);
        return it != gauges.end() ? it->second.value : 0.0;
    }

    std::string render() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::string out;
        for (auto const& [name, gauge] : gauges) {
            out += fmt::format("# HELP {} {}\n", name, gauge.help);
            out += fmt::format("# TYPE {} gauge\n", name);
            out += fmt::format("{} {}\n", name, gauge.value);
        }
        return out;
    }

private:
    struct gauge_t {
        std::string help;
        double value{ 0.0 };
    };

    mutable std::mutex mutex;
    std::map<std::string, gauge_t> gauges;
};

inline constexpr const char* client_fps{ "rtcgw_client_fps" };
inline constexpr const char* client_latency{ "rtcgw_client_latency_ms" };
inline constexpr const char* cpu_percent{ "rtcgw_cpu_percent" };
inline constexpr const char* mem_used{ "rtcgw_mem_used_bytes" };

inline void declare_defaults(gauges_t& gauges) {
    gauges.declare(client_fps, "frames per second reported by the viewer");
    gauges.declare(client_latency, "latency in milliseconds reported by the viewer");
    gauges.declare(cpu_percent, "host CPU utilization in percent");
    gauges.declare(mem_used, "host memory in use in bytes");
}

} // namespace metrics

#endif // #ifndef __METRICS_HPP
