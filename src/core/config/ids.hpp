#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <sstream>
#include <string>

namespace hive::core::config {

    // Generates a 12-character hex id with the given prefix, e.g. "task-3f09a1c2b7e4"
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Stable id derived from text (same input, same id across runs)
    inline std::string stable_id(const std::string& prefix, const std::string& text) {
        // FNV-1a, 64 bit
        std::uint64_t hash = 1469598103934665603ULL;
        for (const unsigned char c : text) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        std::stringstream ss;
        ss << prefix << "-" << std::hex << hash;
        return ss.str();
    }

    using SystemTime = std::chrono::system_clock::time_point;

    // Injectable wall clock
    using Clock = std::function<SystemTime()>;

    inline Clock system_clock() {
        return [] { return std::chrono::system_clock::now(); };
    }

    inline std::int64_t to_unix_ms(const SystemTime time) {
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                time.time_since_epoch())
                .count());
    }

} // namespace hive::core::config
