/**
 * Codeveil - Source Code Veiling Codecs
 *
 * statistics.hpp - Counters and timings collected across codec calls
 *
 * Keys are "<method>.<counter>" (e.g. "lana-vortex.fragments") so the
 * report can group them per codec. Timings end in "_time" and are kept
 * in milliseconds.
 */

#ifndef CODEVEIL_STATISTICS_HPP
#define CODEVEIL_STATISTICS_HPP

#include "../common/json_parser.hpp"

#include <string>
#include <map>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace codeveil {

class Timer {
public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    void stop() {
        if (running_) {
            end_time_ = std::chrono::steady_clock::now();
            running_ = false;
        }
    }

    double elapsedMs() const {
        auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_time_);
        return duration.count() / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_ = false;
};

/**
 * Adds the scope's duration to target on destruction, also when the
 * scope is left by an exception
 */
class ScopedTimer {
public:
    explicit ScopedTimer(double& target) : target_(target) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
        target_ += timer_.elapsedMs();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Timer timer_;
    double& target_;
};

class Statistics {
public:
    void set(const std::string& name, int value) {
        int_stats_[name] = value;
    }

    void set(const std::string& name, double value) {
        double_stats_[name] = value;
    }

    void increment(const std::string& name, int amount = 1) {
        int_stats_[name] += amount;
    }

    void add(const std::string& name, double amount) {
        double_stats_[name] += amount;
    }

    /**
     * Fold one call's counters in under a prefix
     */
    void mergeCounters(const std::string& prefix, const std::map<std::string, int>& counters) {
        for (const auto& [name, value] : counters) {
            int_stats_[prefix + "." + name] += value;
        }
    }

    int getInt(const std::string& name) const {
        auto it = int_stats_.find(name);
        return it != int_stats_.end() ? it->second : 0;
    }

    double getDouble(const std::string& name) const {
        auto it = double_stats_.find(name);
        return it != double_stats_.end() ? it->second : 0.0;
    }

    bool has(const std::string& name) const {
        return int_stats_.count(name) > 0 || double_stats_.count(name) > 0;
    }

    bool empty() const {
        return int_stats_.empty() && double_stats_.empty();
    }

    const std::map<std::string, int>& getIntStats() const { return int_stats_; }
    const std::map<std::string, double>& getDoubleStats() const { return double_stats_; }

    void merge(const Statistics& other) {
        for (const auto& [name, value] : other.int_stats_) {
            int_stats_[name] += value;
        }
        for (const auto& [name, value] : other.double_stats_) {
            double_stats_[name] += value;
        }
    }

    void clear() {
        int_stats_.clear();
        double_stats_.clear();
    }

    /**
     * Plain text report grouped by the key prefix
     */
    std::string format() const {
        std::ostringstream oss;
        oss << "=== Codeveil Statistics ===" << std::endl;

        std::string current_group;
        for (const auto& [name, value] : int_stats_) {
            size_t dot = name.find('.');
            std::string group = dot == std::string::npos ? "general" : name.substr(0, dot);
            std::string short_name = dot == std::string::npos ? name : name.substr(dot + 1);

            if (group != current_group) {
                oss << std::endl << "[" << group << "]" << std::endl;
                current_group = group;
            }
            oss << "  " << std::setw(28) << std::left << short_name
                << ": " << value << std::endl;
        }

        if (!double_stats_.empty()) {
            oss << std::endl << "[timing]" << std::endl;
            for (const auto& [name, value] : double_stats_) {
                oss << "  " << std::setw(28) << std::left << name
                    << ": " << std::fixed << std::setprecision(2)
                    << value << " ms" << std::endl;
            }
        }

        oss << "===========================" << std::endl;
        return oss.str();
    }

    std::string toJson() const {
        JsonValue root = JsonValue::object();
        for (const auto& [name, value] : int_stats_) {
            root.set(name, JsonValue(value));
        }
        for (const auto& [name, value] : double_stats_) {
            root.set(name, JsonValue(value));
        }
        return JsonSerializer::serialize(root, true) + "\n";
    }

private:
    std::map<std::string, int> int_stats_;
    std::map<std::string, double> double_stats_;
};

} // namespace codeveil

#endif // CODEVEIL_STATISTICS_HPP
