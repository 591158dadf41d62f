#ifndef KEYPROBE_METRICS_HPP
#define KEYPROBE_METRICS_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace keyprobe {

// Counter names used across the run
constexpr const char* METRIC_LOOKUP_REQUESTS = "lookup_requests_total";
constexpr const char* METRIC_LOOKUP_FAILURES = "lookup_failures_total";
constexpr const char* METRIC_TOKENS_PROCESSED = "tokens_processed_total";
constexpr const char* METRIC_RUN_SECONDS = "run_seconds";

class Metrics {
public:
    static Metrics& getInstance();

    void increment_counter(const std::string& name, int64_t value = 1);
    int64_t counter(const std::string& name) const;

    void record_histogram(const std::string& name, double value);
    // Sum of all observations, 0 when nothing was recorded
    double histogram_sum(const std::string& name) const;
    std::size_t histogram_count(const std::string& name) const;

    // One line, "name=value" pairs sorted by name
    std::string summary() const;

    void reset();

    // Records elapsed seconds into a histogram when stopped or destroyed
    class Timer {
    public:
        explicit Timer(const std::string& name);
        ~Timer();

        double stop();
        double elapsed_seconds() const;

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_;
        double elapsed_;
        bool stopped_;
    };

private:
    Metrics();
    ~Metrics();
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace keyprobe

#endif // KEYPROBE_METRICS_HPP
