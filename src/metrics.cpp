#include "keyprobe/metrics.hpp"
#include <iomanip>
#include <map>
#include <mutex>
#include <numeric>
#include <sstream>
#include <vector>

namespace keyprobe {

class Metrics::Impl {
public:
    std::map<std::string, int64_t> counters;
    std::map<std::string, std::vector<double>> histograms;
    mutable std::mutex metrics_mutex;
};

Metrics::Metrics() : pImpl(std::make_unique<Impl>()) {}

Metrics::~Metrics() = default;

Metrics& Metrics::getInstance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment_counter(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters[name] += value;
}

int64_t Metrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->counters.find(name);
    return it == pImpl->counters.end() ? 0 : it->second;
}

void Metrics::record_histogram(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->histograms[name].push_back(value);
}

double Metrics::histogram_sum(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->histograms.find(name);
    if (it == pImpl->histograms.end()) {
        return 0.0;
    }
    return std::accumulate(it->second.begin(), it->second.end(), 0.0);
}

std::size_t Metrics::histogram_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->histograms.find(name);
    return it == pImpl->histograms.end() ? 0 : it->second.size();
}

std::string Metrics::summary() const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);

    std::ostringstream out;
    bool first = true;
    for (const auto& [name, value] : pImpl->counters) {
        out << (first ? "" : " ") << name << "=" << value;
        first = false;
    }
    for (const auto& [name, values] : pImpl->histograms) {
        double sum = std::accumulate(values.begin(), values.end(), 0.0);
        out << (first ? "" : " ") << name << "=" << std::fixed << std::setprecision(3) << sum;
        first = false;
    }
    return out.str();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters.clear();
    pImpl->histograms.clear();
}

Metrics::Timer::Timer(const std::string& name)
    : name_(name),
      start_(std::chrono::steady_clock::now()),
      elapsed_(0.0),
      stopped_(false) {}

Metrics::Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

double Metrics::Timer::stop() {
    if (!stopped_) {
        elapsed_ = elapsed_seconds();
        stopped_ = true;
        Metrics::getInstance().record_histogram(name_, elapsed_);
    }
    return elapsed_;
}

double Metrics::Timer::elapsed_seconds() const {
    if (stopped_) {
        return elapsed_;
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    return elapsed.count();
}

} // namespace keyprobe
