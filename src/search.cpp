#include "keyprobe/search.hpp"
#include "keyprobe/checksum_source.hpp"
#include "keyprobe/failure_sink.hpp"
#include "keyprobe/logging.hpp"
#include "keyprobe/metrics.hpp"
#include <utility>

namespace keyprobe {

namespace {

// Log lines end the in-place progress line first; removed on scope exit
class ProgressLineGuard {
public:
    explicit ProgressLineGuard(ConsoleReporter& reporter) {
        Logger::getInstance().set_console_interrupt([&reporter] { reporter.end_progress_line(); });
    }

    ~ProgressLineGuard() {
        Logger::getInstance().set_console_interrupt(nullptr);
    }

    ProgressLineGuard(const ProgressLineGuard&) = delete;
    ProgressLineGuard& operator=(const ProgressLineGuard&) = delete;
};

} // namespace

Outcome run_search(
    const Config& config,
    const std::string& report_path,
    std::shared_ptr<LookupClient> lookup_client,
    ConsoleReporter& reporter) {

    std::string failed_path = failure_log_path(report_path, config.failed_log);
    reporter.announce_files(report_path, failed_path);

    auto checksums = load_checksums(report_path);
    auto failure_sink = std::make_shared<FileFailureSink>(failed_path);

    if (checksums.empty()) {
        reporter.announce_empty();
        failure_sink->close();
        return Outcome{};
    }

    reporter.announce_start(checksums.size());

    ProgressLineGuard guard(reporter);

    Verifier verifier(std::move(lookup_client), failure_sink);
    verifier.set_progress_callback([&reporter](std::size_t processed, std::size_t total) {
        reporter.progress(processed, total);
    });

    Metrics::Timer timer(METRIC_RUN_SECONDS);
    Outcome outcome = verifier.run(checksums);
    double elapsed = timer.stop();

    failure_sink->close();
    reporter.report(outcome, elapsed);

    LOG_INFO("Run finished: " + Metrics::getInstance().summary());
    return outcome;
}

} // namespace keyprobe
