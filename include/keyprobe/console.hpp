#ifndef KEYPROBE_CONSOLE_HPP
#define KEYPROBE_CONSOLE_HPP

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include "keyprobe/verifier.hpp"

namespace keyprobe {

// Human-facing output of a run. The verifier never prints; run_search wires
// progress() in as its progress callback.
class ConsoleReporter {
public:
    explicit ConsoleReporter(std::ostream& out);

    // Asks for the report path on `in`. Throws InvalidArgumentError when
    // the input ends or the answer is blank.
    std::string prompt_report_path(std::istream& in);

    void announce_files(const std::string& report_path, const std::string& failed_log_path);
    void announce_start(std::size_t total);
    void announce_empty();

    // Rewrites the current line in place
    void progress(std::size_t processed, std::size_t total);

    // Moves off a pending progress line so other output starts on its own line
    void end_progress_line();

    void report(const Outcome& outcome, double elapsed_seconds);

    static std::string format_progress(std::size_t processed, std::size_t total);
    static std::string format_elapsed(double elapsed_seconds);

private:
    std::ostream& out_;
    bool progress_shown_;
};

} // namespace keyprobe

#endif // KEYPROBE_CONSOLE_HPP
