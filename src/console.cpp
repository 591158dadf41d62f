#include "keyprobe/console.hpp"
#include "keyprobe/checksum_source.hpp"
#include "keyprobe/error.hpp"
#include <boost/json.hpp>
#include <iomanip>
#include <sstream>

namespace keyprobe {

ConsoleReporter::ConsoleReporter(std::ostream& out)
    : out_(out),
      progress_shown_(false) {}

std::string ConsoleReporter::prompt_report_path(std::istream& in) {
    out_ << "Enter the full path to the checksum report file (e.g., ./checksum_report.txt): " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        throw InvalidArgumentError("No checksum report path was entered", "prompt_report_path");
    }

    answer = trim(answer);
    if (answer.empty()) {
        throw InvalidArgumentError("No checksum report path was entered", "prompt_report_path");
    }
    return answer;
}

void ConsoleReporter::announce_files(const std::string& report_path, const std::string& failed_log_path) {
    out_ << "Reading checksums from: '" << report_path << "'..." << std::endl;
    out_ << "Failed checksums will be logged to: '" << failed_log_path << "'" << std::endl;
}

void ConsoleReporter::announce_start(std::size_t total) {
    out_ << "Found " << total << " checksums to process." << std::endl;
    out_ << "Starting search..." << std::endl;
}

void ConsoleReporter::announce_empty() {
    out_ << "No checksums found in the specified file." << std::endl;
}

std::string ConsoleReporter::format_progress(std::size_t processed, std::size_t total) {
    double percentage = total == 0 ? 0.0 : static_cast<double>(processed) * 100.0 / static_cast<double>(total);

    std::ostringstream line;
    line << "Progress: " << processed << "/" << total << " checksums checked ("
         << std::fixed << std::setprecision(2) << percentage << "%)";
    return line.str();
}

std::string ConsoleReporter::format_elapsed(double elapsed_seconds) {
    std::ostringstream line;
    line << "Total Execution Time: " << std::fixed << std::setprecision(3) << elapsed_seconds << "s";
    return line.str();
}

void ConsoleReporter::progress(std::size_t processed, std::size_t total) {
    out_ << '\r' << format_progress(processed, total) << std::flush;
    progress_shown_ = true;
}

void ConsoleReporter::end_progress_line() {
    if (progress_shown_) {
        out_ << '\n' << std::flush;
        progress_shown_ = false;
    }
}

void ConsoleReporter::report(const Outcome& outcome, double elapsed_seconds) {
    end_progress_line();
    out_ << format_elapsed(elapsed_seconds) << '\n';

    if (outcome.matched()) {
        out_ << "\U0001F389 Match Found! \U0001F389" << '\n'
             << "------------------------------------" << '\n'
             << "Checksum: " << outcome.checksum << '\n'
             << "Result: " << boost::json::serialize(outcome.payload) << '\n'
             << "------------------------------------" << std::endl;
    } else {
        out_ << "Search complete. No matching key was found." << std::endl;
    }
}

} // namespace keyprobe
