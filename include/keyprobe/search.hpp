#ifndef KEYPROBE_SEARCH_HPP
#define KEYPROBE_SEARCH_HPP

#include <memory>
#include <string>
#include "keyprobe/config.hpp"
#include "keyprobe/console.hpp"
#include "keyprobe/lookup_client.hpp"
#include "keyprobe/verifier.hpp"

namespace keyprobe {

// One full run over a checksum report: parse the report, open the failure
// log beside it, verify every checksum and print the result.
//
// The report is parsed before the failure log is opened, so a missing report
// (FileNotFoundError) leaves no failed log behind. An empty report prints a
// notice and returns an Exhausted outcome with total 0. The failure log is
// closed before the result is printed.
Outcome run_search(
    const Config& config,
    const std::string& report_path,
    std::shared_ptr<LookupClient> lookup_client,
    ConsoleReporter& reporter);

} // namespace keyprobe

#endif // KEYPROBE_SEARCH_HPP
