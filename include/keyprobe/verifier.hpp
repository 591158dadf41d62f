#ifndef KEYPROBE_VERIFIER_HPP
#define KEYPROBE_VERIFIER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/json.hpp>
#include "keyprobe/failure_sink.hpp"
#include "keyprobe/lookup_client.hpp"

namespace keyprobe {

enum class MatchDecision {
    TransientFailure,
    NoMatch,
    Match
};

const char* to_string(MatchDecision decision);

// Match only when both lookups succeeded and carry the same non-empty key.
// Keys compare as exact byte strings.
MatchDecision decide(const LookupResult& first, const LookupResult& second);

struct Outcome {
    enum class Kind {
        MatchFound,
        Exhausted
    };

    Kind kind = Kind::Exhausted;
    // Set for MatchFound: the matching checksum and the first lookup's payload
    std::string checksum;
    boost::json::value payload;

    std::size_t processed = 0;
    std::size_t total = 0;

    bool matched() const { return kind == Kind::MatchFound; }
};

using ProgressCallback = std::function<void(std::size_t processed, std::size_t total)>;

// Submits each checksum twice, in order, one request at a time, and stops at
// the first checksum whose two lookups agree on a key. Failed lookups are
// written to the failure sink and the run moves on; nothing is retried.
class Verifier {
public:
    Verifier(std::shared_ptr<LookupClient> lookup_client, std::shared_ptr<FailureSink> failure_sink);
    virtual ~Verifier() = default;

    void set_progress_callback(ProgressCallback callback);

    Outcome run(const std::vector<std::string>& checksums);

private:
    std::shared_ptr<LookupClient> lookup_client_;
    std::shared_ptr<FailureSink> failure_sink_;
    ProgressCallback progress_callback_;

    void record_failure(const std::string& checksum, int attempt);
    void advance(std::size_t& processed, std::size_t total);
};

} // namespace keyprobe

#endif // KEYPROBE_VERIFIER_HPP
