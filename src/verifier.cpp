#include "keyprobe/verifier.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include "keyprobe/metrics.hpp"
#include <utility>

namespace keyprobe {

const char* to_string(MatchDecision decision) {
    switch (decision) {
        case MatchDecision::TransientFailure: return "transient-failure";
        case MatchDecision::NoMatch: return "no-match";
        case MatchDecision::Match: return "match";
    }
    return "unknown";
}

MatchDecision decide(const LookupResult& first, const LookupResult& second) {
    if (!first || !second) {
        return MatchDecision::TransientFailure;
    }

    const auto& key1 = first->key;
    const auto& key2 = second->key;
    if (key1 && key2 && !key1->empty() && *key1 == *key2) {
        return MatchDecision::Match;
    }
    return MatchDecision::NoMatch;
}

Verifier::Verifier(std::shared_ptr<LookupClient> lookup_client, std::shared_ptr<FailureSink> failure_sink)
    : lookup_client_(std::move(lookup_client)),
      failure_sink_(std::move(failure_sink)) {
    if (!lookup_client_) {
        throw InvalidArgumentError("Null pointer: lookup_client", "Verifier");
    }
    if (!failure_sink_) {
        throw InvalidArgumentError("Null pointer: failure_sink", "Verifier");
    }
}

void Verifier::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void Verifier::record_failure(const std::string& checksum, int attempt) {
    LOG_DEBUG("Lookup " + std::to_string(attempt) + " failed for checksum " + checksum);
    failure_sink_->record(checksum);
}

void Verifier::advance(std::size_t& processed, std::size_t total) {
    ++processed;
    Metrics::getInstance().increment_counter(METRIC_TOKENS_PROCESSED);
    if (progress_callback_) {
        progress_callback_(processed, total);
    }
}

Outcome Verifier::run(const std::vector<std::string>& checksums) {
    Outcome outcome;
    outcome.total = checksums.size();

    LOG_DEBUG("Verifying " + std::to_string(outcome.total) + " checksums");

    for (const auto& checksum : checksums) {
        LookupResult first = lookup_client_->submit(checksum);
        if (!first) {
            record_failure(checksum, 1);
            advance(outcome.processed, outcome.total);
            continue;
        }

        LookupResult second = lookup_client_->submit(checksum);
        if (!second) {
            record_failure(checksum, 2);
            advance(outcome.processed, outcome.total);
            continue;
        }

        MatchDecision decision = decide(first, second);
        LOG_TRACE("Checksum " + checksum + ": " + to_string(decision));

        if (decision == MatchDecision::Match) {
            outcome.kind = Outcome::Kind::MatchFound;
            outcome.checksum = checksum;
            outcome.payload = std::move(first->payload);
            LOG_DEBUG("Match found for checksum " + checksum + " after " +
                      std::to_string(outcome.processed) + " checksums");
            return outcome;
        }

        advance(outcome.processed, outcome.total);
    }

    outcome.kind = Outcome::Kind::Exhausted;
    LOG_DEBUG("No match among " + std::to_string(outcome.total) + " checksums");
    return outcome;
}

} // namespace keyprobe
