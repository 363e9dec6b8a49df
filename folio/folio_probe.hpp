// folio_probe.hpp - Bounded Probe Search
//
// Binary search for the largest integer in [low, high] accepted by an
// external predicate that is assumed, but not trusted, to be monotonic
// (accepted values form a prefix of the range). The number of probes is
// capped so a faulty predicate can never loop forever; a probe that fails
// to answer is treated like a rejection.

#ifndef FOLIO_PROBE_HPP
#define FOLIO_PROBE_HPP

#include <cstdint>

namespace folio {

enum class ProbeVerdict : uint8_t {
    Accept,     // value fits
    Reject,     // value goes too far
    Failed,     // predicate could not answer
};

struct ProbeSearchResult {
    bool found;
    int value;          // largest accepted value, valid when found
    int probes;         // predicate invocations
    int failures;       // probes that returned Failed
    bool capped;        // stopped by the probe cap with range left
};

template <typename Probe>
ProbeSearchResult bounded_probe_search(int low, int high, int max_probes, Probe&& probe) {
    ProbeSearchResult result = {};
    while (low <= high) {
        if (result.probes >= max_probes) {
            result.capped = true;
            break;
        }
        result.probes++;

        int mid = low + (high - low) / 2;
        ProbeVerdict verdict = probe(mid);
        if (verdict == ProbeVerdict::Accept) {
            result.found = true;
            result.value = mid;
            low = mid + 1;
        } else {
            if (verdict == ProbeVerdict::Failed) result.failures++;
            high = mid - 1;
        }
    }
    return result;
}

} // namespace folio

#endif // FOLIO_PROBE_HPP
