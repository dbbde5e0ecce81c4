#ifndef ECCFLOW_INSERT_SIZE_H
#define ECCFLOW_INSERT_SIZE_H

#include "alignment_record.h"
#include "alignment_source.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace eccflow {

struct InsertSizeConfig {
    size_t sample_size = 100000;
    int32_t mapq_cutoff = 60;
    int64_t progress_interval = 1000000;
};

struct InsertSizeStats {
    double mean = 0.0;
    double stddev = 0.0;  // population standard deviation (divide by N)

    size_t sample_count = 0;
    size_t requested_sample_size = 0;
    bool quota_reached = false;

    int64_t records_scanned = 0;
    int64_t pairs_evaluated = 0;
    int64_t malformed_records = 0;
};

// Thrown when not a single read pair passed the acceptance filter.
class EmptySampleError : public std::runtime_error {
public:
    explicit EmptySampleError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * MateBuffer: single-slot pairing state machine for name-sorted input.
 *
 *   Empty        --first-->            HoldingFirst(first)
 *   HoldingFirst --first-->            HoldingFirst(new first), old one dropped
 *   HoldingFirst --second, same name-> pair emitted, stays HoldingFirst
 *   any          --second, no match--> unchanged, second dropped
 *
 * Out-of-order input silently loses pairs.
 */
class MateBuffer {
public:
    enum class State : uint8_t {
        kEmpty = 0,
        kHoldingFirst = 1
    };

    // Returns the buffered first mate when `record` completes a pair,
    // nullptr otherwise. The pointer stays valid until the next offer().
    const AlignmentRecord* offer(const AlignmentRecord& record);

    State state() const { return state_; }
    int64_t discarded_firsts() const { return discarded_firsts_; }
    int64_t orphan_seconds() const { return orphan_seconds_; }

private:
    State state_ = State::kEmpty;
    AlignmentRecord first_;
    bool first_paired_ = false;
    int64_t discarded_firsts_ = 0;
    int64_t orphan_seconds_ = 0;
};

// All six conditions: both MAPQ >= cutoff, first mate properly paired,
// no hard or soft clips on either mate, FR orientation, first TLEN > 0.
bool accept_read_pair(
    const AlignmentRecord& first,
    const AlignmentRecord& second,
    int32_t mapq_cutoff);

// Mean and population standard deviation; throws EmptySampleError on an
// empty sample.
InsertSizeStats summarize_insert_sizes(const std::vector<int64_t>& sample);

class InsertSizeEstimator final {
public:
    explicit InsertSizeEstimator(InsertSizeConfig config);

    InsertSizeStats estimate(AlignmentRecordSource& source) const;

    // Same scan, but also hands back the accepted template lengths.
    InsertSizeStats estimate(
        AlignmentRecordSource& source,
        std::vector<int64_t>& sample) const;

    const InsertSizeConfig& config() const { return config_; }

private:
    InsertSizeConfig config_;
};

}  // namespace eccflow

#endif  // ECCFLOW_INSERT_SIZE_H
