#include "insert_size.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace eccflow {

const AlignmentRecord* MateBuffer::offer(const AlignmentRecord& record) {
    switch (record.mate_role) {
        case MateRole::kFirst:
            if (state_ == State::kHoldingFirst && !first_paired_) {
                ++discarded_firsts_;
            }
            first_ = record;
            first_paired_ = false;
            state_ = State::kHoldingFirst;
            return nullptr;

        case MateRole::kSecond:
            if (state_ == State::kHoldingFirst && record.query_name == first_.query_name) {
                first_paired_ = true;
                return &first_;
            }
            ++orphan_seconds_;
            return nullptr;

        default:
            return nullptr;
    }
}

bool accept_read_pair(
    const AlignmentRecord& first,
    const AlignmentRecord& second,
    int32_t mapq_cutoff) {
    if (first.mapping_quality < mapq_cutoff || second.mapping_quality < mapq_cutoff) {
        return false;
    }
    if (!first.is_proper_pair) {
        return false;
    }
    if (is_hard_clipped(first) || is_hard_clipped(second)) {
        return false;
    }
    if (is_soft_clipped(first) || is_soft_clipped(second)) {
        return false;
    }
    // FR orientation.
    if (first.is_reverse || !second.is_reverse) {
        return false;
    }
    return first.template_length > 0;
}

InsertSizeStats summarize_insert_sizes(const std::vector<int64_t>& sample) {
    if (sample.empty()) {
        throw EmptySampleError("insert size sample is empty: no read pair passed the filters");
    }

    InsertSizeStats stats;
    stats.sample_count = sample.size();

    const double n = static_cast<double>(sample.size());
    double sum = 0.0;
    for (const int64_t v : sample) {
        sum += static_cast<double>(v);
    }
    stats.mean = sum / n;

    double sq = 0.0;
    for (const int64_t v : sample) {
        const double d = static_cast<double>(v) - stats.mean;
        sq += d * d;
    }
    stats.stddev = std::sqrt(sq / n);
    return stats;
}

InsertSizeEstimator::InsertSizeEstimator(InsertSizeConfig config)
    : config_(std::move(config)) {
    if (config_.sample_size == 0) {
        throw std::invalid_argument("insert size sample_size must be positive");
    }
    if (config_.mapq_cutoff < 0) {
        throw std::invalid_argument("insert size mapq_cutoff must be non-negative");
    }
}

InsertSizeStats InsertSizeEstimator::estimate(AlignmentRecordSource& source) const {
    std::vector<int64_t> sample;
    return estimate(source, sample);
}

InsertSizeStats InsertSizeEstimator::estimate(
    AlignmentRecordSource& source,
    std::vector<int64_t>& sample) const {
    if (!source.is_valid()) {
        throw std::runtime_error("alignment source is not valid: " + source.path());
    }

    sample.clear();
    sample.reserve(std::min<size_t>(config_.sample_size, 1u << 20));

    MateBuffer buffer;
    int64_t pairs_evaluated = 0;
    int64_t malformed = 0;

    const auto on_record = [&](const AlignmentRecord& record) {
        if (!record.cigar_valid) {
            ++malformed;
            return true;
        }

        const AlignmentRecord* first = buffer.offer(record);
        if (first == nullptr) {
            return true;
        }

        ++pairs_evaluated;
        if (accept_read_pair(*first, record, config_.mapq_cutoff)) {
            sample.push_back(first->template_length);
        }
        return sample.size() < config_.sample_size;
    };

    const auto on_progress = [&sample](int64_t processed) {
        std::cerr << "[InsertSize] scanned=" << processed
                  << " accepted=" << sample.size() << '\n';
        return true;
    };

    const int64_t scanned = source.stream(on_record, on_progress, config_.progress_interval);
    if (scanned < 0) {
        throw std::runtime_error("failed while reading alignments from " + source.path());
    }

    InsertSizeStats stats = summarize_insert_sizes(sample);
    stats.requested_sample_size = config_.sample_size;
    stats.quota_reached = sample.size() >= config_.sample_size;
    stats.records_scanned = scanned;
    stats.pairs_evaluated = pairs_evaluated;
    stats.malformed_records = malformed;

    if (malformed > 0) {
        std::cerr << "[InsertSize] skipped " << malformed
                  << " records with an unusable CIGAR\n";
    }
    if (!stats.quota_reached) {
        std::cerr << "[InsertSize] warning: only " << stats.sample_count << " of "
                  << config_.sample_size << " requested pairs passed the filters in "
                  << source.path() << '\n';
    }

    std::ostringstream line;
    line << std::fixed << std::setprecision(2)
         << "[InsertSize] mean=" << stats.mean << " std=" << stats.stddev
         << " n=" << stats.sample_count;
    std::cerr << line.str() << '\n';

    return stats;
}

}  // namespace eccflow
