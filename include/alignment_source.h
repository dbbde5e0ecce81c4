#ifndef ECCFLOW_ALIGNMENT_SOURCE_H
#define ECCFLOW_ALIGNMENT_SOURCE_H

#include "alignment_record.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace eccflow {

// Return false to stop the stream after this record.
using RecordHandler = std::function<bool(const AlignmentRecord&)>;
using ProgressHandler = std::function<bool(int64_t processed)>;

/**
 * AlignmentRecordSource: sequential, one-pass reader over an alignment stream.
 * Records are delivered in file order; no random access.
 */
class AlignmentRecordSource {
public:
    virtual ~AlignmentRecordSource() = default;

    virtual bool is_valid() const = 0;
    virtual const std::string& path() const = 0;

    /**
     * Deliver records to `record_handler` until it returns false, the stream
     * ends, or `progress_handler` returns false.
     * @return Number of records delivered, -1 if the source is invalid or a
     *         read error interrupted the stream
     */
    virtual int64_t stream(
        const RecordHandler& record_handler,
        const ProgressHandler& progress_handler = nullptr,
        int64_t progress_interval = 1000000) = 0;
};

std::unique_ptr<AlignmentRecordSource> make_alignment_source(
    const std::string& path,
    int32_t decompression_threads = 2);

}  // namespace eccflow

#endif  // ECCFLOW_ALIGNMENT_SOURCE_H
