#include "alignment_source.h"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <htslib/sam.h>

namespace eccflow {
namespace {

struct BamRecordDeleter {
    void operator()(bam1_t* b) const {
        if (b != nullptr) {
            bam_destroy1(b);
        }
    }
};

using BamRecordPtr = std::unique_ptr<bam1_t, BamRecordDeleter>;

MateRole mate_role_from_flag(uint16_t flag) {
    if (flag & BAM_FREAD1) {
        return MateRole::kFirst;
    }
    if (flag & BAM_FREAD2) {
        return MateRole::kSecond;
    }
    return MateRole::kUnpaired;
}

// Fill `out` from an htslib record, reusing its buffers.
void decode_record(const bam1_t* b, AlignmentRecord& out) {
    const uint16_t flag = b->core.flag;

    out.query_name.assign(bam_get_qname(b));
    out.mate_role = mate_role_from_flag(flag);
    out.mapping_quality = b->core.qual;
    out.is_reverse = (flag & BAM_FREVERSE) != 0;
    out.is_proper_pair = (flag & BAM_FPROPER_PAIR) != 0;
    out.template_length = b->core.isize;

    out.cigar_ops.clear();
    out.cigar_valid = true;

    // "*" CIGAR (unmapped): valid, no ops.
    const uint32_t n_cigar = b->core.n_cigar;
    if (n_cigar == 0) {
        return;
    }

    const uint32_t* cigar = bam_get_cigar(b);
    out.cigar_ops.reserve(n_cigar);
    for (uint32_t i = 0; i < n_cigar; ++i) {
        const char op = bam_cigar_opchr(cigar[i]);
        const int32_t len = static_cast<int32_t>(bam_cigar_oplen(cigar[i]));
        if (!is_cigar_op_code(op) || len <= 0) {
            out.cigar_ops.clear();
            out.cigar_valid = false;
            return;
        }
        out.cigar_ops.emplace_back(op, len);
    }
}

class HtslibAlignmentSource final : public AlignmentRecordSource {
public:
    HtslibAlignmentSource(std::string path, int32_t decompression_threads)
        : path_(std::move(path)) {
        file_ = sam_open(path_.c_str(), "r");
        if (!file_) {
            std::cerr << "[AlignmentSource] failed to open: " << path_ << '\n';
            return;
        }

        if (decompression_threads > 1) {
            hts_set_threads(file_, decompression_threads);
        }

        header_ = sam_hdr_read(file_);
        if (!header_) {
            std::cerr << "[AlignmentSource] failed to read header: " << path_ << '\n';
            return;
        }

        valid_ = true;
    }

    ~HtslibAlignmentSource() override {
        if (header_ != nullptr) {
            sam_hdr_destroy(header_);
        }
        if (file_ != nullptr) {
            sam_close(file_);
        }
    }

    HtslibAlignmentSource(const HtslibAlignmentSource&) = delete;
    HtslibAlignmentSource& operator=(const HtslibAlignmentSource&) = delete;

    bool is_valid() const override { return valid_; }

    const std::string& path() const override { return path_; }

    int64_t stream(
        const RecordHandler& record_handler,
        const ProgressHandler& progress_handler,
        int64_t progress_interval) override {
        if (!valid_ || !record_handler) {
            return -1;
        }

        BamRecordPtr b(bam_init1());
        if (!b) {
            std::cerr << "[AlignmentSource] failed to allocate BAM record\n";
            return -1;
        }

        AlignmentRecord record;
        int64_t processed = 0;
        int64_t last_progress = 0;
        int rc = 0;

        while ((rc = sam_read1(file_, header_, b.get())) >= 0) {
            decode_record(b.get(), record);
            ++processed;
            if (!record_handler(record)) {
                break;
            }

            if (progress_handler && progress_interval > 0 &&
                processed - last_progress >= progress_interval) {
                if (!progress_handler(processed)) {
                    break;
                }
                last_progress = processed;
            }
        }

        // -1 is a clean end of file; anything lower is truncation or corruption.
        if (rc < -1) {
            std::cerr << "[AlignmentSource] read error after record " << processed
                      << " in " << path_ << '\n';
            return -1;
        }

        return processed;
    }

private:
    std::string path_;
    samFile* file_ = nullptr;
    sam_hdr_t* header_ = nullptr;
    bool valid_ = false;
};

}  // namespace

std::unique_ptr<AlignmentRecordSource> make_alignment_source(
    const std::string& path,
    int32_t decompression_threads) {
    return std::make_unique<HtslibAlignmentSource>(path, decompression_threads);
}

}  // namespace eccflow
