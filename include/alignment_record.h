#ifndef ECCFLOW_ALIGNMENT_RECORD_H
#define ECCFLOW_ALIGNMENT_RECORD_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eccflow {

enum class MateRole : uint8_t {
    kUnpaired = 0,
    kFirst = 1,   // BAM_FREAD1
    kSecond = 2   // BAM_FREAD2
};

// (SAM operation character, length), e.g. {'S', 12}.
using CigarOp = std::pair<char, int32_t>;

/**
 * AlignmentRecord: one alignment of one sequencing read.
 * Carries only the fields the insert-size estimator looks at.
 */
struct AlignmentRecord {
    std::string query_name;
    MateRole mate_role = MateRole::kUnpaired;
    int32_t mapping_quality = 0;

    std::vector<CigarOp> cigar_ops;
    // False when the CIGAR could not be decoded. A '*' CIGAR is valid with no ops.
    bool cigar_valid = true;

    bool is_reverse = false;       // BAM_FREVERSE
    bool is_proper_pair = false;   // BAM_FPROPER_PAIR

    // Positive when this record anchors the leftmost end of the fragment.
    int64_t template_length = 0;
};

bool is_cigar_op_code(char op);

bool is_soft_clipped(const AlignmentRecord& record);
bool is_hard_clipped(const AlignmentRecord& record);

// Parse a SAM text CIGAR ("12S88M", "5H95M"). Returns false and leaves `ops`
// empty on '*', an empty string, a zero length or an unknown op.
bool parse_cigar_string(std::string_view cigar, std::vector<CigarOp>& ops);

std::string format_cigar(const std::vector<CigarOp>& ops);

}  // namespace eccflow

#endif  // ECCFLOW_ALIGNMENT_RECORD_H
