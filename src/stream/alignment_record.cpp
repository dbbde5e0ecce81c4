#include "alignment_record.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace eccflow {
namespace {

constexpr char kCigarOpCodes[] = "MIDNSHP=X";

bool has_op(const AlignmentRecord& record, char op) {
    return std::any_of(record.cigar_ops.begin(), record.cigar_ops.end(),
                       [op](const CigarOp& entry) { return entry.first == op; });
}

}  // namespace

bool is_cigar_op_code(char op) {
    for (const char* p = kCigarOpCodes; *p != '\0'; ++p) {
        if (*p == op) {
            return true;
        }
    }
    return false;
}

bool is_soft_clipped(const AlignmentRecord& record) {
    return has_op(record, 'S');
}

bool is_hard_clipped(const AlignmentRecord& record) {
    return has_op(record, 'H');
}

bool parse_cigar_string(std::string_view cigar, std::vector<CigarOp>& ops) {
    ops.clear();
    if (cigar.empty() || cigar == "*") {
        return false;
    }

    int64_t len = 0;
    bool have_digits = false;
    for (const char c : cigar) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            len = len * 10 + (c - '0');
            if (len > std::numeric_limits<int32_t>::max()) {
                ops.clear();
                return false;
            }
            have_digits = true;
            continue;
        }
        if (!have_digits || len == 0 || !is_cigar_op_code(c)) {
            ops.clear();
            return false;
        }
        ops.emplace_back(c, static_cast<int32_t>(len));
        len = 0;
        have_digits = false;
    }

    // Trailing length without an op.
    if (have_digits) {
        ops.clear();
        return false;
    }
    return true;
}

std::string format_cigar(const std::vector<CigarOp>& ops) {
    if (ops.empty()) {
        return "*";
    }
    std::string out;
    for (const auto& [op, len] : ops) {
        out += std::to_string(len);
        out += op;
    }
    return out;
}

}  // namespace eccflow
