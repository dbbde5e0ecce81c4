#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "alignment_record.h"
#include "alignment_source.h"
#include "insert_size.h"
#include "test_path_utils.h"

using namespace eccflow;
namespace fs = std::filesystem;

namespace {

std::string sam_line(const std::string& qname, int flag, const std::string& rname,
                     int pos, int mapq, const std::string& cigar,
                     const std::string& rnext, int pnext, int tlen) {
    std::ostringstream oss;
    oss << qname << '\t' << flag << '\t' << rname << '\t' << pos << '\t' << mapq << '\t'
        << cigar << '\t' << rnext << '\t' << pnext << '\t' << tlen << '\t'
        << std::string(50, 'A') << '\t' << std::string(50, 'I') << '\n';
    return oss.str();
}

// Name-sorted SAM, nine records:
//   good1  99/147 FR pair, TLEN 250
//   clip   99/147 pair, first mate soft-clipped
//   unmap  77/141 unmapped pair, CIGAR '*'
//   single unpaired read
//   good2  99/147 FR pair, TLEN 300
std::string write_name_sorted_sam(const std::string& dir) {
    const std::string path = (fs::path(dir) / "name_sorted.sam").string();
    std::ofstream out(path);
    out << "@HD\tVN:1.6\tSO:queryname\n"
        << "@SQ\tSN:chr1\tLN:10000\n"
        << sam_line("good1", 0x63, "chr1", 100, 60, "50M", "=", 300, 250)
        << sam_line("good1", 0x93, "chr1", 300, 60, "50M", "=", 100, -250)
        << sam_line("clip", 0x63, "chr1", 500, 60, "10S40M", "=", 700, 250)
        << sam_line("clip", 0x93, "chr1", 700, 60, "50M", "=", 500, -250)
        << sam_line("unmap", 0x4d, "*", 0, 0, "*", "*", 0, 0)
        << sam_line("unmap", 0x8d, "*", 0, 0, "*", "*", 0, 0)
        << sam_line("single", 0, "chr1", 900, 60, "50M", "*", 0, 0)
        << sam_line("good2", 0x63, "chr1", 1000, 60, "50M", "=", 1250, 300)
        << sam_line("good2", 0x93, "chr1", 1250, 60, "50M", "=", 1000, -300);
    return path;
}

std::vector<AlignmentRecord> read_all(AlignmentRecordSource& source, int64_t& returned) {
    std::vector<AlignmentRecord> records;
    returned = source.stream([&records](const AlignmentRecord& r) {
        records.push_back(r);
        return true;
    });
    return records;
}

}  // namespace

void test_decode_fields() {
    std::cout << "Testing htslib record decoding..." << std::endl;

    const std::string dir = eccflow_test::make_temp_dir("eccflow_source_decode");
    const std::string path = write_name_sorted_sam(dir);

    auto source = make_alignment_source(path, 1);
    assert(source->is_valid());
    assert(source->path() == path);

    int64_t returned = 0;
    const std::vector<AlignmentRecord> records = read_all(*source, returned);
    assert(returned == 9);
    assert(records.size() == 9);

    const AlignmentRecord& first = records[0];
    assert(first.query_name == "good1");
    assert(first.mate_role == MateRole::kFirst);
    assert(first.mapping_quality == 60);
    assert(!first.is_reverse);
    assert(first.is_proper_pair);
    assert(first.template_length == 250);
    assert(first.cigar_valid);
    assert(first.cigar_ops.size() == 1);
    assert(first.cigar_ops[0] == CigarOp('M', 50));

    const AlignmentRecord& second = records[1];
    assert(second.query_name == "good1");
    assert(second.mate_role == MateRole::kSecond);
    assert(second.is_reverse);
    assert(second.is_proper_pair);
    assert(second.template_length == -250);

    const AlignmentRecord& clipped = records[2];
    assert(clipped.cigar_valid);
    assert(format_cigar(clipped.cigar_ops) == "10S40M");
    assert(is_soft_clipped(clipped));
    assert(!is_hard_clipped(clipped));

    const AlignmentRecord& unmapped = records[4];
    assert(unmapped.mate_role == MateRole::kFirst);
    assert(unmapped.cigar_valid);
    assert(unmapped.cigar_ops.empty());
    assert(!unmapped.is_proper_pair);
    assert(unmapped.mapping_quality == 0);
    assert(records[5].mate_role == MateRole::kSecond);

    const AlignmentRecord& single = records[6];
    assert(single.query_name == "single");
    assert(single.mate_role == MateRole::kUnpaired);
    assert(single.template_length == 0);

    eccflow_test::remove_tree(dir);
    std::cout << "  decoding tests passed!" << std::endl;
}

void test_stream_control() {
    std::cout << "Testing stream stop and progress..." << std::endl;

    const std::string dir = eccflow_test::make_temp_dir("eccflow_source_control");
    const std::string path = write_name_sorted_sam(dir);

    auto source = make_alignment_source(path, 1);
    int64_t seen = 0;
    const int64_t returned = source->stream([&seen](const AlignmentRecord&) {
        return ++seen < 3;
    });
    assert(returned == 3);
    assert(seen == 3);

    auto again = make_alignment_source(path, 1);
    std::vector<int64_t> ticks;
    const int64_t total = again->stream(
        [](const AlignmentRecord&) { return true; },
        [&ticks](int64_t processed) {
            ticks.push_back(processed);
            return true;
        },
        4);
    assert(total == 9);
    const std::vector<int64_t> expected = {4, 8};
    assert(ticks == expected);

    eccflow_test::remove_tree(dir);
    std::cout << "  stream control tests passed!" << std::endl;
}

void test_estimate_from_sam() {
    std::cout << "Testing insert size estimate over htslib input..." << std::endl;

    const std::string dir = eccflow_test::make_temp_dir("eccflow_source_estimate");
    const std::string path = write_name_sorted_sam(dir);

    auto source = make_alignment_source(path, 1);
    InsertSizeConfig config;
    config.sample_size = 100;
    InsertSizeEstimator estimator(config);
    std::vector<int64_t> sample;
    const InsertSizeStats stats = estimator.estimate(*source, sample);

    const std::vector<int64_t> expected = {250, 300};
    assert(sample == expected);
    assert(std::fabs(stats.mean - 275.0) < 1e-9);
    assert(std::fabs(stats.stddev - 25.0) < 1e-9);
    assert(stats.records_scanned == 9);
    // good1, clip, unmap, good2; the unpaired read never pairs.
    assert(stats.pairs_evaluated == 4);
    assert(stats.malformed_records == 0);
    assert(!stats.quota_reached);

    eccflow_test::remove_tree(dir);
    std::cout << "  htslib estimate tests passed!" << std::endl;
}

void test_unreadable_inputs() {
    std::cout << "Testing unreadable alignment inputs..." << std::endl;

    const std::string dir = eccflow_test::make_temp_dir("eccflow_source_bad");

    auto missing = make_alignment_source((fs::path(dir) / "absent.bam").string(), 1);
    assert(!missing->is_valid());
    assert(missing->stream([](const AlignmentRecord&) { return true; }) == -1);

    bool threw = false;
    try {
        InsertSizeEstimator(InsertSizeConfig{}).estimate(*missing);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // A line htslib cannot parse after a valid record is a read error.
    const std::string broken = (fs::path(dir) / "broken.sam").string();
    {
        std::ofstream out(broken);
        out << "@HD\tVN:1.6\tSO:queryname\n"
            << "@SQ\tSN:chr1\tLN:10000\n"
            << sam_line("good1", 0x63, "chr1", 100, 60, "50M", "=", 300, 250)
            << "good1\tnot_a_flag\tchr1\n";
    }
    auto truncated = make_alignment_source(broken, 1);
    assert(truncated->is_valid());
    int64_t seen = 0;
    const int64_t returned = truncated->stream([&seen](const AlignmentRecord&) {
        ++seen;
        return true;
    });
    assert(returned == -1);
    assert(seen == 1);

    auto truncated_again = make_alignment_source(broken, 1);
    threw = false;
    try {
        InsertSizeEstimator(InsertSizeConfig{}).estimate(*truncated_again);
    } catch (const EmptySampleError&) {
        assert(false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    eccflow_test::remove_tree(dir);
    std::cout << "  unreadable input tests passed!" << std::endl;
}

int main() {
    std::cout << "=== AlignmentRecordSource Tests ===" << std::endl;

    test_decode_fields();
    test_stream_control();
    test_estimate_from_sam();
    test_unreadable_inputs();

    std::cout << "\n=== All AlignmentRecordSource tests passed! ===" << std::endl;
    return 0;
}
