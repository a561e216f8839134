#include <iostream>
#include <cassert>
#include <string>
#include <vector>

#include "fingerprint_config.h"
#include "tip_extractor.h"
#include "test_path_utils.h"

using namespace tefp;

namespace {

std::string sam_record(const std::string& name, int flag, const std::string& reference, int pos, int mapq,
                       const std::string& cigar, const std::string& tags) {
    std::string line = name + "\t" + std::to_string(flag) + "\t" + reference + "\t" + std::to_string(pos) +
                       "\t" + std::to_string(mapq) + "\t" + cigar + "\t*\t0\t0\t" + std::string(50, 'A') + "\t*";
    if (!tags.empty()) line += "\t" + tags;
    return line;
}

std::string write_sam(const std::string& dir, const std::string& name, bool with_read_group) {
    std::vector<std::string> lines = {
        "@HD\tVN:1.6\tSO:unsorted",
        "@SQ\tSN:chr1\tLN:10000",
        "@SQ\tSN:chr2\tLN:10000",
    };
    if (with_read_group) lines.push_back("@RG\tID:rg1\tSM:sampleA\tPL:ILLUMINA");
    lines.push_back(sam_record("r1", 0, "chr1", 100, 60, "50M", "ME:Z:gypsy1"));
    lines.push_back(sam_record("r2", 16, "chr1", 200, 60, "10S40M", "ME:Z:copia2"));
    lines.push_back(sam_record("r3", 0, "chr1", 300, 60, "40M10S", "ME:Z:gypsy3"));
    lines.push_back(sam_record("r4", 0, "chr1", 400, 10, "50M", "ME:Z:gypsy1"));      // low mapq
    lines.push_back("r5\t4\t*\t0\t0\t*\t*\t0\t0\t" + std::string(50, 'A') + "\t*");  // unmapped
    lines.push_back(sam_record("r6", 0, "chr1", 500, 60, "50M", ""));                  // untagged
    lines.push_back(sam_record("r7", 1024, "chr1", 600, 60, "50M", "ME:Z:gypsy1"));   // duplicate
    lines.push_back(sam_record("r8", 256, "chr1", 650, 60, "50M", "ME:Z:gypsy1"));    // secondary
    lines.push_back(sam_record("r9", 0, "chr2", 700, 60, "50M", "ME:Z:LINE1"));       // no family
    lines.push_back(sam_record("r10", 0, "chr2", 800, 60, "50M", "ME:Z:copia9"));
    return tefp_test::write_text_file(dir, name, lines);
}

FingerprintConfig extraction_config() {
    FingerprintConfig config;
    config.families = {"gypsy", "copia"};
    config.min_mapq = 30;
    return config;
}

}  // namespace

void test_helpers() {
    std::cout << "Testing extraction helpers..." << std::endl;

    assert(assign_category("gypsy12", {"copia", "gypsy"}) == "gypsy");
    assert(assign_category("LINE1", {"copia", "gypsy"}).empty());
    assert(assign_category("anything", {}) == ".");
    // First matching prefix wins.
    assert(assign_category("gypsy_x", {"gyp", "gypsy"}) == "gyp");

    // Forward: 1-based end of [99, 149) is 149. Reverse: 1-based start is 100.
    assert(tip_position(99, 149, false, 0, 0, false) == 149);
    assert(tip_position(99, 149, true, 0, 0, false) == 100);
    assert(tip_position(99, 149, false, 7, 12, true) == 161);
    assert(tip_position(99, 149, true, 7, 12, true) == 93);
    assert(tip_position(3, 40, true, 20, 0, true) == 1);

    assert(sample_name_from_header("@HD\tVN:1.6\n@RG\tID:x\tSM:plant7\tPL:ONT\n", "/data/run.bam") == "plant7");
    assert(sample_name_from_header("@RG\tID:x\tSM:last", "a.bam") == "last");
    assert(sample_name_from_header("@HD\tVN:1.6\n", "/data/plant9.sorted.bam") == "plant9");
    assert(sample_name_from_header("", "plain") == "plain");

    std::cout << "  Extraction helper tests passed!" << std::endl;
}

void test_extract_from_sam() {
    std::cout << "Testing extraction from an alignment file..." << std::endl;

    const auto dir = tefp_test::make_temp_dir("tefp_test_tip_extractor");
    const auto path = write_sam(dir, "reads.sam", true);
    const auto config = extraction_config();

    TipExtractor extractor(path, config);
    assert(extractor.is_valid());
    assert(extractor.sample() == "sampleA");
    assert((extractor.reference_names() == std::vector<std::string>{"chr1", "chr2"}));

    TipTable table;
    const auto stats = extractor.extract(table);
    assert(stats.records == 10);
    assert(stats.informative == 4);
    assert(stats.skipped_flag == 3);
    assert(stats.skipped_mapq == 1);
    assert(stats.skipped_untagged == 1);
    assert(stats.skipped_family == 1);
    assert(stats.skipped_reference == 0);

    assert(table.size() == 3);
    const auto& gypsy = table.at({"chr1", Strand::kForward, "gypsy", "sampleA"});
    assert(gypsy.size() == 2);
    assert(gypsy[0].position == 149 && gypsy[0].element == "gypsy1");
    assert(gypsy[1].position == 339 && gypsy[1].element == "gypsy3");
    const auto& copia = table.at({"chr1", Strand::kReverse, "copia", "sampleA"});
    assert(copia.size() == 1 && copia[0].position == 200);
    assert(table.at({"chr2", Strand::kForward, "copia", "sampleA"})[0].position == 849);

    std::cout << "  Extraction tests passed!" << std::endl;
}

void test_extract_options() {
    std::cout << "Testing extraction options..." << std::endl;

    const auto dir = tefp_test::make_temp_dir("tefp_test_tip_extractor");
    const auto path = write_sam(dir, "plant3.sam", false);

    auto config = extraction_config();
    config.include_soft_clips = true;
    config.references = {"chr1"};

    std::vector<std::string> samples;
    const TipTable table = extract_tips({path}, config, &samples);
    assert((samples == std::vector<std::string>{"plant3"}));
    assert(table.size() == 2);
    const auto& gypsy = table.at({"chr1", Strand::kForward, "gypsy", "plant3"});
    assert(gypsy[1].position == 349);
    assert(table.at({"chr1", Strand::kReverse, "copia", "plant3"})[0].position == 190);

    // Without families every element shares one category.
    config = extraction_config();
    config.families.clear();
    const TipTable flat = extract_tips({path}, config);
    assert(flat.count({"chr2", Strand::kForward, ".", "plant3"}) == 1);
    assert(flat.at({"chr2", Strand::kForward, ".", "plant3"}).size() == 2);

    std::cout << "  Extraction option tests passed!" << std::endl;
}

void test_extract_errors() {
    std::cout << "Testing extraction errors..." << std::endl;

    const auto config = extraction_config();
    const auto dir = tefp_test::make_temp_dir("tefp_test_tip_extractor");

    TipExtractor missing(dir + "/absent.bam", config);
    assert(!missing.is_valid());
    TipTable table;
    bool threw = false;
    try {
        missing.extract(table);
    } catch (const InputError&) {
        threw = true;
    }
    assert(threw);

    const auto path = write_sam(dir, "twice.sam", true);
    threw = false;
    try {
        extract_tips({path, path}, config);
    } catch (const InputError& e) {
        threw = std::string(e.what()).find("sampleA") != std::string::npos;
    }
    assert(threw);

    std::cout << "  Extraction error tests passed!" << std::endl;
}

void test_extract_real_bam() {
    std::cout << "Testing extraction from TEFP_TEST_BAM..." << std::endl;

    const auto bam = tefp_test::resolve_env_file("TEFP_TEST_BAM");
    if (!tefp_test::require_path_or_skip(bam, "test BAM", "TEFP_TEST_BAM")) {
        return;
    }

    FingerprintConfig config;
    config.min_mapq = 0;
    TipExtractor extractor(bam, config);
    assert(extractor.is_valid());
    TipTable table;
    const auto stats = extractor.extract(table);
    std::cout << "  records=" << stats.records << " informative=" << stats.informative << std::endl;
    int64_t tips = 0;
    for (const auto& entry : table) {
        for (const auto& tip : entry.second) {
            assert(tip.position >= 1);
            ++tips;
        }
    }
    assert(tips == stats.informative);

    std::cout << "  Real BAM tests passed!" << std::endl;
}

int main() {
    std::cout << "=== TEFP Tip Extraction Tests ===" << std::endl;

    try {
        test_helpers();
        test_extract_from_sam();
        test_extract_options();
        test_extract_errors();
        test_extract_real_bam();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
