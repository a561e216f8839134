#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "annotation_reader.h"
#include "line_writer.h"
#include "result_model.h"
#include "test_path_utils.h"

using namespace tefp;

namespace {

JoinedLocus joined_locus() {
    JoinedLocus locus;
    locus.locus = Locus{"chr1", 100, 170};
    locus.category = "Gypsy";
    locus.strand = Strand::kUnknown;
    locus.joined = true;
    locus.anchored = true;
    locus.annotation_id = "te_c";
    locus.flanks = {Locus{"chr1", 100, 120}, Locus{"chr1", 150, 170}};
    locus.cluster_count = 2;
    locus.elements.samples = {"s1", "s2"};
    locus.elements.elements = {"A", "B"};
    locus.elements.counts = {{5, 3}, {3, 0}};
    locus.elements.sample_points = {9, 3};
    locus.elements.max_count_proportion = 0.625;
    return locus;
}

JoinedLocus single_locus() {
    JoinedLocus locus;
    locus.locus = Locus{"chr1", 50, 60};
    locus.category = "Gypsy";
    locus.strand = Strand::kForward;
    locus.flanks = {Locus{"chr1", 50, 60}};
    locus.cluster_count = 1;
    locus.elements.samples = {"s1", "s2"};
    locus.elements.elements = {"A"};
    locus.elements.counts = {{4}, {0}};
    locus.elements.sample_points = {4, 0};
    locus.elements.max_count_proportion = 1.0;
    return locus;
}

ResultModel make_model() {
    return ResultModel({joined_locus(), single_locus()}, {"s1", "s2"}, OutputOptions{});
}

std::vector<std::string> collect(const LineSequence& lines) {
    std::vector<std::string> out;
    for (const auto& line : lines) out.push_back(line);
    return out;
}

}  // namespace

void test_colour_and_format_names() {
    std::cout << "Testing colours and format names..." << std::endl;

    assert(proportion_colour(0.0) == "#0000FF");
    assert(proportion_colour(1.0) == "#FF0000");
    assert(proportion_colour(0.625) == "#9F0060");
    assert(proportion_colour(3.0) == "#FF0000");

    assert(parse_line_format("tsv") == LineFormat::kTabular);
    assert(parse_line_format("csv") == LineFormat::kCsv);
    assert(parse_line_format("gff") == LineFormat::kGff);
    bool threw = false;
    try {
        parse_line_format("bed");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Colour and format name tests passed!" << std::endl;
}

void test_tabular_lines() {
    std::cout << "Testing tabular lines..." << std::endl;

    const ResultModel model = make_model();
    const auto lines = collect(model.lines(LineFormat::kTabular));
    assert(lines.size() == 3);
    assert(lines[0] ==
           "reference\tstart\tstop\tstrand\tcategory\tjoined\tflanks\tknown_element\tclusters\tsupport\t"
           "element_1\telement_2\ts1_element_1_count\ts1_element_2_count\t"
           "s2_element_1_count\ts2_element_2_count\tmax_count_proportion");
    // Default order puts the locus at 50 first.
    assert(lines[1] == "chr1\t50\t60\t+\tGypsy\t0\t50-60\t.\t1\t4\tA\t.\t4\t0\t0\t0\t1.000");
    assert(lines[2] == "chr1\t100\t170\t.\tGypsy\t1\t100-120,150-170\tte_c\t2\t12\tA\tB\t5\t3\t3\t0\t0.625");

    std::cout << "  Tabular line tests passed!" << std::endl;
}

void test_csv_lines() {
    std::cout << "Testing CSV lines..." << std::endl;

    const ResultModel model = make_model();
    const auto lines = collect(model.lines(LineFormat::kCsv));
    assert(lines[0].compare(0, 27, "\"reference\",\"start\",\"stop\",") == 0);
    assert(lines[2] ==
           "\"chr1\",100,170,\".\",\"Gypsy\",1,\"100-120,150-170\",\"te_c\",2,12,\"A\",\"B\",5,3,3,0,0.625");

    std::cout << "  CSV line tests passed!" << std::endl;
}

void test_gff_lines() {
    std::cout << "Testing GFF lines..." << std::endl;

    const ResultModel model = make_model();
    const auto lines = collect(model.lines(LineFormat::kGff));
    assert(lines[0] == "##gff-version 3");

    const GffRecord record = parse_gff_line(lines[2], 3);
    assert(record.seqid == "chr1");
    assert(record.source == "tefp");
    assert(record.type == "insertion");
    assert(record.start == 100 && record.end == 170);

    std::string value;
    assert(record.get("ID", value) && value == "Gypsy_chr1_._100");
    assert(record.get("flanks", value) && value == "100-120,150-170");
    assert(record.get("known_element", value) && value == "te_c");
    assert(record.get("s2_element_1_count", value) && value == "3");
    assert(record.get("color", value) && value == "#9F0060");

    const GffRecord single = parse_gff_line(lines[1], 2);
    assert(single.type == "flank");
    assert(single.strand == '+');
    assert(!single.get("known_element", value));

    OutputOptions plain;
    plain.colour_by_proportion = false;
    const ResultModel uncoloured({joined_locus()}, {"s1", "s2"}, plain);
    const auto plain_lines = collect(uncoloured.lines(LineFormat::kGff));
    assert(!parse_gff_line(plain_lines[1], 2).get("color", value));

    std::cout << "  GFF line tests passed!" << std::endl;
}

void test_ordering_and_restart() {
    std::cout << "Testing ordering and restartable sequences..." << std::endl;

    const ResultModel model = make_model();
    const LineSequence by_proportion = model.lines(LineFormat::kTabular, {"max_count_proportion"});
    assert(by_proportion.size() == 3);
    assert(by_proportion.line(1).compare(0, 9, "chr1\t100\t") == 0);

    // Iterating twice yields the same lines.
    const auto first = collect(by_proportion);
    const auto second = collect(by_proportion);
    assert(first == second);

    const auto by_strand = collect(model.lines(LineFormat::kTabular, {"joined", "start"}));
    assert(by_strand[1].compare(0, 8, "chr1\t50\t") == 0);

    bool threw = false;
    try {
        model.lines(LineFormat::kTabular, {"start", "colour"});
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("colour") != std::string::npos;
    }
    assert(threw);

    const ResultModel empty{};
    assert(collect(empty.lines(LineFormat::kGff)).size() == 1);

    std::cout << "  Ordering tests passed!" << std::endl;
}

void test_line_writer() {
    std::cout << "Testing LineWriter..." << std::endl;

    assert(compression_for("out.tsv") == Compression::kNone);
    assert(compression_for("out.gff.gz") == Compression::kBgzf);
    assert(compression_for("out.bgz") == Compression::kBgzf);
    assert(compression_for("-") == Compression::kNone);

    const auto dir = tefp_test::make_temp_dir("tefp_test_result_model");
    const ResultModel model = make_model();

    const std::string plain_path = dir + "/loci.tsv";
    {
        LineWriter writer(plain_path);
        const int64_t count = writer.write_all(model.lines(LineFormat::kTabular));
        assert(count == 3);
        writer.close();
    }
    const auto written = tefp_test::read_lines(plain_path);
    assert(written == collect(model.lines(LineFormat::kTabular)));

    // BGZF output reads back through htslib.
    const std::string gz_path = dir + "/loci.gff.gz";
    {
        LineWriter writer(gz_path);
        assert(writer.compression() == Compression::kBgzf);
        writer.write_all(model.lines(LineFormat::kGff));
    }
    GffReader reader(gz_path);
    assert(reader.is_valid());
    std::vector<GffRecord> records;
    const int64_t features = reader.stream([&records](const GffRecord& r) { records.push_back(r); });
    assert(features == 2);
    assert(records[0].start == 50 && records[1].start == 100);

    bool threw = false;
    try {
        LineWriter bad(dir + "/missing_dir/out.tsv");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  LineWriter tests passed!" << std::endl;
}

int main() {
    std::cout << "=== TEFP Result Model Tests ===" << std::endl;

    try {
        test_colour_and_format_names();
        test_tabular_lines();
        test_csv_lines();
        test_gff_lines();
        test_ordering_and_restart();
        test_line_writer();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
