#include <iostream>
#include <atomic>
#include <cassert>
#include <cmath>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "annotation_reader.h"
#include "fingerprint_config.h"
#include "fingerprint_pipeline.h"
#include "task_queue.h"

using namespace tefp;

namespace {

std::vector<ReadTip> run_of_tips(int64_t start, int count, const std::string& element) {
    std::vector<ReadTip> tips;
    for (int i = 0; i < count; ++i) {
        tips.push_back({start + i, element});
    }
    return tips;
}

TipTable make_tip_table() {
    TipTable table;
    table[{"chr1", Strand::kForward, "Gypsy", "s1"}] = run_of_tips(1000, 10, "gypsy1");
    table[{"chr1", Strand::kReverse, "Gypsy", "s1"}] = run_of_tips(1040, 10, "gypsy1");
    table[{"chr1", Strand::kForward, "Gypsy", "s2"}] = run_of_tips(1002, 10, "gypsy2");
    table[{"chr2", Strand::kForward, "Copia", "s2"}] = run_of_tips(500, 10, "copia4");
    // Too few reads for a cluster.
    table[{"chr2", Strand::kReverse, "Copia", "s1"}] = run_of_tips(900, 3, "copia4");
    return table;
}

FingerprintConfig small_config() {
    FingerprintConfig config;
    config.epsilon = 50;
    config.minimum_epsilon = 0;
    config.minimum_points = 5;
    config.method = SplitMethod::kConservative;
    config.buffer_margin = 20;
    config.join_distance = 25;
    config.n_common_elements = 2;
    return config;
}

std::vector<std::string> collect(const LineSequence& lines) {
    std::vector<std::string> out;
    for (const auto& line : lines) out.push_back(line);
    return out;
}

template <typename Fn>
bool throws_config_error(Fn fn, const std::string& expected) {
    try {
        fn();
    } catch (const ConfigError& e) {
        return std::string(e.what()).find(expected) != std::string::npos;
    }
    return false;
}

}  // namespace

void test_task_queue() {
    std::cout << "Testing TaskQueue..." << std::endl;

    TaskQueue queue(3);
    assert(queue.worker_count() == 3);

    std::atomic<int> executed{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        auto task = std::make_unique<PromiseTask<int>>("chr" + std::to_string(i), [i, &executed]() {
            ++executed;
            return i * i;
        });
        assert(task->reference() == "chr" + std::to_string(i));
        futures.push_back(task->get_future());
        const bool submitted = queue.submit(std::move(task));
        assert(submitted);
    }

    auto failing = std::make_unique<PromiseTask<int>>("chrX", []() -> int {
        throw std::runtime_error("worker failed on chrX");
    });
    auto failed = failing->get_future();
    queue.submit(std::move(failing));

    int total = 0;
    for (auto& f : futures) total += f.get();
    assert(total == 2470);  // sum of squares 0..19

    bool threw = false;
    try {
        failed.get();
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "worker failed on chrX";
    }
    assert(threw);

    queue.close();
    queue.wait();
    assert(executed == 20);
    assert(queue.size() == 0);
    const bool late = queue.submit(std::make_unique<PromiseTask<int>>("late", []() { return 0; }));
    assert(!late);

    std::cout << "  TaskQueue tests passed!" << std::endl;
}

void test_config_validation() {
    std::cout << "Testing configuration validation..." << std::endl;

    validate_config(FingerprintConfig{});
    validate_config(small_config());

    auto config = small_config();
    config.epsilon = -1;
    assert(throws_config_error([&]() { validate_config(config); }, "epsilon"));

    config = small_config();
    config.minimum_epsilon = 50;
    assert(throws_config_error([&]() { validate_config(config); }, "minimum_epsilon"));
    // The lower bound only matters when splitting.
    config.method = SplitMethod::kNonHierarchical;
    validate_config(config);

    config = small_config();
    config.minimum_points = 0;
    assert(throws_config_error([&]() { validate_config(config); }, "minimum_points"));

    config = small_config();
    config.threads = 0;
    assert(throws_config_error([&]() { validate_config(config); }, "threads"));

    config = small_config();
    config.n_common_elements = 0;
    assert(throws_config_error([&]() { validate_config(config); }, "n_common_elements"));

    config = small_config();
    config.join_distance = -5;
    assert(throws_config_error([&]() { validate_config(config); }, "join_distance"));

    config = small_config();
    config.buffer_margin = -5;
    assert(throws_config_error([&]() { FingerprintPipeline pipeline(config); }, "buffer_margin"));

    config = small_config();
    config.element_tag = "M";
    assert(throws_config_error([&]() { validate_config(config); }, "element_tag"));

    config = small_config();
    config.min_mapq = 256;
    assert(throws_config_error([&]() { validate_config(config); }, "min_mapq"));

    // Option values wider than 32 bits are rejected, not wrapped.
    assert(narrow_int32("threads", 8) == 8);
    assert(narrow_int32("mapq", -3) == -3);
    assert(throws_config_error([]() { narrow_int32("threads", 4294967297LL); }, "threads = 4294967297"));
    assert(throws_config_error([]() { narrow_int32("mapq", -2147483649LL); }, "mapq"));

    // Deprecated but valid.
    config = small_config();
    config.method = SplitMethod::kAggressive;
    validate_config(config);

    assert(parse_split_method("idbcan") == SplitMethod::kNonHierarchical);
    assert(parse_split_method("sdbican") == SplitMethod::kConservative);
    assert(parse_split_method("sdbican-aggressive") == SplitMethod::kAggressive);
    assert(throws_config_error([]() { parse_split_method("optics"); }, "optics"));

    std::cout << "  Configuration validation tests passed!" << std::endl;
}

void test_pipeline_run() {
    std::cout << "Testing pipeline run..." << std::endl;

    const TipTable table = make_tip_table();
    const FingerprintPipeline pipeline(small_config());
    const FingerprintResult result = pipeline.run(table);

    assert(result.references == 2);
    assert(result.tips == 43);
    assert(result.clusters == 4);
    assert(result.bins == 2);
    assert((result.model.samples() == std::vector<std::string>{"s1", "s2"}));

    const auto& loci = result.model.loci();
    assert(loci.size() == 2);

    const auto& joined = loci[0];
    assert(joined.locus == (Locus{"chr1", 1000, 1049}));
    assert(joined.joined && !joined.anchored);
    assert(joined.category == "Gypsy");
    assert(joined.flanks.size() == 2);
    assert(joined.flanks[0] == (Locus{"chr1", 1000, 1011}));
    assert(joined.flanks[1] == (Locus{"chr1", 1040, 1049}));
    assert((joined.elements.elements == std::vector<std::string>{"gypsy1", "gypsy2"}));
    assert(joined.elements.counts[0][0] == 20 && joined.elements.counts[1][1] == 10);
    assert(std::fabs(joined.elements.max_count_proportion - 1.0) < 1e-12);

    const auto& single = loci[1];
    assert(single.locus == (Locus{"chr2", 500, 509}));
    assert(!single.joined);
    assert(single.strand == Strand::kForward);
    assert(single.category == "Copia");

    // Caller's sample order is kept; unknown samples are appended.
    const FingerprintResult ordered = pipeline.run(table, {"s2"});
    assert((ordered.model.samples() == std::vector<std::string>{"s2", "s1"}));

    std::cout << "  Pipeline run tests passed!" << std::endl;
}

void test_pipeline_threads_agree() {
    std::cout << "Testing pipeline with several workers..." << std::endl;

    TipTable table = make_tip_table();
    for (int r = 3; r < 12; ++r) {
        const std::string reference = "chr" + std::to_string(r);
        table[{reference, Strand::kForward, "Gypsy", "s1"}] = run_of_tips(100 * r, 8, "gypsy1");
        table[{reference, Strand::kReverse, "Gypsy", "s2"}] = run_of_tips(100 * r + 30, 8, "gypsy3");
    }

    auto config = small_config();
    const auto serial = FingerprintPipeline(config).run(table);
    config.threads = 4;
    const auto parallel = FingerprintPipeline(config).run(table);
    config.threads = 32;
    const auto idle_workers = FingerprintPipeline(config).run(table);

    const auto expected = collect(serial.model.lines(LineFormat::kTabular));
    assert(expected.size() == 1 + 2 + 9);
    assert(collect(parallel.model.lines(LineFormat::kTabular)) == expected);
    assert(collect(idle_workers.model.lines(LineFormat::kTabular)) == expected);

    std::cout << "  Worker agreement tests passed!" << std::endl;
}

void test_pipeline_methods() {
    std::cout << "Testing clustering methods in the pipeline..." << std::endl;

    // Two tight groups 40bp apart: one cluster at epsilon 50 unless split.
    TipTable table;
    std::vector<ReadTip> tips = run_of_tips(100, 10, "gypsy1");
    for (const auto& tip : run_of_tips(150, 10, "gypsy1")) tips.push_back(tip);
    table[{"chr1", Strand::kForward, "Gypsy", "s1"}] = tips;

    auto config = small_config();
    config.buffer_margin = 25;
    config.method = SplitMethod::kNonHierarchical;
    const auto flat = FingerprintPipeline(config).run(table);
    assert(flat.clusters == 1);

    config.method = SplitMethod::kConservative;
    const auto split = FingerprintPipeline(config).run(table);
    assert(split.clusters == 2);
    // Same strand clusters in one bin form a single flank.
    assert(split.model.size() == 1);
    assert(split.model.loci()[0].cluster_count == 2);

    config.method = SplitMethod::kAggressive;
    const auto aggressive = FingerprintPipeline(config).run(table);
    assert(aggressive.clusters == 2);

    std::cout << "  Clustering method tests passed!" << std::endl;
}

void test_pipeline_joins_neighbouring_bins() {
    std::cout << "Testing pipeline joins across bins..." << std::endl;

    // Default settings: buffer 20 keeps a 45bp gap in two bins, join distance 25 pairs it.
    TipTable table;
    table[{"chr1", Strand::kForward, "Gypsy", "s1"}] = run_of_tips(91, 10, "gypsy1");
    table[{"chr1", Strand::kReverse, "Gypsy", "s1"}] = run_of_tips(145, 10, "gypsy1");
    const FingerprintConfig config;
    const auto result = FingerprintPipeline(config).run(table);
    assert(result.bins == 2);
    assert(result.model.size() == 1);
    const auto& locus = result.model.loci()[0];
    assert(locus.joined && !locus.anchored);
    assert(locus.locus == (Locus{"chr1", 91, 154}));

    table[{"chr1", Strand::kReverse, "Gypsy", "s1"}] = run_of_tips(151, 10, "gypsy1");
    assert(FingerprintPipeline(config).run(table).model.size() == 2);

    std::cout << "  Neighbouring bin join tests passed!" << std::endl;
}

void test_pipeline_anchored_join() {
    std::cout << "Testing pipeline join through a long known element..." << std::endl;

    TipTable table;
    table[{"chr1", Strand::kForward, "Gypsy", "s1"}] = run_of_tips(91, 10, "gypsy1");
    table[{"chr1", Strand::kReverse, "Gypsy", "s1"}] = run_of_tips(5000, 10, "gypsy1");

    AnnotationLocus te1;
    te1.locus = Locus{"chr1", 101, 4999};
    te1.strand = Strand::kForward;
    te1.id = "te1";
    const AnnotationIndex index({te1});

    auto config = FingerprintConfig{};
    config.threads = 2;
    const auto result = FingerprintPipeline(config, &index).run(table);
    assert(result.bins == 2);
    assert(result.model.size() == 1);
    const auto& locus = result.model.loci()[0];
    assert(locus.joined && locus.anchored);
    assert(locus.annotation_id == "te1");
    assert(locus.locus == (Locus{"chr1", 91, 5009}));
    assert(locus.flanks.size() == 2);

    // Same reads without the annotation stay two unpaired flanks.
    assert(FingerprintPipeline(config).run(table).model.size() == 2);

    std::cout << "  Long known element join tests passed!" << std::endl;
}

void test_pipeline_input_error() {
    std::cout << "Testing malformed input..." << std::endl;

    TipTable table = make_tip_table();
    table[{"chr9", Strand::kForward, "Gypsy", "s3"}] = {{10, "gypsy1"}, {-4, "gypsy1"}};

    auto config = small_config();
    config.threads = 2;
    const FingerprintPipeline pipeline(config);

    bool threw = false;
    try {
        pipeline.run(table);
    } catch (const InputError& e) {
        const std::string message = e.what();
        threw = message.find("chr9") != std::string::npos && message.find("s3") != std::string::npos;
    }
    assert(threw);

    // Empty input is not an error.
    const auto empty = pipeline.run(TipTable{});
    assert(empty.model.empty());
    assert(empty.references == 0);

    std::cout << "  Malformed input tests passed!" << std::endl;
}

int main() {
    std::cout << "=== TEFP Pipeline Tests ===" << std::endl;

    try {
        test_task_queue();
        test_config_validation();
        test_pipeline_run();
        test_pipeline_threads_agree();
        test_pipeline_methods();
        test_pipeline_joins_neighbouring_bins();
        test_pipeline_anchored_join();
        test_pipeline_input_error();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
