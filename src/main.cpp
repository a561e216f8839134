/**
 * TEFP - transposon insertion fingerprinting
 *
 * fingerprint:
 * 1. Tip extraction (one BAM per sample, htslib)
 * 2. Density clustering (IDBCAN) or hierarchical splitting (SDBICAN)
 * 3. Buffering and comparative bin merging across samples
 * 4. Pair joining of insertion flanks, known element lookup
 * 5. Output as TSV, CSV or GFF3 (optionally BGZF compressed)
 *
 * filter-gff: keep GFF3 features matching column/attribute filters.
 */

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "annotation_reader.h"
#include "fingerprint_config.h"
#include "fingerprint_pipeline.h"
#include "gff_filter.h"
#include "line_writer.h"
#include "result_model.h"
#include "tip_extractor.h"

using namespace tefp;

namespace {

class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " fingerprint [options] <bam>..." << std::endl;
    std::cout << "       " << prog << " filter-gff -i <gff> -f <filter>... [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "TEFP - transposon insertion fingerprinting" << std::endl;
    std::cout << std::endl;
    std::cout << "fingerprint options:" << std::endl;
    std::cout << "  -a, --annotation <gff>     Known elements (GFF3, may be bgzipped)" << std::endl;
    std::cout << "  -f, --families <a,b,..>    Element family prefixes" << std::endl;
    std::cout << "  -r, --references <a,b,..>  Only these references" << std::endl;
    std::cout << "  -e, --epsilon <int>        Maximum gap within a cluster (250)" << std::endl;
    std::cout << "      --minimum-epsilon <int> Smallest epsilon tried when splitting (0)" << std::endl;
    std::cout << "  -m, --minimum-reads <int>  Minimum reads per cluster (10)" << std::endl;
    std::cout << "      --method <name>        idbcan | sdbican | sdbican-aggressive (sdbican)" << std::endl;
    std::cout << "  -b, --buffer <int>         Buffer margin for comparison (20)" << std::endl;
    std::cout << "  -j, --join-distance <int>  Flank join distance (25)" << std::endl;
    std::cout << "  -n, --elements <int>       Common elements reported (2)" << std::endl;
    std::cout << "  -q, --mapq <int>           Minimum mapping quality (30)" << std::endl;
    std::cout << "      --tag <XX>             SAM tag naming the element (ME)" << std::endl;
    std::cout << "      --soft-clips           Extend tips by soft clips" << std::endl;
    std::cout << "      --no-colour            No GFF colour attribute" << std::endl;
    std::cout << "  -t, --threads <int>        Worker threads (1)" << std::endl;
    std::cout << "      --format <name>        tsv | csv | gff (tsv)" << std::endl;
    std::cout << "      --order <a,b,..>       Sort fields (reference,start,stop,category)" << std::endl;
    std::cout << "  -o, --output <path>        Destination, '-' for stdout, .gz for BGZF (-)" << std::endl;
    std::cout << "  -v, --verbose              Per-reference progress" << std::endl;
    std::cout << std::endl;
    std::cout << "filter-gff options:" << std::endl;
    std::cout << "  -i, --input <gff>          Input GFF3" << std::endl;
    std::cout << "  -f, --filter <expr>        <field><op><value>, op in == = != >= > <= <" << std::endl;
    std::cout << "  -c, --combine <ANY|ALL>    Combine filters and wildcard fields (ALL)" << std::endl;
    std::cout << "  -o, --output <path>        Destination (-)" << std::endl;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

int64_t parse_int(const std::string& option, const std::string& text) {
    size_t used = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw UsageError("invalid value for " + option + ": '" + text + "'");
    }
    return value;
}

int32_t parse_int32(const std::string& option, const std::string& text) {
    try {
        return narrow_int32(option, parse_int(option, text));
    } catch (const ConfigError& e) {
        throw UsageError(e.what());
    }
}

// Walks argv; value() consumes the argument following the current option.
class ArgCursor {
public:
    ArgCursor(int argc, char* argv[], int first) : argc_(argc), argv_(argv), index_(first) {}

    bool next(std::string& arg) {
        if (index_ >= argc_) return false;
        arg = argv_[index_++];
        return true;
    }

    std::string value(const std::string& option) {
        if (index_ >= argc_) {
            throw UsageError("missing value for " + option);
        }
        return argv_[index_++];
    }

private:
    int argc_;
    char** argv_;
    int index_;
};

int run_fingerprint(int argc, char* argv[]) {
    FingerprintConfig config;
    std::string annotation_path;
    std::string output = "-";
    LineFormat format = LineFormat::kTabular;
    std::vector<std::string> order = ResultModel::default_order();
    std::vector<std::string> bams;

    ArgCursor args(argc, argv, 2);
    std::string arg;
    while (args.next(arg)) {
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-a" || arg == "--annotation") {
            annotation_path = args.value(arg);
        } else if (arg == "-f" || arg == "--families") {
            for (auto& family : split_list(args.value(arg))) config.families.push_back(family);
        } else if (arg == "-r" || arg == "--references") {
            for (auto& reference : split_list(args.value(arg))) config.references.push_back(reference);
        } else if (arg == "-e" || arg == "--epsilon") {
            config.epsilon = parse_int(arg, args.value(arg));
        } else if (arg == "--minimum-epsilon") {
            config.minimum_epsilon = parse_int(arg, args.value(arg));
        } else if (arg == "-m" || arg == "--minimum-reads") {
            config.minimum_points = parse_int(arg, args.value(arg));
        } else if (arg == "--method") {
            config.method = parse_split_method(args.value(arg));
        } else if (arg == "-b" || arg == "--buffer") {
            config.buffer_margin = parse_int(arg, args.value(arg));
        } else if (arg == "-j" || arg == "--join-distance") {
            config.join_distance = parse_int(arg, args.value(arg));
        } else if (arg == "-n" || arg == "--elements") {
            config.n_common_elements = parse_int(arg, args.value(arg));
        } else if (arg == "-q" || arg == "--mapq") {
            config.min_mapq = parse_int32(arg, args.value(arg));
        } else if (arg == "--tag") {
            config.element_tag = args.value(arg);
        } else if (arg == "--soft-clips") {
            config.include_soft_clips = true;
        } else if (arg == "--no-colour") {
            config.colour_by_proportion = false;
        } else if (arg == "-t" || arg == "--threads") {
            config.threads = parse_int32(arg, args.value(arg));
        } else if (arg == "--format") {
            format = parse_line_format(args.value(arg));
        } else if (arg == "--order") {
            order = split_list(args.value(arg));
        } else if (arg == "-o" || arg == "--output") {
            output = args.value(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else {
            bams.push_back(arg);
        }
    }
    if (bams.empty()) {
        throw UsageError("at least one BAM file is required");
    }

    // Fail on bad settings before touching any input.
    validate_config(config);

    std::cerr << "[Phase 1] Extracting read tips from " << bams.size() << " BAM file(s)" << std::endl;
    std::vector<std::string> samples;
    const TipTable tips = extract_tips(bams, config, &samples);

    std::unique_ptr<AnnotationIndex> annotations;
    if (!annotation_path.empty()) {
        std::cerr << "[Phase 1] Reading known elements: " << annotation_path << std::endl;
        annotations = std::make_unique<AnnotationIndex>(read_annotations(annotation_path, config.references));
        std::cerr << "  Known elements: " << annotations->size() << std::endl;
    }

    std::cerr << "[Phase 2] Clustering, comparing and joining" << std::endl;
    const FingerprintPipeline pipeline(config, annotations.get());
    const FingerprintResult result = pipeline.run(tips, samples);

    // Build every line before opening the destination so a bad order writes nothing.
    const LineSequence lines = result.model.lines(format, order);
    std::cerr << "[Phase 3] Writing " << result.model.size() << " loci to " << output << std::endl;
    LineWriter writer(output);
    writer.write_all(lines);
    writer.close();

    std::cerr << "\n=== Fingerprint Summary ===" << std::endl;
    std::cerr << "Samples:     " << result.model.samples().size() << std::endl;
    std::cerr << "References:  " << result.references << std::endl;
    std::cerr << "Read tips:   " << result.tips << std::endl;
    std::cerr << "Clusters:    " << result.clusters << std::endl;
    std::cerr << "Bins:        " << result.bins << std::endl;
    std::cerr << "Loci:        " << result.model.size() << std::endl;
    return 0;
}

int run_filter_gff(int argc, char* argv[]) {
    std::string input;
    std::string output = "-";
    std::vector<GffFilterRule> rules;
    Combinator combinator = Combinator::kAll;

    ArgCursor args(argc, argv, 2);
    std::string arg;
    while (args.next(arg)) {
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-i" || arg == "--input") {
            input = args.value(arg);
        } else if (arg == "-f" || arg == "--filter") {
            rules.push_back(parse_filter_string(args.value(arg)));
        } else if (arg == "-c" || arg == "--combine") {
            combinator = parse_combinator(args.value(arg));
        } else if (arg == "-o" || arg == "--output") {
            output = args.value(arg);
        } else {
            throw UsageError("unknown argument " + arg);
        }
    }
    if (input.empty()) {
        throw UsageError("an input GFF file is required");
    }

    LineWriter writer(output);
    const int64_t kept = filter_gff(input, rules, combinator, writer);
    writer.close();
    std::cerr << "[FilterGff] kept " << kept << " feature(s)" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    try {
        if (command == "fingerprint") {
            return run_fingerprint(argc, argv);
        }
        if (command == "filter-gff") {
            return run_filter_gff(argc, argv);
        }
        if (command == "-h" || command == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        throw UsageError("unknown command '" + command + "'");
    } catch (const UsageError& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return 1;
    }
}
