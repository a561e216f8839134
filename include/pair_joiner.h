#ifndef TEFP_PAIR_JOINER_H
#define TEFP_PAIR_JOINER_H

#include "annotation_reader.h"
#include "bin_merger.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tefp {

struct JoinConfig {
    int64_t join_distance = 25;
    size_t n_common_elements = 2;
};

/**
 * Flank: all same-strand clusters of one bin, i.e. one side of a
 * putative insertion. Extent is trimmed (true member positions).
 */
struct Flank {
    Strand strand = Strand::kUnknown;
    Locus extent;
    std::vector<const Cluster*> clusters;

    size_t point_count() const;
};

/**
 * ElementSummary: the n most common elements among a locus' member points.
 *
 * counts[s][e] is the number of points of samples[s] assigned to elements[e].
 * max_count_proportion is the largest per-sample count of elements[0] divided
 * by its count summed over samples.
 */
struct ElementSummary {
    std::vector<std::string> samples;
    std::vector<std::string> elements;
    std::vector<std::vector<int64_t>> counts;
    std::vector<int64_t> sample_points;
    double max_count_proportion = 0.0;

    int64_t total_points() const;
    size_t supporting_samples() const;
};

ElementSummary summarize_elements(
    const std::vector<const Cluster*>& clusters,
    const std::vector<std::string>& samples,
    size_t n_common_elements);

/**
 * JoinedLocus: one reported insertion site (two joined flanks or a single
 * unpaired flank).
 */
struct JoinedLocus {
    Locus locus;
    std::string category;
    Strand strand = Strand::kUnknown;  // strand of a single flank; kUnknown when joined
    bool joined = false;
    bool anchored = false;             // joined through a known element
    std::string annotation_id;         // known element, empty if none
    std::vector<Locus> flanks;         // trimmed, upstream first
    size_t cluster_count = 0;
    ElementSummary elements;
};

struct PairDecision {
    bool paired = false;
    bool anchored = false;
    int64_t distance = 0;
    const AnnotationLocus* annotation = nullptr;
};

/**
 * PairJoiner: joins the two flanks of an insertion. Flanks may come from
 * different bins of the same reference and category.
 *
 * A forward (upstream) and a reverse (downstream) flank are joined when a
 * known element starts within join_distance of the upstream stop and ends
 * within join_distance of the downstream start; without such an element they
 * are joined when their gap is at most 2 * join_distance.
 */
class PairJoiner {
public:
    explicit PairJoiner(JoinConfig config, const AnnotationIndex* annotations = nullptr);

    std::vector<JoinedLocus> join(const Bin& bin, const std::vector<std::string>& samples) const;

    // Bins of one reference and category, in any order.
    std::vector<JoinedLocus> join(const std::vector<Bin>& bins, const std::vector<std::string>& samples) const;

    // Symmetric: evaluate_pair(a, b) == evaluate_pair(b, a).
    PairDecision evaluate_pair(const Flank& a, const Flank& b) const;

    std::vector<Flank> flanks(const Bin& bin) const;

    const JoinConfig& config() const { return config_; }

private:
    std::vector<JoinedLocus> join_flanks(
        std::vector<Flank> sides,
        const std::vector<std::string>& samples) const;

    // Indices after upstream that evaluate_pair could accept, ascending.
    std::vector<size_t> downstream_candidates(const std::vector<Flank>& sides, size_t upstream) const;

    const AnnotationLocus* nearest_known_element(const Flank& flank) const;

    JoinedLocus make_locus(
        const std::vector<const Flank*>& parts,
        const PairDecision& decision,
        const std::vector<std::string>& samples) const;

    JoinConfig config_;
    const AnnotationIndex* annotations_;
};

}  // namespace tefp

#endif  // TEFP_PAIR_JOINER_H
