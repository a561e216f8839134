#include "pair_joiner.h"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace tefp {
namespace {

bool flank_before(const Flank& a, const Flank& b) {
    return std::tie(a.extent.start, a.extent.stop, a.strand) <
           std::tie(b.extent.start, b.extent.stop, b.strand);
}

struct Candidate {
    size_t upstream = 0;
    size_t downstream = 0;
    PairDecision decision;
};

}  // namespace

size_t Flank::point_count() const {
    size_t total = 0;
    for (const auto* cluster : clusters) {
        total += cluster->size();
    }
    return total;
}

int64_t ElementSummary::total_points() const {
    int64_t total = 0;
    for (int64_t n : sample_points) total += n;
    return total;
}

size_t ElementSummary::supporting_samples() const {
    return static_cast<size_t>(std::count_if(sample_points.begin(), sample_points.end(),
                                             [](int64_t n) { return n > 0; }));
}

ElementSummary summarize_elements(
    const std::vector<const Cluster*>& clusters,
    const std::vector<std::string>& samples,
    size_t n_common_elements) {
    ElementSummary summary;
    summary.samples = samples;
    summary.sample_points.assign(samples.size(), 0);

    std::map<std::string, size_t> sample_index;
    for (size_t i = 0; i < samples.size(); ++i) {
        sample_index.emplace(samples[i], i);
    }

    std::map<std::string, int64_t> totals;
    std::vector<std::map<std::string, int64_t>> per_sample(samples.size());
    for (const auto* cluster : clusters) {
        const auto it = sample_index.find(cluster->key().sample);
        if (it == sample_index.end()) continue;
        const size_t s = it->second;
        for (size_t i = 0; i < cluster->size(); ++i) {
            const auto& element = cluster->member(i).element;
            ++totals[element];
            ++per_sample[s][element];
            ++summary.sample_points[s];
        }
    }

    std::vector<std::pair<std::string, int64_t>> ranked(totals.begin(), totals.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (ranked.size() > n_common_elements) {
        ranked.resize(n_common_elements);
    }

    for (const auto& entry : ranked) {
        summary.elements.push_back(entry.first);
    }
    summary.counts.assign(samples.size(), std::vector<int64_t>(summary.elements.size(), 0));
    for (size_t s = 0; s < samples.size(); ++s) {
        for (size_t e = 0; e < summary.elements.size(); ++e) {
            const auto it = per_sample[s].find(summary.elements[e]);
            if (it != per_sample[s].end()) {
                summary.counts[s][e] = it->second;
            }
        }
    }

    if (!summary.elements.empty()) {
        int64_t top_total = 0;
        int64_t top_max = 0;
        for (size_t s = 0; s < samples.size(); ++s) {
            top_total += summary.counts[s][0];
            top_max = std::max(top_max, summary.counts[s][0]);
        }
        if (top_total > 0) {
            summary.max_count_proportion = static_cast<double>(top_max) / static_cast<double>(top_total);
        }
    }
    return summary;
}

// ============= PairJoiner =============

PairJoiner::PairJoiner(JoinConfig config, const AnnotationIndex* annotations)
    : config_(std::move(config)), annotations_(annotations) {}

std::vector<Flank> PairJoiner::flanks(const Bin& bin) const {
    std::map<Strand, Flank> by_strand;
    for (const auto* member : bin.members) {
        const Locus trimmed = trim(*member->cluster);
        auto [it, inserted] = by_strand.try_emplace(member->key().strand);
        auto& flank = it->second;
        if (inserted) {
            flank.strand = member->key().strand;
            flank.extent = trimmed;
        } else {
            flank.extent.start = std::min(flank.extent.start, trimmed.start);
            flank.extent.stop = std::max(flank.extent.stop, trimmed.stop);
        }
        flank.clusters.push_back(member->cluster);
    }

    std::vector<Flank> result;
    for (auto& entry : by_strand) {
        result.push_back(std::move(entry.second));
    }
    std::sort(result.begin(), result.end(), flank_before);
    return result;
}

PairDecision PairJoiner::evaluate_pair(const Flank& a, const Flank& b) const {
    PairDecision decision;

    const Flank* upstream = &a;
    const Flank* downstream = &b;
    if (flank_before(b, a)) {
        std::swap(upstream, downstream);
    }

    if (upstream->extent.reference != downstream->extent.reference) {
        return decision;
    }
    // Tips of forward reads mark the left flank, reverse reads the right flank.
    if (upstream->strand == Strand::kReverse || downstream->strand == Strand::kForward) {
        return decision;
    }

    const int64_t distance = config_.join_distance;
    const int64_t upstream_stop = upstream->extent.stop;
    const int64_t downstream_start = downstream->extent.start;

    if (annotations_ != nullptr && !annotations_->empty()) {
        const auto hits = annotations_->starting_within(
            upstream->extent.reference, upstream_stop - distance, upstream_stop + distance);
        for (const auto* hit : hits) {
            const int64_t to_downstream = std::llabs(downstream_start - hit->locus.stop);
            if (to_downstream > distance) continue;
            const int64_t total = std::llabs(hit->locus.start - upstream_stop) + to_downstream;
            if (decision.annotation == nullptr || total < decision.distance) {
                decision.annotation = hit;
                decision.distance = total;
            }
        }
        if (decision.annotation != nullptr) {
            decision.paired = true;
            decision.anchored = true;
            return decision;
        }
    }

    const int64_t gap = std::max<int64_t>(0, downstream_start - upstream_stop);
    if (gap <= 2 * distance) {
        decision.paired = true;
        decision.distance = gap;
    }
    return decision;
}

const AnnotationLocus* PairJoiner::nearest_known_element(const Flank& flank) const {
    if (annotations_ == nullptr || annotations_->empty()) {
        return nullptr;
    }

    const int64_t distance = config_.join_distance;
    const auto& reference = flank.extent.reference;
    const AnnotationLocus* best = nullptr;
    int64_t best_distance = 0;

    auto consider = [&](const AnnotationLocus* hit, int64_t d) {
        if (best == nullptr || d < best_distance ||
            (d == best_distance && hit->order < best->order)) {
            best = hit;
            best_distance = d;
        }
    };

    if (flank.strand != Strand::kReverse) {
        const int64_t stop = flank.extent.stop;
        for (const auto* hit : annotations_->starting_within(reference, stop - distance, stop + distance)) {
            consider(hit, std::llabs(hit->locus.start - stop));
        }
    }
    if (flank.strand != Strand::kForward) {
        const int64_t start = flank.extent.start;
        for (const auto* hit : annotations_->ending_within(reference, start - distance, start + distance)) {
            consider(hit, std::llabs(hit->locus.stop - start));
        }
    }
    return best;
}

JoinedLocus PairJoiner::make_locus(
    const std::vector<const Flank*>& parts,
    const PairDecision& decision,
    const std::vector<std::string>& samples) const {
    JoinedLocus locus;
    locus.joined = parts.size() > 1;
    locus.anchored = decision.anchored;
    locus.strand = locus.joined ? Strand::kUnknown : parts.front()->strand;
    if (decision.annotation != nullptr) {
        locus.annotation_id = decision.annotation->id;
    }

    std::vector<const Cluster*> clusters;
    std::set<std::string> categories;
    locus.locus = parts.front()->extent;
    for (const auto* part : parts) {
        locus.locus.start = std::min(locus.locus.start, part->extent.start);
        locus.locus.stop = std::max(locus.locus.stop, part->extent.stop);
        locus.flanks.push_back(part->extent);
        for (const auto* cluster : part->clusters) {
            clusters.push_back(cluster);
            categories.insert(cluster->key().category);
        }
    }
    for (const auto& category : categories) {
        if (!locus.category.empty()) locus.category += ',';
        locus.category += category;
    }

    locus.cluster_count = clusters.size();
    locus.elements = summarize_elements(clusters, samples, config_.n_common_elements);
    return locus;
}

std::vector<size_t> PairJoiner::downstream_candidates(const std::vector<Flank>& sides, size_t upstream) const {
    std::set<size_t> found;
    const Flank& up = sides[upstream];
    if (up.strand == Strand::kReverse) {
        return {};
    }
    const int64_t distance = config_.join_distance;
    const int64_t stop = up.extent.stop;

    // Sides are sorted by start, so the scan ends at the first start too far away.
    for (size_t j = upstream + 1; j < sides.size() && sides[j].extent.start <= stop + 2 * distance; ++j) {
        found.insert(j);
    }

    if (annotations_ != nullptr && !annotations_->empty()) {
        auto start_before = [](const Flank& flank, int64_t position) { return flank.extent.start < position; };
        for (const auto* hit : annotations_->starting_within(up.extent.reference, stop - distance, stop + distance)) {
            auto it = std::lower_bound(sides.begin() + upstream + 1, sides.end(),
                                       hit->locus.stop - distance, start_before);
            for (; it != sides.end() && it->extent.start <= hit->locus.stop + distance; ++it) {
                found.insert(static_cast<size_t>(it - sides.begin()));
            }
        }
    }
    return std::vector<size_t>(found.begin(), found.end());
}

std::vector<JoinedLocus> PairJoiner::join(const Bin& bin, const std::vector<std::string>& samples) const {
    return join_flanks(flanks(bin), samples);
}

std::vector<JoinedLocus> PairJoiner::join(const std::vector<Bin>& bins, const std::vector<std::string>& samples) const {
    std::vector<Flank> sides;
    for (const auto& bin : bins) {
        for (auto& flank : flanks(bin)) {
            sides.push_back(std::move(flank));
        }
    }
    std::sort(sides.begin(), sides.end(), flank_before);
    return join_flanks(std::move(sides), samples);
}

std::vector<JoinedLocus> PairJoiner::join_flanks(
    std::vector<Flank> sides,
    const std::vector<std::string>& samples) const {
    std::vector<Candidate> candidates;
    for (size_t i = 0; i < sides.size(); ++i) {
        for (size_t j : downstream_candidates(sides, i)) {
            const auto decision = evaluate_pair(sides[i], sides[j]);
            if (decision.paired) {
                candidates.push_back({i, j, decision});
            }
        }
    }
    // Anchored pairs first, then the closest.
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.decision.anchored != b.decision.anchored) return a.decision.anchored;
        return a.decision.distance < b.decision.distance;
    });

    std::vector<JoinedLocus> loci;
    std::vector<bool> used(sides.size(), false);
    for (const auto& candidate : candidates) {
        if (used[candidate.upstream] || used[candidate.downstream]) continue;
        used[candidate.upstream] = true;
        used[candidate.downstream] = true;
        loci.push_back(make_locus({&sides[candidate.upstream], &sides[candidate.downstream]},
                                  candidate.decision, samples));
    }

    for (size_t i = 0; i < sides.size(); ++i) {
        if (used[i]) continue;
        PairDecision single;
        single.annotation = nearest_known_element(sides[i]);
        loci.push_back(make_locus({&sides[i]}, single, samples));
    }

    loci.erase(std::remove_if(loci.begin(), loci.end(), [](const JoinedLocus& locus) {
                   return locus.elements.supporting_samples() == 0;
               }),
               loci.end());
    std::sort(loci.begin(), loci.end(), [](const JoinedLocus& a, const JoinedLocus& b) {
        return std::tie(a.locus.start, a.locus.stop, a.strand) < std::tie(b.locus.start, b.locus.stop, b.strand);
    });
    return loci;
}

}  // namespace tefp
