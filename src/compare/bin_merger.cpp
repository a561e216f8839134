#include "bin_merger.h"

#include <algorithm>
#include <set>
#include <tuple>

namespace tefp {
namespace {

bool sweep_order(const BufferedCluster* a, const BufferedCluster* b) {
    const auto& ka = a->key();
    const auto& kb = b->key();
    const auto first_a = a->cluster->first_position();
    const auto first_b = b->cluster->first_position();
    const auto last_a = a->cluster->last_position();
    const auto last_b = b->cluster->last_position();
    const auto size_a = a->cluster->size();
    const auto size_b = b->cluster->size();
    return std::tie(a->extent.start, a->extent.stop, ka.sample, ka.strand, ka.category, first_a, last_a, size_a) <
           std::tie(b->extent.start, b->extent.stop, kb.sample, kb.strand, kb.category, first_b, last_b, size_b);
}

}  // namespace

std::vector<std::string> Bin::samples() const {
    std::set<std::string> names;
    for (const auto* member : members) {
        names.insert(member->key().sample);
    }
    return {names.begin(), names.end()};
}

std::vector<Bin> merge_bins(const ClustersBySample& clusters_by_sample, const std::string& reference) {
    std::vector<const BufferedCluster*> clusters;
    for (const auto& [sample, sample_clusters] : clusters_by_sample) {
        for (const auto& cluster : sample_clusters) {
            clusters.push_back(&cluster);
        }
    }
    return merge_bins(std::move(clusters), reference);
}

std::vector<Bin> merge_bins(std::vector<const BufferedCluster*> clusters, const std::string& reference) {
    clusters.erase(
        std::remove_if(clusters.begin(), clusters.end(), [&reference](const BufferedCluster* c) {
            return c == nullptr || c->extent.reference != reference;
        }),
        clusters.end());
    std::sort(clusters.begin(), clusters.end(), sweep_order);

    std::vector<Bin> bins;
    for (const auto* cluster : clusters) {
        if (!bins.empty() && cluster->extent.start <= bins.back().stop) {
            auto& open = bins.back();
            open.stop = std::max(open.stop, cluster->extent.stop);
            open.members.push_back(cluster);
            continue;
        }
        Bin bin;
        bin.reference = reference;
        bin.start = cluster->extent.start;
        bin.stop = cluster->extent.stop;
        bin.members.push_back(cluster);
        bins.push_back(std::move(bin));
    }
    return bins;
}

}  // namespace tefp
