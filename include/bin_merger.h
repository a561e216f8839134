#ifndef TEFP_BIN_MERGER_H
#define TEFP_BIN_MERGER_H

#include "cluster_buffer.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tefp {

/**
 * Bin: buffered clusters whose extents overlap, directly or through a chain
 * of overlaps. Members are borrowed from the caller.
 */
struct Bin {
    std::string reference;
    int64_t start = 0;
    int64_t stop = 0;
    std::vector<const BufferedCluster*> members;

    Locus extent() const { return Locus{reference, start, stop}; }

    // Distinct sample names, ascending.
    std::vector<std::string> samples() const;
};

using ClustersBySample = std::map<std::string, std::vector<BufferedCluster>>;

/**
 * Merge buffered clusters of one reference into bins.
 *
 * Clusters are swept in (start, stop, sample, strand, category) order; a
 * cluster starting at or before the open bin's end joins that bin. The
 * result does not depend on input order.
 */
std::vector<Bin> merge_bins(const ClustersBySample& clusters_by_sample, const std::string& reference);

std::vector<Bin> merge_bins(std::vector<const BufferedCluster*> clusters, const std::string& reference);

}  // namespace tefp

#endif  // TEFP_BIN_MERGER_H
