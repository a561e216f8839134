#ifndef TEFP_DENSITY_CLUSTER_H
#define TEFP_DENSITY_CLUSTER_H

#include "coordinate_set.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tefp {

/**
 * ClusterSlice: half-open index range [lower, upper) into a sorted
 * position vector. Avoids copying member positions.
 */
struct ClusterSlice {
    size_t lower = 0;
    size_t upper = 0;

    bool empty() const { return lower >= upper; }
    size_t size() const { return upper - lower; }

    bool operator==(const ClusterSlice& other) const {
        return lower == other.lower && upper == other.upper;
    }
};

/**
 * Cluster: members are a slice of a CoordinateSet (non-owning view).
 *
 * The exact member set is the maximal cluster for every epsilon in
 * [epsilon_lower, epsilon_upper]; support is the width of that range and
 * stability is member count times support.
 */
struct Cluster {
    const CoordinateSet* source = nullptr;
    ClusterSlice slice;

    int64_t epsilon_lower = 0;
    int64_t epsilon_upper = 0;
    int64_t support = 1;
    double stability = 0.0;

    size_t size() const { return slice.size(); }
    const CoordinateKey& key() const { return source->key(); }

    int64_t first_position() const { return source->positions()[slice.lower]; }
    int64_t last_position() const { return source->positions()[slice.upper - 1]; }

    const ReadTip& member(size_t i) const { return (*source)[slice.lower + i]; }
};

/**
 * Gap-based density clustering of positions[lower, upper).
 *
 * A cluster grows while the gap to the next position is <= epsilon and closes
 * at the first larger gap. Clusters with fewer than minimum_points members are
 * noise and are not returned. Positions must be sorted ascending.
 *
 * @throws std::invalid_argument on unsorted input, negative epsilon or
 *         minimum_points == 0
 */
std::vector<ClusterSlice> density_cluster(
    const std::vector<int64_t>& positions,
    size_t lower,
    size_t upper,
    int64_t epsilon,
    size_t minimum_points);

std::vector<ClusterSlice> density_cluster(
    const std::vector<int64_t>& positions,
    int64_t epsilon,
    size_t minimum_points);

/**
 * Per-point labels for the same partition: clusters are numbered from 0 in
 * ascending order, noise points are labelled -1.
 */
std::vector<int32_t> label_points(
    const std::vector<int64_t>& positions,
    int64_t epsilon,
    size_t minimum_points);

// Largest gap between adjacent positions in the slice (0 for one member).
int64_t max_internal_gap(const std::vector<int64_t>& positions, const ClusterSlice& slice);

/**
 * Flat (non-hierarchical) clusters of a coordinate set at one epsilon, with
 * support and stability filled in.
 */
std::vector<Cluster> cluster_coordinates(
    const CoordinateSet& coordinates,
    int64_t epsilon,
    size_t minimum_points);

}  // namespace tefp

#endif  // TEFP_DENSITY_CLUSTER_H
