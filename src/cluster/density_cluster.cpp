#include "density_cluster.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tefp {
namespace {

void check_arguments(
    const std::vector<int64_t>& positions,
    size_t lower,
    size_t upper,
    int64_t epsilon,
    size_t minimum_points) {
    if (epsilon < 0) {
        throw std::invalid_argument("epsilon must be >= 0, got " + std::to_string(epsilon));
    }
    if (minimum_points == 0) {
        throw std::invalid_argument("minimum_points must be >= 1");
    }
    if (lower > upper || upper > positions.size()) {
        throw std::invalid_argument("cluster slice out of range");
    }
    for (size_t i = lower + 1; i < upper; ++i) {
        if (positions[i] < positions[i - 1]) {
            throw std::invalid_argument("positions must be sorted in ascending order");
        }
    }
}

}  // namespace

std::vector<ClusterSlice> density_cluster(
    const std::vector<int64_t>& positions,
    size_t lower,
    size_t upper,
    int64_t epsilon,
    size_t minimum_points) {
    check_arguments(positions, lower, upper, epsilon, minimum_points);

    std::vector<ClusterSlice> slices;
    if (lower == upper) {
        return slices;
    }

    size_t cluster_start = lower;
    for (size_t i = lower + 1; i <= upper; ++i) {
        const bool closes = (i == upper) || (positions[i] - positions[i - 1] > epsilon);
        if (!closes) {
            continue;
        }
        if (i - cluster_start >= minimum_points) {
            slices.push_back({cluster_start, i});
        }
        cluster_start = i;
    }
    return slices;
}

std::vector<ClusterSlice> density_cluster(
    const std::vector<int64_t>& positions,
    int64_t epsilon,
    size_t minimum_points) {
    return density_cluster(positions, 0, positions.size(), epsilon, minimum_points);
}

std::vector<int32_t> label_points(
    const std::vector<int64_t>& positions,
    int64_t epsilon,
    size_t minimum_points) {
    std::vector<int32_t> labels(positions.size(), -1);
    const auto slices = density_cluster(positions, epsilon, minimum_points);
    for (size_t label = 0; label < slices.size(); ++label) {
        std::fill(labels.begin() + static_cast<std::ptrdiff_t>(slices[label].lower),
                  labels.begin() + static_cast<std::ptrdiff_t>(slices[label].upper),
                  static_cast<int32_t>(label));
    }
    return labels;
}

int64_t max_internal_gap(const std::vector<int64_t>& positions, const ClusterSlice& slice) {
    int64_t gap = 0;
    for (size_t i = slice.lower + 1; i < slice.upper; ++i) {
        gap = std::max(gap, positions[i] - positions[i - 1]);
    }
    return gap;
}

std::vector<Cluster> cluster_coordinates(
    const CoordinateSet& coordinates,
    int64_t epsilon,
    size_t minimum_points) {
    const auto& positions = coordinates.positions();
    const auto slices = density_cluster(positions, epsilon, minimum_points);

    std::vector<Cluster> clusters;
    clusters.reserve(slices.size());
    for (const auto& slice : slices) {
        Cluster cluster;
        cluster.source = &coordinates;
        cluster.slice = slice;
        cluster.epsilon_upper = epsilon;
        cluster.epsilon_lower = max_internal_gap(positions, slice);
        cluster.support = cluster.epsilon_upper - cluster.epsilon_lower + 1;
        cluster.stability = static_cast<double>(slice.size()) * static_cast<double>(cluster.support);
        clusters.push_back(cluster);
    }
    return clusters;
}

}  // namespace tefp
