#ifndef TEFP_SPLIT_CLUSTER_H
#define TEFP_SPLIT_CLUSTER_H

#include "coordinate_set.h"
#include "density_cluster.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tefp {

enum class SplitMethod : uint8_t {
    kNonHierarchical = 0,
    kConservative = 1,
    kAggressive = 2  // deprecated
};

const char* split_method_name(SplitMethod method);

/**
 * ClusterNode: one cluster of the hierarchy.
 *
 * Stored in an arena (ClusterTree::nodes) and linked by index. A node is
 * always created after its parent, so children have larger indices.
 */
struct ClusterNode {
    ClusterSlice slice;
    int64_t epsilon_lower = 0;
    int64_t epsilon_upper = 0;
    int64_t support = 1;
    double stability = 0.0;

    int32_t parent = -1;
    std::vector<int32_t> children;

    bool is_leaf() const { return children.empty(); }
};

/**
 * Stability of a member set that stays a maximal cluster over the epsilon
 * range [epsilon_lower, epsilon_upper]: members times range width.
 */
double stability_score(size_t member_count, int64_t epsilon_lower, int64_t epsilon_upper);

class ClusterTree {
public:
    ClusterTree() = default;

    const CoordinateSet* source() const { return source_; }
    const std::vector<ClusterNode>& nodes() const { return nodes_; }
    const std::vector<int32_t>& roots() const { return roots_; }
    const ClusterNode& node(int32_t idx) const { return nodes_[static_cast<size_t>(idx)]; }

    bool empty() const { return nodes_.empty(); }

    std::vector<int32_t> leaves() const;

    /**
     * Node indices chosen by the given method, ordered by position.
     *   kNonHierarchical: the roots.
     *   kConservative:    a parent is kept unless its children's selected
     *                     stability sums to strictly more.
     *   kAggressive:      every leaf.
     */
    std::vector<int32_t> select(SplitMethod method) const;

    std::vector<Cluster> selected_clusters(SplitMethod method) const;

    Cluster to_cluster(int32_t idx) const;

private:
    friend class SplitClusterer;

    int32_t add_node(const ClusterSlice& slice, int64_t epsilon_upper, int32_t parent);

    const CoordinateSet* source_ = nullptr;
    std::vector<ClusterNode> nodes_;
    std::vector<int32_t> roots_;
};

/**
 * SplitClusterer: hierarchical splitting of density clusters.
 *
 * Roots are the density clusters at maximum_epsilon. A node whose largest
 * internal gap is G is re-clustered at G - 1 while G - 1 >= minimum_epsilon;
 * surviving sub-clusters become its children. No splitting happens when
 * minimum_epsilon >= maximum_epsilon.
 */
class SplitClusterer {
public:
    SplitClusterer(int64_t minimum_epsilon, int64_t maximum_epsilon, size_t minimum_points);

    ClusterTree build(const CoordinateSet& coordinates) const;

    std::vector<Cluster> cluster(const CoordinateSet& coordinates, SplitMethod method) const;

    int64_t minimum_epsilon() const { return minimum_epsilon_; }
    int64_t maximum_epsilon() const { return maximum_epsilon_; }
    size_t minimum_points() const { return minimum_points_; }

private:
    int64_t minimum_epsilon_;
    int64_t maximum_epsilon_;
    size_t minimum_points_;
};

}  // namespace tefp

#endif  // TEFP_SPLIT_CLUSTER_H
