#include "split_cluster.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tefp {

const char* split_method_name(SplitMethod method) {
    switch (method) {
        case SplitMethod::kNonHierarchical: return "IDBCAN";
        case SplitMethod::kConservative: return "SDBICAN";
        case SplitMethod::kAggressive: return "SDBICAN-aggressive";
    }
    return "UNKNOWN";
}

double stability_score(size_t member_count, int64_t epsilon_lower, int64_t epsilon_upper) {
    if (epsilon_upper < epsilon_lower) {
        return 0.0;
    }
    const int64_t support = epsilon_upper - epsilon_lower + 1;
    return static_cast<double>(member_count) * static_cast<double>(support);
}

// ============= ClusterTree =============

int32_t ClusterTree::add_node(const ClusterSlice& slice, int64_t epsilon_upper, int32_t parent) {
    ClusterNode node;
    node.slice = slice;
    node.epsilon_upper = epsilon_upper;
    node.epsilon_lower = epsilon_upper;
    node.parent = parent;
    nodes_.push_back(std::move(node));

    const auto idx = static_cast<int32_t>(nodes_.size() - 1);
    if (parent < 0) {
        roots_.push_back(idx);
    } else {
        nodes_[static_cast<size_t>(parent)].children.push_back(idx);
    }
    return idx;
}

std::vector<int32_t> ClusterTree::leaves() const {
    std::vector<int32_t> result;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].is_leaf()) {
            result.push_back(static_cast<int32_t>(i));
        }
    }
    return result;
}

std::vector<int32_t> ClusterTree::select(SplitMethod method) const {
    std::vector<int32_t> selected;

    switch (method) {
        case SplitMethod::kNonHierarchical:
            selected = roots_;
            break;

        case SplitMethod::kAggressive:
            selected = leaves();
            break;

        case SplitMethod::kConservative: {
            // Bottom-up: children always follow their parent in the arena.
            std::vector<double> best(nodes_.size(), 0.0);
            std::vector<bool> keep(nodes_.size(), true);
            for (size_t i = nodes_.size(); i-- > 0;) {
                const auto& node = nodes_[i];
                if (node.is_leaf()) {
                    best[i] = node.stability;
                    continue;
                }
                double children_total = 0.0;
                for (int32_t child : node.children) {
                    children_total += best[static_cast<size_t>(child)];
                }
                if (children_total > node.stability) {
                    best[i] = children_total;
                    keep[i] = false;
                } else {
                    best[i] = node.stability;
                }
            }

            std::vector<int32_t> stack(roots_.rbegin(), roots_.rend());
            while (!stack.empty()) {
                const int32_t idx = stack.back();
                stack.pop_back();
                if (keep[static_cast<size_t>(idx)]) {
                    selected.push_back(idx);
                    continue;
                }
                const auto& children = node(idx).children;
                stack.insert(stack.end(), children.rbegin(), children.rend());
            }
            break;
        }
    }

    std::sort(selected.begin(), selected.end(), [this](int32_t a, int32_t b) {
        return node(a).slice.lower < node(b).slice.lower;
    });
    return selected;
}

Cluster ClusterTree::to_cluster(int32_t idx) const {
    const auto& n = node(idx);
    Cluster cluster;
    cluster.source = source_;
    cluster.slice = n.slice;
    cluster.epsilon_lower = n.epsilon_lower;
    cluster.epsilon_upper = n.epsilon_upper;
    cluster.support = n.support;
    cluster.stability = n.stability;
    return cluster;
}

std::vector<Cluster> ClusterTree::selected_clusters(SplitMethod method) const {
    std::vector<Cluster> clusters;
    for (int32_t idx : select(method)) {
        clusters.push_back(to_cluster(idx));
    }
    return clusters;
}

// ============= SplitClusterer =============

SplitClusterer::SplitClusterer(int64_t minimum_epsilon, int64_t maximum_epsilon, size_t minimum_points)
    : minimum_epsilon_(minimum_epsilon),
      maximum_epsilon_(maximum_epsilon),
      minimum_points_(minimum_points) {
    if (minimum_epsilon_ < 0 || maximum_epsilon_ < 0) {
        throw std::invalid_argument("splitting epsilon values must be >= 0");
    }
    if (minimum_points_ == 0) {
        throw std::invalid_argument("minimum_points must be >= 1");
    }
}

ClusterTree SplitClusterer::build(const CoordinateSet& coordinates) const {
    ClusterTree tree;
    tree.source_ = &coordinates;

    const auto& positions = coordinates.positions();
    if (positions.empty()) {
        return tree;
    }

    const bool splitting = minimum_epsilon_ < maximum_epsilon_;

    std::vector<int32_t> pending;
    for (const auto& slice : density_cluster(positions, maximum_epsilon_, minimum_points_)) {
        pending.push_back(tree.add_node(slice, maximum_epsilon_, -1));
    }

    while (!pending.empty()) {
        const int32_t idx = pending.back();
        pending.pop_back();

        // Copy: add_node below may reallocate the arena.
        const ClusterSlice slice = tree.node(idx).slice;
        const int64_t epsilon_upper = tree.node(idx).epsilon_upper;

        const int64_t gap = max_internal_gap(positions, slice);
        const int64_t epsilon_lower = std::min(std::max(gap, minimum_epsilon_), epsilon_upper);

        auto& node = tree.nodes_[static_cast<size_t>(idx)];
        node.epsilon_lower = epsilon_lower;
        node.support = epsilon_upper - epsilon_lower + 1;
        node.stability = stability_score(slice.size(), epsilon_lower, epsilon_upper);

        if (!splitting || gap == 0 || gap - 1 < minimum_epsilon_) {
            continue;
        }

        const auto children = density_cluster(
            positions, slice.lower, slice.upper, gap - 1, minimum_points_);
        for (const auto& child : children) {
            pending.push_back(tree.add_node(child, gap - 1, idx));
        }
    }

    return tree;
}

std::vector<Cluster> SplitClusterer::cluster(const CoordinateSet& coordinates, SplitMethod method) const {
    return build(coordinates).selected_clusters(method);
}

}  // namespace tefp
