#include "coordinate_set.h"

#include <algorithm>
#include <utility>

namespace tefp {

char strand_symbol(Strand strand) {
    switch (strand) {
        case Strand::kForward: return '+';
        case Strand::kReverse: return '-';
        default: return '.';
    }
}

Strand parse_strand(char symbol) {
    switch (symbol) {
        case '+': return Strand::kForward;
        case '-': return Strand::kReverse;
        default: return Strand::kUnknown;
    }
}

CoordinateSet::CoordinateSet(CoordinateKey key, std::vector<ReadTip> tips)
    : key_(std::move(key)), tips_(std::move(tips)) {
    for (const auto& tip : tips_) {
        if (tip.position < 1) {
            throw InputError("malformed read tip position " + std::to_string(tip.position) +
                             " on reference '" + key_.reference + "' in sample '" +
                             key_.sample + "'");
        }
    }

    std::stable_sort(tips_.begin(), tips_.end(), [](const ReadTip& a, const ReadTip& b) {
        return a.position < b.position;
    });

    positions_.reserve(tips_.size());
    for (const auto& tip : tips_) {
        positions_.push_back(tip.position);
    }
}

}  // namespace tefp
