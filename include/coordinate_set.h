#ifndef TEFP_COORDINATE_SET_H
#define TEFP_COORDINATE_SET_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace tefp {

/**
 * InputError: malformed coordinate or annotation input, unreadable files.
 * Fatal for the run.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

enum class Strand : uint8_t {
    kUnknown = 0,
    kForward = 1,
    kReverse = 2
};

char strand_symbol(Strand strand);
Strand parse_strand(char symbol);

/**
 * Locus: closed interval [start, stop] on a named reference.
 */
struct Locus {
    std::string reference;
    int64_t start = 0;
    int64_t stop = 0;

    int64_t length() const { return stop - start + 1; }

    bool contains(const Locus& other) const {
        return reference == other.reference && start <= other.start && other.stop <= stop;
    }

    bool overlaps(const Locus& other) const {
        return reference == other.reference && start <= other.stop && other.start <= stop;
    }

    bool operator==(const Locus& other) const {
        return reference == other.reference && start == other.start && stop == other.stop;
    }
    bool operator!=(const Locus& other) const { return !(*this == other); }
};

/**
 * ReadTip: one informative read tip.
 * Sample, category and strand live in the owning CoordinateSet's key.
 */
struct ReadTip {
    int64_t position = 0;
    std::string element;  // repeat element the read was assigned to
};

struct CoordinateKey {
    std::string reference;
    Strand strand = Strand::kUnknown;
    std::string category;
    std::string sample;

    bool operator<(const CoordinateKey& other) const {
        return std::tie(reference, strand, category, sample) <
               std::tie(other.reference, other.strand, other.category, other.sample);
    }
    bool operator==(const CoordinateKey& other) const {
        return reference == other.reference && strand == other.strand &&
               category == other.category && sample == other.sample;
    }
};

// Extracted input: every (reference, strand, category, sample) and its tips.
using TipTable = std::map<CoordinateKey, std::vector<ReadTip>>;

/**
 * CoordinateSet: read tips of one key, sorted by position.
 *
 * Sort is stable so tips sharing a position keep insertion order.
 * Immutable after construction.
 */
class CoordinateSet {
public:
    CoordinateSet(CoordinateKey key, std::vector<ReadTip> tips);

    const CoordinateKey& key() const { return key_; }
    const std::vector<ReadTip>& tips() const { return tips_; }
    const std::vector<int64_t>& positions() const { return positions_; }

    size_t size() const { return tips_.size(); }
    bool empty() const { return tips_.empty(); }

    const ReadTip& operator[](size_t idx) const { return tips_[idx]; }

private:
    CoordinateKey key_;
    std::vector<ReadTip> tips_;
    std::vector<int64_t> positions_;  // parallel to tips_, for the clustering scans
};

}  // namespace tefp

#endif  // TEFP_COORDINATE_SET_H
