#ifndef TEFP_RESULT_MODEL_H
#define TEFP_RESULT_MODEL_H

#include "pair_joiner.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace tefp {

enum class LineFormat : uint8_t {
    kTabular = 0,
    kCsv = 1,
    kGff = 2
};

// "tsv" | "csv" | "gff"; throws std::invalid_argument otherwise.
LineFormat parse_line_format(const std::string& name);

struct OutputOptions {
    size_t n_common_elements = 2;
    bool colour_by_proportion = true;
    std::string source = "tefp";
};

// "#RRGGBB" from blue (shared, low proportion) to red (sample specific).
std::string proportion_colour(double proportion);

class ResultModel;

/**
 * LineSequence: lazily formatted output lines (header first).
 *
 * Lines are formatted on dereference. Iterating again restarts from the
 * header; the sequence borrows the ResultModel, which must outlive it.
 */
class LineSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        iterator(const LineSequence* sequence, size_t index);

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const { return index_ == other.index_; }
        bool operator!=(const iterator& other) const { return index_ != other.index_; }

    private:
        const LineSequence* sequence_ = nullptr;
        size_t index_ = 0;
        mutable std::string line_;
        mutable bool formatted_ = false;
    };

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, size()); }

    // Header line plus one line per locus.
    size_t size() const { return order_.size() + 1; }
    LineFormat format() const { return format_; }

    std::string line(size_t index) const;

private:
    friend class ResultModel;

    LineSequence(const ResultModel* model, LineFormat format, std::vector<size_t> order);

    const ResultModel* model_;
    LineFormat format_;
    std::vector<size_t> order_;
};

/**
 * ResultModel: the final, ordered collection of joined loci of a run.
 */
class ResultModel {
public:
    ResultModel() = default;
    ResultModel(std::vector<JoinedLocus> loci, std::vector<std::string> samples, OutputOptions options = {});

    const std::vector<JoinedLocus>& loci() const { return loci_; }
    const std::vector<std::string>& samples() const { return samples_; }
    const OutputOptions& options() const { return options_; }

    size_t size() const { return loci_.size(); }
    bool empty() const { return loci_.empty(); }

    static const std::vector<std::string>& default_order();
    static const std::vector<std::string>& sortable_fields();

    /**
     * Lines in the given format, loci ordered by the given fields.
     * @throws std::invalid_argument for an unknown field name
     */
    LineSequence lines(LineFormat format, const std::vector<std::string>& order = default_order()) const;

    std::vector<std::string> column_names() const;

private:
    friend class LineSequence;

    struct Cell {
        std::string text;
        bool quoted = false;
    };

    std::vector<Cell> row(const JoinedLocus& locus) const;
    std::string header_line(LineFormat format) const;
    std::string record_line(const JoinedLocus& locus, LineFormat format) const;
    std::string gff_line(const JoinedLocus& locus) const;

    std::vector<JoinedLocus> loci_;
    std::vector<std::string> samples_;
    OutputOptions options_;
};

}  // namespace tefp

#endif  // TEFP_RESULT_MODEL_H
