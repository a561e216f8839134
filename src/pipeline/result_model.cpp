#include "result_model.h"

#include "annotation_reader.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tefp {
namespace {

std::string format_proportion(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << value;
    return out.str();
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string or_dot(const std::string& text) {
    return text.empty() ? "." : text;
}

std::string flank_text(const std::vector<Locus>& flanks) {
    std::string text;
    for (const auto& flank : flanks) {
        if (!text.empty()) text += ',';
        text += std::to_string(flank.start) + "-" + std::to_string(flank.stop);
    }
    return text;
}

// -1, 0, 1 comparison of two loci on one field.
int compare_field(const JoinedLocus& a, const JoinedLocus& b, const std::string& field) {
    auto cmp = [](const auto& x, const auto& y) { return x < y ? -1 : (y < x ? 1 : 0); };
    if (field == "reference") return cmp(a.locus.reference, b.locus.reference);
    if (field == "start") return cmp(a.locus.start, b.locus.start);
    if (field == "stop") return cmp(a.locus.stop, b.locus.stop);
    if (field == "category") return cmp(a.category, b.category);
    if (field == "strand") return cmp(strand_symbol(a.strand), strand_symbol(b.strand));
    if (field == "support") return cmp(a.elements.total_points(), b.elements.total_points());
    if (field == "joined") return cmp(a.joined, b.joined);
    if (field == "max_count_proportion") {
        return cmp(a.elements.max_count_proportion, b.elements.max_count_proportion);
    }
    throw std::invalid_argument("unknown sort field '" + field + "'");
}

}  // namespace

LineFormat parse_line_format(const std::string& name) {
    if (name == "tsv" || name == "tabular") return LineFormat::kTabular;
    if (name == "csv") return LineFormat::kCsv;
    if (name == "gff" || name == "gff3") return LineFormat::kGff;
    throw std::invalid_argument("unknown output format '" + name + "': must be tsv, csv or gff");
}

std::string proportion_colour(double proportion) {
    const double p = std::clamp(proportion, 0.0, 1.0);
    const int red = static_cast<int>(std::lround(255.0 * p));
    const int blue = 255 - red;
    std::ostringstream out;
    out << '#' << std::hex << std::uppercase << std::setfill('0')
        << std::setw(2) << red << "00" << std::setw(2) << blue;
    return out.str();
}

// ============= LineSequence =============

LineSequence::LineSequence(const ResultModel* model, LineFormat format, std::vector<size_t> order)
    : model_(model), format_(format), order_(std::move(order)) {}

std::string LineSequence::line(size_t index) const {
    if (index == 0) {
        return model_->header_line(format_);
    }
    return model_->record_line(model_->loci_[order_.at(index - 1)], format_);
}

LineSequence::iterator::iterator(const LineSequence* sequence, size_t index)
    : sequence_(sequence), index_(index) {}

LineSequence::iterator::reference LineSequence::iterator::operator*() const {
    if (!formatted_) {
        line_ = sequence_->line(index_);
        formatted_ = true;
    }
    return line_;
}

LineSequence::iterator& LineSequence::iterator::operator++() {
    ++index_;
    formatted_ = false;
    return *this;
}

LineSequence::iterator LineSequence::iterator::operator++(int) {
    iterator previous = *this;
    ++*this;
    return previous;
}

// ============= ResultModel =============

ResultModel::ResultModel(std::vector<JoinedLocus> loci, std::vector<std::string> samples, OutputOptions options)
    : loci_(std::move(loci)), samples_(std::move(samples)), options_(std::move(options)) {}

const std::vector<std::string>& ResultModel::default_order() {
    static const std::vector<std::string> order = {"reference", "start", "stop", "category"};
    return order;
}

const std::vector<std::string>& ResultModel::sortable_fields() {
    static const std::vector<std::string> fields = {
        "reference", "start", "stop", "category", "strand", "support", "joined", "max_count_proportion"};
    return fields;
}

LineSequence ResultModel::lines(LineFormat format, const std::vector<std::string>& order) const {
    for (const auto& field : order) {
        const auto& fields = sortable_fields();
        if (std::find(fields.begin(), fields.end(), field) == fields.end()) {
            throw std::invalid_argument("unknown sort field '" + field + "'");
        }
    }

    std::vector<size_t> indices(loci_.size());
    for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;
    std::stable_sort(indices.begin(), indices.end(), [this, &order](size_t a, size_t b) {
        for (const auto& field : order) {
            const int c = compare_field(loci_[a], loci_[b], field);
            if (c != 0) return c < 0;
        }
        return false;
    });
    return LineSequence(this, format, std::move(indices));
}

std::vector<std::string> ResultModel::column_names() const {
    std::vector<std::string> names = {
        "reference", "start", "stop", "strand", "category", "joined",
        "flanks", "known_element", "clusters", "support"};
    for (size_t e = 1; e <= options_.n_common_elements; ++e) {
        names.push_back("element_" + std::to_string(e));
    }
    for (const auto& sample : samples_) {
        for (size_t e = 1; e <= options_.n_common_elements; ++e) {
            names.push_back(sample + "_element_" + std::to_string(e) + "_count");
        }
    }
    names.push_back("max_count_proportion");
    return names;
}

std::vector<ResultModel::Cell> ResultModel::row(const JoinedLocus& locus) const {
    const auto& summary = locus.elements;
    std::vector<Cell> cells = {
        {locus.locus.reference, true},
        {std::to_string(locus.locus.start), false},
        {std::to_string(locus.locus.stop), false},
        {std::string(1, strand_symbol(locus.strand)), true},
        {locus.category, true},
        {locus.joined ? "1" : "0", false},
        {flank_text(locus.flanks), true},
        {or_dot(locus.annotation_id), true},
        {std::to_string(locus.cluster_count), false},
        {std::to_string(summary.total_points()), false},
    };
    for (size_t e = 0; e < options_.n_common_elements; ++e) {
        cells.push_back({e < summary.elements.size() ? summary.elements[e] : ".", true});
    }
    for (const auto& sample : samples_) {
        const auto it = std::find(summary.samples.begin(), summary.samples.end(), sample);
        const auto s = static_cast<size_t>(it - summary.samples.begin());
        for (size_t e = 0; e < options_.n_common_elements; ++e) {
            int64_t count = 0;
            if (it != summary.samples.end() && e < summary.elements.size()) {
                count = summary.counts[s][e];
            }
            cells.push_back({std::to_string(count), false});
        }
    }
    cells.push_back({format_proportion(summary.max_count_proportion), false});
    return cells;
}

std::string ResultModel::header_line(LineFormat format) const {
    if (format == LineFormat::kGff) {
        return "##gff-version 3";
    }
    std::string line;
    const char delimiter = format == LineFormat::kCsv ? ',' : '\t';
    for (const auto& name : column_names()) {
        if (!line.empty()) line.push_back(delimiter);
        line += format == LineFormat::kCsv ? quote(name) : name;
    }
    return line;
}

std::string ResultModel::record_line(const JoinedLocus& locus, LineFormat format) const {
    if (format == LineFormat::kGff) {
        return gff_line(locus);
    }
    std::string line;
    const bool csv = format == LineFormat::kCsv;
    bool first = true;
    for (const auto& cell : row(locus)) {
        if (!first) line.push_back(csv ? ',' : '\t');
        first = false;
        line += (csv && cell.quoted) ? quote(cell.text) : cell.text;
    }
    return line;
}

std::string ResultModel::gff_line(const JoinedLocus& locus) const {
    GffRecord record;
    record.seqid = locus.locus.reference;
    record.source = options_.source;
    record.type = locus.joined ? "insertion" : "flank";
    record.start = locus.locus.start;
    record.end = locus.locus.stop;
    record.strand = strand_symbol(locus.strand);

    const auto& summary = locus.elements;
    auto& attributes = record.attributes;
    attributes.emplace_back("ID", locus.category + "_" + locus.locus.reference + "_" +
                                      std::string(1, strand_symbol(locus.strand)) + "_" +
                                      std::to_string(locus.locus.start));
    attributes.emplace_back("category", locus.category);
    attributes.emplace_back("flanks", flank_text(locus.flanks));
    if (!locus.annotation_id.empty()) {
        attributes.emplace_back("known_element", locus.annotation_id);
    }
    attributes.emplace_back("support", std::to_string(summary.total_points()));
    for (size_t e = 0; e < summary.elements.size(); ++e) {
        attributes.emplace_back("element_" + std::to_string(e + 1), summary.elements[e]);
    }
    for (size_t s = 0; s < summary.samples.size(); ++s) {
        for (size_t e = 0; e < summary.elements.size(); ++e) {
            attributes.emplace_back(summary.samples[s] + "_element_" + std::to_string(e + 1) + "_count",
                                    std::to_string(summary.counts[s][e]));
        }
    }
    attributes.emplace_back("max_count_proportion", format_proportion(summary.max_count_proportion));
    if (options_.colour_by_proportion) {
        attributes.emplace_back("color", proportion_colour(summary.max_count_proportion));
    }
    return format_gff_record(record);
}

}  // namespace tefp
