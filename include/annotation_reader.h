#ifndef TEFP_ANNOTATION_READER_H
#define TEFP_ANNOTATION_READER_H

#include "coordinate_set.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tefp {

/**
 * GffRecord: one GFF3 feature line, attributes kept in file order.
 */
struct GffRecord {
    std::string seqid;
    std::string source = ".";
    std::string type = ".";
    int64_t start = 0;
    int64_t end = 0;
    std::string score = ".";
    char strand = '.';
    std::string phase = ".";
    std::vector<std::pair<std::string, std::string>> attributes;

    // Column or attribute value by name; false if absent.
    bool get(const std::string& field, std::string& value) const;

    // Column names followed by attribute keys.
    std::vector<std::string> field_names() const;
};

/**
 * Parse one GFF3 feature line.
 * @throws InputError naming the line number on malformed input
 */
GffRecord parse_gff_line(const std::string& line, int64_t line_number);

std::string format_gff_record(const GffRecord& record);

std::string gff_encode(const std::string& value);
std::string gff_decode(const std::string& value);

/**
 * GffReader: line reader for plain or bgzipped GFF3 (htslib text I/O).
 */
class GffReader {
public:
    explicit GffReader(const std::string& path);
    ~GffReader();

    GffReader(const GffReader&) = delete;
    GffReader& operator=(const GffReader&) = delete;

    bool is_valid() const { return valid_; }
    const std::string& path() const { return path_; }

    /**
     * Call handler for each feature line; comment and blank lines are skipped.
     * @return number of features read
     */
    int64_t stream(const std::function<void(const GffRecord&)>& handler);

private:
    std::string path_;
    struct Handle;
    Handle* handle_ = nullptr;
    bool valid_ = false;
};

/**
 * AnnotationLocus: known element from the annotation file.
 * order is the position of the record in the input, used to break ties.
 */
struct AnnotationLocus {
    Locus locus;
    Strand strand = Strand::kUnknown;
    std::string id;
    size_t order = 0;
};

/**
 * Read annotation loci. When references is non-empty only those are kept.
 * @throws InputError if the file cannot be opened or a line is malformed
 */
std::vector<AnnotationLocus> read_annotations(
    const std::string& path,
    const std::vector<std::string>& references = {});

AnnotationLocus annotation_from_record(const GffRecord& record, size_t order);

/**
 * AnnotationIndex: annotation loci grouped by reference, with views sorted by
 * start and by stop for range queries.
 */
class AnnotationIndex {
public:
    AnnotationIndex() = default;
    explicit AnnotationIndex(std::vector<AnnotationLocus> annotations);

    bool empty() const { return annotations_.empty(); }
    size_t size() const { return annotations_.size(); }

    // Annotations on reference with start in [low, high], in input order.
    std::vector<const AnnotationLocus*> starting_within(
        const std::string& reference, int64_t low, int64_t high) const;

    // Annotations on reference with stop in [low, high], in input order.
    std::vector<const AnnotationLocus*> ending_within(
        const std::string& reference, int64_t low, int64_t high) const;

private:
    struct ReferenceView {
        std::vector<size_t> by_start;
        std::vector<size_t> by_stop;
    };

    std::vector<AnnotationLocus> annotations_;
    std::map<std::string, ReferenceView> views_;
};

}  // namespace tefp

#endif  // TEFP_ANNOTATION_READER_H
