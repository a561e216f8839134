#ifndef TEFP_GFF_FILTER_H
#define TEFP_GFF_FILTER_H

#include "annotation_reader.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tefp {

class LineWriter;

enum class FilterOp : uint8_t {
    kEqual = 0,
    kNotEqual = 1,
    kGreaterEqual = 2,
    kGreater = 3,
    kLessEqual = 4,
    kLess = 5
};

enum class Combinator : uint8_t {
    kAny = 0,
    kAll = 1
};

const char* filter_op_symbol(FilterOp op);

// "ANY" | "ALL" (case sensitive); throws std::invalid_argument otherwise.
Combinator parse_combinator(const std::string& name);

/**
 * GffFilterRule: "<field><op><value>". field may contain shell wildcards
 * and is matched against column names and attribute keys.
 */
struct GffFilterRule {
    std::string field;
    FilterOp op = FilterOp::kEqual;
    std::string value;
};

/**
 * Parse a filter string. Operators: == = != >= > <= <. Field and value are
 * trimmed of surrounding whitespace.
 * @throws std::invalid_argument unless exactly one operator is present
 */
GffFilterRule parse_filter_string(const std::string& text);

// Numeric comparison when both sides parse as numbers, string comparison otherwise.
bool compare_values(const std::string& lhs, FilterOp op, const std::string& rhs);

/**
 * Test one rule against every field matching its pattern, combined with
 * the combinator. No matching field means the rule fails.
 */
bool apply_filter(const GffRecord& record, const GffFilterRule& rule, Combinator combinator);

bool apply_filters(const GffRecord& record, const std::vector<GffFilterRule>& rules, Combinator combinator);

/**
 * Copy the features of a GFF3 file that pass the rules to out, after a
 * "##gff-version 3" header.
 * @return number of features written
 * @throws InputError if the input cannot be read
 */
int64_t filter_gff(
    const std::string& input_path,
    const std::vector<GffFilterRule>& rules,
    Combinator combinator,
    LineWriter& out);

}  // namespace tefp

#endif  // TEFP_GFF_FILTER_H
