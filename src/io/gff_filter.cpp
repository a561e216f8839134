#include "gff_filter.h"

#include "line_writer.h"

#include <cstdlib>
#include <stdexcept>

#include <fnmatch.h>

namespace tefp {
namespace {

std::string strip(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

bool parse_number(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

template <typename T>
bool compare(const T& lhs, FilterOp op, const T& rhs) {
    switch (op) {
        case FilterOp::kEqual: return lhs == rhs;
        case FilterOp::kNotEqual: return lhs != rhs;
        case FilterOp::kGreaterEqual: return lhs >= rhs;
        case FilterOp::kGreater: return lhs > rhs;
        case FilterOp::kLessEqual: return lhs <= rhs;
        case FilterOp::kLess: return lhs < rhs;
    }
    return false;
}

}  // namespace

const char* filter_op_symbol(FilterOp op) {
    switch (op) {
        case FilterOp::kEqual: return "==";
        case FilterOp::kNotEqual: return "!=";
        case FilterOp::kGreaterEqual: return ">=";
        case FilterOp::kGreater: return ">";
        case FilterOp::kLessEqual: return "<=";
        case FilterOp::kLess: return "<";
    }
    return "?";
}

Combinator parse_combinator(const std::string& name) {
    if (name == "ANY") return Combinator::kAny;
    if (name == "ALL") return Combinator::kAll;
    throw std::invalid_argument("invalid combinator '" + name + "': must be ANY or ALL");
}

GffFilterRule parse_filter_string(const std::string& text) {
    size_t found = 0;
    size_t op_pos = 0;
    size_t op_len = 0;
    FilterOp op = FilterOp::kEqual;

    for (size_t i = 0; i < text.size();) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';
        size_t len = 0;
        FilterOp current = FilterOp::kEqual;
        if (c == '>' && next == '=') { len = 2; current = FilterOp::kGreaterEqual; }
        else if (c == '<' && next == '=') { len = 2; current = FilterOp::kLessEqual; }
        else if (c == '=' && next == '=') { len = 2; current = FilterOp::kEqual; }
        else if (c == '!' && next == '=') { len = 2; current = FilterOp::kNotEqual; }
        else if (c == '>') { len = 1; current = FilterOp::kGreater; }
        else if (c == '<') { len = 1; current = FilterOp::kLess; }
        else if (c == '=') { len = 1; current = FilterOp::kEqual; }

        if (len == 0) {
            ++i;
            continue;
        }
        ++found;
        op_pos = i;
        op_len = len;
        op = current;
        i += len;
    }

    if (found > 1) {
        throw std::invalid_argument("more than one operator in filter: \"" + text + "\"");
    }
    if (found == 0) {
        throw std::invalid_argument("no valid operator in filter: \"" + text + "\"");
    }

    GffFilterRule rule;
    rule.field = strip(text.substr(0, op_pos));
    rule.op = op;
    rule.value = strip(text.substr(op_pos + op_len));
    if (rule.field.empty()) {
        throw std::invalid_argument("missing field in filter: \"" + text + "\"");
    }
    return rule;
}

bool compare_values(const std::string& lhs, FilterOp op, const std::string& rhs) {
    double x = 0.0;
    double y = 0.0;
    if (parse_number(lhs, x) && parse_number(rhs, y)) {
        return compare(x, op, y);
    }
    return compare(lhs, op, rhs);
}

bool apply_filter(const GffRecord& record, const GffFilterRule& rule, Combinator combinator) {
    bool any_field = false;
    for (const auto& name : record.field_names()) {
        if (fnmatch(rule.field.c_str(), name.c_str(), 0) != 0) {
            continue;
        }
        std::string value;
        record.get(name, value);
        const bool pass = compare_values(value, rule.op, rule.value);
        any_field = true;
        if (combinator == Combinator::kAny && pass) return true;
        if (combinator == Combinator::kAll && !pass) return false;
    }
    if (!any_field) return false;
    return combinator == Combinator::kAll;
}

bool apply_filters(const GffRecord& record, const std::vector<GffFilterRule>& rules, Combinator combinator) {
    for (const auto& rule : rules) {
        const bool pass = apply_filter(record, rule, combinator);
        if (combinator == Combinator::kAny && pass) return true;
        if (combinator == Combinator::kAll && !pass) return false;
    }
    return combinator == Combinator::kAll;
}

int64_t filter_gff(
    const std::string& input_path,
    const std::vector<GffFilterRule>& rules,
    Combinator combinator,
    LineWriter& out) {
    GffReader reader(input_path);
    if (!reader.is_valid()) {
        throw InputError("cannot read GFF file: " + input_path);
    }

    out.write_line("##gff-version 3");
    int64_t written = 0;
    reader.stream([&](const GffRecord& record) {
        if (apply_filters(record, rules, combinator)) {
            out.write_line(format_gff_record(record));
            ++written;
        }
    });
    return written;
}

}  // namespace tefp
