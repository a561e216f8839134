#include "annotation_reader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace tefp {
namespace {

constexpr const char* kGffColumns[] = {
    "seqid", "source", "type", "start", "end", "score", "strand", "phase"};

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(text);
    while (std::getline(in, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

bool parse_int64(const std::string& text, int64_t& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return false;
    value = static_cast<int64_t>(parsed);
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

}  // namespace

// ============= GffRecord =============

bool GffRecord::get(const std::string& field, std::string& value) const {
    if (field == "seqid") { value = seqid; return true; }
    if (field == "source") { value = source; return true; }
    if (field == "type") { value = type; return true; }
    if (field == "start") { value = std::to_string(start); return true; }
    if (field == "end") { value = std::to_string(end); return true; }
    if (field == "score") { value = score; return true; }
    if (field == "strand") { value = std::string(1, strand); return true; }
    if (field == "phase") { value = phase; return true; }
    for (const auto& [key, attr_value] : attributes) {
        if (key == field) {
            value = attr_value;
            return true;
        }
    }
    return false;
}

std::vector<std::string> GffRecord::field_names() const {
    std::vector<std::string> names(std::begin(kGffColumns), std::end(kGffColumns));
    for (const auto& attribute : attributes) {
        names.push_back(attribute.first);
    }
    return names;
}

std::string gff_encode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case ';': case '=': case '&': case ',': case '\t': case '%': case '\n': {
                const auto byte = static_cast<unsigned char>(c);
                out.push_back('%');
                out.push_back(kHex[byte >> 4]);
                out.push_back(kHex[byte & 0x0F]);
                break;
            }
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string gff_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int hi = hex_value(value[i + 1]);
            const int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

GffRecord parse_gff_line(const std::string& line, int64_t line_number) {
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }

    const auto columns = split(trimmed, '\t');
    if (columns.size() != 9) {
        throw InputError("malformed GFF line " + std::to_string(line_number) + ": expected 9 columns, found " +
                         std::to_string(columns.size()));
    }

    GffRecord record;
    record.seqid = gff_decode(columns[0]);
    record.source = gff_decode(columns[1]);
    record.type = gff_decode(columns[2]);
    if (!parse_int64(columns[3], record.start) || !parse_int64(columns[4], record.end)) {
        throw InputError("malformed GFF line " + std::to_string(line_number) + ": non-integer start or end");
    }
    if (record.end < record.start) {
        throw InputError("malformed GFF line " + std::to_string(line_number) + ": end before start");
    }
    record.score = columns[5];
    if (columns[6].size() != 1) {
        throw InputError("malformed GFF line " + std::to_string(line_number) + ": invalid strand '" +
                         columns[6] + "'");
    }
    record.strand = columns[6][0];
    record.phase = columns[7];

    if (columns[8] != "." && !columns[8].empty()) {
        for (const auto& pair : split(columns[8], ';')) {
            if (pair.empty()) continue;
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                throw InputError("malformed GFF line " + std::to_string(line_number) +
                                 ": attribute without '=': " + pair);
            }
            record.attributes.emplace_back(gff_decode(pair.substr(0, eq)), gff_decode(pair.substr(eq + 1)));
        }
    }
    return record;
}

std::string format_gff_record(const GffRecord& record) {
    std::ostringstream out;
    out << gff_encode(record.seqid) << '\t'
        << gff_encode(record.source) << '\t'
        << gff_encode(record.type) << '\t'
        << record.start << '\t'
        << record.end << '\t'
        << record.score << '\t'
        << record.strand << '\t'
        << record.phase << '\t';
    if (record.attributes.empty()) {
        out << '.';
    }
    for (size_t i = 0; i < record.attributes.size(); ++i) {
        if (i > 0) out << ';';
        out << gff_encode(record.attributes[i].first) << '=' << gff_encode(record.attributes[i].second);
    }
    return out.str();
}

// ============= GffReader =============

struct GffReader::Handle {
    htsFile* file = nullptr;
    kstring_t line = {0, 0, nullptr};
};

GffReader::GffReader(const std::string& path) : path_(path), handle_(new Handle) {
    handle_->file = hts_open(path_.c_str(), "r");
    if (!handle_->file) {
        std::cerr << "[GffReader] failed to open: " << path_ << '\n';
        return;
    }
    valid_ = true;
}

GffReader::~GffReader() {
    if (handle_ != nullptr) {
        if (handle_->file != nullptr) {
            hts_close(handle_->file);
        }
        free(handle_->line.s);
        delete handle_;
    }
}

int64_t GffReader::stream(const std::function<void(const GffRecord&)>& handler) {
    if (!valid_) {
        throw InputError("cannot read GFF file: " + path_);
    }

    int64_t line_number = 0;
    int64_t features = 0;
    int rc = 0;
    while ((rc = hts_getline(handle_->file, KS_SEP_LINE, &handle_->line)) >= 0) {
        ++line_number;
        const std::string line(handle_->line.s, handle_->line.l);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        handler(parse_gff_line(line, line_number));
        ++features;
    }
    if (rc < -1) {
        throw InputError("read error in GFF file " + path_ + " after line " + std::to_string(line_number));
    }
    return features;
}

// ============= Annotations =============

AnnotationLocus annotation_from_record(const GffRecord& record, size_t order) {
    AnnotationLocus annotation;
    annotation.locus = Locus{record.seqid, record.start, record.end};
    annotation.strand = parse_strand(record.strand);
    annotation.order = order;
    if (!record.get("ID", annotation.id) && !record.get("Name", annotation.id)) {
        annotation.id = record.seqid + ":" + std::to_string(record.start) + "-" + std::to_string(record.end);
    }
    return annotation;
}

std::vector<AnnotationLocus> read_annotations(
    const std::string& path,
    const std::vector<std::string>& references) {
    GffReader reader(path);
    std::vector<AnnotationLocus> annotations;
    size_t order = 0;
    reader.stream([&](const GffRecord& record) {
        const size_t current = order++;
        if (!references.empty() &&
            std::find(references.begin(), references.end(), record.seqid) == references.end()) {
            return;
        }
        annotations.push_back(annotation_from_record(record, current));
    });
    return annotations;
}

// ============= AnnotationIndex =============

AnnotationIndex::AnnotationIndex(std::vector<AnnotationLocus> annotations)
    : annotations_(std::move(annotations)) {
    std::stable_sort(annotations_.begin(), annotations_.end(), [](const auto& a, const auto& b) {
        return a.order < b.order;
    });
    for (size_t i = 0; i < annotations_.size(); ++i) {
        auto& view = views_[annotations_[i].locus.reference];
        view.by_start.push_back(i);
        view.by_stop.push_back(i);
    }
    for (auto& [reference, view] : views_) {
        std::stable_sort(view.by_start.begin(), view.by_start.end(), [this](size_t a, size_t b) {
            return annotations_[a].locus.start < annotations_[b].locus.start;
        });
        std::stable_sort(view.by_stop.begin(), view.by_stop.end(), [this](size_t a, size_t b) {
            return annotations_[a].locus.stop < annotations_[b].locus.stop;
        });
    }
}

std::vector<const AnnotationLocus*> AnnotationIndex::starting_within(
    const std::string& reference, int64_t low, int64_t high) const {
    std::vector<const AnnotationLocus*> hits;
    const auto it = views_.find(reference);
    if (it == views_.end() || low > high) return hits;

    const auto& order = it->second.by_start;
    auto first = std::lower_bound(order.begin(), order.end(), low, [this](size_t idx, int64_t value) {
        return annotations_[idx].locus.start < value;
    });
    for (; first != order.end() && annotations_[*first].locus.start <= high; ++first) {
        hits.push_back(&annotations_[*first]);
    }
    std::sort(hits.begin(), hits.end(), [](const AnnotationLocus* a, const AnnotationLocus* b) {
        return a->order < b->order;
    });
    return hits;
}

std::vector<const AnnotationLocus*> AnnotationIndex::ending_within(
    const std::string& reference, int64_t low, int64_t high) const {
    std::vector<const AnnotationLocus*> hits;
    const auto it = views_.find(reference);
    if (it == views_.end() || low > high) return hits;

    const auto& order = it->second.by_stop;
    auto first = std::lower_bound(order.begin(), order.end(), low, [this](size_t idx, int64_t value) {
        return annotations_[idx].locus.stop < value;
    });
    for (; first != order.end() && annotations_[*first].locus.stop <= high; ++first) {
        hits.push_back(&annotations_[*first]);
    }
    std::sort(hits.begin(), hits.end(), [](const AnnotationLocus* a, const AnnotationLocus* b) {
        return a->order < b->order;
    });
    return hits;
}

}  // namespace tefp
