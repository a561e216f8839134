#include "tip_extractor.h"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace tefp {

std::string assign_category(const std::string& element, const std::vector<std::string>& families) {
    if (families.empty()) {
        return ".";
    }
    for (const auto& family : families) {
        if (element.compare(0, family.size(), family) == 0) {
            return family;
        }
    }
    return "";
}

int64_t tip_position(
    int64_t pos,
    int64_t end,
    bool reverse,
    int32_t leading_soft_clip,
    int32_t trailing_soft_clip,
    bool include_soft_clips) {
    if (reverse) {
        int64_t tip = pos + 1;
        if (include_soft_clips) {
            tip = std::max<int64_t>(1, tip - leading_soft_clip);
        }
        return tip;
    }
    int64_t tip = end;
    if (include_soft_clips) {
        tip += trailing_soft_clip;
    }
    return tip;
}

std::string sample_name_from_header(const std::string& header_text, const std::string& path) {
    std::istringstream in(header_text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 3, "@RG") != 0) continue;
        const auto sm = line.find("\tSM:");
        if (sm == std::string::npos) continue;
        const auto begin = sm + 4;
        const auto end = line.find('\t', begin);
        return line.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    }

    std::string name = path;
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);
    const auto dot = name.find('.');
    if (dot != std::string::npos && dot > 0) name = name.substr(0, dot);
    return name;
}

// ============= TipExtractor =============

TipExtractor::TipExtractor(const std::string& bam_path, const FingerprintConfig& config)
    : bam_path_(bam_path), config_(config) {
    hts_file_ = hts_open(bam_path_.c_str(), "r");
    if (!hts_file_) {
        std::cerr << "[TipExtractor] failed to open BAM: " << bam_path_ << '\n';
        return;
    }

    header_ = sam_hdr_read(hts_file_);
    if (!header_) {
        std::cerr << "[TipExtractor] failed to read BAM header: " << bam_path_ << '\n';
        return;
    }

    const char* text = sam_hdr_str(header_);
    sample_ = sample_name_from_header(text ? text : "", bam_path_);
    aln_ = bam_init1();
    valid_ = aln_ != nullptr;
}

TipExtractor::~TipExtractor() {
    if (aln_) bam_destroy1(aln_);
    if (header_) bam_hdr_destroy(header_);
    if (hts_file_) hts_close(hts_file_);
}

std::vector<std::string> TipExtractor::reference_names() const {
    std::vector<std::string> names;
    if (!header_) return names;
    for (int32_t tid = 0; tid < header_->n_targets; ++tid) {
        names.emplace_back(header_->target_name[tid]);
    }
    return names;
}

ExtractionStats TipExtractor::extract(TipTable& table) {
    if (!valid_) {
        throw InputError("cannot read BAM file: " + bam_path_);
    }

    ExtractionStats stats;
    const std::set<std::string> wanted(config_.references.begin(), config_.references.end());
    constexpr uint16_t kSkipFlags =
        BAM_FUNMAP | BAM_FSECONDARY | BAM_FSUPPLEMENTARY | BAM_FQCFAIL | BAM_FDUP;

    int ret;
    while ((ret = sam_read1(hts_file_, header_, aln_)) >= 0) {
        ++stats.records;

        if (aln_->core.flag & kSkipFlags) {
            ++stats.skipped_flag;
            continue;
        }
        if (aln_->core.qual < config_.min_mapq) {
            ++stats.skipped_mapq;
            continue;
        }

        const char* reference = sam_hdr_tid2name(header_, aln_->core.tid);
        if (reference == nullptr || (!wanted.empty() && wanted.count(reference) == 0)) {
            ++stats.skipped_reference;
            continue;
        }

        uint8_t* tag = bam_aux_get(aln_, config_.element_tag.c_str());
        const char* element = tag ? bam_aux2Z(tag) : nullptr;
        if (element == nullptr) {
            ++stats.skipped_untagged;
            continue;
        }

        std::string category = assign_category(element, config_.families);
        if (category.empty()) {
            ++stats.skipped_family;
            continue;
        }

        const uint32_t* cigar = bam_get_cigar(aln_);
        const uint32_t n_cigar = aln_->core.n_cigar;
        int32_t leading_clip = 0;
        int32_t trailing_clip = 0;
        if (n_cigar > 0 && bam_cigar_op(cigar[0]) == BAM_CSOFT_CLIP) {
            leading_clip = static_cast<int32_t>(bam_cigar_oplen(cigar[0]));
        }
        if (n_cigar > 1 && bam_cigar_op(cigar[n_cigar - 1]) == BAM_CSOFT_CLIP) {
            trailing_clip = static_cast<int32_t>(bam_cigar_oplen(cigar[n_cigar - 1]));
        }

        const bool reverse = (aln_->core.flag & BAM_FREVERSE) != 0;
        CoordinateKey key{reference, reverse ? Strand::kReverse : Strand::kForward,
                          std::move(category), sample_};
        table[key].push_back({tip_position(aln_->core.pos, bam_endpos(aln_), reverse,
                                           leading_clip, trailing_clip, config_.include_soft_clips),
                              element});
        ++stats.informative;
    }

    if (ret < -1) {
        throw InputError("BAM read error in " + bam_path_ + " at record " + std::to_string(stats.records));
    }
    return stats;
}

TipTable extract_tips(
    const std::vector<std::string>& bam_paths,
    const FingerprintConfig& config,
    std::vector<std::string>* samples) {
    TipTable table;
    std::set<std::string> seen;
    for (const auto& path : bam_paths) {
        TipExtractor extractor(path, config);
        if (!extractor.is_valid()) {
            throw InputError("cannot read BAM file: " + path);
        }
        if (!seen.insert(extractor.sample()).second) {
            throw InputError("duplicate sample name '" + extractor.sample() + "' in " + path);
        }
        if (samples != nullptr) {
            samples->push_back(extractor.sample());
        }

        const auto stats = extractor.extract(table);
        if (config.verbose) {
            std::cerr << "[TipExtractor] " << extractor.sample() << ": records=" << stats.records
                      << " informative=" << stats.informative
                      << " skipped_mapq=" << stats.skipped_mapq
                      << " untagged=" << stats.skipped_untagged << '\n';
        }
    }
    return table;
}

}  // namespace tefp
