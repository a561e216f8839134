#ifndef TEFP_TIP_EXTRACTOR_H
#define TEFP_TIP_EXTRACTOR_H

#include "coordinate_set.h"
#include "fingerprint_config.h"

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/sam.h>

namespace tefp {

/**
 * Category of an element: the first family prefix it starts with, "." when
 * no families are configured, empty when it matches none.
 */
std::string assign_category(const std::string& element, const std::vector<std::string>& families);

/**
 * 1-based tip of an alignment covering [pos, end) (0-based, half open).
 * Forward reads end at the tip, reverse reads start at it. With
 * include_soft_clips the tip moves outward by the clip on the tip side.
 */
int64_t tip_position(
    int64_t pos,
    int64_t end,
    bool reverse,
    int32_t leading_soft_clip,
    int32_t trailing_soft_clip,
    bool include_soft_clips);

// SM of the first @RG line, or the file name without directory and extension.
std::string sample_name_from_header(const std::string& header_text, const std::string& path);

struct ExtractionStats {
    int64_t records = 0;
    int64_t informative = 0;
    int64_t skipped_flag = 0;
    int64_t skipped_mapq = 0;
    int64_t skipped_untagged = 0;
    int64_t skipped_family = 0;
    int64_t skipped_reference = 0;
};

/**
 * TipExtractor: single pass over one sample's BAM, collecting informative
 * read tips into a TipTable.
 */
class TipExtractor {
public:
    TipExtractor(const std::string& bam_path, const FingerprintConfig& config);
    ~TipExtractor();

    TipExtractor(const TipExtractor&) = delete;
    TipExtractor& operator=(const TipExtractor&) = delete;

    bool is_valid() const { return valid_; }
    const std::string& bam_path() const { return bam_path_; }
    const std::string& sample() const { return sample_; }

    /**
     * Append this sample's tips to table.
     * @throws InputError if the file is invalid or a read error occurs
     */
    ExtractionStats extract(TipTable& table);

    std::vector<std::string> reference_names() const;

private:
    std::string bam_path_;
    const FingerprintConfig& config_;
    htsFile* hts_file_ = nullptr;
    bam_hdr_t* header_ = nullptr;
    bam1_t* aln_ = nullptr;
    std::string sample_;
    bool valid_ = false;
};

/**
 * Extract tips from every BAM (one sample each).
 * @throws InputError on unreadable files or duplicate sample names
 */
TipTable extract_tips(
    const std::vector<std::string>& bam_paths,
    const FingerprintConfig& config,
    std::vector<std::string>* samples = nullptr);

}  // namespace tefp

#endif  // TEFP_TIP_EXTRACTOR_H
