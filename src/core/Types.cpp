#include "core/Types.hpp"

#include <algorithm>
#include <cctype>

#include "core/Errors.hpp"

namespace AnnoEnrich {

std::string format_to_string(InputFormat format) {
    switch (format) {
        case InputFormat::DATA_FRAME: return "data.frame";
        case InputFormat::BED: return "bed";
        case InputFormat::CHR_RANGE: return "chr:start-end";
        case InputFormat::GRANGES: return "GRanges";
        default: return "unknown";
    }
}

InputFormat string_to_format(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "data.frame" || lower == "dataframe" || lower == "tsv") return InputFormat::DATA_FRAME;
    if (lower == "bed") return InputFormat::BED;
    if (lower == "chr:start-end") return InputFormat::CHR_RANGE;
    if (lower == "granges") return InputFormat::GRANGES;

    throw ConfigurationError("Unknown input format: " + str);
}

std::string p_adjust_to_string(PAdjustMethod method) {
    switch (method) {
        case PAdjustMethod::BH: return "BH";
        case PAdjustMethod::BY: return "BY";
        case PAdjustMethod::BONFERRONI: return "bonferroni";
        case PAdjustMethod::HOLM: return "holm";
        case PAdjustMethod::HOCHBERG: return "hochberg";
        case PAdjustMethod::HOMMEL: return "hommel";
        default: return "unknown";
    }
}

PAdjustMethod string_to_p_adjust(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "BH" || upper == "FDR") return PAdjustMethod::BH;
    if (upper == "BY") return PAdjustMethod::BY;
    if (upper == "BONFERRONI") return PAdjustMethod::BONFERRONI;
    if (upper == "HOLM") return PAdjustMethod::HOLM;
    if (upper == "HOCHBERG") return PAdjustMethod::HOCHBERG;
    if (upper == "HOMMEL") return PAdjustMethod::HOMMEL;

    throw ConfigurationError("Unknown p-value adjustment method: " + str);
}

}  // namespace AnnoEnrich
