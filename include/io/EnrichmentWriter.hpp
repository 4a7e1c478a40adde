#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "core/DataStructs.hpp"

namespace AnnoEnrich {

/**
 * @brief Writes enrichment results as tab-separated text.
 *
 * Result table columns:
 * ```
 * name  nAnno  nOverlap  fc  zscore  pvalue  adjp  nData  nBG
 * ```
 * zscore is rounded to 3 significant digits, pvalue and adjp to 2; p-values
 * in (0, 0.1) are printed in scientific notation.
 *
 * Null matrix: a header of category names, then one line per sample in
 * sample-index order.
 */
class EnrichmentWriter {
public:
    /**
     * @param output_path Destination file, or "-" for standard output.
     */
    explicit EnrichmentWriter(const std::string& output_path = "-") : output_path_(output_path) {}

    /// @throws std::runtime_error if the destination cannot be written.
    void write_table(const std::vector<EnrichmentRecord>& records) const;

    /// @throws std::runtime_error if @p path cannot be written.
    static void write_null_matrix(const std::string& path, const std::vector<std::string>& names,
                                  const Eigen::MatrixXd& null_matrix);

    static void write_table(std::ostream& os, const std::vector<EnrichmentRecord>& records);
    static void write_null_matrix(std::ostream& os, const std::vector<std::string>& names,
                                  const Eigen::MatrixXd& null_matrix);

    /// Rounds @p x to @p digits significant digits (0 stays 0).
    static double signif(double x, int digits);

    static std::string format_zscore(double z);
    static std::string format_pvalue(double p);

private:
    std::string output_path_;
};

}  // namespace AnnoEnrich
