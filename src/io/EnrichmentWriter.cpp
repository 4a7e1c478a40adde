#include "io/EnrichmentWriter.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace AnnoEnrich {

double EnrichmentWriter::signif(double x, int digits) {
    if (x == 0.0 || !std::isfinite(x)) return x;
    if (digits < 1) digits = 1;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, x);
    return std::strtod(buf, nullptr);
}

std::string EnrichmentWriter::format_zscore(double z) {
    std::ostringstream ss;
    ss << std::setprecision(15) << signif(z, 3);
    return ss.str();
}

std::string EnrichmentWriter::format_pvalue(double p) {
    const double rounded = signif(p, 2);
    std::ostringstream ss;
    if (rounded < 0.1 && rounded != 0.0) {
        ss << std::scientific << std::setprecision(1) << rounded;
    } else {
        ss << std::setprecision(15) << rounded;
    }
    return ss.str();
}

void EnrichmentWriter::write_table(std::ostream& os, const std::vector<EnrichmentRecord>& records) {
    os << "name\tnAnno\tnOverlap\tfc\tzscore\tpvalue\tadjp\tnData\tnBG\n";
    for (const auto& rec : records) {
        os << rec.name << "\t" << rec.n_anno << "\t" << rec.n_overlap << "\t" << std::setprecision(6) << rec.fc
           << "\t" << format_zscore(rec.zscore) << "\t" << format_pvalue(rec.pvalue) << "\t"
           << format_pvalue(rec.adjp) << "\t" << rec.n_data << "\t" << rec.n_bg << "\n";
    }
}

void EnrichmentWriter::write_table(const std::vector<EnrichmentRecord>& records) const {
    if (output_path_.empty() || output_path_ == "-") {
        write_table(std::cout, records);
        std::cout.flush();
        return;
    }

    std::ofstream ofs(output_path_);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_path_);
    }
    write_table(ofs, records);
    if (!ofs) {
        throw std::runtime_error("Failed writing output file: " + output_path_);
    }
    LOG_INFO("Enrichment table written to " + output_path_ + " (" + std::to_string(records.size()) + " rows)");
}

void EnrichmentWriter::write_null_matrix(std::ostream& os, const std::vector<std::string>& names,
                                         const Eigen::MatrixXd& null_matrix) {
    for (size_t c = 0; c < names.size(); ++c) {
        os << (c > 0 ? "\t" : "") << names[c];
    }
    os << "\n";
    for (Eigen::Index r = 0; r < null_matrix.rows(); ++r) {
        for (Eigen::Index c = 0; c < null_matrix.cols(); ++c) {
            // overlap widths are whole bases
            os << (c > 0 ? "\t" : "") << static_cast<int64_t>(null_matrix(r, c));
        }
        os << "\n";
    }
}

void EnrichmentWriter::write_null_matrix(const std::string& path, const std::vector<std::string>& names,
                                         const Eigen::MatrixXd& null_matrix) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open null matrix file: " + path);
    }
    write_null_matrix(ofs, names, null_matrix);
    if (!ofs) {
        throw std::runtime_error("Failed writing null matrix file: " + path);
    }
    LOG_INFO("Null matrix written to " + path + " (" + std::to_string(null_matrix.rows()) + " samples)");
}

}  // namespace AnnoEnrich
