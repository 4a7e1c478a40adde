#pragma once

#include <string>
#include <vector>

#include <htslib/hts.h>

#include "core/DataStructs.hpp"

namespace AnnoEnrich {

/**
 * @brief RAII wrapper reading tab-delimited interval tables with HTSlib.
 *
 * Plain text, gzip and bgzip files are all read through hts_open(), so
 * compressed annotation tables need no separate handling. Each non-empty
 * line becomes one RawRow; format interpretation is left to IntervalSet and
 * AnnotationCatalog.
 *
 * Usage:
 *   IntervalReader reader("peaks.bed.gz");
 *   std::vector<RawRow> rows = reader.read_all();
 */
class IntervalReader {
public:
    /**
     * @param path Path of the table (plain, gzip or bgzip).
     * @throws MalformedInputError if the file cannot be opened.
     */
    explicit IntervalReader(const std::string& path);

    ~IntervalReader();

    IntervalReader(const IntervalReader&) = delete;
    IntervalReader& operator=(const IntervalReader&) = delete;
    IntervalReader(IntervalReader&&) noexcept;
    IntervalReader& operator=(IntervalReader&&) noexcept;

    /**
     * @brief Reads the next non-empty line.
     * @return false at end of file.
     * @throws MalformedInputError on a read error.
     */
    bool next(RawRow& row);

    /// Reads every remaining line.
    std::vector<RawRow> read_all();

    /// Convenience: opens @p path and reads it completely.
    static std::vector<RawRow> read_file(const std::string& path);

    /// Splits one line on tabs, dropping a trailing carriage return.
    static std::vector<std::string> split_line(const std::string& line);

    const std::string& get_path() const { return path_; }

private:
    std::string path_;
    htsFile* fp_;
    int64_t line_no_ = 0;
};

}  // namespace AnnoEnrich
