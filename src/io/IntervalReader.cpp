#include "io/IntervalReader.hpp"

#include <cstdlib>
#include <utility>

#include <htslib/kstring.h>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

IntervalReader::IntervalReader(const std::string& path) : path_(path), fp_(nullptr) {
    fp_ = hts_open(path.c_str(), "r");
    if (!fp_) {
        throw MalformedInputError("Cannot open interval table: " + path);
    }
}

IntervalReader::~IntervalReader() {
    if (fp_) {
        hts_close(fp_);
    }
}

IntervalReader::IntervalReader(IntervalReader&& other) noexcept
    : path_(std::move(other.path_)), fp_(other.fp_), line_no_(other.line_no_) {
    other.fp_ = nullptr;
}

IntervalReader& IntervalReader::operator=(IntervalReader&& other) noexcept {
    if (this != &other) {
        if (fp_) {
            hts_close(fp_);
        }
        path_ = std::move(other.path_);
        fp_ = other.fp_;
        line_no_ = other.line_no_;
        other.fp_ = nullptr;
    }
    return *this;
}

std::vector<std::string> IntervalReader::split_line(const std::string& line) {
    std::string trimmed = line;
    if (!trimmed.empty() && trimmed.back() == '\r') {
        trimmed.pop_back();
    }

    std::vector<std::string> fields;
    size_t begin = 0;
    while (true) {
        size_t tab = trimmed.find('\t', begin);
        if (tab == std::string::npos) {
            fields.push_back(trimmed.substr(begin));
            break;
        }
        fields.push_back(trimmed.substr(begin, tab - begin));
        begin = tab + 1;
    }
    return fields;
}

bool IntervalReader::next(RawRow& row) {
    if (!fp_) return false;

    kstring_t str = {0, 0, nullptr};
    while (true) {
        int ret = hts_getline(fp_, KS_SEP_LINE, &str);
        if (ret == -1) {
            free(str.s);
            return false;
        }
        if (ret < -1) {
            free(str.s);
            throw MalformedInputError("Read error in " + path_ + " after line " + std::to_string(line_no_));
        }
        line_no_++;

        std::string line(str.s, str.l);
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        row.fields = split_line(line);
        row.line_no = line_no_;
        free(str.s);
        return true;
    }
}

std::vector<RawRow> IntervalReader::read_all() {
    std::vector<RawRow> rows;
    RawRow row;
    while (next(row)) {
        rows.push_back(row);
    }
    return rows;
}

std::vector<RawRow> IntervalReader::read_file(const std::string& path) {
    IntervalReader reader(path);
    std::vector<RawRow> rows = reader.read_all();
    LOG_DEBUG("Read " + std::to_string(rows.size()) + " rows from " + path);
    return rows;
}

}  // namespace AnnoEnrich
