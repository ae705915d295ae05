#include "io/TableReader.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace Methodical {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    // Tolerate CRLF files
    if (!fields.empty() && !fields.back().empty() && fields.back().back() == '\r') {
        fields.back().pop_back();
    }
    return fields;
}

double parse_numeric_field(const std::string& field) {
    if (field.empty() || field == "NA" || field == "NaN" || field == "nan" || field == ".") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(field.c_str(), &end);
    if (end == field.c_str() || *end != '\0' || errno == ERANGE) {
        throw std::runtime_error("Invalid numeric value: '" + field + "'");
    }
    return value;
}

// ==================================================
// TextLineReader Implementation
// ==================================================

TextLineReader::TextLineReader(const std::string& path) : path_(path), fp_(nullptr), buffer_{0, 0, nullptr} {
    fp_ = hts_open(path.c_str(), "r");
    if (!fp_) {
        throw std::runtime_error("Failed to open file: " + path);
    }
}

TextLineReader::~TextLineReader() {
    ks_free(&buffer_);
    if (fp_) hts_close(fp_);
}

bool TextLineReader::next(std::string& line) {
    int ret = hts_getline(fp_, '\n', &buffer_);
    if (ret == -1) {
        return false;
    }
    if (ret < -1) {
        throw std::runtime_error("Read error in " + path_ + " after line " + std::to_string(line_number_));
    }
    ++line_number_;
    line.assign(buffer_.s ? buffer_.s : "", buffer_.l);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

// ==================================================
// Matrix loading
// ==================================================

LabeledMatrix read_labeled_matrix(const std::string& path) {
    TextLineReader reader(path);
    std::string line;

    // Header: first non-empty line
    std::vector<std::string> header;
    while (reader.next(line)) {
        if (line.empty()) continue;
        header = split_tabs(line);
        break;
    }
    if (header.size() < 2) {
        throw std::runtime_error("Missing or empty header in " + path);
    }

    LabeledMatrix matrix;
    matrix.col_names.assign(header.begin() + 1, header.end());
    const size_t n_cols = matrix.col_names.size();

    std::vector<std::vector<double>> rows;
    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;
        auto fields = split_tabs(line);
        if (fields.size() != n_cols + 1) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) + ": expected " +
                                     std::to_string(n_cols + 1) + " fields, found " + std::to_string(fields.size()));
        }
        matrix.row_names.push_back(fields[0]);
        std::vector<double> row(n_cols);
        for (size_t c = 0; c < n_cols; ++c) {
            try {
                row[c] = parse_numeric_field(fields[c + 1]);
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) + ": " + e.what());
            }
        }
        rows.push_back(std::move(row));
    }

    matrix.values.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(n_cols));
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < n_cols; ++c) {
            matrix.values(r, c) = rows[r][c];
        }
    }
    return matrix;
}

} // namespace Methodical
