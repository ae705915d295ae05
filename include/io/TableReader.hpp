#pragma once

#include <string>
#include <vector>
#include <htslib/hts.h>
#include <htslib/kstring.h>

#include "core/MethylationMatrix.hpp"

namespace Methodical {

/**
 * @brief Splits a line on tab characters, keeping empty fields.
 */
std::vector<std::string> split_tabs(const std::string& line);

/**
 * @brief Parses a numeric field; "NA", "NaN", "." and empty fields give NaN.
 * @throws std::runtime_error for anything else that is not a number.
 */
double parse_numeric_field(const std::string& field);

/**
 * @brief Line reader over plain, gzip or bgzip text files (htslib hts_getline).
 *
 * Usage:
 *   TextLineReader reader("expression.tsv.gz");
 *   std::string line;
 *   while (reader.next(line)) { ... }
 */
class TextLineReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit TextLineReader(const std::string& path);
    ~TextLineReader();

    TextLineReader(const TextLineReader&) = delete;
    TextLineReader& operator=(const TextLineReader&) = delete;

    /**
     * @brief Reads the next line without its terminator.
     * @return false at end of file.
     * @throws std::runtime_error on a read error.
     */
    bool next(std::string& line);

    int line_number() const { return line_number_; }

private:
    std::string path_;
    htsFile* fp_;
    kstring_t buffer_;
    int line_number_ = 0;
};

/**
 * @brief Reads a TSV matrix with a header row and a row-name column.
 *
 * Layout:
 *   <label>  <col1>  <col2> ...
 *   <row1>   v11     v12    ...
 *
 * Blank lines and lines starting with '#' after the header are skipped.
 *
 * @throws std::runtime_error on I/O errors, ragged rows or non-numeric cells.
 */
LabeledMatrix read_labeled_matrix(const std::string& path);

} // namespace Methodical
