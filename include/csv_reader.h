/**
 * @brief Handles CSV file I/O for the table comparison utility
 */

#ifndef CSV_READER_H
#define CSV_READER_H

#include <istream>
#include <ostream>
#include <string>

#include "table_types.h"

/**
 * @brief Reads and writes excel-dialect CSV tables
 *
 * This class is responsible for:
 * - Opening and validating files
 * - Parsing quoted fields (embedded separators, quotes and newlines)
 * - Skipping a UTF-8 byte order mark
 * - Dropping blank rows
 * - Writing tables with minimal quoting and CRLF line endings
 *
 * Cells are kept as UTF-8 bytes.
 */
class CsvReader {
 public:
  CsvReader() = default;
  ~CsvReader() = default;
  // ========================================================================
  // File Operations
  // ========================================================================
  bool load_file(const std::string& filename, Table& table,
                 bool ignore_blank_rows = true) const;
  bool save_file(const std::string& filename, const Table& table) const;

  // ========================================================================
  // Stream Operations
  // ========================================================================
  // Returns false if the input ends inside a quoted field
  static bool parse(std::istream& is, Table& table,
                    bool ignore_blank_rows = true);
  static void write(std::ostream& os, const Table& table);

  static bool is_blank(const Row& row);
  static std::string base_name(const std::string& path);

 private:
  static void skip_bom(std::istream& is);
  static bool read_record(std::istream& is, Row& row, bool& malformed);
  static std::string quote_field(const std::string& field);
};

#endif  // CSV_READER_H
