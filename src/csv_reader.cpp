#include "csv_reader.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

// ========================================================================
// File Operations
// ========================================================================

bool CsvReader::load_file(const std::string& filename, Table& table,
                          bool ignore_blank_rows) const {
  std::ifstream infile(filename, std::ios::binary);
  if (!infile.is_open()) {
    std::cerr << "\033[1;31mError opening file: " << filename << "\033[0m"
              << std::endl;
    return false;
  }
  if (!parse(infile, table, ignore_blank_rows)) {
    std::cerr << "\033[1;31mError reading file: " << filename
              << " (unterminated quoted field at end of file)\033[0m"
              << std::endl;
    return false;
  }
  return true;
}

bool CsvReader::save_file(const std::string& filename,
                          const Table& table) const {
  std::ofstream outfile(filename, std::ios::binary | std::ios::trunc);
  if (!outfile.is_open()) {
    std::cerr << "\033[1;31mError opening file for writing: " << filename
              << "\033[0m" << std::endl;
    return false;
  }
  write(outfile, table);
  outfile.flush();
  if (!outfile) {
    std::cerr << "\033[1;31mError writing file: " << filename << "\033[0m"
              << std::endl;
    return false;
  }
  return true;
}

// ========================================================================
// Stream Operations
// ========================================================================

void CsvReader::skip_bom(std::istream& is) {
  static const char bom[] = "\xEF\xBB\xBF";
  char buffer[3] = {0, 0, 0};
  is.read(buffer, 3);
  std::streamsize got = is.gcount();
  if (got == 3 && buffer[0] == bom[0] && buffer[1] == bom[1] &&
      buffer[2] == bom[2]) {
    return;
  }
  is.clear();
  for (std::streamsize i = got; i > 0; --i) {
    is.putback(buffer[i - 1]);
  }
}

bool CsvReader::read_record(std::istream& is, Row& row, bool& malformed) {
  row.clear();
  malformed = false;
  if (is.peek() == EOF) {
    return false;
  }

  std::string field;
  bool in_quotes = false;
  bool field_started = false;  // a quote opens a field only at its start
  char c;
  while (is.get(c)) {
    if (in_quotes) {
      if (c == '"') {
        if (is.peek() == '"') {
          is.get();
          field += '"';
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"' && !field_started) {
      in_quotes = true;
      field_started = true;
    } else if (c == ',') {
      row.push_back(field);
      field.clear();
      field_started = false;
    } else if (c == '\r') {
      if (is.peek() == '\n') is.get();
      break;
    } else if (c == '\n') {
      break;
    } else {
      field += c;
      field_started = true;
    }
  }
  if (in_quotes) {
    malformed = true;
  }
  row.push_back(field);
  return true;
}

bool CsvReader::parse(std::istream& is, Table& table, bool ignore_blank_rows) {
  table.clear();
  skip_bom(is);
  Row row;
  bool malformed = false;
  while (read_record(is, row, malformed)) {
    if (malformed) {
      return false;
    }
    if (ignore_blank_rows && is_blank(row)) {
      continue;
    }
    table.push_back(row);
  }
  return true;
}

std::string CsvReader::quote_field(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void CsvReader::write(std::ostream& os, const Table& table) {
  for (const auto& row : table) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) os << ',';
      os << quote_field(row[i]);
    }
    os << "\r\n";
  }
}

bool CsvReader::is_blank(const Row& row) {
  for (const auto& cell : row) {
    if (!cell.empty()) {
      return false;
    }
  }
  return true;
}

std::string CsvReader::base_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}
