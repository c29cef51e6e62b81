/**
 * @brief Structured error raised by the reconciliation engine
 *
 * Every structural inconsistency (headers, row/column counts, required
 * columns, configuration) aborts the run with a CompareError. Callers match
 * on kind() and read the typed fields in context().
 */

#ifndef COMPARE_ERROR_H
#define COMPARE_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

enum class ErrorKind {
  ConfigError,
  EmptyTable,
  MissingRequiredColumn,
  ColumnCountMismatch,
  SynonymCountMismatch,
  UnexpectedHeaderDifference,
  UnreconciledHeaderDifference,
  RowCountExceeded,
  ColumnNotFound,
  RowTooShort,
  RowTooLong
};

const char* error_kind_name(ErrorKind kind);

struct ErrorContext {
  static constexpr size_t npos = static_cast<size_t>(-1);

  std::string column;      // Offending column name (if any)
  size_t position = npos;  // 0-based column position
  size_t row = npos;       // Row index within the table (0 = header)
  std::string source_a;    // Label of the first table / config file
  std::string source_b;    // Label of the second table
  std::string value_a;     // Value seen in the first source
  std::string value_b;     // Value seen in the second source
};

class CompareError : public std::runtime_error {
 public:
  CompareError(ErrorKind kind, const std::string& message,
               ErrorContext context = ErrorContext{});

  ErrorKind kind() const { return kind_; }
  const ErrorContext& context() const { return context_; }

 private:
  ErrorKind kind_;
  ErrorContext context_;
};

#endif  // COMPARE_ERROR_H
