#include "compare_error.h"

#include <utility>

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ConfigError:
      return "ConfigError";
    case ErrorKind::EmptyTable:
      return "EmptyTable";
    case ErrorKind::MissingRequiredColumn:
      return "MissingRequiredColumn";
    case ErrorKind::ColumnCountMismatch:
      return "ColumnCountMismatch";
    case ErrorKind::SynonymCountMismatch:
      return "SynonymCountMismatch";
    case ErrorKind::UnexpectedHeaderDifference:
      return "UnexpectedHeaderDifference";
    case ErrorKind::UnreconciledHeaderDifference:
      return "UnreconciledHeaderDifference";
    case ErrorKind::RowCountExceeded:
      return "RowCountExceeded";
    case ErrorKind::ColumnNotFound:
      return "ColumnNotFound";
    case ErrorKind::RowTooShort:
      return "RowTooShort";
    case ErrorKind::RowTooLong:
      return "RowTooLong";
  }
  return "UnknownError";
}

CompareError::CompareError(ErrorKind kind, const std::string& message,
                           ErrorContext context)
    : std::runtime_error(message), kind_(kind), context_(std::move(context)) {}
