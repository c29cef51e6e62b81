/**
 * @brief Header alignment under known column synonyms
 */

#include "header_reconciler.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>

#include "compare_error.h"

HeaderReconciler::HeaderReconciler(const SynonymGroups& groups,
                                   const PrintLevel& print_settings)
    : synonyms_(build_synonym_map(groups)), print(print_settings) {}

SynonymMap HeaderReconciler::build_synonym_map(const SynonymGroups& groups) {
  SynonymMap map;
  for (const auto& group : groups) {
    for (const auto& variant : group) {
      std::set<std::string> others;
      for (const auto& other : group) {
        if (other != variant) {
          others.insert(other);
        }
      }
      // a name listed in several groups keeps the last group's mapping
      map[variant] = others;
    }
  }
  return map;
}

std::string format_header(const Header& header) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < header.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << "'" << header[i] << "'";
  }
  oss << "]";
  return oss.str();
}

void HeaderReconciler::print_headers(const Header& header_a,
                                     const Header& header_b,
                                     const std::string& label_a,
                                     const std::string& label_b) const {
  if (!print.debug) {
    return;
  }
  std::cout << "   " << label_a << " header (length " << header_a.size()
            << "): " << format_header(header_a) << std::endl;
  std::cout << "   " << label_b << " header (length " << header_b.size()
            << "): " << format_header(header_b) << std::endl;
}

void HeaderReconciler::reconcile(const Header& header_a,
                                 const Header& header_b,
                                 const std::string& label_a,
                                 const std::string& label_b) const {
  if (header_a.size() != header_b.size()) {
    print_headers(header_a, header_b, label_a, label_b);
    if (print.debug) {
      std::set<std::string> names_a(header_a.begin(), header_a.end());
      std::set<std::string> names_b(header_b.begin(), header_b.end());
      Header only_a;
      Header only_b;
      std::set_difference(names_a.begin(), names_a.end(), names_b.begin(),
                          names_b.end(), std::back_inserter(only_a));
      std::set_difference(names_b.begin(), names_b.end(), names_a.begin(),
                          names_a.end(), std::back_inserter(only_b));
      std::cout << "   Difference (a - b): " << format_header(only_a)
                << std::endl;
      std::cout << "   Difference (b - a): " << format_header(only_b)
                << std::endl;
    }
    ErrorContext context;
    context.source_a = label_a;
    context.source_b = label_b;
    context.value_a = std::to_string(header_a.size());
    context.value_b = std::to_string(header_b.size());
    throw CompareError(ErrorKind::ColumnCountMismatch,
                       "CSV files have different number of columns (" +
                           label_a + ": " + context.value_a + ", " + label_b +
                           ": " + context.value_b + "), stopping.",
                       context);
  }

  if (header_a == header_b) {
    return;
  }

  check_expected_differences(header_a, header_b, label_a, label_b);
  check_expected_differences(header_b, header_a, label_b, label_a);

  Header remaining_a = remove_synonym_names(header_a);
  Header remaining_b = remove_synonym_names(header_b);

  if (remaining_a.size() != remaining_b.size()) {
    print_headers(header_a, header_b, label_a, label_b);
    if (print.debug) {
      std::cout << "   " << label_a << " remaining columns to check: "
                << format_header(remaining_a) << std::endl;
      std::cout << "   " << label_b << " remaining columns to check: "
                << format_header(remaining_b) << std::endl;
    }
    ErrorContext context;
    context.source_a = label_a;
    context.source_b = label_b;
    context.value_a = std::to_string(remaining_a.size());
    context.value_b = std::to_string(remaining_b.size());
    throw CompareError(
        ErrorKind::SynonymCountMismatch,
        "Different number of remaining columns to check (" + label_a + ": " +
            context.value_a + ", " + label_b + ": " + context.value_b +
            "). Double check the alternative column names in "
            "EXPECTED_HEADER_DIFFERENCES_RAW, or check your CSV headers.",
        context);
  }

  for (size_t i = 0; i < remaining_a.size(); ++i) {
    if (remaining_a[i] == remaining_b[i]) {
      continue;
    }
    if (print.debug) {
      std::cout << "   " << label_a << " expected headers without variations: "
                << format_header(remaining_a) << std::endl;
      std::cout << "   " << label_b << " expected headers without variations: "
                << format_header(remaining_b) << std::endl;
    }
    ErrorContext context;
    context.column = remaining_a[i];
    context.position = i;
    context.source_a = label_a;
    context.source_b = label_b;
    context.value_a = remaining_a[i];
    context.value_b = remaining_b[i];
    throw CompareError(ErrorKind::UnreconciledHeaderDifference,
                       "Unexpectedly different headers for column number " +
                           std::to_string(i + 1) + " after removing synonyms: '" +
                           remaining_a[i] + "' in " + label_a + ", '" +
                           remaining_b[i] + "' in " + label_b + ".",
                       context);
  }
}

void HeaderReconciler::check_expected_differences(
    const Header& header_1, const Header& header_2, const std::string& label_1,
    const std::string& label_2) const {
  for (size_t i = 0; i < header_1.size(); ++i) {
    const std::string& col = header_1[i];
    auto it = synonyms_.find(col);
    if (it == synonyms_.end()) {
      continue;
    }
    const std::string& corresponding = header_2[i];
    if (corresponding == col || it->second.count(corresponding) > 0) {
      if (print.debug) {
        std::cout << "   Column '" << col << "' at position " << i + 1
                  << " in " << label_1
                  << " within expected parameters, moving on." << std::endl;
      }
      continue;
    }
    print_headers(header_1, header_2, label_1, label_2);
    ErrorContext context;
    context.column = col;
    context.position = i;
    context.source_a = label_1;
    context.source_b = label_2;
    context.value_a = col;
    context.value_b = corresponding;
    throw CompareError(ErrorKind::UnexpectedHeaderDifference,
                       "Column '" + col + "' at position " +
                           std::to_string(i + 1) + " in " + label_1 +
                           " is unexpectedly different from column '" +
                           corresponding + "' at the same position in " +
                           label_2 + ".",
                       context);
  }
}

Header HeaderReconciler::remove_synonym_names(const Header& header) const {
  // one occurrence per mapped name, so a repeated name is left over and
  // shows up as a count mismatch
  Header remaining = header;
  for (const auto& entry : synonyms_) {
    auto it = std::find(remaining.begin(), remaining.end(), entry.first);
    if (it != remaining.end()) {
      remaining.erase(it);
    }
  }
  return remaining;
}
