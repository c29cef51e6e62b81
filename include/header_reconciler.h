/**
 * @brief Validates that two header rows can be compared position by position
 */

#ifndef HEADER_RECONCILER_H
#define HEADER_RECONCILER_H

#include <string>

#include "print_level.h"
#include "table_types.h"

/**
 * @brief Aligns two headers, tolerating declared column renames
 *
 * This class is responsible for:
 * - Building the SynonymMap from configured synonym groups
 * - Checking column counts of both headers
 * - Checking that every synonym-mapped name lines up with an identical name
 *   or a declared synonym at the same position
 * - Checking that the names left after removing all synonyms agree
 *
 * Validation only: neither header is rewritten.
 */
class HeaderReconciler {
 public:
  explicit HeaderReconciler(const SynonymGroups& groups,
                            const PrintLevel& print_settings = PrintLevel{});
  ~HeaderReconciler() = default;

  static SynonymMap build_synonym_map(const SynonymGroups& groups);

  // Throws CompareError on the first alignment failure
  void reconcile(const Header& header_a, const Header& header_b,
                 const std::string& label_a,
                 const std::string& label_b) const;

  const SynonymMap& synonyms() const { return synonyms_; }

 private:
  SynonymMap synonyms_;
  PrintLevel print;

  void check_expected_differences(const Header& header_1,
                                  const Header& header_2,
                                  const std::string& label_1,
                                  const std::string& label_2) const;
  Header remove_synonym_names(const Header& header) const;
  void print_headers(const Header& header_a, const Header& header_b,
                     const std::string& label_a,
                     const std::string& label_b) const;
};

// Renders a header as "[a, b, c]" for diagnostics
std::string format_header(const Header& header);

#endif  // HEADER_RECONCILER_H
