/**
 * @brief Per-column cell equivalence rules
 */

#ifndef COMPARATOR_REGISTRY_H
#define COMPARATOR_REGISTRY_H

#include <cstddef>
#include <functional>
#include <map>
#include <string>

// Binary equivalence predicate over two cell values
using CellComparator =
    std::function<bool(const std::string&, const std::string&)>;

/**
 * @brief Resolves the comparison rule for a column position
 *
 * Columns without an override use normalised equality (surrounding
 * whitespace trimmed, lowercased). Overrides are registered once by
 * position at setup and are read-only afterwards.
 */
class ComparatorRegistry {
 public:
  ComparatorRegistry() = default;
  ~ComparatorRegistry() = default;

  // Last registration for a position wins
  void register_override(size_t column_index, CellComparator comparator);
  bool has_override(size_t column_index) const;

  bool compare(size_t column_index, const std::string& value_a,
               const std::string& value_b) const;

  static std::string normalise(const std::string& value);
  static bool default_compare(const std::string& value_a,
                              const std::string& value_b);

  // Comparator that strips a case-insensitive prefix (e.g. "pmc") from
  // either normalised value before comparing
  static CellComparator prefix_stripping(const std::string& prefix);

 private:
  std::map<size_t, CellComparator> overrides_;
};

#endif  // COMPARATOR_REGISTRY_H
