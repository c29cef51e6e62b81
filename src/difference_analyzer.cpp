/**
 * @brief Cell-by-cell comparison of comparable row pairs
 */

#include "difference_analyzer.h"

#include <algorithm>

DifferenceAnalyzer::DifferenceAnalyzer(const ComparatorRegistry& registry)
    : registry(registry) {}

size_t DifferenceAnalyzer::process_row(size_t row_number, const Row& row_a,
                                       const Row& row_b,
                                       DifferenceMap& differences) const {
  size_t found = 0;
  const size_t width = std::min(row_a.size(), row_b.size());
  for (size_t column_index = 0; column_index < width; ++column_index) {
    const std::string& value_a = row_a[column_index];
    const std::string& value_b = row_b[column_index];
    if (!registry.compare(column_index, value_a, value_b)) {
      differences.record(column_index, row_number, value_a, value_b);
      found++;
    }
  }
  return found;
}
