/**
 * @brief Two-level ordered mapping of recorded cell differences
 *
 * Outer level: column position, iterated in header order (ascending
 * position). Inner level: data row number, iterated in ascending order.
 * Only columns with at least one recorded difference are present.
 */

#ifndef DIFFERENCE_MAP_H
#define DIFFERENCE_MAP_H

#include <cstddef>
#include <map>
#include <string>

struct CellPair {
  std::string value_a;  // Value in table A
  std::string value_b;  // Value in table B
};

class DifferenceMap {
 public:
  using RowDifferences = std::map<size_t, CellPair>;
  using ColumnDifferences = std::map<size_t, RowDifferences>;
  using const_iterator = ColumnDifferences::const_iterator;

  // Records (or replaces) the difference at (column, row)
  void record(size_t column, size_t row, const std::string& value_a,
              const std::string& value_b);

  const CellPair* find(size_t column, size_t row) const;

  bool empty() const { return columns_.empty(); }
  size_t column_count() const { return columns_.size(); }
  size_t total() const;

  const_iterator begin() const { return columns_.begin(); }
  const_iterator end() const { return columns_.end(); }

 private:
  ColumnDifferences columns_;
};

#endif  // DIFFERENCE_MAP_H
