#include "difference_map.h"

void DifferenceMap::record(size_t column, size_t row,
                           const std::string& value_a,
                           const std::string& value_b) {
  columns_[column][row] = CellPair{value_a, value_b};
}

const CellPair* DifferenceMap::find(size_t column, size_t row) const {
  auto col_it = columns_.find(column);
  if (col_it == columns_.end()) {
    return nullptr;
  }
  auto row_it = col_it->second.find(row);
  if (row_it == col_it->second.end()) {
    return nullptr;
  }
  return &row_it->second;
}

size_t DifferenceMap::total() const {
  size_t count = 0;
  for (const auto& column : columns_) {
    count += column.second.size();
  }
  return count;
}
