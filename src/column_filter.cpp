#include "column_filter.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>

#include "compare_error.h"

ColumnFilter::ColumnFilter(const PrintLevel& print_settings)
    : print(print_settings) {}

size_t ColumnFilter::resolve(const Header& header,
                             const ColumnSelector& selector,
                             const std::string& label) {
  if (selector.kind == ColumnSelector::Kind::ByPosition) {
    return selector.position;
  }
  auto it = std::find(header.begin(), header.end(), selector.name);
  if (it == header.end()) {
    ErrorContext context;
    context.column = selector.name;
    context.source_a = label;
    throw CompareError(ErrorKind::ColumnNotFound,
                       "Cannot delete column '" + selector.name + "' from " +
                           label + ", it's not in the CSV header.",
                       context);
  }
  return static_cast<size_t>(it - header.begin());
}

void ColumnFilter::delete_positions(Table& table,
                                    const std::vector<size_t>& positions,
                                    const std::string& label) {
  if (positions.empty()) {
    return;
  }
  // positions[0] is the largest, so one length check covers the whole pass
  const size_t highest = positions.front();
  for (size_t r = 0; r < table.size(); ++r) {
    if (highest >= table[r].size()) {
      ErrorContext context;
      context.position = highest;
      context.row = r;
      context.source_a = label;
      context.value_a = std::to_string(table[r].size());
      throw CompareError(
          ErrorKind::RowTooShort,
          "Cannot delete cell " + std::to_string(highest + 1) + " from row " +
              std::to_string(r) + " of " + label + ", the row has only " +
              std::to_string(table[r].size()) +
              " cells. Either the CSV is not rectangular or the column does "
              "not exist.",
          context);
    }
  }
  for (auto& row : table) {
    for (size_t position : positions) {
      row.erase(row.begin() + static_cast<std::ptrdiff_t>(position));
    }
  }
}

void ColumnFilter::delete_column(Table& table, const ColumnSelector& selector,
                                 const std::string& label) const {
  const Header empty_header;
  const Header& header = table.empty() ? empty_header : table.front();
  size_t position = resolve(header, selector, label);
  delete_positions(table, {position}, label);
}

std::vector<std::string> ColumnFilter::apply_whitelist(
    Table& table, const std::set<std::string>& whitelist,
    const std::string& label) const {
  std::vector<std::string> removed;
  if (table.empty()) {
    return removed;
  }
  const Header& header = table.front();
  std::vector<size_t> positions;
  for (size_t i = 0; i < header.size(); ++i) {
    if (whitelist.count(header[i]) == 0) {
      positions.push_back(i);
      removed.push_back(header[i]);
    }
  }
  std::sort(positions.begin(), positions.end(), std::greater<size_t>());
  delete_positions(table, positions, label);

  if (!print.quiet) {
    for (const auto& name : removed) {
      std::cout << "Deleted column '" << name << "' from " << label
                << ", not in whitelist." << std::endl;
    }
  }
  return removed;
}
