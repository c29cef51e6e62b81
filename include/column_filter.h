/**
 * @brief Column deletion and whitelist filtering for loaded tables
 */

#ifndef COLUMN_FILTER_H
#define COLUMN_FILTER_H

#include <set>
#include <string>
#include <vector>

#include "print_level.h"
#include "table_types.h"

/**
 * @brief Deletes columns from a table by position or by header name
 *
 * Names are resolved against the table's own header (row 0), so the same
 * whitelist can be applied independently to tables whose column order
 * differs.
 */
class ColumnFilter {
 public:
  explicit ColumnFilter(const PrintLevel& print_settings = PrintLevel{});
  ~ColumnFilter() = default;

  // Resolves a selector against a header; throws ColumnNotFound
  static size_t resolve(const Header& header, const ColumnSelector& selector,
                        const std::string& label);

  void delete_column(Table& table, const ColumnSelector& selector,
                     const std::string& label) const;

  // Deletes every column whose name is not whitelisted. Returns the deleted
  // names in header order.
  std::vector<std::string> apply_whitelist(
      Table& table, const std::set<std::string>& whitelist,
      const std::string& label) const;

 private:
  PrintLevel print;

  // Removes the given positions from every row; positions must be sorted
  // in descending order
  static void delete_positions(Table& table,
                               const std::vector<size_t>& positions,
                               const std::string& label);
};

#endif  // COLUMN_FILTER_H
