#include "comparator_registry.h"

#include <algorithm>
#include <cctype>
#include <utility>

void ComparatorRegistry::register_override(size_t column_index,
                                           CellComparator comparator) {
  overrides_[column_index] = std::move(comparator);
}

bool ComparatorRegistry::has_override(size_t column_index) const {
  return overrides_.count(column_index) > 0;
}

bool ComparatorRegistry::compare(size_t column_index,
                                 const std::string& value_a,
                                 const std::string& value_b) const {
  auto it = overrides_.find(column_index);
  if (it != overrides_.end()) {
    return it->second(value_a, value_b);
  }
  return default_compare(value_a, value_b);
}

std::string ComparatorRegistry::normalise(const std::string& value) {
  const char* whitespace = " \t\r\n\f\v";
  size_t start = value.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(whitespace);
  std::string out = value.substr(start, end - start + 1);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool ComparatorRegistry::default_compare(const std::string& value_a,
                                         const std::string& value_b) {
  return normalise(value_a) == normalise(value_b);
}

CellComparator ComparatorRegistry::prefix_stripping(const std::string& prefix) {
  const std::string lowered = normalise(prefix);
  return [lowered](const std::string& value_a, const std::string& value_b) {
    std::string n_a = normalise(value_a);
    std::string n_b = normalise(value_b);
    if (n_a.compare(0, lowered.size(), lowered) == 0) {
      n_a.erase(0, lowered.size());
    }
    if (n_b.compare(0, lowered.size(), lowered) == 0) {
      n_b.erase(0, lowered.size());
    }
    return n_a == n_b;
  };
}
