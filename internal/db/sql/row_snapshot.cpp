#include "row_snapshot.hpp"

#include <stdexcept>
#include <type_traits>

namespace healthstore::db::sql {

RowSnapshot RowSnapshot::Capture(const Row& row) {
  RowSnapshot snapshot;
  const int count = row.ColumnCount();
  snapshot.names_.reserve(count);
  snapshot.values_.reserve(count);
  for (int col = 0; col < count; ++col) {
    snapshot.names_.push_back(row.ColumnName(col));
    snapshot.values_.push_back(row.GetValue(col));
  }
  return snapshot;
}

const Param& RowSnapshot::At(int col) const {
  if (col < 0 || col >= ColumnCount()) {
    throw std::out_of_range("row snapshot: column " + std::to_string(col) + " out of range");
  }
  return values_[col];
}

std::string RowSnapshot::ColumnName(int col) const {
  At(col);
  return names_[col];
}

int RowSnapshot::ColumnIndex(std::string_view name) const {
  for (int col = 0; col < ColumnCount(); ++col) {
    if (names_[col] == name) {
      return col;
    }
  }
  throw std::out_of_range("row snapshot: no column named " + std::string(name));
}

std::string RowSnapshot::GetText(int col) const {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, Blob>) {
          return std::string(v.begin(), v.end());
        } else {
          return std::to_string(v);
        }
      },
      At(col));
}

int RowSnapshot::GetInt(int col) const {
  return static_cast<int>(GetInt64(col));
}

int64_t RowSnapshot::GetInt64(int col) const {
  return std::visit(
      [](const auto& v) -> int64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T>) {
          return static_cast<int64_t>(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v.empty() ? 0 : std::stoll(v);
        } else {
          return 0;
        }
      },
      At(col));
}

double RowSnapshot::GetDouble(int col) const {
  return std::visit(
      [](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T>) {
          return static_cast<double>(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v.empty() ? 0.0 : std::stod(v);
        } else {
          return 0.0;
        }
      },
      At(col));
}

Blob RowSnapshot::GetBlob(int col) const {
  const auto& value = At(col);
  if (const auto* blob = std::get_if<Blob>(&value)) {
    return *blob;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return Blob(text->begin(), text->end());
  }
  return {};
}

bool RowSnapshot::IsNull(int col) const {
  return std::holds_alternative<std::nullptr_t>(At(col));
}

Param RowSnapshot::GetValue(int col) const {
  return At(col);
}

}
