#include "database/Result.hpp"

#include <fmt/format.h>

using namespace mds::database;
using namespace mds::types;

Field Row::operator[](const std::string_view column) const {
    for (size_t i = 0; i < columns_->size(); ++i)
        if ((*columns_)[i] == column) return {values_[i], (*columns_)[i]};
    throw StoreError(fmt::format("No column named '{}' in result row", column));
}

Field Row::operator[](const size_t index) const {
    if (index >= values_.size()) throw StoreError(fmt::format("Column index {} out of range", index));
    return {values_[index], (*columns_)[index]};
}

const Row& Result::one_row() const {
    if (rows_.size() != 1) throw StoreError(fmt::format("Expected exactly one row, got {}", rows_.size()));
    return rows_.front();
}
