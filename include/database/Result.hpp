#pragma once

#include "types/errors.hpp"

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace mds::database {

using Value = std::variant<std::monostate, int64_t, double, std::string>;

// Positional parameters for a prepared statement, bound as ?1, ?2, ...
class Params {
public:
    Params() = default;

    template <typename... Args>
        requires (sizeof...(Args) > 0 && !(std::is_same_v<std::remove_cvref_t<Args>, Params> || ...))
    explicit Params(Args&&... args) { (append(std::forward<Args>(args)), ...); }

    void append(std::nullptr_t) { values_.emplace_back(std::monostate{}); }
    void append(std::nullopt_t) { values_.emplace_back(std::monostate{}); }
    void append(const std::string& s) { values_.emplace_back(s); }
    void append(std::string_view s) { values_.emplace_back(std::string(s)); }
    void append(const char* s) { values_.emplace_back(std::string(s)); }
    void append(const double d) { values_.emplace_back(d); }

    template <std::integral T>
    void append(const T v) { values_.emplace_back(static_cast<int64_t>(v)); }

    template <typename T>
    void append(const std::optional<T>& opt) {
        if (opt) append(*opt);
        else append(nullptr);
    }

    [[nodiscard]] const std::vector<Value>& values() const { return values_; }

private:
    std::vector<Value> values_;
};

class Field {
public:
    Field(const Value& value, const std::string_view name) : value_(&value), name_(name) {}

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(*value_); }

    template <typename T>
    [[nodiscard]] T as() const {
        if (is_null()) throw types::StoreError("Column '" + std::string(name_) + "' is NULL");

        if constexpr (std::is_same_v<T, std::string>) {
            if (const auto* s = std::get_if<std::string>(value_)) return *s;
            if (const auto* i = std::get_if<int64_t>(value_)) return std::to_string(*i);
            return std::to_string(std::get<double>(*value_));
        } else if constexpr (std::is_same_v<T, bool>) {
            return integer() != 0;
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<T>(integer());
        } else if constexpr (std::is_floating_point_v<T>) {
            if (const auto* d = std::get_if<double>(value_)) return static_cast<T>(*d);
            return static_cast<T>(integer());
        } else {
            static_assert(std::is_same_v<T, void>, "Unsupported column type");
        }
    }

    template <typename T>
    [[nodiscard]] T as(T def) const { return is_null() ? def : as<T>(); }

    template <typename T>
    [[nodiscard]] std::optional<T> opt() const {
        if (is_null()) return std::nullopt;
        return as<T>();
    }

private:
    const Value* value_;
    std::string_view name_;

    [[nodiscard]] int64_t integer() const {
        if (const auto* i = std::get_if<int64_t>(value_)) return *i;
        if (const auto* d = std::get_if<double>(value_)) return static_cast<int64_t>(*d);
        throw types::StoreError("Column '" + std::string(name_) + "' is not numeric");
    }
};

class Row {
public:
    Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values)
        : columns_(std::move(columns)), values_(std::move(values)) {}

    [[nodiscard]] Field operator[](std::string_view column) const;
    [[nodiscard]] Field operator[](size_t index) const;
    [[nodiscard]] size_t size() const { return values_.size(); }

private:
    std::shared_ptr<const std::vector<std::string>> columns_;
    std::vector<Value> values_;
};

class Result {
public:
    Result() = default;
    Result(std::vector<Row> rows, const int affected) : rows_(std::move(rows)), affected_(affected) {}

    [[nodiscard]] bool empty() const { return rows_.empty(); }
    [[nodiscard]] size_t size() const { return rows_.size(); }
    [[nodiscard]] int affected_rows() const { return affected_; }

    [[nodiscard]] const Row& operator[](const size_t i) const { return rows_.at(i); }
    [[nodiscard]] const Row& one_row() const;

    [[nodiscard]] auto begin() const { return rows_.begin(); }
    [[nodiscard]] auto end() const { return rows_.end(); }

private:
    std::vector<Row> rows_;
    int affected_ = 0;
};

}
