// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Persistent JSON-like document type.
///
/// A Value is one of:
/// - null (std::monostate), bool, integer (int64_t), floating point (double), string
/// - a sequence (immer::vector of boxed Values)
/// - an object (immer::map from std::string to boxed Values)
///
/// Containers are immer's persistent structures: "modifying" a Value always
/// produces a new Value, and every subtree that was not on the modified path
/// is shared with the original instead of being copied.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize the allocation and refcount strategy of the underlying containers.

#pragma once

#include <jsonrfc/jsonrfc_config.h>
#include <jsonrfc/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonrfc {

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                       MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    constexpr BasicValue(int v) noexcept : data(int64_t{v}) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }

    /// Look up a map member without copying it; nullptr when absent or not a map
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    /// Look up a sequence element without copying it; nullptr when out of range or not a vector
    [[nodiscard]] const BasicValue* find(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return &(*v)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        auto* found = find(key);
        return found ? *found : BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        auto* found = find(index);
        return found ? *found : BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }
    [[nodiscard]] bool contains(std::size_t index) const { return find(index) != nullptr; }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    /// Number of members (map) or elements (vector); 0 for scalars
    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }
};

/// Structural equality. An integer and a double never compare equal,
/// even when they denote the same number.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Default Value Type Aliases
//
// Value uses immer's default (thread-safe) memory policy so that one
// document can be read by concurrent calls on several threads.
// ============================================================

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = BasicValueBox<immer::default_memory_policy>;
using ValueMap    = BasicValueMap<immer::default_memory_policy>;
using ValueVector = BasicValueVector<immer::default_memory_policy>;

// ============================================================
// Utility functions
// ============================================================

/// Compact JSON-like rendering, used in diagnostics and test output.
/// Map members are printed in key order so the output is deterministic.
[[nodiscard]] JSONRFC_API std::string value_to_string(const Value& val);

/// Print Value with indentation
JSONRFC_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

JSONRFC_EXTERN_TEMPLATE struct BasicValue<immer::default_memory_policy>;

} // namespace jsonrfc
