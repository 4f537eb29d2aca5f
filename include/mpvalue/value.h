// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief MessagePack-model Value tree.
///
/// This file defines the Value type produced by to_value():
/// - Nil (std::monostate), Boolean, Integer, Float32, Float64
/// - String (Utf8String: valid text, or the raw bytes that failed validation)
/// - Binary (ByteBuffer)
/// - Array and Map (immer's persistent vectors; map keeps insertion order)
/// - Ext (signed 8-bit type tag + opaque payload)
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include "mpvalue_config.h"

#include "api.h"
#include "log.h"

#include <immer/box.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mpvalue {

/// @brief Byte buffer type for Binary and Ext payloads
using ByteBuffer = std::vector<uint8_t>;

/// Reserved newtype name that routes a value into extension capture.
/// Matches the name MessagePack serde producers use for ext types.
inline constexpr std::string_view ext_struct_name = "_ExtStruct";

// ============================================================
// Integer
// ============================================================

/// A MessagePack integer: either a non-negative value (held as uint64_t)
/// or a negative one (held as int64_t). Non-negative signed inputs are
/// normalized into the unsigned slot, so equality is numeric.
class Integer
{
public:
    constexpr Integer() noexcept : n_(uint64_t{0}) {}

    template <std::signed_integral T>
        requires (!std::same_as<T, bool>)
    constexpr Integer(T v) noexcept
        : n_(v < 0 ? Repr{std::in_place_index<1>, static_cast<int64_t>(v)}
                   : Repr{std::in_place_index<0>, static_cast<uint64_t>(v)}) {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    constexpr Integer(T v) noexcept : n_(std::in_place_index<0>, static_cast<uint64_t>(v)) {}

    /// True if the value fits in int64_t.
    [[nodiscard]] constexpr bool is_i64() const noexcept {
        if (auto* p = std::get_if<0>(&n_)) return *p <= static_cast<uint64_t>(INT64_MAX);
        return true;
    }

    /// True if the value is non-negative.
    [[nodiscard]] constexpr bool is_u64() const noexcept { return n_.index() == 0; }

    [[nodiscard]] constexpr bool is_negative() const noexcept { return n_.index() == 1; }

    [[nodiscard]] constexpr std::optional<int64_t> as_i64() const noexcept {
        if (auto* p = std::get_if<1>(&n_)) return *p;
        if (is_i64()) return static_cast<int64_t>(std::get<0>(n_));
        return std::nullopt;
    }

    [[nodiscard]] constexpr std::optional<uint64_t> as_u64() const noexcept {
        if (auto* p = std::get_if<0>(&n_)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] constexpr double as_f64() const noexcept {
        if (auto* p = std::get_if<0>(&n_)) return static_cast<double>(*p);
        return static_cast<double>(std::get<1>(n_));
    }

    friend constexpr bool operator==(const Integer&, const Integer&) = default;

private:
    using Repr = std::variant<uint64_t, int64_t>;
    Repr n_;
};

// ============================================================
// Utf8String
// ============================================================

/// Bytes that failed UTF-8 validation, kept verbatim.
struct InvalidUtf8
{
    ByteBuffer bytes;
    /// Length of the longest valid prefix.
    std::size_t valid_up_to = 0;

    bool operator==(const InvalidUtf8&) const = default;
};

/// String node payload. Holds either valid UTF-8 text or, when validation
/// fails, the original bytes. Never both.
class MPVALUE_API Utf8String
{
public:
    Utf8String() = default;

    /// Validates @p text; invalid input is kept in the fallback branch.
    Utf8String(std::string text);
    Utf8String(const char* text) : Utf8String(std::string{text}) {}

    [[nodiscard]] static Utf8String from_bytes(std::span<const uint8_t> bytes);

    [[nodiscard]] bool is_str() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    [[nodiscard]] std::optional<std::string_view> as_str() const noexcept {
        if (auto* p = std::get_if<std::string>(&data_)) return std::string_view{*p};
        return std::nullopt;
    }

    /// Raw bytes of either branch.
    [[nodiscard]] std::span<const uint8_t> as_bytes() const noexcept;

    /// Offset of the first invalid byte, for the fallback branch only.
    [[nodiscard]] std::optional<std::size_t> valid_up_to() const noexcept {
        if (auto* p = std::get_if<InvalidUtf8>(&data_)) return p->valid_up_to;
        return std::nullopt;
    }

    bool operator==(const Utf8String&) const = default;

private:
    std::variant<std::string, InvalidUtf8> data_;
};

// ============================================================
// Ext
// ============================================================

/// MessagePack extension: application-defined type tag and opaque payload.
struct Ext
{
    int8_t type = 0;
    ByteBuffer data;

    bool operator==(const Ext&) const = default;
};

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

/// One key/value pair of a Map node. Keys are arbitrary values.
template <typename MemoryPolicy>
struct BasicMapEntry {
    BasicValueBox<MemoryPolicy> key;
    BasicValueBox<MemoryPolicy> value;

    bool operator==(const BasicMapEntry& other) const {
        return key == other.key && value == other.value;
    }

    bool operator!=(const BasicMapEntry& other) const {
        return !(*this == other);
    }
};

/// Map nodes are ordered pair sequences: insertion order is kept and
/// repeated keys are not merged.
template <typename MemoryPolicy>
using BasicValueMap = immer::vector<BasicMapEntry<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using map_entry     = BasicMapEntry<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 Integer,
                 float,
                 double,
                 Utf8String,
                 ByteBuffer,
                 value_array,
                 value_map,
                 Ext>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(Integer{v}) {}

    constexpr BasicValue(Integer v) noexcept : data(v) {}
    constexpr BasicValue(float v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(Utf8String v) : data(std::move(v)) {}
    BasicValue(std::string v) : data(Utf8String{std::move(v)}) {}
    BasicValue(const char* v) : data(Utf8String{std::string{v}}) {}
    BasicValue(ByteBuffer v) : data(std::move(v)) {}
    BasicValue(Ext v) : data(std::move(v)) {}
    BasicValue(value_array v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue map(std::initializer_list<std::pair<BasicValue, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.push_back(map_entry{value_box{key}, value_box{val}});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue binary(ByteBuffer bytes) {
        return BasicValue{std::move(bytes)};
    }

    static BasicValue ext(int8_t type, ByteBuffer bytes) {
        return BasicValue{Ext{type, std::move(bytes)}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_nil() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_integer() const noexcept { return is<Integer>(); }
    [[nodiscard]] bool is_f32() const noexcept { return is<float>(); }
    [[nodiscard]] bool is_f64() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<Utf8String>(); }
    [[nodiscard]] bool is_binary() const noexcept { return is<ByteBuffer>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_ext() const noexcept { return is<Ext>(); }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::optional<int64_t> as_i64() const {
        if (auto* p = get_if<Integer>()) return p->as_i64();
        return std::nullopt;
    }

    [[nodiscard]] std::optional<uint64_t> as_u64() const {
        if (auto* p = get_if<Integer>()) return p->as_u64();
        return std::nullopt;
    }

    /// Float32 is widened; integers are not coerced.
    [[nodiscard]] std::optional<double> as_f64() const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<float>()) return static_cast<double>(*p);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string_view> as_str() const {
        if (auto* p = get_if<Utf8String>()) return p->as_str();
        return std::nullopt;
    }

    /// Bytes of a Binary, String or Ext node.
    [[nodiscard]] std::optional<std::span<const uint8_t>> as_slice() const {
        if (auto* p = get_if<ByteBuffer>()) return std::span<const uint8_t>{*p};
        if (auto* p = get_if<Utf8String>()) return p->as_bytes();
        if (auto* p = get_if<Ext>()) return std::span<const uint8_t>{p->data};
        return std::nullopt;
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* a = get_if<value_array>()) return a->size();
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* b = get_if<ByteBuffer>()) return b->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

// Value = single-threaded tree, the default output of to_value()
using Value      = BasicValue<unsafe_memory_policy>;
using ValueBox   = BasicValueBox<unsafe_memory_policy>;
using ValueArray = BasicValueArray<unsafe_memory_policy>;
using ValueMap   = BasicValueMap<unsafe_memory_policy>;
using MapEntry   = BasicMapEntry<unsafe_memory_policy>;

#if MPVALUE_ENABLE_THREAD_SAFE
// SyncValue = tree that may be shared across threads once built
using SyncValue      = BasicValue<thread_safe_memory_policy>;
using SyncValueBox   = BasicValueBox<thread_safe_memory_policy>;
using SyncValueArray = BasicValueArray<thread_safe_memory_policy>;
using SyncValueMap   = BasicValueMap<thread_safe_memory_policy>;
using SyncMapEntry   = BasicMapEntry<thread_safe_memory_policy>;
#endif

/// Structural equality, variant-for-variant.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Compact single-line rendering, e.g. [1, "a", {2: nil}, ext(5, b"\x01")]
[[nodiscard]] MPVALUE_API std::string value_to_string(const Value& val);

namespace detail {

/// Length of the longest valid UTF-8 prefix of @p bytes.
[[nodiscard]] MPVALUE_API std::size_t utf8_valid_up_to(std::span<const uint8_t> bytes) noexcept;

/// Append the UTF-8 encoding of @p cp to @p out.
/// @return false if @p cp is not a Unicode scalar value
MPVALUE_API bool encode_utf8(char32_t cp, std::string& out);

} // namespace detail

// ============================================================
// Extern Template Declarations
// ============================================================

extern template struct BasicValue<unsafe_memory_policy>;
extern template struct BasicMapEntry<unsafe_memory_policy>;

} // namespace mpvalue
