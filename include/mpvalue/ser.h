// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ser.h
/// @brief Generic, visitor-style serialization protocol.
///
/// A type describes itself to a *serializer* by calling one primitive
/// operation, or by opening one compound, feeding it elements and closing
/// it. The serializer decides what to build; to_value() is one serializer.
///
/// Making a type serializable:
/// @code
///   struct Point {
///       int x;
///       int y;
///
///       template <mpvalue::Serializer S>
///       typename S::ok_type serialize(S& s) const {
///           auto st = s.serialize_struct("Point", 2);
///           st.serialize_field("x", x);
///           st.serialize_field("y", y);
///           return st.end();
///       }
///   };
/// @endcode
///
/// or by specializing mpvalue::Serialize<T> when the type can't be edited.
///
/// Serializer operations:
///   serialize_bool / _i8.._i64 / _u8.._u64 / _f32 / _f64 / _char / _str / _bytes
///   serialize_none / serialize_some(v) / serialize_unit
///   serialize_unit_struct(name)
///   serialize_unit_variant(name, index, variant)
///   serialize_newtype_struct(name, v)
///   serialize_newtype_variant(name, index, variant, v)
///   serialize_seq(len?) / serialize_tuple(len) / serialize_tuple_struct(name, len)
///   serialize_tuple_variant(name, index, variant, len)
///   serialize_map(len?) / serialize_struct(name, len)
///   serialize_struct_variant(name, index, variant, len)
///
/// Compound objects are returned by value and expose serialize_element(v),
/// serialize_field(v), serialize_field(name, v), serialize_key(k),
/// serialize_value(v), serialize_entry(k, v) as fits their shape, and end().
///
/// Every operation reports failure by throwing mpvalue::Error.

#pragma once

#include "mpvalue_config.h"

#include "error.h"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace mpvalue {

// ============================================================
// Serializer concept
// ============================================================

template <typename S>
concept Serializer = requires(S& s,
                              std::string_view name,
                              std::span<const uint8_t> bytes,
                              std::optional<std::size_t> len_hint) {
    typename S::ok_type;
    s.serialize_bool(true);
    s.serialize_i8(int8_t{});
    s.serialize_i16(int16_t{});
    s.serialize_i32(int32_t{});
    s.serialize_i64(int64_t{});
    s.serialize_u8(uint8_t{});
    s.serialize_u16(uint16_t{});
    s.serialize_u32(uint32_t{});
    s.serialize_u64(uint64_t{});
    s.serialize_f32(float{});
    s.serialize_f64(double{});
    s.serialize_char(char32_t{});
    s.serialize_str(name);
    s.serialize_bytes(bytes);
    s.serialize_none();
    s.serialize_unit();
    s.serialize_unit_struct(name);
    s.serialize_unit_variant(name, uint32_t{}, name);
    s.serialize_seq(len_hint);
    s.serialize_tuple(std::size_t{});
    s.serialize_tuple_struct(name, std::size_t{});
    s.serialize_tuple_variant(name, uint32_t{}, name, std::size_t{});
    s.serialize_map(len_hint);
    s.serialize_struct(name, std::size_t{});
    s.serialize_struct_variant(name, uint32_t{}, name, std::size_t{});
};

// ============================================================
// Customization point
// ============================================================

/// Specialize for types that can't carry a member serialize().
/// The primary template forwards to `value.serialize(s)`.
template <typename T>
struct Serialize {
    template <Serializer S>
    static typename S::ok_type serialize(const T& value, S& s) {
        return value.serialize(s);
    }
};

/// Drive @p s with @p value.
template <typename T, Serializer S>
typename S::ok_type serialize(const T& value, S& s) {
    return Serialize<T>::serialize(value, s);
}

// ============================================================
// Bytes
// ============================================================

/// Non-owning byte view that serializes through serialize_bytes.
/// A plain std::vector<uint8_t> serializes as a sequence of integers.
struct Bytes {
    std::span<const uint8_t> data;

    Bytes() = default;
    explicit Bytes(std::span<const uint8_t> d) noexcept : data(d) {}
    explicit Bytes(const std::vector<uint8_t>& v) noexcept : data(v) {}
};

template <>
struct Serialize<Bytes> {
    template <Serializer S>
    static typename S::ok_type serialize(const Bytes& value, S& s) {
        return s.serialize_bytes(value.data);
    }
};

// ============================================================
// Impossible
// ============================================================

/// Compound type for serializers that reject a composite shape. The
/// opening call always throws, so no instance ever exists.
template <typename Ok>
class Impossible {
public:
    using ok_type = Ok;

    Impossible() = delete;

    template <typename T>
    void serialize_element(const T&) { unreachable(); }

    template <typename T>
    void serialize_field(const T&) { unreachable(); }

    template <typename T>
    void serialize_field(std::string_view, const T&) { unreachable(); }

    template <typename K>
    void serialize_key(const K&) { unreachable(); }

    template <typename V>
    void serialize_value(const V&) { unreachable(); }

    template <typename K, typename V>
    void serialize_entry(const K&, const V&) { unreachable(); }

    Ok end() { unreachable(); }

private:
    [[noreturn]] static void unreachable() {
        throw Error{"impossible compound used"};
    }
};

// ============================================================
// Primitive impls
// ============================================================

template <>
struct Serialize<bool> {
    template <Serializer S>
    static typename S::ok_type serialize(bool value, S& s) {
        return s.serialize_bool(value);
    }
};

/// Integral types dispatch on width and signedness; `char` follows the
/// platform's signedness. Wider-than-64-bit types are not supported.
template <std::integral T>
    requires (!std::same_as<T, bool> && !std::same_as<T, char32_t> &&
              !std::same_as<T, char16_t> && !std::same_as<T, char8_t> &&
              !std::same_as<T, wchar_t>)
struct Serialize<T> {
    template <Serializer S>
    static typename S::ok_type serialize(T value, S& s) {
        static_assert(sizeof(T) <= 8, "integers wider than 64 bits are not serializable");
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) return s.serialize_i8(static_cast<int8_t>(value));
            else if constexpr (sizeof(T) == 2) return s.serialize_i16(static_cast<int16_t>(value));
            else if constexpr (sizeof(T) == 4) return s.serialize_i32(static_cast<int32_t>(value));
            else return s.serialize_i64(static_cast<int64_t>(value));
        } else {
            if constexpr (sizeof(T) == 1) return s.serialize_u8(static_cast<uint8_t>(value));
            else if constexpr (sizeof(T) == 2) return s.serialize_u16(static_cast<uint16_t>(value));
            else if constexpr (sizeof(T) == 4) return s.serialize_u32(static_cast<uint32_t>(value));
            else return s.serialize_u64(static_cast<uint64_t>(value));
        }
    }
};

template <>
struct Serialize<float> {
    template <Serializer S>
    static typename S::ok_type serialize(float value, S& s) {
        return s.serialize_f32(value);
    }
};

template <>
struct Serialize<double> {
    template <Serializer S>
    static typename S::ok_type serialize(double value, S& s) {
        return s.serialize_f64(value);
    }
};

template <>
struct Serialize<char32_t> {
    template <Serializer S>
    static typename S::ok_type serialize(char32_t value, S& s) {
        return s.serialize_char(value);
    }
};

template <>
struct Serialize<std::string_view> {
    template <Serializer S>
    static typename S::ok_type serialize(std::string_view value, S& s) {
        return s.serialize_str(value);
    }
};

template <>
struct Serialize<std::string> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::string& value, S& s) {
        return s.serialize_str(value);
    }
};

template <>
struct Serialize<const char*> {
    template <Serializer S>
    static typename S::ok_type serialize(const char* value, S& s) {
        if (value == nullptr) {
            return s.serialize_none();
        }
        return s.serialize_str(value);
    }
};

/// String literals and fixed char buffers, up to the first NUL
template <std::size_t N>
struct Serialize<char[N]> {
    template <Serializer S>
    static typename S::ok_type serialize(const char (&value)[N], S& s) {
        const auto len = static_cast<std::size_t>(std::find(value, value + N, '\0') - value);
        return s.serialize_str(std::string_view{value, len});
    }
};

template <>
struct Serialize<std::monostate> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::monostate&, S& s) {
        return s.serialize_unit();
    }
};

template <>
struct Serialize<std::nullptr_t> {
    template <Serializer S>
    static typename S::ok_type serialize(std::nullptr_t, S& s) {
        return s.serialize_unit();
    }
};

// ============================================================
// Container impls
// ============================================================

template <typename T>
struct Serialize<std::optional<T>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::optional<T>& value, S& s) {
        if (value) return s.serialize_some(*value);
        return s.serialize_none();
    }
};

template <typename T, typename Alloc>
struct Serialize<std::vector<T, Alloc>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::vector<T, Alloc>& value, S& s) {
        auto seq = s.serialize_seq(value.size());
        for (const auto& item : value) {
            seq.serialize_element(item);
        }
        return seq.end();
    }
};

template <typename T, std::size_t N>
struct Serialize<std::array<T, N>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::array<T, N>& value, S& s) {
        auto tup = s.serialize_tuple(N);
        for (const auto& item : value) {
            tup.serialize_element(item);
        }
        return tup.end();
    }
};

template <typename A, typename B>
struct Serialize<std::pair<A, B>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::pair<A, B>& value, S& s) {
        auto tup = s.serialize_tuple(2);
        tup.serialize_element(value.first);
        tup.serialize_element(value.second);
        return tup.end();
    }
};

template <typename... Ts>
struct Serialize<std::tuple<Ts...>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::tuple<Ts...>& value, S& s) {
        auto tup = s.serialize_tuple(sizeof...(Ts));
        std::apply([&tup](const auto&... items) { (tup.serialize_element(items), ...); }, value);
        return tup.end();
    }
};

namespace detail {

template <typename MapT, Serializer S>
typename S::ok_type serialize_map_like(const MapT& value, S& s) {
    auto map = s.serialize_map(value.size());
    for (const auto& [key, val] : value) {
        map.serialize_entry(key, val);
    }
    return map.end();
}

} // namespace detail

template <typename K, typename V, typename Cmp, typename Alloc>
struct Serialize<std::map<K, V, Cmp, Alloc>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::map<K, V, Cmp, Alloc>& value, S& s) {
        return detail::serialize_map_like(value, s);
    }
};

template <typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct Serialize<std::unordered_map<K, V, Hash, Eq, Alloc>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::unordered_map<K, V, Hash, Eq, Alloc>& value, S& s) {
        return detail::serialize_map_like(value, s);
    }
};

/// std::variant is an enum whose alternatives are numbered by position:
/// std::monostate alternatives are unit variants, others newtype variants.
template <typename... Ts>
struct Serialize<std::variant<Ts...>> {
    template <Serializer S>
    static typename S::ok_type serialize(const std::variant<Ts...>& value, S& s) {
        const auto index = static_cast<uint32_t>(value.index());
        return std::visit([&s, index](const auto& alt) -> typename S::ok_type {
            using A = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<A, std::monostate>) {
                return s.serialize_unit_variant("variant", index, "");
            } else {
                return s.serialize_newtype_variant("variant", index, "", alt);
            }
        }, value);
    }
};

} // namespace mpvalue
