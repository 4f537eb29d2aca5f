// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_serialize.h
/// @brief Serialize impls for the Value model itself.
///
/// A Value tree can be fed back through any serializer. Passing it to
/// to_value() reproduces the same tree, except that a String whose bytes
/// failed UTF-8 validation comes back as Binary.

#pragma once

#include "mpvalue_config.h"

#include "ser.h"
#include "value.h"

#include <cstdint>
#include <tuple>
#include <type_traits>
#include <variant>

namespace mpvalue {

template <>
struct Serialize<Integer> {
    template <Serializer S>
    static typename S::ok_type serialize(const Integer& value, S& s) {
        if (auto u = value.as_u64()) {
            return s.serialize_u64(*u);
        }
        return s.serialize_i64(*value.as_i64());
    }
};

template <>
struct Serialize<Utf8String> {
    template <Serializer S>
    static typename S::ok_type serialize(const Utf8String& value, S& s) {
        if (auto str = value.as_str()) {
            return s.serialize_str(*str);
        }
        return s.serialize_bytes(value.as_bytes());
    }
};

/// Ext goes out under the capture convention: a newtype named
/// ext_struct_name wrapping (tag, payload).
template <>
struct Serialize<Ext> {
    template <Serializer S>
    static typename S::ok_type serialize(const Ext& value, S& s) {
        return s.serialize_newtype_struct(ext_struct_name, std::tuple<int8_t, Bytes>{value.type, Bytes{value.data}});
    }
};

template <typename MemoryPolicy>
struct Serialize<BasicValue<MemoryPolicy>> {
    using value_type = BasicValue<MemoryPolicy>;
    using value_array = typename value_type::value_array;
    using value_map = typename value_type::value_map;

    template <Serializer S>
    static typename S::ok_type serialize(const value_type& value, S& s) {
        return std::visit([&s](const auto& arg) -> typename S::ok_type {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return s.serialize_unit();
            } else if constexpr (std::is_same_v<T, bool>) {
                return s.serialize_bool(arg);
            } else if constexpr (std::is_same_v<T, float>) {
                return s.serialize_f32(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                return s.serialize_f64(arg);
            } else if constexpr (std::is_same_v<T, ByteBuffer>) {
                return s.serialize_bytes(arg);
            } else if constexpr (std::is_same_v<T, value_array>) {
                auto seq = s.serialize_seq(arg.size());
                for (const auto& item : arg) {
                    seq.serialize_element(item.get());
                }
                return seq.end();
            } else if constexpr (std::is_same_v<T, value_map>) {
                auto map = s.serialize_map(arg.size());
                for (const auto& entry : arg) {
                    map.serialize_entry(entry.key.get(), entry.value.get());
                }
                return map.end();
            } else {
                // Integer, Utf8String, Ext
                return mpvalue::serialize(arg, s);
            }
        }, value.data);
    }
};

} // namespace mpvalue
