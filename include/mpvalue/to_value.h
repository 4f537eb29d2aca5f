// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file to_value.h
/// @brief Convert any serializable value into a Value tree.
///
/// @code
///   #include <mpvalue/to_value.h>
///
///   std::map<std::string, std::vector<int>> scores{{"alice", {1, 2}}};
///   Value v = to_value(scores);   // {"alice": [1, 2]}
/// @endcode
///
/// Mapping rules:
/// - integers of every width -> Integer (sign class kept)
/// - f32 / f64 -> Float32 / Float64, never promoted
/// - char, text -> String; bytes -> Binary
/// - none, unit -> Nil; unit struct -> []
/// - seq, tuple, tuple struct, struct -> Array (struct field names dropped)
/// - map -> Map, in call order, duplicate keys kept
/// - enum alternatives -> [index, [fields...]]
/// - newtype struct -> its field, unless named ext_struct_name (-> Ext)
///
/// Conversion is all-or-nothing: any failure throws mpvalue::Error and
/// the partially built tree is released.

#pragma once

#include "mpvalue_config.h"

#include "api.h"
#include "builders.h"
#include "error.h"
#include "ext_serializer.h"
#include "ser.h"
#include "value.h"
#include "value_serialize.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace mpvalue {

template <typename MemoryPolicy = unsafe_memory_policy, typename T>
[[nodiscard]] BasicValue<MemoryPolicy> to_value(const T& value);

namespace detail {

/// Positional enum encoding: [index, args]
template <typename MemoryPolicy>
BasicValue<MemoryPolicy> make_variant(uint32_t index, BasicValueArray<MemoryPolicy> args)
{
    return BasicArrayBuilder<MemoryPolicy>{}
        .push_back(BasicValue<MemoryPolicy>{index})
        .push_back(BasicValue<MemoryPolicy>{std::move(args)})
        .finish();
}

} // namespace detail

// ============================================================
// Compound builders
// ============================================================

/// seq, tuple, tuple struct and struct: every element in order, names dropped.
template <typename MemoryPolicy>
class BasicSeqSerializer {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using ok_type = value_type;

    template <typename T>
    void serialize_element(const T& value) {
        items_.push_back(to_value<MemoryPolicy>(value));
    }

    template <typename T>
    void serialize_field(const T& value) {
        serialize_element(value);
    }

    template <typename T>
    void serialize_field(std::string_view /*name*/, const T& value) {
        serialize_element(value);
    }

    [[nodiscard]] value_type end() {
        return items_.finish();
    }

private:
    BasicArrayBuilder<MemoryPolicy> items_;
};

/// Key/value pairs in call order. A key is converted as soon as it arrives
/// and stays pending until its value does.
template <typename MemoryPolicy>
class BasicMapSerializer {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using ok_type = value_type;

    template <typename K>
    void serialize_key(const K& key) {
        next_key_ = to_value<MemoryPolicy>(key);
    }

    template <typename V>
    void serialize_value(const V& value) {
        // Producers must request the key right before its value.
        MPVALUE_CONTRACT(next_key_.has_value(), "serialize_value called before serialize_key");
        value_type key = std::move(*next_key_);
        next_key_.reset();
        entries_.insert(std::move(key), to_value<MemoryPolicy>(value));
    }

    template <typename K, typename V>
    void serialize_entry(const K& key, const V& value) {
        serialize_key(key);
        serialize_value(value);
    }

    [[nodiscard]] value_type end() {
        return entries_.finish();
    }

private:
    BasicMapBuilder<MemoryPolicy> entries_;
    std::optional<value_type> next_key_;
};

/// Tuple and struct enum alternatives: [index, [fields...]]
template <typename MemoryPolicy>
class BasicVariantSerializer {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using ok_type = value_type;

    explicit BasicVariantSerializer(uint32_t index) : index_(index) {}

    template <typename T>
    void serialize_field(const T& value) {
        fields_.push_back(to_value<MemoryPolicy>(value));
    }

    template <typename T>
    void serialize_field(std::string_view /*name*/, const T& value) {
        serialize_field(value);
    }

    [[nodiscard]] value_type end() {
        return detail::make_variant<MemoryPolicy>(index_, fields_.finish_array());
    }

private:
    uint32_t index_;
    BasicArrayBuilder<MemoryPolicy> fields_;
};

// ============================================================
// BasicValueSerializer
// ============================================================

/// The serializer behind to_value(). Stateless; every call returns a
/// freshly built node.
template <typename MemoryPolicy>
class BasicValueSerializer {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using ok_type = value_type;
    using value_array = BasicValueArray<MemoryPolicy>;
    using seq_type = BasicSeqSerializer<MemoryPolicy>;
    using map_type = BasicMapSerializer<MemoryPolicy>;
    using variant_type = BasicVariantSerializer<MemoryPolicy>;

    value_type serialize_bool(bool v) { return value_type{v}; }

    value_type serialize_i8(int8_t v) { return serialize_i64(v); }
    value_type serialize_i16(int16_t v) { return serialize_i64(v); }
    value_type serialize_i32(int32_t v) { return serialize_i64(v); }
    value_type serialize_i64(int64_t v) { return value_type{Integer{v}}; }

    value_type serialize_u8(uint8_t v) { return serialize_u64(v); }
    value_type serialize_u16(uint16_t v) { return serialize_u64(v); }
    value_type serialize_u32(uint32_t v) { return serialize_u64(v); }
    value_type serialize_u64(uint64_t v) { return value_type{Integer{v}}; }

    value_type serialize_f32(float v) { return value_type{v}; }
    value_type serialize_f64(double v) { return value_type{v}; }

    value_type serialize_char(char32_t v) {
        std::string buf;
        if (!detail::encode_utf8(v, buf)) {
            throw Error::custom("invalid char U+", std::hex, static_cast<uint32_t>(v));
        }
        return serialize_str(buf);
    }

    value_type serialize_str(std::string_view v) {
        return value_type{Utf8String{std::string{v}}};
    }

    value_type serialize_bytes(std::span<const uint8_t> v) {
        return value_type{ByteBuffer(v.begin(), v.end())};
    }

    value_type serialize_none() { return serialize_unit(); }

    template <typename T>
    value_type serialize_some(const T& value) {
        return mpvalue::serialize(value, *this);
    }

    value_type serialize_unit() { return value_type{}; }

    value_type serialize_unit_struct(std::string_view /*name*/) {
        return value_type{value_array{}};
    }

    value_type serialize_unit_variant(std::string_view /*name*/, uint32_t index, std::string_view /*variant*/) {
        return detail::make_variant<MemoryPolicy>(index, value_array{});
    }

    template <typename T>
    value_type serialize_newtype_struct(std::string_view name, const T& value) {
        if (name == ext_struct_name) {
            return value_type{capture_ext(value)};
        }
        return mpvalue::serialize(value, *this);
    }

    /// The enum's index and names are dropped when either name is the
    /// extension sentinel.
    template <typename T>
    value_type serialize_newtype_variant(std::string_view name, uint32_t index, std::string_view variant,
                                         const T& value) {
        if (name == ext_struct_name || variant == ext_struct_name) {
            return value_type{capture_ext(value)};
        }
        auto args = BasicArrayBuilder<MemoryPolicy>{}.push_back(to_value<MemoryPolicy>(value)).finish_array();
        return detail::make_variant<MemoryPolicy>(index, std::move(args));
    }

    // Lengths are sizing hints only; immer transients grow by chunks and
    // a mismatch is not an error.
    seq_type serialize_seq(std::optional<std::size_t> /*len*/) { return seq_type{}; }
    seq_type serialize_tuple(std::size_t /*len*/) { return seq_type{}; }
    seq_type serialize_tuple_struct(std::string_view /*name*/, std::size_t /*len*/) { return seq_type{}; }
    seq_type serialize_struct(std::string_view /*name*/, std::size_t /*len*/) { return seq_type{}; }

    variant_type serialize_tuple_variant(std::string_view /*name*/, uint32_t index, std::string_view /*variant*/,
                                         std::size_t /*len*/) {
        return variant_type{index};
    }

    variant_type serialize_struct_variant(std::string_view /*name*/, uint32_t index, std::string_view /*variant*/,
                                          std::size_t /*len*/) {
        return variant_type{index};
    }

    map_type serialize_map(std::optional<std::size_t> /*len*/) { return map_type{}; }
};

using ValueSerializer = BasicValueSerializer<unsafe_memory_policy>;
using SeqSerializer = BasicSeqSerializer<unsafe_memory_policy>;
using MapSerializer = BasicMapSerializer<unsafe_memory_policy>;
using VariantSerializer = BasicVariantSerializer<unsafe_memory_policy>;

#if MPVALUE_ENABLE_THREAD_SAFE
using SyncValueSerializer = BasicValueSerializer<thread_safe_memory_policy>;
#endif

// ============================================================
// Entry point
// ============================================================

/// Convert @p value into a Value tree.
///
/// @tparam MemoryPolicy immer memory policy of the result (Value by default)
/// @throws mpvalue::Error if the value's serialization fails or misuses the
///         extension-capture convention
template <typename MemoryPolicy, typename T>
BasicValue<MemoryPolicy> to_value(const T& value)
{
    BasicValueSerializer<MemoryPolicy> serializer;
    return mpvalue::serialize(value, serializer);
}

// ============================================================
// Extern Template Declarations
// ============================================================

extern template class BasicValueSerializer<unsafe_memory_policy>;
extern template class BasicSeqSerializer<unsafe_memory_policy>;
extern template class BasicMapSerializer<unsafe_memory_policy>;
extern template class BasicVariantSerializer<unsafe_memory_policy>;

} // namespace mpvalue
