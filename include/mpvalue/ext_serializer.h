// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ext_serializer.h
/// @brief Capture of a MessagePack Ext through the generic protocol.
///
/// The protocol has no extension primitive. A producer that wants an Ext
/// serializes a newtype struct named mpvalue::ext_struct_name wrapping a
/// 2-tuple of (int8_t tag, Bytes payload):
///
/// @code
///   s.serialize_newtype_struct(ext_struct_name,
///                              std::tuple<int8_t, Bytes>{5, Bytes{payload}});
/// @endcode
///
/// The converter hands the wrapped value to an ExtSerializer, which accepts
/// exactly one tuple open. Each tuple element goes through an
/// ExtFieldSerializer, which accepts one i8 and one byte string in either
/// order. Anything else throws mpvalue::Error.

#pragma once

#include "mpvalue_config.h"

#include "api.h"
#include "error.h"
#include "ser.h"
#include "value.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <source_location>
#include <span>
#include <string_view>

namespace mpvalue {

/// Stage 2: one tuple element. Accepts serialize_i8 once (the tag) and
/// serialize_bytes once (the payload).
class MPVALUE_API ExtFieldSerializer {
public:
    using ok_type = void;

    void serialize_i8(int8_t value);
    void serialize_bytes(std::span<const uint8_t> value);

    void serialize_bool(bool) { reject(); }
    void serialize_i16(int16_t) { reject(); }
    void serialize_i32(int32_t) { reject(); }
    void serialize_i64(int64_t) { reject(); }
    void serialize_u8(uint8_t) { reject(); }
    void serialize_u16(uint16_t) { reject(); }
    void serialize_u32(uint32_t) { reject(); }
    void serialize_u64(uint64_t) { reject(); }
    void serialize_f32(float) { reject(); }
    void serialize_f64(double) { reject(); }
    void serialize_char(char32_t) { reject(); }
    void serialize_str(std::string_view) { reject(); }
    void serialize_none() { reject(); }
    void serialize_unit() { reject(); }
    void serialize_unit_struct(std::string_view) { reject(); }
    void serialize_unit_variant(std::string_view, uint32_t, std::string_view) { reject(); }

    template <typename T>
    void serialize_some(const T&) { reject(); }

    template <typename T>
    void serialize_newtype_struct(std::string_view, const T&) { reject(); }

    template <typename T>
    void serialize_newtype_variant(std::string_view, uint32_t, std::string_view, const T&) { reject(); }

    Impossible<void> serialize_seq(std::optional<std::size_t>) { reject(); }
    Impossible<void> serialize_tuple(std::size_t) { reject(); }
    Impossible<void> serialize_tuple_struct(std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_tuple_variant(std::string_view, uint32_t, std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_map(std::optional<std::size_t>) { reject(); }
    Impossible<void> serialize_struct(std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_struct_variant(std::string_view, uint32_t, std::string_view, std::size_t) { reject(); }

    /// Both fields present: the Ext. Otherwise throws "expected i8 and bytes".
    [[nodiscard]] Ext finish() &&;

private:
    [[noreturn]] static void reject(std::source_location loc = std::source_location::current());

    std::optional<int8_t> tag_;
    std::optional<ByteBuffer> binary_;
};

/// The open tuple of stage 1. Routes every element into stage 2.
class ExtTuple {
public:
    using ok_type = void;

    explicit ExtTuple(ExtFieldSerializer& fields) noexcept : fields_(&fields) {}

    template <typename T>
    void serialize_element(const T& value) {
        mpvalue::serialize(value, *fields_);
    }

    void end() noexcept {}

private:
    ExtFieldSerializer* fields_;
};

/// Stage 1: the newtype's wrapped value. Accepts a single serialize_tuple.
class MPVALUE_API ExtSerializer {
public:
    using ok_type = void;

    ExtTuple serialize_tuple(std::size_t len);

    void serialize_bool(bool) { reject(); }
    void serialize_i8(int8_t) { reject(); }
    void serialize_i16(int16_t) { reject(); }
    void serialize_i32(int32_t) { reject(); }
    void serialize_i64(int64_t) { reject(); }
    void serialize_u8(uint8_t) { reject(); }
    void serialize_u16(uint16_t) { reject(); }
    void serialize_u32(uint32_t) { reject(); }
    void serialize_u64(uint64_t) { reject(); }
    void serialize_f32(float) { reject(); }
    void serialize_f64(double) { reject(); }
    void serialize_char(char32_t) { reject(); }
    void serialize_str(std::string_view) { reject(); }
    void serialize_bytes(std::span<const uint8_t>) { reject(); }
    void serialize_none() { reject(); }
    void serialize_unit() { reject(); }
    void serialize_unit_struct(std::string_view) { reject(); }
    void serialize_unit_variant(std::string_view, uint32_t, std::string_view) { reject(); }

    template <typename T>
    void serialize_some(const T&) { reject(); }

    template <typename T>
    void serialize_newtype_struct(std::string_view, const T&) { reject(); }

    template <typename T>
    void serialize_newtype_variant(std::string_view, uint32_t, std::string_view, const T&) { reject(); }

    Impossible<void> serialize_seq(std::optional<std::size_t>) { reject(); }
    Impossible<void> serialize_tuple_struct(std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_tuple_variant(std::string_view, uint32_t, std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_map(std::optional<std::size_t>) { reject(); }
    Impossible<void> serialize_struct(std::string_view, std::size_t) { reject(); }
    Impossible<void> serialize_struct_variant(std::string_view, uint32_t, std::string_view, std::size_t) { reject(); }

    /// The captured Ext. Throws "expected tuple" if no tuple was opened,
    /// or "expected i8 and bytes" if a field is missing.
    [[nodiscard]] Ext finish() &&;

private:
    [[noreturn]] static void reject(std::source_location loc = std::source_location::current());

    std::optional<ExtFieldSerializer> fields_;
};

/// Drive @p value through both capture stages and return the Ext.
template <typename T>
[[nodiscard]] Ext capture_ext(const T& value) {
    ExtSerializer se;
    mpvalue::serialize(value, se);
    return std::move(se).finish();
}

} // namespace mpvalue
