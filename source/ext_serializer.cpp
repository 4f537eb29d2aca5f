// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <mpvalue/ext_serializer.h>

#include <utility>

namespace mpvalue {

namespace {

constexpr const char* kExpectedTuple = "expected tuple";
constexpr const char* kExpectedFields = "expected i8 and bytes";
constexpr const char* kSecondTag = "received second i8";

} // anonymous namespace

// ============================================================
// ExtFieldSerializer
// ============================================================

void ExtFieldSerializer::serialize_i8(int8_t value)
{
    if (tag_) {
        detail::log_error("ExtFieldSerializer", kSecondTag);
        throw Error{kSecondTag};
    }
    tag_ = value;
}

void ExtFieldSerializer::serialize_bytes(std::span<const uint8_t> value)
{
    if (binary_) {
        detail::log_error("ExtFieldSerializer", "received second byte string");
        throw Error{kExpectedFields};
    }
    binary_.emplace(value.begin(), value.end());
}

Ext ExtFieldSerializer::finish() &&
{
    if (tag_ && binary_) {
        return Ext{*tag_, std::move(*binary_)};
    }
    detail::log_error("ExtFieldSerializer", tag_ ? "missing byte string" : "missing i8 tag");
    throw Error{kExpectedFields};
}

void ExtFieldSerializer::reject(std::source_location loc)
{
    detail::log_error("ExtFieldSerializer", kExpectedFields, loc);
    throw Error{kExpectedFields};
}

// ============================================================
// ExtSerializer
// ============================================================

ExtTuple ExtSerializer::serialize_tuple(std::size_t /*len*/)
{
    // The two-slot accumulator rejects surplus elements on its own, so the
    // declared length is not checked.
    if (fields_) {
        detail::log_error("ExtSerializer", "second tuple opened");
        throw Error{kExpectedTuple};
    }
    return ExtTuple{fields_.emplace()};
}

Ext ExtSerializer::finish() &&
{
    if (!fields_) {
        detail::log_error("ExtSerializer", "no tuple was opened");
        throw Error{kExpectedTuple};
    }
    return std::move(*fields_).finish();
}

void ExtSerializer::reject(std::source_location loc)
{
    detail::log_error("ExtSerializer", kExpectedTuple, loc);
    throw Error{kExpectedTuple};
}

} // namespace mpvalue
