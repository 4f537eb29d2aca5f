// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value type utilities

#include <mpvalue/value.h>
#include <mpvalue/builders.h>

#include <utf8proc.h>

#include <iomanip>    // for std::setprecision
#include <sstream>    // for std::ostringstream

namespace mpvalue {

// ============================================================
// UTF-8 helpers
// ============================================================

namespace detail {

std::size_t utf8_valid_up_to(std::span<const uint8_t> bytes) noexcept
{
    std::size_t i = 0;
    while (i < bytes.size()) {
        utf8proc_int32_t cp = 0;
        // Rejects overlong forms, surrogates and anything above U+10FFFF
        const auto n = utf8proc_iterate(reinterpret_cast<const utf8proc_uint8_t*>(bytes.data() + i),
                                        static_cast<utf8proc_ssize_t>(bytes.size() - i), &cp);
        if (n <= 0) {
            return i;
        }
        i += static_cast<std::size_t>(n);
    }
    return bytes.size();
}

bool encode_utf8(char32_t cp, std::string& out)
{
    if (cp > 0x10FFFF || !utf8proc_codepoint_valid(static_cast<utf8proc_int32_t>(cp))) {
        return false;
    }
    utf8proc_uint8_t buf[4] = {};
    const auto n = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buf);
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
    return true;
}

} // namespace detail

// ============================================================
// Utf8String
// ============================================================

namespace {

std::span<const uint8_t> bytes_of(const std::string& s) noexcept
{
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // anonymous namespace

Utf8String::Utf8String(std::string text)
{
    const auto valid = detail::utf8_valid_up_to(bytes_of(text));
    if (valid == text.size()) {
        data_ = std::move(text);
        return;
    }
    auto bytes = bytes_of(text);
    data_ = InvalidUtf8{ByteBuffer(bytes.begin(), bytes.end()), valid};
}

Utf8String Utf8String::from_bytes(std::span<const uint8_t> bytes)
{
    Utf8String result;
    const auto valid = detail::utf8_valid_up_to(bytes);
    if (valid == bytes.size()) {
        result.data_ = std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    } else {
        result.data_ = InvalidUtf8{ByteBuffer(bytes.begin(), bytes.end()), valid};
    }
    return result;
}

std::span<const uint8_t> Utf8String::as_bytes() const noexcept
{
    if (auto* p = std::get_if<std::string>(&data_)) return bytes_of(*p);
    return std::get<InvalidUtf8>(data_).bytes;
}

// ============================================================
// value_to_string
// ============================================================

namespace {

std::string format_bytes(std::span<const uint8_t> bytes)
{
    std::ostringstream oss;
    oss << "b\"" << std::hex << std::setfill('0');
    for (auto b : bytes) {
        oss << "\\x" << std::setw(2) << static_cast<unsigned>(b);
    }
    oss << "\"";
    return oss.str();
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Integer>) {
            if (auto u = arg.as_u64()) return std::to_string(*u);
            return std::to_string(*arg.as_i64());
        } else if constexpr (std::is_same_v<T, float>) {
            std::ostringstream oss;
            oss << std::setprecision(9) << arg << "f";
            return oss.str();
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(17) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, Utf8String>) {
            if (auto s = arg.as_str()) return "\"" + std::string{*s} + "\"";
            return "invalid" + format_bytes(arg.as_bytes());
        } else if constexpr (std::is_same_v<T, ByteBuffer>) {
            return format_bytes(arg);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            std::string out = "[";
            bool first = true;
            for (const auto& item : arg) {
                if (!first) out += ", ";
                first = false;
                out += value_to_string(item.get());
            }
            return out + "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string out = "{";
            bool first = true;
            for (const auto& entry : arg) {
                if (!first) out += ", ";
                first = false;
                out += value_to_string(entry.key.get()) + ": " + value_to_string(entry.value.get());
            }
            return out + "}";
        } else {
            return "ext(" + std::to_string(static_cast<int>(arg.type)) + ", " + format_bytes(arg.data) + ")";
        }
    }, val.data);
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

// Explicit instantiation for unsafe_memory_policy (Value)
template struct BasicValue<unsafe_memory_policy>;
template struct BasicMapEntry<unsafe_memory_policy>;
template class BasicArrayBuilder<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;

// Explicit instantiation for thread_safe_memory_policy (SyncValue)
template struct BasicValue<thread_safe_memory_policy>;
template struct BasicMapEntry<thread_safe_memory_policy>;
template class BasicArrayBuilder<thread_safe_memory_policy>;
template class BasicMapBuilder<thread_safe_memory_policy>;

} // namespace mpvalue
