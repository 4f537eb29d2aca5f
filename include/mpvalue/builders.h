// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of Array and Map nodes.
///
/// This file provides transient-based builders:
/// - ArrayBuilder: Build value_array efficiently
/// - MapBuilder: Build value_map efficiently (ordered, duplicates kept)
///
/// Usage:
/// @code
///   #include <mpvalue/builders.h>
///
///   Value items = ArrayBuilder()
///       .push_back("item1")
///       .push_back(42)
///       .finish();
///
///   Value config = MapBuilder()
///       .insert("width", 1920)
///       .insert("height", 1080)
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace mpvalue {

/// Builder for constructing value_array efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_array = BasicValueArray<MemoryPolicy>;
    using transient_type = typename value_array::transient_type;

    BasicArrayBuilder() : transient_(value_array{}.transient()) {}
    explicit BasicArrayBuilder(const value_array& existing) : transient_(existing.transient()) {}

    // Move operations (allowed)
    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    /// Append an element (any type convertible to BasicValue)
    template <typename T>
    BasicArrayBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicArrayBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] bool empty() const {
        return transient_.size() == 0;
    }

    /// Finish building and return the container.
    /// The builder must not be used afterwards.
    [[nodiscard]] value_array finish_array() {
        return std::move(transient_).persistent();
    }

    /// Finish building and return an Array node.
    [[nodiscard]] value_type finish() {
        return value_type{finish_array()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing value_map efficiently - O(n) complexity.
/// Entries are appended in call order; a repeated key adds a second entry.
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using map_entry = BasicMapEntry<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}
    explicit BasicMapBuilder(const value_map& existing) : transient_(existing.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    template <typename K, typename V>
    BasicMapBuilder& insert(K&& key, V&& val) {
        return insert(value_type{std::forward<K>(key)}, value_type{std::forward<V>(val)});
    }

    BasicMapBuilder& insert(value_type key, value_type val) {
        transient_.push_back(map_entry{value_box{std::move(key)}, value_box{std::move(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_map finish_map() {
        return std::move(transient_).persistent();
    }

    [[nodiscard]] value_type finish() {
        return value_type{finish_map()};
    }

private:
    transient_type transient_;
};

using ArrayBuilder = BasicArrayBuilder<unsafe_memory_policy>;
using MapBuilder = BasicMapBuilder<unsafe_memory_policy>;

#if MPVALUE_ENABLE_THREAD_SAFE
using SyncArrayBuilder = BasicArrayBuilder<thread_safe_memory_policy>;
using SyncMapBuilder = BasicMapBuilder<thread_safe_memory_policy>;
#endif

// ============================================================
// Extern Template Declarations
// ============================================================

extern template class BasicArrayBuilder<unsafe_memory_policy>;
extern template class BasicMapBuilder<unsafe_memory_policy>;

} // namespace mpvalue
