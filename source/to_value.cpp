// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// to_value.cpp - Explicit instantiations of the Value serializer family

#include <mpvalue/to_value.h>

namespace mpvalue {

// ============================================================
// Explicit Template Instantiations
//
// Pairs with the 'extern template' declarations in to_value.h so the
// non-template members are compiled once, here.
// ============================================================

template class BasicValueSerializer<unsafe_memory_policy>;
template class BasicSeqSerializer<unsafe_memory_policy>;
template class BasicMapSerializer<unsafe_memory_policy>;
template class BasicVariantSerializer<unsafe_memory_policy>;

template class BasicValueSerializer<thread_safe_memory_policy>;
template class BasicSeqSerializer<thread_safe_memory_policy>;
template class BasicMapSerializer<thread_safe_memory_policy>;
template class BasicVariantSerializer<thread_safe_memory_policy>;

} // namespace mpvalue
