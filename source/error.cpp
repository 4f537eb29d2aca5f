// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <mpvalue/error.h>

#include <cstdlib>

namespace mpvalue::detail {

void contract_failure(std::string_view message, std::source_location loc) noexcept
{
    detail::log_contract_violation(message, loc);
    std::abort();
}

} // namespace mpvalue::detail
