// test_helpers.h - Shared helpers for the mpvalue test executables

#pragma once

#include <catch2/catch_all.hpp>
#include <mpvalue/value.h>

#include <string>

namespace Catch {

// Readable failure output for REQUIRE(a == b) on Value trees
template <>
struct StringMaker<mpvalue::Value> {
    static std::string convert(const mpvalue::Value& v) {
        return mpvalue::value_to_string(v);
    }
};

} // namespace Catch
