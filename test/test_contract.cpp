// test_contract.cpp - Tests for the producer-contract failure channel
// Module 4: Protocol misuse aborts; malformed data only throws

#include "test_helpers.h"

#include <mpvalue/to_value.h>

#include <cstdint>
#include <tuple>

using namespace mpvalue;

#if defined(__unix__) || defined(__APPLE__)

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct ValueBeforeKey {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto map = s.serialize_map(1);
        map.serialize_value(1);
        return map.end();
    }
};

struct WellFormedMap {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto map = s.serialize_map(1);
        map.serialize_key("k");
        map.serialize_value(1);
        return map.end();
    }
};

struct MalformedExt {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        return s.serialize_newtype_struct(ext_struct_name, std::make_tuple(int8_t{5}));
    }
};

// Runs @p fn in a forked child and returns its wait status
template <typename Fn>
int run_in_child(Fn fn) {
    const pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        // Let SIGABRT terminate the child instead of reaching Catch's handler
        std::signal(SIGABRT, SIG_DFL);
        fn();
        _exit(0);
    }
    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    return status;
}

} // namespace

// ============================================================
// Contract violations
// ============================================================

TEST_CASE("map value before key aborts the process", "[contract]") {
    const int status = run_in_child([] { (void)to_value(ValueBeforeKey{}); });
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGABRT);
}

TEST_CASE("well-formed map runs to completion", "[contract]") {
    const int status = run_in_child([] { (void)to_value(WellFormedMap{}); });
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
}

// ============================================================
// Data errors stay recoverable
// ============================================================

TEST_CASE("malformed ext data throws instead of aborting", "[contract]") {
    REQUIRE_THROWS_AS(to_value(MalformedExt{}), Error);

    // The caller can carry on converting after a failure
    REQUIRE(to_value(WellFormedMap{}) == Value::map({{"k", 1}}));
}

#endif
