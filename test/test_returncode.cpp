#include <catch2/catch.hpp>

#include "physio/returncode.hpp"

using namespace Physio;

TEST_CASE("vendor return codes are described by name", "[returncode]") {
    CHECK(describe(1) == "MPSUCCESS");
    CHECK(describe(MPNOTCON) == "MPNOTCON");
    CHECK(describe(MPNOACTCH) == "MPNOACTCH");
    CHECK(describe(MPPARSERERR) == "MPPARSERERR");
}

TEST_CASE("codes outside the vendor table are unknown", "[returncode]") {
    CHECK(describe(0) == "UNKNOWN");
    CHECK(describe(-1) == "UNKNOWN");
    CHECK(describe(MPPARSERERR + 1) == "UNKNOWN");
}
