#include "doctest.h"
#include "normalize.hpp"

TEST_CASE("normalize_line_breaks") {
    CHECK(normalize_line_breaks("") == "");
    CHECK(normalize_line_breaks("ACGT") == "ACGT");
    CHECK(normalize_line_breaks("A\nC") == "A\nC");
    CHECK(normalize_line_breaks("A\r\nC") == "A\nC");
    CHECK(normalize_line_breaks("A\n\r\r\n\nC") == "A\nC");
    CHECK(normalize_line_breaks("A\rC\rG") == "A\nC\nG");
}

TEST_CASE("normalize_line_breaks collapses leading and trailing runs") {
    CHECK(normalize_line_breaks("\r\n\r>a\nAC\n\n") == "\n>a\nAC\n");
    CHECK(normalize_line_breaks("\n") == "\n");
    CHECK(normalize_line_breaks("\r\r\r") == "\n");
}

TEST_CASE("normalize_line_breaks keeps other whitespace") {
    CHECK(normalize_line_breaks(" \t\n \r\n\t") == " \t\n \n\t");
}

TEST_CASE("normalize_line_breaks is idempotent") {
    std::string text{"\r>WGCaC\n\nAACCcxXAA\naacc\n.ef34\nCGG\r.\r>f\nTTT\r\n"};
    auto once = normalize_line_breaks(text);
    CHECK(normalize_line_breaks(once) == once);
}
