// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <util/strencodings.h>

#include <string>

BOOST_AUTO_TEST_SUITE(strencodings_tests)

BOOST_AUTO_TEST_CASE(escape_json_short_forms) {
    BOOST_CHECK_EQUAL(EscapeJSON("plain"), "plain");
    BOOST_CHECK_EQUAL(EscapeJSON("a\"b\\c"), "a\\\"b\\\\c");
    BOOST_CHECK_EQUAL(EscapeJSON("\b\f\n\r\t"), "\\b\\f\\n\\r\\t");
}

BOOST_AUTO_TEST_CASE(escape_json_other_control_characters) {
    BOOST_CHECK_EQUAL(EscapeJSON(std::string("\x01", 1)), "\\u0001");
    BOOST_CHECK_EQUAL(EscapeJSON(std::string("a\x1f" "b", 3)), "a\\u001fb");
    BOOST_CHECK_EQUAL(EscapeJSON(std::string("\0", 1)), "\\u0000");

    // Nothing below 0x20 survives unescaped
    std::string all;
    for (int c = 0; c < 0x20; ++c) {
        all += static_cast<char>(c);
    }
    std::string escaped = EscapeJSON(all);
    for (char c : escaped) {
        BOOST_CHECK(static_cast<unsigned char>(c) >= 0x20);
    }
}

BOOST_AUTO_TEST_CASE(escape_json_keeps_high_bytes) {
    // UTF-8 passes through untouched
    BOOST_CHECK_EQUAL(EscapeJSON("caf\xc3\xa9"), "caf\xc3\xa9");
    BOOST_CHECK_EQUAL(EscapeJSON("\x7f"), "\x7f");
}

BOOST_AUTO_TEST_SUITE_END()
