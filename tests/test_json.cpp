//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSON parser/serializer: escaping, unicode, number typing, errors
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "toolrpc/JSONRPCTypes.h"

using namespace toolrpc;

TEST(Json, EscapesControlCharactersAndQuotes) {
    JSONValue v{std::string("a\"b\\c\nd\te\x01")};
    EXPECT_EQ(SerializeJSON(v), R"("a\"b\\c\nd\te\u0001")");
    EXPECT_EQ(ParseJSON(SerializeJSON(v)), v);
}

TEST(Json, DecodesUnicodeEscapesIncludingSurrogatePairs) {
    JSONValue v = ParseJSON(R"("é✓😀")");
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "\xC3\xA9\xE2\x9C\x93\xF0\x9F\x98\x80");
}

TEST(Json, RejectsUnpairedSurrogates) {
    EXPECT_THROW(ParseJSON(R"("\ud83d")"), std::runtime_error);
    EXPECT_THROW(ParseJSON(R"("\ude00")"), std::runtime_error);
}

TEST(Json, KeepsIntegersAndDoublesDistinct) {
    JSONValue v = ParseJSON(R"({"i":12,"neg":-4,"d":1.5,"e":1e3})");
    EXPECT_TRUE(std::holds_alternative<int64_t>(v.Find("i")->value));
    EXPECT_EQ(std::get<int64_t>(v.Find("neg")->value), -4);
    EXPECT_TRUE(std::holds_alternative<double>(v.Find("d")->value));
    EXPECT_TRUE(std::holds_alternative<double>(v.Find("e")->value));

    JSONValue whole{3.0};
    const std::string text = SerializeJSON(whole);
    EXPECT_TRUE(std::holds_alternative<double>(ParseJSON(text).value)) << text;
}

TEST(Json, RejectsTrailingGarbageAndTruncation) {
    EXPECT_THROW(ParseJSON("{} x"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(Json, DeepEqualityIgnoresKeyOrder) {
    EXPECT_EQ(ParseJSON(R"({"a":1,"b":[true,null]})"), ParseJSON(R"({"b":[true,null],"a":1})"));
    EXPECT_NE(ParseJSON(R"({"a":1})"), ParseJSON(R"({"a":2})"));
}
