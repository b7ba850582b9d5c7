// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "test.h"

namespace jsonevent::test
{

TEST(StatusTests, StatusMessages)
{
    ASSERT_EQ(Status::ok().to_string(), "OK");
    ASSERT_EQ(Status::lex_error("Missing decimals", {0, 2}).to_string(), "LexError: Missing decimals at 0:2");
    ASSERT_EQ(Status::parse_error("Unexpected end-array", {3, 14}).to_string(), "ParseError: Unexpected end-array at 3:14");
    ASSERT_EQ(Status::system_error("disk on fire").to_string(), "SystemError: disk on fire");
    ASSERT_EQ(Status::invalid_argument("bad tag").to_string(), "InvalidArgument: bad tag");
}

TEST(StatusTests, StatusCodes)
{
    ASSERT_OK(Status::ok());
    ASSERT_TRUE(Status::lex_error("", {}).is_lex_error());
    ASSERT_TRUE(Status::parse_error("", {}).is_parse_error());
    ASSERT_TRUE(Status::system_error("").is_system_error());
    ASSERT_TRUE(Status::invalid_argument("").is_invalid_argument());
    ASSERT_FALSE(Status::lex_error("", {}).is_parse_error());
    ASSERT_FALSE(Status::ok().is_lex_error());
}

TEST(StatusTests, Position)
{
    const auto s = Status::lex_error("msg", {12, 34});
    ASSERT_EQ(s.line(), 12U);
    ASSERT_EQ(s.column(), 34U);
    ASSERT_EQ(s.what(), "msg");
    ASSERT_EQ(Status::system_error("msg").position(), Position {});
    ASSERT_EQ(Status::ok().position(), Position {});
    ASSERT_TRUE(Status::ok().what().is_empty());
}

TEST(StatusTests, Copy)
{
    const auto s = Status::parse_error("status message", {1, 2});
    const auto t = s;
    ASSERT_TRUE(t.is_parse_error());
    ASSERT_EQ(t.to_string(), s.to_string());

    auto u = Status::ok();
    u = s;
    ASSERT_EQ(u.to_string(), "ParseError: status message at 1:2");

    u = Status::ok();
    ASSERT_OK(u);
    ASSERT_TRUE(s.is_parse_error());
}

TEST(StatusTests, Reassign)
{
    auto s = Status::ok();
    ASSERT_OK(s);
    s = Status::lex_error("status message", {});
    ASSERT_TRUE(s.is_lex_error());
    s = Status::system_error("status message");
    ASSERT_TRUE(s.is_system_error());
    ASSERT_EQ(s.what(), "status message");
}

TEST(StatusTests, MoveConstructor)
{
    auto s = Status::invalid_argument("status message");
    const auto t = std::move(s);
    ASSERT_TRUE(t.is_invalid_argument());
    ASSERT_EQ(t.what(), "status message");
}

TEST(StatusTests, MoveAssignment)
{
    auto s = Status::system_error("status message");
    auto t = Status::ok();
    t = std::move(s);
    ASSERT_TRUE(t.is_system_error());
    ASSERT_EQ(t.what(), "status message");
}

TEST(StatusTests, ResultHoldsStatus)
{
    Result<int> r = Err {Status::lex_error("Expected digit", {0, 2})};
    ASSERT_FALSE(r.has_value());
    ASSERT_EQ(r.error().to_string(), "LexError: Expected digit at 0:2");
    r = 42;
    ASSERT_EQ(*r, 42);
}

} // namespace jsonevent::test
