// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "test.h"
#include "utils/fake_source.h"
#include <cstdio>

namespace jsonevent::test
{

static auto read_all(Source &source, std::string &out) -> Status
{
    for (;;) {
        char c;
        auto got = source.read(c);
        if (!got) {
            return got.error();
        } else if (!*got) {
            return Status::ok();
        }
        out += c;
    }
}

TEST(SourceTests, StringSourceReadsEverything)
{
    StringSource source("[1, 2]");
    std::string text;
    ASSERT_OK(read_all(source, text));
    ASSERT_EQ(text, "[1, 2]");

    // End of input is sticky.
    char c;
    auto got = source.read(c);
    ASSERT_TRUE(got.has_value());
    ASSERT_FALSE(*got);
}

TEST(SourceTests, StringSourceOwnsItsText)
{
    std::unique_ptr<StringSource> source;
    {
        std::string text = "true";
        source = std::make_unique<StringSource>(text);
        text.assign("????");
    }
    std::string out;
    ASSERT_OK(read_all(*source, out));
    ASSERT_EQ(out, "true");
}

class FileSourceTests : public testing::Test
{
protected:
    auto make_file(const std::string &contents) -> std::FILE *
    {
        auto *file = std::tmpfile();
        EXPECT_NE(file, nullptr);
        if (file != nullptr) {
            EXPECT_EQ(std::fwrite(contents.data(), 1, contents.size(), file), contents.size());
            std::rewind(file);
        }
        return file;
    }
};

TEST_F(FileSourceTests, ReadsSmallFile)
{
    FileSource source(make_file(R"({"a": null})"), "small", true);
    std::string out;
    ASSERT_OK(read_all(source, out));
    ASSERT_EQ(out, R"({"a": null})");
}

TEST_F(FileSourceTests, ReadsAcrossBlocks)
{
    std::string contents;
    for (size_t i = 0; contents.size() < FileSource::kBlockSize * 3 + 7; ++i) {
        contents += std::to_string(i) + ',';
    }
    FileSource source(make_file(contents), "large", true);
    std::string out;
    ASSERT_OK(read_all(source, out));
    ASSERT_EQ(out, contents);
}

TEST_F(FileSourceTests, ReadsEmptyFile)
{
    FileSource source(make_file(""), "empty", true);
    std::string out;
    ASSERT_OK(read_all(source, out));
    ASSERT_TRUE(out.empty());
}

TEST_F(FileSourceTests, MissingFileIsSystemError)
{
    auto source = new_file_source("/nonexistent/jsonevent/input.json");
    ASSERT_FALSE(source.has_value());
    ASSERT_TRUE(source.error().is_system_error()) << source.error().to_string();
    ASSERT_TRUE(source.error().what().to_view().find("input.json") != std::string_view::npos);
}

TEST(FakeSourceTests, ChunkingDoesNotChangeCharacters)
{
    const std::string text = "[\"chunked\", 1, 2, 3]";
    for (size_t chunk_size : {1, 2, 5, 100}) {
        FakeSource source(text, chunk_size);
        std::string out;
        ASSERT_OK(read_all(source, out));
        ASSERT_EQ(out, text);
        ASSERT_EQ(source.refill_count(), (text.size() + chunk_size - 1) / chunk_size);
    }
}

TEST(FakeSourceTests, InjectedError)
{
    FakeSource source("[1, 2, 3]");
    source.fail_after(4);
    std::string out;
    const auto s = read_all(source, out);
    ASSERT_TRUE(s.is_system_error()) << s.to_string();
    ASSERT_EQ(out, "[1, ");

    // The error is sticky.
    char c;
    auto got = source.read(c);
    ASSERT_FALSE(got.has_value());
    ASSERT_TRUE(got.error().is_system_error());
}

} // namespace jsonevent::test
