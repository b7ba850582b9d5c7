// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "json2xml.h"
#include "test.h"
#include "utils/system.h"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace jsonevent::test
{

using namespace jsonevent::tools;

class Json2XmlTests : public testing::Test
{
protected:
    Json2XmlTests()
        : m_dir(std::filesystem::temp_directory_path() /
                (std::string("jsonevent_json2xml_") + testing::UnitTest::GetInstance()->current_test_info()->name()))
    {
        std::filesystem::create_directories(m_dir);
    }

    ~Json2XmlTests() override
    {
        std::error_code ignored;
        std::filesystem::remove_all(m_dir, ignored);
    }

    static auto parse(std::vector<const char *> args) -> Result<Arguments>
    {
        args.insert(args.begin(), "json2xml");
        return parse_arguments(static_cast<int>(args.size()), args.data());
    }

    static auto run(std::vector<const char *> args) -> int
    {
        args.insert(args.begin(), "json2xml");
        return json2xml_main(static_cast<int>(args.size()), args.data());
    }

    static auto assert_usage_error(std::vector<const char *> args, const std::string &target)
    {
        const auto got = parse(args);
        ASSERT_FALSE(got.has_value());
        EXPECT_NOK(got.error());
        ASSERT_TRUE(got.error().is_invalid_argument()) << got.error().to_string();
        ASSERT_EQ(got.error().to_string(), target);
        ASSERT_EQ(run(args), kExitUsageError);
    }

    auto write_file(const std::string &name, const std::string &contents) const -> std::string
    {
        const auto path = (m_dir / name).string();
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << contents;
        return path;
    }

    static auto read_file(const std::string &path) -> std::string
    {
        std::ifstream ifs(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path m_dir;
};

TEST_F(Json2XmlTests, Defaults)
{
    const auto args = parse({});
    ASSERT_TRUE(args.has_value()) << args.error().to_string();
    ASSERT_EQ(args->input, "-");
    ASSERT_EQ(args->output, "");
    ASSERT_EQ(args->xml.root_tag, "root");
    ASSERT_EQ(args->xml.list_item, "list_element");
    ASSERT_EQ(args->xml.header, kDefaultXmlHeader);
    ASSERT_FALSE(args->xml.typed);
    ASSERT_FALSE(args->xml.formatted);
    ASSERT_FALSE(args->help);
    ASSERT_EQ(args->options.log_level, LogLevel::kOff);
}

TEST_F(Json2XmlTests, ShortOptions)
{
    const auto args = parse({"-t", "-f", "-v", "-r", "doc", "-l", "li", "-o", "out.xml", "in.json"});
    ASSERT_TRUE(args.has_value()) << args.error().to_string();
    ASSERT_TRUE(args->xml.typed);
    ASSERT_TRUE(args->xml.formatted);
    ASSERT_EQ(args->options.log_level, LogLevel::kInfo);
    ASSERT_EQ(args->xml.root_tag, "doc");
    ASSERT_EQ(args->xml.list_item, "li");
    ASSERT_EQ(args->output, "out.xml");
    ASSERT_EQ(args->input, "in.json");
}

TEST_F(Json2XmlTests, LongOptions)
{
    const auto args = parse({"--typed", "--formatted", "--header", "<?xml?>", "--root", "doc",
                             "--list-item", "item", "--output", "out.xml", "-"});
    ASSERT_TRUE(args.has_value()) << args.error().to_string();
    ASSERT_TRUE(args->xml.typed);
    ASSERT_TRUE(args->xml.formatted);
    ASSERT_EQ(args->xml.header, "<?xml?>");
    ASSERT_EQ(args->xml.root_tag, "doc");
    ASSERT_EQ(args->xml.list_item, "item");
    ASSERT_EQ(args->output, "out.xml");
    ASSERT_EQ(args->input, "-");
}

TEST_F(Json2XmlTests, Help)
{
    const auto args = parse({"--help"});
    ASSERT_TRUE(args.has_value());
    ASSERT_TRUE(args->help);
    ASSERT_EQ(run({"-h"}), kExitSuccess);
}

TEST_F(Json2XmlTests, MissingOptionValue)
{
    assert_usage_error({"-r"}, R"(InvalidArgument: missing value for "-r")");
    assert_usage_error({"in.json", "--output"}, R"(InvalidArgument: missing value for "--output")");
}

TEST_F(Json2XmlTests, UnrecognizedOption)
{
    assert_usage_error({"--pretty"}, R"(InvalidArgument: unrecognized option "--pretty")");
    assert_usage_error({"-x", "in.json"}, R"(InvalidArgument: unrecognized option "-x")");
}

TEST_F(Json2XmlTests, SecondInputFile)
{
    assert_usage_error({"a.json", "b.json"}, "InvalidArgument: expected at most one input file");
    assert_usage_error({"-", "-"}, "InvalidArgument: expected at most one input file");
}

TEST_F(Json2XmlTests, InvalidTags)
{
    assert_usage_error({"-r", "1st"}, R"(InvalidArgument: "1st" is not a valid root tag)");
    assert_usage_error({"--root", ""}, R"(InvalidArgument: "" is not a valid root tag)");
    assert_usage_error({"-l", "list item"}, R"(InvalidArgument: "list item" is not a valid list item tag)");
}

TEST_F(Json2XmlTests, ConvertsFile)
{
    const auto input = write_file("input.json", R"({"a": [1, "x"], "b": null})");
    const auto output = (m_dir / "output.xml").string();
    ASSERT_EQ(run({"-t", "-o", output.c_str(), input.c_str()}), kExitSuccess);
    ASSERT_EQ(read_file(output),
              std::string(kDefaultXmlHeader) + "\n"
              R"(<root><a><list_element type="int">1</list_element>)"
              R"(<list_element type="string">x</list_element></a><b type="null">null</b></root>)");
}

TEST_F(Json2XmlTests, InvalidDocumentIsRuntimeError)
{
    const auto input = write_file("input.json", "[1, 2,]");
    const auto output = (m_dir / "output.xml").string();
    ASSERT_EQ(run({"-o", output.c_str(), input.c_str()}), kExitRuntimeError);

    Arguments args;
    args.input = input;
    args.output = output;
    const auto log = System(args.options).create_log("json2xml");
    const auto s = convert(args, *log);
    ASSERT_EQ(s.to_string(), "ParseError: Unexpected end-array as array element at 0:7");
}

TEST_F(Json2XmlTests, MissingInputIsRuntimeError)
{
    const auto input = (m_dir / "missing.json").string();
    ASSERT_EQ(run({input.c_str()}), kExitRuntimeError);
}

} // namespace jsonevent::test
