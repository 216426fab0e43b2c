/**
 * @file test_connections_parser.cpp
 * @brief Unit tests for ConnectionsParser, OptionsParser and ConnectionsBuilder
 * @brief ConnectionsParser、OptionsParser 与 ConnectionsBuilder 的单元测试
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <gtest/gtest.h>
#ifdef SILINK_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <functional>
#include <string>
#include <vector>

#include <silink/connections_builder.hpp>
#include <silink/connections_parser.hpp>
#include <silink/error.hpp>

namespace silink {
namespace test {

namespace {

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& ex) {
        return ex.Code();
    }
    return ErrorCode::Success;
}

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test a single section with plain options
 * @brief 测试带普通选项的单个段
 */
TEST(ConnectionsParserTest, SingleSection) {
    ConnectionsParser parser;
    auto sections = parser.Parse("tcp(host=localhost,port=4228,timeout=30000)");

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].protocolName, "tcp");
    EXPECT_EQ(sections[0].rawOptions, "host=localhost,port=4228,timeout=30000");

    OptionsParser options;
    auto pairs = options.Parse("tcp", sections[0].rawOptions);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], (OptionsParser::Option{"host", "localhost"}));
    EXPECT_EQ(pairs[1], (OptionsParser::Option{"port", "4228"}));
    EXPECT_EQ(pairs[2], (OptionsParser::Option{"timeout", "30000"}));
}

/**
 * @brief Test several sections, whitespace and empty option lists
 * @brief 测试多个段、空白与空选项列表
 */
TEST(ConnectionsParserTest, MultipleSections) {
    ConnectionsParser parser;
    auto sections = parser.Parse("  tcp() ,  file(filename=log.sil, append=true) ,mem()  ");

    ASSERT_EQ(sections.size(), 3u);
    EXPECT_EQ(sections[0].protocolName, "tcp");
    EXPECT_EQ(sections[0].rawOptions, "");
    EXPECT_EQ(sections[1].protocolName, "file");
    EXPECT_EQ(sections[1].rawOptions, "filename=log.sil, append=true");
    EXPECT_EQ(sections[2].protocolName, "mem");
}

/**
 * @brief Test that an empty string yields no sections
 * @brief 测试空字符串不产生任何段
 */
TEST(ConnectionsParserTest, EmptyString) {
    ConnectionsParser parser;
    EXPECT_TRUE(parser.Parse("").empty());
    EXPECT_TRUE(parser.Parse("   ").empty());
}

/**
 * @brief Test that a quoted ")" does not close the section
 * @brief 测试引号中的 ")" 不会结束段
 */
TEST(ConnectionsParserTest, QuotedParenthesis) {
    ConnectionsParser parser;
    auto sections = parser.Parse(R"x(file(filename="a(1).sil", caption="x\"y)"), text())x");

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].rawOptions, R"x(filename="a(1).sil", caption="x\"y)")x");

    OptionsParser options;
    auto pairs = options.Parse("file", sections[0].rawOptions);
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0].second, "a(1).sil");
    EXPECT_EQ(pairs[1].second, "x\"y)");
}

/**
 * @brief Test malformed connections strings
 * @brief 测试格式错误的连接字符串
 */
TEST(ConnectionsParserTest, MalformedInput) {
    ConnectionsParser parser;
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp(host=localhost"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("(host=localhost)"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp() file()"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("file(filename=\"log.sil)"); }),
              ErrorCode::ConfigParseError);
}

/**
 * @brief Test that listeners see every section in order
 * @brief 测试监听器按顺序收到每个段
 */
TEST(ConnectionsParserTest, Listeners) {
    ConnectionsParser parser;
    std::vector<std::string> names;
    const auto id = parser.AddListener(
        [&](const ConnectionDescriptor& descriptor) { names.push_back(descriptor.protocolName); });

    parser.Parse("tcp(), pipe(), file()");
    EXPECT_EQ(names, (std::vector<std::string>{"tcp", "pipe", "file"}));

    EXPECT_TRUE(parser.RemoveListener(id));
    parser.Parse("mem()");
    EXPECT_EQ(names.size(), 3u);
}

/**
 * @brief Test option value trimming and unescaping
 * @brief 测试选项值的裁剪与反转义
 */
TEST(OptionsParserTest, TrimAndUnescape) {
    OptionsParser parser;
    auto pairs = parser.Parse("file", R"( Key = plain value ,path="c:\\logs\\app.sil", pad="  x  ")");

    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], (OptionsParser::Option{"Key", "plain value"}));
    EXPECT_EQ(pairs[1], (OptionsParser::Option{"path", "c:\\logs\\app.sil"}));
    EXPECT_EQ(pairs[2], (OptionsParser::Option{"pad", "  x  "}));
}

/**
 * @brief Test malformed option strings
 * @brief 测试格式错误的选项字符串
 */
TEST(OptionsParserTest, MalformedInput) {
    OptionsParser parser;
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp", "host"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp", "=localhost"); }), ErrorCode::ConfigParseError);
    EXPECT_EQ(CodeOf([&] { parser.Parse("tcp", "host=\"localhost"); }),
              ErrorCode::ConfigParseError);
}

/**
 * @brief Test that option listeners receive protocol, key and value
 * @brief 测试选项监听器收到协议、键与值
 */
TEST(OptionsParserTest, Listeners) {
    OptionsParser parser;
    std::vector<std::string> seen;
    parser.AddListener([&](std::string_view protocol, const std::string& key,
                           const std::string& value) {
        seen.push_back(std::string(protocol) + ":" + key + "=" + value);
    });

    parser.Parse("tcp", "host=h, port=1");
    EXPECT_EQ(seen, (std::vector<std::string>{"tcp:host=h", "tcp:port=1"}));
}

/**
 * @brief Test that builder output parses back to the same options
 * @brief 测试构建器输出可解析回相同选项
 */
TEST(ConnectionsBuilderTest, BuildsParsableString) {
    ConnectionsBuilder builder;
    builder.BeginProtocol("file");
    builder.AddOption("filename", "c:\\a \"b\".sil");
    builder.AddOption("append", true);
    builder.AddSizeOption("maxsize", 2048);
    builder.AddOption("rotate", FileRotate::Daily);
    builder.EndProtocol();
    builder.BeginProtocol("tcp");
    builder.AddOption("port", 4228);
    builder.AddTimespanOption("reconnect.interval", std::chrono::milliseconds(3000));
    builder.EndProtocol();

    ConnectionsParser parser;
    auto sections = parser.Parse(builder.ToString());
    ASSERT_EQ(sections.size(), 2u);

    OptionsParser options;
    auto file = options.Parse(sections[0].protocolName, sections[0].rawOptions);
    ASSERT_EQ(file.size(), 4u);
    EXPECT_EQ(file[0].second, "c:\\a \"b\".sil");
    EXPECT_EQ(file[1].second, "true");
    EXPECT_EQ(file[2].second, "2kb");
    EXPECT_EQ(file[3].second, "Daily");

    auto tcp = options.Parse(sections[1].protocolName, sections[1].rawOptions);
    ASSERT_EQ(tcp.size(), 2u);
    EXPECT_EQ(tcp[0].second, "4228");
    EXPECT_EQ(tcp[1].second, "3s");
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: any quoted value parses back unchanged
 * @brief 属性：任何加引号的值都能原样解析回来
 */
RC_GTEST_PROP(OptionsParserPropertyTest, QuotedValueRoundTrip, (const std::string& value)) {
    OptionsParser parser;
    auto pairs = parser.Parse("p", "key=" + QuoteOptionValue(value));

    RC_ASSERT(pairs.size() == 1u);
    RC_ASSERT(pairs[0].first == "key");
    RC_ASSERT(pairs[0].second == value);
}

/**
 * @brief Property: built sections are parsed back in order
 * @brief 属性：构建的段按顺序解析回来
 */
RC_GTEST_PROP(ConnectionsParserPropertyTest, BuilderSectionCount, ()) {
    const auto count = *rc::gen::inRange<size_t>(1, 8);
    const auto value = *rc::gen::arbitrary<std::string>();

    ConnectionsBuilder builder;
    for (size_t i = 0; i < count; ++i) {
        builder.BeginProtocol("mem");
        builder.AddOption("caption", value);
        builder.EndProtocol();
    }

    ConnectionsParser parser;
    auto sections = parser.Parse(builder.ToString());
    RC_ASSERT(sections.size() == count);
    for (const auto& section : sections) {
        RC_ASSERT(section.protocolName == "mem");
    }
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
