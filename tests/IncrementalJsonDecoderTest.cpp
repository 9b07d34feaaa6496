#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"
#include "IncrementalJsonDecoder.hpp"

namespace b2core {

namespace {

struct Item {
    std::string a;
    std::vector<std::uint32_t> b;

    bool operator==(const Item&) const = default;
};

Item tag_invoke(const json::value_to_tag<Item>&, const json::value& jv) {
    const auto& obj = jv.as_object();
    return Item{json::value_to<std::string>(obj.at("a")),
                json::value_to<std::vector<std::uint32_t>>(obj.at("b"))};
}

template <typename T>
void drain(IncrementalJsonDecoder<T>& decoder, std::vector<T>& out) {
    while (auto next = decoder.next()) {
        out.push_back(std::move(*next));
    }
}

template <typename T>
std::vector<T> decode_all(std::string_view json, std::uint32_t level) {
    IncrementalJsonDecoder<T> decoder(level);
    decoder.push(json);
    std::vector<T> out;
    drain(decoder, out);
    return out;
}

template <typename T>
std::vector<T> decode_split(std::string_view json, std::uint32_t level, std::size_t at) {
    IncrementalJsonDecoder<T> decoder(level);
    std::vector<T> out;
    decoder.push(json.substr(0, at));
    drain(decoder, out);
    decoder.push(json.substr(at));
    drain(decoder, out);
    return out;
}

}  // namespace

TEST(IncrementalJsonDecoder, BareArray) {
    EXPECT_EQ(decode_all<std::uint32_t>("[1,2,3,4,5]", 1),
              (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(decode_all<std::uint32_t>("[1, 2, 3, 4, 5]", 1),
              (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));
}

TEST(IncrementalJsonDecoder, WrappedListIgnoresKey) {
    EXPECT_EQ(decode_all<std::uint32_t>("{list: [1,2,3,4,5]}", 2),
              (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(decode_all<std::uint32_t>(R"({"files": [1, 2, 3, 4, 5]})", 2),
              (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));
}

TEST(IncrementalJsonDecoder, ObjectElements) {
    constexpr std::string_view json = R"({list: [
                { "a": "test", "b": [1, 2]},
                { "a": "test2", "b": [3, 4]}
            ]})";
    auto items = decode_all<Item>(json, 2);
    ASSERT_EQ(items.size(), 2U);
    EXPECT_EQ(items[0], (Item{"test", {1, 2}}));
    EXPECT_EQ(items[1], (Item{"test2", {3, 4}}));
}

TEST(IncrementalJsonDecoder, StringsMayContainBracketsAndEscapedQuotes) {
    constexpr std::string_view json = R"(["a]b", "c,d", "e\"]f", "g\\"])";
    auto items = decode_all<std::string>(json, 1);
    EXPECT_EQ(items, (std::vector<std::string>{"a]b", "c,d", "e\"]f", "g\\"}));
}

TEST(IncrementalJsonDecoder, EveryTwoWaySplitOfNestedLists) {
    constexpr std::string_view json = "[[1,2,3],[1,2,3],[3,2,1]]";
    const std::vector<std::vector<std::uint32_t>> expected{{1, 2, 3}, {1, 2, 3}, {3, 2, 1}};
    for (std::size_t i = 1; i < json.size(); ++i) {
        EXPECT_EQ(decode_split<std::vector<std::uint32_t>>(json, 1, i), expected)
            << "split at " << i;
    }
}

TEST(IncrementalJsonDecoder, EveryTwoWaySplitOfObjects) {
    constexpr std::string_view json =
        R"({"items": [{"a": "x,]", "b": [1]}, {"a": "y", "b": []}], "next": null})";
    const std::vector<Item> expected{{"x,]", {1}}, {"y", {}}};
    for (std::size_t i = 1; i < json.size(); ++i) {
        EXPECT_EQ(decode_split<Item>(json, 2, i), expected) << "split at " << i;
    }
}

TEST(IncrementalJsonDecoder, ByteAtATime) {
    constexpr std::string_view json = R"({"n": [10, 20, {"k": [30]}, "s\"]"]})";
    IncrementalJsonDecoder<json::value> decoder(2);
    std::vector<json::value> out;
    for (char c : json) {
        decoder.push(std::string_view(&c, 1));
        drain(decoder, out);
    }
    ASSERT_EQ(out.size(), 4U);
    EXPECT_EQ(out[0], json::value(10));
    EXPECT_EQ(out[1], json::value(20));
    EXPECT_EQ(out[2], json::parse(R"({"k": [30]})"));
    EXPECT_EQ(out[3], json::value("s\"]"));
}

TEST(IncrementalJsonDecoder, EmptyListYieldsNothingForEverySplit) {
    constexpr std::string_view json = "{[ \n]}";
    for (std::size_t i = 1; i < json.size(); ++i) {
        EXPECT_TRUE(decode_split<std::uint8_t>(json, 2, i).empty()) << "split at " << i;
    }
    EXPECT_TRUE(decode_all<std::uint32_t>("[]", 1).empty());
    EXPECT_TRUE(decode_all<std::uint32_t>(R"({"files": []})", 2).empty());
}

TEST(IncrementalJsonDecoder, EmptyListReleasesItsBytes) {
    IncrementalJsonDecoder<std::uint32_t> decoder(2);
    decoder.push(std::string_view("{\"files\": [  \n ]"));
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.buffered(), 0U);
    decoder.push(std::string_view("}"));
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_TRUE(decoder.balanced());
}

TEST(IncrementalJsonDecoder, PreambleIsNotRetained) {
    IncrementalJsonDecoder<std::uint32_t> decoder(2);
    std::string preamble = R"({"padding": ")" + std::string(4096, 'x') + R"(", "list": [)";
    decoder.push(preamble);
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.buffered(), 0U);

    decoder.push(std::string_view("7"));
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.buffered(), 1U);

    decoder.push(std::string_view("]}"));
    EXPECT_EQ(decoder.next(), 7U);
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_TRUE(decoder.balanced());
}

TEST(IncrementalJsonDecoder, IncompleteElementWaitsForMoreBytes) {
    IncrementalJsonDecoder<std::string> decoder(1);
    decoder.push(std::string_view(R"(["abc", "de)"));
    EXPECT_EQ(decoder.next(), "abc");
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_FALSE(decoder.balanced());
    decoder.push(std::string_view(R"(f"])"));
    EXPECT_EQ(decoder.next(), "def");
    EXPECT_TRUE(decoder.balanced());
}

TEST(IncrementalJsonDecoder, LoneCloseBracketIsDecodeError) {
    IncrementalJsonDecoder<std::uint32_t> decoder(1);
    decoder.push(std::string_view("]"));
    EXPECT_THROW(decoder.next(), DecodeError);

    IncrementalJsonDecoder<std::uint32_t> braces(2);
    braces.push(std::string_view("}"));
    EXPECT_THROW(braces.next(), DecodeError);
}

TEST(IncrementalJsonDecoder, ExtraCloseAfterListIsDecodeError) {
    IncrementalJsonDecoder<std::uint32_t> decoder(1);
    decoder.push(std::string_view("[1]]"));
    EXPECT_EQ(decoder.next(), 1U);
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(IncrementalJsonDecoder, SchemaMismatchIsDecodeError) {
    IncrementalJsonDecoder<std::uint32_t> decoder(1);
    decoder.push(std::string_view(R"([1, "two", 3])"));
    EXPECT_EQ(decoder.next(), 1U);
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(IncrementalJsonDecoder, MalformedElementIsDecodeError) {
    IncrementalJsonDecoder<json::value> decoder(1);
    decoder.push(std::string_view("[1, nope, 3]"));
    EXPECT_EQ(decoder.next(), json::value(1));
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(IncrementalJsonDecoder, LevelZeroIsRejected) {
    EXPECT_THROW(IncrementalJsonDecoder<std::uint32_t>(0), std::invalid_argument);
}

TEST(IncrementalJsonDecoder, AcceptsByteSpans) {
    const std::vector<std::uint8_t> bytes{'[', '4', ',', '2', ']'};
    IncrementalJsonDecoder<std::uint32_t> decoder(1, 16);
    decoder.push(std::span<const std::uint8_t>(bytes));
    EXPECT_EQ(decoder.next(), 4U);
    EXPECT_EQ(decoder.next(), 2U);
    EXPECT_FALSE(decoder.next().has_value());
}

}  // namespace b2core
