#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <bytesplit.hpp>

using namespace bytesplit;

namespace {

// {b"something": True}
const Bytes something_true = concat_bytes(Bytes{0x81, 0xc4, 0x09}, to_bytes("something"),
                                          Bytes{0xc3});

// key=value;key=value pairs, for exercising a caller-supplied decoder
class KeyValueDecoder : public MappingDecoder {
public:
    expected<Mapping, std::string> decode(ByteView bytes) const override {
        std::string text(bytes.begin(), bytes.end());
        Mapping out;
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find(';', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            const std::string pair = text.substr(start, end - start);
            const size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                return make_unexpected("missing '=' in '" + pair + "'");
            }
            out.push_back(MapEntry{MapValue{pair.substr(0, eq)}, MapValue{pair.substr(eq + 1)}});
            start = end + 1;
        }
        return out;
    }
};

} // namespace

TEST(MappingDecoderTest, MsgpackRemainderAfterFixedField) {
    Splitter splitter{16};
    Bytes buffer = concat_bytes(to_bytes("This is 16 bytes"), something_true);

    auto values = splitter.split(buffer, {.decode_remainder_as_mapping = true});
    ASSERT_TRUE(values.has_value()) << values.error().describe();
    ASSERT_EQ(values->size(), 2u);
    EXPECT_EQ((*values)[0].bytes(), to_bytes("This is 16 bytes"));

    const auto& mapping = (*values)[1].as<Mapping>();
    ASSERT_EQ(mapping.size(), 1u);
    const MapValue* flag = find_entry(mapping, "something");
    ASSERT_NE(flag, nullptr);
    ASSERT_TRUE(flag->is<bool>());
    EXPECT_TRUE(flag->as<bool>());
}

TEST(MappingDecoderTest, StringKeysAndScalarValues) {
    // {"n": -3, "u": 200, "s": "hi", "z": nil}
    Bytes map{0x84, 0xa1, 'n', 0xfd, 0xa1, 'u', 0xcc, 0xc8,
              0xa1, 's', 0xa2, 'h',  'i',  0xa1, 'z', 0xc0};

    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(map);
    ASSERT_TRUE(mapping.has_value()) << mapping.error();
    ASSERT_EQ(mapping->size(), 4u);

    EXPECT_EQ(find_entry(*mapping, "n")->as<int64_t>(), -3);
    EXPECT_EQ(find_entry(*mapping, "u")->as<int64_t>(), 200);
    EXPECT_EQ(find_entry(*mapping, "s")->as<std::string>(), "hi");
    EXPECT_TRUE(find_entry(*mapping, "z")->is_nil());
    EXPECT_EQ(find_entry(*mapping, "missing"), nullptr);
}

TEST(MappingDecoderTest, NestedContainers) {
    // {"list": [1, 2], "inner": {"x": 1.5}}
    Bytes map = concat_bytes(Bytes{0x82, 0xa4}, to_bytes("list"), Bytes{0x92, 0x01, 0x02, 0xa5},
                             to_bytes("inner"), Bytes{0x81, 0xa1, 'x', 0xcb, 0x3f, 0xf8, 0x00,
                                                      0x00, 0x00, 0x00, 0x00, 0x00});

    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(map);
    ASSERT_TRUE(mapping.has_value()) << mapping.error();

    const auto& list = find_entry(*mapping, "list")->as<MapArray>();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1].as<int64_t>(), 2);

    const auto& inner = find_entry(*mapping, "inner")->as<Mapping>();
    EXPECT_DOUBLE_EQ(find_entry(inner, "x")->as<double>(), 1.5);
}

TEST(MappingDecoderTest, LargeUnsignedKeepsFullRange) {
    Bytes map{0x81, 0xa1, 'b', 0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};

    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(map);
    ASSERT_TRUE(mapping.has_value());
    EXPECT_EQ(find_entry(*mapping, "b")->as<uint64_t>(), UINT64_MAX);
}

TEST(MappingDecoderTest, EmptyMap) {
    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(Bytes{0x80});
    ASSERT_TRUE(mapping.has_value());
    EXPECT_TRUE(mapping->empty());
}

// ============================================================================
// Rejections
// ============================================================================

TEST(MappingDecoderTest, MalformedRemainderIsAConstructionError) {
    Splitter splitter{16};
    Bytes buffer = concat_bytes(to_bytes("This is 16 bytes"), Bytes{0x81, 0xc4, 0x09, 's'});

    auto values = splitter.split(buffer, {.decode_remainder_as_mapping = true});
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().code, SplitErrorCode::construction_error);
    EXPECT_EQ(values.error().field_index, 1u);
}

TEST(MappingDecoderTest, EmptyRemainderIsNotAMapping) {
    Splitter splitter{16};

    auto values = splitter.split(as_byte_view("This is 16 bytes"),
                                 {.decode_remainder_as_mapping = true});
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().code, SplitErrorCode::construction_error);
}

TEST(MappingDecoderTest, TopLevelMustBeAMap) {
    MsgpackMappingDecoder decoder;
    auto array = decoder.decode(Bytes{0x92, 0x01, 0x02});
    ASSERT_FALSE(array.has_value());
    EXPECT_NE(array.error().find("not a map"), std::string::npos);
}

TEST(MappingDecoderTest, TrailingBytesAreRejected) {
    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(Bytes{0x80, 0x00});
    ASSERT_FALSE(mapping.has_value());
    EXPECT_NE(mapping.error().find("trailing"), std::string::npos);
}

TEST(MappingDecoderTest, ExtTypesAreRejected) {
    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(Bytes{0x81, 0xa1, 'e', 0xd4, 0x01, 0x00});
    ASSERT_FALSE(mapping.has_value());
    EXPECT_NE(mapping.error().find("ext type 1"), std::string::npos);
}

TEST(MappingDecoderTest, HostileCountsDoNotAllocate) {
    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(Bytes{0xdf, 0xff, 0xff, 0xff, 0xff});
    ASSERT_FALSE(mapping.has_value());
    EXPECT_NE(mapping.error().find("truncated"), std::string::npos);
}

TEST(MappingDecoderTest, DeepNestingIsRejected) {
    // {"": [[[[...]]]]} nested past the depth limit
    Bytes map{0x81, 0xa0};
    map.insert(map.end(), MsgpackMappingDecoder::max_depth + 2, 0x91);
    map.push_back(0xc0);

    MsgpackMappingDecoder decoder;
    auto mapping = decoder.decode(map);
    ASSERT_FALSE(mapping.has_value());
    EXPECT_NE(mapping.error().find("too deep"), std::string::npos);
}

// ============================================================================
// Caller-supplied decoders
// ============================================================================

TEST(MappingDecoderTest, CustomDecoderIsUsed) {
    KeyValueDecoder decoder;
    Splitter splitter{4};

    auto values = splitter.split(as_byte_view("headblend=house;milk=oat"),
                                 {.decode_remainder_as_mapping = true, .mapping_decoder = &decoder});
    ASSERT_TRUE(values.has_value()) << values.error().describe();

    const auto& mapping = values->back().as<Mapping>();
    ASSERT_EQ(mapping.size(), 2u);
    EXPECT_EQ(find_entry(mapping, "milk")->as<std::string>(), "oat");
}

TEST(MappingDecoderTest, CustomDecoderFailureCarriesMessage) {
    KeyValueDecoder decoder;
    Splitter splitter{4};

    auto values = splitter.split(as_byte_view("headblend"),
                                 {.decode_remainder_as_mapping = true, .mapping_decoder = &decoder});
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().code, SplitErrorCode::construction_error);
    EXPECT_NE(values.error().detail.find("missing '='"), std::string::npos);
}
