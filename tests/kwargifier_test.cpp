#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <bytesplit.hpp>

using namespace bytesplit;

namespace {

class DeliciousCoffee {
public:
    explicit DeliciousCoffee(const FieldMap& fields)
        : blend(fields.get<Bytes>("blend")),
          milk_type(fields.get<Bytes>("milk_type")),
          size(fields.get<uint16_t>("size")) {}

    std::string sip() const { return "Mmmm"; }

    Bytes blend;
    Bytes milk_type;
    uint16_t size;
};

// Built through a factory that validates across fields
struct Order {
    static Order from_fields(const FieldMap& fields) {
        const auto& quantity = fields.get<uint16_t>("quantity");
        if (quantity == 0) {
            throw std::invalid_argument("quantity must be positive");
        }
        return Order{fields.get<std::string>("item"), quantity};
    }

    std::string item;
    uint16_t quantity;
};

// Throws something that is not a std::exception
struct Refusal {
    explicit Refusal(const FieldMap&) { throw "no"; }
};

const Kwargifier<DeliciousCoffee> coffee_kwargifier{
    {"blend", variable_length},
    {"milk_type", field<Bytes>(13)},
    {"size", field<uint16_t>(2, {{"byteorder", "big"}})},
};

Bytes coffee_bytes(std::string_view blend, std::string_view milk, uint16_t size) {
    return concat_bytes(VariableLengthFrame::encode(to_bytes(blend)), to_bytes(milk),
                        Bytes{static_cast<uint8_t>(size >> 8), static_cast<uint8_t>(size & 0xff)});
}

} // namespace

// ============================================================================
// Eager construction
// ============================================================================

TEST(KwargifierTest, KwargifiedCoffee) {
    auto cup = coffee_kwargifier(
        coffee_bytes("Equal Exchange Mind, Body, and Soul", "local_oatmilk", 54453));
    ASSERT_TRUE(cup.has_value()) << cup.error().describe();

    EXPECT_EQ(cup->blend, to_bytes("Equal Exchange Mind, Body, and Soul"));
    EXPECT_EQ(cup->milk_type, to_bytes("local_oatmilk"));
    EXPECT_EQ(cup->size, 54453);
    EXPECT_EQ(cup->sip(), "Mmmm");
}

TEST(KwargifierTest, FieldNamesKeepSchemaOrder) {
    EXPECT_EQ(coffee_kwargifier.field_names(),
              (std::vector<std::string>{"blend", "milk_type", "size"}));
    EXPECT_EQ(coffee_kwargifier.splitter().size(), 3u);
}

TEST(KwargifierTest, SizeErrorsPassThrough) {
    Bytes buffer = coffee_bytes("Democracy Coffee", "half_and_half", 16);
    buffer.pop_back();

    auto cup = coffee_kwargifier.build(buffer);
    ASSERT_FALSE(cup.has_value());
    EXPECT_EQ(cup.error().code, SplitErrorCode::size_mismatch);
    EXPECT_EQ(cup.error().field_index, 2u);
}

TEST(KwargifierTest, MissingFieldIsAConstructionError) {
    Kwargifier<DeliciousCoffee> incomplete{
        {"blend", variable_length},
        {"milk_type", field<Bytes>(13)},
    };

    auto cup = incomplete(concat_bytes(VariableLengthFrame::encode(to_bytes("Democracy Coffee")),
                                       to_bytes("half_and_half")));
    ASSERT_FALSE(cup.has_value());
    EXPECT_EQ(cup.error().code, SplitErrorCode::construction_error);
    EXPECT_NE(cup.error().detail.find("size"), std::string::npos);
}

TEST(KwargifierTest, FactoryTargets) {
    Kwargifier<Order> order_kwargifier{
        {"item", field<std::string>(6)},
        {"quantity", field<uint16_t>(2)},
    };

    auto order = order_kwargifier(concat_bytes(to_bytes("beans!"), Bytes{0x00, 0x03}));
    ASSERT_TRUE(order.has_value()) << order.error().describe();
    EXPECT_EQ(order->item, "beans!");
    EXPECT_EQ(order->quantity, 3);

    auto refused = order_kwargifier(concat_bytes(to_bytes("beans!"), Bytes{0x00, 0x00}));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, SplitErrorCode::construction_error);
    EXPECT_NE(refused.error().detail.find("quantity must be positive"), std::string::npos);
}

TEST(KwargifierTest, NonStandardTargetExceptionIsAConstructionError) {
    Kwargifier<Refusal> refusing{{"anything", 4}};

    auto refused = refusing(to_bytes("four"));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, SplitErrorCode::construction_error);
    EXPECT_NE(refused.error().detail.find("non-standard exception"), std::string::npos);
}

TEST(KwargifierTest, DuplicateNamesAreRejected) {
    using Schema = std::vector<NamedField>;
    EXPECT_THROW(Kwargifier<DeliciousCoffee>(Schema{{"blend", 4}, {"blend", 4}}),
                 std::invalid_argument);
    EXPECT_THROW(Kwargifier<DeliciousCoffee>(Schema{{"", 4}}), std::invalid_argument);
}

// ============================================================================
// Partial construction
// ============================================================================

TEST(KwargifierTest, PartialInstantiation) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Sandino Roasters Blend", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value()) << brewing.error().describe();

    // Methods of the target are not fields
    auto sip = brewing->get_field("sip");
    ASSERT_FALSE(sip.has_value());
    EXPECT_EQ(sip.error().code, SplitErrorCode::attribute_resolution);

    auto cup = std::move(*brewing).finish();
    ASSERT_TRUE(cup.has_value()) << cup.error().describe();
    EXPECT_EQ(cup->sip(), "Mmmm");
    EXPECT_EQ(cup->size, 16);
}

TEST(KwargifierTest, JustInTimeAttributeResolution) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Democracy Coffee", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value());
    EXPECT_TRUE(brewing->resolved().empty());

    auto blend = brewing->get<Bytes>("blend");
    ASSERT_TRUE(blend.has_value());
    EXPECT_EQ(*blend, to_bytes("Democracy Coffee"));

    EXPECT_EQ(brewing->resolved().names(), (std::vector<std::string>{"blend"}));
    EXPECT_TRUE(brewing->is_resolved("blend"));
    EXPECT_FALSE(brewing->is_resolved("size"));

    auto sip = brewing->get_field("sip");
    ASSERT_FALSE(sip.has_value());
    EXPECT_EQ(sip.error().code, SplitErrorCode::attribute_resolution);

    // Served from the cache the second time
    auto again = brewing->get<Bytes>("blend");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, to_bytes("Democracy Coffee"));
    EXPECT_EQ(brewing->resolved().size(), 1u);

    auto cup = std::move(*brewing).finish();
    ASSERT_TRUE(cup.has_value());
    EXPECT_EQ(cup->sip(), "Mmmm");
}

TEST(KwargifierTest, PartialMatchesEager) {
    Bytes buffer = coffee_bytes("Equal Exchange Mind, Body, and Soul", "local_oatmilk", 54453);

    auto eager = coffee_kwargifier(buffer);
    auto lazy = coffee_kwargifier.build_partial(buffer);
    ASSERT_TRUE(eager.has_value());
    ASSERT_TRUE(lazy.has_value());

    auto finished = std::move(*lazy).finish();
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->blend, eager->blend);
    EXPECT_EQ(finished->milk_type, eager->milk_type);
    EXPECT_EQ(finished->size, eager->size);
}

TEST(KwargifierTest, PartialDoesNotDependOnCallerBuffer) {
    Bytes buffer = coffee_bytes("Democracy Coffee", "half_and_half", 16);
    auto brewing = coffee_kwargifier.build_partial(buffer);
    ASSERT_TRUE(brewing.has_value());

    std::fill(buffer.begin(), buffer.end(), uint8_t{0});
    buffer.clear();

    auto milk = brewing->get<Bytes>("milk_type");
    ASSERT_TRUE(milk.has_value());
    EXPECT_EQ(*milk, to_bytes("half_and_half"));
}

TEST(KwargifierTest, WrongTypeRequestIsAUsageError) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Democracy Coffee", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value());

    auto size = brewing->get<std::string>("size");
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, SplitErrorCode::usage_error);

    auto right = brewing->get<uint16_t>("size");
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(*right, 16);
}

TEST(KwargifierTest, FinishIsSingleUse) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Democracy Coffee", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value());

    auto cup = std::move(*brewing).finish();
    ASSERT_TRUE(cup.has_value());
    EXPECT_TRUE(brewing->finished());

    auto second = std::move(*brewing).finish();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, SplitErrorCode::usage_error);

    auto blend = brewing->get_field("blend");
    ASSERT_FALSE(blend.has_value());
    EXPECT_EQ(blend.error().code, SplitErrorCode::usage_error);
}

TEST(KwargifierTest, PartialSizeErrorsAreImmediate) {
    Bytes buffer = coffee_bytes("Democracy Coffee", "half_and_half", 16);
    buffer.push_back(0x00);

    auto brewing = coffee_kwargifier.build_partial(buffer);
    ASSERT_FALSE(brewing.has_value());
    EXPECT_EQ(brewing.error().code, SplitErrorCode::size_mismatch);
}

// Test: a field that rejects its bytes fails only when it is resolved
TEST(KwargifierTest, PartialConstructionErrorsAreDeferred) {
    Kwargifier<Order> order_kwargifier{
        {"item", field<std::string>(2)},
        {"quantity", field<uint16_t>(2)},
    };

    auto pending = order_kwargifier.build_partial(Bytes{0xc3, 0x28, 0x00, 0x01});
    ASSERT_TRUE(pending.has_value());

    auto quantity = pending->get<uint16_t>("quantity");
    ASSERT_TRUE(quantity.has_value());
    EXPECT_EQ(*quantity, 1);

    auto item = pending->get_field("item");
    ASSERT_FALSE(item.has_value());
    EXPECT_EQ(item.error().code, SplitErrorCode::construction_error);
    EXPECT_EQ(item.error().field_index, 0u);

    auto order = std::move(*pending).finish();
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, SplitErrorCode::construction_error);
}

TEST(KwargifierTest, MovedFromPartialIsFinished) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Democracy Coffee", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value());

    PartialResult<DeliciousCoffee> taken = std::move(*brewing);
    EXPECT_TRUE(brewing->finished());
    EXPECT_FALSE(taken.finished());

    auto cup = std::move(taken).finish();
    EXPECT_TRUE(cup.has_value());
}

TEST(KwargifierTest, MovedFromPartialHasNoFieldNames) {
    auto brewing =
        coffee_kwargifier.build_partial(coffee_bytes("Democracy Coffee", "half_and_half", 16));
    ASSERT_TRUE(brewing.has_value());
    EXPECT_EQ(brewing->field_names().size(), 3u);

    PartialResult<DeliciousCoffee> taken = std::move(*brewing);
    EXPECT_TRUE(brewing->field_names().empty());
    EXPECT_EQ(taken.field_names(), coffee_kwargifier.field_names());
}

// Test: a target that refuses its fields leaves the partial result unfinished
TEST(KwargifierTest, FailedTargetConstructionKeepsPartialOpen) {
    Kwargifier<Order> order_kwargifier{
        {"item", field<std::string>(6)},
        {"quantity", field<uint16_t>(2)},
    };

    auto pending =
        order_kwargifier.build_partial(concat_bytes(to_bytes("beans!"), Bytes{0x00, 0x00}));
    ASSERT_TRUE(pending.has_value());

    auto order = std::move(*pending).finish();
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, SplitErrorCode::construction_error);

    EXPECT_FALSE(pending->finished());
    EXPECT_EQ(pending->resolved().size(), 2u);

    auto item = pending->get<std::string>("item");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "beans!");

    auto again = std::move(*pending).finish();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, SplitErrorCode::construction_error);
}
