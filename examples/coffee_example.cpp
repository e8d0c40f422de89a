#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <bytesplit.hpp>

using namespace bytesplit;

struct DeliciousCoffee {
    explicit DeliciousCoffee(const FieldMap& fields)
        : blend(fields.get<std::string>("blend")),
          milk_type(fields.get<std::string>("milk_type")),
          size(fields.get<uint16_t>("size")) {}

    std::string sip() const { return "Mmmm"; }

    std::string blend;
    std::string milk_type;
    uint16_t size;
};

// Helper function to print one split value
void printValue(const FieldValue& value, const std::string& label) {
    std::cout << "  " << label << ": ";
    if (const auto* text = value.get_if<std::string>()) {
        std::cout << '"' << *text << '"';
    } else if (const auto* number = value.get_if<uint16_t>()) {
        std::cout << *number;
    } else if (const auto* raw = value.get_if<Bytes>()) {
        std::cout << std::hex << std::setfill('0');
        for (uint8_t b : *raw) {
            std::cout << std::setw(2) << static_cast<int>(b);
        }
        std::cout << std::dec << " (" << raw->size() << " bytes)";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "bytesplit Examples\n";
    std::cout << "==================\n\n";

    // Example 1: Fixed-length fields
    std::cout << "1. Fixed-Length Fields\n";
    std::cout << "----------------------\n";

    Splitter words{5, 1, 5};
    auto greeting = words(as_byte_view("hello world"));
    if (!greeting) {
        std::cerr << "Split failed: " << greeting.error().describe() << "\n";
        return 1;
    }
    for (size_t i = 0; i < greeting->size(); ++i) {
        printValue((*greeting)[i], "field " + std::to_string(i));
    }
    std::cout << "\n";

    // Example 2: Bundling length-prefixed messages
    std::cout << "2. Bundle and Dispense\n";
    std::cout << "----------------------\n";

    std::vector<Bytes> items{to_bytes("llamas"), to_bytes("dingos"), to_bytes("christmas-tree")};
    auto wire = VariableLengthFrame::bundle(items);
    std::cout << "  Bundled " << items.size() << " items into " << wire.size() << " bytes\n";

    auto dispensed = VariableLengthFrame::dispense(wire);
    if (!dispensed) {
        std::cerr << "Dispense failed: " << dispensed.error().describe() << "\n";
        return 1;
    }
    for (const auto& item : *dispensed) {
        std::cout << "  " << std::string(item.begin(), item.end()) << "\n";
    }
    std::cout << "\n";

    // Example 3: Named fields and a target type
    std::cout << "3. Kwargifier\n";
    std::cout << "-------------\n";

    Kwargifier<DeliciousCoffee> coffee{
        {"blend", field<std::string>(variable_length)},
        {"milk_type", field<std::string>(13, {{"encoding", "ascii"}})},
        {"size", field<uint16_t>(2, {{"byteorder", "big"}})},
    };

    Bytes order = concat_bytes(VariableLengthFrame::encode(to_bytes("Democracy Coffee")),
                               to_bytes("local_oatmilk"), Bytes{0xd4, 0xb5});

    auto brewing = coffee.build_partial(order);
    if (!brewing) {
        std::cerr << "Build failed: " << brewing.error().describe() << "\n";
        return 1;
    }

    // Only the blend is decoded here
    auto blend = brewing->get_field("blend");
    if (blend) {
        printValue(*blend, "blend (just in time)");
    }
    std::cout << "  Fields resolved so far: " << brewing->resolved().size() << " of "
              << brewing->field_names().size() << "\n";

    auto cup = std::move(*brewing).finish();
    if (!cup) {
        std::cerr << "Finish failed: " << cup.error().describe() << "\n";
        return 1;
    }
    std::cout << "  " << cup->blend << " with " << cup->milk_type << ", size " << cup->size
              << ": " << cup->sip() << "\n\n";

    // Example 4: Errors are values
    std::cout << "4. Error Reporting\n";
    std::cout << "------------------\n";

    auto short_order = coffee(ByteView(order).first(order.size() - 1));
    if (!short_order) {
        std::cout << "  " << short_order.error().describe() << "\n";
    }

    return 0;
}
