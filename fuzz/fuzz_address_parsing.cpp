// Fuzz target for peer address parsing
// Tests Address::Parse and Address::ToString
//
// Addresses arrive from the command line and from peers' configuration.
// Parse must reject malformed text without crashing, and whatever it
// accepts must print back to text that parses to the same Address.
//
// Target code:
// - src/network/address.cpp (Address::Parse, Address::ToString)

#include "network/address.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

using namespace meshwire::network;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    // Bound input length; addresses are short
    if (size > 512) {
        return 0;
    }
    std::string text(reinterpret_cast<const char*>(data), size);

    auto parsed = Address::Parse(text);
    if (!parsed) {
        return 0;
    }

    if (parsed->port == 0) {
        abort();
    }

    auto again = Address::Parse(parsed->ToString());
    if (!again || !(*again == *parsed)) {
        abort();
    }

    return 0;
}
