// Fuzz target for the package envelope decoder
// Tests DecodePackage (inflate + CBOR structure) and payload decoding
//
// Every byte a peer sends reaches this code before any validation.
// Bugs here can:
// - Crash the receive loop (exception leaks, null dereference)
// - Exhaust memory (decompression bombs, huge declared lengths)
// - Accept structurally invalid packages
//
// Target code:
// - src/network/transport.cpp (DecodePackage)
// - src/network/message.cpp (Package::Deserialize, SerializedMessage::Deserialize)
// - src/util/compression.cpp (Decompress)

#include "network/errors.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>

using namespace meshwire;
using namespace meshwire::network;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    // First byte selects the limit so both binding defaults are exercised
    if (size < 1) {
        return 0;
    }
    const size_t limit = (data[0] & 1) ? protocol::DEFAULT_TCP_MAX_PACKAGE_SIZE
                                       : protocol::DEFAULT_UDP_MAX_PACKAGE_SIZE;
    data += 1;
    size -= 1;

    Package pkg;
    try {
        pkg = DecodePackage(data, size, limit);
    } catch (const DecodeError&) {
        return 0;
    }

    // A decoded package must satisfy the envelope invariants
    if (pkg.metadata.stage != PackageStage::INACTIVE && !pkg.metadata.session_id) {
        abort();
    }

    try {
        (void)pkg.message.Deserialize();
    } catch (const DecodeError&) {
        return 0;
    }

    // Re-encoding what we accepted must not fail on size
    try {
        auto bytes = EncodePackage(pkg, protocol::MAX_PACKAGE_SIZE_LIMIT);
        auto again = DecodePackage(bytes.data(), bytes.size(), protocol::MAX_PACKAGE_SIZE_LIMIT);
        if (!(again == pkg)) {
            abort();
        }
    } catch (const NetworkError&) {
        abort();
    }

    return 0;
}
