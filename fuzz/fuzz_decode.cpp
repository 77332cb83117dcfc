// fuzz_decode.cpp - libFuzzer target for the ember::json decoder.
//
// Feeds arbitrary bytes through decode() into a dynamic Value and into a
// fixed-type slot, with and without use_number. Round-trips every accepted
// document through dump() and checks that it decodes to the same tree.
// AddressSanitizer + UBSanitizer are enabled by the EMBER_JSON_BUILD_FUZZ
// option in the root CMakeLists.txt.
//
// Build:
//   cmake -B build-fuzz \
//         -DEMBER_JSON_BUILD_FUZZ=ON \
//         -DEMBER_JSON_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_decode
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_decode corpus/ -max_len=65536

#include <ember_json/ember_json.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

using namespace ember::json;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // ── 1. Dynamic tree, native numbers ─────────────────────────────────────
    Value v;
    if (decode(input, v)) {
        // Doubles may be printed as integers; compare the dumps instead.
        const std::string once = dump(v);
        Value again;
        if (!decode(once, again) || dump(again) != once)
            std::abort();
    }

    // ── 2. Numbers kept as text ─────────────────────────────────────────────
    DecodeOptions opts;
    opts.use_number = true;
    Value text;
    if (decode(input, text, opts)) {
        const std::string once = dump(text);
        Value again;
        if (!decode(once, again, opts) || dump(again) != once)
            std::abort();
    }

    // ── 3. Fixed-type destination ───────────────────────────────────────────
    int64_t n = 0;
    FixedSlot<int64_t> slot(n);
    ParseResult r = decode(input, slot);
    if (!r && r.error == Error::Ok)
        std::abort();

    // ── 4. Scanner alone must agree with the decoder on syntax ──────────────
    if (!validate(input) && static_cast<bool>(decode(input, v)))
        std::abort();

    return 0;
}
