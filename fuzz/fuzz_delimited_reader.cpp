/**
 * @file fuzz_delimited_reader.cpp
 * @brief LibFuzzer target for the delimited reader.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

#include "tabload/delimited_reader.h"
#include "tabload/error.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;
    constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
    if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

    // First byte picks separator, quote and skip
    const uint8_t selector = data[0];
    tabload::DelimitedOptions options;
    options.separator = (selector & 1) ? '\t' : ',';
    options.quote = (selector & 2) ? '\0' : ((selector & 4) ? '\'' : '"');
    options.skip = (selector >> 3) & 3;

    std::string input(reinterpret_cast<const char*>(data + 1), size - 1);
    tabload::DelimitedReader reader(std::make_unique<std::istringstream>(input), options);
    try {
        while (reader.next()) {
        }
    } catch (const tabload::MalformedRowError&) {
        // Ragged rows are expected input
    }
    return 0;
}
