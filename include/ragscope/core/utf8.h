#pragma once

#include <cstddef>
#include <string_view>

namespace ragscope::core {

// Longest prefix of at most maxBytes that does not end inside a UTF-8 sequence.
inline std::string_view utf8Prefix(std::string_view input, size_t maxBytes) {
    if (input.size() <= maxBytes)
        return input;
    size_t end = maxBytes;
    while (end > 0 && (static_cast<unsigned char>(input[end]) & 0xC0) == 0x80)
        --end;
    return input.substr(0, end);
}

} // namespace ragscope::core
