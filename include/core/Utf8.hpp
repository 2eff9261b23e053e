#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexicon {

    // Reverses a UTF-8 string code point by code point. A byte that does not
    // start a well-formed sequence is moved as a single unit. Reversing twice
    // restores well-formed UTF-8 only; stray bytes may regroup into a sequence.
    std::string reverseCodePoints(std::string_view text);

    // Smallest string greater than every string starting with `prefix`, built by
    // incrementing the last code point. Empty when no such bound exists (an empty
    // prefix, only U+10FFFF code points) or the prefix ends in a malformed byte.
    std::optional<std::string> prefixUpperBound(std::string_view prefix);

    // Splits on a single ASCII space. An empty input yields an empty list.
    std::vector<std::string> splitTokens(std::string_view text);

    std::string joinTokens(const std::vector<std::string>& tokens);

}
