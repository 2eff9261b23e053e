#include "core/Utf8.hpp"
#include <cstdint>

namespace lexicon {

    namespace {
        size_t sequenceLength(std::string_view text, size_t pos) {
            unsigned char lead = static_cast<unsigned char>(text[pos]);
            size_t length = 1;
            if (lead >= 0xF0 && lead <= 0xF4) length = 4;
            else if (lead >= 0xE0 && lead < 0xF0) length = 3;
            else if (lead >= 0xC2 && lead < 0xE0) length = 2;

            if (length == 1 || pos + length > text.size()) {
                return 1;
            }
            for (size_t i = 1; i < length; ++i) {
                unsigned char next = static_cast<unsigned char>(text[pos + i]);
                if ((next & 0xC0) != 0x80) {
                    return 1;
                }
            }
            return length;
        }

        uint32_t decode(std::string_view unit) {
            unsigned char lead = static_cast<unsigned char>(unit[0]);
            uint32_t cp;
            switch (unit.size()) {
                case 1: return lead;
                case 2: cp = lead & 0x1F; break;
                case 3: cp = lead & 0x0F; break;
                default: cp = lead & 0x07; break;
            }
            for (size_t i = 1; i < unit.size(); ++i) {
                cp = (cp << 6) | (static_cast<unsigned char>(unit[i]) & 0x3F);
            }
            return cp;
        }

        std::string encode(uint32_t cp) {
            std::string out;
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            return out;
        }
    }

    std::string reverseCodePoints(std::string_view text) {
        std::string reversed(text.size(), '\0');
        size_t out = text.size();
        size_t pos = 0;
        while (pos < text.size()) {
            size_t length = sequenceLength(text, pos);
            out -= length;
            reversed.replace(out, length, text.data() + pos, length);
            pos += length;
        }
        return reversed;
    }

    std::optional<std::string> prefixUpperBound(std::string_view prefix) {
        std::vector<size_t> starts;
        for (size_t pos = 0; pos < prefix.size(); pos += sequenceLength(prefix, pos)) {
            starts.push_back(pos);
        }

        while (!starts.empty()) {
            size_t start = starts.back();
            std::string_view unit = prefix.substr(start);
            if (unit.size() == 1 && static_cast<unsigned char>(unit[0]) >= 0x80) {
                return std::nullopt;
            }

            uint32_t cp = decode(unit);
            if (cp < 0x10FFFF) {
                ++cp;
                if (cp == 0xD800) {
                    cp = 0xE000;
                }
                return std::string(prefix.substr(0, start)) + encode(cp);
            }
            starts.pop_back();
            prefix = prefix.substr(0, start);
        }
        return std::nullopt;
    }

    std::vector<std::string> splitTokens(std::string_view text) {
        std::vector<std::string> tokens;
        if (text.empty()) {
            return tokens;
        }

        size_t start = 0;
        while (true) {
            size_t space = text.find(' ', start);
            if (space == std::string_view::npos) {
                tokens.emplace_back(text.substr(start));
                break;
            }
            tokens.emplace_back(text.substr(start, space - start));
            start = space + 1;
        }
        return tokens;
    }

    std::string joinTokens(const std::vector<std::string>& tokens) {
        std::string joined;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i > 0) joined += ' ';
            joined += tokens[i];
        }
        return joined;
    }
}
