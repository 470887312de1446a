#include "util/TextDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>

namespace czcheck {
namespace TextDecoder {

namespace {

enum class Kind { Unknown, Utf8, Ascii, Latin1 };

Kind classify(const std::string& encoding) {
    std::string n = normalizeName(encoding);
    if (n == "utf-8" || n == "utf8") return Kind::Utf8;
    if (n == "ascii" || n == "us-ascii") return Kind::Ascii;
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1" || n == "iso8859-1") return Kind::Latin1;
    return Kind::Unknown;
}

// Returns the offset of the first malformed sequence, or npos if valid.
size_t findInvalidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return i;
        }
        if (i + len > s.size()) return i;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return i;
        if (cp >= 0xD800 && cp <= 0xDFFF) return i;
        if (cp > 0x10FFFF) return i;
        i += len;
    }
    return std::string::npos;
}

Error decodeError(const std::string& encoding, size_t offset) {
    return Error{ErrorCode::UnrecognizedEncoding,
                 "Text is not valid " + encoding + " (invalid byte at offset " + std::to_string(offset) + ")"};
}

}  // namespace

std::string normalizeName(const std::string& encoding) {
    std::string n;
    n.reserve(encoding.size());
    for (char c : encoding) {
        if (c == '_') {
            n += '-';
        } else {
            n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return n;
}

bool isSupported(const std::string& encoding) {
    return classify(encoding) != Kind::Unknown;
}

Expected<std::string> decode(const std::string& bytes, const std::string& encoding) {
    switch (classify(encoding)) {
    case Kind::Utf8: {
        size_t bad = findInvalidUtf8(bytes);
        if (bad != std::string::npos) return decodeError(encoding, bad);
        if (bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) return bytes.substr(3);
        return bytes;
    }
    case Kind::Ascii: {
        auto it = std::find_if(bytes.begin(), bytes.end(),
                               [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
        if (it != bytes.end()) return decodeError(encoding, static_cast<size_t>(it - bytes.begin()));
        return bytes;
    }
    case Kind::Latin1: {
        std::string out;
        out.reserve(bytes.size());
        for (char ch : bytes) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 0x80) {
                out += ch;
            } else {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return out;
    }
    case Kind::Unknown:
        break;
    }
    return Error{ErrorCode::UnrecognizedEncoding, "Unknown character set encoding: '" + encoding + "'"};
}

std::string normalizeNewlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += text[i];
        }
    }
    return out;
}

}  // namespace TextDecoder
}  // namespace czcheck
