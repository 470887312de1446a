#pragma once

#include <string>

#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Converts raw file bytes in a named encoding to UTF-8 text
 *
 * Supported encodings (names are case-insensitive, '_' and '-' are interchangeable):
 *   utf-8, utf8             - validated, a leading BOM is dropped
 *   ascii, us-ascii         - bytes >= 0x80 are rejected
 *   latin-1, latin1,
 *   iso-8859-1, iso8859-1   - every byte is transcoded to its UTF-8 form
 *
 * Any other name, or bytes that are invalid for the encoding, yields
 * ErrorCode::UnrecognizedEncoding.
 */
namespace TextDecoder {

/// Normalize an encoding name: lowercase, '_' replaced with '-'
std::string normalizeName(const std::string& encoding);

/// True if decode() understands @p encoding
bool isSupported(const std::string& encoding);

/**
 * @brief Decode @p bytes from @p encoding into UTF-8
 * @return Decoded text, or UnrecognizedEncoding error
 */
Expected<std::string> decode(const std::string& bytes, const std::string& encoding);

/// Turn "\r\n" and lone "\r" line endings into "\n"
std::string normalizeNewlines(const std::string& text);

}  // namespace TextDecoder

}  // namespace czcheck
