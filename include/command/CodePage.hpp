#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace thermo::command {

// Character code pages; the value is the parameter of ESC t
enum class CodePage : uint8_t {
    Cp437 = 0,          // USA, Standard Europe (power-on default)
    Katakana = 1,
    Cp850 = 2,          // Multilingual Latin
    Cp860 = 3,          // Portuguese
    Cp863 = 4,          // Canadian-French
    Cp865 = 5,          // Nordic
    Windows1252 = 16,   // Latin I
    Cp866 = 17,         // Cyrillic #2
    Cp852 = 18,         // Latin 2
    Cp858 = 19,         // Multilingual with Euro
    Cp862 = 21,         // Hebrew DOS
    Cp864 = 22,         // Arabic
    Thai42 = 23,
    Windows1253 = 24,   // Greek
    Windows1254 = 25,   // Turkish
    Windows1257 = 26,   // Baltic
    Farsi = 27,
    Windows1251 = 28,   // Cyrillic
    Cp737 = 29,         // Greek DOS
    Cp775 = 30,         // Baltic DOS
    Thai14 = 31,
    HebrewOld = 32,
    Windows1255 = 33,   // Hebrew
    Thai11 = 34,
    Thai18 = 35,
    Cp855 = 36,         // Cyrillic
    Cp857 = 37,         // Turkish DOS
    Cp928 = 38,         // Greek
    Thai16 = 39,
    Windows1256 = 40,   // Arabic
};

// Short lowercase name, e.g. "cp437", "windows-1252"
std::string_view code_page_name(CodePage page);

// Inverse of code_page_name, case-insensitive
std::optional<CodePage> parse_code_page(std::string_view name);

// ESC t n
std::string select_code_page(CodePage page);

// International character sets; the value is the parameter of ESC R.
// Each one replaces a few ASCII positions ('#', '@', '[' ...) with
// national characters.
enum class InternationalCharacterSet : uint8_t {
    Usa = 0,
    France = 1,
    Germany = 2,
    Uk = 3,
    DenmarkI = 4,
    Sweden = 5,
    Italy = 6,
    SpainI = 7,
    Japan = 8,
    Norway = 9,
    DenmarkII = 10,
    SpainII = 11,
    LatinAmerica = 12,
    Korea = 13,
};

// ESC R n
std::string select_character_set(InternationalCharacterSet set);

struct EncodingError {
    CodePage code_page = CodePage::Cp437;
    size_t byte_offset = 0;   // Into the UTF-8 input
    size_t byte_length = 0;   // Length of the offending sequence
    std::string message;
};

/**
 * Converts UTF-8 text into the byte encoding of a printer code page.
 *
 * Backed by ICU converters. Pages without an ICU converter only accept
 * ASCII. With transliteration enabled, a character the page cannot
 * represent is first rewritten with ICU's Latin-ASCII rules ("“" -> "\"",
 * "ß" -> "ss") before the conversion is declared failed.
 */
class CodePageEncoder {
public:
    explicit CodePageEncoder(CodePage page, bool transliterate = false);
    ~CodePageEncoder();

    CodePageEncoder(const CodePageEncoder&) = delete;
    CodePageEncoder& operator=(const CodePageEncoder&) = delete;

    CodePage code_page() const { return page_; }
    bool has_converter() const;

    // std::nullopt if any character cannot be represented; `error` (if given)
    // then describes the first one
    std::optional<std::string> encode(std::string_view utf8, EncodingError* error = nullptr) const;

private:
    struct Impl;

    CodePage page_;
    bool transliterate_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace thermo::command
