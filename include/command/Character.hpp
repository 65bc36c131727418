#pragma once

#include "style/AttributeSet.hpp"
#include "style/Transition.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace thermo::command {

/**
 * Character formatting commands.
 *
 * Every encoder returns a complete, self-contained byte sequence; sequences
 * for different attributes can be concatenated in any order. Each one must be
 * sent before the text it affects.
 */

// ESC E n
std::string set_emphasized(bool on);

// ESC - n   (n = 0 off, 1 one-dot, 2 two-dot)
std::string set_underline(style::Underline level);

// ESC G n
std::string set_double_strike(bool on);

// GS B n   (white on black)
std::string set_reverse(bool on);

// ESC { n   (180 degrees, only honoured at the start of a line)
std::string set_upside_down(bool on);

// ESC V n   (90 degrees clockwise)
std::string set_rotation(bool on);

enum class Font : uint8_t {
    A = 0,  // 12x24 dots (power-on default)
    B = 1,  // 9x17 dots
};

// ESC M n
std::string select_font(Font font);

// Magnification of one axis, 1x to 8x; the value is the field sent
enum class ScaleFactor : uint8_t { X1, X2, X3, X4, X5, X6, X7, X8 };

struct CharacterSize {
    ScaleFactor width = ScaleFactor::X1;
    ScaleFactor height = ScaleFactor::X1;

    static constexpr CharacterSize standard() { return {ScaleFactor::X1, ScaleFactor::X1}; }
    static constexpr CharacterSize double_size() { return {ScaleFactor::X2, ScaleFactor::X2}; }
    static constexpr CharacterSize double_width() { return {ScaleFactor::X2, ScaleFactor::X1}; }
    static constexpr CharacterSize double_height() { return {ScaleFactor::X1, ScaleFactor::X2}; }

    bool operator==(const CharacterSize&) const = default;
};

// GS ! n   (bits 4-6 width, bits 0-2 height)
std::string set_character_size(CharacterSize size);

enum class Justification : uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

// ESC a n   (only honoured at the start of a line)
std::string set_justification(Justification justification);

// GS b n   (smooths the edges of enlarged characters)
std::string set_smoothing(bool on);

// Bytes for a single transition request. Underline requests are encoded
// from `underline` alone; their `enabled` flag is not consulted.
std::string encode(const style::StyleCommand& cmd);

// Concatenated bytes for a list of requests, in list order
std::string encode(const std::vector<style::StyleCommand>& cmds);

// LF
std::string line_feed();

// ESC @   (clears buffer, resets every mode to power-on defaults)
std::string initialize();

}  // namespace thermo::command
