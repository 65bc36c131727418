#include "command/Character.hpp"
#include "command/Command.hpp"

namespace thermo::command {

namespace {

std::string three_byte(char prefix, char code, uint8_t n) {
    return std::string{prefix, code, static_cast<char>(n)};
}

}  // namespace

std::string set_emphasized(bool on) {
    return three_byte(ESC, 'E', on ? 1 : 0);
}

std::string set_underline(style::Underline level) {
    return three_byte(ESC, '-', static_cast<uint8_t>(level));
}

std::string set_double_strike(bool on) {
    return three_byte(ESC, 'G', on ? 1 : 0);
}

std::string set_reverse(bool on) {
    return three_byte(GS, 'B', on ? 1 : 0);
}

std::string set_upside_down(bool on) {
    return three_byte(ESC, '{', on ? 1 : 0);
}

std::string set_rotation(bool on) {
    return three_byte(ESC, 'V', on ? 1 : 0);
}

std::string select_font(Font font) {
    return three_byte(ESC, 'M', static_cast<uint8_t>(font));
}

std::string set_character_size(CharacterSize size) {
    auto width = static_cast<uint8_t>(size.width) & 0x07;
    auto height = static_cast<uint8_t>(size.height) & 0x07;
    return three_byte(GS, '!', static_cast<uint8_t>((width << 4) | height));
}

std::string set_justification(Justification justification) {
    return three_byte(ESC, 'a', static_cast<uint8_t>(justification));
}

std::string set_smoothing(bool on) {
    return three_byte(GS, 'b', on ? 1 : 0);
}

std::string encode(const style::StyleCommand& cmd) {
    using style::StyleAttribute;

    switch (cmd.attribute) {
        case StyleAttribute::Bold:         return set_emphasized(cmd.enabled);
        case StyleAttribute::Underline:    return set_underline(cmd.underline);
        case StyleAttribute::DoubleStrike: return set_double_strike(cmd.enabled);
        case StyleAttribute::Reverse:      return set_reverse(cmd.enabled);
        case StyleAttribute::UpsideDown:   return set_upside_down(cmd.enabled);
        case StyleAttribute::Rotated:      return set_rotation(cmd.enabled);
    }
    return {};
}

std::string encode(const std::vector<style::StyleCommand>& cmds) {
    std::string out;
    out.reserve(cmds.size() * 3);
    for (const auto& cmd : cmds) {
        out += encode(cmd);
    }
    return out;
}

std::string line_feed() {
    return std::string(1, LF);
}

std::string initialize() {
    return std::string{ESC, '@'};
}

}  // namespace thermo::command
