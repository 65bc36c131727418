#pragma once

#include "style/AttributeSet.hpp"
#include <cstdint>
#include <vector>

namespace thermo::style {

// Declaration order is the canonical emission order of transitions
enum class StyleAttribute : uint8_t {
    Bold,
    Underline,
    DoubleStrike,
    Reverse,
    UpsideDown,
    Rotated,
};

/**
 * A request to put one attribute into one state.
 *
 * For boolean attributes only `enabled` is meaningful. For underline the
 * target level in `underline` is authoritative; underline_level() keeps
 * `enabled` equal to `underline != None`, and encoders never read it.
 */
struct StyleCommand {
    StyleAttribute attribute = StyleAttribute::Bold;
    bool enabled = false;
    Underline underline = Underline::None;

    static StyleCommand toggle(StyleAttribute attribute, bool enabled);
    static StyleCommand underline_level(Underline level);

    bool operator==(const StyleCommand&) const = default;
};

/**
 * Commands moving the device from `before` to `after`.
 *
 * One command per attribute whose value differs, in StyleAttribute order.
 * Identical inputs always produce identical output; equal sets produce none.
 */
std::vector<StyleCommand> style_transition_commands(const AttributeSet& before,
                                                    const AttributeSet& after);

}  // namespace thermo::style
