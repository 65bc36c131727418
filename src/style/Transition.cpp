#include "style/Transition.hpp"

namespace thermo::style {

StyleCommand StyleCommand::toggle(StyleAttribute attribute, bool enabled) {
    StyleCommand cmd;
    cmd.attribute = attribute;
    cmd.enabled = enabled;
    return cmd;
}

StyleCommand StyleCommand::underline_level(Underline level) {
    StyleCommand cmd;
    cmd.attribute = StyleAttribute::Underline;
    cmd.enabled = level != Underline::None;
    cmd.underline = level;
    return cmd;
}

namespace {

void append_toggle(std::vector<StyleCommand>& out, StyleAttribute attribute,
                   bool before, bool after) {
    if (before != after) {
        out.push_back(StyleCommand::toggle(attribute, after));
    }
}

// Any change of level sets the new level directly. Going to None from
// Single or Double is the same single "underline off" request.
void append_underline(std::vector<StyleCommand>& out, Underline before, Underline after) {
    if (before != after) {
        out.push_back(StyleCommand::underline_level(after));
    }
}

}  // namespace

std::vector<StyleCommand> style_transition_commands(const AttributeSet& before,
                                                    const AttributeSet& after) {
    std::vector<StyleCommand> commands;
    if (before == after) {
        return commands;
    }

    append_toggle(commands, StyleAttribute::Bold, before.bold, after.bold);
    append_underline(commands, before.underline, after.underline);
    append_toggle(commands, StyleAttribute::DoubleStrike, before.double_strike, after.double_strike);
    append_toggle(commands, StyleAttribute::Reverse, before.reverse, after.reverse);
    append_toggle(commands, StyleAttribute::UpsideDown, before.upside_down, after.upside_down);
    append_toggle(commands, StyleAttribute::Rotated, before.rotated, after.rotated);

    return commands;
}

}  // namespace thermo::style
