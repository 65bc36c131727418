#include "style/AttributeSet.hpp"

namespace thermo::style {

AttributeSet AttributeSet::with_bold(bool on) const {
    AttributeSet copy = *this;
    copy.bold = on;
    return copy;
}

AttributeSet AttributeSet::with_double_strike(bool on) const {
    AttributeSet copy = *this;
    copy.double_strike = on;
    return copy;
}

AttributeSet AttributeSet::with_reverse(bool on) const {
    AttributeSet copy = *this;
    copy.reverse = on;
    return copy;
}

AttributeSet AttributeSet::with_upside_down(bool on) const {
    AttributeSet copy = *this;
    copy.upside_down = on;
    return copy;
}

AttributeSet AttributeSet::with_rotated(bool on) const {
    AttributeSet copy = *this;
    copy.rotated = on;
    return copy;
}

AttributeSet AttributeSet::with_underline(Underline level) const {
    AttributeSet copy = *this;
    copy.underline = level;
    return copy;
}

AttributeSet AttributeSet::combine(const std::vector<AttributeSet>& stack) {
    AttributeSet effective;
    for (const auto& scope : stack) {
        effective.bold = effective.bold || scope.bold;
        effective.double_strike = effective.double_strike || scope.double_strike;
        effective.reverse = effective.reverse || scope.reverse;
        effective.upside_down = effective.upside_down || scope.upside_down;
        effective.rotated = effective.rotated || scope.rotated;
        if (static_cast<uint8_t>(scope.underline) > static_cast<uint8_t>(effective.underline)) {
            effective.underline = scope.underline;
        }
    }
    return effective;
}

}  // namespace thermo::style
