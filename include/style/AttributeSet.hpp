#pragma once

#include <cstdint>
#include <vector>

namespace thermo::style {

// Ordered by strength: the combination rule keeps the highest level
enum class Underline : uint8_t {
    None = 0,
    Single = 1,
    Double = 2,
};

/**
 * Character formatting state of the printer.
 *
 * Immutable value: each with_* member returns a copy with one field changed.
 * Default-constructed sets are the baseline (everything off).
 */
struct AttributeSet {
    bool bold = false;
    bool double_strike = false;
    bool reverse = false;
    bool upside_down = false;
    bool rotated = false;
    Underline underline = Underline::None;

    AttributeSet with_bold(bool on) const;
    AttributeSet with_double_strike(bool on) const;
    AttributeSet with_reverse(bool on) const;
    AttributeSet with_upside_down(bool on) const;
    AttributeSet with_rotated(bool on) const;
    AttributeSet with_underline(Underline level) const;

    bool is_baseline() const { return *this == AttributeSet{}; }

    /**
     * Fold a scope stack (outermost first) into the effective style.
     *
     * Booleans are OR-ed, underline takes the strongest level, so an inner
     * scope can add attributes but never switch off one set further out.
     * An empty stack yields the baseline.
     */
    static AttributeSet combine(const std::vector<AttributeSet>& stack);

    bool operator==(const AttributeSet&) const = default;
};

}  // namespace thermo::style
