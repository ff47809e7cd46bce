#pragma once

#include "petalite/core/types.hpp"
#include "petalite/core/unicode.hpp"
#include <vector>

namespace petalite::text {

// ============================================================================
// Line Break Classes (UAX #14, simplified)
// ============================================================================

enum class LineBreakClass : u8 {
    BK,  // Mandatory Break
    CR,  // Carriage Return
    LF,  // Line Feed
    SP,  // Space
    ZW,  // Zero Width Space
    GL,  // Non-breaking (Glue)
    WJ,  // Word Joiner
    CM,  // Combining Mark
    BA,  // Break After
    HY,  // Hyphen
    OP,  // Open Punctuation
    CL,  // Close Punctuation
    NU,  // Numeric
    ID,  // Ideographic
    AL   // Alphabetic and everything else
};

enum class BreakAction : u8 {
    NoBreak,
    Allowed,
    Mandatory
};

[[nodiscard]] LineBreakClass get_line_break_class(unicode::CodePoint cp);

// Break action between two adjacent code points
[[nodiscard]] BreakAction get_break_action(LineBreakClass before, LineBreakClass after);

[[nodiscard]] constexpr bool is_line_break(LineBreakClass cls) {
    return cls == LineBreakClass::BK || cls == LineBreakClass::CR || cls == LineBreakClass::LF;
}

// Characters that end up as blank space and may hang past a line end
[[nodiscard]] constexpr bool is_collapsible_space(LineBreakClass cls) {
    return cls == LineBreakClass::SP || cls == LineBreakClass::ZW;
}

/**
 * @brief Caller adjustments on top of the default break class table
 *
 * A word separator stays a visible glyph after which a line may end. A
 * line break character ends the line and is never drawn. Code points that
 * already break by default (spaces and newlines) keep their behavior when
 * listed as word separators.
 */
struct BreakRules {
    std::vector<unicode::CodePoint> word_separators;
    std::vector<unicode::CodePoint> line_breaks;

    [[nodiscard]] LineBreakClass classify(unicode::CodePoint cp) const;
};

} // namespace petalite::text
