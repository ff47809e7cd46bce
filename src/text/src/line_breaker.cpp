/**
 * Line break classification
 */

#include "petalite/text/line_breaker.hpp"

#include <algorithm>

namespace petalite::text {

LineBreakClass get_line_break_class(unicode::CodePoint cp) {
    switch (cp) {
        case '\n': return LineBreakClass::LF;
        case '\r': return LineBreakClass::CR;
        case 0x000B:  // Vertical tab
        case 0x000C:  // Form feed
        case 0x0085:  // Next line
        case 0x2028:  // Line separator
        case 0x2029:  // Paragraph separator
            return LineBreakClass::BK;
        case ' ':
        case '\t':
        case 0x1680:
        case 0x205F:
        case 0x3000:
            return LineBreakClass::SP;
        case 0x200B: return LineBreakClass::ZW;
        case 0x00A0:  // No-break space
        case 0x202F:  // Narrow no-break space
        case 0x2007:  // Figure space
            return LineBreakClass::GL;
        case 0x2060:
        case 0xFEFF:
            return LineBreakClass::WJ;
        case '-': return LineBreakClass::HY;
        case 0x00AD:  // Soft hyphen
        case 0x2010:
        case 0x2012:
        case 0x2013:
        case '/':
        case '|':
            return LineBreakClass::BA;
        case '(': case '[': case '{': return LineBreakClass::OP;
        case ')': case ']': case '}':
        case ',': case '.': case ':': case ';': case '!': case '?':
            return LineBreakClass::CL;
        default: break;
    }

    if (cp >= 0x2000 && cp <= 0x200A) {
        // En quad through hair space, minus the figure space handled above
        return LineBreakClass::SP;
    }
    if (cp >= '0' && cp <= '9') {
        return LineBreakClass::NU;
    }
    if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0xFE20 && cp <= 0xFE2F) ||
        cp == 0x200D) {
        return LineBreakClass::CM;
    }
    if ((cp >= 0x2E80 && cp <= 0x2FFF) ||   // CJK radicals
        (cp >= 0x3040 && cp <= 0x30FF) ||   // Hiragana, Katakana
        (cp >= 0x3400 && cp <= 0x4DBF) ||   // CJK extension A
        (cp >= 0x4E00 && cp <= 0x9FFF) ||   // CJK unified ideographs
        (cp >= 0xAC00 && cp <= 0xD7A3) ||   // Hangul syllables
        (cp >= 0xF900 && cp <= 0xFAFF) ||   // CJK compatibility
        (cp >= 0x20000 && cp <= 0x3FFFD)) {
        return LineBreakClass::ID;
    }
    return LineBreakClass::AL;
}

BreakAction get_break_action(LineBreakClass before, LineBreakClass after) {
    // LB4: BK !
    if (before == LineBreakClass::BK) return BreakAction::Mandatory;

    // LB5: CR x LF, CR !, LF !
    if (before == LineBreakClass::CR && after == LineBreakClass::LF) {
        return BreakAction::NoBreak;
    }
    if (before == LineBreakClass::CR || before == LineBreakClass::LF) {
        return BreakAction::Mandatory;
    }

    // LB6: x BK, x CR, x LF
    if (is_line_break(after)) return BreakAction::NoBreak;

    // LB7: x SP, x ZW
    if (after == LineBreakClass::SP || after == LineBreakClass::ZW) {
        return BreakAction::NoBreak;
    }

    // LB8: ZW SP* /
    if (before == LineBreakClass::ZW) return BreakAction::Allowed;

    // LB9: x CM
    if (after == LineBreakClass::CM) return BreakAction::NoBreak;

    // LB11, LB12: WJ and GL glue both sides
    if (before == LineBreakClass::WJ || after == LineBreakClass::WJ ||
        before == LineBreakClass::GL || after == LineBreakClass::GL) {
        return BreakAction::NoBreak;
    }

    // LB13: x CL
    if (after == LineBreakClass::CL) return BreakAction::NoBreak;

    // LB14: OP SP* x
    if (before == LineBreakClass::OP) return BreakAction::NoBreak;

    // LB18: SP /
    if (before == LineBreakClass::SP) return BreakAction::Allowed;

    // LB21: x BA, x HY
    if (after == LineBreakClass::BA || after == LineBreakClass::HY) {
        return BreakAction::NoBreak;
    }

    // LB25 (partial): HY x NU
    if (before == LineBreakClass::HY) {
        return after == LineBreakClass::NU ? BreakAction::NoBreak : BreakAction::Allowed;
    }
    if (before == LineBreakClass::BA) return BreakAction::Allowed;

    // LB31 restricted to ideographs; words and numbers stay glued
    if (before == LineBreakClass::ID || after == LineBreakClass::ID) {
        return BreakAction::Allowed;
    }

    return BreakAction::NoBreak;
}

LineBreakClass BreakRules::classify(unicode::CodePoint cp) const {
    if (std::find(line_breaks.begin(), line_breaks.end(), cp) != line_breaks.end()) {
        return LineBreakClass::BK;
    }

    LineBreakClass cls = get_line_break_class(cp);
    if (is_line_break(cls) || is_collapsible_space(cls)) {
        return cls;
    }
    if (std::find(word_separators.begin(), word_separators.end(), cp) != word_separators.end()) {
        return LineBreakClass::BA;
    }
    return cls;
}

} // namespace petalite::text
