#pragma once

#include "petalite/text/font.hpp"
#include "petalite/text/line_breaker.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace petalite::text {

class FontStorage;

// ============================================================================
// Text Run - Input to shaping
// ============================================================================

struct TextRun {
    std::string_view content;
    FontId font{INVALID_FONT_ID};
    f32 size{16.0f};
};

// ============================================================================
// Shaped Cluster
// ============================================================================

enum class ClusterKind : u8 {
    Glyph,      // Visible glyph, including .notdef
    Space,      // Blank space with a natural advance
    Tab,        // Resolved against tab stops during arrangement
    LineBreak   // Hard break; carries no advance
};

struct ShapedCluster {
    GlyphIndex glyph{0};
    ClusterKind kind{ClusterKind::Glyph};
    LineBreakClass break_class{LineBreakClass::AL};
    bool missing{false};     // Element font unknown; zero advance, never drawn
    u32 element{0};          // Index of the source run
    u32 byte_start{0};       // Byte range inside the run content
    u32 byte_end{0};
    f32 advance{0};          // Natural advance, kerning with the next cluster folded in
    GlyphMetrics ink;        // Ink box at sub-pixel offset 0

    [[nodiscard]] bool is_blank() const {
        return kind == ClusterKind::Space || kind == ClusterKind::Tab;
    }
};

// ============================================================================
// Break Opportunities
// ============================================================================

enum class BreakKind : u8 {
    Optional,   // Line may end here
    Mandatory,  // Line must end here
    End         // End of text
};

/**
 * @brief A place where a line may end
 *
 * A line ending here covers clusters up to `end` (exclusive); the next
 * line starts at `resume`. Clusters in between are blank space that is
 * dropped at the line edge. `advance` is the natural advance from the
 * start of the text up to `end`.
 */
struct BreakOpportunity {
    BreakKind kind{BreakKind::Optional};
    u32 end{0};
    u32 resume{0};
    f32 advance{0};

    [[nodiscard]] bool forces_line() const { return kind != BreakKind::Optional; }
};

struct ElementInfo {
    FontId font{INVALID_FONT_ID};
    f32 size{0};
    bool font_found{false};
    LineMetrics metrics;
    f32 space_advance{0};
};

// ============================================================================
// Shaped Text - Width independent result of shaping a whole TextData
// ============================================================================

class ShapedText {
public:
    [[nodiscard]] const std::vector<ShapedCluster>& clusters() const { return m_clusters; }
    [[nodiscard]] const std::vector<BreakOpportunity>& breaks() const { return m_breaks; }
    [[nodiscard]] const std::vector<ElementInfo>& elements() const { return m_elements; }

    [[nodiscard]] u32 cluster_count() const { return static_cast<u32>(m_clusters.size()); }
    [[nodiscard]] bool empty() const { return m_clusters.empty(); }

    // Natural advance of clusters [0, index)
    [[nodiscard]] f32 advance_before(u32 index) const { return m_prefix[index]; }

    // Natural advance of clusters [start, end), tabs counted as zero
    [[nodiscard]] f32 natural_width(u32 start, u32 end) const {
        return m_prefix[end] - m_prefix[start];
    }

    [[nodiscard]] bool has_tab(u32 start, u32 end) const {
        return m_tab_prefix[end] != m_tab_prefix[start];
    }

private:
    friend class TextShaper;

    std::vector<ShapedCluster> m_clusters;
    std::vector<BreakOpportunity> m_breaks;
    std::vector<ElementInfo> m_elements;
    std::vector<f32> m_prefix{0.0f};
    std::vector<u32> m_tab_prefix{0};
};

// ============================================================================
// Text Shaper
// ============================================================================

/**
 * @brief Converts text runs into clusters and break opportunities
 *
 * One cluster per code point, left to right. The result depends only on
 * the runs and the fonts, never on layout width.
 */
class TextShaper {
public:
    explicit TextShaper(const FontStorage& fonts, BreakRules rules = {});

    [[nodiscard]] ShapedText shape(std::span<const TextRun> runs) const;

    [[nodiscard]] const BreakRules& rules() const { return m_rules; }

private:
    const FontStorage& m_fonts;
    BreakRules m_rules;
};

} // namespace petalite::text
