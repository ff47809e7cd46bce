/**
 * Text shaper implementation
 *
 * Simple left-to-right shaping: one cluster per code point, pair kerning
 * between glyphs of the same font and size, and break opportunities from
 * the line break class table.
 */

#include "petalite/text/shaper.hpp"
#include "petalite/text/font_storage.hpp"
#include "petalite/core/logger.hpp"

#include <memory>
#include <utility>

namespace petalite::text {

namespace {

struct ResolvedRun {
    std::shared_ptr<const Font> font;
    f32 size;
};

u32 trim_trailing_blanks(const std::vector<ShapedCluster>& clusters, u32 floor, u32 end) {
    while (end > floor && clusters[end - 1].is_blank()) {
        --end;
    }
    return end;
}

} // anonymous namespace

TextShaper::TextShaper(const FontStorage& fonts, BreakRules rules)
    : m_fonts(fonts)
    , m_rules(std::move(rules))
{
}

ShapedText TextShaper::shape(std::span<const TextRun> runs) const {
    ShapedText out;
    std::vector<ResolvedRun> resolved;
    resolved.reserve(runs.size());
    out.m_elements.reserve(runs.size());

    // ========================================================================
    // Clusters
    // ========================================================================

    for (usize element = 0; element < runs.size(); ++element) {
        const TextRun& run = runs[element];
        auto font = m_fonts.font(run.font);

        ElementInfo info;
        info.font = run.font;
        info.size = run.size;
        info.font_found = font != nullptr;
        if (font) {
            info.metrics = font->line_metrics(run.size);
            info.space_advance = font->glyph_metrics(font->glyph_index(' '), run.size).advance;
        } else if (!run.content.empty()) {
            PETALITE_LOG_WARN_FMT("Unknown font id {} for text element {}; glyphs will be skipped",
                                  run.font, element);
        }
        out.m_elements.push_back(info);
        resolved.push_back({font, run.size});

        auto code_points = unicode::decode_utf8(run.content);
        for (usize i = 0; i < code_points.size(); ++i) {
            const auto& decoded = code_points[i];
            unicode::CodePoint cp = decoded.code_point;
            LineBreakClass cls = m_rules.classify(cp);

            ShapedCluster cluster;
            cluster.break_class = cls;
            cluster.element = static_cast<u32>(element);
            cluster.byte_start = decoded.byte_offset;
            cluster.byte_end = decoded.byte_offset + decoded.byte_length;
            cluster.missing = font == nullptr;

            if (is_line_break(cls)) {
                // CR LF is a single break
                if (cp == '\r' && i + 1 < code_points.size() && code_points[i + 1].code_point == '\n') {
                    ++i;
                    cluster.byte_end = code_points[i].byte_offset + code_points[i].byte_length;
                }
                cluster.kind = ClusterKind::LineBreak;
                out.m_clusters.push_back(cluster);
                continue;
            }

            if (cp == '\t') {
                cluster.kind = ClusterKind::Tab;
                out.m_clusters.push_back(cluster);
                continue;
            }

            if (unicode::is_control(cp)) {
                continue;
            }

            cluster.kind = is_collapsible_space(cls) ? ClusterKind::Space : ClusterKind::Glyph;
            if (font && cls != LineBreakClass::ZW) {
                cluster.glyph = font->glyph_index(cp);
                GlyphMetrics metrics = font->glyph_metrics(cluster.glyph, run.size);
                cluster.advance = metrics.advance;
                if (cluster.kind == ClusterKind::Glyph) {
                    cluster.ink = metrics;
                } else if (cluster.glyph == 0) {
                    cluster.advance = info.space_advance;
                }
            }
            out.m_clusters.push_back(cluster);
        }
    }

    auto& clusters = out.m_clusters;
    const u32 count = static_cast<u32>(clusters.size());

    // ========================================================================
    // Kerning
    // ========================================================================

    for (u32 i = 1; i < count; ++i) {
        ShapedCluster& left = clusters[i - 1];
        const ShapedCluster& right = clusters[i];
        if (left.kind != ClusterKind::Glyph || right.kind != ClusterKind::Glyph ||
            left.missing || right.missing) {
            continue;
        }
        const ResolvedRun& lrun = resolved[left.element];
        const ResolvedRun& rrun = resolved[right.element];
        if (lrun.font != rrun.font || lrun.size != rrun.size) {
            continue;
        }
        // A line may end between the pair, so the advance must not depend on it
        if (get_break_action(left.break_class, right.break_class) == BreakAction::Allowed) {
            continue;
        }
        left.advance += lrun.font->kerning(left.glyph, right.glyph, lrun.size);
    }

    // ========================================================================
    // Prefix sums
    // ========================================================================

    out.m_prefix.resize(count + 1);
    out.m_tab_prefix.resize(count + 1);
    for (u32 i = 0; i < count; ++i) {
        out.m_prefix[i + 1] = out.m_prefix[i] + clusters[i].advance;
        out.m_tab_prefix[i + 1] = out.m_tab_prefix[i] +
                                  (clusters[i].kind == ClusterKind::Tab ? 1u : 0u);
    }

    if (count == 0) {
        return out;
    }

    // ========================================================================
    // Break opportunities
    // ========================================================================

    auto& breaks = out.m_breaks;
    u32 paragraph_start = 0;
    u32 i = 0;
    while (i < count) {
        const ShapedCluster& cluster = clusters[i];

        if (cluster.kind == ClusterKind::LineBreak) {
            u32 end = trim_trailing_blanks(clusters, paragraph_start, i);
            breaks.push_back({BreakKind::Mandatory, end, i + 1, out.m_prefix[end]});
            paragraph_start = i + 1;
            ++i;
            continue;
        }

        if (cluster.is_blank()) {
            u32 start = i;
            while (i < count && clusters[i].is_blank()) {
                ++i;
            }
            // Leading blanks indent the paragraph; trailing blanks are trimmed
            // by the following hard break instead
            if (start > paragraph_start && i < count &&
                clusters[i].kind != ClusterKind::LineBreak) {
                breaks.push_back({BreakKind::Optional, start, i, out.m_prefix[start]});
            }
            continue;
        }

        if (i + 1 < count && clusters[i + 1].kind == ClusterKind::Glyph &&
            get_break_action(cluster.break_class, clusters[i + 1].break_class) == BreakAction::Allowed) {
            breaks.push_back({BreakKind::Optional, i + 1, i + 1, out.m_prefix[i + 1]});
        }
        ++i;
    }

    u32 end = trim_trailing_blanks(clusters, paragraph_start, count);
    breaks.push_back({BreakKind::End, end, count, out.m_prefix[end]});
    return out;
}

} // namespace petalite::text
