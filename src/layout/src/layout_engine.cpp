/**
 * Layout engine implementation (Pass 2)
 *
 * Line breaking is greedy first-fit over the break opportunity list. Once
 * line boundaries are known, lines are stacked, truncated to max_height,
 * aligned and their glyphs snapped to the pixel grid.
 */

#include "petalite/layout/layout_engine.hpp"
#include "petalite/text/font_storage.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <utility>

namespace petalite::layout {

using text::BreakKind;
using text::BreakOpportunity;
using text::ClusterKind;
using text::ShapedCluster;
using text::ShapedText;

namespace {

constexpr f32 WIDTH_EPSILON = 1e-3f;

struct LineSpan {
    u32 start;
    u32 end;
    bool paragraph_end;
};

// Measures cluster ranges including letter spacing and tab stops
class LineMeasure {
public:
    LineMeasure(const ShapedText& shaped, const TextLayoutConfig& config)
        : m_shaped(shaped)
        , m_letter_spacing(config.letter_spacing)
        , m_tab_width(config.tab_width)
    {
    }

    // Pen position after the cluster, given the position before it
    [[nodiscard]] f32 advance(f32 x, u32 index) const {
        const ShapedCluster& cluster = m_shaped.clusters()[index];
        if (cluster.kind == ClusterKind::Tab) {
            f32 stop = m_shaped.elements()[cluster.element].space_advance * m_tab_width;
            if (stop > 0.0f) {
                x = (std::floor(x / stop) + 1.0f) * stop;
            }
            return x + m_letter_spacing;
        }
        return x + cluster.advance + m_letter_spacing;
    }

    [[nodiscard]] f32 width(u32 start, u32 end) const {
        if (start >= end) {
            return 0.0f;
        }
        if (!m_shaped.has_tab(start, end)) {
            return m_shaped.natural_width(start, end) +
                   m_letter_spacing * static_cast<f32>(end - start);
        }
        f32 x = 0.0f;
        for (u32 i = start; i < end; ++i) {
            x = advance(x, i);
        }
        return x;
    }

private:
    const ShapedText& m_shaped;
    f32 m_letter_spacing;
    f32 m_tab_width;
};

std::vector<LineSpan> break_lines(const ShapedText& shaped, const TextLayoutConfig& config,
                                  const LineMeasure& measure) {
    std::vector<LineSpan> lines;
    const auto& breaks = shaped.breaks();

    const bool wrapping = config.max_width.has_value() && config.wrap_style != WrapStyle::NoWrap;
    const f32 limit = wrapping ? std::max(0.0f, *config.max_width) + WIDTH_EPSILON
                               : std::numeric_limits<f32>::infinity();

    u32 line_start = 0;
    std::optional<usize> pending;  // Last optional break that fits on the open line

    usize i = 0;
    while (i < breaks.size()) {
        const BreakOpportunity& candidate = breaks[i];
        if (!candidate.forces_line() && candidate.end <= line_start) {
            ++i;
            continue;
        }

        if (wrapping && measure.width(line_start, candidate.end) > limit) {
            if (pending) {
                const BreakOpportunity& previous = breaks[*pending];
                lines.push_back({line_start, previous.end, false});
                line_start = previous.resume;
                pending.reset();
                // Re-examine the same candidate on the fresh line
                continue;
            }

            if (config.wrap_style == WrapStyle::CharWrap) {
                while (candidate.end - line_start > 1 &&
                       measure.width(line_start, candidate.end) > limit) {
                    u32 split = line_start + 1;
                    while (split + 1 < candidate.end &&
                           measure.width(line_start, split + 1) <= limit) {
                        ++split;
                    }
                    lines.push_back({line_start, split, false});
                    line_start = split;
                }
            }
            // WordWrap: the overflowing run stays on its own line
        }

        if (candidate.forces_line()) {
            lines.push_back({line_start, candidate.end, true});
            line_start = candidate.resume;
            pending.reset();
        } else {
            pending = i;
        }
        ++i;
    }

    return lines;
}

text::LineMetrics line_metrics(const ShapedText& shaped, const LineSpan& span) {
    const auto& clusters = shaped.clusters();
    const auto& elements = shaped.elements();

    bool any = false;
    text::LineMetrics out;
    auto accumulate = [&](u32 element) {
        const text::ElementInfo& info = elements[element];
        if (!info.font_found) {
            return;
        }
        if (!any) {
            out = info.metrics;
            any = true;
            return;
        }
        out.ascent = std::max(out.ascent, info.metrics.ascent);
        out.descent = std::min(out.descent, info.metrics.descent);
        out.line_gap = std::max(out.line_gap, info.metrics.line_gap);
    };

    u32 last_element = std::numeric_limits<u32>::max();
    for (u32 i = span.start; i < span.end; ++i) {
        if (clusters[i].element != last_element) {
            last_element = clusters[i].element;
            accumulate(last_element);
        }
    }

    if (span.start == span.end) {
        // Empty line: use the element that carried the hard break
        u32 index = span.end < clusters.size() ? span.end : static_cast<u32>(clusters.size()) - 1;
        accumulate(clusters[index].element);
    }
    return out;
}

// Fills `gap_starts` with the cluster index that begins after each inner
// blank gap of the line. Breaks without blanks (after a hyphen, slash or
// zero width space) are not gaps.
void collect_gaps(const std::vector<BreakOpportunity>& breaks, usize& cursor,
                  const LineSpan& span, std::vector<u32>& gap_starts) {
    gap_starts.clear();
    while (cursor < breaks.size() && breaks[cursor].end <= span.start) {
        ++cursor;
    }
    for (usize i = cursor; i < breaks.size() && breaks[i].end < span.end; ++i) {
        const BreakOpportunity& b = breaks[i];
        if (b.kind == BreakKind::Optional && b.resume > b.end && b.resume < span.end) {
            gap_starts.push_back(b.resume);
        }
    }
}

} // anonymous namespace

LayoutEngine::LayoutEngine(const text::FontStorage& fonts, text::BreakRules rules)
    : m_shaper(fonts, std::move(rules))
{
}

LayoutResult<NoPayload> LayoutEngine::arrange(const ShapedText& shaped,
                                              const TextLayoutConfig& config) const {
    LayoutResult<NoPayload> result;
    if (shaped.empty()) {
        return result;
    }

    const auto& clusters = shaped.clusters();
    LineMeasure measure(shaped, config);
    std::vector<LineSpan> spans = break_lines(shaped, config, measure);

    // ========================================================================
    // Vertical stacking and truncation
    // ========================================================================

    struct PendingLine {
        LineSpan span;
        f32 top;
        f32 ascent;
        f32 height;
        f32 width;
    };

    std::vector<PendingLine> kept;
    kept.reserve(spans.size());

    f32 y = 0.0f;
    for (const LineSpan& span : spans) {
        text::LineMetrics metrics = line_metrics(shaped, span);
        f32 height = metrics.line_height() * config.line_height_scale;
        if (config.max_height && y + height > *config.max_height + WIDTH_EPSILON) {
            break;
        }
        kept.push_back({span, y, metrics.ascent, height, measure.width(span.start, span.end)});
        y += height;
    }

    f32 total_width = 0.0f;
    for (const auto& line : kept) {
        total_width = std::max(total_width, line.width);
    }
    result.total_width = total_width;
    result.total_height = y;

    // ========================================================================
    // Alignment and glyph placement
    // ========================================================================

    const f32 container_width = config.max_width.value_or(total_width);
    const f32 container_height = config.max_height.value_or(result.total_height);

    f32 y_offset = 0.0f;
    switch (config.vertical_align) {
        case VerticalAlign::Top: break;
        case VerticalAlign::Middle: y_offset = (container_height - result.total_height) * 0.5f; break;
        case VerticalAlign::Bottom: y_offset = container_height - result.total_height; break;
    }
    y_offset = std::max(0.0f, y_offset);

    const u32 positions = std::clamp<u32>(config.subpixel_positions, 1, text::MAX_SUBPIXEL_POSITIONS);
    const auto& breaks = shaped.breaks();
    usize break_cursor = 0;
    std::vector<u32> gap_starts;

    result.lines.reserve(kept.size());
    for (const PendingLine& pending : kept) {
        LayoutLine<NoPayload> line;
        line.top = pending.top + y_offset;
        line.baseline = line.top + pending.ascent;
        line.height = pending.height;
        line.width = pending.width;
        line.cluster_start = pending.span.start;
        line.cluster_end = pending.span.end;
        line.paragraph_end = pending.span.paragraph_end;

        f32 slack = std::max(0.0f, container_width - pending.width);
        f32 gap_extra = 0.0f;
        gap_starts.clear();

        switch (config.horizontal_align) {
            case HorizontalAlign::Left: break;
            case HorizontalAlign::Center: line.x = slack * 0.5f; break;
            case HorizontalAlign::Right: line.x = slack; break;
            case HorizontalAlign::Justify:
                if (!pending.span.paragraph_end && slack > 0.0f) {
                    collect_gaps(breaks, break_cursor, pending.span, gap_starts);
                    if (!gap_starts.empty()) {
                        gap_extra = slack / static_cast<f32>(gap_starts.size());
                        line.width = container_width;
                    }
                }
                break;
        }

        const i32 baseline_px = static_cast<i32>(std::lround(line.baseline));
        usize gap_index = 0;
        f32 pen = 0.0f;
        for (u32 c = pending.span.start; c < pending.span.end; ++c) {
            while (gap_index < gap_starts.size() && gap_starts[gap_index] <= c) {
                ++gap_index;
            }
            const ShapedCluster& cluster = clusters[c];
            if (cluster.kind == ClusterKind::Glyph && !cluster.missing) {
                const text::ElementInfo& info = shaped.elements()[cluster.element];
                f32 pen_x = line.x + pen + gap_extra * static_cast<f32>(gap_index);

                f32 whole = std::floor(pen_x);
                auto bucket = static_cast<u32>(std::lround((pen_x - whole) * static_cast<f32>(positions)));
                auto origin_x = static_cast<i32>(whole);
                if (bucket >= positions) {
                    origin_x += 1;
                    bucket = 0;
                }

                PositionedGlyph<NoPayload> glyph;
                glyph.key.font = info.font;
                glyph.key.glyph = cluster.glyph;
                glyph.key.size_q = text::GlyphKey::quantize_size(info.size);
                glyph.key.subpixel_positions = static_cast<u8>(positions);
                glyph.key.subpixel_bucket = static_cast<u8>(bucket);
                glyph.pen_x = pen_x;
                glyph.baseline = line.baseline;
                glyph.origin = {origin_x, baseline_px};
                glyph.element = cluster.element;
                glyph.cluster = c;

                const text::GlyphMetrics& ink = cluster.ink;
                if (!ink.is_empty()) {
                    // A sub-pixel shift can push ink one pixel further right
                    i32 extra = bucket > 0 ? 1 : 0;
                    glyph.bounds = RectI(origin_x + ink.xmin,
                                         baseline_px - (ink.ymin + static_cast<i32>(ink.height)),
                                         static_cast<i32>(ink.width) + extra,
                                         static_cast<i32>(ink.height));
                }
                line.glyphs.push_back(glyph);
            }
            pen = measure.advance(pen, c);
        }

        result.lines.push_back(std::move(line));
    }

    return result;
}

} // namespace petalite::layout
