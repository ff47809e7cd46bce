#pragma once

#include "petalite/layout/layout_config.hpp"
#include "petalite/layout/layout_result.hpp"
#include "petalite/layout/text_data.hpp"
#include "petalite/text/shaper.hpp"

namespace petalite::text {
class FontStorage;
}

namespace petalite::layout {

/**
 * @brief Two-pass text layout
 *
 * Pass 1 (shape) turns a TextData into a width independent ShapedText:
 * clusters, advances and break opportunities. Pass 2 (arrange) walks the
 * break list greedily against a TextLayoutConfig. A ShapedText can be kept
 * and arranged again with other configs; lines before the first line a
 * narrower width forces to break earlier come out identical.
 */
class LayoutEngine {
public:
    explicit LayoutEngine(const text::FontStorage& fonts, text::BreakRules rules = {});

    template<typename T>
    [[nodiscard]] text::ShapedText shape(const TextData<T>& data) const {
        auto runs = data.runs();
        return m_shaper.shape(runs);
    }

    [[nodiscard]] LayoutResult<NoPayload> arrange(const text::ShapedText& shaped,
                                                  const TextLayoutConfig& config) const;

    // Arrange and attach the payload of each glyph's source element.
    // `shaped` must come from shape(data).
    template<typename T>
    [[nodiscard]] LayoutResult<T> arrange(const text::ShapedText& shaped,
                                          const TextData<T>& data,
                                          const TextLayoutConfig& config) const {
        LayoutResult<NoPayload> placed = arrange(shaped, config);

        LayoutResult<T> result;
        result.total_width = placed.total_width;
        result.total_height = placed.total_height;
        result.lines.reserve(placed.lines.size());

        for (auto& line : placed.lines) {
            LayoutLine<T> out;
            out.top = line.top;
            out.baseline = line.baseline;
            out.height = line.height;
            out.width = line.width;
            out.x = line.x;
            out.cluster_start = line.cluster_start;
            out.cluster_end = line.cluster_end;
            out.paragraph_end = line.paragraph_end;
            out.glyphs.reserve(line.glyphs.size());
            for (const auto& glyph : line.glyphs) {
                out.glyphs.push_back(PositionedGlyph<T>{glyph, data[glyph.element].payload});
            }
            result.lines.push_back(std::move(out));
        }
        return result;
    }

    template<typename T>
    [[nodiscard]] LayoutResult<T> layout(const TextData<T>& data,
                                         const TextLayoutConfig& config) const {
        return arrange(shape(data), data, config);
    }

    // Size of the laid out block
    template<typename T>
    [[nodiscard]] SizeF measure(const TextData<T>& data, const TextLayoutConfig& config) const {
        return arrange(shape(data), config).size();
    }

private:
    text::TextShaper m_shaper;
};

} // namespace petalite::layout
