#pragma once

#include "petalite/text/shaper.hpp"
#include <string>
#include <utility>
#include <vector>

namespace petalite::layout {

/**
 * @brief A run of text in one font and size
 *
 * The payload is never inspected by layout; it is copied onto every
 * positioned glyph the element produces.
 */
template<typename T>
struct TextElement {
    std::string content;
    text::FontId font{text::INVALID_FONT_ID};
    f32 size{16.0f};
    T payload{};
};

// One logical paragraph or block of text, built by appending elements
template<typename T>
class TextData {
public:
    TextData() = default;

    void append(TextElement<T> element) {
        m_elements.push_back(std::move(element));
    }

    void append(std::string content, text::FontId font, f32 size, T payload = T{}) {
        m_elements.push_back({std::move(content), font, size, std::move(payload)});
    }

    void clear() { m_elements.clear(); }

    [[nodiscard]] const std::vector<TextElement<T>>& elements() const { return m_elements; }
    [[nodiscard]] const TextElement<T>& operator[](usize index) const { return m_elements[index]; }
    [[nodiscard]] usize size() const { return m_elements.size(); }
    [[nodiscard]] bool empty() const { return m_elements.empty(); }

    // Views into the element contents; valid while this TextData is unchanged
    [[nodiscard]] std::vector<text::TextRun> runs() const {
        std::vector<text::TextRun> out;
        out.reserve(m_elements.size());
        for (const auto& element : m_elements) {
            out.push_back({element.content, element.font, element.size});
        }
        return out;
    }

private:
    std::vector<TextElement<T>> m_elements;
};

} // namespace petalite::layout
