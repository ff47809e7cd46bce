#pragma once

#include "petalite/text/font.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace petalite::text {

enum class GenericFamily : u8 {
    Serif,
    SansSerif,
    Cursive,
    Fantasy,
    Monospace
};

/**
 * @brief Thread-safe registry of loaded fonts
 *
 * Issues FontIds, resolves them back to fonts and answers family queries.
 * Every operation takes the same internal lock. Fonts are handed out as
 * shared pointers, so removing a face never invalidates a font that a
 * concurrent layout is still using.
 */
class FontStorage {
public:
    FontStorage();
    ~FontStorage();

    FontStorage(const FontStorage&) = delete;
    FontStorage& operator=(const FontStorage&) = delete;

    // Load a face from a font file through FreeType
    [[nodiscard]] Result<FontId, FontError> load_font_file(const std::string& path,
                                                           u32 face_index = 0);

    // Load a face from an in-memory font file
    [[nodiscard]] Result<FontId, FontError> load_font_memory(std::vector<u8> data,
                                                             u32 face_index = 0);

    // Register an already constructed font
    FontId add_font(std::shared_ptr<const Font> font);

    // Returns false when the id is unknown
    bool remove_face(FontId id);

    [[nodiscard]] std::shared_ptr<const Font> font(FontId id) const;

    // Case-insensitive family lookup. Generic names ("serif", "sans-serif",
    // "cursive", "fantasy", "monospace") resolve through the configured
    // family for that generic. The lowest matching id wins.
    [[nodiscard]] std::optional<FontId> query(std::string_view family) const;

    void set_generic_family(GenericFamily generic, std::string family);
    [[nodiscard]] std::string generic_family(GenericFamily generic) const;

    [[nodiscard]] usize len() const;
    [[nodiscard]] bool is_empty() const;
    [[nodiscard]] std::vector<FontId> ids() const;

private:
    [[nodiscard]] FontId insert_locked(std::shared_ptr<const Font> font);

    mutable std::mutex m_mutex;
    std::map<FontId, std::shared_ptr<const Font>> m_fonts;
    std::array<std::string, 5> m_generic_families;
    FontId m_next_id{1};
};

} // namespace petalite::text
