/**
 * Font storage implementation
 */

#include "petalite/text/font_storage.hpp"
#include "petalite/text/freetype_font.hpp"
#include "petalite/core/logger.hpp"

#include <cctype>

namespace petalite::text {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (usize i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<GenericFamily> parse_generic(std::string_view name) {
    if (equals_ignore_case(name, "serif")) return GenericFamily::Serif;
    if (equals_ignore_case(name, "sans-serif")) return GenericFamily::SansSerif;
    if (equals_ignore_case(name, "cursive")) return GenericFamily::Cursive;
    if (equals_ignore_case(name, "fantasy")) return GenericFamily::Fantasy;
    if (equals_ignore_case(name, "monospace")) return GenericFamily::Monospace;
    return std::nullopt;
}

} // anonymous namespace

FontStorage::FontStorage()
    : m_generic_families{"Times New Roman", "Arial", "Comic Sans MS", "Impact", "Courier New"}
{
}

FontStorage::~FontStorage() = default;

FontId FontStorage::insert_locked(std::shared_ptr<const Font> font) {
    FontId id = m_next_id++;
    m_fonts.emplace(id, std::move(font));
    return id;
}

Result<FontId, FontError> FontStorage::load_font_file(const std::string& path, u32 face_index) {
    auto loaded = FreeTypeFont::load_file(path, face_index);
    if (loaded.is_err()) {
        PETALITE_LOG_ERROR_FMT("Failed to load font '{}': {}", path, to_string(loaded.error()));
        return make_error(loaded.error());
    }

    std::shared_ptr<const Font> font = std::move(loaded).value();
    PETALITE_LOG_DEBUG_FMT("Loaded font '{}' from {}", font->family(), path);

    std::lock_guard lock(m_mutex);
    return insert_locked(std::move(font));
}

Result<FontId, FontError> FontStorage::load_font_memory(std::vector<u8> data, u32 face_index) {
    auto loaded = FreeTypeFont::load_memory(std::move(data), face_index);
    if (loaded.is_err()) {
        PETALITE_LOG_ERROR_FMT("Failed to load font from memory: {}", to_string(loaded.error()));
        return make_error(loaded.error());
    }

    std::shared_ptr<const Font> font = std::move(loaded).value();
    std::lock_guard lock(m_mutex);
    return insert_locked(std::move(font));
}

FontId FontStorage::add_font(std::shared_ptr<const Font> font) {
    if (!font) {
        return INVALID_FONT_ID;
    }
    std::lock_guard lock(m_mutex);
    return insert_locked(std::move(font));
}

bool FontStorage::remove_face(FontId id) {
    std::lock_guard lock(m_mutex);
    return m_fonts.erase(id) > 0;
}

std::shared_ptr<const Font> FontStorage::font(FontId id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_fonts.find(id);
    if (it == m_fonts.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<FontId> FontStorage::query(std::string_view family) const {
    std::lock_guard lock(m_mutex);

    std::string_view wanted = family;
    if (auto generic = parse_generic(family)) {
        wanted = m_generic_families[static_cast<usize>(*generic)];
    }

    for (const auto& [id, font] : m_fonts) {
        if (equals_ignore_case(font->family(), wanted)) {
            return id;
        }
    }
    return std::nullopt;
}

void FontStorage::set_generic_family(GenericFamily generic, std::string family) {
    std::lock_guard lock(m_mutex);
    m_generic_families[static_cast<usize>(generic)] = std::move(family);
}

std::string FontStorage::generic_family(GenericFamily generic) const {
    std::lock_guard lock(m_mutex);
    return m_generic_families[static_cast<usize>(generic)];
}

usize FontStorage::len() const {
    std::lock_guard lock(m_mutex);
    return m_fonts.size();
}

bool FontStorage::is_empty() const {
    return len() == 0;
}

std::vector<FontId> FontStorage::ids() const {
    std::lock_guard lock(m_mutex);
    std::vector<FontId> out;
    out.reserve(m_fonts.size());
    for (const auto& entry : m_fonts) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace petalite::text
