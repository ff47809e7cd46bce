#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace petalite {

// ============================================================================
// Basic type aliases
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result type - For error handling without exceptions
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         !std::is_same_v<std::decay_t<U>, Error<E>>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}
    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return m_data.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return m_data.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & {
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T& value() const& {
        return std::get<0>(m_data);
    }

    [[nodiscard]] T&& value() && {
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] E& error() & {
        return std::get<1>(m_data);
    }

    [[nodiscard]] const E& error() const& {
        return std::get<1>(m_data);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(m_data);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(m_data));
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), value());
        }
        return make_error(error());
    }

    template<typename F>
    auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        if (is_err()) {
            return make_error(std::invoke(std::forward<F>(f), error()));
        }
        return value();
    }

private:
    std::variant<T, E> m_data;
};

// Specialization for void value type
template<typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    Result() : m_error(std::nullopt) {}
    Result(Error<E> error) : m_error(std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return !m_error.has_value();
    }

    [[nodiscard]] bool is_err() const noexcept {
        return m_error.has_value();
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const E& error() const& {
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Geometry types
// ============================================================================

template<typename T>
struct Point {
    T x{};
    T y{};

    constexpr Point() = default;
    constexpr Point(T x_, T y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point& other) const {
        return !(*this == other);
    }

    constexpr Point operator+(const Point& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Point operator-(const Point& other) const {
        return {x - other.x, y - other.y};
    }
};

template<typename T>
struct Size {
    T width{};
    T height{};

    constexpr Size() = default;
    constexpr Size(T w, T h) : width(w), height(h) {}

    constexpr bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Size& other) const {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool is_empty() const {
        return width <= T{} || height <= T{};
    }
};

template<typename T>
struct Rect {
    T x{};
    T y{};
    T width{};
    T height{};

    constexpr Rect() = default;
    constexpr Rect(T x_, T y_, T w, T h) : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point<T> origin, Size<T> size)
        : x(origin.x), y(origin.y), width(size.width), height(size.height) {}

    [[nodiscard]] constexpr Point<T> origin() const { return {x, y}; }
    [[nodiscard]] constexpr Size<T> size() const { return {width, height}; }

    [[nodiscard]] constexpr T left() const { return x; }
    [[nodiscard]] constexpr T top() const { return y; }
    [[nodiscard]] constexpr T right() const { return x + width; }
    [[nodiscard]] constexpr T bottom() const { return y + height; }

    [[nodiscard]] constexpr bool is_empty() const {
        return width <= T{} || height <= T{};
    }

    [[nodiscard]] constexpr bool contains(Point<T> point) const {
        return point.x >= x && point.x < right() &&
               point.y >= y && point.y < bottom();
    }

    [[nodiscard]] constexpr bool intersects(const Rect& other) const {
        return x < other.right() && right() > other.x &&
               y < other.bottom() && bottom() > other.y;
    }

    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        T new_x = std::max(x, other.x);
        T new_y = std::max(y, other.y);
        T new_right = std::min(right(), other.right());
        T new_bottom = std::min(bottom(), other.bottom());

        if (new_right <= new_x || new_bottom <= new_y) {
            return {};
        }

        return {new_x, new_y, new_right - new_x, new_bottom - new_y};
    }

    constexpr bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Rect& other) const {
        return !(*this == other);
    }
};

// Common type aliases
using PointI = Point<i32>;
using PointF = Point<f32>;
using SizeI = Size<i32>;
using SizeF = Size<f32>;
using RectI = Rect<i32>;
using RectF = Rect<f32>;

// ============================================================================
// Color
// ============================================================================

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    constexpr Color() = default;
    constexpr Color(u8 r_, u8 g_, u8 b_, u8 a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    static constexpr Color from_rgb(u32 rgb) {
        return Color(
            static_cast<u8>((rgb >> 16) & 0xFF),
            static_cast<u8>((rgb >> 8) & 0xFF),
            static_cast<u8>(rgb & 0xFF)
        );
    }

    static constexpr Color from_rgba(u32 rgba) {
        return Color(
            static_cast<u8>((rgba >> 24) & 0xFF),
            static_cast<u8>((rgba >> 16) & 0xFF),
            static_cast<u8>((rgba >> 8) & 0xFF),
            static_cast<u8>(rgba & 0xFF)
        );
    }

    [[nodiscard]] constexpr u32 to_rgba() const {
        return (static_cast<u32>(r) << 24) |
               (static_cast<u32>(g) << 16) |
               (static_cast<u32>(b) << 8) |
               static_cast<u32>(a);
    }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    // Common colors
    static constexpr Color black() { return {0, 0, 0}; }
    static constexpr Color white() { return {255, 255, 255}; }
    static constexpr Color red() { return {255, 0, 0}; }
    static constexpr Color transparent() { return {0, 0, 0, 0}; }
};

// Normalized color as consumed by shaders
struct ColorF {
    f32 r{0.0f};
    f32 g{0.0f};
    f32 b{0.0f};
    f32 a{1.0f};

    constexpr ColorF() = default;
    constexpr ColorF(f32 r_, f32 g_, f32 b_, f32 a_ = 1.0f)
        : r(r_), g(g_), b(b_), a(a_) {}

    static constexpr ColorF from(Color c) {
        return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
    }

    constexpr bool operator==(const ColorF& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

} // namespace petalite
