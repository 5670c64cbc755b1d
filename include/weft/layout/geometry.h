#pragma once
#include <weft/core/config.h>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace weft::layout {

constexpr int kUnbounded = core::config::kUnboundedCells;
inline bool is_bounded(int cells) { return cells >= 0; }

// Cell sums pin at the int range instead of wrapping; a wrapped sum would
// read as unbounded.
inline int saturating_add(int a, int b) {
    const std::int64_t sum = static_cast<std::int64_t>(a) + b;
    if (sum > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (sum < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(sum);
}

enum class Axis { Horizontal, Vertical };

const char* axis_name(Axis axis);

// Accepts the long and abbreviated spellings used in templates
// ("horizontal", "horz", "h", "vertical", "vert", "v").
std::optional<Axis> parse_axis(std::string_view text);

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size&) const = default;
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point&) const = default;
};

struct Rect {
    int x = 0, y = 0;
    int width = 0, height = 0;

    Point origin() const { return {x, y}; }
    Size size() const { return {width, height}; }
    int right() const { return saturating_add(x, width); }
    int bottom() const { return saturating_add(y, height); }
    bool is_empty() const { return width <= 0 || height <= 0; }
    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }
    bool contains(const Rect& other) const;

    // Inset on each side; the size saturates at zero.
    Rect shrink(int left, int right, int top, int bottom) const;

    bool operator==(const Rect&) const = default;
};

int main_of(Size size, Axis axis);
int cross_of(Size size, Axis axis);
Size make_size(Axis axis, int main, int cross);

// The room a node is measured against. A negative dimension is unbounded.
struct Extent {
    int width = kUnbounded;
    int height = kUnbounded;

    static Extent unbounded() { return {}; }
    static Extent viewport() {
        return {core::config::kDefaultViewportWidth, core::config::kDefaultViewportHeight};
    }

    bool width_bounded() const { return is_bounded(width); }
    bool height_bounded() const { return is_bounded(height); }

    int along(Axis axis) const { return axis == Axis::Horizontal ? width : height; }
    int across(Axis axis) const { return axis == Axis::Horizontal ? height : width; }
    static Extent from_axis(Axis axis, int main, int cross);

    // Subtract an inset; unbounded stays unbounded, bounded saturates at zero.
    Extent reduce(int dw, int dh) const;

    // Replace a dimension with an explicit one, never growing past a bound.
    Extent pin(std::optional<int> w, std::optional<int> h) const;

    // Cap a size at the bounded dimensions.
    Size clamp(Size size) const;

    bool operator==(const Extent&) const = default;
};

} // namespace weft::layout
