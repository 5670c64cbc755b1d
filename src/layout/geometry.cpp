#include <weft/layout/geometry.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace weft::layout {

namespace {

int saturating_sub(int cells, int delta) {
    if (!is_bounded(cells)) return kUnbounded;
    return std::max(0, cells - delta);
}

} // namespace

const char* axis_name(Axis axis) {
    switch (axis) {
        case Axis::Horizontal: return "horizontal";
        case Axis::Vertical:   return "vertical";
    }
    return "unknown";
}

std::optional<Axis> parse_axis(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "horizontal" || lower == "horz" || lower == "h") return Axis::Horizontal;
    if (lower == "vertical" || lower == "vert" || lower == "v") return Axis::Vertical;
    return std::nullopt;
}

bool Rect::contains(const Rect& other) const {
    if (other.is_empty()) {
        return other.x >= x && other.y >= y && other.x <= right() && other.y <= bottom();
    }
    return other.x >= x && other.y >= y && other.right() <= right() && other.bottom() <= bottom();
}

Rect Rect::shrink(int left, int right_inset, int top, int bottom_inset) const {
    Rect r;
    r.x = saturating_add(x, left);
    r.y = saturating_add(y, top);
    r.width = static_cast<int>(
        std::max<std::int64_t>(0, std::int64_t{width} - left - right_inset));
    r.height = static_cast<int>(
        std::max<std::int64_t>(0, std::int64_t{height} - top - bottom_inset));
    return r;
}

int main_of(Size size, Axis axis) {
    return axis == Axis::Horizontal ? size.width : size.height;
}

int cross_of(Size size, Axis axis) {
    return axis == Axis::Horizontal ? size.height : size.width;
}

Size make_size(Axis axis, int main, int cross) {
    if (axis == Axis::Horizontal) return {main, cross};
    return {cross, main};
}

Extent Extent::from_axis(Axis axis, int main, int cross) {
    if (axis == Axis::Horizontal) return {main, cross};
    return {cross, main};
}

Extent Extent::reduce(int dw, int dh) const {
    return {saturating_sub(width, dw), saturating_sub(height, dh)};
}

Extent Extent::pin(std::optional<int> w, std::optional<int> h) const {
    Extent e = *this;
    if (w) e.width = width_bounded() ? std::min(*w, width) : *w;
    if (h) e.height = height_bounded() ? std::min(*h, height) : *h;
    return e;
}

Size Extent::clamp(Size size) const {
    Size s = size;
    s.width = std::max(0, s.width);
    s.height = std::max(0, s.height);
    if (width_bounded()) s.width = std::min(s.width, width);
    if (height_bounded()) s.height = std::min(s.height, height);
    return s;
}

} // namespace weft::layout
