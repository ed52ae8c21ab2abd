#pragma once

#include <string>

namespace GS {

struct PixelPoint {
    int x = 0;
    int y = 0;

    friend bool operator==(PixelPoint const&, PixelPoint const&) = default;
};

struct PixelSize {
    int width  = 0;
    int height = 0;

    [[nodiscard]] bool valid() const { return width > 0 && height > 0; }

    friend bool operator==(PixelSize const&, PixelSize const&) = default;
};

// Axis aligned box in absolute pixels, origin top-left.
struct PixelRect {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    [[nodiscard]] auto right() const -> int { return x + width; }
    [[nodiscard]] auto bottom() const -> int { return y + height; }
    [[nodiscard]] auto size() const -> PixelSize { return PixelSize{width, height}; }
    [[nodiscard]] auto center() const -> PixelPoint { return PixelPoint{x + width / 2, y + height / 2}; }
    [[nodiscard]] auto empty() const -> bool { return width <= 0 || height <= 0; }

    [[nodiscard]] auto contains(PixelRect const& other) const -> bool {
        return other.x >= x && other.y >= y && other.right() <= right() && other.bottom() <= bottom();
    }

    [[nodiscard]] auto contains(PixelPoint const& point) const -> bool {
        return point.x >= x && point.y >= y && point.x < right() && point.y < bottom();
    }

    [[nodiscard]] auto translated(int dx, int dy) const -> PixelRect {
        return PixelRect{x + dx, y + dy, width, height};
    }

    friend bool operator==(PixelRect const&, PixelRect const&) = default;
};

[[nodiscard]] inline auto describeRect(PixelRect const& rect) -> std::string {
    return "(" + std::to_string(rect.x) + "," + std::to_string(rect.y) + " " + std::to_string(rect.width) + "x"
           + std::to_string(rect.height) + ")";
}

} // namespace GS
