#pragma once
#include <trellis/css/style/computed_style.h>
#include <trellis/dom/document.h>
#include <memory>
#include <string>
#include <vector>

namespace trellis::layout {

struct Rect {
    float x = 0, y = 0;
    float width = 0, height = 0;

    float right() const { return x + width; }
    float bottom() const { return y + height; }
    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }
};

// Geometry written by the layout engine. x / y locate the margin box
// relative to the parent's content box; width / height are the content box.
struct BoxGeometry {
    float x = 0, y = 0;
    float width = 0, height = 0;
    EdgeSizes margin, border, padding;

    float margin_box_width() const {
        return margin.left + border.left + padding.left + width + padding.right + border.right + margin.right;
    }
    float margin_box_height() const {
        return margin.top + border.top + padding.top + height + padding.bottom + border.bottom + margin.bottom;
    }
    float border_box_width() const { return border.left + padding.left + width + padding.right + border.right; }
    float border_box_height() const { return border.top + padding.top + height + padding.bottom + border.bottom; }
    float content_left() const { return x + margin.left + border.left + padding.left; }
    float content_top() const { return y + margin.top + border.top + padding.top; }
};

// The four nested rectangles of one element in document coordinates.
struct Box {
    Rect margin;
    Rect border;
    Rect padding;
    Rect content;

    bool operator==(const Box& other) const {
        return margin == other.margin && border == other.border &&
               padding == other.padding && content == other.content;
    }
};

// Places `geometry` with its parent's content box at (origin_x, origin_y).
Box make_box(const BoxGeometry& geometry, float origin_x, float origin_y);

struct LayoutNode {
    dom::ElementId element = dom::kNoElement;
    css::ComputedStyle style;
    std::string text_content;
    BoxGeometry geometry;

    LayoutNode* parent = nullptr;
    std::vector<std::unique_ptr<LayoutNode>> children;

    LayoutNode& append_child(std::unique_ptr<LayoutNode> child);
    bool is_display_none() const { return style.display == css::Display::None; }
};

} // namespace trellis::layout
