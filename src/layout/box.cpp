#include <trellis/layout/box.h>
#include <algorithm>

namespace trellis::layout {

Box make_box(const BoxGeometry& g, float origin_x, float origin_y) {
    Box box;
    // Negative margins can make the margin box smaller than the border box;
    // its size stops at 0 while the border box keeps its offset.
    box.margin = {origin_x + g.x, origin_y + g.y, std::max(0.0f, g.margin_box_width()),
                  std::max(0.0f, g.margin_box_height())};
    box.border = {box.margin.x + g.margin.left, box.margin.y + g.margin.top,
                  g.border_box_width(), g.border_box_height()};
    box.padding = {box.border.x + g.border.left, box.border.y + g.border.top,
                   g.padding.left + g.width + g.padding.right,
                   g.padding.top + g.height + g.padding.bottom};
    box.content = {box.padding.x + g.padding.left, box.padding.y + g.padding.top,
                   g.width, g.height};
    return box;
}

LayoutNode& LayoutNode::append_child(std::unique_ptr<LayoutNode> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return *children.back();
}

} // namespace trellis::layout
