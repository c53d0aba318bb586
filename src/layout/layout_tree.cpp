#include <trellis/layout/layout_tree.h>
#include <limits>

namespace trellis::layout {

LayoutTree LayoutTree::build(const LayoutNode& root) {
    LayoutTree tree;
    tree.append(root, 0, 0, 0);
    return tree;
}

void LayoutTree::append(const LayoutNode& node, float origin_x, float origin_y, size_t depth) {
    LayoutEntry entry;
    entry.element = node.element;
    entry.style = node.style;
    entry.box = make_box(node.geometry, origin_x, origin_y);
    entry.depth = depth;

    const float content_x = entry.box.content.x;
    const float content_y = entry.box.content.y;
    index_[node.element] = entries_.size();
    entries_.push_back(std::move(entry));

    for (const auto& child : node.children) {
        append(*child, content_x, content_y, depth + 1);
    }
}

const LayoutEntry* LayoutTree::find(dom::ElementId element) const {
    auto it = index_.find(element);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

const LayoutEntry* LayoutTree::hit_test(float x, float y) const {
    const LayoutEntry* best = nullptr;
    constexpr size_t kNotHidden = std::numeric_limits<size_t>::max();
    size_t hidden_depth = kNotHidden;  // depth of the display:none subtree being skipped

    for (const auto& entry : entries_) {
        if (hidden_depth != kNotHidden) {
            if (entry.depth > hidden_depth) continue;
            hidden_depth = kNotHidden;
        }
        if (entry.style.display == css::Display::None) {
            hidden_depth = entry.depth;
            continue;
        }
        if (entry.style.visibility == css::Visibility::Hidden) continue;
        if (!entry.box.border.contains(x, y)) continue;
        if (!best || entry.depth >= best->depth) {
            best = &entry;
        }
    }
    return best;
}

} // namespace trellis::layout
