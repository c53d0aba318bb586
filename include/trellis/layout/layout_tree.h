#pragma once
#include <trellis/css/style/computed_style.h>
#include <trellis/dom/document.h>
#include <trellis/layout/box.h>
#include <unordered_map>
#include <vector>

namespace trellis::layout {

struct LayoutEntry {
    dom::ElementId element = dom::kNoElement;
    css::ComputedStyle style;
    Box box;
    size_t depth = 0;
};

// Read-only result of one reflow: every element's style and box in
// document order.
class LayoutTree {
public:
    using const_iterator = std::vector<LayoutEntry>::const_iterator;

    LayoutTree() = default;

    // Flattens a laid-out node tree into absolute document coordinates.
    static LayoutTree build(const LayoutNode& root);

    const LayoutEntry* find(dom::ElementId element) const;

    // Deepest rendered entry whose border box contains the point; later
    // siblings win ties. Returns nullptr when nothing is hit.
    const LayoutEntry* hit_test(float x, float y) const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const LayoutEntry& operator[](size_t index) const { return entries_[index]; }

private:
    void append(const LayoutNode& node, float origin_x, float origin_y, size_t depth);

    std::vector<LayoutEntry> entries_;
    std::unordered_map<dom::ElementId, size_t> index_;
};

} // namespace trellis::layout
