#pragma once
#include <trellis/layout/box.h>
#include <functional>
#include <optional>
#include <string>

namespace trellis::layout {

// Width in pixels of a single run of text at the given font size.
using TextMeasureFn = std::function<float(const std::string& text, float font_size)>;

// Fallback measurer: every glyph advances by a fixed fraction of the font size.
float average_advance_width(const std::string& text, float font_size);

class LayoutEngine {
public:
    LayoutEngine();

    // Lays out the tree rooted at `root` inside a viewport-sized containing
    // block. Total: never throws on odd styles, never yields negative sizes.
    void compute(LayoutNode& root, float viewport_width, float viewport_height);

    void set_text_measurer(TextMeasureFn fn);

private:
    // Sizes the parent imposes on a box; unset members are resolved from
    // the box's own style.
    struct SizeConstraint {
        std::optional<float> width;
        std::optional<float> height;
        bool shrink_to_fit = false;
    };

    // Resolves edges and sizes of `node` and lays out its subtree. A negative
    // containing height means the containing block's height is auto.
    void layout_box(LayoutNode& node, float containing_width, float containing_height,
                    const SizeConstraint& constraint);

    void resolve_edges(LayoutNode& node, float containing_width) const;
    float compute_width(const LayoutNode& node, float containing_width, bool shrink_to_fit) const;
    std::optional<float> definite_height(const LayoutNode& node, float containing_height) const;
    float clamp_width(const LayoutNode& node, float width, float containing_width) const;
    float clamp_height(const LayoutNode& node, float height, float containing_height) const;

    // Lay out children and return the resulting content height.
    float layout_flow(LayoutNode& node, float content_height);
    float layout_inline_run(LayoutNode& node, size_t begin, size_t end, float top,
                            float content_height);
    float layout_flex(LayoutNode& node, float content_height);
    // Sizes an absolute or fixed box and places it by its insets against the
    // parent's content box, falling back to the static position per axis.
    void layout_out_of_flow(LayoutNode& node, float containing_width, float containing_height);
    float layout_text(const LayoutNode& node, float content_width) const;

    // Border-box width the node would take with unlimited room.
    float max_content_width(const LayoutNode& node) const;

    float measure_text(const std::string& text, float font_size) const;
    size_t count_lines(const std::string& text, float font_size, float width) const;

    TextMeasureFn text_measurer_;
};

} // namespace trellis::layout
