#include <trellis/layout/layout_engine.h>
#include <trellis/core/config.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace trellis::layout {

namespace {

constexpr float kUnbounded = std::numeric_limits<float>::infinity();

float border_width(const css::BorderEdge& edge) {
    if (edge.style == css::BorderStyle::None || edge.style == css::BorderStyle::Hidden) {
        return 0;
    }
    return std::max(0.0f, edge.width);
}

// Only px survives without a containing block.
float fixed_px(const css::Length& length) {
    return length.unit == css::Length::Unit::Px ? length.value : 0.0f;
}

float intrinsic_padding_border(const css::ComputedStyle& s) {
    return std::max(0.0f, fixed_px(s.padding.left)) + std::max(0.0f, fixed_px(s.padding.right)) +
           border_width(s.border_left) + border_width(s.border_right);
}

// Absolute and fixed boxes leave the flow; their parent places them once
// its own size is known.
bool is_out_of_flow(const LayoutNode& node) {
    return !node.is_display_none() && (node.style.position == css::Position::Absolute ||
                                       node.style.position == css::Position::Fixed);
}

// Shifts a relatively positioned box away from its flow position. left
// beats right and top beats bottom.
void apply_relative_offset(LayoutNode& node, float containing_width, float containing_height) {
    if (node.is_display_none() || node.style.position != css::Position::Relative) return;
    const auto& inset = node.style.inset;
    auto& g = node.geometry;
    if (!inset.left.is_auto()) {
        g.x += inset.left.resolve(containing_width);
    } else if (!inset.right.is_auto()) {
        g.x -= inset.right.resolve(containing_width);
    }
    if (!inset.top.is_auto()) {
        g.y += inset.top.resolve(containing_height);
    } else if (!inset.bottom.is_auto()) {
        g.y -= inset.bottom.resolve(containing_height);
    }
}

// Zero-sized box at the parent's content origin, subtree included.
void collapse(LayoutNode& node) {
    node.geometry = BoxGeometry{};
    for (auto& child : node.children) {
        collapse(*child);
    }
}

css::AlignItems effective_align(const css::ComputedStyle& container,
                                const css::ComputedStyle& item) {
    switch (item.align_self) {
        case css::AlignSelf::FlexStart: return css::AlignItems::FlexStart;
        case css::AlignSelf::FlexEnd: return css::AlignItems::FlexEnd;
        case css::AlignSelf::Center: return css::AlignItems::Center;
        case css::AlignSelf::Stretch: return css::AlignItems::Stretch;
        case css::AlignSelf::Auto: break;
    }
    return container.align_items;
}

} // namespace

float average_advance_width(const std::string& text, float font_size) {
    size_t glyphs = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++glyphs;  // count UTF-8 lead bytes
    }
    return static_cast<float>(glyphs) * font_size * core::config::kAverageGlyphAdvance;
}

LayoutEngine::LayoutEngine() : text_measurer_(average_advance_width) {}

void LayoutEngine::set_text_measurer(TextMeasureFn fn) {
    text_measurer_ = fn ? std::move(fn) : TextMeasureFn(average_advance_width);
}

float LayoutEngine::measure_text(const std::string& text, float font_size) const {
    return std::max(0.0f, text_measurer_(text, font_size));
}

void LayoutEngine::compute(LayoutNode& root, float viewport_width, float viewport_height) {
    root.geometry = BoxGeometry{};
    // The root is always block-level, whatever its display.
    layout_box(root, std::max(0.0f, viewport_width), viewport_height, {});
    root.geometry.x = 0;
    root.geometry.y = 0;
}

// ---------------------------------------------------------------------------
// Box sizing
// ---------------------------------------------------------------------------

void LayoutEngine::resolve_edges(LayoutNode& node, float containing_width) const {
    const auto& s = node.style;
    auto& g = node.geometry;

    // Percent margins and padding, vertical ones included, refer to the
    // containing block's width. Auto margins start at 0.
    g.margin.top = s.margin.top.resolve(containing_width);
    g.margin.right = s.margin.right.resolve(containing_width);
    g.margin.bottom = s.margin.bottom.resolve(containing_width);
    g.margin.left = s.margin.left.resolve(containing_width);

    g.padding.top = std::max(0.0f, s.padding.top.resolve(containing_width));
    g.padding.right = std::max(0.0f, s.padding.right.resolve(containing_width));
    g.padding.bottom = std::max(0.0f, s.padding.bottom.resolve(containing_width));
    g.padding.left = std::max(0.0f, s.padding.left.resolve(containing_width));

    g.border.top = border_width(s.border_top);
    g.border.right = border_width(s.border_right);
    g.border.bottom = border_width(s.border_bottom);
    g.border.left = border_width(s.border_left);
}

float LayoutEngine::clamp_width(const LayoutNode& node, float width, float containing_width) const {
    const auto& s = node.style;
    float adjust = s.box_sizing == css::BoxSizing::BorderBox
                       ? node.geometry.padding.horizontal() + node.geometry.border.horizontal()
                       : 0.0f;
    if (!s.max_width.is_none()) {
        width = std::min(width, s.max_width.resolve(containing_width) - adjust);
    }
    width = std::max(width, s.min_width.resolve(containing_width) - adjust);
    return std::max(width, 0.0f);
}

float LayoutEngine::clamp_height(const LayoutNode& node, float height, float containing_height) const {
    const auto& s = node.style;
    float adjust = s.box_sizing == css::BoxSizing::BorderBox
                       ? node.geometry.padding.vertical() + node.geometry.border.vertical()
                       : 0.0f;
    if (!s.max_height.is_none() && !(s.max_height.is_percent() && containing_height < 0)) {
        height = std::min(height, s.max_height.resolve(containing_height) - adjust);
    }
    height = std::max(height, s.min_height.resolve(containing_height) - adjust);
    return std::max(height, 0.0f);
}

float LayoutEngine::compute_width(const LayoutNode& node, float containing_width,
                                  bool shrink_to_fit) const {
    const auto& s = node.style;
    const auto& g = node.geometry;
    float padding_border = g.padding.horizontal() + g.border.horizontal();
    float available = std::max(0.0f, containing_width - g.margin.horizontal() - padding_border);

    float w;
    if (!s.width.is_auto()) {
        w = s.width.resolve(containing_width);
        if (s.box_sizing == css::BoxSizing::BorderBox) w -= padding_border;
    } else if (shrink_to_fit) {
        w = std::min(std::max(0.0f, max_content_width(node) - padding_border), available);
    } else {
        w = available;
    }
    return clamp_width(node, w, containing_width);
}

std::optional<float> LayoutEngine::definite_height(const LayoutNode& node,
                                                   float containing_height) const {
    const auto& s = node.style;
    if (s.height.is_auto()) return std::nullopt;
    float h = s.height.resolve(containing_height);
    if (s.box_sizing == css::BoxSizing::BorderBox) {
        h -= node.geometry.padding.vertical() + node.geometry.border.vertical();
    }
    return clamp_height(node, h, containing_height);
}

void LayoutEngine::layout_box(LayoutNode& node, float containing_width, float containing_height,
                              const SizeConstraint& constraint) {
    auto& g = node.geometry;
    if (node.is_display_none()) {
        collapse(node);
        return;
    }

    resolve_edges(node, containing_width);
    g.width = constraint.width ? std::max(0.0f, *constraint.width)
                               : compute_width(node, containing_width, constraint.shrink_to_fit);

    std::optional<float> fixed_height = constraint.height;
    if (!fixed_height) fixed_height = definite_height(node, containing_height);
    float inner_height = fixed_height ? *fixed_height : -1.0f;

    float content_height;
    if (node.style.is_flex_container()) {
        content_height = layout_flex(node, inner_height);
    } else if (!node.children.empty()) {
        content_height = layout_flow(node, inner_height);
    } else {
        content_height = layout_text(node, g.width);
    }

    if (fixed_height) {
        g.height = std::max(0.0f, *fixed_height);
    } else {
        g.height = clamp_height(node, content_height, containing_height);
    }

    // Children are placed; now apply positioning against this content box.
    for (auto& child : node.children) {
        if (is_out_of_flow(*child)) {
            layout_out_of_flow(*child, g.width, g.height);
        } else {
            apply_relative_offset(*child, g.width, inner_height);
        }
    }
}

void LayoutEngine::layout_out_of_flow(LayoutNode& node, float containing_width,
                                      float containing_height) {
    // Flow left the static position in x / y.
    const float static_x = node.geometry.x;
    const float static_y = node.geometry.y;
    const auto& s = node.style;
    const auto& inset = s.inset;

    resolve_edges(node, containing_width);
    auto& g = node.geometry;

    // Auto sizes pinned by both opposing insets fill the space between them.
    SizeConstraint constraint;
    constraint.shrink_to_fit = true;
    if (s.width.is_auto() && !inset.left.is_auto() && !inset.right.is_auto()) {
        float w = containing_width - inset.left.resolve(containing_width) -
                  inset.right.resolve(containing_width) - g.margin.horizontal() -
                  g.padding.horizontal() - g.border.horizontal();
        constraint.width = clamp_width(node, w, containing_width);
    }
    if (s.height.is_auto() && !inset.top.is_auto() && !inset.bottom.is_auto()) {
        float h = containing_height - inset.top.resolve(containing_height) -
                  inset.bottom.resolve(containing_height) - g.margin.vertical() -
                  g.padding.vertical() - g.border.vertical();
        constraint.height = clamp_height(node, h, containing_height);
    }
    layout_box(node, containing_width, containing_height, constraint);

    if (!inset.left.is_auto()) {
        g.x = inset.left.resolve(containing_width);
    } else if (!inset.right.is_auto()) {
        g.x = containing_width - inset.right.resolve(containing_width) - g.margin_box_width();
    } else {
        g.x = static_x;
    }
    if (!inset.top.is_auto()) {
        g.y = inset.top.resolve(containing_height);
    } else if (!inset.bottom.is_auto()) {
        g.y = containing_height - inset.bottom.resolve(containing_height) - g.margin_box_height();
    } else {
        g.y = static_y;
    }
}

// ---------------------------------------------------------------------------
// Block and inline flow
// ---------------------------------------------------------------------------

float LayoutEngine::layout_flow(LayoutNode& node, float content_height) {
    const float width = node.geometry.width;
    auto& kids = node.children;
    float cursor_y = 0;

    size_t i = 0;
    while (i < kids.size()) {
        LayoutNode& child = *kids[i];
        if (child.is_display_none()) {
            collapse(child);
            ++i;
            continue;
        }
        if (is_out_of_flow(child)) {
            child.geometry.x = 0;
            child.geometry.y = cursor_y;
            ++i;
            continue;
        }

        if (child.style.is_inline_level()) {
            size_t end = i;
            while (end < kids.size() &&
                   (kids[end]->is_display_none() || is_out_of_flow(*kids[end]) ||
                    kids[end]->style.is_inline_level())) {
                ++end;
            }
            cursor_y += layout_inline_run(node, i, end, cursor_y, content_height);
            i = end;
            continue;
        }

        layout_box(child, width, content_height, {});
        auto& cg = child.geometry;

        // Auto horizontal margins centre (or push) a block of explicit width.
        const auto& margin = child.style.margin;
        if (!child.style.width.is_auto() && (margin.left.is_auto() || margin.right.is_auto())) {
            float remaining = std::max(0.0f, width - cg.border_box_width() -
                                                 (margin.left.is_auto() ? 0.0f : cg.margin.left) -
                                                 (margin.right.is_auto() ? 0.0f : cg.margin.right));
            if (margin.left.is_auto() && margin.right.is_auto()) {
                cg.margin.left = remaining / 2;
                cg.margin.right = remaining / 2;
            } else if (margin.left.is_auto()) {
                cg.margin.left = remaining;
            } else {
                cg.margin.right = remaining;
            }
        }

        cg.x = 0;
        cg.y = cursor_y;
        cursor_y += cg.margin_box_height();
        ++i;
    }
    return cursor_y;
}

float LayoutEngine::layout_inline_run(LayoutNode& node, size_t begin, size_t end, float top,
                                      float content_height) {
    const float width = node.geometry.width;
    auto& kids = node.children;

    float y = top;
    float line_x = 0;
    float line_height = 0;
    size_t line_start = begin;
    size_t on_line = 0;

    auto finish_line = [&](size_t line_end) {
        float slack = width - line_x;
        float shift = 0;
        if (slack > 0) {
            if (node.style.text_align == css::TextAlign::Center) shift = slack / 2;
            else if (node.style.text_align == css::TextAlign::Right) shift = slack;
        }
        if (shift > 0) {
            for (size_t k = line_start; k < line_end; ++k) {
                if (!kids[k]->is_display_none() && !is_out_of_flow(*kids[k])) {
                    kids[k]->geometry.x += shift;
                }
            }
        }
        y += line_height;
    };

    for (size_t k = begin; k < end; ++k) {
        LayoutNode& child = *kids[k];
        if (child.is_display_none()) {
            collapse(child);
            continue;
        }
        if (is_out_of_flow(child)) {
            child.geometry.x = line_x;
            child.geometry.y = y;
            continue;
        }

        SizeConstraint constraint;
        constraint.shrink_to_fit = true;
        layout_box(child, width, content_height, constraint);
        auto& cg = child.geometry;
        float outer_width = cg.margin_box_width();

        if (on_line > 0 && line_x + outer_width > width) {
            finish_line(k);
            line_start = k;
            line_x = 0;
            line_height = 0;
            on_line = 0;
        }

        cg.x = line_x;
        cg.y = y;
        line_x += outer_width;
        line_height = std::max(line_height, cg.margin_box_height());
        ++on_line;
    }
    finish_line(end);
    return y - top;
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

size_t LayoutEngine::count_lines(const std::string& text, float font_size, float width) const {
    if (text.empty()) return 0;
    if (width <= 0 || measure_text(text, font_size) <= width) return 1;

    // Greedy wrap at whitespace; an overlong word keeps a line to itself.
    const float space = measure_text(" ", font_size);
    size_t lines = 0;
    float line_width = 0;
    bool line_open = false;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i == start) break;

        float word = measure_text(text.substr(start, i - start), font_size);
        if (!line_open) {
            ++lines;
            line_width = word;
            line_open = true;
        } else if (line_width + space + word <= width) {
            line_width += space + word;
        } else {
            ++lines;
            line_width = word;
        }
    }
    return std::max<size_t>(lines, 1);
}

float LayoutEngine::layout_text(const LayoutNode& node, float content_width) const {
    if (node.text_content.empty()) return 0;
    const auto& s = node.style;
    size_t lines = count_lines(node.text_content, s.font_size, content_width);
    return static_cast<float>(lines) * s.line_height.to_px(s.font_size);
}

float LayoutEngine::max_content_width(const LayoutNode& node) const {
    const auto& s = node.style;
    if (node.is_display_none()) return 0;

    float padding_border = intrinsic_padding_border(s);
    if (s.width.unit == css::Length::Unit::Px) {
        return s.box_sizing == css::BoxSizing::BorderBox
                   ? std::max(s.width.value, padding_border)
                   : s.width.value + padding_border;
    }

    float content = 0;
    if (node.children.empty()) {
        content = measure_text(node.text_content, s.font_size);
    } else if (s.is_flex_container()) {
        bool row = s.flex_direction == css::FlexDirection::Row ||
                   s.flex_direction == css::FlexDirection::RowReverse;
        size_t count = 0;
        for (const auto& child : node.children) {
            if (child->is_display_none() || is_out_of_flow(*child)) continue;
            float outer = max_content_width(*child) + fixed_px(child->style.margin.left) +
                          fixed_px(child->style.margin.right);
            content = row ? content + outer : std::max(content, outer);
            ++count;
        }
        if (row && count > 1) {
            content += std::max(0.0f, fixed_px(s.column_gap)) * static_cast<float>(count - 1);
        }
    } else {
        float run = 0;
        for (const auto& child : node.children) {
            if (child->is_display_none() || is_out_of_flow(*child)) continue;
            float outer = max_content_width(*child) + fixed_px(child->style.margin.left) +
                          fixed_px(child->style.margin.right);
            if (child->style.is_inline_level()) {
                run += outer;
                content = std::max(content, run);
            } else {
                run = 0;
                content = std::max(content, outer);
            }
        }
    }

    float adjust = s.box_sizing == css::BoxSizing::BorderBox ? padding_border : 0.0f;
    if (s.max_width.unit == css::Length::Unit::Px) {
        content = std::min(content, s.max_width.value - adjust);
    }
    if (s.min_width.unit == css::Length::Unit::Px) {
        content = std::max(content, s.min_width.value - adjust);
    }
    return std::max(0.0f, content) + padding_border;
}

// ---------------------------------------------------------------------------
// Flex (single line)
// ---------------------------------------------------------------------------

float LayoutEngine::layout_flex(LayoutNode& node, float content_height) {
    const auto& s = node.style;
    const bool is_row = s.flex_direction == css::FlexDirection::Row ||
                        s.flex_direction == css::FlexDirection::RowReverse;
    const bool is_reverse = s.flex_direction == css::FlexDirection::RowReverse ||
                            s.flex_direction == css::FlexDirection::ColumnReverse;
    const float container_width = node.geometry.width;

    // For row, the main axis gap is column-gap; for column, row-gap.
    const float main_gap = std::max(0.0f, is_row ? s.column_gap.resolve(container_width)
                                                 : s.row_gap.resolve(content_height));

    const float main_size = is_row ? container_width : content_height;
    const bool has_definite_main_size = main_size >= 0;

    struct FlexItem {
        LayoutNode* child;
        float base = 0;
        float hypothetical = 0;
        float target = 0;
        float min_main = 0;
        float max_main = kUnbounded;
        float outer_extra = 0;  // margins + padding + border along the main axis
        float violation = 0;
        bool frozen = false;
    };

    std::vector<FlexItem> items;
    for (auto& child : node.children) {
        if (child->is_display_none()) {
            collapse(*child);
            continue;
        }
        if (is_out_of_flow(*child)) {
            child->geometry.x = 0;
            child->geometry.y = 0;
            continue;
        }
        FlexItem item;
        item.child = child.get();
        items.push_back(item);
    }
    std::stable_sort(items.begin(), items.end(), [](const FlexItem& a, const FlexItem& b) {
        return a.child->style.order < b.child->style.order;
    });
    if (items.empty()) return 0;

    const float total_gaps = main_gap * static_cast<float>(items.size() - 1);

    // Cross size of a column item: stretched to the container unless it has
    // a width or is aligned elsewhere.
    auto column_cross_width = [&](const LayoutNode& child) {
        bool stretch = effective_align(s, child.style) == css::AlignItems::Stretch;
        if (stretch && child.style.width.is_auto()) {
            const auto& cg = child.geometry;
            float w = container_width - cg.margin.horizontal() - cg.padding.horizontal() -
                      cg.border.horizontal();
            return clamp_width(child, w, container_width);
        }
        return compute_width(child, container_width, true);
    };

    // Flex base and hypothetical main sizes
    for (auto& item : items) {
        LayoutNode& child = *item.child;
        const auto& cs = child.style;
        resolve_edges(child, container_width);
        const auto& cg = child.geometry;

        float padding_border = is_row ? cg.padding.horizontal() + cg.border.horizontal()
                                      : cg.padding.vertical() + cg.border.vertical();
        float box_adjust = cs.box_sizing == css::BoxSizing::BorderBox ? padding_border : 0.0f;
        item.outer_extra = padding_border + (is_row ? cg.margin.horizontal() : cg.margin.vertical());

        const css::Length& main_length = is_row ? cs.width : cs.height;
        if (!cs.flex_basis.is_auto()) {
            item.base = cs.flex_basis.resolve(main_size) - box_adjust;
        } else if (!main_length.is_auto()) {
            item.base = main_length.resolve(main_size) - box_adjust;
        } else if (is_row) {
            item.base = max_content_width(child) - padding_border;
        } else {
            SizeConstraint measure;
            measure.width = column_cross_width(child);
            layout_box(child, container_width, -1.0f, measure);
            item.base = child.geometry.height;
        }
        item.base = std::max(0.0f, item.base);

        const css::Length& min_length = is_row ? cs.min_width : cs.min_height;
        const css::Length& max_length = is_row ? cs.max_width : cs.max_height;
        item.min_main = std::max(0.0f, min_length.resolve(main_size) - box_adjust);
        if (!max_length.is_none() && !(max_length.is_percent() && main_size < 0)) {
            item.max_main = std::max(item.min_main, max_length.resolve(main_size) - box_adjust);
        }
        item.hypothetical = std::clamp(item.base, item.min_main, item.max_main);
        item.target = item.hypothetical;
    }

    // Resolve flexible lengths
    if (has_definite_main_size) {
        float outer_hypothetical = total_gaps;
        for (const auto& item : items) outer_hypothetical += item.hypothetical + item.outer_extra;
        const bool grow = outer_hypothetical < main_size;

        for (auto& item : items) {
            float factor = grow ? item.child->style.flex_grow : item.child->style.flex_shrink;
            if (factor <= 0 || (grow && item.base > item.hypothetical) ||
                (!grow && item.base < item.hypothetical)) {
                item.frozen = true;
                item.target = item.hypothetical;
            }
        }

        auto free_space = [&]() {
            float used = total_gaps;
            for (const auto& item : items) {
                used += (item.frozen ? item.target : item.base) + item.outer_extra;
            }
            return main_size - used;
        };
        const float initial_free = free_space();

        for (size_t round = 0; round <= items.size(); ++round) {
            bool all_frozen = std::all_of(items.begin(), items.end(),
                                          [](const FlexItem& item) { return item.frozen; });
            if (all_frozen) break;

            float remaining = free_space();
            float factor_sum = 0;
            float scaled_shrink_sum = 0;
            for (const auto& item : items) {
                if (item.frozen) continue;
                const auto& cs = item.child->style;
                factor_sum += grow ? cs.flex_grow : cs.flex_shrink;
                scaled_shrink_sum += cs.flex_shrink * item.base;
            }
            if (factor_sum < 1) {
                float scaled = initial_free * factor_sum;
                if (std::fabs(scaled) < std::fabs(remaining)) remaining = scaled;
            }

            float total_violation = 0;
            for (auto& item : items) {
                if (item.frozen) continue;
                const auto& cs = item.child->style;
                float size = item.base;
                if (grow) {
                    if (factor_sum > 0) size += remaining * cs.flex_grow / factor_sum;
                } else if (scaled_shrink_sum > 0) {
                    size += remaining * (cs.flex_shrink * item.base) / scaled_shrink_sum;
                }
                float clamped = std::clamp(size, item.min_main, item.max_main);
                item.target = clamped;
                item.violation = clamped - size;
                total_violation += item.violation;
            }

            for (auto& item : items) {
                if (item.frozen) continue;
                if (total_violation == 0) {
                    item.frozen = true;
                    continue;
                }
                if ((total_violation > 0 && item.violation > 0) ||
                    (total_violation < 0 && item.violation < 0)) {
                    item.frozen = true;
                }
            }
        }
    }

    // Lay out each item at its main size; measure the line's cross size.
    float line_cross = 0;
    for (auto& item : items) {
        LayoutNode& child = *item.child;
        SizeConstraint constraint;
        if (is_row) {
            constraint.width = item.target;
        } else {
            constraint.width = column_cross_width(child);
            constraint.height = item.target;
        }
        layout_box(child, container_width, content_height, constraint);
        const auto& cg = child.geometry;
        line_cross = std::max(line_cross, is_row ? cg.margin_box_height() : cg.margin_box_width());
    }

    const float cross_size = is_row ? (content_height >= 0 ? content_height : line_cross)
                                    : container_width;

    // Row items stretch to the line; column items were stretched above.
    if (is_row) {
        for (auto& item : items) {
            LayoutNode& child = *item.child;
            if (effective_align(s, child.style) != css::AlignItems::Stretch ||
                !child.style.height.is_auto()) {
                continue;
            }
            const auto& cg = child.geometry;
            float stretched = cross_size - cg.margin.vertical() - cg.padding.vertical() -
                              cg.border.vertical();
            SizeConstraint constraint;
            constraint.width = item.target;
            constraint.height = clamp_height(child, stretched, content_height);
            layout_box(child, container_width, content_height, constraint);
        }
    }

    // Main-axis placement
    float used = total_gaps;
    for (const auto& item : items) used += item.target + item.outer_extra;
    const float free = has_definite_main_size ? main_size - used : 0.0f;
    const float main_extent = has_definite_main_size ? main_size : used;
    const float count = static_cast<float>(items.size());

    float start = 0;
    float between = main_gap;
    switch (s.justify_content) {
        case css::JustifyContent::FlexStart:
            break;
        case css::JustifyContent::FlexEnd:
            start = free;
            break;
        case css::JustifyContent::Center:
            start = free / 2;
            break;
        case css::JustifyContent::SpaceBetween:
            if (free > 0 && items.size() > 1) between += free / (count - 1);
            break;
        case css::JustifyContent::SpaceAround:
            if (free > 0) {
                between += free / count;
                start = free / (2 * count);
            } else {
                start = free / 2;
            }
            break;
        case css::JustifyContent::SpaceEvenly:
            if (free > 0) {
                between += free / (count + 1);
                start = free / (count + 1);
            } else {
                start = free / 2;
            }
            break;
    }

    float cursor = start;
    for (auto& item : items) {
        auto& cg = item.child->geometry;
        float outer_main = item.target + item.outer_extra;
        float main_pos = is_reverse ? main_extent - cursor - outer_main : cursor;
        float outer_cross = is_row ? cg.margin_box_height() : cg.margin_box_width();

        float cross_pos = 0;
        switch (effective_align(s, item.child->style)) {
            case css::AlignItems::FlexEnd: cross_pos = cross_size - outer_cross; break;
            case css::AlignItems::Center: cross_pos = (cross_size - outer_cross) / 2; break;
            case css::AlignItems::FlexStart:
            case css::AlignItems::Stretch: break;
        }

        if (is_row) {
            cg.x = main_pos;
            cg.y = cross_pos;
        } else {
            cg.x = cross_pos;
            cg.y = main_pos;
        }
        cursor += outer_main + between;
    }

    if (content_height >= 0) return content_height;
    return is_row ? line_cross : used;
}

} // namespace trellis::layout
