#include <trellis/css/style/computed_style.h>
#include <initializer_list>

namespace trellis::css {

float Length::resolve(float base) const {
    switch (unit) {
        case Unit::Px:
            return value;
        case Unit::Percent:
            return base < 0 ? 0.0f : value * base / 100.0f;
        case Unit::Auto:
        case Unit::None:
            return 0.0f;
    }
    return 0.0f;
}

float LineHeight::to_px(float font_size) const {
    switch (kind) {
        case Kind::Normal: return font_size * core::config::kDefaultLineHeightFactor;
        case Kind::Number: return font_size * value;
        case Kind::Px:     return value;
    }
    return font_size;
}

bool ComputedStyle::operator==(const ComputedStyle& o) const {
    return display == o.display && position == o.position && inset == o.inset &&
           box_sizing == o.box_sizing &&
           width == o.width && height == o.height &&
           min_width == o.min_width && min_height == o.min_height &&
           max_width == o.max_width && max_height == o.max_height &&
           margin == o.margin && padding == o.padding &&
           border_top == o.border_top && border_right == o.border_right &&
           border_bottom == o.border_bottom && border_left == o.border_left &&
           color == o.color && background_color == o.background_color &&
           opacity == o.opacity && visibility == o.visibility &&
           overflow == o.overflow && z_index == o.z_index && cursor == o.cursor &&
           font_family == o.font_family && font_size == o.font_size &&
           font_weight == o.font_weight && font_style == o.font_style &&
           line_height == o.line_height && text_align == o.text_align &&
           flex_direction == o.flex_direction && flex_grow == o.flex_grow &&
           flex_shrink == o.flex_shrink && flex_basis == o.flex_basis &&
           justify_content == o.justify_content && align_items == o.align_items &&
           align_self == o.align_self && row_gap == o.row_gap &&
           column_gap == o.column_gap && order == o.order &&
           extensions == o.extensions;
}

const ComputedStyle& initial_style() {
    static const ComputedStyle style = [] {
        ComputedStyle s;
        // Initial border widths compute to 0 while the style is none.
        for (BorderEdge* edge : {&s.border_top, &s.border_right, &s.border_bottom, &s.border_left}) {
            edge->width = 0;
        }
        return s;
    }();
    return style;
}

const char* display_name(Display display) {
    switch (display) {
        case Display::Block:       return "block";
        case Display::Inline:      return "inline";
        case Display::InlineBlock: return "inline-block";
        case Display::Flex:        return "flex";
        case Display::InlineFlex:  return "inline-flex";
        case Display::ListItem:    return "list-item";
        case Display::Table:       return "table";
        case Display::Grid:        return "grid";
        case Display::InlineGrid:  return "inline-grid";
        case Display::Contents:    return "contents";
        case Display::None:        return "none";
    }
    return "block";
}

} // namespace trellis::css
