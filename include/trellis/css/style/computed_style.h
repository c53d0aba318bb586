#pragma once
#include <trellis/core/config.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace trellis::css {

// Display values the cascade accepts. Layout implements block, inline,
// inline-block and flex; every other accepted value is laid out as block.
enum class Display {
    Block, Inline, InlineBlock, Flex, InlineFlex,
    ListItem, Table, Grid, InlineGrid, Contents, None
};

enum class Position { Static, Relative, Absolute, Fixed, Sticky };
enum class BoxSizing { ContentBox, BorderBox };
enum class TextAlign { Left, Right, Center, Justify };
enum class FontStyle { Normal, Italic, Oblique };
enum class Overflow { Visible, Hidden, Scroll, Auto };
enum class Visibility { Visible, Hidden, Collapse };
enum class FlexDirection { Row, RowReverse, Column, ColumnReverse };
enum class JustifyContent { FlexStart, FlexEnd, Center, SpaceBetween, SpaceAround, SpaceEvenly };
enum class AlignItems { FlexStart, FlexEnd, Center, Stretch };
enum class AlignSelf { Auto, FlexStart, FlexEnd, Center, Stretch };
enum class Cursor { Auto, Default, Pointer, Text, Move, NotAllowed };
enum class BorderStyle { None, Hidden, Solid, Dashed, Dotted, Double, Groove, Ridge, Inset, Outset };

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

// Computed length. Font-relative units are converted to px during the
// cascade; percentages stay unresolved until layout knows the containing
// block.
struct Length {
    enum class Unit { Px, Percent, Auto, None };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length auto_val() { return {0, Unit::Auto}; }
    static Length none() { return {0, Unit::None}; }
    static Length zero() { return {0, Unit::Px}; }

    bool is_auto() const { return unit == Unit::Auto; }
    bool is_none() const { return unit == Unit::None; }
    bool is_percent() const { return unit == Unit::Percent; }

    // Resolves against a containing dimension. A negative base means the
    // dimension is itself indefinite; percentages of it resolve to 0.
    // auto / none resolve to 0; callers test for those first.
    float resolve(float base) const;

    bool operator==(const Length& other) const {
        return value == other.value && unit == other.unit;
    }
    bool operator!=(const Length& other) const { return !(*this == other); }
};

struct EdgeSizes {
    Length top, right, bottom, left;

    bool operator==(const EdgeSizes& other) const {
        return top == other.top && right == other.right &&
               bottom == other.bottom && left == other.left;
    }
};

struct BorderEdge {
    float width = 3.0f;  // "medium"; zeroed when style is none/hidden
    BorderStyle style = BorderStyle::None;
    Color color = Color::black();

    bool operator==(const BorderEdge& other) const {
        return width == other.width && style == other.style && color == other.color;
    }
};

struct LineHeight {
    enum class Kind { Normal, Number, Px };
    Kind kind = Kind::Normal;
    float value = 0;

    float to_px(float font_size) const;

    bool operator==(const LineHeight& other) const {
        return kind == other.kind && value == other.value;
    }
};

struct ComputedStyle {
    // Box
    Display display = Display::Inline;
    Position position = Position::Static;
    BoxSizing box_sizing = BoxSizing::ContentBox;
    // top/right/bottom/left; only read for relative, absolute and fixed boxes.
    EdgeSizes inset{Length::auto_val(), Length::auto_val(), Length::auto_val(),
                    Length::auto_val()};

    Length width = Length::auto_val();
    Length height = Length::auto_val();
    Length min_width = Length::zero();
    Length min_height = Length::zero();
    Length max_width = Length::none();
    Length max_height = Length::none();

    EdgeSizes margin{Length::zero(), Length::zero(), Length::zero(), Length::zero()};
    EdgeSizes padding{Length::zero(), Length::zero(), Length::zero(), Length::zero()};
    BorderEdge border_top, border_right, border_bottom, border_left;

    // Visual
    Color color = Color::black();
    Color background_color = Color::transparent();
    float opacity = 1.0f;
    Visibility visibility = Visibility::Visible;
    Overflow overflow = Overflow::Visible;
    std::optional<int> z_index;  // nullopt is "auto"
    Cursor cursor = Cursor::Auto;

    // Text
    std::string font_family = "sans-serif";
    float font_size = core::config::kDefaultFontSize;
    int font_weight = 400;
    FontStyle font_style = FontStyle::Normal;
    LineHeight line_height;
    TextAlign text_align = TextAlign::Left;

    // Flex
    FlexDirection flex_direction = FlexDirection::Row;
    float flex_grow = 0;
    float flex_shrink = 1;
    Length flex_basis = Length::auto_val();
    JustifyContent justify_content = JustifyContent::FlexStart;
    AlignItems align_items = AlignItems::Stretch;
    AlignSelf align_self = AlignSelf::Auto;
    Length row_gap = Length::zero();
    Length column_gap = Length::zero();
    int order = 0;

    // Registered extension properties, passed through uninterpreted.
    std::map<std::string, std::string> extensions;

    bool is_inline_level() const {
        return display == Display::Inline || display == Display::InlineBlock ||
               display == Display::InlineFlex || display == Display::InlineGrid;
    }
    bool is_flex_container() const {
        return display == Display::Flex || display == Display::InlineFlex;
    }

    bool operator==(const ComputedStyle& other) const;
    bool operator!=(const ComputedStyle& other) const { return !(*this == other); }
};

// Initial value of every recognized property. Process-wide and immutable.
const ComputedStyle& initial_style();

std::optional<Color> parse_color(std::string_view text);

const char* display_name(Display display);

} // namespace trellis::css
