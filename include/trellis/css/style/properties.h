#pragma once
#include <trellis/css/parser/stylesheet.h>
#include <trellis/css/style/computed_style.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::css {

// Closed set of longhand properties the cascade types and layout reads.
enum class PropertyId : uint8_t {
    Display, Position, Top, Right, Bottom, Left, BoxSizing,
    Width, Height, MinWidth, MinHeight, MaxWidth, MaxHeight,
    MarginTop, MarginRight, MarginBottom, MarginLeft,
    PaddingTop, PaddingRight, PaddingBottom, PaddingLeft,
    BorderTopWidth, BorderRightWidth, BorderBottomWidth, BorderLeftWidth,
    BorderTopStyle, BorderRightStyle, BorderBottomStyle, BorderLeftStyle,
    BorderTopColor, BorderRightColor, BorderBottomColor, BorderLeftColor,
    Color, BackgroundColor, Opacity, Visibility, Overflow, ZIndex, Cursor,
    FontFamily, FontSize, FontWeight, FontStyle, LineHeight, TextAlign,
    FlexDirection, FlexGrow, FlexShrink, FlexBasis,
    JustifyContent, AlignItems, AlignSelf, RowGap, ColumnGap, Order,
    Count
};

inline constexpr size_t kPropertyCount = static_cast<size_t>(PropertyId::Count);

std::string_view property_name(PropertyId id);
std::optional<PropertyId> lookup_property(std::string_view name);
bool is_inherited(PropertyId id);
bool is_shorthand(std::string_view name);

struct LonghandDeclaration {
    PropertyId id;
    std::vector<ComponentValue> values;
};

// Expands margin, padding, inset, border*, flex, gap and background into
// longhands. Returns std::nullopt when the shorthand value is invalid.
std::optional<std::vector<LonghandDeclaration>> expand_shorthand(
    std::string_view name, const std::vector<ComponentValue>& values);

// Types `values` and stores them into `style`. `parent` supplies inherit
// and em bases. Returns false, leaving `style` untouched, when the value is
// not valid for the property.
bool apply_property(ComputedStyle& style, PropertyId id,
                    const std::vector<ComponentValue>& values,
                    const ComputedStyle& parent, float root_font_size);

// Copies one property's computed value from src to dst.
void copy_property(ComputedStyle& dst, const ComputedStyle& src, PropertyId id);

std::string component_values_to_string(const std::vector<ComponentValue>& values);

// Extension properties registered by outside modules (e.g. a sprite layer).
// The cascade orders their declarations like any other but never parses
// the value.
class PropertyRegistry {
public:
    // Returns false when `name` is already a built-in property.
    bool register_extension(const std::string& name, bool inherited = false);

    bool is_extension(std::string_view name) const;
    bool is_inherited_extension(std::string_view name) const;
    bool is_recognized(std::string_view name) const;

    const std::map<std::string, bool, std::less<>>& extensions() const { return extensions_; }

private:
    std::map<std::string, bool, std::less<>> extensions_;  // name -> inherited
};

} // namespace trellis::css
