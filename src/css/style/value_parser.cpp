#include <trellis/css/style/properties.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace trellis::css {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black",       {0, 0, 0, 255}},
        {"white",       {255, 255, 255, 255}},
        {"red",         {255, 0, 0, 255}},
        {"green",       {0, 128, 0, 255}},
        {"blue",        {0, 0, 255, 255}},
        {"yellow",      {255, 255, 0, 255}},
        {"orange",      {255, 165, 0, 255}},
        {"purple",      {128, 0, 128, 255}},
        {"gray",        {128, 128, 128, 255}},
        {"grey",        {128, 128, 128, 255}},
        {"darkgray",    {169, 169, 169, 255}},
        {"lightgray",   {211, 211, 211, 255}},
        {"transparent", {0, 0, 0, 0}},
        {"cyan",        {0, 255, 255, 255}},
        {"magenta",     {255, 0, 255, 255}},
        {"lime",        {0, 255, 0, 255}},
        {"maroon",      {128, 0, 0, 255}},
        {"navy",        {0, 0, 128, 255}},
        {"olive",       {128, 128, 0, 255}},
        {"teal",        {0, 128, 128, 255}},
        {"silver",      {192, 192, 192, 255}},
        {"aqua",        {0, 255, 255, 255}},
        {"fuchsia",     {255, 0, 255, 255}},
        {"pink",        {255, 192, 203, 255}},
        {"brown",       {165, 42, 42, 255}},
        {"gold",        {255, 215, 0, 255}},
    };
    return colors;
}

ComponentValue ident(std::string name) {
    ComponentValue cv;
    cv.token_type = CSSToken::Ident;
    cv.value = std::move(name);
    return cv;
}

ComponentValue number(double n) {
    ComponentValue cv;
    cv.token_type = CSSToken::Number;
    cv.numeric_value = n;
    std::ostringstream oss;
    oss << n;
    cv.value = oss.str();
    return cv;
}

bool is_ident(const ComponentValue& cv) {
    return cv.type == ComponentValue::Token && cv.token_type == CSSToken::Ident;
}

bool is_ident(const ComponentValue& cv, std::string_view name) {
    return is_ident(cv) && to_lower(cv.value) == name;
}

bool is_number(const ComponentValue& cv) {
    return cv.type == ComponentValue::Token && cv.token_type == CSSToken::Number;
}

bool is_css_wide_keyword(const ComponentValue& cv) {
    return is_ident(cv, "inherit") || is_ident(cv, "initial") || is_ident(cv, "unset");
}

std::optional<std::string> single_keyword(const std::vector<ComponentValue>& values) {
    if (values.size() != 1 || !is_ident(values[0])) return std::nullopt;
    return to_lower(values[0].value);
}

template <typename Enum>
bool apply_keyword(const std::vector<ComponentValue>& values,
                   std::initializer_list<std::pair<std::string_view, Enum>> table,
                   Enum& out) {
    auto kw = single_keyword(values);
    if (!kw) return false;
    for (const auto& [name, value] : table) {
        if (name == *kw) {
            out = value;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Length parsing
// ---------------------------------------------------------------------------

struct LengthRules {
    bool allow_auto = false;
    bool allow_none = false;
    bool allow_percent = true;
    bool allow_negative = false;
};

// em resolves against `em_base`, rem against `root_font_size`.
std::optional<Length> parse_length(const ComponentValue& cv, float em_base,
                                   float root_font_size, LengthRules rules) {
    if (cv.type != ComponentValue::Token) return std::nullopt;

    if (cv.token_type == CSSToken::Ident) {
        std::string kw = to_lower(cv.value);
        if (rules.allow_auto && kw == "auto") return Length::auto_val();
        if (rules.allow_none && kw == "none") return Length::none();
        return std::nullopt;
    }

    auto v = static_cast<float>(cv.numeric_value);
    if (!rules.allow_negative && v < 0) return std::nullopt;

    if (cv.token_type == CSSToken::Number) {
        if (v != 0) return std::nullopt;  // only a bare 0 is unitless
        return Length::zero();
    }
    if (cv.token_type == CSSToken::Percentage) {
        if (!rules.allow_percent) return std::nullopt;
        return Length::percent(v);
    }
    if (cv.token_type != CSSToken::Dimension) return std::nullopt;

    const std::string& unit = cv.unit;
    if (unit == "px") return Length::px(v);
    if (unit == "em") return Length::px(v * em_base);
    if (unit == "rem") return Length::px(v * root_font_size);
    if (unit == "pt") return Length::px(v * 96.0f / 72.0f);
    if (unit == "pc") return Length::px(v * 16.0f);
    if (unit == "in") return Length::px(v * 96.0f);
    if (unit == "cm") return Length::px(v * 96.0f / 2.54f);
    if (unit == "mm") return Length::px(v * 96.0f / 25.4f);
    return std::nullopt;
}

std::optional<Length> parse_single_length(const std::vector<ComponentValue>& values,
                                          float em_base, float root_font_size,
                                          LengthRules rules) {
    if (values.size() != 1) return std::nullopt;
    return parse_length(values[0], em_base, root_font_size, rules);
}

std::optional<float> parse_border_width(const std::vector<ComponentValue>& values,
                                        float em_base, float root_font_size) {
    if (auto kw = single_keyword(values)) {
        if (*kw == "thin") return 1.0f;
        if (*kw == "medium") return 3.0f;
        if (*kw == "thick") return 5.0f;
        return std::nullopt;
    }
    LengthRules rules;
    rules.allow_percent = false;
    auto len = parse_single_length(values, em_base, root_font_size, rules);
    if (!len) return std::nullopt;
    return len->value;
}

std::optional<BorderStyle> parse_border_style(const ComponentValue& cv) {
    BorderStyle style = BorderStyle::None;
    if (!apply_keyword<BorderStyle>({cv}, {
            {"none", BorderStyle::None}, {"hidden", BorderStyle::Hidden},
            {"solid", BorderStyle::Solid}, {"dashed", BorderStyle::Dashed},
            {"dotted", BorderStyle::Dotted}, {"double", BorderStyle::Double},
            {"groove", BorderStyle::Groove}, {"ridge", BorderStyle::Ridge},
            {"inset", BorderStyle::Inset}, {"outset", BorderStyle::Outset},
        }, style)) {
        return std::nullopt;
    }
    return style;
}

// `current` is the value currentcolor refers to.
std::optional<Color> parse_color_value(const std::vector<ComponentValue>& values,
                                       const Color& current) {
    if (values.size() != 1) return std::nullopt;
    if (is_ident(values[0], "currentcolor")) return current;
    return parse_color(component_values_to_string(values));
}

std::optional<float> parse_non_negative_number(const std::vector<ComponentValue>& values) {
    if (values.size() != 1 || !is_number(values[0]) || values[0].numeric_value < 0) {
        return std::nullopt;
    }
    return static_cast<float>(values[0].numeric_value);
}

std::optional<int> parse_integer(const std::vector<ComponentValue>& values) {
    if (values.size() != 1 || !is_number(values[0])) return std::nullopt;
    double v = values[0].numeric_value;
    if (std::floor(v) != v) return std::nullopt;
    if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(v);
}

float keyword_font_size(const std::string& kw, float parent_size, bool& ok) {
    ok = true;
    if (kw == "xx-small") return 9;
    if (kw == "x-small") return 10;
    if (kw == "small") return 13;
    if (kw == "medium") return 16;
    if (kw == "large") return 18;
    if (kw == "x-large") return 24;
    if (kw == "xx-large") return 32;
    if (kw == "smaller") return parent_size / 1.2f;
    if (kw == "larger") return parent_size * 1.2f;
    ok = false;
    return 0;
}

std::optional<std::string> parse_font_family(const std::vector<ComponentValue>& values) {
    std::string result;
    bool need_separator = false;
    for (const auto& cv : values) {
        if (cv.type != ComponentValue::Token) return std::nullopt;
        if (cv.token_type == CSSToken::Comma) {
            if (result.empty()) return std::nullopt;
            result += ", ";
            need_separator = false;
            continue;
        }
        if (cv.token_type != CSSToken::Ident && cv.token_type != CSSToken::String) {
            return std::nullopt;
        }
        if (need_separator) result += ' ';
        result += cv.value;
        need_separator = true;
    }
    if (result.empty()) return std::nullopt;
    return result;
}

// Border longhands grouped by side.
struct BorderSideIds {
    PropertyId width, style, color;
};

constexpr BorderSideIds kBorderSides[] = {
    {PropertyId::BorderTopWidth, PropertyId::BorderTopStyle, PropertyId::BorderTopColor},
    {PropertyId::BorderRightWidth, PropertyId::BorderRightStyle, PropertyId::BorderRightColor},
    {PropertyId::BorderBottomWidth, PropertyId::BorderBottomStyle, PropertyId::BorderBottomColor},
    {PropertyId::BorderLeftWidth, PropertyId::BorderLeftStyle, PropertyId::BorderLeftColor},
};

BorderEdge& border_edge(ComputedStyle& style, size_t side) {
    switch (side) {
        case 0: return style.border_top;
        case 1: return style.border_right;
        case 2: return style.border_bottom;
        default: return style.border_left;
    }
}

const BorderEdge& border_edge(const ComputedStyle& style, size_t side) {
    switch (side) {
        case 0: return style.border_top;
        case 1: return style.border_right;
        case 2: return style.border_bottom;
        default: return style.border_left;
    }
}

// Side index and component of a border longhand; -1 when not a border longhand.
int border_side_of(PropertyId id, int& component) {
    for (int side = 0; side < 4; ++side) {
        const auto& ids = kBorderSides[side];
        if (id == ids.width) { component = 0; return side; }
        if (id == ids.style) { component = 1; return side; }
        if (id == ids.color) { component = 2; return side; }
    }
    return -1;
}

// Expands 1-4 values into top/right/bottom/left.
std::optional<std::vector<LonghandDeclaration>> expand_box(
    const std::vector<ComponentValue>& values, const PropertyId (&ids)[4]) {
    if (values.empty() || values.size() > 4) return std::nullopt;
    const size_t n = values.size();
    // Index of the value each side takes, per the 1/2/3/4-value forms.
    static constexpr size_t kPick[4][4] = {
        {0, 0, 0, 0}, {0, 1, 0, 1}, {0, 1, 2, 1}, {0, 1, 2, 3},
    };
    std::vector<LonghandDeclaration> result;
    for (size_t side = 0; side < 4; ++side) {
        result.push_back({ids[side], {values[kPick[n - 1][side]]}});
    }
    return result;
}

bool looks_like_border_width(const ComponentValue& cv) {
    if (is_ident(cv, "thin") || is_ident(cv, "medium") || is_ident(cv, "thick")) return true;
    return cv.type == ComponentValue::Token &&
           (cv.token_type == CSSToken::Dimension ||
            (cv.token_type == CSSToken::Number && cv.numeric_value == 0));
}

std::optional<std::vector<LonghandDeclaration>> expand_border(
    const std::vector<ComponentValue>& values, std::initializer_list<size_t> sides) {
    if (values.empty() || values.size() > 3) return std::nullopt;

    std::optional<ComponentValue> width, style, color;
    for (const auto& cv : values) {
        if (!width && looks_like_border_width(cv)) {
            width = cv;
        } else if (!style && parse_border_style(cv)) {
            style = cv;
        } else if (!color && (is_ident(cv, "currentcolor") ||
                              parse_color(component_values_to_string({cv})))) {
            color = cv;
        } else {
            return std::nullopt;
        }
    }

    std::vector<LonghandDeclaration> result;
    for (size_t side : sides) {
        const auto& ids = kBorderSides[side];
        result.push_back({ids.width, {width.value_or(ident("medium"))}});
        result.push_back({ids.style, {style.value_or(ident("none"))}});
        result.push_back({ids.color, {color.value_or(ident("currentcolor"))}});
    }
    return result;
}

std::optional<std::vector<LonghandDeclaration>> expand_flex(
    const std::vector<ComponentValue>& values) {
    auto make = [](ComponentValue grow, ComponentValue shrink, ComponentValue basis) {
        return std::vector<LonghandDeclaration>{
            {PropertyId::FlexGrow, {std::move(grow)}},
            {PropertyId::FlexShrink, {std::move(shrink)}},
            {PropertyId::FlexBasis, {std::move(basis)}},
        };
    };

    if (auto kw = single_keyword(values)) {
        if (*kw == "none") return make(number(0), number(0), ident("auto"));
        if (*kw == "auto") return make(number(1), number(1), ident("auto"));
    }
    if (values.empty() || values.size() > 3) return std::nullopt;

    std::vector<ComponentValue> numbers;
    std::optional<ComponentValue> basis;
    for (const auto& cv : values) {
        // <grow> [<shrink>] must be adjacent; a third number is the basis.
        if (is_number(cv) && numbers.size() < 2 && !(basis && !numbers.empty())) {
            numbers.push_back(cv);
        } else if (!basis) {
            basis = cv;
        } else {
            return std::nullopt;
        }
    }

    if (numbers.empty()) {
        // flex: <basis> is 1 1 <basis>
        return make(number(1), number(1), *basis);
    }
    return make(numbers[0], numbers.size() > 1 ? numbers[1] : number(1),
                basis.value_or(number(0)));
}

} // namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

namespace {

std::string component_value_to_string(const ComponentValue& cv) {
    if (cv.type == ComponentValue::Token) {
        if (cv.token_type == CSSToken::String) return "\"" + cv.value + "\"";
        return cv.value;
    }

    std::string result;
    char close = ')';
    if (cv.type == ComponentValue::Function) {
        result = cv.value + "(";
    } else {
        result = cv.value;
        if (cv.value == "[") close = ']';
        else if (cv.value == "{") close = '}';
    }
    for (size_t i = 0; i < cv.children.size(); ++i) {
        const auto& child = cv.children[i];
        bool comma = child.type == ComponentValue::Token && child.token_type == CSSToken::Comma;
        if (i > 0 && !comma) result += ' ';
        result += component_value_to_string(child);
    }
    result += close;
    return result;
}

} // namespace

std::string component_values_to_string(const std::vector<ComponentValue>& values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        const auto& cv = values[i];
        bool comma = cv.type == ComponentValue::Token && cv.token_type == CSSToken::Comma;
        if (i > 0 && !comma) result += ' ';
        result += component_value_to_string(cv);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Colors
// ---------------------------------------------------------------------------

std::optional<Color> parse_color(std::string_view input) {
    std::string value = trim(to_lower(input));
    if (value.empty()) return std::nullopt;

    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it != colors.end()) {
        return it->second;
    }

    if (value[0] == '#') {
        std::string hex = value.substr(1);
        std::vector<int> digits;
        for (char c : hex) {
            int d = hex_digit(c);
            if (d < 0) return std::nullopt;
            digits.push_back(d);
        }
        auto channel = [&](size_t i, bool short_form) {
            return static_cast<uint8_t>(short_form ? digits[i] * 17
                                                   : digits[2 * i] * 16 + digits[2 * i + 1]);
        };
        switch (digits.size()) {
            case 3: return Color{channel(0, true), channel(1, true), channel(2, true), 255};
            case 4: return Color{channel(0, true), channel(1, true), channel(2, true), channel(3, true)};
            case 6: return Color{channel(0, false), channel(1, false), channel(2, false), 255};
            case 8: return Color{channel(0, false), channel(1, false), channel(2, false), channel(3, false)};
            default: return std::nullopt;
        }
    }

    // rgb(r, g, b) / rgba(r, g, b, a) / rgb(r g b / a)
    if (value.rfind("rgb(", 0) == 0 || value.rfind("rgba(", 0) == 0) {
        auto open = value.find('(');
        auto close = value.rfind(')');
        if (close == std::string::npos || close <= open) return std::nullopt;
        std::string args = value.substr(open + 1, close - open - 1);
        for (auto& c : args) {
            if (c == ',' || c == '/') c = ' ';
        }

        std::istringstream iss(args);
        std::string part;
        float channels[4] = {0, 0, 0, 1};
        int count = 0;
        while (iss >> part) {
            if (count >= 4) return std::nullopt;
            bool percent = part.back() == '%';
            if (percent) part.pop_back();
            char* end = nullptr;
            float v = std::strtof(part.c_str(), &end);
            if (end == part.c_str() || *end != '\0') return std::nullopt;
            if (count < 3) {
                channels[count] = percent ? v * 255.0f / 100.0f : v;
            } else {
                channels[count] = percent ? v / 100.0f : v;
            }
            ++count;
        }
        if (count < 3) return std::nullopt;
        auto clamp_byte = [](float v) {
            return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
        };
        return Color{clamp_byte(channels[0]), clamp_byte(channels[1]),
                     clamp_byte(channels[2]), clamp_byte(channels[3] * 255.0f)};
    }

    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Shorthand expansion
// ---------------------------------------------------------------------------

std::optional<std::vector<LonghandDeclaration>> expand_shorthand(
    std::string_view name, const std::vector<ComponentValue>& values) {
    static constexpr PropertyId kMargin[4] = {
        PropertyId::MarginTop, PropertyId::MarginRight,
        PropertyId::MarginBottom, PropertyId::MarginLeft};
    static constexpr PropertyId kInset[4] = {
        PropertyId::Top, PropertyId::Right, PropertyId::Bottom, PropertyId::Left};
    static constexpr PropertyId kPadding[4] = {
        PropertyId::PaddingTop, PropertyId::PaddingRight,
        PropertyId::PaddingBottom, PropertyId::PaddingLeft};
    static constexpr PropertyId kBorderWidth[4] = {
        PropertyId::BorderTopWidth, PropertyId::BorderRightWidth,
        PropertyId::BorderBottomWidth, PropertyId::BorderLeftWidth};
    static constexpr PropertyId kBorderStyle[4] = {
        PropertyId::BorderTopStyle, PropertyId::BorderRightStyle,
        PropertyId::BorderBottomStyle, PropertyId::BorderLeftStyle};
    static constexpr PropertyId kBorderColor[4] = {
        PropertyId::BorderTopColor, PropertyId::BorderRightColor,
        PropertyId::BorderBottomColor, PropertyId::BorderLeftColor};

    // A CSS-wide keyword applies to every longhand of the shorthand.
    if (values.size() == 1 && is_css_wide_keyword(values[0])) {
        std::vector<ComponentValue> four(4, values[0]);
        if (name == "margin") return expand_box(four, kMargin);
        if (name == "padding") return expand_box(four, kPadding);
        if (name == "inset") return expand_box(four, kInset);
        if (name == "border-width") return expand_box(four, kBorderWidth);
        if (name == "border-style") return expand_box(four, kBorderStyle);
        if (name == "border-color") return expand_box(four, kBorderColor);
        if (name == "flex") {
            return std::vector<LonghandDeclaration>{
                {PropertyId::FlexGrow, {values[0]}},
                {PropertyId::FlexShrink, {values[0]}},
                {PropertyId::FlexBasis, {values[0]}}};
        }
        if (name == "gap") {
            return std::vector<LonghandDeclaration>{
                {PropertyId::RowGap, {values[0]}}, {PropertyId::ColumnGap, {values[0]}}};
        }
        if (name == "background") {
            return std::vector<LonghandDeclaration>{{PropertyId::BackgroundColor, {values[0]}}};
        }
        std::vector<LonghandDeclaration> result;
        auto add_side = [&](size_t side) {
            const auto& ids = kBorderSides[side];
            result.push_back({ids.width, {values[0]}});
            result.push_back({ids.style, {values[0]}});
            result.push_back({ids.color, {values[0]}});
        };
        if (name == "border") {
            for (size_t side = 0; side < 4; ++side) add_side(side);
            return result;
        }
        if (name == "border-top") { add_side(0); return result; }
        if (name == "border-right") { add_side(1); return result; }
        if (name == "border-bottom") { add_side(2); return result; }
        if (name == "border-left") { add_side(3); return result; }
        return std::nullopt;
    }

    if (name == "margin") return expand_box(values, kMargin);
    if (name == "padding") return expand_box(values, kPadding);
    if (name == "inset") return expand_box(values, kInset);
    if (name == "border-width") return expand_box(values, kBorderWidth);
    if (name == "border-style") return expand_box(values, kBorderStyle);
    if (name == "border-color") return expand_box(values, kBorderColor);
    if (name == "border") return expand_border(values, {0, 1, 2, 3});
    if (name == "border-top") return expand_border(values, {0});
    if (name == "border-right") return expand_border(values, {1});
    if (name == "border-bottom") return expand_border(values, {2});
    if (name == "border-left") return expand_border(values, {3});
    if (name == "flex") return expand_flex(values);

    if (name == "gap") {
        if (values.empty() || values.size() > 2) return std::nullopt;
        return std::vector<LonghandDeclaration>{
            {PropertyId::RowGap, {values[0]}},
            {PropertyId::ColumnGap, {values.size() > 1 ? values[1] : values[0]}}};
    }

    if (name == "background") {
        // Only the color layer is modelled; an omitted color resets it.
        for (const auto& cv : values) {
            if (is_ident(cv, "currentcolor") || parse_color(component_values_to_string({cv}))) {
                return std::vector<LonghandDeclaration>{{PropertyId::BackgroundColor, {cv}}};
            }
        }
        return std::vector<LonghandDeclaration>{
            {PropertyId::BackgroundColor, {ident("transparent")}}};
    }

    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Typed application
// ---------------------------------------------------------------------------

void copy_property(ComputedStyle& dst, const ComputedStyle& src, PropertyId id) {
    int component = 0;
    int side = border_side_of(id, component);
    if (side >= 0) {
        BorderEdge& to = border_edge(dst, static_cast<size_t>(side));
        const BorderEdge& from = border_edge(src, static_cast<size_t>(side));
        if (component == 0) to.width = from.width;
        else if (component == 1) to.style = from.style;
        else to.color = from.color;
        return;
    }

    switch (id) {
        case PropertyId::Display: dst.display = src.display; break;
        case PropertyId::Position: dst.position = src.position; break;
        case PropertyId::Top: dst.inset.top = src.inset.top; break;
        case PropertyId::Right: dst.inset.right = src.inset.right; break;
        case PropertyId::Bottom: dst.inset.bottom = src.inset.bottom; break;
        case PropertyId::Left: dst.inset.left = src.inset.left; break;
        case PropertyId::BoxSizing: dst.box_sizing = src.box_sizing; break;
        case PropertyId::Width: dst.width = src.width; break;
        case PropertyId::Height: dst.height = src.height; break;
        case PropertyId::MinWidth: dst.min_width = src.min_width; break;
        case PropertyId::MinHeight: dst.min_height = src.min_height; break;
        case PropertyId::MaxWidth: dst.max_width = src.max_width; break;
        case PropertyId::MaxHeight: dst.max_height = src.max_height; break;
        case PropertyId::MarginTop: dst.margin.top = src.margin.top; break;
        case PropertyId::MarginRight: dst.margin.right = src.margin.right; break;
        case PropertyId::MarginBottom: dst.margin.bottom = src.margin.bottom; break;
        case PropertyId::MarginLeft: dst.margin.left = src.margin.left; break;
        case PropertyId::PaddingTop: dst.padding.top = src.padding.top; break;
        case PropertyId::PaddingRight: dst.padding.right = src.padding.right; break;
        case PropertyId::PaddingBottom: dst.padding.bottom = src.padding.bottom; break;
        case PropertyId::PaddingLeft: dst.padding.left = src.padding.left; break;
        case PropertyId::Color: dst.color = src.color; break;
        case PropertyId::BackgroundColor: dst.background_color = src.background_color; break;
        case PropertyId::Opacity: dst.opacity = src.opacity; break;
        case PropertyId::Visibility: dst.visibility = src.visibility; break;
        case PropertyId::Overflow: dst.overflow = src.overflow; break;
        case PropertyId::ZIndex: dst.z_index = src.z_index; break;
        case PropertyId::Cursor: dst.cursor = src.cursor; break;
        case PropertyId::FontFamily: dst.font_family = src.font_family; break;
        case PropertyId::FontSize: dst.font_size = src.font_size; break;
        case PropertyId::FontWeight: dst.font_weight = src.font_weight; break;
        case PropertyId::FontStyle: dst.font_style = src.font_style; break;
        case PropertyId::LineHeight: dst.line_height = src.line_height; break;
        case PropertyId::TextAlign: dst.text_align = src.text_align; break;
        case PropertyId::FlexDirection: dst.flex_direction = src.flex_direction; break;
        case PropertyId::FlexGrow: dst.flex_grow = src.flex_grow; break;
        case PropertyId::FlexShrink: dst.flex_shrink = src.flex_shrink; break;
        case PropertyId::FlexBasis: dst.flex_basis = src.flex_basis; break;
        case PropertyId::JustifyContent: dst.justify_content = src.justify_content; break;
        case PropertyId::AlignItems: dst.align_items = src.align_items; break;
        case PropertyId::AlignSelf: dst.align_self = src.align_self; break;
        case PropertyId::RowGap: dst.row_gap = src.row_gap; break;
        case PropertyId::ColumnGap: dst.column_gap = src.column_gap; break;
        case PropertyId::Order: dst.order = src.order; break;
        default: break;
    }
}

bool apply_property(ComputedStyle& style, PropertyId id,
                    const std::vector<ComponentValue>& values,
                    const ComputedStyle& parent, float root_font_size) {
    if (values.empty()) return false;

    if (auto kw = single_keyword(values)) {
        if (*kw == "inherit") {
            copy_property(style, parent, id);
            return true;
        }
        if (*kw == "initial") {
            copy_property(style, initial_style(), id);
            return true;
        }
        if (*kw == "unset") {
            copy_property(style, is_inherited(id) ? parent : initial_style(), id);
            return true;
        }
    }

    // font-size resolves em against the parent; everything else against
    // the element's own (already computed) font size.
    const float em_base = id == PropertyId::FontSize ? parent.font_size : style.font_size;

    LengthRules size_rules;
    size_rules.allow_auto = true;
    LengthRules min_rules;
    min_rules.allow_auto = true;
    LengthRules max_rules;
    max_rules.allow_none = true;
    LengthRules margin_rules;
    margin_rules.allow_auto = true;
    margin_rules.allow_negative = true;
    LengthRules padding_rules;
    // Insets take the same values as margins.
    const LengthRules inset_rules = margin_rules;

    auto store_length = [&](Length& field, LengthRules rules) {
        auto len = parse_single_length(values, em_base, root_font_size, rules);
        if (!len) return false;
        field = *len;
        return true;
    };

    int component = 0;
    int side = border_side_of(id, component);
    if (side >= 0) {
        BorderEdge& edge = border_edge(style, static_cast<size_t>(side));
        if (component == 0) {
            auto w = parse_border_width(values, em_base, root_font_size);
            if (!w) return false;
            edge.width = *w;
        } else if (component == 1) {
            if (values.size() != 1) return false;
            auto bs = parse_border_style(values[0]);
            if (!bs) return false;
            edge.style = *bs;
        } else {
            auto c = parse_color_value(values, style.color);
            if (!c) return false;
            edge.color = *c;
        }
        return true;
    }

    switch (id) {
        case PropertyId::Display:
            return apply_keyword<Display>(values, {
                {"block", Display::Block}, {"inline", Display::Inline},
                {"inline-block", Display::InlineBlock}, {"flex", Display::Flex},
                {"inline-flex", Display::InlineFlex}, {"list-item", Display::ListItem},
                {"flow-root", Display::Block},
                {"table", Display::Table}, {"inline-table", Display::Table},
                {"table-row", Display::Table}, {"table-cell", Display::Table},
                {"table-row-group", Display::Table},
                {"table-header-group", Display::Table},
                {"table-footer-group", Display::Table},
                {"table-caption", Display::Table},
                {"grid", Display::Grid}, {"inline-grid", Display::InlineGrid},
                {"contents", Display::Contents}, {"none", Display::None},
            }, style.display);
        case PropertyId::Position:
            return apply_keyword<Position>(values, {
                {"static", Position::Static}, {"relative", Position::Relative},
                {"absolute", Position::Absolute}, {"fixed", Position::Fixed},
                {"sticky", Position::Sticky},
            }, style.position);
        case PropertyId::Top: return store_length(style.inset.top, inset_rules);
        case PropertyId::Right: return store_length(style.inset.right, inset_rules);
        case PropertyId::Bottom: return store_length(style.inset.bottom, inset_rules);
        case PropertyId::Left: return store_length(style.inset.left, inset_rules);
        case PropertyId::BoxSizing:
            return apply_keyword<BoxSizing>(values, {
                {"content-box", BoxSizing::ContentBox}, {"border-box", BoxSizing::BorderBox},
            }, style.box_sizing);

        case PropertyId::Width: return store_length(style.width, size_rules);
        case PropertyId::Height: return store_length(style.height, size_rules);
        case PropertyId::MinWidth:
        case PropertyId::MinHeight: {
            Length& field = id == PropertyId::MinWidth ? style.min_width : style.min_height;
            if (!store_length(field, min_rules)) return false;
            if (field.is_auto()) field = Length::zero();
            return true;
        }
        case PropertyId::MaxWidth: return store_length(style.max_width, max_rules);
        case PropertyId::MaxHeight: return store_length(style.max_height, max_rules);

        case PropertyId::MarginTop: return store_length(style.margin.top, margin_rules);
        case PropertyId::MarginRight: return store_length(style.margin.right, margin_rules);
        case PropertyId::MarginBottom: return store_length(style.margin.bottom, margin_rules);
        case PropertyId::MarginLeft: return store_length(style.margin.left, margin_rules);
        case PropertyId::PaddingTop: return store_length(style.padding.top, padding_rules);
        case PropertyId::PaddingRight: return store_length(style.padding.right, padding_rules);
        case PropertyId::PaddingBottom: return store_length(style.padding.bottom, padding_rules);
        case PropertyId::PaddingLeft: return store_length(style.padding.left, padding_rules);

        case PropertyId::Color: {
            auto c = parse_color_value(values, parent.color);
            if (!c) return false;
            style.color = *c;
            return true;
        }
        case PropertyId::BackgroundColor: {
            auto c = parse_color_value(values, style.color);
            if (!c) return false;
            style.background_color = *c;
            return true;
        }
        case PropertyId::Opacity: {
            if (values.size() != 1 || values[0].type != ComponentValue::Token) return false;
            const auto& cv = values[0];
            float v;
            if (cv.token_type == CSSToken::Number) v = static_cast<float>(cv.numeric_value);
            else if (cv.token_type == CSSToken::Percentage) v = static_cast<float>(cv.numeric_value) / 100.0f;
            else return false;
            style.opacity = std::clamp(v, 0.0f, 1.0f);
            return true;
        }
        case PropertyId::Visibility:
            return apply_keyword<Visibility>(values, {
                {"visible", Visibility::Visible}, {"hidden", Visibility::Hidden},
                {"collapse", Visibility::Collapse},
            }, style.visibility);
        case PropertyId::Overflow:
            return apply_keyword<Overflow>(values, {
                {"visible", Overflow::Visible}, {"hidden", Overflow::Hidden},
                {"scroll", Overflow::Scroll}, {"auto", Overflow::Auto},
            }, style.overflow);
        case PropertyId::ZIndex: {
            if (auto kw = single_keyword(values)) {
                if (*kw != "auto") return false;
                style.z_index.reset();
                return true;
            }
            auto z = parse_integer(values);
            if (!z) return false;
            style.z_index = *z;
            return true;
        }
        case PropertyId::Cursor:
            return apply_keyword<Cursor>(values, {
                {"auto", Cursor::Auto}, {"default", Cursor::Default},
                {"pointer", Cursor::Pointer}, {"text", Cursor::Text},
                {"move", Cursor::Move}, {"not-allowed", Cursor::NotAllowed},
            }, style.cursor);

        case PropertyId::FontFamily: {
            auto family = parse_font_family(values);
            if (!family) return false;
            style.font_family = *family;
            return true;
        }
        case PropertyId::FontSize: {
            if (auto kw = single_keyword(values)) {
                bool ok = false;
                float size = keyword_font_size(*kw, parent.font_size, ok);
                if (!ok) return false;
                style.font_size = size;
                return true;
            }
            auto len = parse_single_length(values, em_base, root_font_size, LengthRules{});
            if (!len) return false;
            style.font_size = len->is_percent() ? parent.font_size * len->value / 100.0f
                                                : len->value;
            return true;
        }
        case PropertyId::FontWeight: {
            if (auto kw = single_keyword(values)) {
                if (*kw == "normal") style.font_weight = 400;
                else if (*kw == "bold") style.font_weight = 700;
                else if (*kw == "bolder") {
                    style.font_weight = parent.font_weight < 350 ? 400
                                      : parent.font_weight < 550 ? 700 : 900;
                } else if (*kw == "lighter") {
                    style.font_weight = parent.font_weight < 550 ? 100
                                      : parent.font_weight < 750 ? 400 : 700;
                } else {
                    return false;
                }
                return true;
            }
            auto w = parse_integer(values);
            if (!w || *w < 1 || *w > 1000) return false;
            style.font_weight = *w;
            return true;
        }
        case PropertyId::FontStyle:
            return apply_keyword<FontStyle>(values, {
                {"normal", FontStyle::Normal}, {"italic", FontStyle::Italic},
                {"oblique", FontStyle::Oblique},
            }, style.font_style);
        case PropertyId::LineHeight: {
            if (auto kw = single_keyword(values)) {
                if (*kw != "normal") return false;
                style.line_height = LineHeight{};
                return true;
            }
            if (auto n = parse_non_negative_number(values)) {
                style.line_height = LineHeight{LineHeight::Kind::Number, *n};
                return true;
            }
            auto len = parse_single_length(values, em_base, root_font_size, LengthRules{});
            if (!len) return false;
            float px = len->is_percent() ? style.font_size * len->value / 100.0f : len->value;
            style.line_height = LineHeight{LineHeight::Kind::Px, px};
            return true;
        }
        case PropertyId::TextAlign:
            return apply_keyword<TextAlign>(values, {
                {"left", TextAlign::Left}, {"start", TextAlign::Left},
                {"right", TextAlign::Right}, {"end", TextAlign::Right},
                {"center", TextAlign::Center}, {"justify", TextAlign::Justify},
            }, style.text_align);

        case PropertyId::FlexDirection:
            return apply_keyword<FlexDirection>(values, {
                {"row", FlexDirection::Row}, {"row-reverse", FlexDirection::RowReverse},
                {"column", FlexDirection::Column},
                {"column-reverse", FlexDirection::ColumnReverse},
            }, style.flex_direction);
        case PropertyId::FlexGrow:
        case PropertyId::FlexShrink: {
            auto n = parse_non_negative_number(values);
            if (!n) return false;
            (id == PropertyId::FlexGrow ? style.flex_grow : style.flex_shrink) = *n;
            return true;
        }
        case PropertyId::FlexBasis: {
            if (single_keyword(values) == std::optional<std::string>("content")) {
                style.flex_basis = Length::auto_val();
                return true;
            }
            return store_length(style.flex_basis, size_rules);
        }
        case PropertyId::JustifyContent:
            return apply_keyword<JustifyContent>(values, {
                {"flex-start", JustifyContent::FlexStart}, {"start", JustifyContent::FlexStart},
                {"normal", JustifyContent::FlexStart},
                {"flex-end", JustifyContent::FlexEnd}, {"end", JustifyContent::FlexEnd},
                {"center", JustifyContent::Center},
                {"space-between", JustifyContent::SpaceBetween},
                {"space-around", JustifyContent::SpaceAround},
                {"space-evenly", JustifyContent::SpaceEvenly},
            }, style.justify_content);
        case PropertyId::AlignItems:
            return apply_keyword<AlignItems>(values, {
                {"flex-start", AlignItems::FlexStart}, {"start", AlignItems::FlexStart},
                {"flex-end", AlignItems::FlexEnd}, {"end", AlignItems::FlexEnd},
                {"center", AlignItems::Center}, {"stretch", AlignItems::Stretch},
                {"normal", AlignItems::Stretch},
            }, style.align_items);
        case PropertyId::AlignSelf:
            return apply_keyword<AlignSelf>(values, {
                {"auto", AlignSelf::Auto},
                {"flex-start", AlignSelf::FlexStart}, {"start", AlignSelf::FlexStart},
                {"flex-end", AlignSelf::FlexEnd}, {"end", AlignSelf::FlexEnd},
                {"center", AlignSelf::Center}, {"stretch", AlignSelf::Stretch},
            }, style.align_self);
        case PropertyId::RowGap:
        case PropertyId::ColumnGap: {
            Length& field = id == PropertyId::RowGap ? style.row_gap : style.column_gap;
            if (single_keyword(values) == std::optional<std::string>("normal")) {
                field = Length::zero();
                return true;
            }
            return store_length(field, padding_rules);
        }
        case PropertyId::Order: {
            auto n = parse_integer(values);
            if (!n) return false;
            style.order = *n;
            return true;
        }
        default:
            return false;
    }
}

} // namespace trellis::css
