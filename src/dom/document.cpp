#include <trellis/dom/document.h>
#include <algorithm>
#include <cctype>
#include <map>

namespace trellis::dom {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

} // namespace

// ---------------------------------------------------------------------------
// ClassList
// ---------------------------------------------------------------------------

void ClassList::add(const std::string& cls) {
    if (!contains(cls)) {
        classes_.push_back(cls);
    }
}

void ClassList::remove(const std::string& cls) {
    auto it = std::find(classes_.begin(), classes_.end(), cls);
    if (it != classes_.end()) {
        classes_.erase(it);
    }
}

bool ClassList::contains(const std::string& cls) const {
    return std::find(classes_.begin(), classes_.end(), cls) != classes_.end();
}

void ClassList::toggle(const std::string& cls) {
    if (contains(cls)) {
        remove(cls);
    } else {
        add(cls);
    }
}

std::string ClassList::to_string() const {
    std::string result;
    for (size_t i = 0; i < classes_.size(); ++i) {
        if (i > 0) result += ' ';
        result += classes_[i];
    }
    return result;
}

void ClassList::assign(std::string_view value) {
    classes_.clear();
    size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && is_space(value[i])) ++i;
        size_t start = i;
        while (i < value.size() && !is_space(value[i])) ++i;
        if (i > start) add(std::string(value.substr(start, i - start)));
    }
}

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(ElementId handle, std::string tag_name)
    : handle_(handle)
    , tag_name_(ascii_lower(std::move(tag_name))) {}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    std::string key = ascii_lower(name);
    for (auto& attr : attributes_) {
        if (attr.name == key) {
            attr.value = value;
            on_attribute_changed(key, &value);
            return;
        }
    }
    attributes_.push_back({key, value});
    on_attribute_changed(key, &value);
}

void Element::remove_attribute(const std::string& name) {
    std::string key = ascii_lower(name);
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
        [&key](const Attribute& attr) { return attr.name == key; });
    if (it != attributes_.end()) {
        attributes_.erase(it);
        on_attribute_changed(key, nullptr);
    }
}

bool Element::has_attribute(std::string_view name) const {
    return get_attribute(name).has_value();
}

// Keeps the id / class / style shortcuts in sync with the attribute list.
void Element::on_attribute_changed(const std::string& name, const std::string* value) {
    if (name == "id") {
        id_ = value ? *value : std::string();
    } else if (name == "class") {
        class_list_.assign(value ? *value : std::string_view());
    } else if (name == "style") {
        inline_style_ = value ? *value : std::string();
    }
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

ElementId Document::create_element(const std::string& tag_name) {
    auto handle = static_cast<ElementId>(elements_.size());
    elements_.emplace_back(handle, tag_name);
    return handle;
}

bool Document::append_child(ElementId parent, ElementId child) {
    if (!contains(parent) || !contains(child) || parent == child) return false;
    if (elements_[child].parent_ != kNoElement) return false;
    for (ElementId up = parent; up != kNoElement; up = elements_[up].parent_) {
        if (up == child) return false;
    }
    elements_[child].parent_ = parent;
    elements_[parent].children_.push_back(child);
    return true;
}

ElementId Document::root() const {
    if (root_ != kNoElement) return root_;
    return elements_.empty() ? kNoElement : 0;
}

void Document::set_root(ElementId handle) {
    if (contains(handle)) root_ = handle;
}

ElementId Document::find_by_id(std::string_view id) const {
    ElementId found = kNoElement;
    for_each_in_order([&](const Element& el, size_t) {
        if (found == kNoElement && !id.empty() && el.id() == id) found = el.handle();
    });
    return found;
}

std::vector<std::string> Document::duplicate_ids() const {
    std::map<std::string, size_t> counts;
    std::vector<std::string> order;
    for_each_in_order([&](const Element& el, size_t) {
        if (el.id().empty()) return;
        if (counts[el.id()]++ == 1) order.push_back(el.id());
    });
    return order;
}

} // namespace trellis::dom
