#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::dom {

using ElementId = uint32_t;
inline constexpr ElementId kNoElement = std::numeric_limits<ElementId>::max();

struct Attribute {
    std::string name;
    std::string value;
};

class ClassList {
public:
    void add(const std::string& cls);
    void remove(const std::string& cls);
    bool contains(const std::string& cls) const;
    void toggle(const std::string& cls);
    size_t length() const { return classes_.size(); }
    std::string to_string() const;

    const std::vector<std::string>& items() const { return classes_; }

    // Replaces the list with the whitespace-separated tokens of `value`.
    void assign(std::string_view value);

private:
    std::vector<std::string> classes_;
};

// Interaction state bits; the same values the selector matcher reads.
enum ElementStateFlag : uint8_t {
    kHover = 1 << 0,
    kFocus = 1 << 1,
    kActive = 1 << 2,
};

class Element {
public:
    Element(ElementId handle, std::string tag_name);

    ElementId handle() const { return handle_; }
    const std::string& tag_name() const { return tag_name_; }

    // Attributes. Names are stored lower-case.
    std::optional<std::string> get_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(const std::string& name);
    bool has_attribute(std::string_view name) const;
    const std::vector<Attribute>& attributes() const { return attributes_; }

    // Shortcuts
    const std::string& id() const { return id_; }
    ClassList& class_list() { return class_list_; }
    const ClassList& class_list() const { return class_list_; }
    const std::string& inline_style() const { return inline_style_; }

    const std::string& text_content() const { return text_; }
    void set_text_content(std::string text) { text_ = std::move(text); }

    uint8_t state() const { return state_; }
    void set_state(uint8_t state) { state_ = state; }

    ElementId parent() const { return parent_; }
    const std::vector<ElementId>& children() const { return children_; }

private:
    friend class Document;

    ElementId handle_;
    std::string tag_name_;
    std::vector<Attribute> attributes_;
    std::string id_;
    ClassList class_list_;
    std::string inline_style_;
    std::string text_;
    uint8_t state_ = 0;
    ElementId parent_ = kNoElement;
    std::vector<ElementId> children_;

    void on_attribute_changed(const std::string& name, const std::string* value);
};

// Owns every element of one tree. Handles stay valid for the document's
// lifetime; elements are never freed individually.
class Document {
public:
    ElementId create_element(const std::string& tag_name);

    // Fails (returns false) on an unknown handle, a child that already has a
    // parent, or an append that would create a cycle.
    bool append_child(ElementId parent, ElementId child);

    bool contains(ElementId handle) const { return handle < elements_.size(); }
    Element& element(ElementId handle) { return elements_.at(handle); }
    const Element& element(ElementId handle) const { return elements_.at(handle); }
    size_t size() const { return elements_.size(); }

    // Defaults to the first element created.
    ElementId root() const;
    void set_root(ElementId handle);

    // First element in document order with the given id.
    ElementId find_by_id(std::string_view id) const;
    // Ids carried by more than one element of the root's tree.
    std::vector<std::string> duplicate_ids() const;

    template <typename Fn>
    void for_each_in_order(Fn&& fn) const {
        if (root() != kNoElement) visit(root(), 0, fn);
    }

private:
    template <typename Fn>
    void visit(ElementId handle, size_t depth, Fn& fn) const {
        fn(elements_[handle], depth);
        for (ElementId child : elements_[handle].children_) {
            visit(child, depth + 1, fn);
        }
    }

    std::vector<Element> elements_;
    ElementId root_ = kNoElement;
};

} // namespace trellis::dom
