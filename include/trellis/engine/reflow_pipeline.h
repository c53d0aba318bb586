#pragma once
#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/css/parser/stylesheet.h>
#include <trellis/css/style/style_resolver.h>
#include <trellis/dom/document.h>
#include <trellis/layout/layout_engine.h>
#include <trellis/layout/layout_tree.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::engine {

struct ReflowOptions {
    float root_font_size = core::config::kDefaultFontSize;
    layout::TextMeasureFn text_measurer;  // empty: average glyph advance
    core::Severity min_severity = core::Severity::Info;
    core::DiagnosticObserver observer;    // sees every accepted diagnostic
};

struct ReflowResult {
    bool ok = false;
    std::string message;
    int reflow_count = 0;
};

// Runs the full cascade + layout pass over a document and publishes the
// resulting LayoutTree. A failed pass leaves the previous tree in place and
// records a FailureTrace. Trees nested deeper than config::kMaxTreeDepth
// are rejected.
class ReflowPipeline {
public:
    ReflowPipeline();
    explicit ReflowPipeline(ReflowOptions options);

    // Replace / append author stylesheets. Returns the structural parse
    // errors, which are also reported as diagnostics.
    std::vector<css::ParseError> set_stylesheet(std::string_view css);
    std::vector<css::ParseError> add_stylesheet(std::string_view css);

    bool register_extension_property(const std::string& name, bool inherited = false);

    ReflowResult reflow(const dom::Document& document,
                        float viewport_width = core::config::kDefaultViewportWidth,
                        float viewport_height = core::config::kDefaultViewportHeight);

    // Last published tree; nullptr before the first successful reflow.
    const layout::LayoutTree* layout_tree() const { return tree_.get(); }
    int reflow_count() const { return reflow_count_; }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }
    const core::FailureTraceCollector& failures() const { return failures_; }
    const css::StyleResolver& resolver() const { return resolver_; }

private:
    std::unique_ptr<layout::LayoutNode> build_styled_tree(
        const dom::Document& document, dom::ElementId element,
        const std::vector<css::ElementView>& views,
        const css::ComputedStyle& parent_style, size_t depth) const;

    core::DiagnosticEmitter diagnostics_;
    core::FailureTraceCollector failures_;
    css::StyleResolver resolver_;
    layout::LayoutEngine layout_engine_;
    std::unique_ptr<layout::LayoutTree> tree_;
    int reflow_count_ = 0;
};

// Selector-matching views of every element, indexed by ElementId. Sibling
// and parent links point into the returned vector.
std::vector<css::ElementView> build_element_views(const dom::Document& document);

}  // namespace trellis::engine
