#include <trellis/engine/reflow_pipeline.h>
#include <exception>
#include <map>
#include <sstream>
#include <stdexcept>

namespace trellis::engine {

namespace {

constexpr const char* kEngineModule = "engine";
constexpr const char* kParserModule = "css.parser";

void report_parse_result(core::DiagnosticEmitter& diagnostics,
                         const css::ParseStylesheetResult& result) {
    for (const auto& error : result.errors) {
        diagnostics.emit(core::Severity::Error, core::DiagnosticCode::ParseError,
                         kParserModule, "parse", css::format_parse_error(error));
    }
    for (const auto& selector : result.ignored_selectors) {
        diagnostics.warn_unresolved(kParserModule, "parse",
                                    "unsupported selector '" + selector + "'; rule skipped");
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Element views
// ---------------------------------------------------------------------------

std::vector<css::ElementView> build_element_views(const dom::Document& document) {
    std::vector<css::ElementView> views(document.size());

    document.for_each_in_order([&](const dom::Element& element, size_t) {
        auto& view = views[element.handle()];
        view.tag_name = element.tag_name();
        view.id = element.id();
        view.classes = element.class_list().items();
        for (const auto& attr : element.attributes()) {
            view.attributes.emplace_back(attr.name, attr.value);
        }
        view.child_element_count = element.children().size();
        view.has_text = !element.text_content().empty();
        view.state = element.state();

        // Position of each child among its element siblings.
        const auto& children = element.children();
        std::map<std::string, size_t> type_totals;
        for (dom::ElementId child : children) {
            ++type_totals[document.element(child).tag_name()];
        }
        std::map<std::string, size_t> type_seen;
        for (size_t i = 0; i < children.size(); ++i) {
            auto& child_view = views[children[i]];
            const auto& tag = document.element(children[i]).tag_name();
            child_view.parent = &view;
            child_view.prev_sibling = i > 0 ? &views[children[i - 1]] : nullptr;
            child_view.child_index = i;
            child_view.sibling_count = children.size();
            child_view.same_type_index = type_seen[tag]++;
            child_view.same_type_count = type_totals[tag];
        }
    });

    return views;
}

// ---------------------------------------------------------------------------
// ReflowPipeline
// ---------------------------------------------------------------------------

ReflowPipeline::ReflowPipeline() : ReflowPipeline(ReflowOptions{}) {}

ReflowPipeline::ReflowPipeline(ReflowOptions options) {
    diagnostics_.set_min_severity(options.min_severity);
    diagnostics_.add_observer(std::move(options.observer));
    resolver_.set_diagnostics(&diagnostics_);
    resolver_.set_root_font_size(options.root_font_size);
    layout_engine_.set_text_measurer(std::move(options.text_measurer));
}

std::vector<css::ParseError> ReflowPipeline::set_stylesheet(std::string_view css) {
    resolver_.clear_stylesheets();
    return add_stylesheet(css);
}

std::vector<css::ParseError> ReflowPipeline::add_stylesheet(std::string_view css) {
    auto result = css::parse_stylesheet_with_diagnostics(css);
    report_parse_result(diagnostics_, result);
    resolver_.add_stylesheet(result.stylesheet);
    return result.errors;
}

bool ReflowPipeline::register_extension_property(const std::string& name, bool inherited) {
    if (!resolver_.register_extension(name, inherited)) {
        diagnostics_.warn_unresolved("css.cascade", "register",
                                     "'" + name + "' is a built-in property");
        return false;
    }
    return true;
}

std::unique_ptr<layout::LayoutNode> ReflowPipeline::build_styled_tree(
    const dom::Document& document, dom::ElementId handle,
    const std::vector<css::ElementView>& views,
    const css::ComputedStyle& parent_style, size_t depth) const {
    if (depth > core::config::kMaxTreeDepth) {
        throw std::length_error("element tree deeper than " +
                                std::to_string(core::config::kMaxTreeDepth) + " levels");
    }
    const auto& element = document.element(handle);

    std::vector<css::CascadedDeclaration> inline_decls;
    if (!element.inline_style().empty()) {
        inline_decls = resolver_.compile_inline(css::parse_declaration_block(element.inline_style()));
    }

    auto node = std::make_unique<layout::LayoutNode>();
    node->element = handle;
    node->style = resolver_.resolve(views[handle], parent_style, inline_decls);
    node->text_content = element.text_content();

    for (dom::ElementId child : element.children()) {
        node->append_child(build_styled_tree(document, child, views, node->style, depth + 1));
    }
    return node;
}

ReflowResult ReflowPipeline::reflow(const dom::Document& document,
                                    float viewport_width, float viewport_height) {
    diagnostics_.set_correlation_id(static_cast<std::uint64_t>(reflow_count_) + 1);

    const dom::ElementId root = document.root();
    if (root == dom::kNoElement) {
        diagnostics_.emit(core::Severity::Error, core::DiagnosticCode::ReflowFailure,
                          kEngineModule, "reflow", "document has no root element");
        return {false, "document has no root element", reflow_count_};
    }

    layout::LayoutTree tree;
    const char* stage = "dom";
    try {
        for (const auto& id : document.duplicate_ids()) {
            diagnostics_.warn_unresolved("dom", "reflow", "duplicate id '" + id + "'");
        }

        stage = "style";
        auto views = build_element_views(document);
        auto styled = build_styled_tree(document, root, views, css::initial_style(), 0);
        stage = "layout";
        layout_engine_.compute(*styled, viewport_width, viewport_height);
        stage = "publish";
        tree = layout::LayoutTree::build(*styled);
    } catch (const std::exception& e) {
        diagnostics_.emit(core::Severity::Error, core::DiagnosticCode::ReflowFailure,
                          kEngineModule, stage, e.what());
        auto& trace = failures_.capture(diagnostics_, kEngineModule, stage, e.what());
        std::ostringstream viewport;
        viewport << viewport_width << 'x' << viewport_height;
        trace.add_snapshot("elements", std::to_string(document.size()));
        trace.add_snapshot("viewport", viewport.str());
        trace.add_snapshot("stylesheets", std::to_string(resolver_.stylesheet_count()));
        return {false, e.what(), reflow_count_};
    }

    tree_ = std::make_unique<layout::LayoutTree>(std::move(tree));
    ++reflow_count_;
    diagnostics_.info(kEngineModule, "reflow",
                      "laid out " + std::to_string(tree_->size()) + " elements");
    return {true, "OK", reflow_count_};
}

}  // namespace trellis::engine
