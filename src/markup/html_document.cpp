#include "markup/html_document.hpp"
#include "url_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stack>
#include <stdexcept>
#include <unordered_set>

namespace web_archiver {

namespace {

struct ParserDeleter {
    void operator()(TSParser* p) const { ts_parser_delete(p); }
};
struct TreeDeleter {
    void operator()(TSTree* t) const { ts_tree_delete(t); }
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_type(TSNode node, const char* type) {
    return std::string(ts_node_type(node)) == type;
}

bool is_element_node(TSNode node) {
    std::string type = ts_node_type(node);
    return type == "element" || type == "script_element" || type == "style_element";
}

TextSpan span_of(TSNode node) {
    return {ts_node_start_byte(node), ts_node_end_byte(node)};
}

std::string text_of(const std::string& source, TSNode node) {
    auto span = span_of(node);
    if (span.end > source.size() || span.start > span.end) return "";
    return source.substr(span.start, span.length());
}

AttributeView read_attribute(const std::string& source, TSNode attr) {
    AttributeView view;
    view.span = span_of(attr);

    uint32_t count = ts_node_child_count(attr);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(attr, i);
        if (is_type(child, "attribute_name")) {
            view.name = lower(text_of(source, child));
        } else if (is_type(child, "attribute_value")) {
            view.has_value = true;
            view.value_span = span_of(child);
            view.value = text_of(source, child);
        } else if (is_type(child, "quoted_attribute_value")) {
            view.has_value = true;
            // An empty "" has no attribute_value child
            auto outer = span_of(child);
            view.value_span = {outer.start + 1, outer.start + 1};
            uint32_t inner_count = ts_node_child_count(child);
            for (uint32_t j = 0; j < inner_count; ++j) {
                TSNode inner = ts_node_child(child, j);
                if (is_type(inner, "attribute_value")) {
                    view.value_span = span_of(inner);
                    view.value = text_of(source, inner);
                }
            }
        }
    }
    return view;
}

} // namespace

const AttributeView* ElementView::attribute(const std::string& name) const {
    for (const auto& a : attributes) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

HtmlDocument::HtmlDocument(std::string source) : source_(std::move(source)) {
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_html())) {
        throw std::runtime_error("tree-sitter HTML grammar unavailable");
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, source_.c_str(), static_cast<uint32_t>(source_.size())));
    if (!tree) {
        throw std::runtime_error("tree-sitter failed to parse document");
    }
    collect(ts_tree_root_node(tree.get()));
}

void HtmlDocument::collect(TSNode root) {
    // Non-recursive walk, children pushed in reverse to keep document order
    std::stack<TSNode> stack;
    stack.push(root);

    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();

        if (is_element_node(node)) {
            ElementView element;
            element.span = span_of(node);

            uint32_t count = ts_node_child_count(node);
            bool have_start = false;
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_child(node, i);
                if (is_type(child, "start_tag") || is_type(child, "self_closing_tag")) {
                    have_start = true;
                    element.content_span = {ts_node_end_byte(child), ts_node_end_byte(child)};
                    uint32_t tag_children = ts_node_child_count(child);
                    for (uint32_t j = 0; j < tag_children; ++j) {
                        TSNode part = ts_node_child(child, j);
                        if (is_type(part, "tag_name")) {
                            element.tag = lower(text_of(source_, part));
                        } else if (is_type(part, "attribute")) {
                            element.attributes.push_back(read_attribute(source_, part));
                        }
                    }
                } else if (is_type(child, "end_tag") && have_start) {
                    element.content_span.end = ts_node_start_byte(child);
                }
            }
            if (have_start && element.content_span.end < element.content_span.start) {
                element.content_span.end = element.content_span.start;
            }
            if (have_start) elements_.push_back(std::move(element));
        }

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push(ts_node_child(node, i - 1));
        }
    }
}

std::string HtmlDocument::title() const {
    for (const auto& element : elements_) {
        if (element.tag != "title") continue;
        auto span = element.content_span;
        std::string raw = source_.substr(span.start, span.length());

        std::string collapsed;
        bool in_space = false;
        for (char c : decode_html_entities(raw)) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                in_space = !collapsed.empty();
            } else {
                if (in_space) collapsed += ' ';
                collapsed += c;
                in_space = false;
            }
        }
        return collapsed;
    }
    return "";
}

std::string HtmlDocument::apply_edits(const std::string& source, std::vector<TextEdit> edits) {
    std::sort(edits.begin(), edits.end(), [](const TextEdit& a, const TextEdit& b) {
        return a.span.start < b.span.start;
    });

    std::string out;
    out.reserve(source.size());
    uint32_t cursor = 0;
    for (const auto& edit : edits) {
        if (edit.span.start < cursor || edit.span.end > source.size() || edit.span.end < edit.span.start) {
            throw std::logic_error("overlapping or out-of-range text edit");
        }
        out.append(source, cursor, edit.span.start - cursor);
        out += edit.replacement;
        cursor = edit.span.end;
    }
    out.append(source, cursor, std::string::npos);
    return out;
}

std::string sanitize_markup(const std::string& markup) {
    static const std::unordered_set<std::string> kDroppedElements = {"script", "iframe", "object", "embed"};

    HtmlDocument doc(markup);
    std::vector<TextEdit> edits;
    TextSpan dropped_until{0, 0};
    size_t removed_elements = 0;
    size_t removed_handlers = 0;

    for (const auto& element : doc.elements()) {
        // Everything nested in an element we already drop goes with it
        if (element.span.start < dropped_until.end) continue;

        if (kDroppedElements.count(element.tag)) {
            edits.push_back({element.span, ""});
            dropped_until = element.span;
            ++removed_elements;
            continue;
        }

        for (const auto& attr : element.attributes) {
            if (attr.name.size() < 3 || attr.name.compare(0, 2, "on") != 0) continue;
            TextSpan span = attr.span;
            while (span.start > 0 && std::isspace(static_cast<unsigned char>(markup[span.start - 1]))) {
                --span.start;
            }
            edits.push_back({span, ""});
            ++removed_handlers;
        }
    }

    spdlog::info("🧹 Sanitized markup: {} elements, {} event handlers removed", removed_elements, removed_handlers);
    return HtmlDocument::apply_edits(markup, std::move(edits));
}

} // namespace web_archiver
