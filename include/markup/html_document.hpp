#pragma once
#include <tree_sitter/api.h>
#include <cstdint>
#include <string>
#include <vector>

// Grammar shipped by tree-sitter-html
extern "C" {
    const TSLanguage* tree_sitter_html();
}

namespace web_archiver {

// Half-open byte range [start, end) into the text a view was built from.
struct TextSpan {
    uint32_t start = 0;
    uint32_t end = 0;

    uint32_t length() const { return end - start; }
    bool overlaps(const TextSpan& other) const { return start < other.end && other.start < end; }
};

struct TextEdit {
    TextSpan span;
    std::string replacement;
};

struct AttributeView {
    std::string name;  // lowercased
    std::string value; // raw, entities not decoded
    bool has_value = false;
    TextSpan span;       // whole attribute, name through closing quote
    TextSpan value_span; // value without quotes
};

struct ElementView {
    std::string tag; // lowercased
    std::vector<AttributeView> attributes;
    TextSpan span;         // start tag through end tag
    TextSpan content_span; // between start and end tag, empty for void elements

    const AttributeView* attribute(const std::string& name) const;
};

class HtmlDocument {
public:
    explicit HtmlDocument(std::string source);

    const std::string& source() const { return source_; }

    // Every element in document order, including <script> and <style>.
    const std::vector<ElementView>& elements() const { return elements_; }

    // Text of the first <title>, entities decoded and whitespace collapsed. Empty if none.
    std::string title() const;

    // Applies non-overlapping edits. Overlapping edits are a programming error and throw.
    static std::string apply_edits(const std::string& source, std::vector<TextEdit> edits);

private:
    void collect(TSNode root);

    std::string source_;
    std::vector<ElementView> elements_;
};

// Drops <script>, <iframe>, <object>, <embed> and on* handler attributes.
std::string sanitize_markup(const std::string& markup);

} // namespace web_archiver
