#pragma once
#include <string>
#include <vector>
#include <optional>
#include "markup/html_document.hpp"

namespace web_archiver {

enum class ResourceKind {
    Stylesheet,
    Script,
    Image,
    Font,
    Unclassified // stylesheet url(...) target, settled by the response content-type
};

std::string to_string(ResourceKind kind);

// "css", "js", "images", "fonts" under assets/
std::string asset_subdir(ResourceKind kind);

enum class ReferenceOrigin {
    Markup,    // attribute value in HTML
    Stylesheet // url(...) in CSS text
};

struct ResourceReference {
    ResourceKind kind = ResourceKind::Image;
    ReferenceOrigin origin = ReferenceOrigin::Markup;
    std::string original;     // as written in the source
    std::string resolved_url; // absolute http(s)
    std::string local_path;   // set once fetched, relative to the rewritten document
    TextSpan location;        // attribute value, or the whole url(...) occurrence
};

struct ResolverOptions {
    bool download_css = true;
    bool download_js = true;
    bool download_images = true;
    bool download_fonts = true;
};

class ResourceResolver {
public:
    explicit ResourceResolver(ResolverOptions options = {});

    // <link rel=stylesheet href>, <script src>, <img src> in document order.
    std::vector<ResourceReference> discover(const std::string& markup, const std::string& base_url) const;
    std::vector<ResourceReference> discover(const HtmlDocument& doc, const std::string& base_url) const;

    // url(...) occurrences, resolved against the stylesheet's own URL.
    std::vector<ResourceReference> discover_css(const std::string& css, const std::string& css_url) const;

    // Substitutes every reference with a local_path. Spans must come from `text`.
    static std::string rewrite(const std::string& text, const std::vector<ResourceReference>& refs);

    // Already points into a snapshot's assets/ tree.
    static bool is_local_reference(const std::string& reference, ReferenceOrigin origin);

    // Absolute URL to fetch, or nullopt for data:, fragments, javascript: and friends.
    static std::optional<std::string> normalize(const std::string& reference, const std::string& base_url);

    // CSS url(...) targets: font or image by extension, then by content-type.
    static std::optional<ResourceKind> classify_css_asset(const std::string& url, const std::string& content_type = "");

    // Last path segment when it has an extension, else <prefix><hash><ext>.
    static std::string choose_filename(ResourceKind kind, const std::string& url, const std::string& content_type);

    // "assets/fonts/a.woff2" from the document, "../fonts/a.woff2" from a stylesheet in assets/css/.
    static std::string local_reference(const std::string& snapshot_relative_path, ReferenceOrigin origin);

    const ResolverOptions& options() const { return options_; }

private:
    ResolverOptions options_;
};

// FNV-1a, stable across runs and platforms.
uint32_t stable_hash(const std::string& text);

} // namespace web_archiver
