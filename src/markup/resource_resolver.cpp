#include "markup/resource_resolver.hpp"
#include "url_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace web_archiver {

namespace {

const std::array<const char*, 5> kFontExtensions = {".woff", ".woff2", ".ttf", ".eot", ".otf"};
const std::array<const char*, 9> kImageExtensions = {".png", ".jpg", ".jpeg", ".gif", ".svg", ".webp", ".avif", ".ico", ".bmp"};
const std::array<const char*, 6> kSkippedSchemes = {"data:", "javascript:", "mailto:", "about:", "blob:", "tel:"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

template<size_t N>
bool in_list(const std::string& value, const std::array<const char*, N>& list) {
    return std::any_of(list.begin(), list.end(), [&](const char* item) { return value == item; });
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool has_token(const std::string& value, const std::string& token) {
    std::istringstream tokens(lower(value));
    std::string t;
    while (tokens >> t) {
        if (t == token) return true;
    }
    return false;
}

size_t find_url_call(const std::string& css, size_t from) {
    while (from + 4 <= css.size()) {
        size_t i = from;
        for (; i + 4 <= css.size(); ++i) {
            if ((css[i] == 'u' || css[i] == 'U') && (css[i + 1] == 'r' || css[i + 1] == 'R') &&
                (css[i + 2] == 'l' || css[i + 2] == 'L') && css[i + 3] == '(') {
                break;
            }
        }
        if (i + 4 > css.size()) return std::string::npos;
        // Part of a longer identifier, e.g. "myurl("
        if (i > 0) {
            char prev = css[i - 1];
            if (std::isalnum(static_cast<unsigned char>(prev)) || prev == '-' || prev == '_') {
                from = i + 4;
                continue;
            }
        }
        return i;
    }
    return std::string::npos;
}

std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '.' || c == '_' || c == '-') ? c : '_';
    }
    return out;
}

std::string extension_for(ResourceKind kind, const std::string& content_type, const std::string& url) {
    std::string ct = lower(content_type);
    std::string u = lower(url);

    switch (kind) {
    case ResourceKind::Stylesheet:
        return ".css";
    case ResourceKind::Script:
        return ".js";
    case ResourceKind::Image:
        if (contains(ct, "jpeg") || contains(ct, "jpg")) return ".jpg";
        if (contains(ct, "png")) return ".png";
        if (contains(ct, "gif")) return ".gif";
        if (contains(ct, "svg")) return ".svg";
        if (contains(ct, "webp")) return ".webp";
        if (contains(ct, "avif")) return ".avif";
        if (contains(ct, "icon")) return ".ico";
        return ".jpg";
    case ResourceKind::Font:
        for (const std::string& hint : {ct, u}) {
            if (contains(hint, "woff2")) return ".woff2";
            if (contains(hint, "woff")) return ".woff";
            if (contains(hint, "ttf") || contains(hint, "truetype")) return ".ttf";
            if (contains(hint, "otf") || contains(hint, "opentype")) return ".otf";
            if (contains(hint, "eot") || contains(hint, "fontobject")) return ".eot";
            if (contains(hint, "svg")) return ".svg";
        }
        return ".woff";
    case ResourceKind::Unclassified:
        break;
    }
    return ".bin";
}

std::string filename_prefix(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Stylesheet: return "style_";
    case ResourceKind::Script: return "script_";
    case ResourceKind::Image: return "image_";
    case ResourceKind::Font: return "font_";
    case ResourceKind::Unclassified: break;
    }
    return "asset_";
}

} // namespace

std::string to_string(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Stylesheet: return "stylesheet";
    case ResourceKind::Script: return "script";
    case ResourceKind::Image: return "image";
    case ResourceKind::Font: return "font";
    case ResourceKind::Unclassified: return "unclassified";
    }
    return "unknown";
}

std::string asset_subdir(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Stylesheet: return "css";
    case ResourceKind::Script: return "js";
    case ResourceKind::Image: return "images";
    case ResourceKind::Font: return "fonts";
    case ResourceKind::Unclassified: break;
    }
    return "";
}

uint32_t stable_hash(const std::string& text) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

ResourceResolver::ResourceResolver(ResolverOptions options) : options_(options) {}

bool ResourceResolver::is_local_reference(const std::string& reference, ReferenceOrigin origin) {
    std::string ref = trim(reference);
    if (starts_with(ref, "./")) ref = ref.substr(2);

    if (origin == ReferenceOrigin::Markup) {
        for (const char* dir : {"assets/images/", "assets/css/", "assets/js/", "assets/fonts/"}) {
            if (starts_with(ref, dir)) return true;
        }
        return false;
    }
    return starts_with(ref, "../fonts/") || starts_with(ref, "../images/");
}

std::optional<std::string> ResourceResolver::normalize(const std::string& reference, const std::string& base_url) {
    std::string ref = trim(reference);
    if (ref.empty() || ref.front() == '#') return std::nullopt;

    std::string lowered = lower(ref.substr(0, 12));
    for (const char* scheme : kSkippedSchemes) {
        if (starts_with(lowered, scheme)) return std::nullopt;
    }

    std::string resolved = resolve_url(base_url, ref);
    if (!is_http_url(resolved)) return std::nullopt;
    return resolved;
}

std::optional<ResourceKind> ResourceResolver::classify_css_asset(const std::string& url, const std::string& content_type) {
    std::string ext = path_extension(url);
    if (in_list(ext, kFontExtensions)) return ResourceKind::Font;
    if (in_list(ext, kImageExtensions)) return ResourceKind::Image;

    std::string ct = lower(content_type);
    if (ct.empty()) return std::nullopt;
    if (starts_with(ct, "font/") || contains(ct, "font") || contains(ct, "woff")) return ResourceKind::Font;
    if (starts_with(ct, "image/")) return ResourceKind::Image;

    // Servers often send fonts as application/octet-stream
    std::string u = lower(url);
    if (contains(u, "woff") || contains(u, ".ttf") || contains(u, ".otf") || contains(u, ".eot")) return ResourceKind::Font;
    return std::nullopt;
}

std::string ResourceResolver::choose_filename(ResourceKind kind, const std::string& url, const std::string& content_type) {
    std::string segment = sanitize_filename(last_path_segment(url));
    auto dot = segment.rfind('.');
    bool has_extension = dot != std::string::npos && dot > 0 && dot + 1 < segment.size();
    if (has_extension && segment.size() <= 100) {
        return segment;
    }

    char hash[9];
    std::snprintf(hash, sizeof(hash), "%08x", stable_hash(url));
    return filename_prefix(kind) + hash + extension_for(kind, content_type, url);
}

std::string ResourceResolver::local_reference(const std::string& snapshot_relative_path, ReferenceOrigin origin) {
    if (origin == ReferenceOrigin::Markup) return snapshot_relative_path;
    const std::string assets = "assets/";
    if (starts_with(snapshot_relative_path, assets)) {
        return "../" + snapshot_relative_path.substr(assets.size());
    }
    return snapshot_relative_path;
}

std::vector<ResourceReference> ResourceResolver::discover(const std::string& markup, const std::string& base_url) const {
    HtmlDocument doc(markup);
    return discover(doc, base_url);
}

std::vector<ResourceReference> ResourceResolver::discover(const HtmlDocument& doc, const std::string& base_url) const {
    std::vector<ResourceReference> refs;

    for (const auto& element : doc.elements()) {
        const AttributeView* attr = nullptr;
        ResourceKind kind = ResourceKind::Image;

        if (element.tag == "link" && options_.download_css) {
            const auto* rel = element.attribute("rel");
            if (rel && has_token(rel->value, "stylesheet")) {
                attr = element.attribute("href");
                kind = ResourceKind::Stylesheet;
            }
        } else if (element.tag == "script" && options_.download_js) {
            attr = element.attribute("src");
            kind = ResourceKind::Script;
        } else if (element.tag == "img" && options_.download_images) {
            attr = element.attribute("src");
            kind = ResourceKind::Image;
        }

        if (!attr || !attr->has_value) continue;

        std::string raw = decode_html_entities(attr->value);
        if (is_local_reference(raw, ReferenceOrigin::Markup)) continue;

        auto resolved = normalize(raw, base_url);
        if (!resolved) continue;

        ResourceReference ref;
        ref.kind = kind;
        ref.origin = ReferenceOrigin::Markup;
        ref.original = attr->value;
        ref.resolved_url = *resolved;
        ref.location = attr->value_span;
        refs.push_back(std::move(ref));
    }

    spdlog::debug("Discovered {} resource references in markup from {}", refs.size(), base_url);
    return refs;
}

std::vector<ResourceReference> ResourceResolver::discover_css(const std::string& css, const std::string& css_url) const {
    std::vector<ResourceReference> refs;
    size_t pos = 0;

    while ((pos = find_url_call(css, pos)) != std::string::npos) {
        size_t i = pos + 4;
        while (i < css.size() && std::isspace(static_cast<unsigned char>(css[i]))) ++i;
        if (i >= css.size()) break;

        size_t value_start = i;
        size_t value_end = 0;
        size_t close = 0;
        char quote = css[i];

        if (quote == '"' || quote == '\'') {
            value_start = i + 1;
            value_end = css.find(quote, value_start);
            if (value_end == std::string::npos) break;
            close = value_end + 1;
            while (close < css.size() && std::isspace(static_cast<unsigned char>(css[close]))) ++close;
            if (close >= css.size() || css[close] != ')') {
                pos = value_end + 1;
                continue;
            }
        } else {
            close = css.find(')', value_start);
            if (close == std::string::npos) break;
            value_end = close;
        }

        std::string raw = trim(css.substr(value_start, value_end - value_start));
        TextSpan span{static_cast<uint32_t>(pos), static_cast<uint32_t>(close + 1)};
        pos = close + 1;

        if (is_local_reference(raw, ReferenceOrigin::Stylesheet)) continue;
        auto resolved = normalize(raw, css_url);
        if (!resolved) continue;

        ResourceKind kind = classify_css_asset(*resolved).value_or(ResourceKind::Unclassified);
        if (kind == ResourceKind::Font && !options_.download_fonts) continue;
        if (kind == ResourceKind::Image && !options_.download_images) continue;
        if (kind == ResourceKind::Unclassified && !options_.download_fonts && !options_.download_images) continue;

        ResourceReference ref;
        ref.kind = kind;
        ref.origin = ReferenceOrigin::Stylesheet;
        ref.original = raw;
        ref.resolved_url = *resolved;
        ref.location = span;
        refs.push_back(std::move(ref));
    }

    return refs;
}

std::string ResourceResolver::rewrite(const std::string& text, const std::vector<ResourceReference>& refs) {
    std::vector<TextEdit> edits;
    for (const auto& ref : refs) {
        if (ref.local_path.empty()) continue;
        if (ref.origin == ReferenceOrigin::Markup) {
            edits.push_back({ref.location, ref.local_path});
        } else {
            edits.push_back({ref.location, "url(" + ref.local_path + ")"});
        }
    }
    if (edits.empty()) return text;
    return HtmlDocument::apply_edits(text, std::move(edits));
}

} // namespace web_archiver
