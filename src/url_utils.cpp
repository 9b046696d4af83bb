#include "url_utils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace web_archiver {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_scheme_char(char c, bool first) {
    if (std::isalpha(static_cast<unsigned char>(c))) return true;
    if (first) return false;
    return std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

void split_authority(ParsedUrl& u) {
    std::string hostport = u.authority;
    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport = hostport.substr(at + 1);

    if (!hostport.empty() && hostport.front() == '[') {
        // IPv6 literal
        auto close = hostport.find(']');
        u.host = hostport.substr(0, close == std::string::npos ? hostport.size() : close + 1);
        if (close != std::string::npos && close + 1 < hostport.size() && hostport[close + 1] == ':') {
            u.port = hostport.substr(close + 2);
        }
    } else {
        auto colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            u.host = hostport.substr(0, colon);
            u.port = hostport.substr(colon + 1);
        } else {
            u.host = hostport;
        }
    }
    u.host = to_lower(u.host);
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::string input = path;
    bool absolute = !input.empty() && input.front() == '/';
    bool trailing_slash = false;

    size_t pos = absolute ? 1 : 0;
    while (pos <= input.size()) {
        size_t next = input.find('/', pos);
        std::string seg = input.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        bool last = (next == std::string::npos);

        if (seg == ".") {
            trailing_slash = last;
        } else if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailing_slash = last;
        } else {
            out.push_back(seg);
            trailing_slash = false;
        }
        if (last) break;
        pos = next + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < out.size(); ++i) {
        if (i > 0) result += '/';
        result += out[i];
    }
    if (trailing_slash && (result.empty() || result.back() != '/')) result += '/';
    return result;
}

std::string merge_paths(const ParsedUrl& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty()) return "/" + ref_path;
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) return ref_path;
    return base.path.substr(0, slash + 1) + ref_path;
}

} // namespace

std::string ParsedUrl::to_string() const {
    std::string out;
    if (!scheme.empty()) out += scheme + ":";
    if (has_authority) out += "//" + authority;
    out += path;
    if (has_query) out += "?" + query;
    if (has_fragment) out += "#" + fragment;
    return out;
}

ParsedUrl parse_url(const std::string& raw) {
    ParsedUrl u;
    std::string rest = raw;

    // Scheme
    size_t i = 0;
    while (i < rest.size() && is_scheme_char(rest[i], i == 0)) ++i;
    if (i > 0 && i < rest.size() && rest[i] == ':') {
        u.scheme = to_lower(rest.substr(0, i));
        rest = rest.substr(i + 1);
    }

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        u.fragment = rest.substr(hash + 1);
        u.has_fragment = true;
        rest = rest.substr(0, hash);
    }

    auto q = rest.find('?');
    if (q != std::string::npos) {
        u.query = rest.substr(q + 1);
        u.has_query = true;
        rest = rest.substr(0, q);
    }

    if (rest.rfind("//", 0) == 0) {
        u.has_authority = true;
        auto slash = rest.find('/', 2);
        u.authority = rest.substr(2, slash == std::string::npos ? std::string::npos : slash - 2);
        u.path = slash == std::string::npos ? "" : rest.substr(slash);
        split_authority(u);
    } else {
        u.path = rest;
    }
    return u;
}

std::string resolve_url(const std::string& base_str, const std::string& ref_str) {
    ParsedUrl base = parse_url(base_str);
    ParsedUrl ref = parse_url(ref_str);
    ParsedUrl t;

    if (!ref.scheme.empty()) {
        t = ref;
        t.path = remove_dot_segments(ref.path);
    } else {
        if (ref.has_authority) {
            t.authority = ref.authority;
            t.host = ref.host;
            t.port = ref.port;
            t.has_authority = true;
            t.path = remove_dot_segments(ref.path);
            t.query = ref.query;
            t.has_query = ref.has_query;
        } else {
            if (ref.path.empty()) {
                t.path = base.path;
                t.query = ref.has_query ? ref.query : base.query;
                t.has_query = ref.has_query || base.has_query;
            } else {
                if (ref.path.front() == '/') {
                    t.path = remove_dot_segments(ref.path);
                } else {
                    t.path = remove_dot_segments(merge_paths(base, ref.path));
                }
                t.query = ref.query;
                t.has_query = ref.has_query;
            }
            t.authority = base.authority;
            t.host = base.host;
            t.port = base.port;
            t.has_authority = base.has_authority;
        }
        t.scheme = base.scheme.empty() ? "https" : base.scheme;
    }

    if (t.has_authority && t.path.empty()) t.path = "/";
    t.has_fragment = false;
    t.fragment.clear();
    return t.to_string();
}

bool is_protocol_relative(const std::string& reference) {
    return reference.rfind("//", 0) == 0;
}

bool is_http_url(const std::string& url) {
    auto u = parse_url(url);
    return (u.scheme == "http" || u.scheme == "https") && u.has_authority && !u.host.empty();
}

std::string origin_of(const std::string& url) {
    auto u = parse_url(url);
    std::string origin = u.scheme + "://" + u.host;
    if (!u.port.empty()) origin += ":" + u.port;
    return origin;
}

std::string domain_of(const std::string& url) {
    auto u = parse_url(url);
    return u.port.empty() ? u.host : u.host + ":" + u.port;
}

std::string domain_slug(const std::string& domain) {
    std::string slug = domain.empty() ? "unknown_domain" : domain;
    for (auto& c : slug) {
        if (c == '.' || c == ':' || c == '/' || c == '\\' || c == '[' || c == ']') c = '_';
    }
    return slug;
}

std::string last_path_segment(const std::string& url) {
    auto u = parse_url(url);
    std::string path = u.path;
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string path_extension(const std::string& url) {
    std::string seg = last_path_segment(url);
    auto dot = seg.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == seg.size()) return "";
    return to_lower(seg.substr(dot));
}

std::string path_and_query(const std::string& url) {
    auto u = parse_url(url);
    std::string out = u.path.empty() ? "/" : u.path;
    if (u.has_query) out += "?" + u.query;
    return out;
}

std::string decode_html_entities(const std::string& text) {
    if (text.find('&') == std::string::npos) return text;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        auto semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        std::string name = text.substr(i + 1, semi - i - 1);
        std::string replacement;
        if (name == "amp") replacement = "&";
        else if (name == "lt") replacement = "<";
        else if (name == "gt") replacement = ">";
        else if (name == "quot") replacement = "\"";
        else if (name == "apos") replacement = "'";
        else if (name == "nbsp") replacement = "\xC2\xA0";
        else if (name.size() > 1 && name[0] == '#') {
            try {
                unsigned long cp = (name[1] == 'x' || name[1] == 'X')
                    ? std::stoul(name.substr(2), nullptr, 16)
                    : std::stoul(name.substr(1), nullptr, 10);
                // UTF-8 encode
                if (cp < 0x80) {
                    replacement += static_cast<char>(cp);
                } else if (cp < 0x800) {
                    replacement += static_cast<char>(0xC0 | (cp >> 6));
                    replacement += static_cast<char>(0x80 | (cp & 0x3F));
                } else if (cp < 0x10000) {
                    replacement += static_cast<char>(0xE0 | (cp >> 12));
                    replacement += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    replacement += static_cast<char>(0x80 | (cp & 0x3F));
                } else if (cp < 0x110000) {
                    replacement += static_cast<char>(0xF0 | (cp >> 18));
                    replacement += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                    replacement += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    replacement += static_cast<char>(0x80 | (cp & 0x3F));
                }
            } catch (const std::exception&) {
                replacement.clear();
            }
        }

        if (replacement.empty()) {
            out += text[i++];
        } else {
            out += replacement;
            i = semi + 1;
        }
    }
    return out;
}

} // namespace web_archiver
