#pragma once
#include <string>
#include <optional>

namespace web_archiver {

struct ParsedUrl {
    std::string scheme;    // lowercased, empty for relative references
    std::string authority; // userinfo@host:port as written
    std::string host;      // lowercased
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_authority = false;
    bool has_query = false;
    bool has_fragment = false;

    std::string to_string() const;
};

ParsedUrl parse_url(const std::string& url);

// RFC 3986 section 5.2 reference resolution. Fragments are dropped from the result.
std::string resolve_url(const std::string& base, const std::string& reference);

bool is_protocol_relative(const std::string& reference);
bool is_http_url(const std::string& url);

// "https://example.com:8443", used as the robots.txt cache key.
std::string origin_of(const std::string& url);

// host[:port] as it appears in the URL, the "domain" stored in metadata.
std::string domain_of(const std::string& url);

// "example.com:8080" -> "example_com_8080", safe as a directory prefix.
std::string domain_slug(const std::string& domain);

// Last non-empty path segment, query and fragment excluded.
std::string last_path_segment(const std::string& url);

// Lowercased extension of the last path segment including the dot, or "".
std::string path_extension(const std::string& url);

// Path plus query, what robots rules are matched against.
std::string path_and_query(const std::string& url);

// &amp; &lt; &gt; &quot; &apos; and numeric references.
std::string decode_html_entities(const std::string& text);

} // namespace web_archiver
