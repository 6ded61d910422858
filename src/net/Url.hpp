#pragma once

#include <string>

namespace net
{

// Strips trailing '/' so endpoint paths can be appended verbatim
std::string normalize_base_url(const std::string& base);

// Percent-encodes everything outside RFC 3986 unreserved characters
std::string url_escape(const std::string& s);

// Encodes each '/'-separated segment of a relative path, keeping the separators
std::string escape_path(const std::string& relativePath);

// base + "/" + endpoint, tolerating a trailing slash on base and a leading one on endpoint
std::string join_url(const std::string& base, const std::string& endpoint);

// Extracts filename="..." from a Content-Disposition value, empty if absent
std::string content_disposition_filename(const std::string& headerValue);

} // namespace net
