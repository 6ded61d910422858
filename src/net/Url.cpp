#include "Url.hpp"

namespace net
{

std::string normalize_base_url(const std::string& base)
{
    std::string out = base;
    while (!out.empty() && out.back() == '/')
    {
        out.pop_back();
    }
    return out;
}

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string escape_path(const std::string& relativePath)
{
    std::string out;
    std::string segment;
    for (char c : relativePath)
    {
        if (c == '/')
        {
            out += url_escape(segment);
            out.push_back('/');
            segment.clear();
        }
        else
        {
            segment.push_back(c);
        }
    }
    out += url_escape(segment);
    return out;
}

std::string join_url(const std::string& base, const std::string& endpoint)
{
    std::string path = endpoint;
    while (!path.empty() && path.front() == '/')
    {
        path.erase(path.begin());
    }
    return normalize_base_url(base) + "/" + path;
}

std::string content_disposition_filename(const std::string& headerValue)
{
    const std::string key = "filename=\"";
    size_t start = headerValue.find(key);
    if (start == std::string::npos)
        return {};
    start += key.size();
    size_t end = headerValue.find('"', start);
    if (end == std::string::npos)
        return {};
    return headerValue.substr(start, end - start);
}

} // namespace net
