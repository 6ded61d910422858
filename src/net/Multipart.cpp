#include "Multipart.hpp"

#include <random>

namespace
{

// Quotes and line breaks would terminate the header parameter early
std::string quote_param(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value)
    {
        switch (c)
        {
        case '"':
            out += "%22";
            break;
        case '\r':
            out += "%0D";
            break;
        case '\n':
            out += "%0A";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

} // namespace

namespace net
{

std::string make_boundary()
{
    thread_local std::mt19937_64 rng{ std::random_device{}() };
    std::uniform_int_distribution<int> nibble(0, 15);
    const char* hex = "0123456789abcdef";

    std::string token = "dropsync-";
    for (int i = 0; i < 32; ++i)
    {
        token.push_back(hex[nibble(rng)]);
    }
    return token;
}

MultipartBody encode_file_part(const std::string& fieldName, const std::string& fileName, const std::string& content,
                               const std::string& boundary)
{
    MultipartBody mp;
    mp.boundary = boundary;
    mp.contentType = "multipart/form-data; boundary=" + boundary;

    std::string& body = mp.body;
    body.reserve(content.size() + fieldName.size() + fileName.size() + 256);
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + quote_param(fieldName) + "\"; filename=\"" +
            quote_param(fileName) + "\"\r\n";
    body += "Content-Type: application/octet-stream\r\n";
    body += "\r\n";
    body += content;
    body += "\r\n";
    body += "--" + boundary + "--\r\n";
    return mp;
}

} // namespace net
