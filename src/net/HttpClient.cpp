#include "HttpClient.hpp"

#include <cctype>

namespace
{

bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        char x = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        char y = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
        if (x != y)
            return false;
    }
    return true;
}

} // namespace

namespace net
{

std::string HttpResponse::header(const std::string& name) const
{
    for (const auto& [key, value] : headers)
    {
        if (iequals(key, name))
            return value;
    }
    return {};
}

std::string HttpResponse::describeFailure() const
{
    if (!error.empty())
        return error;
    if (status_code == 0)
        return "No response from server";
    return "HTTP error " + std::to_string(status_code);
}

} // namespace net
