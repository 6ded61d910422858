#pragma once

#include <string>

namespace net
{

struct MultipartBody
{
    std::string boundary;
    std::string contentType; // multipart/form-data; boundary=...
    std::string body;
};

// Random token suitable as a multipart boundary, fresh on every call
std::string make_boundary();

// Encodes one file part. fieldName and fileName are written into the
// Content-Disposition line; the part is typed application/octet-stream.
MultipartBody encode_file_part(const std::string& fieldName, const std::string& fileName, const std::string& content,
                               const std::string& boundary = make_boundary());

} // namespace net
