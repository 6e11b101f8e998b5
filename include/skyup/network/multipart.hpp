#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace skyup::network {

/**
 * @brief multipart/form-data body with a single file field
 *
 * Layout:
 * --BOUNDARY CRLF
 * Content-Disposition: form-data; name="file"; filename="a.txt" CRLF
 * Content-Type: text/plain CRLF
 * CRLF
 * <bytes> CRLF
 * --BOUNDARY-- CRLF
 */
struct MultipartBody {
    std::string content_type;  ///< "multipart/form-data; boundary=..."
    std::vector<std::uint8_t> body;
};

/// Random 32-character boundary prefixed with dashes.
std::string make_boundary();

MultipartBody build_file_form(const std::string& field_name,
                              const std::string& filename,
                              const std::vector<std::uint8_t>& data,
                              const std::string& boundary = make_boundary());

/**
 * @brief Content type guessed from the filename's extension
 *
 * Falls back to application/octet-stream.
 */
std::string mime_type_for(const std::string& filename);

} // namespace skyup::network
