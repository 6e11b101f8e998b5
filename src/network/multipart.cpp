#include "skyup/network/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <unordered_map>

namespace skyup::network {
namespace {

// Quotes and line breaks would end the header parameter early.
std::string escape_quoted(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': out += "%22"; break;
            case '\r': out += "%0D"; break;
            case '\n': out += "%0A"; break;
            default: out += c; break;
        }
    }
    return out;
}

void append(std::vector<std::uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

} // namespace

std::string make_boundary() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string boundary = "----skyup";
    for (int i = 0; i < 32; ++i) {
        boundary += kAlphabet[pick(rng)];
    }
    return boundary;
}

MultipartBody build_file_form(const std::string& field_name,
                              const std::string& filename,
                              const std::vector<std::uint8_t>& data,
                              const std::string& boundary) {
    MultipartBody form;
    form.content_type = "multipart/form-data; boundary=" + boundary;

    const std::string head =
        "--" + boundary + "\r\n"
        "Content-Disposition: form-data; name=\"" + escape_quoted(field_name) +
        "\"; filename=\"" + escape_quoted(filename) + "\"\r\n"
        "Content-Type: " + mime_type_for(filename) + "\r\n"
        "\r\n";
    const std::string tail = "\r\n--" + boundary + "--\r\n";

    form.body.reserve(head.size() + data.size() + tail.size());
    append(form.body, head);
    form.body.insert(form.body.end(), data.begin(), data.end());
    append(form.body, tail);
    return form;
}

std::string mime_type_for(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"md", "text/markdown"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"wasm", "application/wasm"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"webp", "image/webp"},
        {"ico", "image/x-icon"},
        {"mp3", "audio/mpeg"},
        {"ogg", "audio/ogg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
    };

    const auto slash = filename.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    const auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) {
        return "application/octet-stream";
    }

    std::string ext = base.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

} // namespace skyup::network
