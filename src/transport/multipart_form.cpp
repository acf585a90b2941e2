/**
 * @file multipart_form.cpp
 * @brief multipart/form-data body builder implementation
 */

#include "kcenon/video_uploader/transport/multipart_form.h"

#include "kcenon/video_uploader/core/api_utils.h"

namespace kcenon::video_uploader {

namespace {

auto escape_quoted(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            out += "%22";
        } else if (c == '\r' || c == '\n') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

void append(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

multipart_form::multipart_form()
    : boundary_("----VideoUploaderBoundary" + api_utils::generate_random_hex(12)) {}

multipart_form::multipart_form(std::string boundary) : boundary_(std::move(boundary)) {}

void multipart_form::add_field(const std::string& name, const std::string& value) {
    part p;
    p.name = name;
    p.data.assign(value.begin(), value.end());
    parts_.push_back(std::move(p));
}

void multipart_form::add_file(const std::string& name,
                              const std::string& filename,
                              const std::vector<std::byte>& data,
                              const std::string& content_type) {
    part p;
    p.name = name;
    p.filename = filename;
    p.content_type = content_type;
    p.is_file = true;
    p.data.resize(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        p.data[i] = static_cast<uint8_t>(data[i]);
    }
    parts_.push_back(std::move(p));
}

auto multipart_form::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_form::boundary() const -> const std::string& {
    return boundary_;
}

auto multipart_form::build() const -> std::vector<uint8_t> {
    std::vector<uint8_t> body;

    for (const auto& p : parts_) {
        append(body, "--" + boundary_ + "\r\n");
        append(body, "Content-Disposition: form-data; name=\"" + escape_quoted(p.name) + "\"");
        if (p.is_file) {
            append(body, "; filename=\"" + escape_quoted(p.filename) + "\"\r\n");
            append(body, "Content-Type: " + p.content_type + "\r\n");
        } else {
            append(body, "\r\n");
        }
        append(body, "\r\n");
        body.insert(body.end(), p.data.begin(), p.data.end());
        append(body, "\r\n");
    }

    append(body, "--" + boundary_ + "--\r\n");
    return body;
}

}  // namespace kcenon::video_uploader
