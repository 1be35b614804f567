#include "multipart_form.h"
#include "util/uuid.h"
#include <algorithm>

namespace core::net {
namespace {
// Quoted-string values in Content-Disposition cannot carry raw quotes or line breaks.
std::string escape_quoted(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '"':
            escaped += "%22";
            break;
        case '\r':
            escaped += "%0D";
            break;
        case '\n':
            escaped += "%0A";
            break;
        default:
            escaped.push_back(c);
        }
    }
    return escaped;
}

std::string make_boundary() {
    auto id = util::generate_uuid();
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return "----DocRelayFormBoundary" + id;
}
} // namespace

MultipartForm::MultipartForm()
    : MultipartForm(make_boundary()) {}

MultipartForm::MultipartForm(std::string boundary)
    : boundary_(std::move(boundary)) {}

void MultipartForm::open_part(std::string_view name) {
    body_ += "--";
    body_ += boundary_;
    body_ += "\r\nContent-Disposition: form-data; name=\"";
    body_ += escape_quoted(name);
    body_ += "\"";
}

void MultipartForm::add_field(std::string_view name, std::string_view value) {
    open_part(name);
    body_ += "\r\n\r\n";
    body_ += value;
    body_ += "\r\n";
}

void MultipartForm::add_file(std::string_view name,
                             std::string_view filename,
                             ConstDataBlock data,
                             std::string_view content_type) {
    open_part(name);
    body_ += "; filename=\"";
    body_ += escape_quoted(filename);
    body_ += "\"\r\nContent-Type: ";
    body_ += content_type;
    body_ += "\r\n\r\n";
    body_ += util::as_string_view(data);
    body_ += "\r\n";
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartForm::build() const {
    std::string body;
    body.reserve(body_.size() + boundary_.size() + 6);
    body += body_;
    body += "--";
    body += boundary_;
    body += "--\r\n";
    return body;
}

} // namespace core::net
