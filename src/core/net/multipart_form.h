#pragma once

#include "util/data_block.h"
#include <string>
#include <string_view>

namespace core::net {

// multipart/form-data body (RFC 7578), built part by part.
class MultipartForm {
  public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_field(std::string_view name, std::string_view value);
    void add_file(std::string_view name,
                  std::string_view filename,
                  ConstDataBlock data,
                  std::string_view content_type = "application/octet-stream");

    const std::string& boundary() const { return boundary_; }
    std::string content_type() const;

    // Returns the body terminated by the closing delimiter. The form stays usable.
    std::string build() const;

  private:
    void open_part(std::string_view name);

    std::string boundary_;
    std::string body_;
};

} // namespace core::net
