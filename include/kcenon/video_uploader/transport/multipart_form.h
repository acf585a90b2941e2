/**
 * @file multipart_form.h
 * @brief multipart/form-data body builder
 */

#ifndef KCENON_VIDEO_UPLOADER_TRANSPORT_MULTIPART_FORM_H
#define KCENON_VIDEO_UPLOADER_TRANSPORT_MULTIPART_FORM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Builds a multipart/form-data request body
 *
 * @code
 * multipart_form form;
 * form.add_field("videoId", "vi123");
 * form.add_file("file", "clip.mp4", chunk_bytes);
 * request.headers["Content-Type"] = form.content_type();
 * request.body = form.build();
 * @endcode
 */
class multipart_form {
public:
    /**
     * @brief Create a form with a random boundary
     */
    multipart_form();

    /**
     * @brief Create a form with a fixed boundary
     */
    explicit multipart_form(std::string boundary);

    void add_field(const std::string& name, const std::string& value);

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::vector<std::byte>& data,
                  const std::string& content_type = "application/octet-stream");

    [[nodiscard]] auto content_type() const -> std::string;

    [[nodiscard]] auto boundary() const -> const std::string&;

    /**
     * @brief Serialize all parts followed by the closing boundary
     */
    [[nodiscard]] auto build() const -> std::vector<uint8_t>;

private:
    struct part {
        std::string name;
        std::string filename;
        std::string content_type;
        std::vector<uint8_t> data;
        bool is_file = false;
    };

    std::string boundary_;
    std::vector<part> parts_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_TRANSPORT_MULTIPART_FORM_H
