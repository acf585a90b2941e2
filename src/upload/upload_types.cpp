/**
 * @file upload_types.cpp
 * @brief Validation helpers for upload types
 */

#include "kcenon/video_uploader/upload/upload_types.h"

#include <regex>

namespace kcenon::video_uploader {

auto origin_info::validate(const std::string& label) const -> result<void> {
    static const std::regex name_pattern(R"(^[\w-]{1,50}$)");
    static const std::regex version_pattern(R"(^\d{1,3}(\.\d{1,3}(\.\d{1,3})?)?$)");

    if (name.empty()) {
        return unexpected(error{error_code::invalid_origin,
            label + " name is required"});
    }
    if (!std::regex_match(name, name_pattern)) {
        return unexpected(error{error_code::invalid_origin,
            "Invalid " + label + " name value. Allowed characters: A-Z, a-z, 0-9, '-', '_'. "
            "Max length: 50."});
    }
    if (version.empty()) {
        return unexpected(error{error_code::invalid_origin,
            label + " version is required"});
    }
    if (!std::regex_match(version, version_pattern)) {
        return unexpected(error{error_code::invalid_origin,
            "Invalid " + label + " version value. The version should match the xxx[.yyy][.zzz] "
            "pattern."});
    }
    return {};
}

}  // namespace kcenon::video_uploader
