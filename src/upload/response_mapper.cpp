/**
 * @file response_mapper.cpp
 * @brief Upload response and error body mapping
 */

#include "kcenon/video_uploader/upload/response_mapper.h"

#include "kcenon/video_uploader/core/api_utils.h"

namespace kcenon::video_uploader {

namespace {

using json_object = std::map<std::string, std::string>;

auto optional_bool(const json_object& object, const std::string& key) -> std::optional<bool> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    return api_utils::json_bool_value(it->second);
}

auto optional_time(const json_object& object, const std::string& key)
    -> std::optional<std::chrono::system_clock::time_point> {
    auto text = api_utils::json_member_string(object, key);
    if (!text) {
        return std::nullopt;
    }
    return api_utils::parse_iso8601_time(*text);
}

auto parse_tags(const json_object& object) -> std::vector<std::string> {
    std::vector<std::string> tags;
    auto it = object.find("tags");
    if (it == object.end()) {
        return tags;
    }
    auto elements = api_utils::json_array_elements(it->second);
    if (!elements) {
        return tags;
    }
    for (const auto& element : *elements) {
        if (auto tag = api_utils::json_string_value(element)) {
            tags.push_back(*tag);
        }
    }
    return tags;
}

auto parse_metadata(const json_object& object) -> std::vector<video_metadata_entry> {
    std::vector<video_metadata_entry> metadata;
    auto it = object.find("metadata");
    if (it == object.end()) {
        return metadata;
    }
    auto elements = api_utils::json_array_elements(it->second);
    if (!elements) {
        return metadata;
    }
    for (const auto& element : *elements) {
        auto entry = api_utils::parse_json_object(element);
        if (!entry) {
            continue;
        }
        video_metadata_entry e;
        e.key = api_utils::json_member_string(*entry, "key").value_or("");
        e.value = api_utils::json_member_string(*entry, "value").value_or("");
        metadata.push_back(std::move(e));
    }
    return metadata;
}

auto parse_source(const json_object& object) -> std::optional<video_source> {
    auto it = object.find("source");
    if (it == object.end()) {
        return std::nullopt;
    }
    auto source = api_utils::parse_json_object(it->second);
    if (!source) {
        return std::nullopt;
    }
    video_source s;
    s.type = api_utils::json_member_string(*source, "type").value_or("");
    s.uri = api_utils::json_member_string(*source, "uri").value_or("");
    return s;
}

auto parse_assets(const json_object& object) -> video_assets {
    video_assets assets;
    auto it = object.find("assets");
    if (it == object.end()) {
        return assets;
    }
    auto parsed = api_utils::parse_json_object(it->second);
    if (!parsed) {
        return assets;
    }
    assets.iframe = api_utils::json_member_string(*parsed, "iframe");
    assets.player = api_utils::json_member_string(*parsed, "player");
    assets.hls = api_utils::json_member_string(*parsed, "hls");
    assets.thumbnail = api_utils::json_member_string(*parsed, "thumbnail");
    assets.mp4 = api_utils::json_member_string(*parsed, "mp4");
    return assets;
}

}  // namespace

auto parse_upload_response(const std::string& body) -> result<video_upload_response> {
    auto object = api_utils::parse_json_object(body);
    if (!object) {
        return unexpected(error{error_code::invalid_response, "upload response is not a JSON object"});
    }

    auto video_id = api_utils::json_member_string(*object, "videoId");
    if (!video_id || video_id->empty()) {
        return unexpected(error{error_code::invalid_response, "upload response has no videoId"});
    }

    video_upload_response response;
    response.video_id = *video_id;
    response.title = api_utils::json_member_string(*object, "title");
    response.description = api_utils::json_member_string(*object, "description");
    response.is_public = optional_bool(*object, "public");
    response.panoramic = optional_bool(*object, "panoramic");
    response.mp4_support = optional_bool(*object, "mp4Support");
    response.published_at = optional_time(*object, "publishedAt");
    response.created_at = optional_time(*object, "createdAt");
    response.updated_at = optional_time(*object, "updatedAt");
    response.tags = parse_tags(*object);
    response.metadata = parse_metadata(*object);
    response.source = parse_source(*object);
    response.assets = parse_assets(*object);
    response.raw = body;

    return response;
}

auto parse_error_response(const http_response& response, error_code code) -> error {
    error err(code);
    err.http_status = response.status_code;
    err.raw_response = response.get_body_string();

    auto object = api_utils::parse_json_object(*err.raw_response);
    if (object) {
        for (const auto& [key, raw_value] : *object) {
            err.details[key] = api_utils::json_string_value(raw_value).value_or(raw_value);
        }
        err.details.try_emplace("status", std::to_string(response.status_code));
    } else {
        err.details["status"] = std::to_string(response.status_code);
        err.details["raw"] = *err.raw_response;
        err.details["reason"] = "UNKNOWN";
    }

    auto title = err.details.find("title");
    if (title != err.details.end() && !title->second.empty()) {
        err.message = title->second;
    } else {
        err.message = "HTTP " + std::to_string(response.status_code);
    }

    return err;
}

}  // namespace kcenon::video_uploader
