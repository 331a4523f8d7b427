// common/utils/media_utils.cpp
#include "common/utils/media_utils.h"
#include "core/types/graph.h"
#include <curl/curl.h>
#include <array>
#include <stdexcept>

namespace comfyflow {

namespace {

struct MimeEntry {
    const char* extension;
    const char* mime;
};

constexpr std::array<MimeEntry, 7> kImageMimes{{
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".webp", "image/webp"},
    {".bmp", "image/bmp"},
    {".tiff", "image/tiff"},
    {".tif", "image/tiff"},
}};

constexpr std::array<MimeEntry, 6> kVideoMimes{{
    {".mp4", "video/mp4"},
    {".m4v", "video/mp4"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
    {".mkv", "video/x-matroska"},
    {".gif", "image/gif"},
}};

constexpr std::array<MimeEntry, 7> kAudioMimes{{
    {".flac", "audio/flac"},
    {".wav", "audio/wav"},
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/aac"},
    {".aac", "audio/aac"},
    {".ogg", "audio/ogg"},
    {".oga", "audio/ogg"},
}};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <size_t N>
std::string lookup(const std::array<MimeEntry, N>& table, const std::string& lower_name) {
    for (const auto& entry : table) {
        if (ends_with(lower_name, entry.extension)) return entry.mime;
    }
    return "application/octet-stream";
}

} // namespace

std::string guess_mime_type(const std::string& filename, MediaKind kind) {
    const std::string lower = to_lower_copy(filename);
    switch (kind) {
        case MediaKind::IMAGE: return lookup(kImageMimes, lower);
        case MediaKind::VIDEO: return lookup(kVideoMimes, lower);
        case MediaKind::AUDIO: return lookup(kAudioMimes, lower);
    }
    return "application/octet-stream";
}

std::string upload_content_type(const std::string& filename) {
    const std::string lower = to_lower_copy(filename);
    if (ends_with(lower, ".jpg") || ends_with(lower, ".jpeg")) return "image/jpeg";
    if (ends_with(lower, ".webp")) return "image/webp";
    return "image/png";
}

std::string url_encode(const std::string& value) {
    if (value.empty()) return {};
    // handle argument is ignored by libcurl >= 7.82
    char* escaped = curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("curl_easy_escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += url_encode(key) + "=" + url_encode(value);
    }
    return query;
}

} // namespace comfyflow
