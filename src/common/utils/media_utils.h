// common/utils/media_utils.h
#ifndef COMFYFLOW_COMMON_UTILS_MEDIA_UTILS_H
#define COMFYFLOW_COMMON_UTILS_MEDIA_UTILS_H

#include "core/types/job.h"
#include <string>
#include <utility>
#include <vector>

namespace comfyflow {

// Extension -> MIME per media kind; unknown -> application/octet-stream
std::string guess_mime_type(const std::string& filename, MediaKind kind);

// Content type for an uploaded input image (jpeg/webp, otherwise png)
std::string upload_content_type(const std::string& filename);

// Percent-encode one query component (RFC 3986 unreserved characters kept)
std::string url_encode(const std::string& value);

// "a=1&b=2", every key and value percent-encoded
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace comfyflow

#endif // COMFYFLOW_COMMON_UTILS_MEDIA_UTILS_H
