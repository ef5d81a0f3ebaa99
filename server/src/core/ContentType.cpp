#include "core/ContentType.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

static const std::unordered_map<std::string, std::string>& mimeTable() {
    static const std::unordered_map<std::string, std::string> table = {
        // text
        {"txt",  "text/plain"},
        {"html", "text/html"},
        {"htm",  "text/html"},
        {"css",  "text/css"},
        {"csv",  "text/csv"},
        {"md",   "text/markdown"},
        {"xml",  "application/xml"},
        {"js",   "application/javascript"},
        {"json", "application/json"},
        // images
        {"png",  "image/png"},
        {"jpg",  "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif",  "image/gif"},
        {"bmp",  "image/bmp"},
        {"webp", "image/webp"},
        {"svg",  "image/svg+xml"},
        {"ico",  "image/vnd.microsoft.icon"},
        {"tif",  "image/tiff"},
        {"tiff", "image/tiff"},
        // audio / video
        {"mp3",  "audio/mpeg"},
        {"wav",  "audio/wav"},
        {"ogg",  "audio/ogg"},
        {"mp4",  "video/mp4"},
        {"webm", "video/webm"},
        {"avi",  "video/x-msvideo"},
        // documents
        {"pdf",  "application/pdf"},
        {"doc",  "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls",  "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt",  "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"rtf",  "application/rtf"},
        {"epub", "application/epub+zip"},
        // archives
        {"zip",  "application/zip"},
        {"gz",   "application/gzip"},
        {"tar",  "application/x-tar"},
        {"rar",  "application/vnd.rar"},
        {"7z",   "application/x-7z-compressed"},
        {"bz2",  "application/x-bzip2"},
        // fonts
        {"ttf",  "font/ttf"},
        {"otf",  "font/otf"},
        {"woff", "font/woff"},
        {"woff2","font/woff2"},
        {"bin",  "application/octet-stream"},
    };
    return table;
}

std::string mimeTypeForExtension(const std::string& ext) {
    std::string key = ext;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    auto it = mimeTable().find(key);
    return (it != mimeTable().end()) ? it->second : "";
}

std::string baseNameOf(const std::string& path) {
    auto slash = path.find_last_of('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::string extensionOf(const std::string& path) {
    std::string name = baseNameOf(path);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    return name.substr(dot + 1);
}
