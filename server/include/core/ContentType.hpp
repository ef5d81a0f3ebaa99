#pragma once
#include <string>

// MIME type for an extension given without its leading dot ("pdf", "PNG").
// Returns "" for extensions not in the table.
std::string mimeTypeForExtension(const std::string& ext);

// Extension of the last path component, without the dot. "" when there is none
// or when the only dot starts the name (".bashrc").
std::string extensionOf(const std::string& path);

// Last path component ("./files/report.pdf" -> "report.pdf").
std::string baseNameOf(const std::string& path);
