#pragma once
#include <string>

// Strict UTF-8 check: rejects overlongs, surrogates and code points above U+10FFFF.
bool isValidUtf8(const std::string& bytes);
