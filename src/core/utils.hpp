#pragma once

#include <string>

// Standard base64 with '=' padding
std::string base64_encode(const std::string& input);

// Decode base64, skipping whitespace. Returns false on a character outside
// the alphabet; stops quietly at '=' padding.
bool base64_decode(const std::string& input, std::string& out);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
