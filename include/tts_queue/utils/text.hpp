#pragma once

#include <cstddef>
#include <string>

namespace tts_queue::utils {

std::string trim(std::string value);

// Number of UTF-8 code points; invalid bytes count as one each.
std::size_t utf8_length(const std::string& text);

// First max_chars code points of text followed by "...", or text unchanged
// when it is not longer than max_chars.
std::string preview(const std::string& text, std::size_t max_chars);

}
