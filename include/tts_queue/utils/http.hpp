#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tts_queue::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string url_encode(const std::string& value);

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

}
