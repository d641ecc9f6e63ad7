#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

void download_file(const std::string& url, const fs::path& output_path, bool show_progress = true);
void download_with_retries(const std::string& url, const fs::path& output_path, int max_retries = 3, bool show_progress = true);
