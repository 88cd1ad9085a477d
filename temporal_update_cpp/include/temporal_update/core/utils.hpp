#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace temporal_update::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
// ||previous - current||_F / ||current||_F; 0 when both are zero.
double relative_frobenius_change(const Matrix2Dd& previous, const Matrix2Dd& current);

// String utilities
std::string to_lower(const std::string& s);

} // namespace temporal_update::core
