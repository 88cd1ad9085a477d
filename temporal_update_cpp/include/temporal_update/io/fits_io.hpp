#pragma once

#include "temporal_update/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace temporal_update::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_image_path(const fs::path& path);

// NAXIS1 is the column count. One-dimensional images read as a single row.
std::pair<Matrix2Dd, FitsHeader> read_fits_matrix(const fs::path& path);

// Single row or single column image, flattened.
VectorXd read_fits_vector(const fs::path& path);

void write_fits_matrix(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header);

// Written as a 1 x n image.
void write_fits_vector(const fs::path& path, const VectorXd& data, const FitsHeader& header);

} // namespace temporal_update::io
