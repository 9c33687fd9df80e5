#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace gauge_adjust::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Math utilities
double median_of(std::vector<double>& v);
double compute_median(const VectorXd& data);

// Exact (bitwise value) equality of two point sets
bool coordinates_equal(const Coordinates& a, const Coordinates& b);

// Rows of `coords` selected by `ix`, in order
Coordinates select_rows(const Coordinates& coords, const IndexSet& ix);
VectorXd select(const VectorXd& values, const IndexSet& ix);

} // namespace gauge_adjust::core
