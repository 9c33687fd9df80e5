#include "gauge_adjust/core/utils.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace gauge_adjust::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

double median_of(std::vector<double>& v) {
    if (v.empty()) return kNoValue;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    const double lo = v[mid - 1];
    return 0.5 * (lo + hi);
}

double compute_median(const VectorXd& data) {
    if (data.size() == 0) return kNoValue;
    // NaN poisons the median the same way it poisons the mean
    if (data.hasNaN()) return kNoValue;

    std::vector<double> values(data.data(), data.data() + data.size());
    return median_of(values);
}

bool coordinates_equal(const Coordinates& a, const Coordinates& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) return false;
    return (a.array() == b.array()).all();
}

Coordinates select_rows(const Coordinates& coords, const IndexSet& ix) {
    Coordinates out(static_cast<Eigen::Index>(ix.size()), coords.cols());
    for (size_t i = 0; i < ix.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = coords.row(ix[i]);
    }
    return out;
}

VectorXd select(const VectorXd& values, const IndexSet& ix) {
    VectorXd out(static_cast<Eigen::Index>(ix.size()));
    for (size_t i = 0; i < ix.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = values(ix[i]);
    }
    return out;
}

} // namespace gauge_adjust::core
