#include "utils.hpp"
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t length){
    std::ostringstream oss;
    for(std::size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string format_size(uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(idx + 1 < unit_count && value >= 1024.0) {
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    if(idx == 0) {
        oss << bytes << " " << units[0];
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << units[idx];
    }
    return oss.str();
}

std::string format_duration(std::chrono::steady_clock::duration elapsed){
    auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    if(total < 0) total = 0;
    std::ostringstream oss;
    oss << (total / 3600) << "h " << ((total % 3600) / 60) << "m " << (total % 60) << "s";
    return oss.str();
}

std::optional<std::filesystem::path> safe_relative_path(const std::string& entry_name){
    if(entry_name.empty()) return std::nullopt;
    std::filesystem::path raw(entry_name);
    if(raw.is_absolute() || raw.has_root_name() || raw.has_root_directory()) return std::nullopt;

    std::filesystem::path clean;
    for(const auto& part : raw) {
        if(part == "..") return std::nullopt;
        if(part.empty() || part == ".") continue;
        clean /= part;
    }
    if(clean.empty()) return std::nullopt;
    return clean;
}
