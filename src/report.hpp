#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "comparison_session.hpp"
#include "log.hpp"

// Prints the duplicate/extracted listing and summary through the print channel.
void render_report(const ComparisonResult& result, Logger* logger = nullptr);

nlohmann::json report_to_json(const ComparisonResult& result);

// Returns false (after logging why) when the file cannot be written.
bool write_json_report(const ComparisonResult& result,
                       const std::filesystem::path& path,
                       Logger* logger = nullptr);
