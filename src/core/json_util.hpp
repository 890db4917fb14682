#pragma once

#include <optional>
#include <string>
#include <string_view>

// Minimal JSON helpers for the flat, known-shape documents cutline writes
// (timeline config). Not a general parser.
namespace cutline::json
{

// Returns the text of the object value stored under `key`, braces included.
std::optional<std::string> read_object(const std::string& json, std::string_view key);

std::optional<double> read_number(const std::string& json, std::string_view key);
std::optional<bool>   read_bool(const std::string& json, std::string_view key);

// Formats a double so that it reads back exactly.
std::string number(double v);

}   // namespace cutline::json
