#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <linkguard/core/status.h>

#include <chjson/chjson.hpp>

namespace linkguard::config {

// "250ms", "5s", "1m", "1h", "1.5s"; a bare number is milliseconds.
linkguard::Result<std::chrono::milliseconds> ParseDuration(std::string_view text);

// Comma-separated, entries trimmed, empty entries dropped.
std::vector<std::string> SplitList(std::string_view text);

// Read-only view over a JSON object file. Getters return not_found for a missing key and
// invalid_argument, naming the key, for a value of the wrong shape.
class Config {
public:
    static linkguard::Result<Config> LoadFile(std::string path);
    static linkguard::Result<Config> Parse(std::string text);

    bool Has(std::string_view key) const;

    linkguard::Result<std::string> GetString(std::string_view key) const;
    linkguard::Result<int> GetInt(std::string_view key) const;
    // a number (ms) or a duration string
    linkguard::Result<std::chrono::milliseconds> GetDuration(std::string_view key) const;
    // a number or a numeric string
    linkguard::Result<double> GetDouble(std::string_view key) const;
    // a comma-separated string
    linkguard::Result<std::vector<std::string>> GetStringList(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

} // namespace linkguard::config
