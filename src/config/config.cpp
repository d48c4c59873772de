#include <linkguard/config/config.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace linkguard::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

linkguard::Status Missing(std::string_view key) {
    return linkguard::Status(linkguard::StatusCode::not_found, "missing key: " + std::string(key));
}

linkguard::Status Invalid(std::string_view key, std::string_view what) {
    return linkguard::Status(linkguard::StatusCode::invalid_argument, std::string(key) + ": " + std::string(what));
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Whole-string decimal, no sign, no exponent.
bool ParseDecimal(std::string_view s, double& out) {
    if (s.empty()) {
        return false;
    }
    bool digits = false;
    bool dot = false;
    for (char ch : s) {
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            digits = true;
        } else if (ch == '.' && !dot) {
            dot = true;
        } else {
            return false;
        }
    }
    if (!digits) {
        return false;
    }
    out = std::strtod(std::string(s).c_str(), nullptr);
    return true;
}

} // namespace

linkguard::Result<std::chrono::milliseconds> ParseDuration(std::string_view text) {
    auto s = Trim(text);
    if (s.empty()) {
        return linkguard::Status(linkguard::StatusCode::invalid_argument, "empty duration");
    }

    double bare = 0;
    if (ParseDecimal(s, bare)) {
        return std::chrono::milliseconds(static_cast<long long>(std::llround(bare)));
    }

    // sequence of <number><unit>, e.g. "1m30s"
    double total_ms = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t num_end = i;
        while (num_end < s.size() && (std::isdigit(static_cast<unsigned char>(s[num_end])) || s[num_end] == '.')) {
            ++num_end;
        }
        double value = 0;
        if (!ParseDecimal(s.substr(i, num_end - i), value)) {
            return linkguard::Status(linkguard::StatusCode::invalid_argument, "invalid duration: " + std::string(text));
        }

        std::size_t unit_end = num_end;
        while (unit_end < s.size() && std::isalpha(static_cast<unsigned char>(s[unit_end]))) {
            ++unit_end;
        }
        auto unit = s.substr(num_end, unit_end - num_end);

        double scale = 0;
        if (unit == "ms") {
            scale = 1;
        } else if (unit == "s") {
            scale = 1000;
        } else if (unit == "m") {
            scale = 60 * 1000;
        } else if (unit == "h") {
            scale = 60 * 60 * 1000;
        } else {
            return linkguard::Status(linkguard::StatusCode::invalid_argument,
                "invalid duration unit '" + std::string(unit) + "' in " + std::string(text));
        }
        total_ms += value * scale;
        i = unit_end;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(total_ms)));
}

std::vector<std::string> SplitList(std::string_view text) {
    std::vector<std::string> out;
    while (true) {
        auto comma = text.find(',');
        auto item = Trim(text.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return out;
}

linkguard::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return linkguard::Status(linkguard::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

linkguard::Result<Config> Config::Parse(std::string text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return linkguard::Status(linkguard::StatusCode::invalid_argument, FormatParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return linkguard::Status(linkguard::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

linkguard::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return Missing(key);
    }
    if (!v->is_string()) {
        return Invalid(key, "not a string");
    }
    return std::string(v->as_string_view());
}

linkguard::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return Missing(key);
    }
    if (!v->is_number() || !v->is_int()) {
        return Invalid(key, "not an int");
    }
    return static_cast<int>(v->as_int());
}

linkguard::Result<std::chrono::milliseconds> Config::GetDuration(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return Missing(key);
    }
    if (v->is_number() && v->is_int()) {
        return std::chrono::milliseconds(static_cast<long long>(v->as_int()));
    }
    if (!v->is_string()) {
        return Invalid(key, "not a duration");
    }
    auto d = ParseDuration(v->as_string_view());
    if (!d.ok()) {
        return Invalid(key, d.status().message());
    }
    return d.value();
}

linkguard::Result<double> Config::GetDouble(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return Missing(key);
    }
    if (v->is_number()) {
        if (v->is_int()) {
            return static_cast<double>(v->as_int());
        }
        return v->as_double();
    }
    double out = 0;
    if (!v->is_string() || !ParseDecimal(Trim(v->as_string_view()), out)) {
        return Invalid(key, "not a number or a decimal string");
    }
    return out;
}

linkguard::Result<std::vector<std::string>> Config::GetStringList(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return Missing(key);
    }
    if (!v->is_string()) {
        return Invalid(key, "not a comma-separated string");
    }
    return SplitList(v->as_string_view());
}

} // namespace linkguard::config
