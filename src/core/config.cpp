#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>

namespace core {

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------
namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

/// Strip leading dashes from an argument key (one or two).
std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

/// Remove one pair of matching single or double quotes.
std::string_view strip_quotes(std::string_view sv) {
    if (sv.size() >= 2 &&
        ((sv.front() == '"' && sv.back() == '"') ||
         (sv.front() == '\'' && sv.back() == '\''))) {
        return sv.substr(1, sv.size() - 2);
    }
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool parse_bool(std::string_view sv, bool default_val) {
    if (sv.empty()) return default_val;
    if (iequals(sv, "1") || iequals(sv, "true") ||
        iequals(sv, "yes") || iequals(sv, "on")) {
        return true;
    }
    if (iequals(sv, "0") || iequals(sv, "false") ||
        iequals(sv, "no") || iequals(sv, "off")) {
        return false;
    }
    return default_val;
}

template <typename Int>
bool parse_whole(const std::string& s, Int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- internal helpers
// ---------------------------------------------------------------------------

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    target[std::string{key}].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};

    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, const char* const argv[]) {
    // argv[0] is the program name -- skip it.
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(LogCategory::CONFIG,
                     "ignoring positional argument '" +
                     std::string{arg} + "'");
            continue;
        }

        std::string_view stripped = strip_dashes(arg);

        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            std::string_view key = stripped.substr(0, eq_pos);
            std::string_view val = stripped.substr(eq_pos + 1);
            insert(cli_values_, trim(key), std::string{trim(val)});
        } else {
            insert(cli_values_, trim(stripped), "1");
        }
    }
}

bool Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return false;
    }

    LOG_INFO(LogCategory::CONFIG,
             "loading configuration from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});

        if (sv.empty() || sv.front() == '#') continue;
        if (sv.starts_with("export ")) sv = trim(sv.substr(7));

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            // Bare words are boolean flags, same as on the command line.
            insert(file_values_, sv, "1");
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        std::string_view val = strip_quotes(trim(sv.substr(eq_pos + 1)));

        if (key.empty()) {
            LOG_ERROR(LogCategory::CONFIG,
                      "empty key on line " + std::to_string(line_num) +
                      " of '" + path.string() + "'");
            continue;
        }

        insert(file_values_, key, std::string{val});
    }
    return true;
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    // Programmatic set goes into file_values_ (lower priority than CLI).
    file_values_[std::string{key}] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    return vals->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

std::optional<std::string> Config::get_with_env(
    std::string_view key, const std::string& env_name) const {
    auto val = get(key);
    if (val.has_value() && !val->empty()) return val;

    val = get(env_name);
    if (val.has_value() && !val->empty()) return val;

    const char* env = std::getenv(env_name.c_str());
    if (env != nullptr && env[0] != '\0') return std::string{env};
    return std::nullopt;
}

int64_t Config::get_int(std::string_view key, int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    int64_t result = 0;
    if (!parse_whole(*val, result)) {
        LOG_ERROR(LogCategory::CONFIG,
                  "cannot parse '" + *val + "' as integer for key '" +
                  std::string{key} + "'");
        return default_val;
    }
    return result;
}

uint64_t Config::get_uint(std::string_view key, uint64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    uint64_t result = 0;
    if (!parse_whole(*val, result)) {
        LOG_ERROR(LogCategory::CONFIG,
                  "cannot parse '" + *val +
                  "' as unsigned integer for key '" +
                  std::string{key} + "'");
        return default_val;
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val, default_val);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    // CLI values first, then file values.
    std::string k{key};
    std::vector<std::string> result;

    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> out;
    while (!value.empty()) {
        auto comma = value.find(',');
        std::string_view item = trim(value.substr(0, comma));
        if (!item.empty()) out.emplace_back(item);
        if (comma == std::string_view::npos) break;
        value.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace core
