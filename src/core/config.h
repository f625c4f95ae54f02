#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  environment
// fallback (only for lookups that name an environment variable).
// Multi-value keys (e.g. -rpcurl=a -rpcurl=b) are accumulated into a
// vector accessible via get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    void parse_args(int argc, const char* const argv[]);

    /// Parse a configuration file. Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored. A leading
    /// "export " and surrounding quotes on the value are stripped so
    /// shell-style .env files load unchanged. Keys are matched
    /// case-sensitively. Returns false if the file cannot be opened.
    bool parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    /// Return the first value for @p key, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Return the first value for @p key, or @p default_val if absent.
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Look up @p key in the config sources, then @p env_name in the config
    /// sources (a loaded .env file), then the environment variable
    /// @p env_name. Empty values count as absent.
    [[nodiscard]] std::optional<std::string> get_with_env(
        std::string_view key, const std::string& env_name) const;

    /// Return the value for @p key parsed as int64, or @p default_val.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Return the value for @p key parsed as uint64, or @p default_val.
    [[nodiscard]] uint64_t get_uint(std::string_view key,
                                    uint64_t default_val = 0) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return all values associated with @p key (multi-value support).
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    /// Check whether @p key exists in any source.
    [[nodiscard]] bool has(std::string_view key) const;

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

/// Split a comma-separated list, trimming whitespace and dropping empty
/// items.
[[nodiscard]] std::vector<std::string> split_list(std::string_view value);

} // namespace core
