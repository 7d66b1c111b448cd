/**
* @file config_loader.cpp
 * @brief Defaults plus a small key = value parser.
 */
#include "flem/config/config_loader.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace flem::config {
    using namespace flem::config::constants;

    namespace {

    std::string_view trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    template <class Int>
    bool parse_uint(std::string_view s, Int& out) {
        unsigned long v = 0;
        const auto* end = s.data() + s.size();
        const auto [ptr, ec] = std::from_chars(s.data(), end, v);
        if (ec != std::errc{} || ptr != end || v > std::numeric_limits<Int>::max()) return false;
        out = static_cast<Int>(v);
        return true;
    }

    bool parse_bool(std::string_view s, bool& out) {
        if (s == "true" || s == "1" || s == "yes")  { out = true;  return true; }
        if (s == "false" || s == "0" || s == "no")  { out = false; return true; }
        return false;
    }

    // "major.minor.patch"
    bool parse_version(std::string_view s, EndpointConfig& cfg) {
        const auto d1 = s.find('.');
        if (d1 == std::string_view::npos) return false;
        const auto d2 = s.find('.', d1 + 1);
        if (d2 == std::string_view::npos) return false;
        return parse_uint(s.substr(0, d1), cfg.version_major) &&
               parse_uint(s.substr(d1 + 1, d2 - d1 - 1), cfg.version_minor) &&
               parse_uint(s.substr(d2 + 1), cfg.version_patch);
    }

    ConfigError make_error(ConfigError::Code code, std::size_t line, std::string_view key) {
        return ConfigError{code, line, std::string(key)};
    }

    } // namespace

    std::string_view to_string(ConfigError::Code c) noexcept {
        switch (c) {
            case ConfigError::Code::FileNotFound: return "file_not_found";
            case ConfigError::Code::SyntaxError:  return "syntax_error";
            case ConfigError::Code::UnknownKey:   return "unknown_key";
            case ConfigError::Code::BadValue:     return "bad_value";
        }
        return "unknown";
    }

    EndpointConfig Loader::defaults() {
        return EndpointConfig{}; // picks defaults from constants
    }

    flem_detail::expected<EndpointConfig, ConfigError> Loader::parse(std::string_view text) {
        EndpointConfig cfg = defaults();
        std::size_t line_no = 0;

        while (!text.empty()) {
            const auto nl = text.find('\n');
            std::string_view line = text.substr(0, nl);
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
            ++line_no;

            if (const auto hash = line.find('#'); hash != std::string_view::npos) {
                line = line.substr(0, hash);
            }
            line = trim(line);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string_view::npos) {
                return flem_detail::unexpected(make_error(ConfigError::Code::SyntaxError, line_no, line));
            }
            const auto key   = trim(line.substr(0, eq));
            const auto value = trim(line.substr(eq + 1));

            bool ok = true;
            if (key == "name") {
                ok = value.size() <= ID_NAME_SIZE;
                if (ok) cfg.name = std::string(value);
            } else if (key == "version") {
                ok = parse_version(value, cfg);
            } else if (key == "max_packet_size") {
                ok = parse_uint(value, cfg.max_packet_size);
            } else if (key == "id_ascii") {
                ok = parse_bool(value, cfg.id_ascii);
            } else if (key == "verbose") {
                ok = parse_bool(value, cfg.verbose);
            } else {
                return flem_detail::unexpected(make_error(ConfigError::Code::UnknownKey, line_no, key));
            }
            if (!ok) {
                return flem_detail::unexpected(make_error(ConfigError::Code::BadValue, line_no, key));
            }
        }
        return cfg;
    }

    flem_detail::expected<EndpointConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return defaults();
        std::ifstream in(path);
        if (!in) {
            return flem_detail::unexpected(make_error(ConfigError::Code::FileNotFound, 0, path));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse(ss.str());
    }

} // namespace flem::config
