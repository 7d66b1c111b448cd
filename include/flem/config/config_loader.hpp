#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a key = value file.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * File format, one setting per line, '#' starts a comment:
 *   name            = pump controller
 *   version         = 1.4.0
 *   max_packet_size = 100
 *   id_ascii        = true
 *   verbose         = false
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "flem/compat/expected.hpp"
#include "flem/config/constants.hpp"

namespace flem::config {

    /** @struct EndpointConfig
     *  @brief Identity and behaviour of one endpoint.
     */
    struct EndpointConfig {
        std::string   name{constants::DEFAULT_ID_NAME};  ///< Descriptor name (<= ID_NAME_SIZE bytes)
        std::uint8_t  version_major{0};
        std::uint8_t  version_minor{0};
        std::uint8_t  version_patch{0};
        std::uint16_t max_packet_size{0};                ///< 0 = use the packet capacity
        bool          id_ascii{constants::DEFAULT_ID_ASCII}; ///< Text-form descriptor on ID replies
        bool          verbose{false};                    ///< Attach the printf observer
    };

    /** @struct ConfigError
     *  @brief Why a config file was rejected.
     */
    struct ConfigError {
        enum class Code : std::uint8_t { FileNotFound = 1, SyntaxError, UnknownKey, BadValue };
        Code        code{Code::FileNotFound};
        std::size_t line{0};   ///< 1-based; 0 when not tied to a line
        std::string key;
    };

    std::string_view to_string(ConfigError::Code c) noexcept;

    /** @class Loader
     *  @brief Source of endpoint configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// @return Configuration built from named defaults only.
        static EndpointConfig defaults();

        /**
         * @brief Load configuration from a path; an empty path yields defaults.
         * @return EndpointConfig, or the first error encountered.
         */
        static flem_detail::expected<EndpointConfig, ConfigError> load_from_file(const std::string& path);

        /// @brief Parse configuration text (same grammar as files).
        static flem_detail::expected<EndpointConfig, ConfigError> parse(std::string_view text);
    };

} // namespace flem::config
