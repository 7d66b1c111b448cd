#pragma once
/**
 * @file data_id.hpp
 * @brief Capability descriptor exchanged on the reserved ID request.
 *
 * Carries the peer's name, a version triple and the largest payload it can
 * accept. Two serializations exist:
 *  - text form: explicit byte order and widths (major, minor, patch,
 *    max size LE, 25 name bytes). Portable; use this between unlike peers.
 *  - memory image: the native Record as laid out by this compiler,
 *    padding included. Only meaningful between peers sharing an ABI.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "flem/compat/expected.hpp"
#include "flem/config/constants.hpp"

namespace flem::proto {

/// @brief Reasons a descriptor cannot be built or parsed.
enum class IdError : std::uint8_t {
    NameTooLong = 1,  ///< Name does not fit the fixed field
    InputTooShort     ///< Fewer bytes than the layout requires
};

std::string_view to_string(IdError e) noexcept;

class DataId final {
public:
    using Name = std::array<char, config::constants::ID_NAME_SIZE>;

    /// @brief Native record; its in-memory image is the binary encoding.
    struct Record {
        std::uint8_t  ver_major{0};
        std::uint8_t  ver_minor{0};
        std::uint8_t  ver_patch{0};
        std::uint16_t max_packet_size{0};
        Name          name{};
    };

    static constexpr std::size_t kTextSize  = config::constants::ID_TEXT_SIZE;
    static constexpr std::size_t kImageSize = sizeof(Record);

    using TextBytes  = std::array<std::uint8_t, kTextSize>;
    using ImageBytes = std::array<std::uint8_t, kImageSize>;

    /**
     * @brief Build from fields.
     * @param name At most ID_NAME_SIZE bytes; shorter names are null-padded.
     * @return IdError::NameTooLong instead of truncating.
     */
    static flem_detail::expected<DataId, IdError>
    make(std::string_view name, std::uint8_t ver_major, std::uint8_t ver_minor,
         std::uint8_t ver_patch, std::uint16_t max_packet_size) noexcept;

    /// @brief Parse the text form. Any byte values are accepted.
    static flem_detail::expected<DataId, IdError>
    from_bytes(std::span<const std::uint8_t> bytes) noexcept;

    /// @brief Parse a memory image produced by memory_image() on this ABI.
    static flem_detail::expected<DataId, IdError>
    from_image(std::span<const std::uint8_t> bytes) noexcept;

    TextBytes  encode_text() const noexcept;
    ImageBytes memory_image() const noexcept;

    std::uint8_t  version_major()   const noexcept { return rec_.ver_major; }
    std::uint8_t  version_minor()   const noexcept { return rec_.ver_minor; }
    std::uint8_t  version_patch()   const noexcept { return rec_.ver_patch; }
    std::uint16_t max_packet_size() const noexcept { return rec_.max_packet_size; }

    /// Raw fixed-width field, padding included.
    const Name& name() const noexcept { return rec_.name; }

    /// Name up to the first NUL (or the full field when it is not terminated).
    std::string_view name_view() const noexcept;

    bool operator==(const DataId& o) const noexcept {
        return rec_.ver_major == o.rec_.ver_major && rec_.ver_minor == o.rec_.ver_minor &&
               rec_.ver_patch == o.rec_.ver_patch &&
               rec_.max_packet_size == o.rec_.max_packet_size && rec_.name == o.rec_.name;
    }

private:
    explicit DataId(const Record& r) noexcept : rec_(r) {}

    Record rec_{};
};

} // namespace flem::proto
