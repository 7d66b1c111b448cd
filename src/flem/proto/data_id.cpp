/**
 * @file data_id.cpp
 * @brief DataId factories and the two descriptor encodings.
 */
#include "flem/proto/data_id.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace flem::proto {

namespace {

using flem::config::constants::ID_NAME_SIZE;

// Text layout offsets.
constexpr std::size_t kTxtMajor = 0;
constexpr std::size_t kTxtMinor = 1;
constexpr std::size_t kTxtPatch = 2;
constexpr std::size_t kTxtSize  = 3;
constexpr std::size_t kTxtName  = 5;

static_assert(kTxtName + ID_NAME_SIZE == DataId::kTextSize, "text layout mismatch");

// Copy one Record member into/out of an image at its native offset. Padding
// bytes are never read, so the image is deterministic.
template <class Field>
void put_field(std::uint8_t* image, std::size_t offset, const Field& f) noexcept {
    std::memcpy(image + offset, &f, sizeof(Field));
}

template <class Field>
void get_field(const std::uint8_t* image, std::size_t offset, Field& f) noexcept {
    std::memcpy(&f, image + offset, sizeof(Field));
}

} // namespace

std::string_view to_string(IdError e) noexcept {
    switch (e) {
        case IdError::NameTooLong:   return "name_too_long";
        case IdError::InputTooShort: return "input_too_short";
    }
    return "unknown";
}

flem_detail::expected<DataId, IdError>
DataId::make(std::string_view name, std::uint8_t ver_major, std::uint8_t ver_minor,
             std::uint8_t ver_patch, std::uint16_t max_packet_size) noexcept {
    if (name.size() > ID_NAME_SIZE) {
        return flem_detail::unexpected(IdError::NameTooLong);
    }
    Record r;
    r.ver_major = ver_major;
    r.ver_minor = ver_minor;
    r.ver_patch = ver_patch;
    r.max_packet_size = max_packet_size;
    std::copy(name.begin(), name.end(), r.name.begin());
    return DataId{r};
}

flem_detail::expected<DataId, IdError>
DataId::from_bytes(std::span<const std::uint8_t> bytes) noexcept {
    if (bytes.size() < kTextSize) {
        return flem_detail::unexpected(IdError::InputTooShort);
    }
    Record r;
    r.ver_major = bytes[kTxtMajor];
    r.ver_minor = bytes[kTxtMinor];
    r.ver_patch = bytes[kTxtPatch];
    r.max_packet_size = static_cast<std::uint16_t>(bytes[kTxtSize] | (bytes[kTxtSize + 1] << 8));
    for (std::size_t i = 0; i < ID_NAME_SIZE; ++i) {
        r.name[i] = static_cast<char>(bytes[kTxtName + i]);
    }
    return DataId{r};
}

flem_detail::expected<DataId, IdError>
DataId::from_image(std::span<const std::uint8_t> bytes) noexcept {
    if (bytes.size() < kImageSize) {
        return flem_detail::unexpected(IdError::InputTooShort);
    }
    Record r;
    const std::uint8_t* p = bytes.data();
    get_field(p, offsetof(Record, ver_major), r.ver_major);
    get_field(p, offsetof(Record, ver_minor), r.ver_minor);
    get_field(p, offsetof(Record, ver_patch), r.ver_patch);
    get_field(p, offsetof(Record, max_packet_size), r.max_packet_size);
    get_field(p, offsetof(Record, name), r.name);
    return DataId{r};
}

DataId::TextBytes DataId::encode_text() const noexcept {
    TextBytes out{};
    out[kTxtMajor] = rec_.ver_major;
    out[kTxtMinor] = rec_.ver_minor;
    out[kTxtPatch] = rec_.ver_patch;
    out[kTxtSize]     = static_cast<std::uint8_t>(rec_.max_packet_size & 0xFF);
    out[kTxtSize + 1] = static_cast<std::uint8_t>(rec_.max_packet_size >> 8);
    for (std::size_t i = 0; i < ID_NAME_SIZE; ++i) {
        out[kTxtName + i] = static_cast<std::uint8_t>(rec_.name[i]);
    }
    return out;
}

DataId::ImageBytes DataId::memory_image() const noexcept {
    ImageBytes out{};
    std::uint8_t* p = out.data();
    put_field(p, offsetof(Record, ver_major), rec_.ver_major);
    put_field(p, offsetof(Record, ver_minor), rec_.ver_minor);
    put_field(p, offsetof(Record, ver_patch), rec_.ver_patch);
    put_field(p, offsetof(Record, max_packet_size), rec_.max_packet_size);
    put_field(p, offsetof(Record, name), rec_.name);
    return out;
}

std::string_view DataId::name_view() const noexcept {
    const auto end = std::find(rec_.name.begin(), rec_.name.end(), '\0');
    return std::string_view(rec_.name.data(),
                            static_cast<std::size_t>(end - rec_.name.begin()));
}

} // namespace flem::proto
