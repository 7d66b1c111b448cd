#ifndef FLEM_VERSION_HPP
#define FLEM_VERSION_HPP

#pragma once

namespace flem {

    /// Library semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 6;
    inline constexpr int version_patch = 2;

    /// Combined version string (e.g. "0.6.2")
    inline constexpr const char* version_string = "0.6.2";

} // namespace flem

#endif // FLEM_VERSION_HPP
