/**
 * @file Version.hpp
 * @brief Library version, injected by the build system.
 */

#pragma once

#ifndef LHEUTILS_VERSION
#define LHEUTILS_VERSION "0.0.0"
#endif

namespace lheutils
{
    inline constexpr const char* kVersion = LHEUTILS_VERSION;

} // namespace lheutils
