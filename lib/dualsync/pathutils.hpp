/**
 * @file pathutils.hpp
 * @brief Lexical path helpers shared by panels, the size cache and the
 * transfer checks
 */

#ifndef PATHUTILS_HPP
#define PATHUTILS_HPP

#include <filesystem>
#include <string>

/**
 * @brief Absolute, lexically normalized form of a path without a trailing
 * separator (except for the root itself)
 *
 * Used as the key of the size cache and as selection identity. Symlinks are
 * not resolved.
 */
std::string normalizePath(const std::filesystem::path &path);

/**
 * @brief Normalized form with symlinks resolved as far as they exist
 *
 * Used for the self/descendant checks of a transfer, where a link pointing
 * into the source must be caught as well.
 */
std::string resolvePath(const std::filesystem::path &path);

/**
 * @brief True if @p candidate equals @p base or lies below it
 *
 * Compares path components, so "/data/ab" is not considered to be inside
 * "/data/a". Both arguments are expected in normalized form.
 */
bool isSameOrDescendant(const std::filesystem::path &candidate,
                        const std::filesystem::path &base);

/** @brief Parent directory; the root is its own parent */
std::string parentPath(const std::string &path);

#endif // PATHUTILS_HPP
