#ifndef TREEDIFF_FS_APP_DIRS_HPP
#define TREEDIFF_FS_APP_DIRS_HPP

#include <vector>

#include <treediff/core/type_definitions.hpp>
#include <treediff/fs/types.hpp>

// This file provides utilities for resolving configuration directories
// according to the XDG base directory conventions.

namespace treediff {

// Get the full path of directories that should be searched for configuration
// files. The user's directory ($XDG_CONFIG_HOME/<app>, or ~/.config/<app>)
// comes first, followed by the system-wide ones in $XDG_CONFIG_DIRS (or
// /etc/xdg).
//
// Only directories that already exist (specifically for this app) are
// returned.
//
std::vector<file_path>
get_config_search_path(string const& app_name);

// Given a search path and a relative path to a configuration file that the
// application wants to read, this will scan the search path and return the
// full path to the first place it's found.
optional<file_path>
search_in_path(
    std::vector<file_path> const& search_path, file_path const& item);

} // namespace treediff

#endif
