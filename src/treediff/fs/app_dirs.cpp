#include <treediff/fs/app_dirs.hpp>

#include <boost/algorithm/string.hpp>

#include <treediff/core/utilities.hpp>

namespace treediff {

static optional<file_path>
get_user_config_home()
{
    auto xdg_config_home = get_optional_environment_variable("XDG_CONFIG_HOME");
    if (xdg_config_home)
    {
        file_path dir = *xdg_config_home;
        // XDG requires absolute paths.
        if (dir.is_absolute())
            return dir;
    }
    auto home = get_optional_environment_variable("HOME");
    if (home)
        return file_path(*home) / ".config";
    return none;
}

std::vector<file_path>
get_config_search_path(string const& app_name)
{
    std::vector<file_path> search_path;

    // Check for a user config dir.
    auto user_config_home = get_user_config_home();
    if (user_config_home && exists(*user_config_home / app_name))
        search_path.push_back(*user_config_home / app_name);

    // Get the list of XDG base config dirs.
    auto xdg_config_dirs = get_optional_environment_variable("XDG_CONFIG_DIRS");
    if (!xdg_config_dirs)
        xdg_config_dirs = string("/etc/xdg");
    std::vector<string> dirs;
    boost::split(dirs, *xdg_config_dirs, [](char c) { return c == ':'; });

    // Filter for directories that contain a subdirectory for this app.
    for (auto const& dir : dirs)
    {
        file_path path(dir);
        if (path.is_absolute() && exists(path / app_name))
            search_path.push_back(path / app_name);
    }

    return search_path;
}

optional<file_path>
search_in_path(std::vector<file_path> const& search_path, file_path const& item)
{
    for (auto const& dir : search_path)
    {
        auto full_path = dir / item;
        if (exists(full_path))
            return some(full_path);
    }
    return none;
}

} // namespace treediff
