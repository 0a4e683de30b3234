#ifndef TREEDIFF_CONFIG_HPP
#define TREEDIFF_CONFIG_HPP

#include <treediff/core/dynamic.hpp>
#include <treediff/fs/types.hpp>

namespace treediff {

struct treediff_config
{
    // the deepest nesting accepted in input values (defaults to 512)
    omissible<integer> max_depth;
    // the logging level, by spdlog name (defaults to "info")
    omissible<string> log_level;
    // if set, log messages are also written to this file
    omissible<string> log_file;
};

integer const default_max_depth = 512;

void
to_dynamic(dynamic* v, treediff_config const& x);

// Fields that aren't recognized are ignored.
void
from_dynamic(treediff_config* x, dynamic const& v);

// Read the configuration from a YAML file.
// If :path is none, this returns a default configuration.
treediff_config
load_config(optional<file_path> const& path);

// Get the path of the configuration file to use. :explicit_path (as given on
// the command line) takes precedence, then the TREEDIFF_CONFIG environment
// variable. Otherwise, the XDG config directories are searched for
// treediff/config.yml, and if there isn't one, this is none.
optional<file_path>
find_config_file(optional<string> const& explicit_path);

} // namespace treediff

#endif
