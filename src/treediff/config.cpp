#include <treediff/config.hpp>

#include <treediff/core/logging.hpp>
#include <treediff/core/type_interfaces.hpp>
#include <treediff/core/utilities.hpp>
#include <treediff/encodings/yaml.hpp>
#include <treediff/fs/app_dirs.hpp>
#include <treediff/fs/file_io.hpp>

namespace treediff {

void
to_dynamic(dynamic* v, treediff_config const& x)
{
    dynamic_map record;
    write_field_to_record(record, "max_depth", x.max_depth);
    write_field_to_record(record, "log_level", x.log_level);
    write_field_to_record(record, "log_file", x.log_file);
    *v = std::move(record);
}

void
from_dynamic(treediff_config* x, dynamic const& v)
{
    // An empty YAML document parses as nil.
    if (v.type() == value_type::NIL)
    {
        *x = treediff_config();
        return;
    }
    auto const& record = cast<dynamic_map>(v);
    treediff_config config;
    read_field_from_record(&config.max_depth, record, "max_depth");
    read_field_from_record(&config.log_level, record, "log_level");
    read_field_from_record(&config.log_file, record, "log_file");
    *x = std::move(config);
}

treediff_config
load_config(optional<file_path> const& path)
{
    if (!path)
        return treediff_config();
    string config_file = path->string();
    TREEDIFF_LOG_CALL(<< TREEDIFF_LOG_ARG(config_file))
    return from_dynamic<treediff_config>(
        parse_yaml_value(read_file_contents(*path)));
}

optional<file_path>
find_config_file(optional<string> const& explicit_path)
{
    if (explicit_path)
        return file_path(*explicit_path);
    auto from_environment
        = get_optional_environment_variable("TREEDIFF_CONFIG");
    if (from_environment)
        return file_path(*from_environment);
    return search_in_path(get_config_search_path("treediff"), "config.yml");
}

} // namespace treediff
