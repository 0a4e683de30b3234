#include <iostream>

#include <boost/program_options.hpp>

#include <treediff/config.hpp>
#include <treediff/core/logging.hpp>
#include <treediff/core/type_interfaces.hpp>
#include <treediff/diff/quick.hpp>
#include <treediff/encodings/yaml.hpp>
#include <treediff/fs/file_io.hpp>

using namespace treediff;

void static
show_version_info()
{
    std::cout << "treediff " << TREEDIFF_VERSION << "\n";
}

static dynamic
read_value(file_path const& path, size_t max_depth)
{
    auto value = parse_yaml_value(read_file_contents(path));
    check_nesting_depth(value, max_depth);
    return value;
}

static int
run(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("patch", "apply the edit script in the first file to the value in the second")
        ("stats", "log the number of edits of each kind")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("files", po::value<std::vector<string>>(), "input files")
    ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("files", -1);

    po::variables_map vm;
    po::store(
        po::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .run(),
        vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        show_version_info();
        std::cout << "usage: treediff [options] <source> <target>\n"
                  << "       treediff [options] --patch <script> <source>\n";
        std::cout << desc;
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    optional<string> explicit_config;
    if (vm.count("config-file"))
        explicit_config = vm["config-file"].as<string>();
    auto config = load_config(find_config_file(explicit_config));

    initialize_logging(
        value_or(config.log_level, string("info")), config.log_file);
    auto logger = get_logger();

    std::vector<string> files;
    if (vm.count("files"))
        files = vm["files"].as<std::vector<string>>();
    if (files.size() != 2)
    {
        logger->error("expected two input files, got {}", files.size());
        std::cerr << desc;
        return 1;
    }

    // This rejects negative limits.
    auto max_depth = from_dynamic<size_t>(
        dynamic(value_or(config.max_depth, default_max_depth)));

    if (vm.count("patch"))
    {
        auto script = from_dynamic<edit_script>(
            read_value(file_path(files[0]), max_depth));
        auto source = read_value(file_path(files[1]), max_depth);
        logger->info("applying {} edits", script.edit_count());
        std::cout << value_to_yaml(patch_value(source, script)) << "\n";
        return 0;
    }

    auto source = read_value(file_path(files[0]), max_depth);
    auto target = read_value(file_path(files[1]), max_depth);
    auto script = compute_edit_script(source, target);
    if (vm.count("stats"))
    {
        logger->info(
            "{} edits: {} added, {} deleted, {} replaced",
            script.edit_count(),
            script.add_count(),
            script.delete_count(),
            script.replace_count());
    }
    std::cout << value_to_yaml(to_dynamic(script)) << "\n";
    return 0;
}

int
main(int argc, char const* const* argv)
{
    try
    {
        return run(argc, argv);
    }
    catch (boost::exception& e)
    {
        get_logger()->error(boost::diagnostic_information(e));
    }
    catch (std::exception& e)
    {
        get_logger()->error(e.what());
    }
    return 1;
}
