#include <treediff/fs/file_io.hpp>

#include <cerrno>
#include <cstring>

#include <treediff/core/utilities.hpp>

namespace treediff {

template<class Stream>
static void
open_stream(Stream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        TREEDIFF_THROW(
            open_file_error() << file_path_info(path) << open_mode_info(mode)
                              << internal_error_message_info(
                                     std::strerror(errno)));
    }
    file.exceptions(std::ios::failbit | std::ios::badbit);
}

void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode | std::ios::in);
}
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode | std::ios::out);
}

string
read_file_contents(file_path const& path)
{
    std::ifstream in;
    open_file(in, path, std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(size_t(in.tellg()));
    in.seekg(0, std::ios::beg);
    in.read(&contents[0], std::streamsize(contents.size()));
    in.close();
    return contents;
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output;
    open_file(output, path, std::ios::trunc | std::ios::binary);
    output << contents;
}

} // namespace treediff
