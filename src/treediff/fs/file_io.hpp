#ifndef TREEDIFF_FS_FILE_IO_HPP
#define TREEDIFF_FS_FILE_IO_HPP

#include <fstream>

#include <treediff/core/exception.hpp>
#include <treediff/core/type_definitions.hpp>
#include <treediff/fs/types.hpp>

namespace treediff {

// Open a file for reading. Throw an error if the open operation fails, and
// enable the exception bits on the stream so that subsequent failures will
// throw exceptions.
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);

// Same, but for writing.
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
TREEDIFF_DEFINE_EXCEPTION(open_file_error)
TREEDIFF_DEFINE_ERROR_INFO(file_path, file_path)
TREEDIFF_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Write a string to a file (overwriting anything that might have been in it).
void
dump_string_to_file(file_path const& path, string const& contents);

} // namespace treediff

#endif
