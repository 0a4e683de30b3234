#ifndef TREEDIFF_FS_TYPES_HPP
#define TREEDIFF_FS_TYPES_HPP

#include <filesystem>

namespace treediff {

// (file_path is slightly inaccurate since a path may refer to a directory,
// but it reads better.)
typedef std::filesystem::path file_path;

} // namespace treediff

#endif
