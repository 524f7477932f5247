#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// Normally I would consider it rude to have a "using …" in a header
// file, but the whole point here is a short namespace for the
// filesystem library used by the cache code.

#include <filesystem>
namespace fs = std::filesystem;
using std::error_code;

#endif // FS_DOT_HPP
