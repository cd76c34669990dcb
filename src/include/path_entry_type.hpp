#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/types.hpp"

namespace auto_delete_path {

// Kind of filesystem entry found at a path, as far as removal is concerned.
enum class PathEntryType : uint8_t {
	// Nothing at the path
	NOT_FOUND,
	// A directory, removed together with everything under it
	DIRECTORY,
	// A symbolic link, removed without following it
	SYMLINK,
	// A regular file
	REGULAR_FILE,
	// Any other non-directory entry: FIFO, socket, device node
	SPECIAL_FILE
};

// Classifies the entry at [path]. Symlinks are detected before following them, so a link to a directory is SYMLINK.
PathEntryType GetPathEntryType(duckdb::FileSystem &fs, const duckdb::string &path);

// Converts PathEntryType to string (lowercase).
duckdb::string PathEntryTypeToString(PathEntryType type);

} // namespace auto_delete_path
