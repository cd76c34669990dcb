#include "path_entry_type.hpp"

#include "duckdb/common/exception.hpp"

#if defined(_WIN32)
#include <windows.h>
// Undefine Windows macros that conflict with DuckDB FileSystem method names
#undef CreateDirectory
#undef MoveFile
#undef RemoveDirectory
#else
#include <sys/stat.h>
#endif

namespace auto_delete_path {

namespace {

// FileSystem has no lstat equivalent, every existence check follows links and only sees directories, regular files and
// pipes. Returns NOT_FOUND when the FileSystem checks have to decide.
PathEntryType GetNoFollowEntryType(const duckdb::string &path) {
#if defined(_WIN32)
	const DWORD attributes = GetFileAttributesA(path.c_str());
	if (attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_REPARSE_POINT) != 0) {
		return PathEntryType::SYMLINK;
	}
	return PathEntryType::NOT_FOUND;
#else
	struct stat status;
	if (lstat(path.c_str(), &status) != 0) {
		return PathEntryType::NOT_FOUND;
	}
	if (S_ISLNK(status.st_mode)) {
		return PathEntryType::SYMLINK;
	}
	if (S_ISFIFO(status.st_mode) || S_ISSOCK(status.st_mode) || S_ISCHR(status.st_mode) || S_ISBLK(status.st_mode)) {
		return PathEntryType::SPECIAL_FILE;
	}
	return PathEntryType::NOT_FOUND;
#endif
}

} // namespace

PathEntryType GetPathEntryType(duckdb::FileSystem &fs, const duckdb::string &path) {
	if (path.empty()) {
		return PathEntryType::NOT_FOUND;
	}
	const auto no_follow_type = GetNoFollowEntryType(path);
	if (no_follow_type != PathEntryType::NOT_FOUND) {
		return no_follow_type;
	}
	if (fs.DirectoryExists(path)) {
		return PathEntryType::DIRECTORY;
	}
	if (fs.FileExists(path)) {
		return PathEntryType::REGULAR_FILE;
	}
	if (fs.IsPipe(path)) {
		return PathEntryType::SPECIAL_FILE;
	}
	return PathEntryType::NOT_FOUND;
}

duckdb::string PathEntryTypeToString(PathEntryType type) {
	switch (type) {
	case PathEntryType::NOT_FOUND:
		return "not_found";
	case PathEntryType::DIRECTORY:
		return "directory";
	case PathEntryType::SYMLINK:
		return "symlink";
	case PathEntryType::REGULAR_FILE:
		return "regular_file";
	case PathEntryType::SPECIAL_FILE:
		return "special_file";
	default:
		throw duckdb::InternalException("Unknown PathEntryType value");
	}
}

} // namespace auto_delete_path
