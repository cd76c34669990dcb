#include "auto_delete_path.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"

#include "path_entry_type.hpp"

#include <functional>

#if defined(_WIN32)
#include <windows.h>
// Undefine Windows macros that conflict with DuckDB FileSystem method names
#undef CreateDirectory
#undef MoveFile
#undef RemoveDirectory
#endif

namespace auto_delete_path {

using duckdb::FileOpenFlags;
using duckdb::FileSystem;
using duckdb::string;

namespace {

void LogCleanupFailure(duckdb::DatabaseInstance &db, const string &message) {
	// Logging macros expect DuckDB names to be visible.
	using namespace duckdb;
	DUCKDB_LOG_WARN(db, message);
}

// Removes a link without touching its target.
void RemoveLink(FileSystem &fs, const string &path) {
#if defined(_WIN32)
	// Directory symlinks and junctions are not files for DeleteFile.
	const DWORD attributes = GetFileAttributesA(path.c_str());
	if (attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_DIRECTORY) != 0) {
		if (!RemoveDirectoryA(path.c_str())) {
			throw duckdb::IOException("Could not remove directory link \"%s\"", path);
		}
		return;
	}
#endif
	fs.RemoveFile(path);
}

void RemoveTree(FileSystem &fs, const string &path);

// Removes the entry at [path] of the given type, throws on failure.
void RemoveEntryOfType(FileSystem &fs, const string &path, PathEntryType entry_type) {
	switch (entry_type) {
	case PathEntryType::NOT_FOUND:
		return;
	case PathEntryType::DIRECTORY:
		RemoveTree(fs, path);
		return;
	case PathEntryType::SYMLINK:
		RemoveLink(fs, path);
		return;
	case PathEntryType::REGULAR_FILE:
	case PathEntryType::SPECIAL_FILE:
		fs.RemoveFile(path);
		return;
	default:
		throw duckdb::InternalException("Unknown PathEntryType value");
	}
}

// FileSystem::RemoveDirectory follows links while recursing and drops errors, so the walk is done here and
// RemoveDirectory only ever sees an empty directory.
void RemoveTree(FileSystem &fs, const string &path) {
	duckdb::vector<string> children;
	const bool listed = fs.ListFiles(path, [&](const string &name, bool /*is_directory*/) { children.push_back(name); });
	if (!listed) {
		throw duckdb::IOException("Could not list directory \"%s\"", path);
	}
	for (const auto &child : children) {
		const auto child_path = fs.JoinPath(path, child);
		RemoveEntryOfType(fs, child_path, GetPathEntryType(fs, child_path));
	}
	fs.RemoveDirectory(path);
	if (GetPathEntryType(fs, path) != PathEntryType::NOT_FOUND) {
		throw duckdb::IOException("Could not remove directory \"%s\"", path);
	}
}

} // namespace

AutoDeletePath::AutoDeletePath(string path_p) : path(std::move(path_p)), armed(true) {
}

AutoDeletePath::AutoDeletePath(string path_p, duckdb::unique_ptr<FileSystem> file_system_p)
    : path(std::move(path_p)), armed(true), file_system(std::move(file_system_p)) {
}

AutoDeletePath::~AutoDeletePath() {
	if (!armed) {
		return;
	}
	TryRemoveEntry();
}

AutoDeletePath::AutoDeletePath(AutoDeletePath &&other) noexcept
    : path(std::move(other.path)), armed(other.armed), file_system(std::move(other.file_system)),
      log_db(other.log_db) {
	other.armed = false;
	other.path.clear();
}

AutoDeletePath &AutoDeletePath::operator=(AutoDeletePath &&other) noexcept {
	if (this == &other) {
		return *this;
	}
	if (armed) {
		TryRemoveEntry();
	}
	path = std::move(other.path);
	armed = other.armed;
	file_system = std::move(other.file_system);
	log_db = other.log_db;
	other.armed = false;
	other.path.clear();
	return *this;
}

AutoDeletePath AutoDeletePath::Temp() {
	return AutoDeletePath(GenerateTempPath());
}

AutoDeletePath AutoDeletePath::Temp(const TempPathOptions &options) {
	return AutoDeletePath(GenerateTempPath(options));
}

AutoDeletePath AutoDeletePath::CreateTempFile(const string &content, const TempPathOptions &options) {
	auto temp_path = Temp(options);
	auto &fs = temp_path.GetFileSystem();
	auto handle =
	    fs.OpenFile(temp_path.GetPath(), FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);
	fs.Write(*handle, const_cast<char *>(content.data()), static_cast<int64_t>(content.size()), /*location=*/0);
	handle->Sync();
	handle->Close();
	return temp_path;
}

string AutoDeletePath::Release() {
	armed = false;
	string released = std::move(path);
	path.clear();
	return released;
}

void AutoDeletePath::Delete() {
	if (!armed) {
		return;
	}
	armed = false;
	RemoveEntry();
}

void AutoDeletePath::SetLogDatabase(duckdb::DatabaseInstance &db) {
	log_db = db.shared_from_this();
}

FileSystem &AutoDeletePath::GetFileSystem() {
	if (!file_system) {
		file_system = FileSystem::CreateLocal();
	}
	return *file_system;
}

void AutoDeletePath::RemoveEntry() {
	auto &fs = GetFileSystem();
	try {
		RemoveEntryOfType(fs, path, GetPathEntryType(fs, path));
	} catch (const duckdb::IOException &) {
		// Removed by someone else in between, the entry is gone either way.
		if (GetPathEntryType(fs, path) == PathEntryType::NOT_FOUND) {
			return;
		}
		throw;
	}
}

void AutoDeletePath::TryRemoveEntry() {
	armed = false;
	try {
		RemoveEntry();
	} catch (const std::exception &ex) {
		auto db = log_db.lock();
		if (!db) {
			return;
		}
		try {
			duckdb::ErrorData error(ex);
			LogCleanupFailure(
			    *db, duckdb::StringUtil::Format("Failed to remove '%s' at scope exit: %s", path, error.RawMessage()));
		} catch (const std::exception &) {
			// Logging is best-effort as well.
		}
	}
}

} // namespace auto_delete_path
