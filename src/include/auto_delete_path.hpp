// AutoDeletePath is a RAII wrapper owning a filesystem path.
// When it goes out of scope (including during exception unwinding) the entry at that path is removed: a file or
// symlink is unlinked, a directory is removed together with everything under it, a missing entry is left as is.
//
// Example:
//   {
//     auto tmp_path = AutoDeletePath::Temp();
//     local_filesystem->CreateDirectory(*tmp_path);
//     auto subfile = local_filesystem->JoinPath(*tmp_path, "subfile");
//     ...
//   }  // Directory and its contents are removed
//
// Cleanup at scope exit is best-effort: failures are logged to the attached database (if any) and never thrown.
// Use Delete() to remove eagerly and get failures reported as exceptions.

#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"

#include "temp_path.hpp"

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace auto_delete_path {

class AutoDeletePath {
public:
	explicit AutoDeletePath(duckdb::string path_p);
	// Removal goes through [file_system_p] instead of a local filesystem.
	AutoDeletePath(duckdb::string path_p, duckdb::unique_ptr<duckdb::FileSystem> file_system_p);
	~AutoDeletePath();

	// Disable copy, ownership only moves. The moved-from instance never removes anything.
	AutoDeletePath(const AutoDeletePath &) = delete;
	AutoDeletePath &operator=(const AutoDeletePath &) = delete;
	AutoDeletePath(AutoDeletePath &&other) noexcept;
	// Cleans up the currently owned entry before taking over [other].
	AutoDeletePath &operator=(AutoDeletePath &&other) noexcept;

	// Creates an instance over a fresh path in the temporary directory. Nothing is created on disk.
	static AutoDeletePath Temp();
	static AutoDeletePath Temp(const TempPathOptions &options);

	// Writes [content] to a new temporary file, and returns the instance owning it.
	// Throws IOException if the file cannot be written; a partially written file is still removed.
	static AutoDeletePath CreateTempFile(const duckdb::string &content,
	                                     const TempPathOptions &options = TempPathOptions());

	const duckdb::string &GetPath() const {
		return path;
	}
	// Pretend to be a smart pointer to the path.
	const duckdb::string &operator*() const {
		return path;
	}
	const duckdb::string *operator->() const {
		return &path;
	}
	operator const duckdb::string &() const {
		return path;
	}

	// Whether the entry is still going to be removed at scope exit.
	bool IsArmed() const {
		return armed;
	}

	// Cancels removal for good. Idempotent.
	void Keep() {
		armed = false;
	}

	// Cancels removal and hands the path back to the caller; the instance is left with an empty path.
	duckdb::string Release();

	// Removes the entry now and disarms. Unlike scope exit, failures are thrown as IOException and not retried later.
	// No-op if already disarmed.
	void Delete();

	// Attaches a database whose logger receives a warning for each failed cleanup at scope exit.
	// Only a weak reference is held.
	void SetLogDatabase(duckdb::DatabaseInstance &db);

private:
	duckdb::FileSystem &GetFileSystem();
	// Removes the entry at [path], throws on failure.
	void RemoveEntry();
	// Disarms and removes the entry, failures are logged and dropped.
	void TryRemoveEntry();

	duckdb::string path;
	bool armed;
	// Created lazily on first removal if not injected.
	duckdb::unique_ptr<duckdb::FileSystem> file_system;
	duckdb::weak_ptr<duckdb::DatabaseInstance> log_db;
};

} // namespace auto_delete_path
