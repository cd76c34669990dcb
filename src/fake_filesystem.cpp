#include "fake_filesystem.hpp"

#include "duckdb/common/exception.hpp"

namespace auto_delete_path {

using duckdb::FileOpener;
using duckdb::optional_ptr;
using duckdb::string;

AutoDeletePathFakeFileSystem::AutoDeletePathFakeFileSystem(duckdb::shared_ptr<FakeFileSystemState> state_p)
    : state(std::move(state_p)), local_filesystem(duckdb::FileSystem::CreateLocal()) {
}

void AutoDeletePathFakeFileSystem::RecordRemoval(const string &path) {
	++state->removal_count;
	if (!state->fail_removal) {
		return;
	}
	if (state->fail_removal_path.empty() || state->fail_removal_path == path) {
		throw duckdb::IOException("Injected removal failure for '%s'", path);
	}
}

bool AutoDeletePathFakeFileSystem::DirectoryExists(const string &directory, optional_ptr<FileOpener> opener) {
	++state->call_count;
	return local_filesystem->DirectoryExists(directory, opener);
}

bool AutoDeletePathFakeFileSystem::FileExists(const string &filename, optional_ptr<FileOpener> opener) {
	++state->call_count;
	return local_filesystem->FileExists(filename, opener);
}

bool AutoDeletePathFakeFileSystem::IsPipe(const string &filename, optional_ptr<FileOpener> opener) {
	++state->call_count;
	return local_filesystem->IsPipe(filename, opener);
}

bool AutoDeletePathFakeFileSystem::ListFiles(const string &directory,
                                             const std::function<void(const string &, bool)> &callback,
                                             FileOpener *opener) {
	++state->call_count;
	return local_filesystem->ListFiles(directory, callback, opener);
}

string AutoDeletePathFakeFileSystem::PathSeparator(const string &path) {
	return local_filesystem->PathSeparator(path);
}

void AutoDeletePathFakeFileSystem::RemoveDirectory(const string &directory, optional_ptr<FileOpener> opener) {
	++state->call_count;
	RecordRemoval(directory);
	local_filesystem->RemoveDirectory(directory, opener);
}

void AutoDeletePathFakeFileSystem::RemoveFile(const string &filename, optional_ptr<FileOpener> opener) {
	++state->call_count;
	RecordRemoval(filename);
	local_filesystem->RemoveFile(filename, opener);
}

bool AutoDeletePathFakeFileSystem::TryRemoveFile(const string &filename, optional_ptr<FileOpener> opener) {
	++state->call_count;
	RecordRemoval(filename);
	return local_filesystem->TryRemoveFile(filename, opener);
}

} // namespace auto_delete_path
