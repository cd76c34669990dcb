// A fake filesystem for auto delete path testing purpose.

#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"

#include <functional>

namespace auto_delete_path {

// State shared between a test and the fake filesystem it hands over, so it stays observable after the filesystem has
// been destroyed along with its owner.
struct FakeFileSystemState {
	// Whether removal calls fail with IOException, without touching the disk.
	bool fail_removal = false;
	// If not empty, only removals of this exact path fail.
	duckdb::string fail_removal_path;
	// Number of removal calls received, failed ones included.
	duckdb::idx_t removal_count = 0;
	// Number of calls of any kind received.
	duckdb::idx_t call_count = 0;
};

// WARNING: fake filesystem is used for testing purpose and shouldn't be used in production.
// Delegates existence checks and removals to the local filesystem.
class AutoDeletePathFakeFileSystem : public duckdb::FileSystem {
public:
	explicit AutoDeletePathFakeFileSystem(duckdb::shared_ptr<FakeFileSystemState> state_p);
	duckdb::string GetName() const override {
		return "AutoDeletePathFakeFileSystem";
	}

	bool DirectoryExists(const duckdb::string &directory, duckdb::optional_ptr<duckdb::FileOpener> opener) override;
	bool FileExists(const duckdb::string &filename, duckdb::optional_ptr<duckdb::FileOpener> opener) override;
	bool IsPipe(const duckdb::string &filename, duckdb::optional_ptr<duckdb::FileOpener> opener) override;
	bool ListFiles(const duckdb::string &directory,
	               const std::function<void(const duckdb::string &, bool)> &callback,
	               duckdb::FileOpener *opener) override;
	duckdb::string PathSeparator(const duckdb::string &path) override;

	void RemoveDirectory(const duckdb::string &directory, duckdb::optional_ptr<duckdb::FileOpener> opener) override;
	void RemoveFile(const duckdb::string &filename, duckdb::optional_ptr<duckdb::FileOpener> opener) override;
	bool TryRemoveFile(const duckdb::string &filename, duckdb::optional_ptr<duckdb::FileOpener> opener) override;

private:
	// Counts a removal call, and throws if removals of [path] are set to fail.
	void RecordRemoval(const duckdb::string &path);

	duckdb::shared_ptr<FakeFileSystemState> state;
	duckdb::unique_ptr<duckdb::FileSystem> local_filesystem;
};

} // namespace auto_delete_path
