// Helpers to generate unique paths under a temporary directory.
//
// Generated paths are only names: nothing is created on disk. Pair them with AutoDeletePath to get them removed.

#pragma once

#include "duckdb/common/string.hpp"

namespace auto_delete_path {

// Options for generating a temporary path.
struct TempPathOptions {
	static constexpr const char *DEFAULT_PREFIX = "auto_delete_path";

	// Directory to generate the path under, empty means the platform temporary directory.
	duckdb::string directory;
	// File name prefix of the generated path.
	duckdb::string prefix;

	TempPathOptions() : directory(), prefix(DEFAULT_PREFIX) {
	}
};

// Returns the platform temporary directory, without trailing separator.
duckdb::string GetTemporaryDirectory();

// Returns a fresh path "<directory>/<prefix>-<sequence>-<uuid>". The sequence is process-wide and starts at 1.
duckdb::string GenerateTempPath(const TempPathOptions &options = TempPathOptions());

} // namespace auto_delete_path
