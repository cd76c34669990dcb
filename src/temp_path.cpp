#include "temp_path.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/uuid.hpp"

#include <atomic>
#include <cstdlib>

#if defined(_WIN32)
#include <windows.h>
// Undefine Windows macros that conflict with DuckDB FileSystem method names
#undef CreateDirectory
#undef MoveFile
#undef RemoveDirectory
#endif

namespace auto_delete_path {

namespace {
std::atomic<duckdb::idx_t> temp_path_sequence {1};
} // namespace

duckdb::string GetTemporaryDirectory() {
#if defined(_WIN32)
	char temp_path[MAX_PATH];
	DWORD ret = GetTempPathA(MAX_PATH, temp_path);
	if (ret > 0 && ret < MAX_PATH) {
		// GetTempPath returns path with trailing backslash, remove it
		duckdb::string result(temp_path);
		if (!result.empty() && (result.back() == '\\' || result.back() == '/')) {
			result.pop_back();
		}
		return result;
	}
	// Fallback to environment variables
	const char *temp = std::getenv("TEMP");
	if (temp != nullptr) {
		return duckdb::string(temp);
	}
	const char *tmp = std::getenv("TMP");
	if (tmp != nullptr) {
		return duckdb::string(tmp);
	}
	// Last resort fallback
	return "C:\\Temp";
#else
	return "/tmp";
#endif
}

duckdb::string GenerateTempPath(const TempPathOptions &options) {
	const auto directory = options.directory.empty() ? GetTemporaryDirectory() : options.directory;
	const auto sequence = temp_path_sequence.fetch_add(1, std::memory_order_relaxed);
	const auto file_name = duckdb::StringUtil::Format(
	    "%s-%llu-%s", options.prefix, sequence, duckdb::UUID::ToString(duckdb::UUID::GenerateRandomUUID()));
	auto local_fs = duckdb::FileSystem::CreateLocal();
	return local_fs->JoinPath(directory, file_name);
}

} // namespace auto_delete_path
