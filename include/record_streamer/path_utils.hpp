#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rs {

// Sidecar files live beside the source unless overridden.
std::string checkpoint_path_for(const std::string& source, const std::string& override_path = {});
std::string position_cache_path_for(const std::string& source, const std::string& override_path = {});

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Read up to `len` bytes at `offset`. Returns false if the file cannot be
// opened or positioned; a short read at end of file is not an error.
bool read_slice(const std::string& path, std::uint64_t offset, std::size_t len,
                std::string& out, std::string* err_out = nullptr);

// Last modification time in filesystem clock ticks; nullopt if stat fails.
std::optional<std::int64_t> file_mtime_ticks(const std::string& path, std::string* err_out = nullptr);

std::optional<std::string> read_whole_file(const std::string& path, std::string* err_out = nullptr);

// Write `data` to `path` via a temporary sibling and rename.
bool write_file_atomic(const std::string& path, std::string_view data, std::string* err_out = nullptr);

// Lowercase hex SHA-256 of `data`.
std::string hex_sha256(std::string_view data);

}
