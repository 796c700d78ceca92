#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace rtcsv {

enum class FileFormat { CSV, TSV, Text, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .tsv/.tab | .txt).
FileFormat detect_format(std::string_view path);

// Delimiter a format conventionally uses ("," / "\t" / ";").
std::string default_delimiter(FileFormat f);

// Slug generation per config: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

}
