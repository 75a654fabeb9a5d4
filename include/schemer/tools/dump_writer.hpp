#pragma once

#include "schemer/output/value.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace schemer::tools {

/// Serialises `records` as a JSON array (indent 1) into
/// `<target_dir>/<stem>_schema.json`, creating `target_dir` when missing.
/// Returns the written path; I/O failures throw.
std::filesystem::path dump_records(const std::vector<output::Value>& records,
                                   const std::filesystem::path& target_dir,
                                   std::string_view stem);

/// Writes one JSON document (indent 1) to `<target_dir>/<stem>_schema.json`.
std::filesystem::path dump_document(const output::Value& document,
                                    const std::filesystem::path& target_dir,
                                    std::string_view stem);

/// True for `.sql`, `.ddl` and `.hql` files (extension compared
/// case-insensitively).
[[nodiscard]] bool is_ddl_source(const std::filesystem::path& path);

/// Expands files and directories into the list of DDL files to parse.
/// Directories contribute their DDL files (non-recursive) in name order;
/// files named explicitly are kept whatever their extension. Throws
/// std::runtime_error when an input does not exist.
[[nodiscard]] std::vector<std::filesystem::path> collect_inputs(const std::vector<std::string>& inputs);

[[nodiscard]] std::string read_source_file(const std::filesystem::path& path);

}  // namespace schemer::tools
