#include "schemer/tools/dump_writer.hpp"

#include "schemer/output/json_writer.hpp"
#include "schemer/parser/text_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace schemer::tools {

std::filesystem::path dump_records(const std::vector<output::Value>& records,
                                   const std::filesystem::path& target_dir,
                                   std::string_view stem)
{
    return dump_document(output::Value{output::Array(records.begin(), records.end())}, target_dir, stem);
}

std::filesystem::path dump_document(const output::Value& document,
                                    const std::filesystem::path& target_dir,
                                    std::string_view stem)
{
    std::filesystem::create_directories(target_dir);

    auto path = target_dir / (std::string{stem} + "_schema.json");
    std::ofstream stream{path, std::ios::out | std::ios::trunc};
    if (!stream.is_open()) {
        throw std::runtime_error{"failed to open '" + path.string() + "' for writing"};
    }

    stream << output::write_json(document, 1) << '\n';
    if (!stream) {
        throw std::runtime_error{"failed to write '" + path.string() + "'"};
    }
    return path;
}

bool is_ddl_source(const std::filesystem::path& path)
{
    const auto extension = parser::lowercase_copy(path.extension().string());
    return extension == ".sql" || extension == ".ddl" || extension == ".hql";
}

std::vector<std::filesystem::path> collect_inputs(const std::vector<std::string>& inputs)
{
    std::vector<std::filesystem::path> files{};
    for (const auto& input : inputs) {
        const std::filesystem::path path{input};
        if (std::filesystem::is_directory(path)) {
            std::vector<std::filesystem::path> found{};
            for (const auto& entry : std::filesystem::directory_iterator{path}) {
                if (entry.is_regular_file() && is_ddl_source(entry.path())) {
                    found.push_back(entry.path());
                }
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else if (std::filesystem::is_regular_file(path)) {
            files.push_back(path);
        } else {
            throw std::runtime_error{"input '" + input + "' does not exist"};
        }
    }
    return files;
}

std::string read_source_file(const std::filesystem::path& path)
{
    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream.is_open()) {
        throw std::runtime_error{"failed to open '" + path.string() + "'"};
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

}  // namespace schemer::tools
