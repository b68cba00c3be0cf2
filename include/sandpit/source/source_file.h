#pragma once

#include <istream>
#include <string>
#include <variant>

/**
 * @file source_file.h
 * @brief Loading submitted scripts from files and streams.
 */

namespace sandpit::source
{

/** @brief A script and the name it was loaded under. */
struct SourceFile
{
    std::string path;     /**< Display name: file path, or `<stdin>`. */
    std::string contents; /**< Raw script text. */
};

/** @brief Error returned when a source cannot be loaded. */
struct LoadError
{
    std::string message;
};

using LoadResult = std::variant<SourceFile, LoadError>;

/** @brief Load the file at `path`; `-` reads standard input. */
LoadResult load_source_file(const std::string& path);

/** @brief Load source from the provided input stream; `path` is used for diagnostics. */
LoadResult load_source_stream(std::istream& in, const std::string& path);

} // namespace sandpit::source
