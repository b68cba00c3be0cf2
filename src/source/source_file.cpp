#include <fstream>
#include <iostream>
#include <iterator>
#include <sandpit/source/source_file.h>
#include <utility>

namespace sandpit::source
{

LoadResult load_source_stream(std::istream& in, const std::string& path)
{
    std::string contents{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
    {
        return LoadError{.message = "failed while reading " + path};
    }
    return SourceFile{.path = path, .contents = std::move(contents)};
}

LoadResult load_source_file(const std::string& path)
{
    // `sandpit run -` and `sandpit check -` take the script from a pipe.
    if (path == "-")
    {
        return load_source_stream(std::cin, "<stdin>");
    }

    std::ifstream script(path, std::ios::binary);
    if (!script.is_open())
    {
        return LoadError{.message = "failed to open " + path};
    }
    return load_source_stream(script, path);
}

} // namespace sandpit::source
