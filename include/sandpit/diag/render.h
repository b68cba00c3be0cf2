#pragma once

#include <sandpit/diag/diagnostic.h>
#include <sandpit/source/source_file.h>
#include <string>

namespace sandpit::diag
{

/**
 * @brief Format for a terminal: `quiz.py:2:1: error: ...`, the offending script line, then
 * `^` marks under the span (clipped to that line). Notes follow as `note:` lines.
 */
[[nodiscard]] std::string render(const Diagnostic& diagnostic,
                                 const sandpit::source::SourceFile& file);

} // namespace sandpit::diag
