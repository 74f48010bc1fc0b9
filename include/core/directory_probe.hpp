/**
 * @file directory_probe.hpp
 * @brief Picks the shell's working directory out of the lines captured after a
 *        `(Get-Location).Path` query.
 *
 * The captured window contains more than the answer: blank lines, the
 * `Path` / `----` table header of PowerShell's default formatter, prompt
 * echoes such as `PS C:\work>` and whatever else the shell printed around
 * the query. Everything that decides what counts as an answer lives here.
 */

#pragma once
#include "core/output_pump.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::core {

    /** @brief `PS <path>>` alone, or followed by an echoed command. */
    bool is_prompt_echo(std::string_view line);

    /** @brief Column header / separator rows of the query's table output. */
    bool is_table_furniture(std::string_view line);

    /**
     * @brief Drive-letter (`C:\x`), UNC (`\\host\share`), provider-qualified
     * (`FileSystem::...`) or POSIX absolute (`/`, `/x`) path. Paths other than
     * POSIX ones must be longer than 2 characters.
     */
    bool looks_like_path(std::string_view line);

    /**
     * @brief Lexically normalizes a directory: duplicate separators, `.` and `..`
     * collapse, trailing separators go (except at a root). Drive and UNC paths keep
     * `\` as separator, everything else uses `/`.
     */
    std::string normalize_directory(std::string_view path);

    /**
     * @brief Returns the first stdout line that survives the filters and looks like a path.
     * @param lines Drained output, in arrival order.
     * @param extra_prompts Additional prompt suffixes (from config) that mark a line as prompt noise.
     */
    std::optional<std::string> extract_directory(const std::vector<OutputLine>& lines,
                                                 const std::vector<std::string>& extra_prompts = {});

}
