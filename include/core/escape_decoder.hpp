/**
 * @file escape_decoder.hpp
 * @brief Decodes ANSI SGR color sequences in shell output into styled text runs.
 *
 * This is cosmetic decoding only: foreground palette colors and reset.
 * Cursor movement, screen clearing and every other control sequence are
 * outside its scope (see strip_escapes for removing them).
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::core {

    struct Color {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;

        /** @brief "#RRGGBB" */
        std::string hex() const;

        bool operator==(const Color&) const = default;
    };

    /** @brief Foreground used when no palette color is active. */
    inline constexpr Color kDefaultForeground{0xD4, 0xD4, 0xD4};

    /**
     * @brief The decoder's active format.
     * `reset` is true while the default format is in effect (initially, and after SGR 0).
     */
    struct TextFormat {
        std::optional<Color> foreground;
        bool reset = true;

        bool operator==(const TextFormat&) const = default;
    };

    struct StyledRun {
        std::string text;
        std::optional<Color> foreground;
        bool reset = true;

        bool operator==(const StyledRun&) const = default;
    };

    struct DecodedChunk {
        std::vector<StyledRun> runs;
        TextFormat final_format; ///< Format in effect after the last sequence; feed it to the next chunk.
    };

    /** @brief Maps an SGR parameter in 30-37 / 90-97 to its palette color. */
    std::optional<Color> palette_color(int sgr_code);

    /**
     * @brief Splits a chunk into styled runs.
     *
     * @param chunk Raw text as read from the shell.
     * @param start Format active before the chunk.
     * @return std::nullopt when the chunk contains no SGR sequence, meaning the
     *         caller can insert the text as-is with its current format.
     */
    std::optional<DecodedChunk> decode(std::string_view chunk, const TextFormat& start = {});

    /** @brief Like decode(), but a plain chunk becomes a single run carrying `start`. */
    DecodedChunk decode_or_plain(std::string_view chunk, const TextFormat& start = {});

    /** @brief Removes every escape sequence (CSI, OSC, charset selection) from the text. */
    std::string strip_escapes(std::string_view text);

    /**
     * @brief Re-encodes runs for a 24-bit color terminal, ending with a reset.
     * Runs without a foreground color are written in `default_color` (an SGR
     * sequence, empty for the terminal default).
     */
    std::string to_terminal(const std::vector<StyledRun>& runs, std::string_view default_color = {});

}
