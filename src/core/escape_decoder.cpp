/**
 * @file escape_decoder.cpp
 * @brief SGR decoding, escape stripping and terminal re-encoding.
 */

#include "core/escape_decoder.hpp"
#include <array>
#include <charconv>
#include <format>
#include <regex>

namespace tether::core {

    namespace {
        constexpr char kEsc = '\x1b';
        constexpr char kBell = '\x07';

        struct PaletteEntry {
            int code;
            Color color;
        };

        constexpr std::array<PaletteEntry, 16> kPalette{{
            {30, {0x00, 0x00, 0x00}}, // Black
            {31, {0xFF, 0x55, 0x55}}, // Red
            {32, {0x50, 0xFA, 0x7B}}, // Green
            {33, {0xF1, 0xFA, 0x8C}}, // Yellow
            {34, {0xBD, 0x93, 0xF9}}, // Blue
            {35, {0xFF, 0x79, 0xC6}}, // Magenta
            {36, {0x8B, 0xE9, 0xFD}}, // Cyan
            {37, {0xF8, 0xF8, 0xF2}}, // White
            {90, {0x62, 0x72, 0xA4}}, // Bright Black
            {91, {0xFF, 0x6E, 0x6E}}, // Bright Red
            {92, {0x69, 0xFF, 0x94}}, // Bright Green
            {93, {0xFF, 0xFF, 0xA5}}, // Bright Yellow
            {94, {0xD6, 0xAC, 0xFF}}, // Bright Blue
            {95, {0xFF, 0x92, 0xDF}}, // Bright Magenta
            {96, {0xA4, 0xFF, 0xFF}}, // Bright Cyan
            {97, {0xFF, 0xFF, 0xFF}}, // Bright White
        }};

        const std::regex& sgr_pattern() {
            static const std::regex pattern("\x1b\\[([0-9;]*)m");
            return pattern;
        }

        /** @brief Applies one semicolon-delimited parameter list to the active format. */
        void apply_parameters(std::string_view params, TextFormat& format) {
            size_t pos = 0;
            while (pos <= params.size()) {
                size_t end = params.find(';', pos);
                if (end == std::string_view::npos) end = params.size();
                std::string_view token = params.substr(pos, end - pos);
                pos = end + 1;

                if (token.empty()) continue;

                int code = 0;
                auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), code);
                if (ec != std::errc() || ptr != token.data() + token.size()) continue;

                if (code == 0) {
                    format = TextFormat{};
                } else if (auto color = palette_color(code)) {
                    format.foreground = *color;
                    format.reset = false;
                }
                // Anything else (bold, background, 256-color...) is ignored.
            }
        }

        void push_run(std::vector<StyledRun>& runs, std::string_view text, const TextFormat& format) {
            if (text.empty()) return;
            runs.push_back({std::string(text), format.foreground, format.reset});
        }
    }

    std::string Color::hex() const {
        return std::format("#{:02X}{:02X}{:02X}", r, g, b);
    }

    std::optional<Color> palette_color(int sgr_code) {
        for (const auto& entry : kPalette) {
            if (entry.code == sgr_code) return entry.color;
        }
        return std::nullopt;
    }

    std::optional<DecodedChunk> decode(std::string_view chunk, const TextFormat& start) {
        std::cregex_iterator it(chunk.data(), chunk.data() + chunk.size(), sgr_pattern());
        std::cregex_iterator end;

        if (it == end) return std::nullopt;

        DecodedChunk result;
        TextFormat current = start;
        size_t last_index = 0;

        for (; it != end; ++it) {
            const auto& match = *it;
            size_t match_pos = static_cast<size_t>(match[0].first - chunk.data());

            push_run(result.runs, chunk.substr(last_index, match_pos - last_index), current);

            std::string_view params(match[1].first, static_cast<size_t>(match[1].length()));
            apply_parameters(params, current);

            last_index = match_pos + static_cast<size_t>(match[0].length());
        }

        push_run(result.runs, chunk.substr(last_index), current);
        result.final_format = current;
        return result;
    }

    DecodedChunk decode_or_plain(std::string_view chunk, const TextFormat& start) {
        if (auto decoded = decode(chunk, start)) return std::move(*decoded);

        DecodedChunk plain;
        plain.runs.push_back({std::string(chunk), start.foreground, start.reset});
        plain.final_format = start;
        return plain;
    }

    std::string strip_escapes(std::string_view text) {
        std::string result;
        result.reserve(text.size());

        // 0=text, 1=ESC, 2=CSI, 3=OSC, 4=OSC saw ESC, 5=Charset
        int state = 0;
        for (char c : text) {
            switch (state) {
                case 0:
                    if (c == kEsc) state = 1;
                    else result += c;
                    break;
                case 1:
                    if (c == '[') state = 2;
                    else if (c == ']') state = 3;
                    else if (c == '(' || c == ')') state = 5;
                    else state = 0;
                    break;
                case 2:
                    if (c >= 0x40 && c <= 0x7E) state = 0;
                    break;
                case 3:
                    if (c == kBell) state = 0;
                    else if (c == kEsc) state = 4;
                    break;
                case 4:
                    state = (c == '\\') ? 0 : 3;
                    break;
                case 5:
                    state = 0;
                    break;
            }
        }
        return result;
    }

    std::string to_terminal(const std::vector<StyledRun>& runs, std::string_view default_color) {
        std::string out;
        for (const auto& run : runs) {
            if (run.foreground) {
                const Color& c = *run.foreground;
                out += std::format("\x1b[38;2;{};{};{}m", c.r, c.g, c.b);
            } else {
                out += "\x1b[0m";
                out += default_color;
            }
            out += run.text;
        }
        out += "\x1b[0m";
        return out;
    }

}
