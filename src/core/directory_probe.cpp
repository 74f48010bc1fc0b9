/**
 * @file directory_probe.cpp
 * @brief Filter policy for directory query replies and path normalization.
 */

#include "core/directory_probe.hpp"
#include "core/escape_decoder.hpp"
#include <algorithm>
#include <cctype>

namespace tether::core {

    namespace {
        std::string_view trim(std::string_view s) {
            const char* ws = " \t\r\n\x0b\x0c";
            size_t first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) return {};
            size_t last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        bool starts_with_ci(std::string_view s, std::string_view prefix) {
            if (s.size() < prefix.size()) return false;
            for (size_t i = 0; i < prefix.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(s[i])) !=
                    std::tolower(static_cast<unsigned char>(prefix[i]))) return false;
            }
            return true;
        }

        bool is_drive_path(std::string_view s) {
            return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
        }

        bool is_unc_path(std::string_view s) {
            return s.starts_with("\\\\");
        }

        bool is_win_sep(char c) { return c == '\\' || c == '/'; }
    }

    bool is_prompt_echo(std::string_view line) {
        std::string_view t = trim(line);
        if (!t.starts_with("PS ")) return false;
        return t.ends_with('>') || t.find("> ") != std::string_view::npos;
    }

    bool is_table_furniture(std::string_view line) {
        std::string_view t = trim(line);
        return t.starts_with("----") || starts_with_ci(t, "path");
    }

    bool looks_like_path(std::string_view line) {
        std::string_view t = trim(line);
        if (t.empty()) return false;
        if (t.front() == '/') return true;
        if (t.size() <= 2) return false;

        if (is_drive_path(t)) return is_win_sep(t[2]);
        if (is_unc_path(t)) return true;
        return t.find("::") != std::string_view::npos;
    }

    std::string normalize_directory(std::string_view path) {
        std::string_view t = trim(path);
        if (t.empty()) return {};

        // Provider-qualified paths are PowerShell's own notation; leave them alone.
        if (t.find("::") != std::string_view::npos) return std::string(t);

        const bool windows_style = is_drive_path(t) || is_unc_path(t);
        const char sep = windows_style ? '\\' : '/';
        auto is_sep = [windows_style](char c) { return windows_style ? is_win_sep(c) : c == '/'; };

        // --- Root prefix ---
        std::string root;
        size_t pos = 0;
        std::vector<std::string> root_parts; // UNC server + share

        if (is_unc_path(t)) {
            root = "\\\\";
            pos = 2;
        } else if (windows_style) {
            root = std::string(t.substr(0, 2));
            pos = 2;
            if (t.size() > 2 && is_sep(t[2])) {
                root += sep;
                pos = 3;
            }
        } else if (t.front() == '/') {
            root = "/";
            pos = 1;
        }

        // --- Components ---
        std::vector<std::string> parts;
        while (pos < t.size()) {
            size_t end = pos;
            while (end < t.size() && !is_sep(t[end])) ++end;
            std::string_view comp = t.substr(pos, end - pos);
            pos = end + 1;

            if (comp.empty() || comp == ".") continue;

            if (is_unc_path(t) && root_parts.size() < 2) {
                root_parts.emplace_back(comp);
                continue;
            }

            if (comp == "..") {
                if (!parts.empty() && parts.back() != "..") {
                    parts.pop_back();
                } else if (root.empty()) {
                    parts.emplace_back(comp);
                }
                // ".." at a root stays at the root.
                continue;
            }
            parts.emplace_back(comp);
        }

        std::string result = root;
        for (size_t i = 0; i < root_parts.size(); ++i) {
            if (i > 0) result += sep;
            result += root_parts[i];
        }
        if (!root_parts.empty() && !parts.empty()) result += sep;

        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += sep;
            result += parts[i];
        }

        if (result.empty()) return ".";
        return result;
    }

    std::optional<std::string> extract_directory(const std::vector<OutputLine>& lines,
                                                 const std::vector<std::string>& extra_prompts) {
        for (const auto& line : lines) {
            // Error records (e.g. "Set-Location: Cannot find path ...") come on stderr.
            if (line.stream != StreamKind::Stdout) continue;

            std::string clean = strip_escapes(line.text);
            std::string_view t = trim(clean);

            if (t.empty()) continue;
            if (is_prompt_echo(t)) continue;
            if (is_table_furniture(t)) continue;

            bool is_prompt = std::any_of(extra_prompts.begin(), extra_prompts.end(), [t](const std::string& p) {
                std::string_view prompt = trim(p);
                return !prompt.empty() && t.ends_with(prompt);
            });
            if (is_prompt) continue;

            // "Label: value" formatting never appears in a bare path reply.
            if (t.find(": ") != std::string_view::npos) continue;

            if (looks_like_path(t)) return std::string(t);
        }
        return std::nullopt;
    }

}
