#include "tools/text_edit.hpp"

#include <sstream>

namespace memvault::tools::text {

namespace {

std::string convert_line_endings(const std::string& text, const std::string& eol) {
    if (eol == "\n") {
        return text;
    }
    std::string converted;
    converted.reserve(text.size() + 16);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            converted += eol;
        } else {
            converted.push_back(text[i]);
        }
    }
    return converted;
}

}  // namespace

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (begin < content.size()) {
        const std::size_t newline = content.find('\n', begin);
        if (newline == std::string::npos) {
            lines.push_back(content.substr(begin));
            break;
        }
        lines.push_back(content.substr(begin, newline - begin + 1));
        begin = newline + 1;
    }
    return lines;
}

std::string strip_line_ending(const std::string& line) {
    std::size_t length = line.size();
    if (length > 0 && line[length - 1] == '\n') {
        --length;
        if (length > 0 && line[length - 1] == '\r') {
            --length;
        }
    }
    return line.substr(0, length);
}

std::string detect_line_ending(const std::string& content) {
    const std::size_t newline = content.find('\n');
    if (newline != std::string::npos && newline > 0 && content[newline - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

std::size_t count_occurrences(const std::string& haystack, const std::string& needle,
                              const std::size_t limit) {
    if (needle.empty()) {
        return 0;
    }
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos && count < limit) {
        ++count;
        pos = haystack.find(needle, pos + 1);
    }
    return count;
}

std::string render_numbered(const std::vector<std::string>& lines,
                            const std::size_t first, const std::size_t last) {
    std::ostringstream out;
    for (std::size_t n = first; n <= last && n <= lines.size(); ++n) {
        if (n != first) {
            out << "\n";
        }
        out << n << "\t" << strip_line_ending(lines[n - 1]);
    }
    return out.str();
}

std::string insert_at_line(const std::string& content, const std::size_t index,
                           const std::string& text) {
    if (content.empty()) {
        return text;
    }

    std::vector<std::string> lines = split_lines(content);
    const std::string eol = detect_line_ending(content);
    std::string block = convert_line_endings(text, eol);

    const bool appending = index >= lines.size();
    const bool last_unterminated = lines.back().empty() || lines.back().back() != '\n';
    if (appending && last_unterminated) {
        // Keep the file's "no trailing newline" shape: terminate the old last
        // line and leave the new block as the unterminated tail.
        lines.back() += eol;
    } else if (block.empty() || block.back() != '\n') {
        block += eol;
    }

    std::string result;
    result.reserve(content.size() + block.size() + eol.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i == index) {
            result += block;
        }
        result += lines[i];
    }
    if (appending) {
        result += block;
    }
    return result;
}

}  // namespace memvault::tools::text
