#include "diagnostic.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace domainfix::cli {

namespace {

constexpr int LINE_NUMBER_WIDTH = 4;

/// Columns covered by a span on its first line (at least one). A span that
/// continues on later lines covers the rest of `line`.
uint32_t span_width(const SourceSpan& span, const std::string& line) {
    uint32_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    if (span.end.line > span.start.line) {
        auto length = static_cast<uint32_t>(line.length());
        return length > start_col ? length - start_col : 1;
    }
    if (span.end.column >= span.start.column) {
        return span.end.column - span.start.column + 1;
    }
    return span.start.length > 0 ? span.start.length : 1;
}

} // anonymous namespace

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return isatty(fileno(stdout)) != 0;
#else
    // Reports go to stdout, so that is the stream that has to be a terminal
    if (!isatty(fileno(stdout)))
        return false;

    if (std::getenv("NO_COLOR") != nullptr)
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    size_t line_start = 0;
    for (uint32_t current = 1; current < line; ++current) {
        line_start = content.find('\n', line_start);
        if (line_start == std::string::npos)
            return "";
        ++line_start;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    if (line_end > line_start && content[line_end - 1] == '\r')
        --line_end;

    return content.substr(line_start, line_end - line_start);
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[TextDomain.ReplaceDomain]: message
    out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error";

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const SourceSpan& span) {
    std::string file_path(span.start.file);

    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << file_path << ":"
         << span.start.line << ":" << span.start.column << "\n";

    std::string source_line = get_source_line(file_path, span.start.line);
    if (source_line.empty()) {
        return;
    }

    int line_width =
        std::max(static_cast<int>(std::to_string(span.start.line).length()), LINE_NUMBER_WIDTH);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Underline, clipped to the line
    uint32_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    uint32_t end_col = start_col + span_width(span, source_line);
    end_col = std::min(end_col, static_cast<uint32_t>(source_line.length()));

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    for (uint32_t i = 0; i < start_col; ++i) {
        // Keep tabs so the caret lines up with the source line
        out_ << (i < source_line.length() && source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(Colors::BrightRed);
    for (uint32_t i = start_col; i < std::max(end_col, start_col + 1); ++i) {
        out_ << '^';
    }
    out_ << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_fixes(const std::vector<DiagnosticFixIt>& fixes) {
    for (const auto& fix : fixes) {
        out_ << color(Colors::BrightGreen) << "  = fix" << color(Colors::Reset) << ": "
             << fix.description << "\n";

        // The fixed text of a multi-line span does not fit on one line
        if (fix.span.end.line > fix.span.start.line) {
            continue;
        }

        std::string file_path(fix.span.start.file);
        std::string source_line = get_source_line(file_path, fix.span.start.line);
        if (source_line.empty()) {
            continue;
        }

        // Show the line as it will read after the fix
        uint32_t start_col = fix.span.start.column > 0 ? fix.span.start.column - 1 : 0;
        if (start_col > source_line.length()) {
            continue;
        }
        std::string fixed_line = source_line;
        fixed_line.replace(start_col, span_width(fix.span, source_line), fix.replacement);

        out_ << color(Colors::BrightBlue) << std::setw(LINE_NUMBER_WIDTH) << fix.span.start.line
             << " | " << color(Colors::Reset) << fixed_line.substr(0, start_col)
             << color(Colors::BrightGreen) << fix.replacement << color(Colors::Reset)
             << fixed_line.substr(start_col + fix.replacement.length()) << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    error_count_++;

    if (format_ == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag.primary_span);
    emit_fixes(diag.fixes);
}

// ============================================================================
// JSON Output
// ============================================================================

std::string DiagnosticEmitter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json_span(const SourceSpan& span) {
    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(std::string(span.start.file)) << "\",";
    out_ << "\"start\":{\"line\":" << span.start.line << ",\"column\":" << span.start.column
         << "},";
    out_ << "\"end\":{\"line\":" << span.end.line << ",\"column\":" << span.end.column << "}";
    out_ << "}";
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    out_ << "{";
    out_ << "\"severity\":\"error\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";
    emit_json_span(diag.primary_span);
    out_ << ",";

    out_ << "\"fixes\":[";
    bool first = true;
    for (const auto& fix : diag.fixes) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "{";
        out_ << "\"description\":\"" << escape_json_string(fix.description) << "\",";
        out_ << "\"replacement\":\"" << escape_json_string(fix.replacement) << "\",";
        emit_json_span(fix.span);
        out_ << "}";
    }
    out_ << "]";

    out_ << "}\n";
}

} // namespace domainfix::cli
