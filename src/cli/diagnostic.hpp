//! # Diagnostic System Interface
//!
//! This header defines how lint issues are printed.
//!
//! ## Text Format
//!
//! ```text
//! error[TextDomain.ReplaceDomain]: Text domain "old" in function __() should ...
//!   --> includes/admin.php:12:20
//!      |
//!   12 |     echo __( 'Settings', 'old' );
//!      |                          ^^^^^
//!      |
//!   = fix: replace with 'new'
//! ```
//!
//! ## JSON Format
//!
//! One object per line, for editors and CI annotations:
//! `{"severity":"error","code":...,"message":...,"span":{...},"fixes":[...]}`

#pragma once

#include "common.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace domainfix::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Green = "\033[32m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightBlue = "\033[94m";
};

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class DiagnosticFormat { Text, JSON };

// Fix-it hint for automatic code correction
struct DiagnosticFixIt {
    SourceSpan span;         // Text being replaced
    std::string replacement; // Text to put in its place
    std::string description; // Human-readable description
};

// Diagnostics are always errors
struct Diagnostic {
    std::string code;    // Issue code (e.g., "TextDomain.ReplaceDomain")
    std::string message; // Main message
    SourceSpan primary_span;
    std::vector<DiagnosticFixIt> fixes;
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(DiagnosticFormat format) {
        format_ = format;
    }
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const Diagnostic& diag);

    // Statistics
    size_t error_count() const {
        return error_count_;
    }

    static std::string escape_json_string(const std::string& s);

private:
    std::ostream& out_;
    bool use_colors_ = true;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    std::unordered_map<std::string, std::string> source_files_; // path -> content
    size_t error_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const SourceSpan& span);
    void emit_fixes(const std::vector<DiagnosticFixIt>& fixes);

    void emit_json(const Diagnostic& diag);
    void emit_json_span(const SourceSpan& span);

    std::string get_source_line(const std::string& path, uint32_t line) const;
};

// Check if terminal supports colors
bool terminal_supports_colors();

} // namespace domainfix::cli
