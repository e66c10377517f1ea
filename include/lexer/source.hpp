//! # Source File Management
//!
//! A loaded PHP source file with byte-offset to line/column mapping.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("includes/admin.php");
//! if (is_err(result)) {
//!     report(unwrap_err(result));
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//!
//! SourceLocation loc = source.location(6); // line 1, column 7
//! std::string_view line = source.line(1);
//! ```

#ifndef DOMAINFIX_LEXER_SOURCE_HPP
#define DOMAINFIX_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domainfix::lexer {

/// A source file with efficient location tracking.
///
/// The source owns its content. Views returned by `content()`, `slice()`
/// and `line()`, and the lexemes of tokens produced from it, are valid as
/// long as the Source object exists and is not moved from.
class Source {
public:
    /// Constructs a source from a filename and content. Builds the line index.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the substring `[start, end)`, clamped to valid bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-indexed line/column location.
    ///
    /// Uses binary search on the line index.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the content of a 1-indexed line without its line terminator.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace domainfix::lexer

#endif // DOMAINFIX_LEXER_SOURCE_HPP
