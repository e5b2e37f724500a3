//! # Source File Management
//!
//! Owns the text of the translation unit and maps byte offsets to
//! line/column positions for spans and diagnostics.
//!
//! ```cpp
//! auto result = Source::from_file("main.kin");
//! if (is_err(result)) { ... }
//! const Source& source = unwrap(result);
//! SourceLocation loc = source.location(4);
//! std::string_view text = source.line(loc.line);
//! ```

#ifndef KINDRED_LEXER_SOURCE_HPP
#define KINDRED_LEXER_SOURCE_HPP

#include "common.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kindred::lexer {

/// A source file with a line index.
///
/// Spans hold a `string_view` of the file name. The name lives on the heap
/// and is shared between copies, so those views stay valid when the
/// `Source` itself is moved.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return *filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Byte at `offset`, or `'\0'` past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Substring `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// 1-based line/column of a byte offset (binary search on the line index).
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Span covering `[start, end)`.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan;

    /// Text of a 1-based line without its line terminator. Empty if out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Reads a file from disk.
    ///
    /// Fails with a message when the file does not exist, is a directory, or
    /// cannot be read.
    [[nodiscard]] static auto from_file(const std::filesystem::path& path)
        -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::shared_ptr<const std::string> filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start

    void build_line_index();
};

} // namespace kindred::lexer

#endif // KINDRED_LEXER_SOURCE_HPP
