// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/// Read position within the fragment currently being fed.
///
/// The cursor never owns bytes. Views handed out by take() and rest() point
/// into the caller's fragment and stay valid as long as that fragment does.
class HttpCursor
{
  public:
    explicit HttpCursor(std::string_view input) noexcept: _input(input) {}

    bool empty() const noexcept { return _offset == _input.size(); }
    std::size_t consumed() const noexcept { return _offset; }
    std::size_t remaining() const noexcept { return _input.size() - _offset; }

    /// The next unconsumed byte. Must not be called on an empty cursor.
    char peek() const noexcept { return _input[_offset]; }

    std::string_view rest() const noexcept { return _input.substr(_offset); }

    /// Consumes up to @p n bytes and returns them without copying.
    std::string_view take(std::size_t n) noexcept;

    void advance(std::size_t n) noexcept;

  private:
    std::string_view _input;
    std::size_t _offset = 0;
};

enum class HttpLineStatus
{
    /// a full line (terminated by LF) is available
    Complete,

    /// all available bytes were consumed, but no LF was seen yet
    Incomplete,

    /// the line exceeds the allowed length; nothing is consumed
    TooLong,
};

struct HttpLineScan
{
    HttpLineStatus status;

    /// line content without CRLF (valid only if status is Complete)
    std::string_view line {};

    /// true if the line was terminated by a LF without preceding CR
    bool bareLF = false;
};

/// Assembles one CRLF-terminated line across fragment boundaries.
///
/// Bytes are only copied when a line spans more than one fragment, and never
/// more than the configured maximum (plus CR) is retained.
class HttpLineBuffer
{
  public:
    /// Scans for the end of the current line.
    ///
    /// @param cursor     input to consume from
    /// @param maxContent maximum line length, excluding CRLF
    ///
    /// The returned line view points either into the cursor's fragment or into
    /// this buffer and is valid until the next call to scan() or clear().
    HttpLineScan scan(HttpCursor& cursor, std::size_t maxContent);

    void clear() noexcept
    {
        _partial.clear();
        _completed = false;
    }

    /// Number of bytes of the current, incomplete line retained so far.
    std::size_t size() const noexcept { return _completed ? 0 : _partial.size(); }

  private:
    std::string _partial;
    bool _completed = false;
};
