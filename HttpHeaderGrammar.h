// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpCursor.h"
#include "HttpLimits.h"
#include "HttpRequest.h"

#include <cstddef>
#include <string_view>
#include <system_error>

enum class HttpHeaderEvent
{
    /// more input is needed to complete the current line
    Incomplete,

    /// one field was appended to the header list
    Field,

    /// the empty line terminating the section was consumed
    End,

    Failed,
};

struct HttpHeaderResult
{
    HttpHeaderEvent event;
    std::error_code error {};
};

/**
 * Parses header (or trailer) fields, one line per call.
 *
 * <pre>
 *   header-field = field-name ":" OWS field-value OWS
 *   field-name   = token
 *   field-value  = *( field-vchar / SP / HT )
 *   obs-fold     = CRLF 1*( SP / HT )    ; rejected
 * </pre>
 *
 * Field count and section size are tracked cumulatively across calls, so the
 * same instance used for headers and trailers enforces one shared budget.
 */
class HttpHeaderGrammar
{
  public:
    explicit HttpHeaderGrammar(HttpLimits const& limits) noexcept;

    HttpHeaderResult parse(HttpCursor& cursor, HttpHeaderList& headers);

    /// Splits and validates a single field line (CRLF already stripped).
    static std::error_code parseField(std::string_view line,
                                      std::string_view& name,
                                      std::string_view& value) noexcept;

    std::size_t fieldCount() const noexcept { return _fieldCount; }
    std::size_t sectionBytes() const noexcept { return _sectionBytes; }

  private:
    std::size_t _maxCount;
    std::size_t _maxFieldBytes;
    std::size_t _maxSectionBytes;

    std::size_t _fieldCount = 0;
    std::size_t _sectionBytes = 0;

    HttpLineBuffer _line;
};
