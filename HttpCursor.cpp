// SPDX-License-Identifier: Apache-2.0
#include "HttpCursor.h"

#include <algorithm>
#include <limits>

namespace
{
char constexpr CR = 0x0D;
char constexpr LF = 0x0A;
} // namespace

std::string_view HttpCursor::take(std::size_t n) noexcept
{
    auto const result = _input.substr(_offset, std::min(n, remaining()));
    _offset += result.size();
    return result;
}

void HttpCursor::advance(std::size_t n) noexcept
{
    _offset += std::min(n, remaining());
}

HttpLineScan HttpLineBuffer::scan(HttpCursor& cursor, std::size_t maxContent)
{
    if (_completed)
        clear();

    // capped so that limit + 2 cannot wrap
    std::size_t const limit = std::min(maxContent, std::numeric_limits<std::size_t>::max() - 2);

    // _partial.size() <= limit + 1 holds here; the extra byte can only be the
    // CR of the pending CRLF.
    std::size_t const window = limit + 2 - _partial.size();
    std::string_view const available = cursor.rest().substr(0, window);

    if (auto const lf = available.find(LF); lf != std::string_view::npos)
    {
        std::string_view line = available.substr(0, lf);
        cursor.advance(lf + 1);

        if (!_partial.empty())
        {
            _partial.append(line);
            line = _partial;
        }
        _completed = true;

        if (line.empty() || line.back() != CR)
            return HttpLineScan { HttpLineStatus::Complete, line, true };

        line.remove_suffix(1);
        return HttpLineScan { HttpLineStatus::Complete, line, false };
    }

    std::size_t const total = _partial.size() + available.size();

    if (available.size() == window)
        return HttpLineScan { HttpLineStatus::TooLong };

    if (!available.empty() && total == limit + 1 && available.back() != CR)
        return HttpLineScan { HttpLineStatus::TooLong };

    _partial.append(available);
    cursor.advance(available.size());
    return HttpLineScan { HttpLineStatus::Incomplete };
}
