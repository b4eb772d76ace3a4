// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpCursor.h"

#include <cstddef>
#include <string_view>

/// Content-Length framed body.
///
/// Never takes more than the announced length from the input; any bytes
/// beyond it belong to the next message.
class HttpFixedLengthBody
{
  public:
    explicit HttpFixedLengthBody(std::size_t length) noexcept: _remaining(length) {}

    /// Takes as many body bytes as available, up to the remaining length.
    std::string_view consume(HttpCursor& cursor) noexcept;

    bool done() const noexcept { return _remaining == 0; }
    std::size_t remaining() const noexcept { return _remaining; }

  private:
    std::size_t _remaining;
};
