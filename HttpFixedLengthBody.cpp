// SPDX-License-Identifier: Apache-2.0
#include "HttpFixedLengthBody.h"

std::string_view HttpFixedLengthBody::consume(HttpCursor& cursor) noexcept
{
    auto const data = cursor.take(_remaining);
    _remaining -= data.size();
    return data;
}
