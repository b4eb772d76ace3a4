// SPDX-License-Identifier: Apache-2.0
#include "HttpLimits.h"

std::string_view HttpLimits::validate() const noexcept
{
    if (maxRequestLineLength == 0)
        return "maxRequestLineLength";
    if (maxHeaderCount == 0)
        return "maxHeaderCount";
    if (maxHeaderSectionBytes == 0)
        return "maxHeaderSectionBytes";
    if (maxSingleHeaderBytes == 0)
        return "maxSingleHeaderBytes";
    if (maxBodySize == 0)
        return "maxBodySize";
    if (maxChunkLineLength == 0)
        return "maxChunkLineLength";

    return {};
}
