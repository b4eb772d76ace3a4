// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

namespace spdlog
{
class logger;
}

/// Upper bounds enforced incrementally while parsing.
///
/// Every limit must be positive. Exceeding any of them is a fatal parse error,
/// never a silent truncation.
struct HttpLimits
{
    /// request-line bytes, excluding the terminating CRLF
    std::size_t maxRequestLineLength = 8192;

    /// number of header fields, trailer fields included
    std::size_t maxHeaderCount = 100;

    /// sum of all header (and trailer) line bytes, excluding line terminators
    std::size_t maxHeaderSectionBytes = 64 * 1024;

    /// bytes of a single header line, excluding the terminating CRLF
    std::size_t maxSingleHeaderBytes = 8192;

    /// decoded body bytes
    std::size_t maxBodySize = 8 * 1024 * 1024;

    /// bytes of a chunk-size line (size and extensions), excluding CRLF
    std::size_t maxChunkLineLength = 1024;

    /// @return the name of the first limit that is zero, or an empty view if
    ///         all limits are valid.
    std::string_view validate() const noexcept;
};

enum class HttpBodyMode
{
    /// the body is collected into HttpRequest::body
    Buffered,

    /// the body is handed out piecewise as HttpMilestone::BodyData progress,
    /// HttpRequest::body stays empty
    Streaming,
};

struct HttpParserConfig
{
    HttpLimits limits {};
    HttpBodyMode bodyMode = HttpBodyMode::Buffered;

    /// logger for trace/debug output; spdlog's default logger if null
    std::shared_ptr<spdlog::logger> logger {};
};
