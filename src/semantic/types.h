#pragma once
#include <QtGlobal>

enum class FrameType : quint8 {
    Started, Delta, ToolDelta, UsageDelta, Finished, Failed
};

enum class SegmentKind : quint8 {
    Text, Media, Structured
};

enum class ErrorKind : quint8 {
    InvalidInput,    // 400
    Unauthorized,    // 401
    Forbidden,       // 403
    NotFound,        // 404
    RateLimited,     // 429  (retryable)
    Unavailable,     // 503  (retryable)
    Timeout,         // 504  (retryable)
    NotSupported,    // 501
    Configuration,   // 500, startup only
    Internal         // 500
};

enum class StopCause : quint8 {
    Completed, Length, ContentFilter, ToolCall
};
