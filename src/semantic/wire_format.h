#pragma once
#include <QString>
#include <optional>

// The two client-facing and provider-facing message dialects.
enum class WireFormat : quint8 {
    Anthropic, OpenAI
};

inline QString wireFormatName(WireFormat format)
{
    return format == WireFormat::Anthropic ? QStringLiteral("anthropic")
                                           : QStringLiteral("openai");
}

inline std::optional<WireFormat> parseWireFormat(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("anthropic"))
        return WireFormat::Anthropic;
    if (n == QStringLiteral("openai"))
        return WireFormat::OpenAI;
    return std::nullopt;
}
