#include "EngineError.h"

EngineError::EngineError()
    : m_kind(NoError)
    , m_code(0)
{
}

EngineError::EngineError(Kind kind, const QString &context, const QString &message, qint64 code)
    : m_kind(kind)
    , m_context(context)
    , m_message(message.trimmed())
    , m_code(code)
{
}

QString EngineError::toString() const
{
    if (m_kind == NoError) {
        return QString();
    }

    QString context = m_context.isEmpty() ? kindName(m_kind) : m_context;

    if (!m_message.isEmpty()) {
        return QString("%1: %2").arg(context, m_message);
    }

    QString hex = QString("%1").arg(static_cast<quint32>(m_code), 8, 16, QLatin1Char('0')).toUpper();
    return QString("%1: code 0x%2").arg(context, hex);
}

QString EngineError::kindName(Kind kind)
{
    switch (kind) {
        case NoError:             return "NoError";
        case PlatformQuery:       return "PlatformQueryError";
        case AudioQuery:          return "AudioQueryError";
        case AudioCommand:        return "AudioCommandError";
        case PlatformSession:     return "PlatformSessionError";
        case InvalidThreshold:    return "InvalidThreshold";
        case UnsupportedPlatform: return "UnsupportedPlatform";
        case Spawn:               return "SpawnError";
    }
    return "Unknown";
}

bool EngineError::operator==(const EngineError &other) const
{
    return m_kind == other.m_kind
        && m_context == other.m_context
        && m_message == other.m_message
        && m_code == other.m_code;
}
