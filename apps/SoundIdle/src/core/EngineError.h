#ifndef ENGINEERROR_H
#define ENGINEERROR_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Failure reported by the platform adapters and the inactivity engine
 *
 * Adapters return bool and keep the failure available through lastError(),
 * the engine logs it and stops. InvalidThreshold and UnsupportedPlatform are
 * returned to the caller of a command and never touch the running loop.
 */
class EngineError
{
public:
    enum Kind {
        NoError = 0,
        PlatformQuery,      // idle-time read failed
        AudioQuery,         // endpoint volume/mute read failed
        AudioCommand,       // endpoint volume/mute write failed
        PlatformSession,    // COM apartment / sound server session setup failed
        InvalidThreshold,   // zero or otherwise invalid duration
        UnsupportedPlatform,
        Spawn               // background thread could not be created
    };

    EngineError();
    EngineError(Kind kind, const QString &context, const QString &message = QString(), qint64 code = 0);

    bool isError() const { return m_kind != NoError; }
    Kind kind() const { return m_kind; }
    QString context() const { return m_context; }
    QString message() const { return m_message; }
    qint64 code() const { return m_code; }

    // "<context>: <message>", or "<context>: code 0x%08X" without a message
    QString toString() const;

    static QString kindName(Kind kind);

    bool operator==(const EngineError &other) const;
    bool operator!=(const EngineError &other) const { return !(*this == other); }

private:
    Kind m_kind;
    QString m_context;
    QString m_message;
    qint64 m_code;
};

#endif // ENGINEERROR_H
