#ifndef SATURATING_H
#define SATURATING_H

#include <QtGlobal>
#include <limits>

// Unsigned arithmetic that clamps instead of wrapping
namespace Saturating {

inline quint64 sub(quint64 a, quint64 b)
{
    return a > b ? a - b : 0;
}

inline quint64 mul(quint64 a, quint64 b)
{
    if (a != 0 && b > std::numeric_limits<quint64>::max() / a) {
        return std::numeric_limits<quint64>::max();
    }
    return a * b;
}

// Clamp into the signed millisecond range used by Qt time APIs
inline qint64 toSigned(quint64 value)
{
    const quint64 max = static_cast<quint64>(std::numeric_limits<qint64>::max());
    return static_cast<qint64>(value > max ? max : value);
}

} // namespace Saturating

#endif // SATURATING_H
