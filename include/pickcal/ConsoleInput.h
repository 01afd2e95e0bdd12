#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace pickcal {

/**
 * Splits raw console input into command lines. Bytes arrive in arbitrary
 * chunks; every complete newline-terminated line in a chunk is returned at
 * once and a trailing partial line is held until its newline arrives.
 */
class CommandLineBuffer {
public:
    QStringList append(const QByteArray &bytes);

    // Hands out the unterminated tail, e.g. when input reaches end of file.
    QString takeRemainder();

    bool hasPartialLine() const { return !m_pending.isEmpty(); }

private:
    QByteArray m_pending;
};

} // namespace pickcal
