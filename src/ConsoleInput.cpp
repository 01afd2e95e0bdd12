#include "pickcal/ConsoleInput.h"

namespace pickcal {

QStringList CommandLineBuffer::append(const QByteArray &bytes)
{
    m_pending.append(bytes);

    QStringList lines;
    qsizetype start = 0;
    qsizetype newline = m_pending.indexOf('\n', start);
    while (newline >= 0) {
        const QString line = QString::fromUtf8(m_pending.mid(start, newline - start)).trimmed();
        if (!line.isEmpty()) {
            lines.append(line);
        }
        start = newline + 1;
        newline = m_pending.indexOf('\n', start);
    }
    m_pending.remove(0, start);
    return lines;
}

QString CommandLineBuffer::takeRemainder()
{
    const QString line = QString::fromUtf8(m_pending).trimmed();
    m_pending.clear();
    return line;
}

} // namespace pickcal
