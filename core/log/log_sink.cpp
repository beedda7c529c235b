#include "log_sink.hpp"

#include <QMutexLocker>

void LogSink::append(const QString& line)
{
    {
        QMutexLocker locker(&mutex);
        buffer.append(line);
    }

    emit lineAppended(line);
}

void LogSink::clear()
{
    {
        QMutexLocker locker(&mutex);
        buffer.clear();
    }

    emit cleared();
}

QStringList LogSink::lines() const
{
    QMutexLocker locker(&mutex);
    return buffer;
}

QStringList LogSink::linesFrom(qsizetype index) const
{
    QMutexLocker locker(&mutex);
    return index >= buffer.size() ? QStringList() : buffer.mid(index);
}

qsizetype LogSink::size() const
{
    QMutexLocker locker(&mutex);
    return buffer.size();
}
