#ifndef LOG_SINK_H
#define LOG_SINK_H

#include <QMutex>
#include <QObject>
#include <QStringList>

//!
//! \brief Append-only buffer of encoder diagnostics, shared by the relay and the display.
//! \details Safe to use from any thread. lineAppended is emitted from the appending thread.
//!
class LogSink final : public QObject
{
    Q_OBJECT

public:
    LogSink() = default;

    void append(const QString& line);
    void clear();

    [[nodiscard]] QStringList lines() const;
    [[nodiscard]] QStringList linesFrom(qsizetype index) const;
    [[nodiscard]] qsizetype size() const;

signals:
    void lineAppended(const QString& line);
    void cleared();

private:
    mutable QMutex mutex;
    QStringList buffer;
};

#endif
