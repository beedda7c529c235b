#include "message_box_notifier.hpp"

#include <QApplication>
#include <QMessageBox>

namespace
{
QMessageBox::Icon iconFor(Severity severity)
{
    switch (severity)
    {
    case Severity::Info:
        return QMessageBox::Information;
    case Severity::Warning:
        return QMessageBox::Warning;
    case Severity::Error:
    case Severity::Critical:
        return QMessageBox::Critical;
    }

    return QMessageBox::NoIcon;
}
}

void MessageBoxNotifier::Notify(const Message& message) const
{
    Notify(message.severity, message.title, message.message, message.details);
}

void MessageBoxNotifier::Notify(Severity severity, const QString& title, const QString& message, const QString& details) const
{
    QMessageBox dialog;
    dialog.setWindowTitle(QApplication::applicationName());
    dialog.setIcon(iconFor(severity));
    dialog.setText("<font size=5><b>" + title + ".</b></font>");
    dialog.setInformativeText(message);
    dialog.setDetailedText(details);
    dialog.setStandardButtons(QMessageBox::Ok);
    dialog.exec();

    // wait until event loop has begun before attempting to exit
    if (severity == Severity::Critical)
        QMetaObject::invokeMethod(QApplication::instance(), [] { QApplication::exit(1); }, Qt::QueuedConnection);
}
