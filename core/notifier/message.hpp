#ifndef MESSAGE_H
#define MESSAGE_H

#include <QString>

enum class Severity {
    Info,
    Warning,
    Error,
    Critical // should terminate program
};

//!
//! \brief Represents a message to be displayed to the user.
//!
struct Message {
public:
    Message(Severity severity, QString title, QString message, QString details = "")
        : severity(severity)
        , title(std::move(title))
        , message(std::move(message))
        , details(std::move(details))
    {
    }

    Severity severity;
    QString title;
    QString message;
    QString details;
};

#endif
