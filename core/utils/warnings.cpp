#include "warnings.hpp"

#include <QStringList>

Warnings::Warnings(QWidget* indicator)
    : m_indicator { indicator }
{
    UpdateIndicator();
}

void Warnings::Set(Warning warning, const QString& text, bool active)
{
    if (active)
        m_active.insert(warning, text);
    else
        m_active.remove(warning);

    UpdateIndicator();
}

void Warnings::UpdateIndicator() const
{
    if (!m_indicator)
        return;

    QStringList lines;
    for (const QString& text : m_active)
        lines.append("⚠ " + text);

    m_indicator->setVisible(!lines.isEmpty());
    m_indicator->setToolTip(lines.join("\n"));
}
