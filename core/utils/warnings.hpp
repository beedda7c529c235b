#ifndef WARNINGS_HPP
#define WARNINGS_HPP

#include <QMap>
#include <QString>
#include <QWidget>

//! Conditions that probably make the next compression fail, without blocking it.
enum class Warning {
    GpuWithoutNvidia,
    PresetUnsupportedByNvenc
};

//!
//! \brief Shows the active warnings as the tooltip of an indicator widget.
//! \details The indicator is hidden while no warning is active.
//!
class Warnings
{
public:
    explicit Warnings(QWidget* indicator);

    void Set(Warning warning, const QString& text, bool active);
    bool isEmpty() const { return m_active.isEmpty(); }

private:
    void UpdateIndicator() const;

    QWidget* m_indicator;
    QMap<Warning, QString> m_active;
};

#endif // WARNINGS_HPP
