#pragma once

#include <QGraphicsEffect>
#include <QPainter>
#include <QPropertyAnimation>
#include <QWidget>

/*!
 * \brief Semi-transparent overlay shown over the window while files are dragged onto it.
 */
class OverlayWidget final : public QWidget
{
public:
    explicit OverlayWidget(QWidget* parent = nullptr)
        : QWidget(parent)
    {
        setAttribute(Qt::WA_TransparentForMouseEvents);
        setAttribute(Qt::WA_NoSystemBackground);
        setAttribute(Qt::WA_TranslucentBackground);

        opacityEffect = new QGraphicsOpacityEffect(this);
        setGraphicsEffect(opacityEffect);

        fadeAnimation = new QPropertyAnimation(opacityEffect, "opacity", this);
        fadeAnimation->setDuration(200);
    }

    void setMessage(const QString& text, const QColor& background)
    {
        this->text = text;
        this->backgroundColor = background;
        update();
    }

    void showWithFade()
    {
        disconnect(onFadeOutFinished);
        setGeometry(parentWidget() ? parentWidget()->rect() : rect());
        raise();
        show();

        fadeAnimation->stop();
        fadeAnimation->setStartValue(0.0);
        fadeAnimation->setEndValue(1.0);
        fadeAnimation->start();
    }

    void hideWithFade()
    {
        fadeAnimation->stop();
        fadeAnimation->setStartValue(1.0);
        fadeAnimation->setEndValue(0.0);

        disconnect(onFadeOutFinished);
        onFadeOutFinished = connect(fadeAnimation, &QPropertyAnimation::finished, this, &OverlayWidget::hide);
        fadeAnimation->start();
    }

protected:
    void paintEvent(QPaintEvent*) override
    {
        QPainter painter(this);
        painter.fillRect(rect(), backgroundColor);

        QPen border(Qt::white, 3, Qt::DashLine);
        painter.setPen(border);
        painter.drawRoundedRect(rect().adjusted(16, 16, -16, -16), 12, 12);

        QFont font = painter.font();
        font.setPointSize(24);
        painter.setFont(font);
        painter.drawText(rect(), Qt::AlignCenter, text);
    }

private:
    QString text;
    QColor backgroundColor = QColor(0, 0, 0, 128);
    QGraphicsOpacityEffect* opacityEffect;
    QPropertyAnimation* fadeAnimation;

    QMetaObject::Connection onFadeOutFinished;
};
