#pragma once

#include "log/log_sink.hpp"
#include "notifier/notifier.hpp"
#include "queue/queue_supervisor.hpp"
#include "settings/settings.hpp"
#include "ui/overlay_widget.hpp"
#include "utils/platform_info.hpp"
#include "utils/warnings.hpp"

#include <QMainWindow>
#include <boost/di.hpp>

class QCheckBox;
class QComboBox;
class QLabel;
class QMimeData;
class QPlainTextEdit;
class QPushButton;
class QSpinBox;
class QStackedWidget;
class QTableWidget;
class QToolButton;
struct EncodeConfig;

class MainWindow final : public QMainWindow
{
    Q_OBJECT

public:
    BOOST_DI_INJECT(
        MainWindow,
        QueueSupervisor& queue,
        JobLauncher& launcher,
        LogSink& log,
        std::shared_ptr<Settings> settings,
        Notifier& notifier,
        PlatformInfo& platformInfo
    );

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragLeaveEvent(QDragLeaveEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void StartCompression();
    void SaveConfig();
    void RefreshQueue();
    void UpdateBusyState(bool busy);
    void AppendLogLine(const QString& line);
    void HandleLaunchFailure(const QString& program, const QString& reason);

private:
    void SetupUi();
    void SetupEventCallbacks();
    void CheckForFFmpeg() const;
    void LoadConfig();
    void ApplyTheme(bool dark);
    void UpdateWarnings();

    [[nodiscard]] EncodeConfig configFromControls() const;
    [[nodiscard]] static QStringList localFiles(const QMimeData* mimeData);

    QueueSupervisor& queue;
    JobLauncher& launcher;
    LogSink& log;
    std::shared_ptr<Settings> settings;
    Notifier& notifier;
    PlatformInfo& platformInfo;

    QSpinBox* targetSizeSpinBox;
    QSpinBox* fpsSpinBox;
    QComboBox* encoderComboBox;
    QComboBox* resolutionComboBox;
    QComboBox* presetComboBox;
    QCheckBox* darkModeCheckBox;
    QToolButton* warningTooltipButton;

    QStackedWidget* queueStack;
    QTableWidget* queueTable;
    QPushButton* startButton;
    QPushButton* cancelButton;
    QPushButton* clearButton;
    QLabel* statusLabel;
    QPlainTextEdit* logView;

    OverlayWidget* overlay;
    std::unique_ptr<Warnings> warnings;

    bool loadingConfig = false;
    bool isDragging = false;
};
