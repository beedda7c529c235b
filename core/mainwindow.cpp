#include "mainwindow.hpp"

#include "encoder/encode_config.hpp"
#include "settings/encode_config_store.hpp"
#include "utils/size_format.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDragEnterEvent>
#include <QFileInfo>
#include <QFontDatabase>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMimeData>
#include <QPalette>
#include <QPlainTextEdit>
#include <QProcess>
#include <QPushButton>
#include <QScrollBar>
#include <QSpinBox>
#include <QStackedWidget>
#include <QStatusBar>
#include <QStyle>
#include <QTabWidget>
#include <QTableWidget>
#include <QToolButton>
#include <QUrl>
#include <QVBoxLayout>

#include <algorithm>

namespace
{
enum QueueColumn
{
    StatusColumn,
    FileColumn,
    InputSizeColumn,
    OutputSizeColumn,
    ColumnCount
};

QString statusText(const QueueItem& item)
{
    switch (item.status)
    {
    case FileStatus::Waiting:
        return QObject::tr("🕓 Waiting");
    case FileStatus::Processing:
        return QObject::tr("🔄 Processing");
    case FileStatus::Done:
        break;
    }

    return item.outcome == JobOutcome::Succeeded ? QObject::tr("✅ Done") : QObject::tr("❌ Failed");
}

QPalette darkPalette()
{
    QPalette palette;
    palette.setColor(QPalette::Window, QColor(45, 45, 45));
    palette.setColor(QPalette::WindowText, Qt::white);
    palette.setColor(QPalette::Base, QColor(30, 30, 30));
    palette.setColor(QPalette::AlternateBase, QColor(45, 45, 45));
    palette.setColor(QPalette::ToolTipBase, Qt::white);
    palette.setColor(QPalette::ToolTipText, Qt::white);
    palette.setColor(QPalette::Text, Qt::white);
    palette.setColor(QPalette::Button, QColor(45, 45, 45));
    palette.setColor(QPalette::ButtonText, Qt::white);
    palette.setColor(QPalette::Highlight, QColor(42, 130, 218));
    palette.setColor(QPalette::HighlightedText, Qt::black);
    return palette;
}
}

MainWindow::MainWindow(
    QueueSupervisor& queue,
    JobLauncher& launcher,
    LogSink& log,
    std::shared_ptr<Settings> settings,
    Notifier& notifier,
    PlatformInfo& platformInfo
)
    : queue(queue)
    , launcher(launcher)
    , log(log)
    , settings(std::move(settings))
    , notifier(notifier)
    , platformInfo(platformInfo)
{
    SetupUi();
    LoadConfig();
    SetupEventCallbacks();
    RefreshQueue();
    UpdateBusyState(queue.isBusy());

    CheckForFFmpeg();
}

void MainWindow::SetupUi()
{
    setWindowTitle(QApplication::applicationName());
    setAcceptDrops(true);
    resize(720, 520);

    auto* tabs = new QTabWidget(this);
    setCentralWidget(tabs);

    // compression tab
    auto* mainTab = new QWidget(tabs);
    auto* mainLayout = new QVBoxLayout(mainTab);
    auto* form = new QFormLayout();

    targetSizeSpinBox = new QSpinBox(mainTab);
    targetSizeSpinBox->setRange(1, 1000000);
    targetSizeSpinBox->setSuffix(" MB");
    form->addRow(tr("Target size:"), targetSizeSpinBox);

    fpsSpinBox = new QSpinBox(mainTab);
    fpsSpinBox->setRange(0, 240);
    fpsSpinBox->setSpecialValueText(tr("Source"));
    form->addRow(tr("Frame rate:"), fpsSpinBox);

    encoderComboBox = new QComboBox(mainTab);
    encoderComboBox->addItem(tr("CPU (libx264)"), toString(EncoderChoice::Cpu));
    encoderComboBox->addItem(tr("GPU (NVENC)"), toString(EncoderChoice::Gpu));

    warningTooltipButton = new QToolButton(mainTab);
    warningTooltipButton->setText("⚠");
    warningTooltipButton->setAutoRaise(true);
    warnings = std::make_unique<Warnings>(warningTooltipButton);

    auto* encoderRow = new QHBoxLayout();
    encoderRow->addWidget(encoderComboBox, 1);
    encoderRow->addWidget(warningTooltipButton);
    form->addRow(tr("Encoder:"), encoderRow);

    resolutionComboBox = new QComboBox(mainTab);
    for (const QString& name : resolutionNames())
        resolutionComboBox->addItem(name == "original" ? tr("Original") : name, name);
    form->addRow(tr("Resolution:"), resolutionComboBox);

    presetComboBox = new QComboBox(mainTab);
    for (const QString& name : presetNames())
        presetComboBox->addItem(name == "none" ? tr("Encoder default") : name, name);
    form->addRow(tr("Preset:"), presetComboBox);

    darkModeCheckBox = new QCheckBox(tr("Dark mode"), mainTab);
    form->addRow(QString(), darkModeCheckBox);

    mainLayout->addLayout(form);

    auto* buttons = new QHBoxLayout();
    startButton = new QPushButton(tr("Start Compression"), mainTab);
    startButton->setMinimumHeight(40);
    QFont bold = startButton->font();
    bold.setBold(true);
    startButton->setFont(bold);

    cancelButton = new QPushButton(tr("Cancel"), mainTab);
    clearButton = new QPushButton(tr("Clear finished"), mainTab);

    buttons->addWidget(startButton, 1);
    buttons->addWidget(cancelButton);
    buttons->addWidget(clearButton);
    mainLayout->addLayout(buttons);

    queueStack = new QStackedWidget(mainTab);

    auto* dropPrompt = new QLabel(tr("📁\nDrop video files here to begin"), queueStack);
    dropPrompt->setAlignment(Qt::AlignCenter);
    dropPrompt->setEnabled(false);
    queueStack->addWidget(dropPrompt);

    queueTable = new QTableWidget(0, ColumnCount, queueStack);
    queueTable->setHorizontalHeaderLabels({ tr("Status"), tr("Filename"), tr("Input size"), tr("Output size") });
    queueTable->horizontalHeader()->setSectionResizeMode(FileColumn, QHeaderView::Stretch);
    queueTable->verticalHeader()->hide();
    queueTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    queueTable->setSelectionMode(QAbstractItemView::NoSelection);
    queueTable->setAlternatingRowColors(true);
    queueStack->addWidget(queueTable);

    mainLayout->addWidget(queueStack, 1);
    tabs->addTab(mainTab, tr("Main"));

    // encoder output tab
    logView = new QPlainTextEdit(tabs);
    logView->setReadOnly(true);
    logView->setMaximumBlockCount(10000);
    logView->setLineWrapMode(QPlainTextEdit::NoWrap);
    logView->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    tabs->addTab(logView, tr("FFmpeg Output"));

    statusLabel = new QLabel(this);
    statusBar()->addPermanentWidget(statusLabel);

    overlay = new OverlayWidget(this);
    overlay->hide();
}

void MainWindow::SetupEventCallbacks()
{
    connect(startButton, &QPushButton::clicked, this, &MainWindow::StartCompression);
    connect(cancelButton, &QPushButton::clicked, &launcher, &JobLauncher::cancel);
    connect(clearButton, &QPushButton::clicked, this, [this] { queue.clearFinished(); });

    connect(targetSizeSpinBox, &QSpinBox::valueChanged, this, &MainWindow::SaveConfig);
    connect(fpsSpinBox, &QSpinBox::valueChanged, this, &MainWindow::SaveConfig);
    connect(encoderComboBox, &QComboBox::currentIndexChanged, this, &MainWindow::SaveConfig);
    connect(resolutionComboBox, &QComboBox::currentIndexChanged, this, &MainWindow::SaveConfig);
    connect(presetComboBox, &QComboBox::currentIndexChanged, this, &MainWindow::SaveConfig);
    connect(darkModeCheckBox, &QCheckBox::toggled, this, &MainWindow::SaveConfig);
    connect(darkModeCheckBox, &QCheckBox::toggled, this, &MainWindow::ApplyTheme);

    connect(&queue, &QueueSupervisor::itemsChanged, this, &MainWindow::RefreshQueue);
    connect(&queue, &QueueSupervisor::busyChanged, this, &MainWindow::UpdateBusyState);
    connect(&log, &LogSink::lineAppended, this, &MainWindow::AppendLogLine);
    connect(&log, &LogSink::cleared, logView, &QPlainTextEdit::clear);
    connect(&launcher, &JobLauncher::launchFailed, this, &MainWindow::HandleLaunchFailure);
}

void MainWindow::CheckForFFmpeg() const
{
    const EncodeConfig config = loadEncodeConfig(*settings);

    const int ffmpegReturnCode = QProcess::execute(config.ffmpegProgram, QStringList() << "-version");
    const int ffprobeReturnCode = QProcess::execute(config.ffprobeProgram, QStringList() << "-version");

    if (ffmpegReturnCode == 0 && ffprobeReturnCode == 0)
        return;

    notifier.Notify(
        Severity::Critical, tr("Could not locate FFmpeg"),
        tr("No valid install of FFmpeg was located. Please make sure FFmpeg and FFprobe are in your PATH, or set "
           "their location in %1.")
            .arg(settings->fileName())
    );
}

void MainWindow::LoadConfig()
{
    const EncodeConfig config = loadEncodeConfig(*settings);

    // setting the controls must not write the half-loaded state back
    loadingConfig = true;

    targetSizeSpinBox->setValue(static_cast<int>(config.targetSizeMb));
    fpsSpinBox->setValue(static_cast<int>(config.frameRate.value_or(0)));
    encoderComboBox->setCurrentIndex(encoderComboBox->findData(toString(config.encoder)));
    resolutionComboBox->setCurrentIndex(resolutionComboBox->findData(toString(config.resolution)));
    presetComboBox->setCurrentIndex(presetComboBox->findData(toString(config.preset)));
    darkModeCheckBox->setChecked(config.darkModeEnabled);

    loadingConfig = false;

    ApplyTheme(config.darkModeEnabled);
    UpdateWarnings();
}

void MainWindow::SaveConfig()
{
    UpdateWarnings();

    if (loadingConfig)
        return;

    saveEncodeConfig(*settings, configFromControls());
}

EncodeConfig MainWindow::configFromControls() const
{
    // tool paths are not editable here, keep whatever the file says
    EncodeConfig config = loadEncodeConfig(*settings);

    config.targetSizeMb = static_cast<quint32>(targetSizeSpinBox->value());
    config.frameRate = fpsSpinBox->value() > 0 ? optional<quint32>(fpsSpinBox->value()) : std::nullopt;
    config.encoder = encoderFromString(encoderComboBox->currentData().toString()).value_or(EncoderChoice::Cpu);
    config.resolution = resolutionFromString(resolutionComboBox->currentData().toString()).value_or(Resolution::Original);
    config.preset = presetFromString(presetComboBox->currentData().toString()).value_or(Preset::Unspecified);
    config.darkModeEnabled = darkModeCheckBox->isChecked();

    return config;
}

void MainWindow::ApplyTheme(bool dark)
{
    QApplication::setPalette(dark ? darkPalette() : QApplication::style()->standardPalette());
}

void MainWindow::UpdateWarnings()
{
    const EncodeConfig config = configFromControls();
    const bool gpuSelected = config.encoder == EncoderChoice::Gpu;

    warnings->Set(
        Warning::GpuWithoutNvidia,
        tr("The GPU encoder requires an NVIDIA graphics card, but none was detected. Encoding will likely fail."),
        gpuSelected && !platformInfo.isNvidia()
    );

    warnings->Set(
        Warning::PresetUnsupportedByNvenc,
        tr("The GPU encoder does not know the '%1' preset. Pick slow, medium or fast.").arg(toString(config.preset)),
        gpuSelected && !nvencAcceptsPreset(config.preset)
    );
}

void MainWindow::StartCompression()
{
    if (queue.isBusy())
        return;

    if (!queue.hasWaiting())
    {
        statusBar()->showMessage(tr("Nothing to compress. Drop some video files first."), 3000);
        return;
    }

    queue.startNext();
}

void MainWindow::RefreshQueue()
{
    const QList<QueueItem> items = queue.items();

    queueStack->setCurrentWidget(items.isEmpty() ? queueStack->widget(0) : queueTable);
    queueTable->setRowCount(static_cast<int>(items.size()));

    for (int row = 0; row < items.size(); row++)
    {
        const QueueItem& item = items.at(row);
        const QString outputSize = item.outputSizeBytes.has_value() ? formatSize(*item.outputSizeBytes) : "-";

        const QStringList cells {
            statusText(item),
            QFileInfo(item.path).fileName(),
            formatSize(static_cast<quint64>(item.inputSizeBytes)),
            outputSize,
        };

        for (int column = 0; column < ColumnCount; column++)
        {
            auto* cell = new QTableWidgetItem(cells.at(column));
            if (column == FileColumn)
                cell->setToolTip(item.path);

            queueTable->setItem(row, column, cell);
        }
    }

    clearButton->setEnabled(std::any_of(items.cbegin(), items.cend(), [](const QueueItem& item) {
        return item.status == FileStatus::Done;
    }));
}

void MainWindow::UpdateBusyState(bool busy)
{
    startButton->setEnabled(!busy);
    cancelButton->setEnabled(busy);
    statusLabel->setText(busy ? tr("🔄 Compressing...") : tr("Idle"));
}

void MainWindow::AppendLogLine(const QString& line)
{
    QScrollBar* scrollBar = logView->verticalScrollBar();
    const bool stickToBottom = scrollBar->value() == scrollBar->maximum();

    logView->appendPlainText(line);

    if (stickToBottom)
        scrollBar->setValue(scrollBar->maximum());
}

void MainWindow::HandleLaunchFailure(const QString& program, const QString& reason)
{
    notifier.Notify(Message(
        Severity::Error, tr("Could not start the encoder"),
        tr("'%1' could not be started. Check that FFmpeg is installed.").arg(program), reason
    ));
}

QStringList MainWindow::localFiles(const QMimeData* mimeData)
{
    QStringList files;

    if (!mimeData->hasUrls())
        return files;

    for (const QUrl& url : mimeData->urls())
    {
        if (url.isLocalFile() && QFileInfo(url.toLocalFile()).isFile())
            files.append(url.toLocalFile());
    }

    return files;
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event)
{
    const bool hasFiles = !localFiles(event->mimeData()).isEmpty();

    if (hasFiles)
        overlay->setMessage(tr("Drop to add to the queue"), QColor(0, 0, 0, 128));
    else
        overlay->setMessage(tr("Only local files can be queued"), QColor(128, 0, 0, 128));

    if (!isDragging)
    {
        overlay->showWithFade();
        isDragging = true;
    }

    event->setAccepted(hasFiles);
}

void MainWindow::dragLeaveEvent(QDragLeaveEvent*)
{
    overlay->hideWithFade();
    isDragging = false;
}

void MainWindow::dropEvent(QDropEvent* event)
{
    for (const QString& path : localFiles(event->mimeData()))
        queue.enqueue(path);

    overlay->hideWithFade();
    isDragging = false;
    event->acceptProposedAction();
}

void MainWindow::resizeEvent(QResizeEvent* event)
{
    overlay->setGeometry(rect());
    QMainWindow::resizeEvent(event);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    SaveConfig();
    launcher.cancel();
    event->accept();
}
