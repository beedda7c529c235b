#include "encoder/job_runner.hpp"
#include "log/log_sink.hpp"
#include "mainwindow.hpp"
#include "notifier/message_box_notifier.hpp"
#include "queue/queue_supervisor.hpp"
#include "settings/ini_settings.hpp"

#include <QApplication>
#include <QDir>
#include <boost/di.hpp>

namespace di = boost::di;

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("Batch Video Compressor");
    app.setStyle("Fusion");

    const QString appDir = QCoreApplication::applicationDirPath();
    const auto settings = std::make_shared<IniSettings>(
        QDir(appDir).filePath("config.ini"), QDir(appDir).filePath("config_default.ini")
    );

    const auto injector = di::make_injector(
        di::bind<Settings>.to(settings),
        di::bind<Notifier>.to<MessageBoxNotifier>(),
        di::bind<JobLauncher>.to<JobRunner>()
    );

    auto& window = injector.create<MainWindow&>();
    window.show();

    return app.exec();
}
