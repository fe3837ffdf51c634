#include "ui/MainWindow.hpp"

#include <QFile>
#include <QWebChannel>
#include <QWebEngineNewWindowRequest>
#include <QWebEnginePage>
#include <QWebEngineScript>
#include <QWebEngineScriptCollection>
#include <QWebEngineView>

#include <nlohmann/json.hpp>

#include "bridge/BridgeCommands.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace axiestudio {

namespace {

constexpr int kDefaultWidth = 1280;
constexpr int kDefaultHeight = 800;
constexpr int kMinimumWidth = 800;
constexpr int kMinimumHeight = 600;

QByteArray readResource(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        ALOG_ERROR(QStringLiteral("MainWindow"),
                   QStringLiteral("readResource"),
                   QStringLiteral("resource_missing"),
                   QStringLiteral("bridge_setup"),
                   QStringLiteral("qrc"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}}));
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

MainWindow::MainWindow(const AppConfig &config, BridgeCommands &bridge, QWidget *parent)
    : QMainWindow(parent)
    , m_config(config)
    , m_bridge(bridge)
    , m_view(new QWebEngineView(this))
    , m_channel(new QWebChannel(this))
{
    setWindowTitle(QStringLiteral("Axie Studio"));
    resize(kDefaultWidth, kDefaultHeight);
    setMinimumSize(kMinimumWidth, kMinimumHeight);
    setCentralWidget(m_view);

    m_channel->registerObject(QStringLiteral("bridge"), &m_bridge);
    m_view->page()->setWebChannel(m_channel);
    installBridgeScript();

    connect(m_view, &QWebEngineView::loadFinished,
            this, &MainWindow::onLoadFinished);
    connect(m_view->page(), &QWebEnginePage::newWindowRequested,
            this, &MainWindow::onNewWindowRequested);
}

MainWindow::~MainWindow() = default;

void MainWindow::loadFrontend()
{
    ALOG_INFO(QStringLiteral("MainWindow"),
              QStringLiteral("loadFrontend"),
              QStringLiteral("frontend_load"),
              QStringLiteral("host_setup"),
              QStringLiteral("web_engine"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"url", m_config.frontendUrl.toStdString()}}));
    m_view->load(QUrl(m_config.frontendUrl));
}

void MainWindow::openDevTools()
{
    if (!m_devTools) {
        m_devTools = std::make_unique<QWebEngineView>();
        m_devTools->setWindowTitle(QStringLiteral("Axie Studio - Inspector"));
        m_devTools->resize(kDefaultWidth * 3 / 4, kDefaultHeight * 3 / 4);
        m_view->page()->setDevToolsPage(m_devTools->page());
    }
    m_devTools->show();
    m_devTools->raise();
}

void MainWindow::onLoadFinished(bool ok)
{
    if (ok) {
        ALOG_INFO(QStringLiteral("MainWindow"),
                  QStringLiteral("onLoadFinished"),
                  QStringLiteral("frontend_loaded"),
                  QStringLiteral("page_load"),
                  QStringLiteral("web_engine"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"url", m_view->url().toString().toStdString()}}));
    } else {
        ALOG_ERROR(QStringLiteral("MainWindow"),
                   QStringLiteral("onLoadFinished"),
                   QStringLiteral("frontend_load_failed"),
                   QStringLiteral("page_load"),
                   QStringLiteral("web_engine"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"url", m_config.frontendUrl.toStdString()}}));
    }
    emit frontendLoaded(ok);
}

void MainWindow::onNewWindowRequested(QWebEngineNewWindowRequest &request)
{
    // Pop-ups and target=_blank links go to the desktop browser.
    const CommandResult result = m_bridge.openExternalUrl(request.requestedUrl().toString());
    if (!result.ok()) {
        ALOG_WARN(QStringLiteral("MainWindow"),
                  QStringLiteral("onNewWindowRequested"),
                  QStringLiteral("external_link_failed"),
                  QStringLiteral("new_window_request"),
                  QStringLiteral("web_engine"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"kind", result.error},
                                  {"error", result.message}}));
    }
}

void MainWindow::installBridgeScript()
{
    // qwebchannel.js ships inside the QtWebChannel library; it must run
    // before the shim, so both go into one document-creation script.
    QByteArray source = readResource(QStringLiteral(":/qtwebchannel/qwebchannel.js"));
    source += '\n';
    source += readResource(QStringLiteral(":/bridge/bridge.js"));

    QWebEngineScript script;
    script.setName(QStringLiteral("axiestudio-bridge"));
    script.setSourceCode(QString::fromUtf8(source));
    script.setInjectionPoint(QWebEngineScript::DocumentCreation);
    script.setWorldId(QWebEngineScript::MainWorld);
    script.setRunsOnSubFrames(false);
    m_view->page()->scripts().insert(script);
}

} // namespace axiestudio
