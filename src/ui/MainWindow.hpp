#pragma once

#include <memory>

#include <QMainWindow>
#include <QUrl>

#include "common/app_config.hpp"

class QWebChannel;
class QWebEngineNewWindowRequest;
class QWebEngineView;

namespace axiestudio {

class BridgeCommands;

// The "main" window: hosts the remote frontend in a QWebEngineView and
// publishes the bridge object to it over a QWebChannel.
class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    MainWindow(const AppConfig &config, BridgeCommands &bridge, QWidget *parent = nullptr);
    ~MainWindow() override;

    void loadFrontend();

public slots:
    void openDevTools();

signals:
    void frontendLoaded(bool ok);

private slots:
    void onLoadFinished(bool ok);

private:
    AppConfig m_config;
    BridgeCommands &m_bridge;
    QWebEngineView *m_view;
    QWebChannel *m_channel;
    std::unique_ptr<QWebEngineView> m_devTools;

    void installBridgeScript();
    void onNewWindowRequested(QWebEngineNewWindowRequest &request);
};

} // namespace axiestudio
