#include "dictationapp.h"
#include "audiorecorder.h"
#include "databasemanager.h"
#include "globalshortcut.h"
#include "hotkeyactivator.h"
#include "modellifecyclemanager.h"
#include "modelstore.h"
#include "recordingcontroller.h"
#include "textpaster.h"
#include "trayindicator.h"
#include "whisperengine.h"

#include <QCoreApplication>
#include <QDebug>

DictationApp::DictationApp(const AppConfig &config, QObject *parent)
    : QObject(parent), m_config(config)
{
    m_store = std::make_unique<ModelStore>(AppPaths::modelsDir());
    m_engine = std::make_unique<WhisperEngine>();
    m_postprocess = std::make_unique<PostprocessClient>();

    m_models = new ModelLifecycleManager(m_store.get(), m_engine.get(), this);
    m_orchestrator = new TranscriptionOrchestrator(m_models, m_postprocess.get(), this);
    m_recorder = new AudioRecorder(AppPaths::recordsDir(), 16000, this);
    m_controller = new RecordingController(m_recorder, this);
    m_shortcut = new GlobalShortcut(this);
    m_activator = new HotkeyActivator(m_shortcut, this);
    m_paster = new TextPaster(this);
    m_tray = new TrayIndicator(this);

    m_models->setConfiguredModelId(m_config.effectiveModelId());
    m_models->setIdleMinutes(m_config.modelIdleMinutes);
    m_models->setActivityProbe([this]() {
        return m_controller->isRecording() || m_orchestrator->isTranscribing();
    });
    m_controller->setModelLoadingProbe([this]() { return m_models->isLoading(); });

    m_orchestrator->setSettings(transcriptionSettings());
    m_orchestrator->setPostprocessConfig(m_config.postprocessConfig());

    // The listener emits from its own thread; toggles run on the GUI thread.
    connect(m_shortcut, &GlobalShortcut::toggled, m_controller, &RecordingController::toggle,
            Qt::QueuedConnection);
    connect(m_activator, &HotkeyActivator::listenerUnavailable, this, [this](const QString &reason) {
        m_tray->showMessage("Global hotkey unavailable", reason);
    });
    connect(m_tray, &TrayIndicator::toggleRequested, m_controller, &RecordingController::toggle);
    connect(m_tray, &TrayIndicator::quitRequested, qApp, &QCoreApplication::quit);

    connect(m_controller, &RecordingController::stopCommitted, this, &DictationApp::onStopCommitted);
    connect(m_controller, &RecordingController::stateChanged, this, &DictationApp::refreshStatus);
    connect(m_controller, &RecordingController::captureFailed, this, [this](const QString &error) {
        m_tray->showMessage("Recording failed", error);
    });

    connect(m_orchestrator, &TranscriptionOrchestrator::transcriptReady,
            this, &DictationApp::onTranscriptReady);
    connect(m_orchestrator, &TranscriptionOrchestrator::transcriptionFailed,
            this, &DictationApp::onTranscriptionFailed);
    connect(m_orchestrator, &TranscriptionOrchestrator::inFlightChanged,
            this, &DictationApp::refreshStatus);
    connect(m_models, &ModelLifecycleManager::loadingChanged, this, &DictationApp::refreshStatus);
}

DictationApp::~DictationApp()
{
    m_shortcut->stop();
    m_orchestrator->waitForIdle();
    m_models->waitForBackgroundTasks();
}

void DictationApp::start()
{
    m_tray->setHotkeyLabel(m_config.hotkey().toString());
    m_tray->show();

    m_shortcut->registerHotkey(m_config.hotkey());
    m_activator->activate();

    m_models->startWarmup(m_config.effectiveModelId());
    refreshStatus();
}

DictationStatus DictationApp::status() const
{
    return deriveStatus(m_controller->isRecording(), m_models->isLoading(), m_orchestrator->inFlight());
}

void DictationApp::toggle()
{
    m_controller->toggle();
}

void DictationApp::reloadSettings()
{
    applyConfig(AppConfig::load(DatabaseManager::instance()));
}

void DictationApp::applyConfig(const AppConfig &config)
{
    const AppConfig previous = m_config;
    m_config = config;

    if (m_config.hotkey() != previous.hotkey()) {
        m_shortcut->registerHotkey(m_config.hotkey());
        m_tray->setHotkeyLabel(m_config.hotkey().toString());
    }
    if (m_config.modelIdleMinutes != previous.modelIdleMinutes) {
        m_models->setIdleMinutes(m_config.modelIdleMinutes);
    }
    m_models->selectModel(m_config.effectiveModelId());

    m_orchestrator->setSettings(transcriptionSettings());
    m_orchestrator->setPostprocessConfig(m_config.postprocessConfig());
    qInfo() << "Settings reloaded.";
}

void DictationApp::onStopCommitted(const QString &path)
{
    m_orchestrator->runAsync(path, m_config.effectiveModelId());
}

void DictationApp::onTranscriptReady(const TranscriptRecord &record)
{
    DatabaseManager::instance().addHistory(record.id, record.text, record.originalText, record.polishedText);
    if (!record.text.isEmpty()) {
        m_paster->paste(record.text);
    }
}

void DictationApp::onTranscriptionFailed(const QString &path, const QString &error)
{
    qWarning() << "No text delivered for" << path << "-" << error;
}

void DictationApp::refreshStatus()
{
    const DictationStatus current = status();
    m_tray->setStatus(current);
    if (current != m_lastStatus) {
        m_lastStatus = current;
        qDebug() << "Status:" << statusLabel(current);
        emit statusChanged(current);
    }
}

TranscriptionSettings DictationApp::transcriptionSettings() const
{
    TranscriptionSettings settings;
    settings.options = m_config.transcribeOptions();
    return settings;
}
