#ifndef DICTATIONAPP_H
#define DICTATIONAPP_H

#include <QObject>
#include <memory>
#include "appconfig.h"
#include "dictationstatus.h"
#include "transcriptionorchestrator.h"

class AudioRecorder;
class GlobalShortcut;
class HotkeyActivator;
class ModelLifecycleManager;
class ModelStore;
class RecordingController;
class SpeechEngine;
class TextPaster;
class TrayIndicator;

// Wires hotkey -> recording -> transcription -> paste and publishes the
// combined status to the tray.
class DictationApp : public QObject
{
    Q_OBJECT
public:
    explicit DictationApp(const AppConfig &config, QObject *parent = nullptr);
    ~DictationApp();

    void start();
    DictationStatus status() const;
    const AppConfig &config() const { return m_config; }

public slots:
    void toggle();
    // Re-reads the settings table and applies what changed.
    void reloadSettings();

signals:
    void statusChanged(DictationStatus status);

private slots:
    void onStopCommitted(const QString &path);
    void onTranscriptReady(const TranscriptRecord &record);
    void onTranscriptionFailed(const QString &path, const QString &error);
    void refreshStatus();

private:
    void applyConfig(const AppConfig &config);
    TranscriptionSettings transcriptionSettings() const;

    AppConfig m_config;
    DictationStatus m_lastStatus = DictationStatus::Idle;

    std::unique_ptr<ModelStore> m_store;
    std::unique_ptr<SpeechEngine> m_engine;
    std::unique_ptr<PostprocessClient> m_postprocess;
    ModelLifecycleManager *m_models;
    TranscriptionOrchestrator *m_orchestrator;
    AudioRecorder *m_recorder;
    RecordingController *m_controller;
    GlobalShortcut *m_shortcut;
    HotkeyActivator *m_activator;
    TextPaster *m_paster;
    TrayIndicator *m_tray;
};

#endif // DICTATIONAPP_H
