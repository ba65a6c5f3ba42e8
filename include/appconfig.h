#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>
#include <optional>
#include "hotkey.h"
#include "postprocessclient.h"
#include "speechengine.h"

class DatabaseManager;

// Where everything lives under the per-user application data directory.
class AppPaths
{
public:
    static QString dataDir();
    static QString recordsDir();
    static QString modelsDir();
    static QString databasePath();
    static QString logPath();
};

// User settings as kept in the settings table. Unset values mean "use the
// built-in default".
struct AppConfig
{
    std::optional<QString> language;
    std::optional<QString> modelId;
    std::optional<int> modelIdleMinutes;

    bool postprocessEnabled = false;
    std::optional<QString> postprocessBaseUrl;
    std::optional<QString> postprocessModel;
    std::optional<QString> postprocessSystemPrompt;

    std::optional<quint32> hotkeyModifiers;
    std::optional<quint32> hotkeyKeycode;
    std::optional<QString> hotkeyLabel;

    static AppConfig load(DatabaseManager &db);
    bool save(DatabaseManager &db) const;

    QString effectiveModelId() const;
    Hotkey hotkey() const;
    void setHotkey(const Hotkey &hotkey);
    PostprocessConfig postprocessConfig() const;
    TranscribeOptions transcribeOptions() const;

    // "auto" or blank -> unset
    static std::optional<QString> parseLanguage(const QString &value);
    // "default" or blank -> unset
    static std::optional<QString> parseModelId(const QString &value);
    // "default", blank, non-numeric or negative -> unset
    static std::optional<int> parseIdleMinutes(const QString &value);
    static bool parseBool(const QString &value);
    static std::optional<QString> parseText(const QString &value);
    static std::optional<quint32> parseUnsigned(const QString &value);
};

#endif // APPCONFIG_H
