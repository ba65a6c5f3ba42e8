#include "appconfig.h"
#include "databasemanager.h"
#include "modelstore.h"

#include <QDir>
#include <QStandardPaths>

namespace {

const char *const kLanguage = "language";
const char *const kModelId = "model_id";
const char *const kIdleMinutes = "model_idle_minutes";
const char *const kPostprocessEnabled = "postprocess_enabled";
const char *const kPostprocessBaseUrl = "postprocess_base_url";
const char *const kPostprocessModel = "postprocess_model";
const char *const kPostprocessPrompt = "postprocess_system_prompt";
const char *const kHotkeyModifiers = "hotkey_modifiers";
const char *const kHotkeyKeycode = "hotkey_keycode";
const char *const kHotkeyLabel = "hotkey_label";

QString orEmpty(const std::optional<QString> &value)
{
    return value.value_or(QString());
}

QString numberOrEmpty(const std::optional<quint32> &value)
{
    return value ? QString::number(*value) : QString();
}

}

QString AppPaths::dataDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString AppPaths::recordsDir()
{
    return QDir(dataDir()).filePath("records");
}

QString AppPaths::modelsDir()
{
    return QDir(dataDir()).filePath("models");
}

QString AppPaths::databasePath()
{
    return QDir(dataDir()).filePath("dictly.db");
}

QString AppPaths::logPath()
{
    return QDir(dataDir()).filePath("dictly.log");
}

std::optional<QString> AppConfig::parseLanguage(const QString &value)
{
    const QString v = value.trimmed();
    if (v.isEmpty() || v.compare("auto", Qt::CaseInsensitive) == 0) return std::nullopt;
    return v;
}

std::optional<QString> AppConfig::parseModelId(const QString &value)
{
    const QString v = value.trimmed();
    if (v.isEmpty() || v.compare("default", Qt::CaseInsensitive) == 0) return std::nullopt;
    return v;
}

std::optional<int> AppConfig::parseIdleMinutes(const QString &value)
{
    const QString v = value.trimmed();
    if (v.isEmpty() || v.compare("default", Qt::CaseInsensitive) == 0) return std::nullopt;
    bool ok = false;
    const int minutes = v.toInt(&ok);
    if (!ok || minutes < 0) return std::nullopt;
    return minutes;
}

bool AppConfig::parseBool(const QString &value)
{
    const QString v = value.trimmed().toLower();
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<QString> AppConfig::parseText(const QString &value)
{
    const QString v = value.trimmed();
    if (v.isEmpty()) return std::nullopt;
    return v;
}

std::optional<quint32> AppConfig::parseUnsigned(const QString &value)
{
    bool ok = false;
    const uint n = value.trimmed().toUInt(&ok);
    if (!ok) return std::nullopt;
    return n;
}

AppConfig AppConfig::load(DatabaseManager &db)
{
    AppConfig config;
    config.language = parseLanguage(db.getSetting(kLanguage));
    config.modelId = parseModelId(db.getSetting(kModelId));
    config.modelIdleMinutes = parseIdleMinutes(db.getSetting(kIdleMinutes));
    config.postprocessEnabled = parseBool(db.getSetting(kPostprocessEnabled));
    config.postprocessBaseUrl = parseText(db.getSetting(kPostprocessBaseUrl));
    config.postprocessModel = parseText(db.getSetting(kPostprocessModel));
    config.postprocessSystemPrompt = parseText(db.getSetting(kPostprocessPrompt));
    config.hotkeyModifiers = parseUnsigned(db.getSetting(kHotkeyModifiers));
    config.hotkeyKeycode = parseUnsigned(db.getSetting(kHotkeyKeycode));
    config.hotkeyLabel = parseText(db.getSetting(kHotkeyLabel));
    return config;
}

bool AppConfig::save(DatabaseManager &db) const
{
    bool ok = true;
    ok &= db.setSetting(kLanguage, language.value_or("auto"));
    ok &= db.setSetting(kModelId, modelId.value_or("default"));
    ok &= db.setSetting(kIdleMinutes, modelIdleMinutes ? QString::number(*modelIdleMinutes) : QString("default"));
    ok &= db.setSetting(kPostprocessEnabled, postprocessEnabled ? "true" : "false");
    ok &= db.setSetting(kPostprocessBaseUrl, orEmpty(postprocessBaseUrl));
    ok &= db.setSetting(kPostprocessModel, orEmpty(postprocessModel));
    ok &= db.setSetting(kPostprocessPrompt, orEmpty(postprocessSystemPrompt));
    ok &= db.setSetting(kHotkeyModifiers, numberOrEmpty(hotkeyModifiers));
    ok &= db.setSetting(kHotkeyKeycode, numberOrEmpty(hotkeyKeycode));
    ok &= db.setSetting(kHotkeyLabel, orEmpty(hotkeyLabel));
    return ok;
}

QString AppConfig::effectiveModelId() const
{
    return modelId.value_or(ModelStore::kDefaultModelId);
}

Hotkey AppConfig::hotkey() const
{
    Hotkey result;
    if (hotkeyModifiers) result.modifiers = *hotkeyModifiers & kModifierMask;
    result.keycode = hotkeyKeycode;
    result.label = orEmpty(hotkeyLabel);
    return result;
}

void AppConfig::setHotkey(const Hotkey &hotkey)
{
    hotkeyModifiers = hotkey.modifiers;
    hotkeyKeycode = hotkey.keycode;
    hotkeyLabel = parseText(hotkey.label);
}

PostprocessConfig AppConfig::postprocessConfig() const
{
    PostprocessConfig result;
    result.enabled = postprocessEnabled;
    if (postprocessBaseUrl) result.baseUrl = *postprocessBaseUrl;
    if (postprocessModel) result.model = *postprocessModel;
    if (postprocessSystemPrompt) result.systemPrompt = *postprocessSystemPrompt;
    return result;
}

TranscribeOptions AppConfig::transcribeOptions() const
{
    TranscribeOptions options;
    options.language = orEmpty(language);
    return options;
}
