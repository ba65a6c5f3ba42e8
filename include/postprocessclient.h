#ifndef POSTPROCESSCLIENT_H
#define POSTPROCESSCLIENT_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <functional>

struct PostprocessConfig
{
    static const char *const kDefaultSystemPrompt;

    bool enabled = false;
    QString baseUrl = QStringLiteral("https://api.openai.com");
    QString model = QStringLiteral("gpt-4o-mini");
    QString systemPrompt = QString::fromUtf8(kDefaultSystemPrompt);
    int timeoutMs = 30000;
};

// Rewrites a raw transcript through an OpenAI compatible chat-completions
// endpoint. The transcript goes out wrapped in <transcript> tags as data.
class PostprocessClient
{
public:
    using CredentialProvider = std::function<QString()>;

    static constexpr const char *kCredentialEnvVar = "DICTLY_POSTPROCESS_API_KEY";

    explicit PostprocessClient(CredentialProvider credentials = CredentialProvider());

    // Blocking. Throws PostprocessError.
    QString rewrite(const QString &text, const PostprocessConfig &config) const;

    static QString environmentCredential();

    static QString chatCompletionsUrl(const QString &baseUrl);
    static QJsonObject buildPayload(const QString &text, const PostprocessConfig &config);
    static QString extractContent(const QJsonObject &response);
    static QString stripTranscriptTags(const QString &text);

private:
    QJsonObject postJson(const QString &url, const QString &apiKey,
                         const QByteArray &body, int timeoutMs) const;

    CredentialProvider m_credentials;
};

#endif // POSTPROCESSCLIENT_H
