#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QObject>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlError>
#include <QFileInfo>
#include <QDir>
#include <QDebug>
#include <QDateTime>
#include <QList>

struct HistoryEntry
{
    QString recordingId;
    QString text;
    QString originalText;
    QString polishedText;
    QString timestamp;
};

class DatabaseManager : public QObject {
    Q_OBJECT
public:
    static DatabaseManager& instance() {
        static DatabaseManager _instance;
        return _instance;
    }

    bool init(const QString &dbPath) {
        close();
        QDir().mkpath(QFileInfo(dbPath).absolutePath());

        m_db = QSqlDatabase::addDatabase("QSQLITE", kConnectionName);
        m_db.setDatabaseName(dbPath);

        if (!m_db.open()) {
            qCritical() << "Database Error:" << m_db.lastError().text();
            return false;
        }

        QSqlQuery query(m_db);
        // History Table
        if (!query.exec("CREATE TABLE IF NOT EXISTS history ("
                        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                        "recording_id TEXT,"
                        "text TEXT,"
                        "original_text TEXT,"
                        "polished_text TEXT,"
                        "timestamp DATETIME DEFAULT CURRENT_TIMESTAMP)")) {
            qCritical() << "Database Error:" << query.lastError().text();
            return false;
        }

        // Settings Table
        if (!query.exec("CREATE TABLE IF NOT EXISTS settings ("
                        "key TEXT PRIMARY KEY,"
                        "value TEXT)")) {
            qCritical() << "Database Error:" << query.lastError().text();
            return false;
        }

        return true;
    }

    void close() {
        if (!m_db.isValid()) return;
        m_db.close();
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(kConnectionName);
    }

    bool isOpen() const { return m_db.isValid() && m_db.isOpen(); }

    bool addHistory(const QString &recordingId, const QString &text,
                    const QString &originalText, const QString &polishedText) {
        QSqlQuery query(m_db);
        query.prepare("INSERT INTO history (recording_id, text, original_text, polished_text) "
                      "VALUES (:recording_id, :text, :original_text, :polished_text)");
        query.bindValue(":recording_id", recordingId);
        query.bindValue(":text", text);
        query.bindValue(":original_text", originalText);
        query.bindValue(":polished_text", polishedText);
        if (!query.exec()) {
            qCritical() << "Failed to add history:" << query.lastError().text();
            return false;
        }
        return true;
    }

    QList<HistoryEntry> getHistory(int limit = 50) {
        QList<HistoryEntry> results;
        QSqlQuery query(m_db);
        // Select timestamp formatted as HH:mm AM/PM for display
        query.prepare("SELECT recording_id, text, original_text, polished_text, "
                      "strftime('%I:%M %p', timestamp, 'localtime') as time_str "
                      "FROM history ORDER BY id ASC LIMIT :limit");
        query.bindValue(":limit", limit);
        if (query.exec()) {
            while (query.next()) {
                HistoryEntry entry;
                entry.recordingId = query.value(0).toString();
                entry.text = query.value(1).toString();
                entry.originalText = query.value(2).toString();
                entry.polishedText = query.value(3).toString();
                entry.timestamp = query.value(4).toString();
                results.append(entry);
            }
        }
        return results;
    }

    bool setSetting(const QString &key, const QString &value) {
        QSqlQuery query(m_db);
        query.prepare("INSERT OR REPLACE INTO settings (key, value) VALUES (:key, :value)");
        query.bindValue(":key", key);
        query.bindValue(":value", value);
        if (!query.exec()) {
            qCritical() << "Failed to save setting" << key << ":" << query.lastError().text();
            return false;
        }
        return true;
    }

    QString getSetting(const QString &key, const QString &defaultValue = "") {
        QSqlQuery query(m_db);
        query.prepare("SELECT value FROM settings WHERE key = :key");
        query.bindValue(":key", key);
        if (query.exec() && query.next()) {
            return query.value(0).toString();
        }
        return defaultValue;
    }

private:
    static constexpr const char *kConnectionName = "dictly";

    DatabaseManager() {}
    QSqlDatabase m_db;
};

#endif
