#ifndef RESULTCACHE_H
#define RESULTCACHE_H

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QDateTime>
#include <QStringList>
#include <QMutex>
#include <functional>

/**
 * Memoiza resultados de analítica por (operación, parámetros normalizados).
 * Invalidación global: cada invalidateAll() sube la generación y vacía las entradas.
 * No hay invalidación parcial.
 */
class ResultCache : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<QDateTime()>;

    explicit ResultCache(int ttlSec = 0, QObject* parent = nullptr);

    // SHA-1 de "op|json compacto" (claves ordenadas, nulos y vacíos descartados)
    static QString makeKey(const QString& op, const QJsonObject& params);

    // true = hit. Con forceRefresh nunca hay hit (el llamador recalcula y hace put).
    // generation recibe la generación vigente; pasarla a put() para no guardar un
    // resultado calculado antes de una invalidación.
    bool fetch(const QString& op, const QJsonObject& params, bool forceRefresh, QJsonValue* out,
               quint64* generation = nullptr);
    // generation 0 = sin comprobación
    void put(const QString& op, const QJsonObject& params, const QJsonValue& value, quint64 generation = 0);

    void invalidateAll(const QString& reason = QString());
    void clear();

    void setTtl(int sec);
    int ttl() const;
    void setClock(Clock c);
    quint64 generation() const;

    struct Stats {
        int entries = 0;
        int expired = 0;
        QStringList liveKeys;   // "op:hash"
        quint64 generation = 0;
        qint64 hits = 0;
        qint64 misses = 0;
        QJsonObject toJson() const;
    };
    Stats stats() const;

signals:
    void invalidated(quint64 generation);

private:
    struct Entry {
        QString op;
        QJsonValue value;
        quint64 generation = 0;
        QDateTime computedAt;
    };

    bool isFresh(const Entry& e, const QDateTime& now) const;

    mutable QMutex m_mutex;
    QHash<QString, Entry> m_entries;
    quint64 m_generation = 1;
    int m_ttlSec = 0;
    qint64 m_hits = 0;
    qint64 m_misses = 0;
    Clock m_clock;
};

#endif // RESULTCACHE_H
