#include "resultcache.h"
#include <QCryptographicHash>
#include <QJsonDocument>
#include <QJsonArray>
#include <QDebug>

ResultCache::ResultCache(int ttlSec, QObject* parent)
    : QObject(parent), m_ttlSec(qMax(0, ttlSec)),
      m_clock([]{ return QDateTime::currentDateTimeUtc(); }) {}

QString ResultCache::makeKey(const QString& op, const QJsonObject& params) {
    QJsonObject norm;
    for (auto it = params.begin(); it != params.end(); ++it) {
        const QJsonValue v = it.value();
        if (v.isNull() || v.isUndefined()) continue;
        if (v.isString() && v.toString().trimmed().isEmpty()) continue;
        norm.insert(it.key(), v.isString() ? QJsonValue(v.toString().trimmed()) : v);
    }
    // QJsonObject ya mantiene las claves ordenadas
    const QByteArray raw = op.toUtf8() + '|' + QJsonDocument(norm).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(QCryptographicHash::hash(raw, QCryptographicHash::Sha1).toHex());
}

bool ResultCache::isFresh(const Entry& e, const QDateTime& now) const {
    if (e.generation != m_generation) return false;
    if (m_ttlSec > 0 && e.computedAt.secsTo(now) >= m_ttlSec) return false;
    return true;
}

bool ResultCache::fetch(const QString& op, const QJsonObject& params, bool forceRefresh, QJsonValue* out,
                        quint64* generation) {
    const QString key = makeKey(op, params);
    QMutexLocker lk(&m_mutex);
    if (generation) *generation = m_generation;
    auto it = m_entries.constFind(key);
    if (forceRefresh || it == m_entries.constEnd() || !isFresh(it.value(), m_clock())) {
        ++m_misses;
        return false;
    }
    ++m_hits;
    if (out) *out = it->value;
    return true;
}

void ResultCache::put(const QString& op, const QJsonObject& params, const QJsonValue& value, quint64 generation) {
    const QString key = makeKey(op, params);
    QMutexLocker lk(&m_mutex);
    if (generation != 0 && generation != m_generation) {
        // Se invalidó mientras se calculaba: el valor puede ser anterior a los datos nuevos
        qDebug() << "[ventas] cache put descartado" << op << "gen" << generation << "actual" << m_generation;
        return;
    }
    Entry e;
    e.op = op;
    e.value = value;
    e.generation = m_generation;
    e.computedAt = m_clock();
    m_entries.insert(key, e);
}

void ResultCache::invalidateAll(const QString& reason) {
    quint64 gen = 0;
    int dropped = 0;
    {
        QMutexLocker lk(&m_mutex);
        dropped = m_entries.size();
        m_entries.clear();
        gen = ++m_generation;
    }
    qInfo() << "[ventas] caché invalidada" << (reason.isEmpty() ? QStringLiteral("(manual)") : reason)
            << "entradas:" << dropped << "generación:" << gen;
    emit invalidated(gen);
}

void ResultCache::clear() {
    QMutexLocker lk(&m_mutex);
    m_entries.clear();
    m_hits = m_misses = 0;
}

void ResultCache::setTtl(int sec) { QMutexLocker lk(&m_mutex); m_ttlSec = qMax(0, sec); }
int ResultCache::ttl() const { QMutexLocker lk(&m_mutex); return m_ttlSec; }
void ResultCache::setClock(Clock c) { QMutexLocker lk(&m_mutex); m_clock = std::move(c); }
quint64 ResultCache::generation() const { QMutexLocker lk(&m_mutex); return m_generation; }

ResultCache::Stats ResultCache::stats() const {
    QMutexLocker lk(&m_mutex);
    Stats st;
    const QDateTime now = m_clock();
    st.entries = m_entries.size();
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        if (isFresh(it.value(), now)) st.liveKeys << it->op + ':' + it.key();
        else ++st.expired;
    }
    st.liveKeys.sort();
    st.generation = m_generation;
    st.hits = m_hits;
    st.misses = m_misses;
    return st;
}

QJsonObject ResultCache::Stats::toJson() const {
    QJsonObject o;
    o["entries"] = entries;
    o["valid"] = entries - expired;
    o["expired"] = expired;
    o["keys"] = QJsonArray::fromStringList(liveKeys);
    o["generation"] = QString::number(generation);
    o["hits"] = hits;
    o["misses"] = misses;
    return o;
}
