#include "importtracker.h"
#include "resultcache.h"
#include <QDebug>

void ImportAccumulator::fold(const RowResult& r) {
    if (aborted) return;
    switch (r.outcome) {
    case RowOutcome::Imported:
        ++imported;
        if (r.factId) factIds.push_back(r.factId);
        for (const auto& c : r.createdEntities) created[c.first].insert(c.second);
        break;
    case RowOutcome::ValidationError:
        ++failed;
        if (errors.size() < maxErrors) errors << r.message;
        break;
    case RowOutcome::StorageError:
        aborted = true;
        fatal = r.message;
        break;
    }
}

ImportTracker::ImportTracker(SalesStorage* store, ResultCache* cache, QObject* parent)
    : QObject(parent), m_store(store), m_cache(cache),
      m_clock([]{ return QDateTime::currentDateTimeUtc(); }) {}

bool ImportTracker::flush(const ImportJob& j, QString* err) {
    ImportJob copy = j;
    return m_store->saveJob(copy, err) == StoreStatus::Ok;
}

void ImportTracker::applyAccumulator(Active& a) const {
    ImportJob& j = a.job;
    j.importedRows = a.acc.imported;
    j.failedRows = a.acc.failed;
    j.errorLog = a.acc.errors;
    j.relatedFactIds = a.acc.factIds;
    j.createdEntities = a.acc.created;
    const int pct = j.totalRows > 0 ? int(qint64(j.importedRows) * 100 / j.totalRows) : 0;
    j.percent = qMax(j.percent, qMin(pct, 100));
}

qint64 ImportTracker::createJob(const QString& filename, const QString& storagePath, qint64 fileSize,
                                ImportTarget target, QString* err) {
    QMutexLocker lk(&m_mutex);
    if (!storagePath.isEmpty()) {
        for (const auto& j : m_store->jobs()) {
            if (j.storagePath == storagePath && j.isActive()) {
                if (err) *err = tr("Ya hay un import activo (#%1) para %2").arg(j.id).arg(storagePath);
                return 0;
            }
        }
    }
    ImportJob j;
    j.filename = filename;
    j.storagePath = storagePath;
    j.fileSize = fileSize;
    j.target = target;
    j.status = ImportStatus::Pending;
    j.startedAt = m_clock();
    j.updatedAt = j.startedAt;
    if (m_store->saveJob(j, err) != StoreStatus::Ok) return 0;
    qInfo() << "[ventas] import" << j.id << "creado:" << filename << targetToString(target);
    return j.id;
}

bool ImportTracker::start(qint64 jobId, int totalRows, quint64* runToken, QString* err) {
    QMutexLocker lk(&m_mutex);
    ImportJob j;
    if (!m_store->job(jobId, &j)) {
        if (err) *err = tr("No existe el import #%1").arg(jobId);
        return false;
    }
    if (j.status != ImportStatus::Pending) {
        if (err) *err = tr("El import #%1 no está pendiente (%2)").arg(jobId).arg(statusToString(j.status));
        return false;
    }
    Active a;
    a.job = j;
    a.job.status = ImportStatus::Processing;
    a.job.totalRows = qMax(0, totalRows);
    a.job.importedRows = a.job.failedRows = a.job.percent = 0;
    a.job.errorLog.clear();
    a.job.message.clear();
    a.job.relatedFactIds.clear();
    a.job.createdEntities.clear();
    a.job.startedAt = m_clock();
    a.job.updatedAt = a.job.startedAt;
    a.job.completedAt = QDateTime();
    a.acc.maxErrors = m_maxErrorLog;
    a.token = ++m_nextToken;
    if (!flush(a.job, err)) return false;
    m_active.insert(jobId, a);
    if (runToken) *runToken = a.token;
    qInfo() << "[ventas] import" << jobId << "processing," << totalRows << "filas";
    return true;
}

bool ImportTracker::recordOutcome(qint64 jobId, quint64 runToken, const RowResult& r) {
    int pct = -1;
    {
        QMutexLocker lk(&m_mutex);
        auto it = m_active.find(jobId);
        if (it == m_active.end() || it->token != runToken) return false;
        Active& a = it.value();
        // Nunca más filas procesadas que el total declarado
        if (r.outcome != RowOutcome::StorageError && a.acc.processed() >= a.job.totalRows) return false;

        const int before = a.job.percent;
        a.acc.fold(r);
        applyAccumulator(a);
        a.job.updatedAt = m_clock();
        if (r.outcome == RowOutcome::ValidationError)
            qDebug() << "[ventas] import" << jobId << r.message;
        if (a.job.percent != before) {
            pct = a.job.percent;
            QString err;
            if (!flush(a.job, &err))
                qWarning() << "[ventas] no se pudo guardar el progreso del import" << jobId << err;
        }
    }
    if (pct >= 0) emit progressChanged(jobId, pct);
    return true;
}

bool ImportTracker::complete(qint64 jobId, quint64 runToken, QString* err) {
    ImportJob done;
    {
        QMutexLocker lk(&m_mutex);
        auto it = m_active.find(jobId);
        if (it == m_active.end() || it->token != runToken) {
            if (err) *err = tr("El import #%1 no está en proceso").arg(jobId);
            return false;
        }
        Active& a = it.value();
        if (a.acc.aborted) {
            if (err) *err = tr("El import #%1 fue abortado: %2").arg(jobId).arg(a.acc.fatal);
            return false;
        }
        applyAccumulator(a);
        // Filas agotadas: el total es lo realmente procesado
        a.job.totalRows = a.acc.processed();
        a.job.percent = 100;
        a.job.status = ImportStatus::Completed;
        a.job.updatedAt = m_clock();
        a.job.completedAt = a.job.updatedAt;
        if (!flush(a.job, err)) return false;
        done = a.job;
        m_active.erase(it);
    }
    qInfo() << "[ventas] import" << jobId << "completed:" << done.importedRows << "ok,"
            << done.failedRows << "con error";
    if (m_cache) m_cache->invalidateAll(QStringLiteral("import %1 completado").arg(jobId));
    emit progressChanged(jobId, 100);
    emit jobFinished(jobId, statusToString(ImportStatus::Completed));
    return true;
}

bool ImportTracker::fail(qint64 jobId, const QString& reason, quint64 runToken) {
    {
        QMutexLocker lk(&m_mutex);
        ImportJob j;
        auto it = m_active.find(jobId);
        if (it != m_active.end()) {
            if (it->token != runToken) return false;
            applyAccumulator(it.value());
            j = it->job;
            m_active.erase(it);
        } else if (runToken != 0 || !m_store->job(jobId, &j) || !j.isActive()) {
            // Token de una ejecución ya reiniciada: no toca el estado actual
            return false;
        }
        j.status = ImportStatus::Failed;
        j.message = reason;
        j.updatedAt = m_clock();
        j.completedAt = j.updatedAt;
        QString err;
        if (!flush(j, &err)) {
            qWarning() << "[ventas] no se pudo marcar como fallido el import" << jobId << err;
            return false;
        }
    }
    qWarning() << "[ventas] import" << jobId << "failed:" << reason;
    emit jobFinished(jobId, statusToString(ImportStatus::Failed));
    return true;
}

bool ImportTracker::job(qint64 jobId, ImportJob* out) const {
    QMutexLocker lk(&m_mutex);
    auto it = m_active.constFind(jobId);
    if (it != m_active.constEnd()) {
        if (out) *out = it->job;
        return true;
    }
    return m_store->job(jobId, out);
}

QVector<ImportJob> ImportTracker::jobs() const {
    QMutexLocker lk(&m_mutex);
    QVector<ImportJob> out = m_store->jobs();
    for (auto& j : out) {
        auto it = m_active.constFind(j.id);
        if (it != m_active.constEnd()) j = it->job;
    }
    return out;
}

bool ImportTracker::isStuck(const ImportJob& j) const {
    if (j.status != ImportStatus::Processing) return false;
    const QDateTime last = j.updatedAt.isValid() ? j.updatedAt : j.startedAt;
    if (!last.isValid()) return true;
    return last.secsTo(m_clock()) >= m_stuckTimeoutSec;
}

QVector<qint64> ImportTracker::findStuck() const {
    QVector<qint64> out;
    for (const auto& j : jobs())
        if (isStuck(j)) out.push_back(j.id);
    return out;
}

bool ImportTracker::resetStuck(qint64 jobId, QString* err) {
    ImportJob j;
    if (!job(jobId, &j)) {
        if (err) *err = tr("No existe el import #%1").arg(jobId);
        return false;
    }
    if (!isStuck(j)) {
        if (err) *err = tr("El import #%1 no está atascado (%2)").arg(jobId).arg(statusToString(j.status));
        return false;
    }
    {
        QMutexLocker lk(&m_mutex);
        // El worker que aún lo tenga deja de poder registrar filas
        m_active.remove(jobId);
        j.status = ImportStatus::Pending;
        j.message = tr("Reiniciado tras quedar atascado");
        j.updatedAt = m_clock();
        if (!flush(j, err)) return false;
    }
    qWarning() << "[ventas] import" << jobId << "atascado, vuelto a pending";
    return true;
}

int ImportTracker::resetAllStuck() {
    int n = 0;
    for (qint64 id : findStuck()) {
        QString err;
        if (resetStuck(id, &err)) ++n;
        else qWarning() << "[ventas] reset-stuck" << id << err;
    }
    return n;
}

bool ImportTracker::deleteImport(qint64 jobId, int* removedFacts, QString* err) {
    {
        QMutexLocker lk(&m_mutex);
        if (m_active.contains(jobId)) {
            if (err) *err = tr("El import #%1 está en proceso; no se puede eliminar").arg(jobId);
            return false;
        }
    }
    int removed = 0;
    QString why;
    const StoreStatus st = m_store->deleteImport(jobId, &removed, &why);
    if (st != StoreStatus::Ok) {
        if (err) *err = tr("No se pudo eliminar el import #%1: %2").arg(jobId).arg(why);
        qWarning() << "[ventas] borrado en cascada fallido" << jobId << why;
        return false;
    }
    if (removedFacts) *removedFacts = removed;
    if (m_cache) m_cache->invalidateAll(QStringLiteral("import %1 eliminado").arg(jobId));
    return true;
}
