#ifndef IMPORTTRACKER_H
#define IMPORTTRACKER_H

#include <QObject>
#include <QHash>
#include <QMutex>
#include <QPair>
#include <functional>
#include "salesstore.h"

class ResultCache;

/* ============================ Resultado por fila ============================ */
enum class RowOutcome { Imported, ValidationError, StorageError };

struct RowResult {
    RowOutcome outcome = RowOutcome::Imported;
    QString message;
    qint64 factId = 0;
    QVector<QPair<EntityKind, qint64>> createdEntities;

    static RowResult imported(qint64 factId) { RowResult r; r.factId = factId; return r; }
    static RowResult validationError(const QString& msg) {
        RowResult r; r.outcome = RowOutcome::ValidationError; r.message = msg; return r;
    }
    static RowResult storageError(const QString& msg) {
        RowResult r; r.outcome = RowOutcome::StorageError; r.message = msg; return r;
    }
};

// Pliegue de RowResult sobre los contadores de un import
struct ImportAccumulator {
    int imported = 0;
    int failed = 0;
    int maxErrors = 100;
    QStringList errors;         // con tope maxErrors
    QVector<qint64> factIds;
    QMap<EntityKind, QSet<qint64>> created;
    bool aborted = false;       // StorageError: la fila no cuenta como fallida
    QString fatal;

    void fold(const RowResult& r);
    int processed() const { return imported + failed; }
};

/* ================================ Tracker ================================ */
class ImportTracker : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<QDateTime()>;

    explicit ImportTracker(SalesStorage* store, ResultCache* cache = nullptr, QObject* parent = nullptr);

    void setStuckTimeout(int sec) { m_stuckTimeoutSec = sec; }
    int stuckTimeout() const { return m_stuckTimeoutSec; }
    void setMaxErrorLog(int n) { m_maxErrorLog = n; }
    void setClock(Clock c) { m_clock = std::move(c); }

    /* ---------- Ciclo de vida ---------- */
    // Nuevo job en pending. 0 si ya hay otro activo sobre la misma ruta.
    qint64 createJob(const QString& filename, const QString& storagePath, qint64 fileSize,
                     ImportTarget target, QString* err = nullptr);
    // pending -> processing (reinicia contadores). runToken identifica esta ejecución:
    // tras un resetStuck y un nuevo start, el token anterior deja de valer.
    bool start(qint64 jobId, int totalRows, quint64* runToken = nullptr, QString* err = nullptr);
    // Pliega el resultado de una fila. false si el job ya no está en processing con ese token.
    bool recordOutcome(qint64 jobId, quint64 runToken, const RowResult& r);
    // processing -> completed
    bool complete(qint64 jobId, quint64 runToken, QString* err = nullptr);
    // processing|pending -> failed, se conservan los contadores parciales.
    // Un job en proceso solo lo falla el token de su ejecución; runToken 0 vale para pending.
    bool fail(qint64 jobId, const QString& reason, quint64 runToken = 0);

    /* ---------- Consulta (polling) ---------- */
    bool job(qint64 jobId, ImportJob* out) const;
    QVector<ImportJob> jobs() const;

    /* ---------- Escape de operador ---------- */
    QVector<qint64> findStuck() const;
    bool isStuck(const ImportJob& j) const;
    // processing (atascado) -> pending. No revierte hechos ya escritos.
    bool resetStuck(qint64 jobId, QString* err = nullptr);
    int resetAllStuck();

    // Borrado en cascada: todos los hechos del import o nada
    bool deleteImport(qint64 jobId, int* removedFacts = nullptr, QString* err = nullptr);

signals:
    void progressChanged(qint64 jobId, int percent);
    void jobFinished(qint64 jobId, const QString& status);

private:
    struct Active {
        ImportJob job;
        ImportAccumulator acc;
        quint64 token = 0;
    };

    bool flush(const ImportJob& j, QString* err = nullptr);
    void applyAccumulator(Active& a) const;

    SalesStorage* m_store;
    ResultCache* m_cache;
    int m_stuckTimeoutSec = 600;
    int m_maxErrorLog = 100;
    Clock m_clock;

    mutable QMutex m_mutex;
    QHash<qint64, Active> m_active;   // jobs en processing de este proceso
    quint64 m_nextToken = 0;
};

#endif // IMPORTTRACKER_H
