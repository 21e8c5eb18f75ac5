#ifndef IMPORTPIPELINE_H
#define IMPORTPIPELINE_H

#include <QObject>
#include <QThreadPool>
#include "pipelineconfig.h"
#include "importtracker.h"
#include "rowvalidator.h"

class EntityResolver;
class FactWriter;

/**
 * Archivo -> filas validadas -> resolución de entidades -> escritura de hechos.
 * Una fila inválida nunca aborta el job; un error de almacenamiento sí.
 */
class ImportPipeline : public QObject {
    Q_OBJECT
public:
    ImportPipeline(SalesStorage* store, ImportTracker* tracker, const PipelineConfig& cfg,
                   QObject* parent = nullptr);
    ~ImportPipeline() override;

    // Crea el job y lo procesa en segundo plano. Devuelve el id al instante (0 si no se pudo crear).
    qint64 submit(const QString& path, ImportTarget target, QString* err = nullptr);
    // Igual que submit pero síncrono
    qint64 importFile(const QString& path, ImportTarget target, QString* err = nullptr);
    // Procesa un job en pending (nuevo o reiniciado tras quedar atascado)
    bool run(qint64 jobId, QString* err = nullptr);

    bool waitForDone(int msecs = -1);

private:
    qint64 createJobFor(const QString& path, ImportTarget target, QString* err);
    bool loadRows(const ImportJob& job, RowValidator* validator, QVector<QStringList>* rows, QString* err);
    RowResult processSalesRow(const RowValidator& v, const QStringList& fields, int rowNumber,
                              qint64 jobId, EntityResolver& resolver, FactWriter& writer);
    RowResult processMasterRow(const RowValidator& v, const QStringList& fields, int rowNumber,
                               EntityResolver& resolver);
    bool abort(qint64 jobId, quint64 runToken, const QString& reason, QString* err);

    SalesStorage* m_store;
    ImportTracker* m_tracker;
    PipelineConfig m_cfg;
    QThreadPool m_pool;
};

#endif // IMPORTPIPELINE_H
