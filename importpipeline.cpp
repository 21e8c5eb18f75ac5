#include "importpipeline.h"
#include "entityresolver.h"
#include "factwriter.h"
#include "csvreader.h"
#include <QFile>
#include <QFileInfo>
#include <QDebug>

ImportPipeline::ImportPipeline(SalesStorage* store, ImportTracker* tracker, const PipelineConfig& cfg,
                               QObject* parent)
    : QObject(parent), m_store(store), m_tracker(tracker), m_cfg(cfg) {}

ImportPipeline::~ImportPipeline() {
    m_pool.waitForDone();
}

qint64 ImportPipeline::createJobFor(const QString& path, ImportTarget target, QString* err) {
    const QFileInfo fi(path);
    const QString storagePath = fi.exists() ? fi.absoluteFilePath() : path;
    return m_tracker->createJob(fi.fileName(), storagePath, fi.exists() ? fi.size() : 0, target, err);
}

qint64 ImportPipeline::submit(const QString& path, ImportTarget target, QString* err) {
    const qint64 id = createJobFor(path, target, err);
    if (!id) return 0;
    m_pool.start([this, id]() {
        QString why;
        if (!run(id, &why))
            qWarning() << "[ventas] import" << id << "terminó con error:" << why;
    });
    return id;
}

qint64 ImportPipeline::importFile(const QString& path, ImportTarget target, QString* err) {
    const qint64 id = createJobFor(path, target, err);
    if (!id) return 0;
    run(id, err);
    return id;
}

bool ImportPipeline::waitForDone(int msecs) {
    return m_pool.waitForDone(msecs);
}

bool ImportPipeline::abort(qint64 jobId, quint64 runToken, const QString& reason, QString* err) {
    if (!m_tracker->fail(jobId, reason, runToken))
        qWarning() << "[ventas] el import" << jobId << "ya no pertenece a esta ejecución";
    if (err) *err = reason;
    return false;
}

bool ImportPipeline::loadRows(const ImportJob& job, RowValidator* validator, QVector<QStringList>* rows,
                              QString* err) {
    const QFileInfo fi(job.storagePath);
    if (!fi.exists()) { if (err) *err = tr("No existe el archivo %1").arg(job.storagePath); return false; }
    if (fi.size() > m_cfg.maxFileBytes) {
        if (err) *err = tr("Archivo demasiado grande (%1 bytes, máximo %2)").arg(fi.size()).arg(m_cfg.maxFileBytes);
        return false;
    }
    QFile f(job.storagePath);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = tr("No se pudo abrir %1: %2").arg(job.storagePath, f.errorString());
        return false;
    }
    CsvReader reader(&f);
    if (!reader.readHeader(err)) return false;
    if (!validator->bindHeader(reader.header(), err)) return false;

    QStringList fields;
    while (reader.next(&fields)) {
        if (rows->size() >= m_cfg.maxRows) {
            if (err) *err = tr("Demasiadas filas (máximo %1)").arg(m_cfg.maxRows);
            return false;
        }
        rows->push_back(fields);
    }
    return true;
}

RowResult ImportPipeline::processSalesRow(const RowValidator& v, const QStringList& fields, int rowNumber,
                                          qint64 jobId, EntityResolver& resolver, FactWriter& writer) {
    CandidateRow row;
    QString why;
    if (!v.validate(fields, rowNumber, &row, &why)) return RowResult::validationError(why);

    RowResult result;
    ResolvedRefs refs;
    EntityResolver::Resolved res;

    MasterEntity customer;
    customer.kind = EntityKind::Customer;
    customer.name = row.customerName;
    customer.normalizedName = row.customerKey;
    customer.region = row.region;
    if (!resolver.upsert(customer, &res, &why)) return RowResult::storageError(why);
    refs.customerId = res.id;
    if (res.created) result.createdEntities.push_back(qMakePair(EntityKind::Customer, res.id));

    if (!row.productKey.isEmpty()) {
        MasterEntity product;
        product.kind = EntityKind::Product;
        product.name = row.productName;
        product.normalizedName = row.productKey;
        product.category = row.category;
        if (!resolver.upsert(product, &res, &why)) return RowResult::storageError(why);
        refs.productId = res.id;
        if (res.created) result.createdEntities.push_back(qMakePair(EntityKind::Product, res.id));
    }
    if (!row.storeKey.isEmpty()) {
        if (!resolver.resolve(EntityKind::Store, row.storeName, row.storeKey, &res, &why))
            return RowResult::storageError(why);
        refs.storeId = res.id;
        if (res.created) result.createdEntities.push_back(qMakePair(EntityKind::Store, res.id));
    }

    // Primero el hecho, luego los agregados: un insert fallido no deja contribuciones huérfanas
    const qint64 factId = writer.write(row, refs, jobId, &why);
    if (!factId) return RowResult::storageError(why);

    if (!resolver.contribute(EntityKind::Customer, refs.customerId, row.amount, row.quantity, row.date, &why)
        || !resolver.contribute(EntityKind::Product, refs.productId, row.amount, row.quantity, row.date, &why)
        || !resolver.contribute(EntityKind::Store, refs.storeId, row.amount, row.quantity, row.date, &why))
        return RowResult::storageError(why);

    result.factId = factId;
    return result;
}

RowResult ImportPipeline::processMasterRow(const RowValidator& v, const QStringList& fields, int rowNumber,
                                           EntityResolver& resolver) {
    CandidateRow row;
    QString why;
    if (!v.validate(fields, rowNumber, &row, &why)) return RowResult::validationError(why);

    MasterEntity e;
    e.kind = (v.target() == ImportTarget::Customers) ? EntityKind::Customer : EntityKind::Product;
    e.name = row.name;
    e.normalizedName = row.nameKey;
    e.email = row.email;
    e.phone = row.phone;
    e.company = row.company;
    e.region = row.region;
    e.category = row.category;

    EntityResolver::Resolved res;
    if (!resolver.upsert(e, &res, &why)) return RowResult::storageError(why);
    RowResult result;
    if (res.created) result.createdEntities.push_back(qMakePair(e.kind, res.id));
    return result;
}

bool ImportPipeline::run(qint64 jobId, QString* err) {
    ImportJob job;
    if (!m_tracker->job(jobId, &job)) {
        if (err) *err = tr("No existe el import #%1").arg(jobId);
        return false;
    }
    if (job.status != ImportStatus::Pending) {
        if (err) *err = tr("El import #%1 no está pendiente").arg(jobId);
        return false;
    }

    RowValidator validator(job.target);
    QVector<QStringList> rows;
    QString why;
    if (!loadRows(job, &validator, &rows, &why)) return abort(jobId, 0, why, err);
    quint64 token = 0;
    if (!m_tracker->start(jobId, rows.size(), &token, err)) return false;

    EntityResolver resolver(m_store, m_cfg.resolverRetries);
    FactWriter writer(m_store);

    for (int i = 0; i < rows.size(); ++i) {
        const int rowNumber = i + 2; // la fila 1 es la cabecera
        const RowResult r = (job.target == ImportTarget::Sales)
            ? processSalesRow(validator, rows[i], rowNumber, jobId, resolver, writer)
            : processMasterRow(validator, rows[i], rowNumber, resolver);

        if (!m_tracker->recordOutcome(jobId, token, r)) {
            // Reiniciado por el operador mientras corría
            if (err) *err = tr("El import #%1 dejó de estar en proceso").arg(jobId);
            return false;
        }
        if (r.outcome == RowOutcome::StorageError) {
            qWarning() << "[ventas] error de almacenamiento en import" << jobId << r.message;
            return abort(jobId, token, r.message, err);
        }
    }
    return m_tracker->complete(jobId, token, err);
}
