#include <QtTest>
#include <QSignalSpy>
#include "importpipeline.h"
#include "importtracker.h"
#include "resultcache.h"
#include "testutil.h"

// Falla al insertar el hecho número failAt (1-based)
class FailingStore : public MemorySalesStore {
public:
    int failAt = 2;
    int inserts = 0;
    StoreStatus insertFact(SalesFact& f, QString* err = nullptr) override {
        if (++inserts == failAt) {
            if (err) *err = QStringLiteral("disco lleno");
            return StoreStatus::Failed;
        }
        return MemorySalesStore::insertFact(f, err);
    }
};

// Otro proceso crea "petrov" entre el lookup y el insert
class RacingStore : public MemorySalesStore {
public:
    mutable bool raced = false;
    StoreStatus findEntity(EntityKind kind, const QString& normalizedName, MasterEntity* out) const override {
        if (!raced && kind == EntityKind::Customer && normalizedName == QLatin1String("petrov")) {
            raced = true;
            MasterEntity rival;
            rival.kind = EntityKind::Customer;
            rival.name = "PETROV";
            rival.normalizedName = "petrov";
            const_cast<RacingStore*>(this)->MemorySalesStore::createEntity(rival);
            return StoreStatus::NotFound;
        }
        return MemorySalesStore::findEntity(kind, normalizedName, out);
    }
};

class LockedStore : public MemorySalesStore {
public:
    StoreStatus deleteImport(qint64, int*, QString* err = nullptr) override {
        if (err) *err = QStringLiteral("bloqueado");
        return StoreStatus::Failed;
    }
};

static const QByteArray kSales =
    "date;customer;product;amount;quantity\n"
    "15.03.2024;Ivanov;Widget;100;2\n"
    "16.03.2024;Petrov;Widget;50;1\n"
    "17.03.2024; IVANOV ;Gadget;30;3\n";

class TestImportPipeline : public QObject {
    Q_OBJECT
private slots:
    void importsAndResolvesExistingCustomer();
    void invalidRowsAreCountedNotFatal();
    void errorLogIsCapped();
    void reimportDoesNotDuplicateEntities();
    void storageFailureFailsJob();
    void duplicateKeyRaceIsResolved();
    void duplicateKeyOnLastRetryIsResolved();
    void cascadeDelete();
    void cascadeDeleteFailureKeepsFacts();
    void completionInvalidatesCache();
    void stuckJobCanBeResetAndRerun();
    void staleRunCannotTouchRestartedJob();
    void rejectsSecondActiveImportOfSamePath();
    void missingColumnsFailJob();
    void tooManyRowsFailJob();
    void missingFileFailsJob();
    void progressIsMonotonic();
    void submitRunsInBackground();
    void customersFileUpdatesAttributes();
};

void TestImportPipeline::importsAndResolvesExistingCustomer() {
    QTemporaryDir dir;
    MemorySalesStore store;
    const qint64 ivanov = addEntity(store, EntityKind::Customer, "Ivanov");
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());

    QString err;
    const qint64 id = pipeline.importFile(writeFile(dir, "ventas.csv", kSales), ImportTarget::Sales, &err);
    QVERIFY2(id > 0, qPrintable(err));

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.totalRows, 3);
    QCOMPARE(job.importedRows, 3);
    QCOMPARE(job.failedRows, 0);
    QCOMPARE(job.percent, 100);
    QCOMPARE(job.relatedFactIds.size(), 3);
    QVERIFY(job.completedAt.isValid());

    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
    QCOMPARE(job.createdEntities.value(EntityKind::Customer).size(), 1);
    QVERIFY(!job.createdEntities.value(EntityKind::Customer).contains(ivanov));
    QCOMPARE(job.createdEntities.value(EntityKind::Product).size(), 2);

    MasterEntity e;
    QVERIFY(store.entity(EntityKind::Customer, ivanov, &e));
    QCOMPARE(e.count, qint64(2));
    QCOMPARE(e.totalAmount, 130.0);
    QCOMPARE(e.totalQuantity, 5.0);
    QCOMPARE(e.lastActivity, QDate(2024, 3, 17));

    QCOMPARE(store.countFactsByImport(id), 3);
    for (const auto& f : store.facts()) QCOMPARE(f.importId, id);
}

void TestImportPipeline::invalidRowsAreCountedNotFatal() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const QByteArray csv =
        "date;customer;amount\n"
        "15.03.2024;Ivanov;100\n"
        "15.03.2024;Ivanov;-5\n"
        "31.02.2024;Petrov;10\n"
        "16.03.2024;;10\n";
    const qint64 id = pipeline.importFile(writeFile(dir, "v.csv", csv), ImportTarget::Sales);

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 1);
    QCOMPARE(job.failedRows, 3);
    QCOMPARE(job.errorLog.size(), 3);
    QVERIFY(job.errorLog.first().startsWith("Fila 3:"));
    QCOMPARE(store.factCount(), 1);
    // Las filas inválidas no crean entidades
    QCOMPARE(store.entities(EntityKind::Customer).size(), 1);
}

void TestImportPipeline::errorLogIsCapped() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    tracker.setMaxErrorLog(2);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    QByteArray csv = "date;customer;amount\n";
    for (int i = 0; i < 5; ++i) csv += "15.03.2024;Ivanov;0\n";
    const qint64 id = pipeline.importFile(writeFile(dir, "v.csv", csv), ImportTarget::Sales);

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.failedRows, 5);
    QCOMPARE(job.errorLog.size(), 2);
}

void TestImportPipeline::reimportDoesNotDuplicateEntities() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const QString path = writeFile(dir, "ventas.csv", kSales);

    const qint64 first = pipeline.importFile(path, ImportTarget::Sales);
    const qint64 second = pipeline.importFile(path, ImportTarget::Sales);
    QVERIFY(first > 0);
    QVERIFY(second > first);

    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
    QCOMPARE(store.entities(EntityKind::Product).size(), 2);
    QCOMPARE(store.factCount(), 6);

    // Cada import suma a la misma entidad: 2 x (100 + 30)
    MasterEntity ivanov;
    QCOMPARE(store.findEntity(EntityKind::Customer, "ivanov", &ivanov), StoreStatus::Ok);
    QCOMPARE(ivanov.count, qint64(4));
    QCOMPARE(ivanov.totalAmount, 260.0);
    QCOMPARE(ivanov.totalQuantity, 10.0);
    MasterEntity widget;
    QCOMPARE(store.findEntity(EntityKind::Product, "widget", &widget), StoreStatus::Ok);
    QCOMPARE(widget.count, qint64(4));
    QCOMPARE(widget.totalAmount, 300.0);

    ImportJob job;
    tracker.job(second, &job);
    QVERIFY(job.createdEntities.isEmpty() || job.createdEntities.value(EntityKind::Customer).isEmpty());
}

void TestImportPipeline::storageFailureFailsJob() {
    QTemporaryDir dir;
    FailingStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());

    QString err;
    const qint64 id = pipeline.importFile(writeFile(dir, "ventas.csv", kSales), ImportTarget::Sales, &err);
    QVERIFY(id > 0);
    QVERIFY(err.contains("disco lleno"));

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Failed);
    QCOMPARE(job.importedRows, 1);
    QCOMPARE(job.failedRows, 0);
    QVERIFY(job.importedRows + job.failedRows < job.totalRows);
    QVERIFY(job.message.contains("disco lleno"));
    QCOMPARE(store.factCount(), 1);
}

void TestImportPipeline::duplicateKeyRaceIsResolved() {
    QTemporaryDir dir;
    RacingStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const qint64 id = pipeline.importFile(writeFile(dir, "ventas.csv", kSales), ImportTarget::Sales);

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 3);
    QVERIFY(store.raced);

    MasterEntity petrov;
    QCOMPARE(store.findEntity(EntityKind::Customer, "petrov", &petrov), StoreStatus::Ok);
    QCOMPARE(petrov.name, QString("PETROV"));
    QCOMPARE(petrov.count, qint64(1));
    QVERIFY(!job.createdEntities.value(EntityKind::Customer).contains(petrov.id));
    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
}

void TestImportPipeline::duplicateKeyOnLastRetryIsResolved() {
    QTemporaryDir dir;
    RacingStore store;
    ImportTracker tracker(&store);
    PipelineConfig cfg;
    cfg.resolverRetries = 1;
    ImportPipeline pipeline(&store, &tracker, cfg);
    const qint64 id = pipeline.importFile(writeFile(dir, "ventas.csv", kSales), ImportTarget::Sales);

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 3);
    QCOMPARE(job.failedRows, 0);
    QVERIFY(store.raced);

    MasterEntity petrov;
    QCOMPARE(store.findEntity(EntityKind::Customer, "petrov", &petrov), StoreStatus::Ok);
    QCOMPARE(petrov.count, qint64(1));
    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
}

void TestImportPipeline::cascadeDelete() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ResultCache cache;
    ImportTracker tracker(&store, &cache);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const qint64 keep = pipeline.importFile(writeFile(dir, "a.csv", kSales), ImportTarget::Sales);
    const qint64 drop = pipeline.importFile(writeFile(dir, "b.csv", kSales), ImportTarget::Sales);
    const quint64 gen = cache.generation();

    int removed = 0;
    QString err;
    QVERIFY2(tracker.deleteImport(drop, &removed, &err), qPrintable(err));
    QCOMPARE(removed, 3);
    QCOMPARE(store.factCount(), 3);
    QCOMPARE(store.countFactsByImport(keep), 3);
    QCOMPARE(store.countFactsByImport(drop), 0);
    QVERIFY(!tracker.job(drop, nullptr));
    QCOMPARE(cache.generation(), gen + 1);
}

void TestImportPipeline::cascadeDeleteFailureKeepsFacts() {
    QTemporaryDir dir;
    LockedStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const qint64 id = pipeline.importFile(writeFile(dir, "a.csv", kSales), ImportTarget::Sales);

    QString err;
    QVERIFY(!tracker.deleteImport(id, nullptr, &err));
    QVERIFY(err.contains("bloqueado"));
    QCOMPARE(store.countFactsByImport(id), 3);
    QVERIFY(tracker.job(id, nullptr));
}

void TestImportPipeline::completionInvalidatesCache() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ResultCache cache;
    QSignalSpy spy(&cache, &ResultCache::invalidated);
    ImportTracker tracker(&store, &cache);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());

    cache.put("dashboard", QJsonObject(), QJsonValue(1));
    QVERIFY(cache.fetch("dashboard", QJsonObject(), false, nullptr));
    pipeline.importFile(writeFile(dir, "a.csv", kSales), ImportTarget::Sales);

    QCOMPARE(spy.count(), 1);
    QVERIFY(!cache.fetch("dashboard", QJsonObject(), false, nullptr));
}

void TestImportPipeline::stuckJobCanBeResetAndRerun() {
    QTemporaryDir dir;
    MemorySalesStore store;
    QDateTime now(QDate(2024, 3, 1), QTime(12, 0), Qt::UTC);
    ImportTracker tracker(&store);
    tracker.setClock([&now]{ return now; });
    tracker.setStuckTimeout(600);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());

    const QString path = writeFile(dir, "ventas.csv", kSales);
    const qint64 id = tracker.createJob("ventas.csv", QFileInfo(path).absoluteFilePath(), 0, ImportTarget::Sales);
    QVERIFY(id > 0);
    quint64 token = 0;
    QVERIFY(tracker.start(id, 3, &token));
    QVERIFY(tracker.recordOutcome(id, token, RowResult::validationError("Fila 2: falta el importe")));

    QString err;
    QVERIFY(!tracker.resetStuck(id, &err));
    QVERIFY(tracker.findStuck().isEmpty());

    now = now.addSecs(601);
    const QVector<qint64> stuck = tracker.findStuck();
    QCOMPARE(stuck.size(), 1);
    QCOMPARE(stuck.first(), id);
    QVERIFY2(tracker.resetStuck(id, &err), qPrintable(err));

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Pending);
    // El worker antiguo ya no puede registrar filas
    QVERIFY(!tracker.recordOutcome(id, token, RowResult::imported(1)));

    QVERIFY2(pipeline.run(id, &err), qPrintable(err));
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 3);
    QCOMPARE(job.failedRows, 0);

    // Un job terminado no se vuelve a ejecutar
    QVERIFY(!pipeline.run(id, &err));
}

void TestImportPipeline::staleRunCannotTouchRestartedJob() {
    MemorySalesStore store;
    QDateTime now(QDate(2024, 3, 1), QTime(12, 0), Qt::UTC);
    ImportTracker tracker(&store);
    tracker.setClock([&now]{ return now; });
    const qint64 id = tracker.createJob("ventas.csv", "/srv/ventas.csv", 0, ImportTarget::Sales);
    QVERIFY(id > 0);

    quint64 oldRun = 0;
    QVERIFY(tracker.start(id, 2, &oldRun));
    now = now.addSecs(tracker.stuckTimeout() + 1);
    QString err;
    QVERIFY2(tracker.resetStuck(id, &err), qPrintable(err));

    quint64 newRun = 0;
    QVERIFY(tracker.start(id, 2, &newRun));
    QVERIFY(newRun != oldRun);

    // El worker reiniciado sigue vivo y no debe contar filas ni cerrar el job
    QVERIFY(!tracker.recordOutcome(id, oldRun, RowResult::imported(7)));
    QVERIFY(!tracker.complete(id, oldRun, &err));
    QVERIFY(!tracker.fail(id, "worker antiguo", oldRun));
    QVERIFY(!tracker.fail(id, "sin token"));

    QVERIFY(tracker.recordOutcome(id, newRun, RowResult::imported(8)));
    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Processing);
    QCOMPARE(job.importedRows, 1);

    QVERIFY2(tracker.complete(id, newRun, &err), qPrintable(err));
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 1);
    QCOMPARE(job.totalRows, 1);
    QCOMPARE(job.relatedFactIds, QVector<qint64>{ 8 });
}

void TestImportPipeline::rejectsSecondActiveImportOfSamePath() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const QString path = writeFile(dir, "ventas.csv", kSales);

    const qint64 pending = tracker.createJob("ventas.csv", QFileInfo(path).absoluteFilePath(), 0, ImportTarget::Sales);
    QVERIFY(pending > 0);
    QString err;
    QCOMPARE(pipeline.importFile(path, ImportTarget::Sales, &err), qint64(0));
    QVERIFY(err.contains(QString::number(pending)));
    QCOMPARE(store.factCount(), 0);
}

void TestImportPipeline::missingColumnsFailJob() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    QString err;
    const qint64 id = pipeline.importFile(writeFile(dir, "v.csv", "date;customer\n15.03.2024;Ivanov\n"),
                                          ImportTarget::Sales, &err);
    QVERIFY(id > 0);
    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Failed);
    QVERIFY(job.message.contains("amount"));
    QCOMPARE(store.factCount(), 0);
}

void TestImportPipeline::tooManyRowsFailJob() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    PipelineConfig cfg;
    cfg.maxRows = 2;
    ImportPipeline pipeline(&store, &tracker, cfg);
    const qint64 id = pipeline.importFile(writeFile(dir, "v.csv", kSales), ImportTarget::Sales);
    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Failed);
    QCOMPARE(store.factCount(), 0);
}

void TestImportPipeline::missingFileFailsJob() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    QString err;
    const qint64 id = pipeline.importFile(dir.filePath("nada.csv"), ImportTarget::Sales, &err);
    QVERIFY(id > 0);
    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Failed);
    QVERIFY(!err.isEmpty());
}

void TestImportPipeline::progressIsMonotonic() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    QSignalSpy progress(&tracker, &ImportTracker::progressChanged);
    QSignalSpy finished(&tracker, &ImportTracker::jobFinished);

    QByteArray csv = "date;customer;amount\n";
    for (int i = 0; i < 10; ++i) csv += (i % 3 == 0) ? "15.03.2024;Ivanov;x\n" : "15.03.2024;Ivanov;10\n";
    const qint64 id = pipeline.importFile(writeFile(dir, "v.csv", csv), ImportTarget::Sales);

    QVERIFY(progress.count() > 1);
    int last = -1;
    for (const auto& args : progress) {
        QCOMPARE(args.at(0).toLongLong(), id);
        const int pct = args.at(1).toInt();
        QVERIFY(pct >= last);
        last = pct;
    }
    QCOMPARE(last, 100);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(1).toString(), QString("completed"));
}

void TestImportPipeline::submitRunsInBackground() {
    QTemporaryDir dir;
    MemorySalesStore store;
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const qint64 a = pipeline.submit(writeFile(dir, "a.csv", kSales), ImportTarget::Sales);
    const qint64 b = pipeline.submit(writeFile(dir, "b.csv", kSales), ImportTarget::Sales);
    QVERIFY(a > 0 && b > 0);
    QVERIFY(pipeline.waitForDone(10000));

    for (qint64 id : { a, b }) {
        ImportJob job;
        QVERIFY(tracker.job(id, &job));
        QCOMPARE(job.status, ImportStatus::Completed);
        QCOMPARE(job.importedRows, 3);
    }
    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
    QCOMPARE(store.factCount(), 6);

    // Las dos tareas concurrentes no pierden contribuciones
    MasterEntity ivanov;
    QCOMPARE(store.findEntity(EntityKind::Customer, "ivanov", &ivanov), StoreStatus::Ok);
    QCOMPARE(ivanov.count, qint64(4));
    QCOMPARE(ivanov.totalAmount, 260.0);
    MasterEntity petrov;
    QCOMPARE(store.findEntity(EntityKind::Customer, "petrov", &petrov), StoreStatus::Ok);
    QCOMPARE(petrov.count, qint64(2));
    QCOMPARE(petrov.totalAmount, 100.0);
}

void TestImportPipeline::customersFileUpdatesAttributes() {
    QTemporaryDir dir;
    MemorySalesStore store;
    const qint64 ivanov = addEntity(store, EntityKind::Customer, "Ivanov");
    ImportTracker tracker(&store);
    ImportPipeline pipeline(&store, &tracker, PipelineConfig());
    const QByteArray csv =
        "name;email;phone;region\n"
        "Ivanov;ivanov@example.com;+7 900;Norte\n"
        "Sidorov;;;Sur\n"
        "Kuznetsov;sin-arroba;;\n";
    const qint64 id = pipeline.importFile(writeFile(dir, "clientes.csv", csv), ImportTarget::Customers);

    ImportJob job;
    QVERIFY(tracker.job(id, &job));
    QCOMPARE(job.status, ImportStatus::Completed);
    QCOMPARE(job.importedRows, 2);
    QCOMPARE(job.failedRows, 1);
    QCOMPARE(job.createdEntities.value(EntityKind::Customer).size(), 1);

    MasterEntity e;
    QVERIFY(store.entity(EntityKind::Customer, ivanov, &e));
    QCOMPARE(e.email, QString("ivanov@example.com"));
    QCOMPARE(e.region, QString("Norte"));
    QCOMPARE(e.count, qint64(0));
    QCOMPARE(store.entities(EntityKind::Customer).size(), 2);
    QCOMPARE(store.factCount(), 0);
}

QTEST_GUILESS_MAIN(TestImportPipeline)
#include "tst_importpipeline.moc"
