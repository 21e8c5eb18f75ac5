#include <QtTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include "salesstore.h"
#include "testutil.h"

class TestSalesStore : public QObject {
    Q_OBJECT
private slots:
    void duplicateKeyIsReported();
    void contributionUpdatesAggregates();
    void attributesNeverTouchAggregates();
    void factCalendarIsDerived();
    void cascadeDeleteReusesSlots();
    void deleteUnknownImport();
    void recomputeRebuildsFromFacts();
    void compactDropsTombstones();
    void saveAndLoadKeepsCounters();
    void migratesVersionOne();
    void rejectsFutureVersion();
    void planTargetNeedsValidPeriod();
};

static qint64 newJob(MemorySalesStore& s) {
    ImportJob j;
    j.filename = "ventas.csv";
    j.status = ImportStatus::Completed;
    s.saveJob(j);
    return j.id;
}

void TestSalesStore::duplicateKeyIsReported() {
    MemorySalesStore s;
    const qint64 id = addEntity(s, EntityKind::Customer, "Ivanov");
    QVERIFY(id > 0);

    MasterEntity dup;
    dup.kind = EntityKind::Customer;
    dup.name = "IVANOV";
    dup.normalizedName = "ivanov";
    QString err;
    QCOMPARE(s.createEntity(dup, &err), StoreStatus::DuplicateKey);
    QVERIFY(!err.isEmpty());

    // La misma clave en otro tipo no choca
    QVERIFY(addEntity(s, EntityKind::Product, "Ivanov") > id);

    MasterEntity found;
    QCOMPARE(s.findEntity(EntityKind::Customer, "ivanov", &found), StoreStatus::Ok);
    QCOMPARE(found.id, id);
    QCOMPARE(s.findEntity(EntityKind::Customer, "petrov", nullptr), StoreStatus::NotFound);
}

void TestSalesStore::contributionUpdatesAggregates() {
    MemorySalesStore s;
    QSignalSpy spy(&s, &MemorySalesStore::entitiesChanged);
    const qint64 id = addEntity(s, EntityKind::Product, "Widget");

    QCOMPARE(s.addContribution(EntityKind::Product, id, 100.10, 2, QDate(2024, 3, 15)), StoreStatus::Ok);
    QCOMPARE(s.addContribution(EntityKind::Product, id, 50.20, 1, QDate(2024, 3, 1)), StoreStatus::Ok);
    QCOMPARE(s.addContribution(EntityKind::Product, 999, 1, 1, QDate(2024, 3, 1)), StoreStatus::NotFound);

    MasterEntity e;
    QVERIFY(s.entity(EntityKind::Product, id, &e));
    QCOMPARE(e.totalAmount, 150.30);
    QCOMPARE(e.totalQuantity, 3.0);
    QCOMPARE(e.count, qint64(2));
    QCOMPARE(e.lastActivity, QDate(2024, 3, 15));
    QCOMPARE(spy.count(), 3);
}

void TestSalesStore::attributesNeverTouchAggregates() {
    MemorySalesStore s;
    const qint64 id = addEntity(s, EntityKind::Customer, "Ivanov", QString(), "Norte");
    s.addContribution(EntityKind::Customer, id, 10, 1, QDate(2024, 1, 1));

    MasterEntity upd;
    upd.id = id;
    upd.kind = EntityKind::Customer;
    upd.email = "ivanov@example.com";
    upd.totalAmount = 9999;
    QCOMPARE(s.updateEntityAttributes(upd), StoreStatus::Ok);

    MasterEntity e;
    QVERIFY(s.entity(EntityKind::Customer, id, &e));
    QCOMPARE(e.email, QString("ivanov@example.com"));
    QCOMPARE(e.region, QString("Norte"));
    QCOMPARE(e.totalAmount, 10.0);
}

void TestSalesStore::factCalendarIsDerived() {
    MemorySalesStore s;
    const qint64 c = addEntity(s, EntityKind::Customer, "Ivanov");
    addFact(s, c, 0, QDate(2024, 3, 15), 100);
    const auto facts = s.facts();
    QCOMPARE(facts.size(), 1);
    const SalesFact& f = facts.first();
    QCOMPARE(f.year, 2024);
    QCOMPARE(f.month, 3);
    QCOMPARE(f.week, 11);
    QCOMPARE(f.weekYear, 2024);
    QCOMPARE(f.dayOfWeek, 4);

    SalesFact bad;
    QCOMPARE(s.insertFact(bad), StoreStatus::Failed);
}

void TestSalesStore::cascadeDeleteReusesSlots() {
    MemorySalesStore s;
    const qint64 c = addEntity(s, EntityKind::Customer, "Ivanov");
    const qint64 job = newJob(s);
    addFact(s, c, 0, QDate(2024, 3, 1), 10, 1, job);
    const qint64 keep = addFact(s, c, 0, QDate(2024, 3, 2), 20, 1, 0);
    const qint64 last = addFact(s, c, 0, QDate(2024, 3, 3), 30, 1, job);
    QCOMPARE(s.countFactsByImport(job), 2);

    QSignalSpy spy(&s, &MemorySalesStore::factsChanged);
    int removed = -1;
    QCOMPARE(s.deleteImport(job, &removed), StoreStatus::Ok);
    QCOMPARE(removed, 2);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(s.factCount(), 1);
    QCOMPARE(s.facts().first().id, keep);
    QVERIFY(!s.job(job, nullptr));

    auto st = s.availStats();
    QCOMPARE(st.total, 3);
    QCOMPARE(st.deleted, 2);
    QCOMPARE(st.freeSlots, 2);

    // El hueco se reutiliza pero el id sigue creciendo
    const qint64 fresh = addFact(s, c, 0, QDate(2024, 3, 4), 40);
    QVERIFY(fresh > last);
    st = s.availStats();
    QCOMPARE(st.total, 3);
    QCOMPARE(st.freeSlots, 1);
    QCOMPARE(s.factCount(), 2);
}

void TestSalesStore::deleteUnknownImport() {
    MemorySalesStore s;
    QString err;
    QCOMPARE(s.deleteImport(42, nullptr, &err), StoreStatus::NotFound);
    QVERIFY(err.contains("42"));
}

void TestSalesStore::recomputeRebuildsFromFacts() {
    MemorySalesStore s;
    const qint64 c = addEntity(s, EntityKind::Customer, "Ivanov");
    const qint64 p = addEntity(s, EntityKind::Product, "Widget");
    const qint64 job = newJob(s);
    addFact(s, c, p, QDate(2024, 3, 1), 100, 2, job);
    addFact(s, c, p, QDate(2024, 3, 5), 50, 1, 0);
    s.addContribution(EntityKind::Customer, c, 150, 3, QDate(2024, 3, 5));

    QVERIFY(s.deleteImport(job, nullptr) == StoreStatus::Ok);
    MasterEntity e;
    s.entity(EntityKind::Customer, c, &e);
    QCOMPARE(e.totalAmount, 150.0);   // el borrado no descuenta

    s.recomputeAggregates();
    s.entity(EntityKind::Customer, c, &e);
    QCOMPARE(e.totalAmount, 50.0);
    QCOMPARE(e.count, qint64(1));
    QCOMPARE(e.lastActivity, QDate(2024, 3, 5));
    s.entity(EntityKind::Product, p, &e);
    QCOMPARE(e.totalQuantity, 1.0);
}

void TestSalesStore::compactDropsTombstones() {
    MemorySalesStore s;
    const qint64 c = addEntity(s, EntityKind::Customer, "Ivanov");
    const qint64 job = newJob(s);
    addFact(s, c, 0, QDate(2024, 3, 1), 10, 1, job);
    addFact(s, c, 0, QDate(2024, 3, 2), 20);
    s.deleteImport(job, nullptr);

    QCOMPARE(s.compactFacts(), 1);
    const auto st = s.availStats();
    QCOMPARE(st.total, 1);
    QCOMPARE(st.deleted, 0);
    QCOMPARE(st.freeSlots, 0);
    QCOMPARE(s.facts().size(), 1);
    QCOMPARE(s.compactFacts(), 0);
}

void TestSalesStore::saveAndLoadKeepsCounters() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("ventas.json");

    MemorySalesStore s;
    const qint64 c = addEntity(s, EntityKind::Customer, "Ivanov", QString(), "Norte");
    const qint64 job = newJob(s);
    addFact(s, c, 0, QDate(2024, 3, 1), 10, 1, job);
    const qint64 keep = addFact(s, c, 0, QDate(2024, 3, 2), 20);
    const qint64 lastFact = addFact(s, c, 0, QDate(2024, 3, 3), 30, 1, job);
    PlanTarget p;
    p.periodStart = QDate(2024, 3, 1);
    p.periodEnd = QDate(2024, 3, 31);
    p.plannedRevenue = 1000;
    QCOMPARE(s.addPlanTarget(p), StoreStatus::Ok);
    s.deleteImport(job, nullptr);

    QString err;
    QVERIFY2(s.saveToJson(path, &err), qPrintable(err));

    MemorySalesStore loaded;
    QVERIFY2(loaded.loadFromJson(path, &err), qPrintable(err));
    QCOMPARE(loaded.factCount(), 1);
    QCOMPARE(loaded.facts().first().id, keep);
    QCOMPARE(loaded.planTargets().size(), 1);
    QCOMPARE(loaded.planTargets().first().plannedRevenue, 1000.0);
    MasterEntity e;
    QVERIFY(loaded.entity(EntityKind::Customer, c, &e));
    QCOMPARE(e.region, QString("Norte"));
    QCOMPARE(loaded.findEntity(EntityKind::Customer, "ivanov", nullptr), StoreStatus::Ok);

    // Los ids borrados no se vuelven a emitir
    QVERIFY(addFact(loaded, c, 0, QDate(2024, 3, 4), 5) > lastFact);
    ImportJob j2;
    loaded.saveJob(j2);
    QVERIFY(j2.id > job);
}

void TestSalesStore::migratesVersionOne() {
    QTemporaryDir dir;
    const QByteArray v1 = R"({
        "version": 1,
        "entities": [ { "id": 1, "kind": "customer", "name": "Ivanov", "normalizedName": "ivanov" } ],
        "facts": [ { "id": 7, "date": "2024-03-15", "customerId": 1, "amount": 100, "quantity": 2, "importId": 3 } ]
    })";
    const QString path = writeFile(dir, "old.json", v1);

    MemorySalesStore s;
    QString err;
    QVERIFY2(s.loadFromJson(path, &err), qPrintable(err));
    const auto facts = s.facts();
    QCOMPARE(facts.size(), 1);
    QCOMPARE(facts.first().importId, qint64(0));
    QCOMPARE(facts.first().week, 11);
    QCOMPARE(facts.first().year, 2024);
    QCOMPARE(s.countFactsByImport(0), 1);
}

void TestSalesStore::rejectsFutureVersion() {
    QTemporaryDir dir;
    const QString path = writeFile(dir, "future.json", R"({ "version": 99 })");
    MemorySalesStore s;
    addEntity(s, EntityKind::Customer, "Ivanov");
    QString err;
    QVERIFY(!s.loadFromJson(path, &err));
    QVERIFY(err.contains("99"));
    QCOMPARE(s.entities(EntityKind::Customer).size(), 1);

    QVERIFY(!s.loadFromJson(writeFile(dir, "broken.json", "{ nope"), &err));
    QVERIFY(!s.loadFromJson(dir.filePath("missing.json"), &err));
}

void TestSalesStore::planTargetNeedsValidPeriod() {
    MemorySalesStore s;
    PlanTarget p;
    p.periodStart = QDate(2024, 4, 1);
    p.periodEnd = QDate(2024, 3, 1);
    QCOMPARE(s.addPlanTarget(p), StoreStatus::Failed);
    QVERIFY(s.planTargets().isEmpty());
}

QTEST_GUILESS_MAIN(TestSalesStore)
#include "tst_salesstore.moc"
