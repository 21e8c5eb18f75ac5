#include "salesstore.h"
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QDebug>
#include <algorithm>

MemorySalesStore::MemorySalesStore(QObject* parent) : QObject(parent) {}

/* ============================ Datos maestros ============================ */
StoreStatus MemorySalesStore::findEntity(EntityKind kind, const QString& normalizedName,
                                         MasterEntity* out) const {
    QMutexLocker lk(&m_mutex);
    const auto byName = m_byName.value(kind);
    auto it = byName.constFind(normalizedName);
    if (it == byName.constEnd()) return StoreStatus::NotFound;
    if (out) *out = m_entities.value(kind).value(it.value());
    return StoreStatus::Ok;
}

StoreStatus MemorySalesStore::createEntity(MasterEntity& e, QString* err) {
    {
        QMutexLocker lk(&m_mutex);
        if (e.normalizedName.isEmpty()) {
            if (err) *err = tr("Nombre normalizado vacío.");
            return StoreStatus::Failed;
        }
        auto& byName = m_byName[e.kind];
        if (byName.contains(e.normalizedName)) {
            if (err) *err = tr("Clave duplicada (%1): %2").arg(kindToString(e.kind), e.normalizedName);
            return StoreStatus::DuplicateKey;
        }
        e.id = ++m_lastEntityId;
        m_entities[e.kind].insert(e.id, e);
        byName.insert(e.normalizedName, e.id);
    }
    emit entitiesChanged();
    return StoreStatus::Ok;
}

StoreStatus MemorySalesStore::updateEntityAttributes(const MasterEntity& e, QString* err) {
    {
        QMutexLocker lk(&m_mutex);
        auto& map = m_entities[e.kind];
        auto it = map.find(e.id);
        if (it == map.end()) {
            if (err) *err = tr("No existe la entidad %1 #%2").arg(kindToString(e.kind)).arg(e.id);
            return StoreStatus::NotFound;
        }
        // Sólo se rellenan atributos no vacíos
        if (!e.category.isEmpty()) it->category = e.category;
        if (!e.region.isEmpty())   it->region = e.region;
        if (!e.email.isEmpty())    it->email = e.email;
        if (!e.phone.isEmpty())    it->phone = e.phone;
        if (!e.company.isEmpty())  it->company = e.company;
    }
    emit entitiesChanged();
    return StoreStatus::Ok;
}

StoreStatus MemorySalesStore::addContribution(EntityKind kind, qint64 id, double amount, double quantity,
                                              const QDate& date, QString* err) {
    {
        QMutexLocker lk(&m_mutex);
        auto& map = m_entities[kind];
        auto it = map.find(id);
        if (it == map.end()) {
            if (err) *err = tr("No existe la entidad %1 #%2").arg(kindToString(kind)).arg(id);
            return StoreStatus::NotFound;
        }
        it->totalAmount = round2(it->totalAmount + amount);
        it->totalQuantity += quantity;
        it->count += 1;
        if (date.isValid() && (!it->lastActivity.isValid() || date > it->lastActivity))
            it->lastActivity = date;
    }
    emit entitiesChanged();
    return StoreStatus::Ok;
}

bool MemorySalesStore::entity(EntityKind kind, qint64 id, MasterEntity* out) const {
    QMutexLocker lk(&m_mutex);
    const auto map = m_entities.value(kind);
    auto it = map.constFind(id);
    if (it == map.constEnd()) return false;
    if (out) *out = it.value();
    return true;
}

QVector<MasterEntity> MemorySalesStore::entities(EntityKind kind) const {
    QMutexLocker lk(&m_mutex);
    QVector<MasterEntity> out;
    const auto map = m_entities.value(kind);
    out.reserve(map.size());
    for (const auto& e : map) out.push_back(e);
    return out;
}

/* ================================ Hechos ================================ */
StoreStatus MemorySalesStore::insertFact(SalesFact& f, QString* err) {
    {
        QMutexLocker lk(&m_mutex);
        if (!f.date.isValid()) {
            if (err) *err = tr("Hecho sin fecha válida.");
            return StoreStatus::Failed;
        }
        f.id = ++m_lastFactId;
        f.deriveCalendar();

        int slot = -1;
        if (!m_freeList.isEmpty()) {
            slot = m_freeList.takeLast();   // ⟵ reutiliza hueco (LIFO)
            m_facts[slot] = f;
        } else {
            slot = m_facts.size();
            m_facts.push_back(f);
        }
        m_factSlot.insert(f.id, slot);
    }
    emit factsChanged();
    return StoreStatus::Ok;
}

QVector<SalesFact> MemorySalesStore::facts(const QDate& from, const QDate& to) const {
    QMutexLocker lk(&m_mutex);
    QVector<SalesFact> out;
    out.reserve(m_facts.size());
    for (const auto& f : m_facts) {
        if (isTombstone(f)) continue;
        if (from.isValid() && f.date < from) continue;
        if (to.isValid() && f.date > to) continue;
        out.push_back(f);
    }
    std::sort(out.begin(), out.end(), [](const SalesFact& a, const SalesFact& b){ return a.id < b.id; });
    return out;
}

int MemorySalesStore::factCount() const {
    QMutexLocker lk(&m_mutex);
    return m_factSlot.size();
}

int MemorySalesStore::countFactsByImport(qint64 importId) const {
    QMutexLocker lk(&m_mutex);
    int n = 0;
    for (const auto& f : m_facts)
        if (!isTombstone(f) && f.importId == importId) ++n;
    return n;
}

/* ============================== Import jobs ============================== */
StoreStatus MemorySalesStore::saveJob(ImportJob& job, QString* err) {
    Q_UNUSED(err);
    QMutexLocker lk(&m_mutex);
    if (job.id == 0) job.id = ++m_lastJobId;
    else if (job.id > m_lastJobId) m_lastJobId = job.id;
    m_jobs.insert(job.id, job);
    return StoreStatus::Ok;
}

bool MemorySalesStore::job(qint64 id, ImportJob* out) const {
    QMutexLocker lk(&m_mutex);
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd()) return false;
    if (out) *out = it.value();
    return true;
}

QVector<ImportJob> MemorySalesStore::jobs() const {
    QMutexLocker lk(&m_mutex);
    QVector<ImportJob> out;
    for (const auto& j : m_jobs) out.push_back(j);
    return out;
}

StoreStatus MemorySalesStore::deleteImport(qint64 jobId, int* removedFacts, QString* err) {
    int removed = 0;
    {
        QMutexLocker lk(&m_mutex);
        if (!m_jobs.contains(jobId)) {
            if (err) *err = tr("No existe el import #%1").arg(jobId);
            return StoreStatus::NotFound;
        }
        // Marcar tombstones + añadir a free list (no eliminar físicamente)
        for (int slot = 0; slot < m_facts.size(); ++slot) {
            SalesFact& f = m_facts[slot];
            if (isTombstone(f) || f.importId != jobId) continue;
            m_factSlot.remove(f.id);
            f = SalesFact();                  // ⟵ tombstone (id == 0)
            m_freeList.push_back(slot);
            ++removed;
        }
        m_jobs.remove(jobId);
    }
    if (removedFacts) *removedFacts = removed;
    qInfo() << "[ventas] import" << jobId << "eliminado en cascada," << removed << "hechos";
    emit factsChanged();
    return StoreStatus::Ok;
}

/* ================================= Plan ================================= */
StoreStatus MemorySalesStore::addPlanTarget(PlanTarget& p, QString* err) {
    QMutexLocker lk(&m_mutex);
    if (!p.periodStart.isValid() || !p.periodEnd.isValid() || p.periodStart > p.periodEnd) {
        if (err) *err = tr("Periodo de plan inválido.");
        return StoreStatus::Failed;
    }
    if (p.id == 0) p.id = ++m_lastPlanId;
    else if (p.id > m_lastPlanId) m_lastPlanId = p.id;
    m_plans.insert(p.id, p);
    return StoreStatus::Ok;
}

QVector<PlanTarget> MemorySalesStore::planTargets() const {
    QMutexLocker lk(&m_mutex);
    QVector<PlanTarget> out;
    for (const auto& p : m_plans) out.push_back(p);
    return out;
}

/* ============================= Mantenimiento ============================= */
void MemorySalesStore::clearUnlocked() {
    m_entities.clear();
    m_byName.clear();
    m_facts.clear();
    m_freeList.clear();
    m_factSlot.clear();
    m_jobs.clear();
    m_plans.clear();
    m_lastEntityId = m_lastFactId = m_lastJobId = m_lastPlanId = 0;
}

void MemorySalesStore::resetAll() {
    {
        QMutexLocker lk(&m_mutex);
        clearUnlocked();
    }
    qInfo() << "[ventas] almacén reiniciado";
    emit entitiesChanged();
    emit factsChanged();
}

void MemorySalesStore::recomputeAggregates() {
    {
        QMutexLocker lk(&m_mutex);
        for (auto& map : m_entities) {
            for (auto& e : map) {
                e.totalAmount = 0.0;
                e.totalQuantity = 0.0;
                e.count = 0;
                e.lastActivity = QDate();
            }
        }
        auto apply = [this](EntityKind k, qint64 id, const SalesFact& f) {
            if (isNullId(id)) return;
            auto& map = m_entities[k];
            auto it = map.find(id);
            if (it == map.end()) return;
            it->totalAmount = round2(it->totalAmount + f.amount);
            it->totalQuantity += f.quantity;
            it->count += 1;
            if (!it->lastActivity.isValid() || f.date > it->lastActivity) it->lastActivity = f.date;
        };
        for (const auto& f : m_facts) {
            if (isTombstone(f)) continue;
            apply(EntityKind::Customer, f.customerId, f);
            apply(EntityKind::Product, f.productId, f);
            apply(EntityKind::Store, f.storeId, f);
        }
    }
    emit entitiesChanged();
}

int MemorySalesStore::compactFacts() {
    int removed = 0;
    {
        QMutexLocker lk(&m_mutex);
        QVector<SalesFact> compacted;
        compacted.reserve(m_facts.size());
        for (const auto& f : m_facts)
            if (!isTombstone(f)) compacted.push_back(f);
        removed = m_facts.size() - compacted.size();
        m_facts.swap(compacted);
        m_freeList.clear();
        m_factSlot.clear();
        for (int i = 0; i < m_facts.size(); ++i) m_factSlot.insert(m_facts[i].id, i);
    }
    emit factsChanged();
    return removed;
}

MemorySalesStore::AvailStats MemorySalesStore::availStats() const {
    QMutexLocker lk(&m_mutex);
    AvailStats st;
    st.total = m_facts.size();
    for (const auto& f : m_facts)
        if (isTombstone(f)) ++st.deleted;
    st.freeSlots = m_freeList.size();
    return st;
}

/* ============================== Persistencia ============================== */
bool MemorySalesStore::saveToJson(const QString& file, QString* err) const {
    QJsonObject root;
    {
        QMutexLocker lk(&m_mutex);
        root["version"] = kSnapshotVersion;

        QJsonArray ents;
        for (const auto& map : m_entities)
            for (const auto& e : map) ents.push_back(e.toJson());
        root["entities"] = ents;

        QJsonArray facts;
        for (const auto& f : m_facts)
            if (!isTombstone(f)) facts.push_back(f.toJson());
        root["facts"] = facts;

        QJsonArray jobs;
        for (const auto& j : m_jobs) jobs.push_back(j.toJson());
        root["jobs"] = jobs;

        QJsonArray plans;
        for (const auto& p : m_plans) plans.push_back(p.toJson());
        root["plans"] = plans;

        QJsonObject counters;
        counters["entity"] = m_lastEntityId;
        counters["fact"] = m_lastFactId;
        counters["job"] = m_lastJobId;
        counters["plan"] = m_lastPlanId;
        root["lastIssuedId"] = counters;
    }

    QSaveFile sf(file);
    if (!sf.open(QIODevice::WriteOnly)) {
        if (err) *err = tr("No se pudo escribir %1").arg(file);
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (sf.write(data) != data.size() || !sf.commit()) {
        if (err) *err = tr("Error al guardar %1: %2").arg(file, sf.errorString());
        return false;
    }
    return true;
}

bool MemorySalesStore::loadFromJson(const QString& file, QString* err) {
    QFile f(file);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = tr("No se pudo abrir %1").arg(file);
        return false;
    }
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = tr("JSON inválido en %1: %2").arg(file, pe.errorString());
        return false;
    }
    const QJsonObject root = doc.object();
    const int version = root.value("version").toInt(1);
    if (version < 1 || version > kSnapshotVersion) {
        if (err) *err = tr("Versión de datos no soportada: %1").arg(version);
        return false;
    }

    {
        QMutexLocker lk(&m_mutex);
        clearUnlocked();

        for (const auto& v : root.value("entities").toArray()) {
            const MasterEntity e = MasterEntity::fromJson(v.toObject());
            if (e.id <= 0 || e.normalizedName.isEmpty()) continue;
            m_entities[e.kind].insert(e.id, e);
            m_byName[e.kind].insert(e.normalizedName, e.id);
            m_lastEntityId = qMax(m_lastEntityId, e.id);
        }

        for (const auto& v : root.value("facts").toArray()) {
            SalesFact sf = SalesFact::fromJson(v.toObject());
            if (sf.id <= 0) continue;
            if (version < 2) {
                // v1 -> v2: hechos sin import propietario y sin campos de calendario
                sf.importId = 0;
                sf.deriveCalendar();
            }
            m_factSlot.insert(sf.id, m_facts.size());
            m_facts.push_back(sf);
            m_lastFactId = qMax(m_lastFactId, sf.id);
        }

        for (const auto& v : root.value("jobs").toArray()) {
            const ImportJob j = ImportJob::fromJson(v.toObject());
            if (j.id <= 0) continue;
            m_jobs.insert(j.id, j);
            m_lastJobId = qMax(m_lastJobId, j.id);
        }

        for (const auto& v : root.value("plans").toArray()) {
            const PlanTarget p = PlanTarget::fromJson(v.toObject());
            if (p.id <= 0) continue;
            m_plans.insert(p.id, p);
            m_lastPlanId = qMax(m_lastPlanId, p.id);
        }

        // Los contadores nunca bajan aunque se hayan borrado filas
        const QJsonObject counters = root.value("lastIssuedId").toObject();
        m_lastEntityId = qMax(m_lastEntityId, counters.value("entity").toVariant().toLongLong());
        m_lastFactId   = qMax(m_lastFactId,   counters.value("fact").toVariant().toLongLong());
        m_lastJobId    = qMax(m_lastJobId,    counters.value("job").toVariant().toLongLong());
        m_lastPlanId   = qMax(m_lastPlanId,   counters.value("plan").toVariant().toLongLong());
    }

    if (version < kSnapshotVersion)
        qInfo() << "[ventas] datos migrados de v" << version << "a v" << kSnapshotVersion;
    emit entitiesChanged();
    emit factsChanged();
    return true;
}
