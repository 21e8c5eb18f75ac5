#include "entityresolver.h"
#include <QDebug>

EntityResolver::EntityResolver(SalesStorage* store, int maxRetries)
    : m_store(store), m_maxRetries(qMax(1, maxRetries)) {}

bool EntityResolver::resolve(EntityKind kind, const QString& displayName, const QString& normalizedName,
                             Resolved* out, QString* err) {
    MasterEntity e;
    e.kind = kind;
    e.name = displayName.trimmed();
    e.normalizedName = normalizedName;
    return upsert(e, out, err);
}

bool EntityResolver::upsert(const MasterEntity& candidate, Resolved* out, QString* err) {
    Resolved r;
    const QString ck = cacheKey(candidate.kind, candidate.normalizedName);
    const bool hasAttrs = !candidate.category.isEmpty() || !candidate.region.isEmpty()
                       || !candidate.email.isEmpty() || !candidate.phone.isEmpty()
                       || !candidate.company.isEmpty();

    auto cached = m_cache.constFind(ck);
    if (cached != m_cache.constEnd() && !hasAttrs) {
        r.id = cached.value();
        if (out) *out = r;
        return true;
    }

    auto adopt = [&](const MasterEntity& found) {
        r.id = found.id;
        if (!hasAttrs) return true;
        MasterEntity upd = candidate;
        upd.id = found.id;
        return m_store->updateEntityAttributes(upd, err) == StoreStatus::Ok;
    };

    for (int attempt = 0; attempt < m_maxRetries && r.id == 0; ++attempt) {
        MasterEntity found;
        StoreStatus st = m_store->findEntity(candidate.kind, candidate.normalizedName, &found);
        if (st == StoreStatus::Ok) {
            if (!adopt(found)) return false;
            break;
        }
        if (st != StoreStatus::NotFound) {
            if (err && err->isEmpty()) *err = QStringLiteral("Error de almacenamiento al buscar \"%1\"").arg(candidate.normalizedName);
            return false;
        }

        MasterEntity fresh = candidate;
        fresh.id = 0;
        QString createErr;
        st = m_store->createEntity(fresh, &createErr);
        if (st == StoreStatus::Ok) {
            r.id = fresh.id;
            r.created = true;
            break;
        }
        if (st != StoreStatus::DuplicateKey) {
            if (err) *err = createErr;
            return false;
        }
        // Otra importación la creó entre el lookup y el insert: la fila ganadora ya existe
        qDebug() << "[ventas] carrera de clave" << ck << "intento" << attempt + 1;
        st = m_store->findEntity(candidate.kind, candidate.normalizedName, &found);
        if (st == StoreStatus::Ok && !adopt(found)) return false;
    }

    if (r.id == 0) {
        if (err) *err = QStringLiteral("No se pudo resolver \"%1\" tras %2 intentos").arg(candidate.normalizedName).arg(m_maxRetries);
        return false;
    }
    m_cache.insert(ck, r.id);
    if (out) *out = r;
    return true;
}

bool EntityResolver::contribute(EntityKind kind, qint64 id, double amount, double quantity,
                                const QDate& date, QString* err) {
    if (isNullId(id)) return true;
    return m_store->addContribution(kind, id, amount, quantity, date, err) == StoreStatus::Ok;
}
