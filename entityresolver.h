#ifndef ENTITYRESOLVER_H
#define ENTITYRESOLVER_H

#include <QString>
#include <QHash>
#include "salesstore.h"

/**
 * Lookup-or-create de datos maestros sobre la clave normalizada.
 * Si otro resolver gana la carrera de creación (DuplicateKey), se reintenta
 * el lookup en lugar de fallar.
 */
class EntityResolver {
public:
    explicit EntityResolver(SalesStorage* store, int maxRetries = 3);

    struct Resolved {
        qint64 id = 0;
        bool created = false;
    };

    // false sólo ante un error de almacenamiento (StorageError)
    bool resolve(EntityKind kind, const QString& displayName, const QString& normalizedName,
                 Resolved* out, QString* err = nullptr);

    // Variante con atributos (archivos de clientes / productos): completa los que falten
    bool upsert(const MasterEntity& candidate, Resolved* out, QString* err = nullptr);

    // Suma la contribución de una fila a los agregados corrientes
    bool contribute(EntityKind kind, qint64 id, double amount, double quantity,
                    const QDate& date, QString* err = nullptr);

private:
    SalesStorage* m_store;
    int m_maxRetries;
    // Caché local por import: "kind:normalizado" -> id
    QHash<QString, qint64> m_cache;

    static QString cacheKey(EntityKind kind, const QString& key) { return kindToString(kind) + ':' + key; }
};

#endif // ENTITYRESOLVER_H
