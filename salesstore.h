#ifndef SALESSTORE_H
#define SALESSTORE_H

#include <QObject>
#include <QMap>
#include <QHash>
#include <QVector>
#include <QMutex>
#include <QMutexLocker>
#include "salesmodel.h"

enum class StoreStatus { Ok, DuplicateKey, NotFound, Failed };

/* =====================================================================
 *  Operaciones que el núcleo necesita de la capa de almacenamiento:
 *  upsert por clave única, borrado en cascada y lecturas por rango.
 * ===================================================================== */
class SalesStorage {
public:
    virtual ~SalesStorage() = default;

    /* ---------- Datos maestros ---------- */
    virtual StoreStatus findEntity(EntityKind kind, const QString& normalizedName,
                                   MasterEntity* out) const = 0;
    // Asigna id. DuplicateKey si ya existe normalizedName para ese tipo.
    virtual StoreStatus createEntity(MasterEntity& e, QString* err = nullptr) = 0;
    // Sólo atributos (categoría, región, contacto); nunca toca los agregados.
    virtual StoreStatus updateEntityAttributes(const MasterEntity& e, QString* err = nullptr) = 0;
    // Incremento atómico de agregados corrientes
    virtual StoreStatus addContribution(EntityKind kind, qint64 id, double amount, double quantity,
                                        const QDate& date, QString* err = nullptr) = 0;
    virtual bool entity(EntityKind kind, qint64 id, MasterEntity* out) const = 0;
    virtual QVector<MasterEntity> entities(EntityKind kind) const = 0;

    /* ---------- Hechos ---------- */
    virtual StoreStatus insertFact(SalesFact& f, QString* err = nullptr) = 0;
    // from/to inválidos = sin límite
    virtual QVector<SalesFact> facts(const QDate& from = QDate(), const QDate& to = QDate()) const = 0;
    virtual int factCount() const = 0;
    virtual int countFactsByImport(qint64 importId) const = 0;

    /* ---------- Import jobs ---------- */
    // id == 0 -> inserta y asigna id; si no, reemplaza
    virtual StoreStatus saveJob(ImportJob& job, QString* err = nullptr) = 0;
    virtual bool job(qint64 id, ImportJob* out) const = 0;
    virtual QVector<ImportJob> jobs() const = 0;
    // Borra el job y todos sus hechos como una sola operación (todo o nada)
    virtual StoreStatus deleteImport(qint64 jobId, int* removedFacts, QString* err = nullptr) = 0;

    /* ---------- Plan ---------- */
    virtual StoreStatus addPlanTarget(PlanTarget& p, QString* err = nullptr) = 0;
    virtual QVector<PlanTarget> planTargets() const = 0;
};

/* ========================= Almacén en memoria ========================= */
class MemorySalesStore : public QObject, public SalesStorage {
    Q_OBJECT
public:
    explicit MemorySalesStore(QObject* parent = nullptr);

    StoreStatus findEntity(EntityKind kind, const QString& normalizedName,
                           MasterEntity* out) const override;
    StoreStatus createEntity(MasterEntity& e, QString* err = nullptr) override;
    StoreStatus updateEntityAttributes(const MasterEntity& e, QString* err = nullptr) override;
    StoreStatus addContribution(EntityKind kind, qint64 id, double amount, double quantity,
                                const QDate& date, QString* err = nullptr) override;
    bool entity(EntityKind kind, qint64 id, MasterEntity* out) const override;
    QVector<MasterEntity> entities(EntityKind kind) const override;

    StoreStatus insertFact(SalesFact& f, QString* err = nullptr) override;
    QVector<SalesFact> facts(const QDate& from = QDate(), const QDate& to = QDate()) const override;
    int factCount() const override;
    int countFactsByImport(qint64 importId) const override;

    StoreStatus saveJob(ImportJob& job, QString* err = nullptr) override;
    bool job(qint64 id, ImportJob* out) const override;
    QVector<ImportJob> jobs() const override;
    StoreStatus deleteImport(qint64 jobId, int* removedFacts, QString* err = nullptr) override;

    StoreStatus addPlanTarget(PlanTarget& p, QString* err = nullptr) override;
    QVector<PlanTarget> planTargets() const override;

    /* ---------- Mantenimiento (acciones explícitas de operador) ---------- */
    void resetAll();
    // Reconstruye los agregados de todas las entidades desde los hechos vivos
    void recomputeAggregates();
    // Elimina tombstones de hechos y limpia la free list. Devuelve huecos removidos.
    int compactFacts();

    struct AvailStats {
        int total{0};     // tamaño del vector interno (incluye tombstones)
        int deleted{0};   // hechos marcados como tombstone
        int freeSlots{0}; // posiciones disponibles en la free list
    };
    AvailStats availStats() const;

    /* ---------- Persistencia ---------- */
    static const int kSnapshotVersion = 2;
    bool loadFromJson(const QString& file, QString* err = nullptr);
    bool saveToJson(const QString& file, QString* err = nullptr) const;

signals:
    void factsChanged();
    void entitiesChanged();

private:
    Q_DISABLE_COPY(MemorySalesStore)

    mutable QMutex m_mutex;

    QMap<EntityKind, QMap<qint64, MasterEntity>> m_entities;
    QMap<EntityKind, QHash<QString, qint64>>     m_byName;

    // Hechos con Avail List: slot con id == 0 es tombstone (reutilizable, LIFO)
    QVector<SalesFact>   m_facts;
    QVector<int>         m_freeList;
    QHash<qint64, int>   m_factSlot;

    QMap<qint64, ImportJob>  m_jobs;
    QMap<qint64, PlanTarget> m_plans;

    // Último ID emitido (no disminuye cuando borras)
    qint64 m_lastEntityId = 0;
    qint64 m_lastFactId = 0;
    qint64 m_lastJobId = 0;
    qint64 m_lastPlanId = 0;

    static inline bool isTombstone(const SalesFact& f) { return f.id == 0; }
    void clearUnlocked();
};

#endif // SALESSTORE_H
