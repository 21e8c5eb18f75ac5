#ifndef SALESMODEL_H
#define SALESMODEL_H

#include <QString>
#include <QStringList>
#include <QDate>
#include <QDateTime>
#include <QVector>
#include <QMap>
#include <QSet>
#include <QJsonObject>

/* ======================== Enumeraciones ======================== */
enum class EntityKind { Customer, Product, Store };

enum class ImportStatus { Pending, Processing, Completed, Failed };

// Tipo de archivo que se importa (columna "target" del upload)
enum class ImportTarget { Sales, Customers, Products };

QString kindToString(EntityKind k);
EntityKind kindFromString(const QString& s, bool* ok = nullptr);

QString statusToString(ImportStatus s);
ImportStatus statusFromString(const QString& s);

QString targetToString(ImportTarget t);
ImportTarget targetFromString(const QString& s, bool* ok = nullptr);

// 0 = sin entidad
inline bool isNullId(qint64 id) { return id <= 0; }

/* ======================== Datos maestros ======================== */
struct MasterEntity {
    qint64  id = 0;
    EntityKind kind = EntityKind::Customer;
    QString name;            // como vino en el archivo
    QString normalizedName;  // clave única por tipo

    // Agregados corrientes (sólo crecen; ver SalesStorage::recomputeAggregates)
    double  totalAmount = 0.0;
    double  totalQuantity = 0.0;
    qint64  count = 0;
    QDate   lastActivity;

    QString category;
    QString region;

    // Contacto (sólo clientes)
    QString email;
    QString phone;
    QString company;

    QJsonObject toJson() const;
    static MasterEntity fromJson(const QJsonObject& o);
};

/* ======================== Hechos de venta ======================== */
struct SalesFact {
    qint64 id = 0;
    QDate  date;
    qint64 customerId = 0;
    qint64 productId = 0;   // 0 = producto desconocido
    qint64 storeId = 0;     // 0 = sin tienda
    QString agent;

    double quantity = 1.0;
    double unitPrice = 0.0;
    double amount = 0.0;    // inmutable una vez escrito

    // Campos de calendario (derivados de date)
    int year = 0;
    int month = 0;
    int week = 0;       // semana ISO
    int weekYear = 0;   // año ISO de la semana
    int dayOfWeek = 0;  // 0 = lunes ... 6 = domingo

    qint64 importId = 0; // 0 = sin import propietario (datos migrados)

    // Recalcula year/month/week/dayOfWeek a partir de date. Idempotente.
    void deriveCalendar();

    QJsonObject toJson() const;
    static SalesFact fromJson(const QJsonObject& o);
};

/* ======================== Import jobs ======================== */
struct ImportJob {
    qint64  id = 0;
    QString filename;
    QString storagePath;  // ruta opaca del archivo subido
    qint64  fileSize = 0;
    ImportTarget target = ImportTarget::Sales;

    int totalRows = 0;
    int importedRows = 0;
    int failedRows = 0;
    int percent = 0;

    ImportStatus status = ImportStatus::Pending;
    QStringList errorLog;  // mensajes por fila (con tope)
    QString message;       // causa del fallo fatal, si lo hubo

    QVector<qint64> relatedFactIds;
    QMap<EntityKind, QSet<qint64>> createdEntities;

    QDateTime startedAt;
    QDateTime updatedAt;
    QDateTime completedAt;

    bool isActive() const { return status == ImportStatus::Pending || status == ImportStatus::Processing; }

    QJsonObject toJson() const;
    static ImportJob fromJson(const QJsonObject& o);
};

/* ======================== Plan ======================== */
struct PlanTarget {
    qint64 id = 0;
    QDate periodStart;
    QDate periodEnd;

    // Filtros opcionales (0 / vacío = sin filtro)
    qint64  productId = 0;
    qint64  customerId = 0;
    QString agent;
    QString region;
    QString category;

    double plannedRevenue = 0.0;
    double plannedQuantity = 0.0;
    double plannedOrders = 0.0;

    QJsonObject toJson() const;
    static PlanTarget fromJson(const QJsonObject& o);
};

// Redondeo a 2 decimales (montos)
double round2(double v);

#endif // SALESMODEL_H
