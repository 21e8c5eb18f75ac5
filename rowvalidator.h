#ifndef ROWVALIDATOR_H
#define ROWVALIDATOR_H

#include <QString>
#include <QStringList>
#include <QDate>
#include <QMap>
#include "salesmodel.h"

// Campos canónicos reconocidos en la cabecera del archivo
enum class RowField {
    Date, Customer, Product, Store, Quantity, Amount, Price,
    Agent, Region, Category, Email, Phone, Company, Name
};

// Fila ya tipada y normalizada, lista para el resolver
struct CandidateRow {
    int rowNumber = 0;
    QDate date;

    QString customerName;
    QString customerKey;   // normalizado
    QString productName;
    QString productKey;
    QString storeName;
    QString storeKey;

    QString agent;
    QString region;
    QString category;

    double quantity = 1.0;
    double unitPrice = 0.0;
    double amount = 0.0;

    // Archivos de clientes / productos
    QString name;
    QString nameKey;
    QString email;
    QString phone;
    QString company;
};

class RowValidator {
public:
    explicit RowValidator(ImportTarget target = ImportTarget::Sales);

    ImportTarget target() const { return m_target; }

    // Asocia columnas a campos canónicos. Falla si falta una columna obligatoria.
    bool bindHeader(const QStringList& header, QString* err = nullptr);
    bool hasField(RowField f) const { return m_columns.contains(f); }

    // Convierte una fila cruda. En caso de rechazo devuelve false y el motivo en err.
    bool validate(const QStringList& fields, int rowNumber, CandidateRow* out, QString* err = nullptr) const;

    /* ---------- Normalización (estáticas, reutilizables) ---------- */
    static QString normalizeName(const QString& raw);
    static QDate   parseDate(const QString& raw, bool* ok = nullptr);
    static double  parseNumber(const QString& raw, bool* ok = nullptr);
    // -1 si el encabezado no corresponde a ningún campo conocido
    static int     fieldForHeader(const QString& header);

private:
    QString value(const QStringList& fields, RowField f) const;
    bool validateSales(const QStringList& fields, CandidateRow* out, QString* err) const;
    bool validateMaster(const QStringList& fields, CandidateRow* out, QString* err) const;

    ImportTarget m_target;
    QMap<RowField, int> m_columns;   // campo -> índice de columna
};

#endif // ROWVALIDATOR_H
