#ifndef ANALYTICSQUERY_H
#define ANALYTICSQUERY_H

#include <QDate>
#include <QString>
#include <QVector>
#include <QJsonObject>
#include "salesmodel.h"

class SalesStorage;

// Rango de fechas + filtros de dimensión comunes a toda la analítica
struct AnalyticsQuery {
    QDate from;   // inválida = sin límite inferior
    QDate to;     // inválida = sin límite superior
    qint64 customerId = 0;
    qint64 productId = 0;
    qint64 storeId = 0;
    QString region;    // región del cliente
    QString category;  // categoría del producto
    QString agent;

    // Rechaza parámetros mal formados antes de calcular nada
    bool validate(QString* err = nullptr) const;
    QJsonObject toJson() const;

    bool hasDimensionFilter() const {
        return customerId || productId || storeId || !region.isEmpty() || !category.isEmpty() || !agent.isEmpty();
    }
};

// Hechos del rango que cumplen los filtros (orden por id)
QVector<SalesFact> selectFacts(const SalesStorage* store, const AnalyticsQuery& q);

// Sumas exactas en céntimos
inline qint64 toCents(double v) { return qRound64(v * 100.0); }
inline double fromCents(qint64 c) { return double(c) / 100.0; }

// Porcentaje con guarda: 0 cuando el denominador es 0
inline double safePercent(double num, double den) { return den == 0.0 ? 0.0 : num / den * 100.0; }

#endif // ANALYTICSQUERY_H
