#ifndef COMPARATOR_H
#define COMPARATOR_H

#include <QObject>
#include <QVariant>
#include <QVector>
#include <QJsonObject>
#include "analyticsquery.h"

class SalesStorage;
class ResultCache;

enum class LflMetric { Revenue, Quantity, Orders, AverageCheck };

QString metricToString(LflMetric m);
LflMetric metricFromString(const QString& s, bool* ok = nullptr);

struct PlanFactMetric {
    double planned = 0.0;
    double actual = 0.0;
    double variance = 0.0;            // actual - planned
    double variancePercent = 0.0;     // 0 si planned == 0
    double completionPercent = 0.0;   // actual / planned * 100, 0 si planned == 0

    void compute(double plannedValue, double actualValue);
    QJsonObject toJson() const;
    static PlanFactMetric fromJson(const QJsonObject& o);
};

struct PlanFactResult {
    QDate from;
    QDate to;
    int matchedTargets = 0;
    PlanFactMetric revenue;
    PlanFactMetric quantity;
    PlanFactMetric orders;

    QJsonObject toJson() const;
    static PlanFactResult fromJson(const QJsonObject& o);
};

struct Period {
    QDate from;
    QDate to;

    bool isValid() const { return from.isValid() && to.isValid() && from <= to; }
    bool overlaps(const Period& o) const { return !(to < o.from || o.to < from); }
    QString label() const;
};

struct LflResult {
    LflMetric metric = LflMetric::Revenue;
    Period period1;
    Period period2;
    double value1 = 0.0;
    double value2 = 0.0;
    double changeAbsolute = 0.0;
    QVariant changePercent;   // nulo si value1 == 0 (distinto de 0 %)

    QJsonObject toJson() const;
    static LflResult fromJson(const QJsonObject& o);
};

class Comparator : public QObject {
    Q_OBJECT
public:
    explicit Comparator(const SalesStorage* store, ResultCache* cache = nullptr, QObject* parent = nullptr);

    // El rango de q es obligatorio; los filtros de q seleccionan objetivos y hechos
    bool planFact(const AnalyticsQuery& q, PlanFactResult* out, QString* err = nullptr, bool forceRefresh = false);

    // Periodos válidos y disjuntos; filters aporta las dimensiones (su rango se ignora)
    bool lfl(const Period& p1, const Period& p2, LflMetric metric, LflResult* out,
             QString* err = nullptr, bool forceRefresh = false, const AnalyticsQuery& filters = AnalyticsQuery());
    bool lflAll(const Period& p1, const Period& p2, QVector<LflResult>* out,
                QString* err = nullptr, bool forceRefresh = false, const AnalyticsQuery& filters = AnalyticsQuery());

    static double metricValue(const QVector<SalesFact>& facts, LflMetric metric);
    static bool targetMatches(const PlanTarget& t, const AnalyticsQuery& q);

private:
    bool checkPeriods(const Period& p1, const Period& p2, QString* err) const;

    const SalesStorage* m_store;
    ResultCache* m_cache;
};

#endif // COMPARATOR_H
