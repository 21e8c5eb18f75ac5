#ifndef AGGREGATIONENGINE_H
#define AGGREGATIONENGINE_H

#include <QObject>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include "analyticsquery.h"

class SalesStorage;
class ResultCache;

enum class TrendGranularity { Day, Week, Month };

QString granularityToString(TrendGranularity g);
TrendGranularity granularityFromString(const QString& s, bool* ok = nullptr);

struct DashboardMetrics {
    double totalRevenue = 0.0;
    int    totalSales = 0;
    double averageCheck = 0.0;   // 0 si no hay ventas
    int    uniqueCustomers = 0;
    QString topProduct;
    QString topCustomer;

    QJsonObject toJson() const;
    static DashboardMetrics fromJson(const QJsonObject& o);
};

struct RankedEntity {
    qint64  id = 0;
    QString name;
    double  revenue = 0.0;
    double  quantity = 0.0;
    int     orders = 0;
    double  averageOrder = 0.0;

    QJsonObject toJson() const;
    static RankedEntity fromJson(const QJsonObject& o);
};

struct TrendPoint {
    QString period;   // yyyy-MM-dd | yyyy-Www | yyyy-MM
    QDate   start;    // primer día del periodo
    double  revenue = 0.0;
    double  quantity = 0.0;
    int     orders = 0;

    QJsonObject toJson() const;
    static TrendPoint fromJson(const QJsonObject& o);
};

class AggregationEngine : public QObject {
    Q_OBJECT
public:
    explicit AggregationEngine(const SalesStorage* store, ResultCache* cache = nullptr, QObject* parent = nullptr);

    bool dashboard(const AnalyticsQuery& q, DashboardMetrics* out, QString* err = nullptr, bool forceRefresh = false);
    bool topCustomers(const AnalyticsQuery& q, int limit, QVector<RankedEntity>* out,
                      QString* err = nullptr, bool forceRefresh = false);
    bool topProducts(const AnalyticsQuery& q, int limit, QVector<RankedEntity>* out,
                     QString* err = nullptr, bool forceRefresh = false);
    bool salesByStores(const AnalyticsQuery& q, QVector<RankedEntity>* out,
                       QString* err = nullptr, bool forceRefresh = false);
    // Sparse salvo dense = true (rellena periodos vacíos dentro del rango)
    bool trend(const AnalyticsQuery& q, TrendGranularity g, bool dense, QVector<TrendPoint>* out,
               QString* err = nullptr, bool forceRefresh = false);

    // Clave y primer día del periodo que contiene d
    static QString periodKey(const QDate& d, TrendGranularity g);
    static QDate periodStart(const QDate& d, TrendGranularity g);
    static QDate nextPeriod(const QDate& start, TrendGranularity g);

private:
    bool ranking(const char* op, EntityKind kind, const AnalyticsQuery& q, int limit,
                 QVector<RankedEntity>* out, QString* err, bool forceRefresh);

    const SalesStorage* m_store;
    ResultCache* m_cache;
};

#endif // AGGREGATIONENGINE_H
