#include "aggregationengine.h"
#include "salesstore.h"
#include "resultcache.h"
#include <QHash>
#include <QMap>
#include <QSet>
#include <algorithm>
#include <limits>

QString granularityToString(TrendGranularity g) {
    switch (g) {
    case TrendGranularity::Day:   return "day";
    case TrendGranularity::Week:  return "week";
    case TrendGranularity::Month: return "month";
    }
    return "day";
}

TrendGranularity granularityFromString(const QString& s, bool* ok) {
    const QString t = s.toLower().trimmed();
    if (ok) *ok = true;
    if (t=="day")   return TrendGranularity::Day;
    if (t=="week")  return TrendGranularity::Week;
    if (t=="month") return TrendGranularity::Month;
    if (ok) *ok = false;
    return TrendGranularity::Day;
}

/* ------------------------------ JSON ------------------------------ */
QJsonObject DashboardMetrics::toJson() const {
    QJsonObject o;
    o["totalRevenue"] = totalRevenue;
    o["totalSales"] = totalSales;
    o["averageCheck"] = averageCheck;
    o["uniqueCustomers"] = uniqueCustomers;
    o["topProduct"] = topProduct;
    o["topCustomer"] = topCustomer;
    return o;
}

DashboardMetrics DashboardMetrics::fromJson(const QJsonObject& o) {
    DashboardMetrics m;
    m.totalRevenue = o.value("totalRevenue").toDouble();
    m.totalSales = o.value("totalSales").toInt();
    m.averageCheck = o.value("averageCheck").toDouble();
    m.uniqueCustomers = o.value("uniqueCustomers").toInt();
    m.topProduct = o.value("topProduct").toString();
    m.topCustomer = o.value("topCustomer").toString();
    return m;
}

QJsonObject RankedEntity::toJson() const {
    QJsonObject o;
    o["id"] = id;
    o["name"] = name;
    o["revenue"] = revenue;
    o["quantity"] = quantity;
    o["orders"] = orders;
    o["averageOrder"] = averageOrder;
    return o;
}

RankedEntity RankedEntity::fromJson(const QJsonObject& o) {
    RankedEntity r;
    r.id = o.value("id").toVariant().toLongLong();
    r.name = o.value("name").toString();
    r.revenue = o.value("revenue").toDouble();
    r.quantity = o.value("quantity").toDouble();
    r.orders = o.value("orders").toInt();
    r.averageOrder = o.value("averageOrder").toDouble();
    return r;
}

QJsonObject TrendPoint::toJson() const {
    QJsonObject o;
    o["period"] = period;
    o["start"] = start.toString(Qt::ISODate);
    o["revenue"] = revenue;
    o["quantity"] = quantity;
    o["orders"] = orders;
    return o;
}

TrendPoint TrendPoint::fromJson(const QJsonObject& o) {
    TrendPoint p;
    p.period = o.value("period").toString();
    p.start = QDate::fromString(o.value("start").toString(), Qt::ISODate);
    p.revenue = o.value("revenue").toDouble();
    p.quantity = o.value("quantity").toDouble();
    p.orders = o.value("orders").toInt();
    return p;
}

template <typename T>
static QJsonArray vecToJson(const QVector<T>& v) {
    QJsonArray a;
    for (const auto& x : v) a.push_back(x.toJson());
    return a;
}

template <typename T>
static QVector<T> vecFromJson(const QJsonValue& v) {
    QVector<T> out;
    for (const auto& x : v.toArray()) out.push_back(T::fromJson(x.toObject()));
    return out;
}

/* ------------------------------ Motor ------------------------------ */
AggregationEngine::AggregationEngine(const SalesStorage* store, ResultCache* cache, QObject* parent)
    : QObject(parent), m_store(store), m_cache(cache) {}

QDate AggregationEngine::periodStart(const QDate& d, TrendGranularity g) {
    switch (g) {
    case TrendGranularity::Day:   return d;
    case TrendGranularity::Week:  return d.addDays(-(d.dayOfWeek() - 1));
    case TrendGranularity::Month: return QDate(d.year(), d.month(), 1);
    }
    return d;
}

QDate AggregationEngine::nextPeriod(const QDate& start, TrendGranularity g) {
    switch (g) {
    case TrendGranularity::Day:   return start.addDays(1);
    case TrendGranularity::Week:  return start.addDays(7);
    case TrendGranularity::Month: return start.addMonths(1);
    }
    return start.addDays(1);
}

QString AggregationEngine::periodKey(const QDate& d, TrendGranularity g) {
    switch (g) {
    case TrendGranularity::Day:
        return d.toString(Qt::ISODate);
    case TrendGranularity::Week: {
        int wy = 0;
        const int w = d.weekNumber(&wy);
        return QStringLiteral("%1-W%2").arg(wy, 4, 10, QLatin1Char('0')).arg(w, 2, 10, QLatin1Char('0'));
    }
    case TrendGranularity::Month:
        return d.toString(QStringLiteral("yyyy-MM"));
    }
    return d.toString(Qt::ISODate);
}

bool AggregationEngine::dashboard(const AnalyticsQuery& q, DashboardMetrics* out, QString* err, bool forceRefresh) {
    if (!q.validate(err)) return false;
    const QJsonObject params = q.toJson();
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch("dashboard", params, forceRefresh, &hit, &gen)) {
        if (out) *out = DashboardMetrics::fromJson(hit.toObject());
        return true;
    }

    const QVector<SalesFact> facts = selectFacts(m_store, q);
    qint64 cents = 0;
    QSet<qint64> customers;
    QHash<qint64, qint64> byCustomer, byProduct;
    for (const auto& f : facts) {
        const qint64 c = toCents(f.amount);
        cents += c;
        customers.insert(f.customerId);
        byCustomer[f.customerId] += c;
        if (!isNullId(f.productId)) byProduct[f.productId] += c;
    }

    // Mayor importe; empate -> menor id
    auto best = [](const QHash<qint64, qint64>& h) {
        qint64 id = 0, top = -1;
        for (auto it = h.constBegin(); it != h.constEnd(); ++it)
            if (it.value() > top || (it.value() == top && it.key() < id)) { top = it.value(); id = it.key(); }
        return id;
    };

    DashboardMetrics m;
    m.totalRevenue = fromCents(cents);
    m.totalSales = facts.size();
    m.averageCheck = m.totalSales == 0 ? 0.0 : round2(m.totalRevenue / m.totalSales);
    m.uniqueCustomers = customers.size();
    MasterEntity e;
    const qint64 topP = best(byProduct);
    if (topP && m_store->entity(EntityKind::Product, topP, &e)) m.topProduct = e.name;
    const qint64 topC = best(byCustomer);
    if (topC && m_store->entity(EntityKind::Customer, topC, &e)) m.topCustomer = e.name;

    if (m_cache) m_cache->put("dashboard", params, m.toJson(), gen);
    if (out) *out = m;
    return true;
}

bool AggregationEngine::ranking(const char* op, EntityKind kind, const AnalyticsQuery& q, int limit,
                                QVector<RankedEntity>* out, QString* err, bool forceRefresh) {
    if (!q.validate(err)) return false;
    if (limit < 0) {
        if (err) *err = QStringLiteral("Límite negativo: %1").arg(limit);
        return false;
    }
    QJsonObject params = q.toJson();
    params["limit"] = limit;
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch(op, params, forceRefresh, &hit, &gen)) {
        if (out) *out = vecFromJson<RankedEntity>(hit);
        return true;
    }

    struct Acc { qint64 cents = 0; double qty = 0.0; int orders = 0; };
    QHash<qint64, Acc> groups;
    for (const auto& f : selectFacts(m_store, q)) {
        const qint64 id = kind == EntityKind::Customer ? f.customerId
                        : kind == EntityKind::Product  ? f.productId : f.storeId;
        if (isNullId(id)) continue;
        Acc& a = groups[id];
        a.cents += toCents(f.amount);
        a.qty += f.quantity;
        a.orders += 1;
    }

    QVector<RankedEntity> rows;
    rows.reserve(groups.size());
    for (auto it = groups.constBegin(); it != groups.constEnd(); ++it) {
        RankedEntity r;
        r.id = it.key();
        MasterEntity e;
        if (m_store->entity(kind, r.id, &e)) r.name = e.name;
        r.revenue = fromCents(it->cents);
        r.quantity = it->qty;
        r.orders = it->orders;
        r.averageOrder = r.orders ? round2(r.revenue / r.orders) : 0.0;
        rows.push_back(r);
    }
    // Orden total: importe desc, id asc (los céntimos comparan exacto)
    std::sort(rows.begin(), rows.end(), [](const RankedEntity& a, const RankedEntity& b) {
        const qint64 ca = toCents(a.revenue), cb = toCents(b.revenue);
        if (ca != cb) return ca > cb;
        return a.id < b.id;
    });
    if (limit >= 0 && rows.size() > limit) rows.resize(limit);

    if (m_cache) m_cache->put(op, params, vecToJson(rows), gen);
    if (out) *out = rows;
    return true;
}

bool AggregationEngine::topCustomers(const AnalyticsQuery& q, int limit, QVector<RankedEntity>* out,
                                     QString* err, bool forceRefresh) {
    return ranking("top_customers", EntityKind::Customer, q, limit, out, err, forceRefresh);
}

bool AggregationEngine::topProducts(const AnalyticsQuery& q, int limit, QVector<RankedEntity>* out,
                                    QString* err, bool forceRefresh) {
    return ranking("top_products", EntityKind::Product, q, limit, out, err, forceRefresh);
}

bool AggregationEngine::salesByStores(const AnalyticsQuery& q, QVector<RankedEntity>* out,
                                      QString* err, bool forceRefresh) {
    // Sin truncar
    return ranking("sales_by_stores", EntityKind::Store, q, std::numeric_limits<int>::max(), out, err, forceRefresh);
}

bool AggregationEngine::trend(const AnalyticsQuery& q, TrendGranularity g, bool dense, QVector<TrendPoint>* out,
                              QString* err, bool forceRefresh) {
    if (!q.validate(err)) return false;
    QJsonObject params = q.toJson();
    params["granularity"] = granularityToString(g);
    params["dense"] = dense;
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch("trend", params, forceRefresh, &hit, &gen)) {
        if (out) *out = vecFromJson<TrendPoint>(hit);
        return true;
    }

    struct Acc { qint64 cents = 0; double qty = 0.0; int orders = 0; };
    QMap<QDate, Acc> buckets;   // ordenado por inicio de periodo
    const QVector<SalesFact> facts = selectFacts(m_store, q);
    QDate minDate, maxDate;
    for (const auto& f : facts) {
        Acc& a = buckets[periodStart(f.date, g)];
        a.cents += toCents(f.amount);
        a.qty += f.quantity;
        a.orders += 1;
        if (!minDate.isValid() || f.date < minDate) minDate = f.date;
        if (!maxDate.isValid() || f.date > maxDate) maxDate = f.date;
    }

    if (dense) {
        const QDate lo = q.from.isValid() ? q.from : minDate;
        const QDate hi = q.to.isValid() ? q.to : maxDate;
        if (lo.isValid() && hi.isValid())
            for (QDate d = periodStart(lo, g); d <= hi; d = nextPeriod(d, g))
                if (!buckets.contains(d)) buckets.insert(d, Acc());
    }

    QVector<TrendPoint> points;
    points.reserve(buckets.size());
    for (auto it = buckets.constBegin(); it != buckets.constEnd(); ++it) {
        TrendPoint p;
        p.start = it.key();
        p.period = periodKey(it.key(), g);
        p.revenue = fromCents(it->cents);
        p.quantity = it->qty;
        p.orders = it->orders;
        points.push_back(p);
    }

    if (m_cache) m_cache->put("trend", params, vecToJson(points), gen);
    if (out) *out = points;
    return true;
}
