#include "comparator.h"
#include "salesstore.h"
#include "resultcache.h"
#include <QJsonArray>

QString metricToString(LflMetric m) {
    switch (m) {
    case LflMetric::Revenue:      return "revenue";
    case LflMetric::Quantity:     return "quantity";
    case LflMetric::Orders:       return "orders";
    case LflMetric::AverageCheck: return "average_check";
    }
    return "revenue";
}

LflMetric metricFromString(const QString& s, bool* ok) {
    const QString t = s.toLower().trimmed();
    if (ok) *ok = true;
    if (t=="revenue")  return LflMetric::Revenue;
    if (t=="quantity") return LflMetric::Quantity;
    if (t=="orders")   return LflMetric::Orders;
    if (t=="average_check" || t=="avg_check") return LflMetric::AverageCheck;
    if (ok) *ok = false;
    return LflMetric::Revenue;
}

/* ------------------------------ Plan-fact ------------------------------ */
void PlanFactMetric::compute(double plannedValue, double actualValue) {
    planned = round2(plannedValue);
    actual = round2(actualValue);
    variance = round2(actual - planned);
    variancePercent = round2(safePercent(variance, planned));
    completionPercent = round2(safePercent(actual, planned));
}

QJsonObject PlanFactMetric::toJson() const {
    QJsonObject o;
    o["planned"] = planned;
    o["actual"] = actual;
    o["variance"] = variance;
    o["variancePercent"] = variancePercent;
    o["completionPercent"] = completionPercent;
    return o;
}

PlanFactMetric PlanFactMetric::fromJson(const QJsonObject& o) {
    PlanFactMetric m;
    m.planned = o.value("planned").toDouble();
    m.actual = o.value("actual").toDouble();
    m.variance = o.value("variance").toDouble();
    m.variancePercent = o.value("variancePercent").toDouble();
    m.completionPercent = o.value("completionPercent").toDouble();
    return m;
}

QJsonObject PlanFactResult::toJson() const {
    QJsonObject o;
    o["from"] = from.toString(Qt::ISODate);
    o["to"] = to.toString(Qt::ISODate);
    o["matchedTargets"] = matchedTargets;
    o["revenue"] = revenue.toJson();
    o["quantity"] = quantity.toJson();
    o["orders"] = orders.toJson();
    return o;
}

PlanFactResult PlanFactResult::fromJson(const QJsonObject& o) {
    PlanFactResult r;
    r.from = QDate::fromString(o.value("from").toString(), Qt::ISODate);
    r.to = QDate::fromString(o.value("to").toString(), Qt::ISODate);
    r.matchedTargets = o.value("matchedTargets").toInt();
    r.revenue = PlanFactMetric::fromJson(o.value("revenue").toObject());
    r.quantity = PlanFactMetric::fromJson(o.value("quantity").toObject());
    r.orders = PlanFactMetric::fromJson(o.value("orders").toObject());
    return r;
}

/* -------------------------------- LFL -------------------------------- */
QString Period::label() const {
    return from.toString(QStringLiteral("dd.MM.yyyy")) + " - " + to.toString(QStringLiteral("dd.MM.yyyy"));
}

QJsonObject LflResult::toJson() const {
    QJsonObject o;
    o["metric"] = metricToString(metric);
    o["period1"] = period1.label();
    o["period2"] = period2.label();
    o["period1From"] = period1.from.toString(Qt::ISODate);
    o["period1To"] = period1.to.toString(Qt::ISODate);
    o["period2From"] = period2.from.toString(Qt::ISODate);
    o["period2To"] = period2.to.toString(Qt::ISODate);
    o["value1"] = value1;
    o["value2"] = value2;
    o["changeAbsolute"] = changeAbsolute;
    o["changePercent"] = changePercent.isNull() ? QJsonValue() : QJsonValue(changePercent.toDouble());
    return o;
}

LflResult LflResult::fromJson(const QJsonObject& o) {
    LflResult r;
    r.metric = metricFromString(o.value("metric").toString());
    r.period1.from = QDate::fromString(o.value("period1From").toString(), Qt::ISODate);
    r.period1.to = QDate::fromString(o.value("period1To").toString(), Qt::ISODate);
    r.period2.from = QDate::fromString(o.value("period2From").toString(), Qt::ISODate);
    r.period2.to = QDate::fromString(o.value("period2To").toString(), Qt::ISODate);
    r.value1 = o.value("value1").toDouble();
    r.value2 = o.value("value2").toDouble();
    r.changeAbsolute = o.value("changeAbsolute").toDouble();
    if (o.value("changePercent").isDouble()) r.changePercent = o.value("changePercent").toDouble();
    return r;
}

/* ------------------------------ Motor ------------------------------ */
Comparator::Comparator(const SalesStorage* store, ResultCache* cache, QObject* parent)
    : QObject(parent), m_store(store), m_cache(cache) {}

static bool sameDim(const QString& a, const QString& b) {
    return QString::compare(a.trimmed(), b.trimmed(), Qt::CaseInsensitive) == 0;
}

bool Comparator::targetMatches(const PlanTarget& t, const AnalyticsQuery& q) {
    if (!t.periodStart.isValid() || t.periodStart < q.from || t.periodStart > q.to) return false;
    // Cada dimensión del objetivo debe coincidir exactamente con la del filtro
    return t.productId == q.productId && t.customerId == q.customerId
        && sameDim(t.agent, q.agent) && sameDim(t.region, q.region) && sameDim(t.category, q.category);
}

double Comparator::metricValue(const QVector<SalesFact>& facts, LflMetric metric) {
    qint64 cents = 0;
    double qty = 0.0;
    for (const auto& f : facts) { cents += toCents(f.amount); qty += f.quantity; }
    switch (metric) {
    case LflMetric::Revenue:      return fromCents(cents);
    case LflMetric::Quantity:     return qty;
    case LflMetric::Orders:       return facts.size();
    case LflMetric::AverageCheck: return facts.isEmpty() ? 0.0 : round2(fromCents(cents) / facts.size());
    }
    return 0.0;
}

bool Comparator::planFact(const AnalyticsQuery& q, PlanFactResult* out, QString* err, bool forceRefresh) {
    if (!q.from.isValid() || !q.to.isValid()) {
        if (err) *err = tr("Plan-fact requiere un periodo (desde y hasta)");
        return false;
    }
    if (!q.validate(err)) return false;
    const QJsonObject params = q.toJson();
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch("plan_fact", params, forceRefresh, &hit, &gen)) {
        if (out) *out = PlanFactResult::fromJson(hit.toObject());
        return true;
    }

    double pRev = 0.0, pQty = 0.0, pOrd = 0.0;
    PlanFactResult r;
    r.from = q.from;
    r.to = q.to;
    for (const auto& t : m_store->planTargets()) {
        if (!targetMatches(t, q)) continue;
        pRev += t.plannedRevenue;
        pQty += t.plannedQuantity;
        pOrd += t.plannedOrders;
        ++r.matchedTargets;
    }
    const QVector<SalesFact> facts = selectFacts(m_store, q);
    r.revenue.compute(pRev, metricValue(facts, LflMetric::Revenue));
    r.quantity.compute(pQty, metricValue(facts, LflMetric::Quantity));
    r.orders.compute(pOrd, metricValue(facts, LflMetric::Orders));

    if (m_cache) m_cache->put("plan_fact", params, r.toJson(), gen);
    if (out) *out = r;
    return true;
}

bool Comparator::checkPeriods(const Period& p1, const Period& p2, QString* err) const {
    if (!p1.isValid() || !p2.isValid()) {
        if (err) *err = tr("Periodo LFL inválido");
        return false;
    }
    if (p1.overlaps(p2)) {
        if (err) *err = tr("Los periodos LFL se solapan: %1 / %2").arg(p1.label(), p2.label());
        return false;
    }
    return true;
}

bool Comparator::lfl(const Period& p1, const Period& p2, LflMetric metric, LflResult* out,
                     QString* err, bool forceRefresh, const AnalyticsQuery& filters) {
    if (!checkPeriods(p1, p2, err)) return false;

    AnalyticsQuery dims = filters;
    dims.from = QDate();
    dims.to = QDate();
    if (!dims.validate(err)) return false;
    QJsonObject params = dims.toJson();
    params["metric"] = metricToString(metric);
    params["p1"] = p1.from.toString(Qt::ISODate) + "/" + p1.to.toString(Qt::ISODate);
    params["p2"] = p2.from.toString(Qt::ISODate) + "/" + p2.to.toString(Qt::ISODate);
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch("lfl", params, forceRefresh, &hit, &gen)) {
        if (out) *out = LflResult::fromJson(hit.toObject());
        return true;
    }

    AnalyticsQuery q1 = dims, q2 = dims;
    q1.from = p1.from; q1.to = p1.to;
    q2.from = p2.from; q2.to = p2.to;

    LflResult r;
    r.metric = metric;
    r.period1 = p1;
    r.period2 = p2;
    r.value1 = metricValue(selectFacts(m_store, q1), metric);
    r.value2 = metricValue(selectFacts(m_store, q2), metric);
    r.changeAbsolute = round2(r.value2 - r.value1);
    if (r.value1 != 0.0)
        r.changePercent = round2((r.value2 - r.value1) / r.value1 * 100.0);

    if (m_cache) m_cache->put("lfl", params, r.toJson(), gen);
    if (out) *out = r;
    return true;
}

bool Comparator::lflAll(const Period& p1, const Period& p2, QVector<LflResult>* out,
                        QString* err, bool forceRefresh, const AnalyticsQuery& filters) {
    QVector<LflResult> all;
    for (LflMetric m : { LflMetric::Revenue, LflMetric::Quantity, LflMetric::Orders, LflMetric::AverageCheck }) {
        LflResult r;
        if (!lfl(p1, p2, m, &r, err, forceRefresh, filters)) return false;
        all.push_back(r);
    }
    if (out) *out = all;
    return true;
}
