#include "analyticsquery.h"
#include "salesstore.h"
#include <QHash>

bool AnalyticsQuery::validate(QString* err) const {
    if (from.isValid() && to.isValid() && from > to) {
        if (err) *err = QStringLiteral("Rango inválido: %1 es posterior a %2")
                            .arg(from.toString(Qt::ISODate), to.toString(Qt::ISODate));
        return false;
    }
    if (customerId < 0 || productId < 0 || storeId < 0) {
        if (err) *err = QStringLiteral("Identificador de filtro negativo");
        return false;
    }
    return true;
}

QJsonObject AnalyticsQuery::toJson() const {
    QJsonObject o;
    if (from.isValid()) o["from"] = from.toString(Qt::ISODate);
    if (to.isValid())   o["to"] = to.toString(Qt::ISODate);
    if (customerId) o["customerId"] = customerId;
    if (productId)  o["productId"] = productId;
    if (storeId)    o["storeId"] = storeId;
    if (!region.isEmpty())   o["region"] = region.trimmed().toLower();
    if (!category.isEmpty()) o["category"] = category.trimmed().toLower();
    if (!agent.isEmpty())    o["agent"] = agent.trimmed().toLower();
    return o;
}

static bool sameText(const QString& a, const QString& b) {
    return QString::compare(a.trimmed(), b.trimmed(), Qt::CaseInsensitive) == 0;
}

QVector<SalesFact> selectFacts(const SalesStorage* store, const AnalyticsQuery& q) {
    const QVector<SalesFact> all = store->facts(q.from, q.to);
    if (!q.hasDimensionFilter()) return all;

    // Atributos de dimensión sólo si hacen falta
    QHash<qint64, QString> regionOf, categoryOf;
    if (!q.region.isEmpty())
        for (const auto& c : store->entities(EntityKind::Customer)) regionOf.insert(c.id, c.region);
    if (!q.category.isEmpty())
        for (const auto& p : store->entities(EntityKind::Product)) categoryOf.insert(p.id, p.category);

    QVector<SalesFact> out;
    for (const auto& f : all) {
        if (q.customerId && f.customerId != q.customerId) continue;
        if (q.productId && f.productId != q.productId) continue;
        if (q.storeId && f.storeId != q.storeId) continue;
        if (!q.agent.isEmpty() && !sameText(f.agent, q.agent)) continue;
        if (!q.region.isEmpty() && !sameText(regionOf.value(f.customerId), q.region)) continue;
        if (!q.category.isEmpty() && !sameText(categoryOf.value(f.productId), q.category)) continue;
        out.push_back(f);
    }
    return out;
}
