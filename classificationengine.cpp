#include "classificationengine.h"
#include "analyticsquery.h"
#include "salesstore.h"
#include "resultcache.h"
#include <QHash>
#include <QJsonArray>
#include <algorithm>
#include <cmath>

QString abcToString(AbcClass c) {
    switch (c) {
    case AbcClass::A: return "A";
    case AbcClass::B: return "B";
    case AbcClass::C: return "C";
    }
    return "C";
}

QString xyzToString(XyzClass c) {
    switch (c) {
    case XyzClass::X: return "X";
    case XyzClass::Y: return "Y";
    case XyzClass::Z: return "Z";
    }
    return "Z";
}

static AbcClass abcFromString(const QString& s) {
    if (s == "A") return AbcClass::A;
    if (s == "B") return AbcClass::B;
    return AbcClass::C;
}

static XyzClass xyzFromString(const QString& s) {
    if (s == "X") return XyzClass::X;
    if (s == "Y") return XyzClass::Y;
    return XyzClass::Z;
}

/* ------------------------------ JSON ------------------------------ */
QJsonObject ProductClass::toJson() const {
    QJsonObject o;
    o["productId"] = productId;
    o["name"] = name;
    o["revenue"] = revenue;
    o["sharePercent"] = sharePercent;
    o["cumulativePercent"] = cumulativePercent;
    o["abc"] = abcToString(abc);
    if (hasXyz) {
        o["xyz"] = xyzToString(xyz);
        o["cv"] = cvPercent;
        o["cell"] = cell();
    } else {
        o["xyz"] = QJsonValue();
        o["cv"] = QJsonValue();
    }
    QJsonArray d;
    for (double v : demand) d.push_back(v);
    o["demand"] = d;
    return o;
}

ProductClass ProductClass::fromJson(const QJsonObject& o) {
    ProductClass p;
    p.productId = o.value("productId").toVariant().toLongLong();
    p.name = o.value("name").toString();
    p.revenue = o.value("revenue").toDouble();
    p.sharePercent = o.value("sharePercent").toDouble();
    p.cumulativePercent = o.value("cumulativePercent").toDouble();
    p.abc = abcFromString(o.value("abc").toString());
    p.hasXyz = o.value("xyz").isString();
    if (p.hasXyz) {
        p.xyz = xyzFromString(o.value("xyz").toString());
        p.cvPercent = o.value("cv").toDouble();
    }
    for (const auto& v : o.value("demand").toArray()) p.demand.push_back(v.toDouble());
    return p;
}

static QJsonObject intMapToJson(const QMap<QString, int>& m) {
    QJsonObject o;
    for (auto it = m.begin(); it != m.end(); ++it) o[it.key()] = it.value();
    return o;
}

static QMap<QString, int> intMapFromJson(const QJsonObject& o) {
    QMap<QString, int> m;
    for (auto it = o.begin(); it != o.end(); ++it) m.insert(it.key(), it.value().toInt());
    return m;
}

QJsonObject AbcXyzResult::toJson() const {
    QJsonObject o;
    o["from"] = from.toString(Qt::ISODate);
    o["to"] = to.toString(Qt::ISODate);
    o["totalRevenue"] = totalRevenue;

    QJsonArray prods;
    for (const auto& p : products) prods.push_back(p.toJson());
    o["products"] = prods;

    QJsonObject mx;
    for (auto it = matrix.begin(); it != matrix.end(); ++it) {
        QJsonArray ids;
        for (qint64 id : it.value()) ids.push_back(id);
        mx[it.key()] = ids;
    }
    o["matrix"] = mx;
    o["abcCounts"] = intMapToJson(abcCounts);
    o["xyzCounts"] = intMapToJson(xyzCounts);
    o["cellCounts"] = intMapToJson(cellCounts);

    QJsonObject rev;
    for (auto it = abcRevenue.begin(); it != abcRevenue.end(); ++it) rev[it.key()] = it.value();
    o["abcRevenue"] = rev;
    o["unclassifiedXyz"] = unclassifiedXyz;
    return o;
}

AbcXyzResult AbcXyzResult::fromJson(const QJsonObject& o) {
    AbcXyzResult r;
    r.from = QDate::fromString(o.value("from").toString(), Qt::ISODate);
    r.to = QDate::fromString(o.value("to").toString(), Qt::ISODate);
    r.totalRevenue = o.value("totalRevenue").toDouble();
    for (const auto& v : o.value("products").toArray()) r.products.push_back(ProductClass::fromJson(v.toObject()));
    const QJsonObject mx = o.value("matrix").toObject();
    for (auto it = mx.begin(); it != mx.end(); ++it) {
        QVector<qint64> ids;
        for (const auto& v : it.value().toArray()) ids.push_back(v.toVariant().toLongLong());
        r.matrix.insert(it.key(), ids);
    }
    r.abcCounts = intMapFromJson(o.value("abcCounts").toObject());
    r.xyzCounts = intMapFromJson(o.value("xyzCounts").toObject());
    r.cellCounts = intMapFromJson(o.value("cellCounts").toObject());
    const QJsonObject rev = o.value("abcRevenue").toObject();
    for (auto it = rev.begin(); it != rev.end(); ++it) r.abcRevenue.insert(it.key(), it.value().toDouble());
    r.unclassifiedXyz = o.value("unclassifiedXyz").toInt();
    return r;
}

/* ---------------------------- Algoritmos ---------------------------- */
const QStringList& ClassificationEngine::cellNames() {
    static const QStringList names = { "AX", "AY", "AZ", "BX", "BY", "BZ", "CX", "CY", "CZ" };
    return names;
}

QVector<AbcClass> ClassificationEngine::classifyAbc(const QVector<qint64>& centsDesc, double thrA, double thrB) {
    QVector<AbcClass> out(centsDesc.size(), AbcClass::C);
    qint64 total = 0;
    for (qint64 c : centsDesc) total += c;
    if (total <= 0) return out;   // sin ingresos: todo C

    // cum/total <= thr/100  <=>  cum*100 <= total*thr (sin división)
    qint64 cum = 0;
    for (int i = 0; i < centsDesc.size(); ++i) {
        cum += centsDesc[i];
        const double lhs = double(cum) * 100.0;
        if (lhs <= double(total) * thrA)      out[i] = AbcClass::A;
        else if (lhs <= double(total) * thrB) out[i] = AbcClass::B;
        else                                  out[i] = AbcClass::C;
    }
    return out;
}

double ClassificationEngine::coefficientOfVariation(const QVector<double>& series, bool* defined) {
    if (defined) *defined = false;
    if (series.isEmpty()) return 0.0;
    double sum = 0.0;
    for (double v : series) sum += v;
    const double mean = sum / series.size();
    if (mean == 0.0) return 0.0;

    double sq = 0.0;
    for (double v : series) sq += (v - mean) * (v - mean);
    const double stddev = std::sqrt(sq / series.size());   // poblacional
    if (defined) *defined = true;
    return stddev / mean * 100.0;
}

QVector<QDate> ClassificationEngine::demandSlices(const QDate& from, const QDate& to) {
    QVector<QDate> starts;
    if (!from.isValid() || !to.isValid() || from > to) return starts;
    // Siempre desde from para que tramos de fin de mes no se desplacen
    for (int i = 0;; ++i) {
        const QDate start = from.addMonths(i);
        if (start > to) break;
        const QDate end = from.addMonths(i + 1).addDays(-1);
        if (end > to && i > 0) break;   // cola incompleta fuera de la serie
        starts.push_back(start);
    }
    return starts;
}

XyzClass ClassificationEngine::classifyXyz(double cvPercent, double thrX, double thrY) {
    if (cvPercent < thrX) return XyzClass::X;
    if (cvPercent < thrY) return XyzClass::Y;
    return XyzClass::Z;
}

/* ------------------------------ Motor ------------------------------ */
ClassificationEngine::ClassificationEngine(const SalesStorage* store, ResultCache* cache, QObject* parent)
    : QObject(parent), m_store(store), m_cache(cache) {}

bool ClassificationEngine::abcXyz(const QDate& asOf, int days, AbcXyzResult* out, QString* err, bool forceRefresh) {
    if (days < 1) {
        if (err) *err = tr("La ventana debe ser de al menos 1 día (%1)").arg(days);
        return false;
    }
    const QDate to = asOf.isValid() ? asOf : QDate::currentDate();
    const QDate from = to.addDays(-(days - 1));

    QJsonObject params;
    params["asOf"] = to.toString(Qt::ISODate);
    params["days"] = days;
    params["thresholds"] = QStringLiteral("%1/%2/%3/%4").arg(m_thrA).arg(m_thrB).arg(m_thrX).arg(m_thrY);
    QJsonValue hit;
    quint64 gen = 0;
    if (m_cache && m_cache->fetch("abc_xyz", params, forceRefresh, &hit, &gen)) {
        if (out) *out = AbcXyzResult::fromJson(hit.toObject());
        return true;
    }

    const QVector<QDate> slices = demandSlices(from, to);
    auto sliceIndex = [&](const QDate& d) {
        // Último tramo cuyo inicio es <= d; -1 si cae en la cola descartada
        const auto it = std::upper_bound(slices.constBegin(), slices.constEnd(), d);
        const int idx = int(it - slices.constBegin()) - 1;
        if (idx < 0) return -1;
        const QDate end = from.addMonths(idx + 1).addDays(-1);
        return (d <= end || slices.size() == 1) ? idx : -1;
    };

    struct Acc { qint64 cents = 0; QVector<double> demand; };
    QHash<qint64, Acc> byProduct;
    for (const auto& f : m_store->facts(from, to)) {
        if (isNullId(f.productId)) continue;
        Acc& a = byProduct[f.productId];
        if (a.demand.isEmpty()) a.demand.fill(0.0, slices.size());
        a.cents += toCents(f.amount);
        const int idx = sliceIndex(f.date);
        if (idx >= 0 && idx < a.demand.size()) a.demand[idx] += f.quantity;
    }

    AbcXyzResult r;
    r.from = from;
    r.to = to;
    for (const QString& c : cellNames()) { r.matrix.insert(c, {}); r.cellCounts.insert(c, 0); }
    for (const char* c : { "A", "B", "C" }) { r.abcCounts.insert(c, 0); r.abcRevenue.insert(c, 0.0); }
    for (const char* c : { "X", "Y", "Z" }) r.xyzCounts.insert(c, 0);

    struct Row { qint64 id; qint64 cents; };
    QVector<Row> rows;
    rows.reserve(byProduct.size());
    for (auto it = byProduct.constBegin(); it != byProduct.constEnd(); ++it) rows.push_back({ it.key(), it->cents });
    std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        if (a.cents != b.cents) return a.cents > b.cents;
        return a.id < b.id;
    });

    QVector<qint64> cents;
    qint64 total = 0;
    for (const auto& row : rows) { cents.push_back(row.cents); total += row.cents; }
    const QVector<AbcClass> abc = classifyAbc(cents, m_thrA, m_thrB);
    r.totalRevenue = fromCents(total);

    QMap<QString, qint64> classCents;
    qint64 cum = 0;
    for (int i = 0; i < rows.size(); ++i) {
        ProductClass p;
        p.productId = rows[i].id;
        MasterEntity e;
        if (m_store->entity(EntityKind::Product, p.productId, &e)) p.name = e.name;
        p.revenue = fromCents(rows[i].cents);
        cum += rows[i].cents;
        p.sharePercent = total ? double(rows[i].cents) * 100.0 / double(total) : 0.0;
        p.cumulativePercent = total ? double(cum) * 100.0 / double(total) : 0.0;
        p.abc = abc[i];
        p.demand = byProduct.value(p.productId).demand;

        bool defined = false;
        const double cv = coefficientOfVariation(p.demand, &defined);
        const QString a = abcToString(p.abc);
        r.abcCounts[a] += 1;
        classCents[a] += rows[i].cents;
        if (defined) {
            p.hasXyz = true;
            p.cvPercent = cv;
            p.xyz = classifyXyz(cv, m_thrX, m_thrY);
            r.xyzCounts[xyzToString(p.xyz)] += 1;
            r.matrix[p.cell()].push_back(p.productId);
            r.cellCounts[p.cell()] += 1;
        } else {
            ++r.unclassifiedXyz;
        }
        r.products.push_back(p);
    }
    for (auto it = classCents.constBegin(); it != classCents.constEnd(); ++it)
        r.abcRevenue[it.key()] = fromCents(it.value());

    if (m_cache) m_cache->put("abc_xyz", params, r.toJson(), gen);
    if (out) *out = r;
    return true;
}
