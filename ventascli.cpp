#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonArray>
#include <QTextStream>
#include <QDebug>

#include "pipelineconfig.h"
#include "salesstore.h"
#include "resultcache.h"
#include "importtracker.h"
#include "importpipeline.h"
#include "aggregationengine.h"
#include "classificationengine.h"
#include "comparator.h"

static void printJson(const QJsonValue& v) {
    QTextStream out(stdout);
    if (v.isArray()) out << QJsonDocument(v.toArray()).toJson(QJsonDocument::Indented);
    else out << QJsonDocument(v.toObject()).toJson(QJsonDocument::Indented);
}

static int fail(const QString& msg) {
    QTextStream(stderr) << "error: " << msg << "\n";
    return 1;
}

static bool parseDateArg(const QString& s, QDate* out, QString* err) {
    if (s.isEmpty()) { *out = QDate(); return true; }
    const QDate d = QDate::fromString(s, Qt::ISODate);
    if (!d.isValid()) { *err = QStringLiteral("Fecha inválida: %1 (use yyyy-MM-dd)").arg(s); return false; }
    *out = d;
    return true;
}

template <typename T>
static QJsonArray toJsonArray(const QVector<T>& v) {
    QJsonArray a;
    for (const auto& x : v) a.push_back(x.toJson());
    return a;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ventascli");
    QCoreApplication::setApplicationVersion("2.0");

    QCommandLineParser p;
    p.setApplicationDescription("Importación de ventas y analítica (ABC/XYZ, plan-fact, LFL)");
    p.addHelpOption();
    p.addVersionOption();
    p.addPositionalArgument("command",
        "import | jobs | status | delete | reset-stuck | dashboard | top | stores | trend | "
        "abcxyz | plan-add | planfact | lfl | recompute | compact | cache-stats");
    p.addPositionalArgument("args", "Argumentos del comando", "[args...]");

    const QCommandLineOption dataOpt("data", "Archivo JSON de datos", "file");
    const QCommandLineOption configOpt("config", "Archivo JSON de configuración", "file");
    const QCommandLineOption typeOpt("type", "sales | customers | products", "type", "sales");
    const QCommandLineOption fromOpt("from", "Desde (yyyy-MM-dd)", "date");
    const QCommandLineOption toOpt("to", "Hasta (yyyy-MM-dd)", "date");
    const QCommandLineOption customerOpt("customer", "Id de cliente", "id");
    const QCommandLineOption productOpt("product", "Id de producto", "id");
    const QCommandLineOption storeOpt("store", "Id de tienda", "id");
    const QCommandLineOption regionOpt("region", "Región del cliente", "name");
    const QCommandLineOption categoryOpt("category", "Categoría del producto", "name");
    const QCommandLineOption agentOpt("agent", "Agente / manager", "name");
    const QCommandLineOption limitOpt("limit", "Top N", "n", "10");
    const QCommandLineOption byOpt("by", "day | week | month", "granularity", "month");
    const QCommandLineOption denseOpt("dense", "Rellenar periodos vacíos");
    const QCommandLineOption daysOpt("days", "Ventana de clasificación en días", "n");
    const QCommandLineOption asOfOpt("as-of", "Fin de la ventana (yyyy-MM-dd)", "date");
    const QCommandLineOption metricOpt("metric", "revenue | quantity | orders | average_check | all", "metric", "all");
    const QCommandLineOption refreshOpt("refresh", "Ignorar la caché");
    p.addOptions({ dataOpt, configOpt, typeOpt, fromOpt, toOpt, customerOpt, productOpt, storeOpt,
                   regionOpt, categoryOpt, agentOpt, limitOpt, byOpt, denseOpt, daysOpt, asOfOpt,
                   metricOpt, refreshOpt });
    p.process(app);

    const QStringList pos = p.positionalArguments();
    if (pos.isEmpty()) p.showHelp(1);
    const QString cmd = pos.first();
    const QStringList args = pos.mid(1);

    QString err;
    PipelineConfig cfg;
    if (p.isSet(configOpt) && !cfg.load(p.value(configOpt), &err)) return fail(err);
    const QString dataFile = p.isSet(dataOpt) ? p.value(dataOpt) : cfg.snapshotPath;

    MemorySalesStore store;
    if (QFileInfo::exists(dataFile) && !store.loadFromJson(dataFile, &err)) return fail(err);

    ResultCache cache(cfg.cacheTtlSec);
    ImportTracker tracker(&store, &cache);
    tracker.setStuckTimeout(cfg.stuckTimeoutSec);
    tracker.setMaxErrorLog(cfg.maxErrorLog);
    ImportPipeline pipeline(&store, &tracker, cfg);
    AggregationEngine aggregation(&store, &cache);
    ClassificationEngine classification(&store, &cache);
    classification.setAbcThresholds(cfg.abcThresholdA, cfg.abcThresholdB);
    classification.setXyzThresholds(cfg.xyzThresholdX, cfg.xyzThresholdY);
    Comparator comparator(&store, &cache);

    AnalyticsQuery q;
    if (!parseDateArg(p.value(fromOpt), &q.from, &err) || !parseDateArg(p.value(toOpt), &q.to, &err))
        return fail(err);
    q.customerId = p.value(customerOpt).toLongLong();
    q.productId = p.value(productOpt).toLongLong();
    q.storeId = p.value(storeOpt).toLongLong();
    q.region = p.value(regionOpt);
    q.category = p.value(categoryOpt);
    q.agent = p.value(agentOpt);
    const bool refresh = p.isSet(refreshOpt);

    auto save = [&]() -> int {
        if (!store.saveToJson(dataFile, &err)) return fail(err);
        return 0;
    };
    auto needArgs = [&](int n, const QString& usage) {
        if (args.size() >= n) return true;
        err = QStringLiteral("uso: ventascli %1").arg(usage);
        return false;
    };

    /* ---------------------------- Importación ---------------------------- */
    if (cmd == "import") {
        if (!needArgs(1, "import <archivo> [--type sales|customers|products]")) return fail(err);
        bool ok = false;
        const ImportTarget target = targetFromString(p.value(typeOpt), &ok);
        if (!ok) return fail(QStringLiteral("Tipo desconocido: %1").arg(p.value(typeOpt)));
        const qint64 id = pipeline.importFile(args[0], target, &err);
        if (!id) return fail(err);
        ImportJob j;
        tracker.job(id, &j);
        printJson(j.toJson());
        if (const int rc = save()) return rc;
        return j.status == ImportStatus::Completed ? 0 : 2;
    }
    if (cmd == "jobs") {
        QJsonArray a;
        for (const auto& j : tracker.jobs()) {
            QJsonObject o = j.toJson();
            o.remove("relatedFactIds");
            o["stuck"] = tracker.isStuck(j);
            a.push_back(o);
        }
        printJson(a);
        return 0;
    }
    if (cmd == "status") {
        if (!needArgs(1, "status <id>")) return fail(err);
        ImportJob j;
        if (!tracker.job(args[0].toLongLong(), &j)) return fail(QStringLiteral("No existe el import #%1").arg(args[0]));
        QJsonObject o = j.toJson();
        o["stuck"] = tracker.isStuck(j);
        printJson(o);
        return 0;
    }
    if (cmd == "delete") {
        if (!needArgs(1, "delete <id>")) return fail(err);
        int removed = 0;
        if (!tracker.deleteImport(args[0].toLongLong(), &removed, &err)) return fail(err);
        QJsonObject o;
        o["deleted"] = args[0].toLongLong();
        o["removedFacts"] = removed;
        printJson(o);
        return save();
    }
    if (cmd == "reset-stuck") {
        QJsonObject o;
        if (args.isEmpty()) {
            o["reset"] = tracker.resetAllStuck();
        } else {
            if (!tracker.resetStuck(args[0].toLongLong(), &err)) return fail(err);
            o["reset"] = 1;
        }
        printJson(o);
        return save();
    }

    /* ----------------------------- Analítica ----------------------------- */
    if (cmd == "dashboard") {
        DashboardMetrics m;
        if (!aggregation.dashboard(q, &m, &err, refresh)) return fail(err);
        printJson(m.toJson());
        return 0;
    }
    if (cmd == "top") {
        if (!needArgs(1, "top customers|products [--limit n]")) return fail(err);
        bool ok = false;
        const int limit = p.value(limitOpt).toInt(&ok);
        if (!ok) return fail(QStringLiteral("Límite inválido: %1").arg(p.value(limitOpt)));
        QVector<RankedEntity> rows;
        bool good = false;
        if (args[0] == "customers") good = aggregation.topCustomers(q, limit, &rows, &err, refresh);
        else if (args[0] == "products") good = aggregation.topProducts(q, limit, &rows, &err, refresh);
        else err = QStringLiteral("Ranking desconocido: %1").arg(args[0]);
        if (!good) return fail(err);
        printJson(toJsonArray(rows));
        return 0;
    }
    if (cmd == "stores") {
        QVector<RankedEntity> rows;
        if (!aggregation.salesByStores(q, &rows, &err, refresh)) return fail(err);
        printJson(toJsonArray(rows));
        return 0;
    }
    if (cmd == "trend") {
        bool ok = false;
        const TrendGranularity g = granularityFromString(p.value(byOpt), &ok);
        if (!ok) return fail(QStringLiteral("Granularidad desconocida: %1").arg(p.value(byOpt)));
        QVector<TrendPoint> points;
        if (!aggregation.trend(q, g, p.isSet(denseOpt), &points, &err, refresh)) return fail(err);
        printJson(toJsonArray(points));
        return 0;
    }
    if (cmd == "abcxyz") {
        QDate asOf;
        if (!parseDateArg(p.value(asOfOpt), &asOf, &err)) return fail(err);
        const int days = p.isSet(daysOpt) ? p.value(daysOpt).toInt() : cfg.classificationDays;
        AbcXyzResult r;
        if (!classification.abcXyz(asOf, days, &r, &err, refresh)) return fail(err);
        printJson(r.toJson());
        return 0;
    }
    if (cmd == "plan-add") {
        if (!needArgs(3, "plan-add <desde> <hasta> <ingresos> [cantidad] [pedidos]")) return fail(err);
        PlanTarget t;
        if (!parseDateArg(args[0], &t.periodStart, &err) || !parseDateArg(args[1], &t.periodEnd, &err))
            return fail(err);
        t.plannedRevenue = args[2].toDouble();
        t.plannedQuantity = args.value(3).toDouble();
        t.plannedOrders = args.value(4).toDouble();
        t.productId = q.productId;
        t.customerId = q.customerId;
        t.agent = q.agent;
        t.region = q.region;
        t.category = q.category;
        if (store.addPlanTarget(t, &err) != StoreStatus::Ok) return fail(err);
        printJson(t.toJson());
        return save();
    }
    if (cmd == "planfact") {
        PlanFactResult r;
        if (!comparator.planFact(q, &r, &err, refresh)) return fail(err);
        printJson(r.toJson());
        return 0;
    }
    if (cmd == "lfl") {
        if (!needArgs(4, "lfl <desde1> <hasta1> <desde2> <hasta2> [--metric m]")) return fail(err);
        Period p1, p2;
        if (!parseDateArg(args[0], &p1.from, &err) || !parseDateArg(args[1], &p1.to, &err)
            || !parseDateArg(args[2], &p2.from, &err) || !parseDateArg(args[3], &p2.to, &err))
            return fail(err);
        if (p.value(metricOpt) == "all") {
            QVector<LflResult> rows;
            if (!comparator.lflAll(p1, p2, &rows, &err, refresh, q)) return fail(err);
            printJson(toJsonArray(rows));
            return 0;
        }
        bool ok = false;
        const LflMetric m = metricFromString(p.value(metricOpt), &ok);
        if (!ok) return fail(QStringLiteral("Métrica desconocida: %1").arg(p.value(metricOpt)));
        LflResult r;
        if (!comparator.lfl(p1, p2, m, &r, &err, refresh, q)) return fail(err);
        printJson(r.toJson());
        return 0;
    }

    /* --------------------------- Mantenimiento --------------------------- */
    if (cmd == "recompute") {
        store.recomputeAggregates();
        cache.invalidateAll(QStringLiteral("recompute"));
        return save();
    }
    if (cmd == "compact") {
        QJsonObject o;
        o["removed"] = store.compactFacts();
        printJson(o);
        return save();
    }
    if (cmd == "cache-stats") {
        printJson(cache.stats().toJson());
        return 0;
    }

    return fail(QStringLiteral("Comando desconocido: %1").arg(cmd));
}
