#include "salesmodel.h"
#include <QJsonArray>
#include <cmath>
#include <algorithm>

QString kindToString(EntityKind k) {
    switch (k) {
    case EntityKind::Customer: return "customer";
    case EntityKind::Product:  return "product";
    case EntityKind::Store:    return "store";
    }
    return "customer";
}

EntityKind kindFromString(const QString& s, bool* ok) {
    const QString t = s.toLower().trimmed();
    if (ok) *ok = true;
    if (t=="customer") return EntityKind::Customer;
    if (t=="product")  return EntityKind::Product;
    if (t=="store")    return EntityKind::Store;
    if (ok) *ok = false;
    return EntityKind::Customer;
}

QString statusToString(ImportStatus s) {
    switch (s) {
    case ImportStatus::Pending:    return "pending";
    case ImportStatus::Processing: return "processing";
    case ImportStatus::Completed:  return "completed";
    case ImportStatus::Failed:     return "failed";
    }
    return "pending";
}

ImportStatus statusFromString(const QString& s) {
    const QString t = s.toLower().trimmed();
    if (t=="processing") return ImportStatus::Processing;
    if (t=="completed")  return ImportStatus::Completed;
    if (t=="failed")     return ImportStatus::Failed;
    return ImportStatus::Pending;
}

QString targetToString(ImportTarget t) {
    switch (t) {
    case ImportTarget::Sales:     return "sales";
    case ImportTarget::Customers: return "customers";
    case ImportTarget::Products:  return "products";
    }
    return "sales";
}

ImportTarget targetFromString(const QString& s, bool* ok) {
    const QString t = s.toLower().trimmed();
    if (ok) *ok = true;
    if (t=="sales")     return ImportTarget::Sales;
    if (t=="customers") return ImportTarget::Customers;
    if (t=="products")  return ImportTarget::Products;
    if (ok) *ok = false;
    return ImportTarget::Sales;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

static QString dateStr(const QDate& d) { return d.isValid() ? d.toString(Qt::ISODate) : QString(); }
static QDate   strDate(const QJsonValue& v) { return QDate::fromString(v.toString(), Qt::ISODate); }
static QString dtStr(const QDateTime& d) { return d.isValid() ? d.toString(Qt::ISODateWithMs) : QString(); }
static QDateTime strDt(const QJsonValue& v) { return QDateTime::fromString(v.toString(), Qt::ISODateWithMs); }

/* ---------------------------- MasterEntity ---------------------------- */
QJsonObject MasterEntity::toJson() const {
    QJsonObject o;
    o["id"] = id;
    o["kind"] = kindToString(kind);
    o["name"] = name;
    o["normalizedName"] = normalizedName;
    o["totalAmount"] = totalAmount;
    o["totalQuantity"] = totalQuantity;
    o["count"] = count;
    o["lastActivity"] = dateStr(lastActivity);
    o["category"] = category;
    o["region"] = region;
    if (kind == EntityKind::Customer) {
        o["email"] = email;
        o["phone"] = phone;
        o["company"] = company;
    }
    return o;
}

MasterEntity MasterEntity::fromJson(const QJsonObject& o) {
    MasterEntity e;
    e.id = o.value("id").toVariant().toLongLong();
    e.kind = kindFromString(o.value("kind").toString());
    e.name = o.value("name").toString();
    e.normalizedName = o.value("normalizedName").toString();
    e.totalAmount = o.value("totalAmount").toDouble();
    e.totalQuantity = o.value("totalQuantity").toDouble();
    e.count = o.value("count").toVariant().toLongLong();
    e.lastActivity = strDate(o.value("lastActivity"));
    e.category = o.value("category").toString();
    e.region = o.value("region").toString();
    e.email = o.value("email").toString();
    e.phone = o.value("phone").toString();
    e.company = o.value("company").toString();
    return e;
}

/* ------------------------------ SalesFact ------------------------------ */
void SalesFact::deriveCalendar() {
    if (!date.isValid()) { year = month = week = weekYear = dayOfWeek = 0; return; }
    year = date.year();
    month = date.month();
    week = date.weekNumber(&weekYear);
    dayOfWeek = date.dayOfWeek() - 1; // Qt: 1 = lunes
}

QJsonObject SalesFact::toJson() const {
    QJsonObject o;
    o["id"] = id;
    o["date"] = dateStr(date);
    o["customerId"] = customerId;
    o["productId"] = productId;
    o["storeId"] = storeId;
    o["agent"] = agent;
    o["quantity"] = quantity;
    o["unitPrice"] = unitPrice;
    o["amount"] = amount;
    o["year"] = year;
    o["month"] = month;
    o["week"] = week;
    o["weekYear"] = weekYear;
    o["dayOfWeek"] = dayOfWeek;
    o["importId"] = importId;
    return o;
}

SalesFact SalesFact::fromJson(const QJsonObject& o) {
    SalesFact f;
    f.id = o.value("id").toVariant().toLongLong();
    f.date = strDate(o.value("date"));
    f.customerId = o.value("customerId").toVariant().toLongLong();
    f.productId = o.value("productId").toVariant().toLongLong();
    f.storeId = o.value("storeId").toVariant().toLongLong();
    f.agent = o.value("agent").toString();
    f.quantity = o.value("quantity").toDouble(1.0);
    f.unitPrice = o.value("unitPrice").toDouble();
    f.amount = o.value("amount").toDouble();
    f.year = o.value("year").toInt();
    f.month = o.value("month").toInt();
    f.week = o.value("week").toInt();
    f.weekYear = o.value("weekYear").toInt();
    f.dayOfWeek = o.value("dayOfWeek").toInt();
    f.importId = o.value("importId").toVariant().toLongLong();
    return f;
}

/* ------------------------------ ImportJob ------------------------------ */
QJsonObject ImportJob::toJson() const {
    QJsonObject o;
    o["id"] = id;
    o["filename"] = filename;
    o["storagePath"] = storagePath;
    o["fileSize"] = fileSize;
    o["target"] = targetToString(target);
    o["totalRows"] = totalRows;
    o["importedRows"] = importedRows;
    o["failedRows"] = failedRows;
    o["percent"] = percent;
    o["status"] = statusToString(status);
    o["errorLog"] = QJsonArray::fromStringList(errorLog);
    o["message"] = message;

    QJsonArray facts;
    for (qint64 id : relatedFactIds) facts.push_back(id);
    o["relatedFactIds"] = facts;

    QJsonObject created;
    for (auto it = createdEntities.begin(); it != createdEntities.end(); ++it) {
        QList<qint64> ids = it.value().values();
        std::sort(ids.begin(), ids.end());
        QJsonArray a;
        for (qint64 id : ids) a.push_back(id);
        created[kindToString(it.key())] = a;
    }
    o["createdEntities"] = created;

    o["startedAt"] = dtStr(startedAt);
    o["updatedAt"] = dtStr(updatedAt);
    o["completedAt"] = dtStr(completedAt);
    return o;
}

ImportJob ImportJob::fromJson(const QJsonObject& o) {
    ImportJob j;
    j.id = o.value("id").toVariant().toLongLong();
    j.filename = o.value("filename").toString();
    j.storagePath = o.value("storagePath").toString();
    j.fileSize = o.value("fileSize").toVariant().toLongLong();
    j.target = targetFromString(o.value("target").toString("sales"));
    j.totalRows = o.value("totalRows").toInt();
    j.importedRows = o.value("importedRows").toInt();
    j.failedRows = o.value("failedRows").toInt();
    j.percent = o.value("percent").toInt();
    j.status = statusFromString(o.value("status").toString());
    for (const auto& v : o.value("errorLog").toArray()) j.errorLog << v.toString();
    j.message = o.value("message").toString();
    for (const auto& v : o.value("relatedFactIds").toArray())
        j.relatedFactIds.push_back(v.toVariant().toLongLong());

    const QJsonObject created = o.value("createdEntities").toObject();
    for (auto it = created.begin(); it != created.end(); ++it) {
        bool ok = false;
        const EntityKind k = kindFromString(it.key(), &ok);
        if (!ok) continue;
        for (const auto& v : it.value().toArray())
            j.createdEntities[k].insert(v.toVariant().toLongLong());
    }

    j.startedAt = strDt(o.value("startedAt"));
    j.updatedAt = strDt(o.value("updatedAt"));
    j.completedAt = strDt(o.value("completedAt"));
    return j;
}

/* ------------------------------ PlanTarget ------------------------------ */
QJsonObject PlanTarget::toJson() const {
    QJsonObject o;
    o["id"] = id;
    o["periodStart"] = dateStr(periodStart);
    o["periodEnd"] = dateStr(periodEnd);
    if (productId)  o["productId"] = productId;
    if (customerId) o["customerId"] = customerId;
    if (!agent.isEmpty())    o["agent"] = agent;
    if (!region.isEmpty())   o["region"] = region;
    if (!category.isEmpty()) o["category"] = category;
    o["plannedRevenue"] = plannedRevenue;
    o["plannedQuantity"] = plannedQuantity;
    o["plannedOrders"] = plannedOrders;
    return o;
}

PlanTarget PlanTarget::fromJson(const QJsonObject& o) {
    PlanTarget p;
    p.id = o.value("id").toVariant().toLongLong();
    p.periodStart = strDate(o.value("periodStart"));
    p.periodEnd = strDate(o.value("periodEnd"));
    p.productId = o.value("productId").toVariant().toLongLong();
    p.customerId = o.value("customerId").toVariant().toLongLong();
    p.agent = o.value("agent").toString();
    p.region = o.value("region").toString();
    p.category = o.value("category").toString();
    p.plannedRevenue = o.value("plannedRevenue").toDouble();
    p.plannedQuantity = o.value("plannedQuantity").toDouble();
    p.plannedOrders = o.value("plannedOrders").toDouble();
    return p;
}
