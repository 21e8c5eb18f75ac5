#include "pipelineconfig.h"
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonParseError>

QJsonObject PipelineConfig::toJson() const {
    QJsonObject o;
    o["stuckTimeoutSec"] = stuckTimeoutSec;
    o["maxErrorLog"] = maxErrorLog;
    o["maxFileBytes"] = maxFileBytes;
    o["maxRows"] = maxRows;
    o["resolverRetries"] = resolverRetries;
    o["cacheTtlSec"] = cacheTtlSec;
    o["abcThresholdA"] = abcThresholdA;
    o["abcThresholdB"] = abcThresholdB;
    o["xyzThresholdX"] = xyzThresholdX;
    o["xyzThresholdY"] = xyzThresholdY;
    o["classificationDays"] = classificationDays;
    o["snapshotPath"] = snapshotPath;
    return o;
}

PipelineConfig PipelineConfig::fromJson(const QJsonObject& o) {
    PipelineConfig c;
    c.stuckTimeoutSec = o.value("stuckTimeoutSec").toInt(c.stuckTimeoutSec);
    c.maxErrorLog = o.value("maxErrorLog").toInt(c.maxErrorLog);
    if (o.contains("maxFileBytes")) c.maxFileBytes = o.value("maxFileBytes").toVariant().toLongLong();
    c.maxRows = o.value("maxRows").toInt(c.maxRows);
    c.resolverRetries = o.value("resolverRetries").toInt(c.resolverRetries);
    c.cacheTtlSec = o.value("cacheTtlSec").toInt(c.cacheTtlSec);
    c.abcThresholdA = o.value("abcThresholdA").toDouble(c.abcThresholdA);
    c.abcThresholdB = o.value("abcThresholdB").toDouble(c.abcThresholdB);
    c.xyzThresholdX = o.value("xyzThresholdX").toDouble(c.xyzThresholdX);
    c.xyzThresholdY = o.value("xyzThresholdY").toDouble(c.xyzThresholdY);
    c.classificationDays = o.value("classificationDays").toInt(c.classificationDays);
    c.snapshotPath = o.value("snapshotPath").toString(c.snapshotPath);
    return c;
}

bool PipelineConfig::load(const QString& file, QString* err) {
    QFile f(file);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QStringLiteral("No se pudo abrir %1").arg(file);
        return false;
    }
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QStringLiteral("Configuración inválida: %1").arg(pe.errorString());
        return false;
    }
    const PipelineConfig c = fromJson(doc.object());
    if (c.abcThresholdA <= 0 || c.abcThresholdA > c.abcThresholdB || c.abcThresholdB > 100
        || c.xyzThresholdX <= 0 || c.xyzThresholdX > c.xyzThresholdY
        || c.resolverRetries < 1 || c.maxErrorLog < 0 || c.classificationDays < 1) {
        if (err) *err = QStringLiteral("Umbrales o límites fuera de rango en %1").arg(file);
        return false;
    }
    *this = c;
    return true;
}

bool PipelineConfig::save(const QString& file, QString* err) const {
    QSaveFile f(file);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = QStringLiteral("No se pudo escribir %1").arg(file);
        return false;
    }
    const QByteArray data = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
    if (f.write(data) != data.size() || !f.commit()) {
        if (err) *err = f.errorString();
        return false;
    }
    return true;
}
