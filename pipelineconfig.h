#pragma once
#include <QString>
#include <QJsonObject>

/**
 * Parámetros del pipeline de importación y de la analítica.
 * Se leen de un JSON plano; las claves ausentes conservan el valor por defecto.
 */
struct PipelineConfig {
    int    stuckTimeoutSec = 600;           // processing sin progreso -> "atascado"
    int    maxErrorLog = 100;               // tope de mensajes por import
    qint64 maxFileBytes = 50LL * 1024 * 1024;
    int    maxRows = 50000;
    int    resolverRetries = 3;             // reintentos de lookup tras clave duplicada
    int    cacheTtlSec = 300;               // 0 = sin TTL

    double abcThresholdA = 80.0;
    double abcThresholdB = 95.0;
    double xyzThresholdX = 10.0;
    double xyzThresholdY = 25.0;
    int    classificationDays = 365;

    QString snapshotPath = QStringLiteral("ventas.json");

    QJsonObject toJson() const;
    static PipelineConfig fromJson(const QJsonObject& o);

    bool load(const QString& file, QString* err=nullptr);
    bool save(const QString& file, QString* err=nullptr) const;
};
