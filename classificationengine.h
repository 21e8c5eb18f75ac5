#ifndef CLASSIFICATIONENGINE_H
#define CLASSIFICATIONENGINE_H

#include <QObject>
#include <QVector>
#include <QMap>
#include <QDate>
#include <QJsonObject>
#include <QStringList>

class SalesStorage;
class ResultCache;

enum class AbcClass { A, B, C };
enum class XyzClass { X, Y, Z };

QString abcToString(AbcClass c);
QString xyzToString(XyzClass c);

struct ProductClass {
    qint64  productId = 0;
    QString name;
    double  revenue = 0.0;
    double  sharePercent = 0.0;
    double  cumulativePercent = 0.0;
    AbcClass abc = AbcClass::C;

    bool     hasXyz = false;       // false: sin demanda en la ventana
    double   cvPercent = 0.0;
    XyzClass xyz = XyzClass::Z;
    QVector<double> demand;        // unidades por tramo mensual de la ventana

    QString cell() const { return hasXyz ? abcToString(abc) + xyzToString(xyz) : QString(); }

    QJsonObject toJson() const;
    static ProductClass fromJson(const QJsonObject& o);
};

struct AbcXyzResult {
    QDate from;
    QDate to;
    double totalRevenue = 0.0;
    QVector<ProductClass> products;          // orden ABC (importe desc, id asc)

    QMap<QString, QVector<qint64>> matrix;   // AX..CZ, siempre las nueve celdas
    QMap<QString, int> abcCounts;
    QMap<QString, int> xyzCounts;
    QMap<QString, int> cellCounts;
    QMap<QString, double> abcRevenue;
    int unclassifiedXyz = 0;

    QJsonObject toJson() const;
    static AbcXyzResult fromJson(const QJsonObject& o);
};

class ClassificationEngine : public QObject {
    Q_OBJECT
public:
    explicit ClassificationEngine(const SalesStorage* store, ResultCache* cache = nullptr, QObject* parent = nullptr);

    void setAbcThresholds(double a, double b) { m_thrA = a; m_thrB = b; }
    void setXyzThresholds(double x, double y) { m_thrX = x; m_thrY = y; }

    // Ventana [asOf - days + 1, asOf]
    bool abcXyz(const QDate& asOf, int days, AbcXyzResult* out, QString* err = nullptr, bool forceRefresh = false);

    /* ---------- Algoritmos ---------- */
    // centsDesc ya ordenado de mayor a menor. Umbrales evaluados tras incluir cada producto.
    static QVector<AbcClass> classifyAbc(const QVector<qint64>& centsDesc, double thrA = 80.0, double thrB = 95.0);
    // CV poblacional en %. defined = false si la media es 0 o la serie está vacía.
    static double coefficientOfVariation(const QVector<double>& series, bool* defined);
    // Inicios de los tramos mensuales contados desde from. Un tramo final incompleto
    // se descarta salvo que la ventana sea más corta que un mes.
    static QVector<QDate> demandSlices(const QDate& from, const QDate& to);
    static XyzClass classifyXyz(double cvPercent, double thrX = 10.0, double thrY = 25.0);

    static const QStringList& cellNames();

private:
    const SalesStorage* m_store;
    ResultCache* m_cache;
    double m_thrA = 80.0, m_thrB = 95.0;
    double m_thrX = 10.0, m_thrY = 25.0;
};

#endif // CLASSIFICATIONENGINE_H
