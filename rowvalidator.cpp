#include "rowvalidator.h"
#include <QRegularExpression>
#include <QDateTime>
#include <cmath>

namespace {
struct HeaderAlias { RowField field; const char* names; };

// Alias separados por '|', comparados en minúsculas y sin espacios extremos
const HeaderAlias kAliases[] = {
    { RowField::Date,     "date|sale_date|fecha|дата|дата продажи" },
    { RowField::Customer, "customer|client|cliente|клиент|контрагент|покупатель" },
    { RowField::Product,  "product|item|producto|товар|номенклатура" },
    { RowField::Store,    "store|shop|tienda|магазин|точка" },
    { RowField::Quantity, "quantity|qty|cantidad|количество|кол-во" },
    { RowField::Amount,   "amount|sum|total|importe|monto|сумма" },
    { RowField::Price,    "price|unit_price|precio|цена" },
    { RowField::Agent,    "agent|manager|agente|менеджер|агент" },
    { RowField::Region,   "region|región|регион" },
    { RowField::Category, "category|categoria|categoría|категория" },
    { RowField::Email,    "email|e-mail|correo|почта" },
    { RowField::Phone,    "phone|telefono|teléfono|телефон" },
    { RowField::Company,  "company|empresa|компания|организация" },
    { RowField::Name,     "name|nombre|наименование|название|имя" },
};

const char* kDateFormats[] = { "d.M.yyyy", "yyyy-M-d", "d/M/yyyy", "yyyy/M/d", "d.M.yy" };

// Excel: día 0 = 1899-12-30 (incluye el bug del 29/02/1900)
const QDate kExcelEpoch(1899, 12, 30);
}

RowValidator::RowValidator(ImportTarget target) : m_target(target) {}

int RowValidator::fieldForHeader(const QString& header) {
    const QString h = header.trimmed().toLower();
    if (h.isEmpty()) return -1;
    for (const auto& a : kAliases) {
        const QStringList names = QString::fromUtf8(a.names).split(QLatin1Char('|'));
        if (names.contains(h)) return static_cast<int>(a.field);
    }
    return -1;
}

bool RowValidator::bindHeader(const QStringList& header, QString* err) {
    m_columns.clear();
    for (int i = 0; i < header.size(); ++i) {
        const int f = fieldForHeader(header[i]);
        if (f < 0) continue;
        const RowField rf = static_cast<RowField>(f);
        if (!m_columns.contains(rf)) m_columns.insert(rf, i); // gana la primera
    }

    QStringList missing;
    if (m_target == ImportTarget::Sales) {
        if (!hasField(RowField::Date))     missing << "date";
        if (!hasField(RowField::Customer)) missing << "customer";
        if (!hasField(RowField::Amount))   missing << "amount";
    } else {
        // En archivos maestros el nombre puede venir como "cliente"/"producto"
        const RowField alt = (m_target == ImportTarget::Customers) ? RowField::Customer : RowField::Product;
        if (!hasField(RowField::Name) && hasField(alt)) m_columns.insert(RowField::Name, m_columns.value(alt));
        if (!hasField(RowField::Name)) missing << "name";
    }
    if (!missing.isEmpty()) {
        if (err) *err = QStringLiteral("Faltan columnas obligatorias: %1").arg(missing.join(", "));
        return false;
    }
    return true;
}

QString RowValidator::value(const QStringList& fields, RowField f) const {
    const int idx = m_columns.value(f, -1);
    if (idx < 0 || idx >= fields.size()) return QString();
    return fields[idx].trimmed();
}

/* ---------------------------- Normalización ---------------------------- */
QString RowValidator::normalizeName(const QString& raw) {
    static const QRegularExpression prefix(QString::fromUtf8("^(ооо|оао|зао|ип|чуп|уп)\\s+"));
    static const QRegularExpression suffix(QString::fromUtf8("\\s+(ооо|оао)$"));
    static const QRegularExpression quotes(QString::fromUtf8("[\"'«»]"));
    static const QRegularExpression spaces(QStringLiteral("\\s+"));

    QString s = raw.trimmed().toLower();
    if (s.isEmpty()) return s;
    s.remove(quotes);
    s = s.trimmed();
    s.remove(prefix);
    s.remove(suffix);
    s.replace(spaces, QStringLiteral(" "));
    return s.trimmed();
}

QDate RowValidator::parseDate(const QString& raw, bool* ok) {
    if (ok) *ok = false;
    QString s = raw.trimmed();
    if (s.isEmpty()) return QDate();

    // Número de serie de Excel
    bool isNum = false;
    const double serial = s.toDouble(&isNum);
    if (isNum) {
        if (serial < 1 || serial > 2958465) return QDate();
        if (ok) *ok = true;
        return kExcelEpoch.addDays(static_cast<qint64>(std::floor(serial)));
    }

    // Fecha-hora ISO completa
    if (s.contains(QLatin1Char('T'))) {
        const QDateTime dt = QDateTime::fromString(s, Qt::ISODate);
        if (dt.isValid()) { if (ok) *ok = true; return dt.date(); }
    }
    // "dd.MM.yyyy HH:mm" -> se descarta la hora
    const int sp = s.indexOf(QLatin1Char(' '));
    if (sp > 0) s = s.left(sp);

    static const QRegularExpression shortYear(QStringLiteral("^\\d{1,2}\\.\\d{1,2}\\.\\d{2}$"));
    const bool twoDigitYear = shortYear.match(s).hasMatch();
    for (const char* fmt : kDateFormats) {
        if (twoDigitYear != QLatin1String(fmt).endsWith(QLatin1String(".yy"))) continue;
        QDate d = QDate::fromString(s, QString::fromLatin1(fmt));
        if (!d.isValid()) continue;
        // yy: 00-68 -> 20xx, 69-99 -> 19xx
        if (QLatin1String(fmt).endsWith(QLatin1String(".yy")) && d.year() < 1969) d = d.addYears(100);
        if (ok) *ok = true;
        return d;
    }
    return QDate();
}

double RowValidator::parseNumber(const QString& raw, bool* ok) {
    static const QRegularExpression junk(QString::fromUtf8("[\\s\\x{00A0}₽€$]|руб\\.?|р\\.$"));
    QString s = raw.trimmed().toLower();
    s.remove(junk);
    if (s.isEmpty()) { if (ok) *ok = false; return 0.0; }

    const int lastComma = s.lastIndexOf(QLatin1Char(','));
    const int lastDot = s.lastIndexOf(QLatin1Char('.'));
    if (lastComma >= 0 && lastDot >= 0) {
        // El separador que aparece último es el decimal
        if (lastComma > lastDot) { s.remove(QLatin1Char('.')); s.replace(QLatin1Char(','), QLatin1Char('.')); }
        else s.remove(QLatin1Char(','));
    } else {
        s.replace(QLatin1Char(','), QLatin1Char('.'));
    }
    bool good = false;
    const double v = s.toDouble(&good);
    if (ok) *ok = good && std::isfinite(v);
    return good ? v : 0.0;
}

/* ------------------------------ Validación ------------------------------ */
bool RowValidator::validate(const QStringList& fields, int rowNumber, CandidateRow* out, QString* err) const {
    CandidateRow row;
    row.rowNumber = rowNumber;
    QString why;
    const bool good = (m_target == ImportTarget::Sales) ? validateSales(fields, &row, &why)
                                                        : validateMaster(fields, &row, &why);
    if (!good) {
        if (err) *err = QStringLiteral("Fila %1: %2").arg(rowNumber).arg(why);
        return false;
    }
    if (out) *out = row;
    return true;
}

bool RowValidator::validateSales(const QStringList& fields, CandidateRow* out, QString* err) const {
    const QString rawDate = value(fields, RowField::Date);
    if (rawDate.isEmpty()) { *err = QStringLiteral("falta la fecha"); return false; }
    bool ok = false;
    out->date = parseDate(rawDate, &ok);
    if (!ok) { *err = QStringLiteral("fecha no reconocida \"%1\"").arg(rawDate); return false; }

    out->customerName = value(fields, RowField::Customer);
    out->customerKey = normalizeName(out->customerName);
    if (out->customerKey.isEmpty()) { *err = QStringLiteral("falta el cliente"); return false; }

    const QString rawAmount = value(fields, RowField::Amount);
    if (rawAmount.isEmpty()) { *err = QStringLiteral("falta el importe"); return false; }
    const double amount = parseNumber(rawAmount, &ok);
    if (!ok) { *err = QStringLiteral("importe no numérico \"%1\"").arg(rawAmount); return false; }
    if (amount <= 0) { *err = QStringLiteral("importe debe ser positivo (%1)").arg(rawAmount); return false; }
    out->amount = round2(amount);

    const QString rawQty = value(fields, RowField::Quantity);
    if (!rawQty.isEmpty()) {
        const double qty = parseNumber(rawQty, &ok);
        if (!ok) { *err = QStringLiteral("cantidad no numérica \"%1\"").arg(rawQty); return false; }
        if (qty <= 0) { *err = QStringLiteral("cantidad debe ser positiva (%1)").arg(rawQty); return false; }
        out->quantity = qty;
    }

    const QString rawPrice = value(fields, RowField::Price);
    double price = 0.0;
    if (!rawPrice.isEmpty()) {
        price = parseNumber(rawPrice, &ok);
        if (!ok || price < 0) { *err = QStringLiteral("precio inválido \"%1\"").arg(rawPrice); return false; }
    }
    out->unitPrice = round2(price > 0 ? price : out->amount / out->quantity);

    out->productName = value(fields, RowField::Product);
    out->productKey = normalizeName(out->productName);
    out->storeName = value(fields, RowField::Store);
    out->storeKey = normalizeName(out->storeName);
    out->agent = value(fields, RowField::Agent);
    out->region = value(fields, RowField::Region);
    out->category = value(fields, RowField::Category);
    return true;
}

bool RowValidator::validateMaster(const QStringList& fields, CandidateRow* out, QString* err) const {
    out->name = value(fields, RowField::Name);
    out->nameKey = normalizeName(out->name);
    if (out->nameKey.isEmpty()) { *err = QStringLiteral("falta el nombre"); return false; }

    out->email = value(fields, RowField::Email);
    if (!out->email.isEmpty() && !out->email.contains(QLatin1Char('@'))) {
        *err = QStringLiteral("email inválido \"%1\"").arg(out->email);
        return false;
    }
    out->phone = value(fields, RowField::Phone);
    out->company = value(fields, RowField::Company);
    out->region = value(fields, RowField::Region);
    out->category = value(fields, RowField::Category);

    const QString rawPrice = value(fields, RowField::Price);
    if (!rawPrice.isEmpty()) {
        bool ok = false;
        const double price = parseNumber(rawPrice, &ok);
        if (!ok || price < 0) { *err = QStringLiteral("precio inválido \"%1\"").arg(rawPrice); return false; }
        out->unitPrice = round2(price);
    }
    return true;
}
