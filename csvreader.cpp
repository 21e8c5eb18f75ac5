#include "csvreader.h"
#include <QIODevice>

CsvReader::CsvReader(QIODevice* dev) : m_in(dev) {
    m_in.setEncoding(QStringConverter::Utf8);
}

// Un registro puede ocupar varias líneas si hay un salto dentro de comillas
bool CsvReader::readRecord(QString* out) {
    if (m_in.atEnd()) return false;
    QString rec = m_in.readLine();
    while (rec.count(QLatin1Char('"')) % 2 != 0 && !m_in.atEnd())
        rec += QLatin1Char('\n') + m_in.readLine();
    *out = rec;
    return true;
}

QChar CsvReader::detectDelimiter(const QString& headerLine) {
    // Gana el separador más frecuente fuera de comillas
    int semi = 0, comma = 0, tab = 0;
    bool quoted = false;
    for (QChar c : headerLine) {
        if (c == QLatin1Char('"')) { quoted = !quoted; continue; }
        if (quoted) continue;
        if (c == QLatin1Char(';')) ++semi;
        else if (c == QLatin1Char(',')) ++comma;
        else if (c == QLatin1Char('\t')) ++tab;
    }
    if (tab > semi && tab > comma) return QLatin1Char('\t');
    if (semi >= comma && semi > 0) return QLatin1Char(';');
    return QLatin1Char(',');
}

QStringList CsvReader::splitRecord(const QString& record, QChar delim) {
    QStringList out;
    QString cur;
    bool quoted = false;
    for (int i = 0; i < record.size(); ++i) {
        const QChar c = record.at(i);
        if (quoted) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < record.size() && record.at(i + 1) == QLatin1Char('"')) { cur += c; ++i; }
                else quoted = false;
            } else {
                cur += c;
            }
        } else if (c == QLatin1Char('"')) {
            quoted = true;
        } else if (c == delim) {
            out << cur.trimmed();
            cur.clear();
        } else if (c != QLatin1Char('\r')) {
            cur += c;
        }
    }
    out << cur.trimmed();
    return out;
}

bool CsvReader::readHeader(QString* err) {
    QString line;
    while (readRecord(&line)) {
        if (line.startsWith(QChar(0xFEFF))) line.remove(0, 1);
        if (line.trimmed().isEmpty()) continue;
        m_delim = detectDelimiter(line);
        m_header = splitRecord(line, m_delim);
        return true;
    }
    if (err) *err = QStringLiteral("Archivo vacío: no hay cabecera");
    return false;
}

bool CsvReader::next(QStringList* fields) {
    QString line;
    while (readRecord(&line)) {
        if (line.trimmed().isEmpty()) continue;
        if (fields) *fields = splitRecord(line, m_delim);
        return true;
    }
    return false;
}
