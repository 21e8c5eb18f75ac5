#ifndef CSVREADER_H
#define CSVREADER_H

#include <QString>
#include <QStringList>
#include <QTextStream>

class QIODevice;

/**
 * Lector CSV por registros (comillas RFC-4180, separador ; , o tab detectado
 * en la cabecera, BOM UTF-8 ignorado, líneas vacías saltadas).
 */
class CsvReader {
public:
    explicit CsvReader(QIODevice* dev);

    // Lee la primera línea no vacía como cabecera y fija el separador
    bool readHeader(QString* err = nullptr);
    QStringList header() const { return m_header; }
    QChar delimiter() const { return m_delim; }

    // Siguiente registro de datos; false al final del archivo
    bool next(QStringList* fields);

    static QChar detectDelimiter(const QString& headerLine);
    static QStringList splitRecord(const QString& record, QChar delim);

private:
    bool readRecord(QString* out);

    QTextStream m_in;
    QStringList m_header;
    QChar m_delim = QLatin1Char(',');
};

#endif // CSVREADER_H
