#include <QtTest>
#include <QBuffer>
#include "csvreader.h"

class TestCsvReader : public QObject {
    Q_OBJECT
private slots:
    void detectsDelimiter_data();
    void detectsDelimiter();
    void quotedFields();
    void multilineQuotedRecord();
    void skipsBomAndBlankLines();
    void emptyInputHasNoHeader();
};

void TestCsvReader::detectsDelimiter_data() {
    QTest::addColumn<QString>("header");
    QTest::addColumn<QString>("delim");
    QTest::newRow("semicolon") << "date;customer;amount" << ";";
    QTest::newRow("comma")     << "date,customer,amount" << ",";
    QTest::newRow("tab")       << "date\tcustomer\tamount" << "\t";
    QTest::newRow("quoted")    << "\"a;b\",c,d" << ",";
}

void TestCsvReader::detectsDelimiter() {
    QFETCH(QString, header);
    QFETCH(QString, delim);
    QCOMPARE(CsvReader::detectDelimiter(header), delim.at(0));
}

void TestCsvReader::quotedFields() {
    const QStringList f = CsvReader::splitRecord("15.03.2024;\"ООО \"\"Ромашка\"\"; филиал\"; 100 ", QLatin1Char(';'));
    QCOMPARE(f.size(), 3);
    QCOMPARE(f[0], QString("15.03.2024"));
    QCOMPARE(f[1], QString::fromUtf8("ООО \"Ромашка\"; филиал"));
    QCOMPARE(f[2], QString("100"));
}

void TestCsvReader::multilineQuotedRecord() {
    QByteArray data = "name,note\nAcme,\"line one\nline two\"\nBeta,x\n";
    QBuffer buf(&data);
    QVERIFY(buf.open(QIODevice::ReadOnly));
    CsvReader r(&buf);
    QVERIFY(r.readHeader());
    QStringList fields;
    QVERIFY(r.next(&fields));
    QCOMPARE(fields.value(1), QString("line one\nline two"));
    QVERIFY(r.next(&fields));
    QCOMPARE(fields.value(0), QString("Beta"));
    QVERIFY(!r.next(&fields));
}

void TestCsvReader::skipsBomAndBlankLines() {
    QByteArray data = "\xEF\xBB\xBF" "date;customer\n\n15.03.2024;Ivanov\n   \n16.03.2024;Petrov\n";
    QBuffer buf(&data);
    QVERIFY(buf.open(QIODevice::ReadOnly));
    CsvReader r(&buf);
    QVERIFY(r.readHeader());
    QCOMPARE(r.header(), QStringList({ "date", "customer" }));
    QCOMPARE(r.delimiter(), QLatin1Char(';'));
    int n = 0;
    QStringList fields;
    while (r.next(&fields)) ++n;
    QCOMPARE(n, 2);
    QCOMPARE(fields.value(1), QString("Petrov"));
}

void TestCsvReader::emptyInputHasNoHeader() {
    QByteArray data = "\n\n";
    QBuffer buf(&data);
    QVERIFY(buf.open(QIODevice::ReadOnly));
    CsvReader r(&buf);
    QString err;
    QVERIFY(!r.readHeader(&err));
    QVERIFY(!err.isEmpty());
}

QTEST_GUILESS_MAIN(TestCsvReader)
#include "tst_csvreader.moc"
