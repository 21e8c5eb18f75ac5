#include "factwriter.h"

SalesFact FactWriter::buildFact(const CandidateRow& row, const ResolvedRefs& refs, qint64 importId) {
    SalesFact f;
    f.date = row.date;
    f.customerId = refs.customerId;
    f.productId = refs.productId;
    f.storeId = refs.storeId;
    f.agent = row.agent;
    f.quantity = row.quantity;
    f.unitPrice = row.unitPrice;
    f.amount = row.amount;
    f.importId = importId;
    f.deriveCalendar();
    return f;
}

qint64 FactWriter::write(const CandidateRow& row, const ResolvedRefs& refs, qint64 importId, QString* err) {
    SalesFact f = buildFact(row, refs, importId);
    QString why;
    if (m_store->insertFact(f, &why) != StoreStatus::Ok) {
        if (err) *err = QStringLiteral("Fila %1: no se pudo guardar la venta (%2)").arg(row.rowNumber).arg(why);
        return 0;
    }
    return f.id;
}
