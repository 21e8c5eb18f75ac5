#ifndef FACTWRITER_H
#define FACTWRITER_H

#include "salesstore.h"
#include "rowvalidator.h"

// Ids ya resueltos de una fila
struct ResolvedRefs {
    qint64 customerId = 0;
    qint64 productId = 0;
    qint64 storeId = 0;
};

class FactWriter {
public:
    explicit FactWriter(SalesStorage* store) : m_store(store) {}

    // Persiste el hecho etiquetado con importId. Devuelve el id o 0 si falló.
    qint64 write(const CandidateRow& row, const ResolvedRefs& refs, qint64 importId, QString* err = nullptr);

    static SalesFact buildFact(const CandidateRow& row, const ResolvedRefs& refs, qint64 importId);

private:
    SalesStorage* m_store;
};

#endif // FACTWRITER_H
