#pragma once

#include "core/shared/note_record.h"
#include "core/vector/filter_expression.h"

#include <QString>

#include <optional>
#include <vector>

namespace nv {

struct QueryRequest {
    // Nearest-neighbour query when either is set (text is embedded with the
    // table's embedding function); otherwise a metadata scan in row order.
    std::optional<QString> queryText;
    std::optional<std::vector<float>> queryVector;
    int limit = 10;
    std::optional<FilterExpression> filter;
};

// VectorTable -- one embedding-backed table of note rows.
//
// add() is atomic per call: either every record is stored with its vector
// or none is. Errors are reported through the return value and, when given,
// errorOut.
class VectorTable {
public:
    virtual ~VectorTable() = default;

    virtual QString name() const = 0;

    virtual bool add(const std::vector<NoteRecord>& records, QString* errorOut = nullptr) = 0;
    virtual bool remove(const FilterExpression& filter, QString* errorOut = nullptr) = 0;
    virtual std::optional<std::vector<RawRow>> query(const QueryRequest& request,
                                                     QString* errorOut = nullptr) = 0;
    virtual std::optional<int> countRows(QString* errorOut = nullptr) = 0;
};

} // namespace nv
