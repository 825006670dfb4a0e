#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QVariantMap>

#include <optional>
#include <vector>

namespace nv {

// Logical field identifiers of a note row. The names returned by
// noteFieldName() are the persisted column names and the identifiers
// accepted by FilterExpression; they must not change.
enum class NoteField {
    NotePath,
    Vector,
    Content,
    SubNoteIndex,
    TimeAdded,
};

QString noteFieldName(NoteField field);
std::optional<NoteField> noteFieldFromName(const QString& name);

// One indexable unit: a whole note file (subNoteIndex is always 0).
// The vector is derived by the embedding function bound to the table and
// is only populated on records read back from the store.
struct NoteRecord {
    QString notePath;
    std::vector<float> vector;
    QString content;
    int subNoteIndex = 0;
    QDateTime timeAdded;
};

// A row as returned by the store, keyed by noteFieldName().
// The vector travels as QList<float>.
using RawRow = QVariantMap;

struct ShapeError {
    NoteField field = NoteField::NotePath;
    QString reason;
};

struct RowParseResult {
    std::optional<NoteRecord> record;
    std::optional<ShapeError> error;

    bool ok() const { return record.has_value(); }
};

// Accept a raw row only if all five fields are present and well typed.
RowParseResult parseNoteRow(const RawRow& row);

RawRow noteRecordToRow(const NoteRecord& record);

// Write-time timestamp. Strictly increasing within the process, so a
// delete+reinsert always carries a later timeAdded than the row it replaces.
QDateTime stampTimeAdded();

} // namespace nv
