#include "core/shared/note_record.h"

#include <QMetaType>

#include <algorithm>
#include <atomic>

namespace nv {

namespace {

ShapeError shapeError(NoteField field, const char* reason)
{
    ShapeError error;
    error.field = field;
    error.reason = QString::fromLatin1(reason);
    return error;
}

} // namespace

QString noteFieldName(NoteField field)
{
    switch (field) {
    case NoteField::NotePath:     return QStringLiteral("notepath");
    case NoteField::Vector:       return QStringLiteral("vector");
    case NoteField::Content:      return QStringLiteral("content");
    case NoteField::SubNoteIndex: return QStringLiteral("subnoteindex");
    case NoteField::TimeAdded:    return QStringLiteral("timeadded");
    }
    return QStringLiteral("notepath");
}

std::optional<NoteField> noteFieldFromName(const QString& name)
{
    if (name == QLatin1String("notepath"))     return NoteField::NotePath;
    if (name == QLatin1String("vector"))       return NoteField::Vector;
    if (name == QLatin1String("content"))      return NoteField::Content;
    if (name == QLatin1String("subnoteindex")) return NoteField::SubNoteIndex;
    if (name == QLatin1String("timeadded"))    return NoteField::TimeAdded;
    return std::nullopt;
}

RowParseResult parseNoteRow(const RawRow& row)
{
    RowParseResult result;

    const QString pathKey = noteFieldName(NoteField::NotePath);
    const QString vectorKey = noteFieldName(NoteField::Vector);
    const QString contentKey = noteFieldName(NoteField::Content);
    const QString subIndexKey = noteFieldName(NoteField::SubNoteIndex);
    const QString timeKey = noteFieldName(NoteField::TimeAdded);

    const QVariant path = row.value(pathKey);
    if (!row.contains(pathKey) || path.metaType().id() != QMetaType::QString) {
        result.error = shapeError(NoteField::NotePath, "missing or not a string");
        return result;
    }
    if (path.toString().isEmpty()) {
        result.error = shapeError(NoteField::NotePath, "empty path");
        return result;
    }

    const QVariant vector = row.value(vectorKey);
    if (!row.contains(vectorKey) || vector.metaType() != QMetaType::fromType<QList<float>>()) {
        result.error = shapeError(NoteField::Vector, "missing or not a float list");
        return result;
    }
    const QList<float> values = vector.value<QList<float>>();
    if (values.isEmpty()) {
        result.error = shapeError(NoteField::Vector, "empty vector");
        return result;
    }

    const QVariant content = row.value(contentKey);
    if (!row.contains(contentKey) || content.metaType().id() != QMetaType::QString) {
        result.error = shapeError(NoteField::Content, "missing or not a string");
        return result;
    }

    bool subIndexOk = false;
    const int subNoteIndex = row.value(subIndexKey).toInt(&subIndexOk);
    if (!row.contains(subIndexKey) || !subIndexOk || subNoteIndex < 0) {
        result.error = shapeError(NoteField::SubNoteIndex, "missing or negative");
        return result;
    }

    const QVariant time = row.value(timeKey);
    if (!row.contains(timeKey) || time.metaType().id() != QMetaType::QDateTime
        || !time.toDateTime().isValid()) {
        result.error = shapeError(NoteField::TimeAdded, "missing or invalid timestamp");
        return result;
    }

    NoteRecord record;
    record.notePath = path.toString();
    record.vector.assign(values.cbegin(), values.cend());
    record.content = content.toString();
    record.subNoteIndex = subNoteIndex;
    record.timeAdded = time.toDateTime();
    result.record = std::move(record);
    return result;
}

RawRow noteRecordToRow(const NoteRecord& record)
{
    RawRow row;
    row.insert(noteFieldName(NoteField::NotePath), record.notePath);
    row.insert(noteFieldName(NoteField::Vector),
               QVariant::fromValue(QList<float>(record.vector.cbegin(), record.vector.cend())));
    row.insert(noteFieldName(NoteField::Content), record.content);
    row.insert(noteFieldName(NoteField::SubNoteIndex), record.subNoteIndex);
    row.insert(noteFieldName(NoteField::TimeAdded), record.timeAdded);
    return row;
}

QDateTime stampTimeAdded()
{
    static std::atomic<qint64> lastStamp{0};

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    qint64 previous = lastStamp.load();
    qint64 next = std::max(now, previous + 1);
    while (!lastStamp.compare_exchange_weak(previous, next)) {
        next = std::max(now, previous + 1);
    }
    return QDateTime::fromMSecsSinceEpoch(next, Qt::UTC);
}

} // namespace nv
