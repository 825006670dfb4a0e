#pragma once

#include "core/shared/note_record.h"

#include <QString>
#include <QVariant>
#include <QVariantList>

#include <vector>

namespace nv {

// FilterExpression -- typed boolean predicate over note fields.
//
// Values are never spliced into query text: toSql() renders positional
// placeholders with a parallel binding list, and toString() renders an
// escaped form for logs. The vector field cannot be filtered on.
class FilterExpression {
public:
    enum class Op {
        Equals,
        NotEquals,
        AllOf,
        AnyOf,
    };

    struct SqlFragment {
        QString sql;
        QVariantList bindings;
    };

    static FilterExpression equals(NoteField field, const QVariant& value);
    static FilterExpression notEquals(NoteField field, const QVariant& value);
    static FilterExpression allOf(std::vector<FilterExpression> terms);
    static FilterExpression anyOf(std::vector<FilterExpression> terms);

    // notepath = <path>
    static FilterExpression pathEquals(const QString& path);
    // content != '' / content = ''
    static FilterExpression contentNotEmpty();
    static FilterExpression contentEmpty();

    bool isValid() const;
    Op op() const { return m_op; }

    SqlFragment toSql() const;
    QString toString() const;

    // Evaluates the predicate against a raw row (same semantics as toSql()).
    bool matches(const RawRow& row) const;

private:
    FilterExpression() = default;

    void appendSql(SqlFragment* fragment) const;

    Op m_op = Op::AllOf;
    NoteField m_field = NoteField::NotePath;
    QVariant m_value;
    std::vector<FilterExpression> m_terms;
};

// Single-quoted literal with embedded quotes doubled.
QString quoteFilterLiteral(const QString& value);

} // namespace nv
