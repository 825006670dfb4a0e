#include "core/vector/filter_expression.h"

#include <QDateTime>
#include <QMetaType>
#include <QStringList>

#include <algorithm>

namespace nv {

namespace {

// Canonical comparison value for a field: strings stay strings, integers
// widen to qint64 and timestamps compare as milliseconds since epoch.
QVariant canonicalValue(NoteField field, const QVariant& value)
{
    switch (field) {
    case NoteField::NotePath:
    case NoteField::Content:
        return value.toString();
    case NoteField::SubNoteIndex:
        return value.toLongLong();
    case NoteField::TimeAdded:
        if (value.metaType().id() == QMetaType::QDateTime) {
            return value.toDateTime().toMSecsSinceEpoch();
        }
        return value.toLongLong();
    case NoteField::Vector:
        break;
    }
    return {};
}

QString literalFor(NoteField field, const QVariant& canonical)
{
    if (field == NoteField::NotePath || field == NoteField::Content) {
        return quoteFilterLiteral(canonical.toString());
    }
    return QString::number(canonical.toLongLong());
}

} // namespace

QString quoteFilterLiteral(const QString& value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('\''), QStringLiteral("''"));
    return QStringLiteral("'") + escaped + QStringLiteral("'");
}

FilterExpression FilterExpression::equals(NoteField field, const QVariant& value)
{
    FilterExpression expression;
    expression.m_op = Op::Equals;
    expression.m_field = field;
    expression.m_value = canonicalValue(field, value);
    return expression;
}

FilterExpression FilterExpression::notEquals(NoteField field, const QVariant& value)
{
    FilterExpression expression = equals(field, value);
    expression.m_op = Op::NotEquals;
    return expression;
}

FilterExpression FilterExpression::allOf(std::vector<FilterExpression> terms)
{
    FilterExpression expression;
    expression.m_op = Op::AllOf;
    expression.m_terms = std::move(terms);
    return expression;
}

FilterExpression FilterExpression::anyOf(std::vector<FilterExpression> terms)
{
    FilterExpression expression;
    expression.m_op = Op::AnyOf;
    expression.m_terms = std::move(terms);
    return expression;
}

FilterExpression FilterExpression::pathEquals(const QString& path)
{
    return equals(NoteField::NotePath, path);
}

FilterExpression FilterExpression::contentNotEmpty()
{
    return notEquals(NoteField::Content, QString());
}

FilterExpression FilterExpression::contentEmpty()
{
    return equals(NoteField::Content, QString());
}

bool FilterExpression::isValid() const
{
    switch (m_op) {
    case Op::Equals:
    case Op::NotEquals:
        return m_field != NoteField::Vector && m_value.isValid();
    case Op::AllOf:
    case Op::AnyOf:
        return std::all_of(m_terms.begin(), m_terms.end(),
                           [](const FilterExpression& term) { return term.isValid(); });
    }
    return false;
}

FilterExpression::SqlFragment FilterExpression::toSql() const
{
    SqlFragment fragment;
    appendSql(&fragment);
    return fragment;
}

void FilterExpression::appendSql(SqlFragment* fragment) const
{
    switch (m_op) {
    case Op::Equals:
    case Op::NotEquals:
        fragment->sql += noteFieldName(m_field);
        fragment->sql += m_op == Op::Equals ? QStringLiteral(" = ?") : QStringLiteral(" != ?");
        fragment->bindings.append(m_value);
        return;
    case Op::AllOf:
    case Op::AnyOf:
        break;
    }

    if (m_terms.empty()) {
        fragment->sql += m_op == Op::AllOf ? QStringLiteral("1") : QStringLiteral("0");
        return;
    }

    const QString joiner = m_op == Op::AllOf ? QStringLiteral(" AND ") : QStringLiteral(" OR ");
    fragment->sql += QLatin1Char('(');
    for (size_t i = 0; i < m_terms.size(); ++i) {
        if (i > 0) {
            fragment->sql += joiner;
        }
        m_terms[i].appendSql(fragment);
    }
    fragment->sql += QLatin1Char(')');
}

QString FilterExpression::toString() const
{
    switch (m_op) {
    case Op::Equals:
    case Op::NotEquals:
        return noteFieldName(m_field)
            + (m_op == Op::Equals ? QStringLiteral(" = ") : QStringLiteral(" != "))
            + literalFor(m_field, m_value);
    case Op::AllOf:
    case Op::AnyOf:
        break;
    }

    if (m_terms.empty()) {
        return m_op == Op::AllOf ? QStringLiteral("true") : QStringLiteral("false");
    }

    QStringList parts;
    for (const FilterExpression& term : m_terms) {
        parts.append(term.toString());
    }
    return QStringLiteral("(")
        + parts.join(m_op == Op::AllOf ? QStringLiteral(" AND ") : QStringLiteral(" OR "))
        + QStringLiteral(")");
}

bool FilterExpression::matches(const RawRow& row) const
{
    switch (m_op) {
    case Op::Equals:
    case Op::NotEquals: {
        const QString key = noteFieldName(m_field);
        if (!row.contains(key)) {
            return false;
        }
        const bool equal = canonicalValue(m_field, row.value(key)) == m_value;
        return m_op == Op::Equals ? equal : !equal;
    }
    case Op::AllOf:
        return std::all_of(m_terms.begin(), m_terms.end(),
                           [&row](const FilterExpression& term) { return term.matches(row); });
    case Op::AnyOf:
        return std::any_of(m_terms.begin(), m_terms.end(),
                           [&row](const FilterExpression& term) { return term.matches(row); });
    }
    return false;
}

} // namespace nv
