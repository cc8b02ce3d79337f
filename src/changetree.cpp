#include "core.h"
#include <QDebug>
#include <QJsonDocument>

namespace jdv {

namespace {

struct CondName { DisplayCondition cond; const char* name; };
constexpr CondName kCondNames[] = {
    {DisplayCondition::Always,    "always"},
    {DisplayCondition::Before,    "before"},
    {DisplayCondition::After,     "after"},
    {DisplayCondition::Collapsed, "collapsed"},
    {DisplayCondition::Expanded,  "expanded"},
};

struct RoleName { TokenRole role; const char* name; };
constexpr RoleName kRoleNames[] = {
    {TokenRole::Key,         "key"},
    {TokenRole::Index,       "index"},
    {TokenRole::Value,       "value"},
    {TokenRole::Syntax,      "spec"},
    {TokenRole::ChangeCount, "change"},
};

DisplayCondition condFromString(const QString& s) {
    for (const auto& c : kCondNames)
        if (s == QLatin1String(c.name)) return c.cond;
    return DisplayCondition::Always;
}

const char* condToString(DisplayCondition d) {
    for (const auto& c : kCondNames)
        if (c.cond == d) return c.name;
    return "always";
}

TokenRole roleFromString(const QString& s) {
    for (const auto& r : kRoleNames)
        if (s == QLatin1String(r.name)) return r.role;
    return TokenRole::Syntax;
}

const char* roleToString(TokenRole t) {
    for (const auto& r : kRoleNames)
        if (r.role == t) return r.name;
    return "spec";
}

// Own contribution of a node: one change of its type, or nothing.
ChangeCounts ownCounts(const ChangeNode& n) {
    ChangeCounts c{};
    if (n.hasDiff()) {
        c[0] = 1;
        c[1 + diffTypeIndex(n.diff.type)] = 1;
    }
    return c;
}

void addCounts(ChangeCounts& into, const ChangeCounts& from) {
    for (size_t i = 0; i < into.size(); i++)
        into[i] += from[i];
}

ChangeCounts expectedCounts(const ChangeNode& n) {
    ChangeCounts c = ownCounts(n);
    if (n.hasDiff() && n.subsumesChildren())
        return c;
    for (const auto& child : n.children)
        addCounts(c, child.counts);
    return c;
}

ChangeCounts recomputeCountsImpl(ChangeNode& node) {
    ChangeCounts childSum{};
    for (auto& child : node.children)
        addCounts(childSum, recomputeCountsImpl(child));

    ChangeCounts c = ownCounts(node);
    if (!(node.hasDiff() && node.subsumesChildren()))
        addCounts(c, childSum);
    node.counts = c;
    return c;
}

QString scalarText(const QJsonValue& v) {
    switch (v.type()) {
    case QJsonValue::String: return v.toString();
    case QJsonValue::Bool:   return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: return QString::number(v.toDouble());
    case QJsonValue::Null:   return QStringLiteral("null");
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(v.toObject()).toJson(QJsonDocument::Compact));
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(v.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Undefined: break;
    }
    return {};
}

} // namespace

void recomputeCounts(ChangeNode& node) {
    recomputeCountsImpl(node);
}

bool verifyCounts(const ChangeNode& root) {
    bool ok = true;
    QVector<const ChangeNode*> stack{&root};
    while (!stack.isEmpty()) {
        const ChangeNode* n = stack.takeLast();
        if (!countsBalanced(n->counts)) {
            qWarning() << "ChangeTree: unbalanced counts at" << n->id
                       << "total" << n->counts[0];
            ok = false;
        }
        if (n->counts != expectedCounts(*n)) {
            qWarning() << "ChangeTree: counts do not match subtree at" << n->id;
            ok = false;
        }
        for (const auto& child : n->children)
            stack.append(&child);
    }
    return ok;
}

int assignLineIndices(ChangeNode& root) {
    int next = 0;
    QVector<ChangeNode*> stack{&root};
    while (!stack.isEmpty()) {
        ChangeNode* n = stack.takeLast();
        n->lineIndex = n->hasTokens() ? ++next : 0;
        // reverse push keeps preorder
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it)
            stack.append(&*it);
    }
    return next;
}

const ChangeNode* findNode(const ChangeNode& root, const QString& id) {
    if (id.isEmpty()) return nullptr;
    QVector<const ChangeNode*> stack{&root};
    while (!stack.isEmpty()) {
        const ChangeNode* n = stack.takeLast();
        if (n->id == id) return n;
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it)
            stack.append(&*it);
    }
    return nullptr;
}

// ── JSON ──

QJsonObject ChangeNode::toJson() const {
    QJsonObject o;
    if (!id.isEmpty()) o["id"] = id;
    if (lineIndex > 0) o["line"] = lineIndex;
    o["indent"] = indent;

    QJsonArray toks;
    for (const auto& t : tokens) {
        QJsonObject to;
        to["text"] = t.text;
        if (t.cond != DisplayCondition::Always)
            to["cond"] = condToString(t.cond);
        to["role"] = roleToString(t.role);
        toks.append(to);
    }
    o["tokens"] = toks;

    if (hasDiff()) {
        QJsonObject d;
        d["action"] = diffActionToString(diff.action);
        d["type"]   = diffTypeToString(diff.type);
        if (!diff.replacedValue.isNull())
            d["replaced"] = diff.replacedValue;
        o["diff"] = d;
    }

    QJsonArray c;
    for (int v : counts) c.append(v);
    o["counts"] = c;

    if (!children.empty()) {
        QJsonArray kids;
        for (const auto& child : children) kids.append(child.toJson());
        o["children"] = kids;
    }
    return o;
}

ChangeNode ChangeNode::fromJson(const QJsonObject& o) {
    ChangeNode n;
    n.id        = o["id"].toString();
    n.lineIndex = o["line"].toInt(0);
    n.indent    = qMax(0, o["indent"].toInt(0));

    const QJsonArray toks = o["tokens"].toArray();
    n.tokens.reserve(toks.size());
    for (const auto& v : toks) {
        QJsonObject to = v.toObject();
        Token t;
        t.text = to["text"].toString();
        t.cond = condFromString(to["cond"].toString());
        t.role = roleFromString(to["role"].toString());
        n.tokens.append(t);
    }

    if (o.contains("diff")) {
        QJsonObject d = o["diff"].toObject();
        bool actionOk = false;
        n.diff.action = diffActionFromString(d["action"].toString(), &actionOk);
        if (!actionOk && d.contains("action"))
            qDebug() << "ChangeTree: unknown action" << d["action"].toString()
                     << "at" << n.id << "- treated as unchanged";
        n.diff.type = diffTypeFromString(d["type"].toString());
        if (d.contains("replaced"))
            n.diff.replacedValue = scalarText(d["replaced"]);
    }

    const QJsonArray kids = o["children"].toArray();
    n.children.reserve(kids.size());
    for (const auto& v : kids)
        n.children.push_back(fromJson(v.toObject()));

    QJsonArray c = o["counts"].toArray();
    if (c.size() == int(n.counts.size())) {
        for (int i = 0; i < c.size(); i++) n.counts[i] = c[i].toInt();
    } else {
        n.counts = expectedCounts(n);
    }
    return n;
}

QJsonObject LineMapping::toJson() const {
    QJsonObject o;
    o["beforeLine"] = beforeLine > 0 ? QJsonValue(beforeLine) : QJsonValue();
    o["afterLine"]  = afterLine  > 0 ? QJsonValue(afterLine)  : QJsonValue();
    o["type"] = lineTypeToString(type);
    if (!blockId.isEmpty()) o["blockId"] = blockId;
    if (hasDiffType) o["diffType"] = diffTypeToString(diffType);
    if (isChangeRoot) o["isChangeRoot"] = true;
    if (!pairId.isEmpty()) o["pairId"] = pairId;
    return o;
}

} // namespace jdv
