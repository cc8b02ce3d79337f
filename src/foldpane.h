#pragma once
#include <QObject>
#include <QVector>

namespace jdv {

// A folded span in pane document coordinates. from/to are opaque positions
// that only the owning pane can turn back into lines (see lineAt).
struct FoldRange {
    int from = 0;
    int to   = 0;

    quint64 key() const { return (quint64(quint32(from)) << 32) | quint32(to); }
};

inline bool operator==(const FoldRange& a, const FoldRange& b) {
    return a.from == b.from && a.to == b.to;
}

// Fold surface of one editor pane. Lines are 1-based. Implementations emit
// foldsChanged() after any fold state change, including their own fold/unfold calls.
class FoldPane : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;

    virtual int lineCount() const = 0;
    virtual QVector<FoldRange> foldedRanges() const = 0;
    virtual int lineAt(int pos) const = 0;

    virtual bool isFoldable(int line) const = 0;
    virtual bool isFolded(int line) const = 0;

    // false when there is nothing to fold / unfold at line
    virtual bool foldLine(int line) = 0;
    virtual bool unfoldLine(int line) = 0;

signals:
    void foldsChanged();
};

} // namespace jdv
