#pragma once
#include "diffpane.h"
#include "foldsync.h"
#include "session.h"
#include <QWidget>

class QSplitter;

namespace jdv {

// Before/after panes over one DiffSession. Keeps pane content, folds, word
// highlights and scroll position in step with the session.
class DiffView : public QWidget {
    Q_OBJECT
public:
    explicit DiffView(DiffSession* session, QWidget* parent = nullptr);

    DiffPane* beforePane() const { return m_before; }
    DiffPane* afterPane() const  { return m_after; }   // the only pane when inline
    FoldSyncCoordinator* foldSync() const { return m_sync; }

signals:
    void blockClicked(const QString& blockId);

private:
    void applyFoldOptions();
    void onContentRebuilt();
    void onFilterFoldsChanged(const FoldDelta& delta);
    void onRevealRequested(const QStringList& ancestorIds, int line);
    void syncScroll(DiffPane* to, int value);

    DiffSession*         m_session;
    QSplitter*           m_splitter = nullptr;
    DiffPane*            m_before = nullptr;
    DiffPane*            m_after = nullptr;
    FoldSyncCoordinator* m_sync = nullptr;
    bool                 m_hasContent = false;
};

} // namespace jdv
