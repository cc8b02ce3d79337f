#include "diffview.h"
#include <Qsci/qsciscintilla.h>
#include <QDebug>
#include <QScrollBar>
#include <QSplitter>
#include <QVBoxLayout>

namespace jdv {

DiffView::DiffView(DiffSession* session, QWidget* parent)
    : QWidget(parent), m_session(session) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_before = new DiffPane(m_splitter);
    m_after  = new DiffPane(m_splitter);
    m_before->setSide(PaneSide::Before);
    m_splitter->addWidget(m_before);
    m_splitter->addWidget(m_after);
    layout->addWidget(m_splitter);

    m_sync = new FoldSyncCoordinator(m_before->foldPane(), m_after->foldPane(), this);

    connect(m_session, &DiffSession::optionsChanged, this, &DiffView::applyFoldOptions);
    connect(m_session, &DiffSession::contentRebuilt, this, &DiffView::onContentRebuilt);
    connect(m_session, &DiffSession::filterFoldsChanged, this, &DiffView::onFilterFoldsChanged);
    connect(m_session, &DiffSession::revealRequested, this, &DiffView::onRevealRequested);

    connect(m_before->scintilla()->verticalScrollBar(), &QScrollBar::valueChanged,
            this, [this](int v) { syncScroll(m_after, v); });
    connect(m_after->scintilla()->verticalScrollBar(), &QScrollBar::valueChanged,
            this, [this](int v) { syncScroll(m_before, v); });

    for (DiffPane* pane : {m_before, m_after}) {
        connect(pane, &DiffPane::blockClicked, this,
                [this](const QString& id, int) { emit blockClicked(id); });
    }

    applyFoldOptions();
    if (m_session->hasResult())
        onContentRebuilt();
}

void DiffView::applyFoldOptions() {
    const DiffOptions& opts = m_session->options();
    m_before->setFoldingEnabled(opts.enableFolding);
    m_after->setFoldingEnabled(opts.enableFolding);
    m_sync->setEnabled(opts.syncFolds && !m_session->isUnified());
    // panes were unfolded without the coordinator seeing it
    if (!opts.enableFolding)
        m_sync->resync();
}

void DiffView::onContentRebuilt() {
    const DiffOptions& opts = m_session->options();

    // Manual folds survive a rebuild; filter folds are sent again by the session
    QSet<QString> keep;
    if (m_hasContent) {
        keep = m_sync->foldedBlockIds(Side::After);
        keep.subtract(m_sync->filterFolds());
    }

    m_before->setFormat(opts.format);
    m_after->setFormat(opts.format);

    if (!m_session->hasResult()) {
        m_before->clearContent();
        m_after->clearContent();
        m_sync->setLineMap({});
        m_sync->resync();
        m_hasContent = false;
        return;
    }

    const QVector<ChangeBadge> badges =
        changeBadges(m_session->index(), m_session->blockLineRanges());

    if (m_session->isUnified()) {
        const UnifiedResult& u = m_session->unified();
        m_before->clearContent();
        m_before->hide();
        m_after->setSide(PaneSide::Unified);
        m_after->setContent(u.lines, u.lineMap, u.foldLevels);
        m_after->setWordDiff(m_session->wordDiff(Side::After));
        m_after->setChangeBadges(badges);
    } else {
        const AlignmentResult& a = m_session->alignment();
        m_before->show();
        m_before->setSide(PaneSide::Before);
        m_after->setSide(PaneSide::After);
        m_before->setContent(a.beforeLines, a.lineMap, a.foldLevels, a.beforeSpacerRows);
        m_after->setContent(a.afterLines, a.lineMap, a.foldLevels, a.afterSpacerRows);
        m_before->setWordDiff(m_session->wordDiff(Side::Before));
        m_after->setWordDiff(m_session->wordDiff(Side::After));
        // same badges on both sides keeps the annotation rows aligned
        m_before->setChangeBadges(badges);
        m_after->setChangeBadges(badges);
    }

    m_sync->setEnabled(opts.syncFolds && !m_session->isUnified());
    m_sync->setLineMap(m_session->lineMap());
    m_sync->resync();
    if (opts.enableFolding)
        m_sync->restoreFolds(keep, m_session->blockLineRanges());
    m_hasContent = true;

    qDebug() << "DiffView: showing" << m_session->lineMap().size() << "rows,"
             << keep.size() << "folds kept";
}

void DiffView::onFilterFoldsChanged(const FoldDelta& delta) {
    if (!m_session->options().enableFolding) return;
    m_sync->applyFilterDelta(delta, m_session->blockLineRanges());
}

void DiffView::onRevealRequested(const QStringList& ancestorIds, int line) {
    m_sync->revealBlocks(ancestorIds, m_session->blockLineRanges());
    if (line < 1) return;
    m_after->scrollToLine(line);
    if (!m_session->isUnified())
        m_before->scrollToLine(line);
}

void DiffView::syncScroll(DiffPane* to, int value) {
    if (m_session->isUnified()) return;
    QScrollBar* bar = to->scintilla()->verticalScrollBar();
    if (bar->value() != value)
        bar->setValue(value);
}

} // namespace jdv
