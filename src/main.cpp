#include "mainwindow.h"
#include <QAction>
#include <QActionGroup>
#include <QApplication>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLabel>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>
#include <QDebug>

namespace jdv {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent) {
    setWindowTitle("JsonDiffView");
    resize(1400, 900);

    m_session = new DiffSession(this);
    m_session->setOptions(DiffOptions::loadDefault());

    m_view = new DiffView(m_session, this);
    setCentralWidget(m_view);

    m_pathLabel = new QLabel(this);
    m_summaryLabel = new QLabel(this);
    statusBar()->addWidget(m_pathLabel, 1);
    statusBar()->addPermanentWidget(m_summaryLabel);

    createMenus();

    connect(m_session, &DiffSession::contentRebuilt, this, &MainWindow::updateStatus);
    // the encoded id keeps "/" inside a key apart from the separator
    connect(m_view, &DiffView::blockClicked, m_pathLabel, &QLabel::setText);
    updateStatus();
}

void MainWindow::createMenus() {
    const DiffOptions& opts = m_session->options();

    // ── File ──
    auto* file = menuBar()->addMenu("&File");
    file->addAction("&Open Result...", this, &MainWindow::openFile)->setShortcut(QKeySequence::Open);
    file->addSeparator();
    file->addAction("E&xit", this, &QWidget::close)->setShortcut(QKeySequence::Quit);

    // ── Navigate ──
    auto* nav = menuBar()->addMenu("&Navigate");
    QAction* next = nav->addAction("&Next Change", this, &MainWindow::nextChange);
    next->setShortcut(QKeySequence(Qt::Key_F8));
    QAction* prev = nav->addAction("&Previous Change", this, &MainWindow::prevChange);
    prev->setShortcut(QKeySequence(Qt::SHIFT | Qt::Key_F8));

    // ── View ──
    auto* view = menuBar()->addMenu("&View");
    auto* formats = new QActionGroup(this);
    for (OutputFormat f : {OutputFormat::Json, OutputFormat::Yaml}) {
        QAction* act = view->addAction(QString(outputFormatToString(f)).toUpper());
        act->setCheckable(true);
        act->setChecked(opts.format == f);
        formats->addAction(act);
        connect(act, &QAction::triggered, this, [this, f]() {
            DiffOptions o = m_session->options();
            o.format = f;
            applyOptions(o);
        });
    }
    view->addSeparator();

    QAction* inl = view->addAction("&Inline Diff");
    inl->setCheckable(true);
    inl->setChecked(opts.displayMode == DisplayMode::Inline);
    connect(inl, &QAction::toggled, this, &MainWindow::toggleInline);

    QAction* sync = view->addAction("&Sync Folds");
    sync->setCheckable(true);
    sync->setChecked(opts.syncFolds);
    connect(sync, &QAction::toggled, this, [this](bool on) {
        DiffOptions o = m_session->options();
        o.syncFolds = on;
        applyOptions(o);
    });
    view->addSeparator();
    view->addAction("&Fold All", this, [this]() { m_view->foldSync()->foldAll(); });
    view->addAction("&Unfold All", this, [this]() { m_view->foldSync()->unfoldAll(); });

    // ── Filter ──
    auto* filter = menuBar()->addMenu("F&ilter");
    for (DiffType t : {DiffType::Breaking, DiffType::NonBreaking,
                       DiffType::Annotation, DiffType::Unclassified}) {
        QAction* act = filter->addAction(diffTypeToString(t));
        act->setCheckable(true);
        act->setChecked(opts.filters.contains(t));
        connect(act, &QAction::toggled, this, &MainWindow::toggleFilter);
        m_filterActions.append(act);
    }

    auto* tb = addToolBar("Navigate");
    tb->setMovable(false);
    tb->addAction(prev);
    tb->addAction(next);
}

bool MainWindow::openResult(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "MainWindow: cannot open" << path;
        return false;
    }
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "MainWindow: bad result file" << path << err.errorString();
        return false;
    }
    if (!m_session->loadResult(doc.object()))
        return false;
    setWindowTitle(QFileInfo(path).fileName() + " - JsonDiffView");
    return true;
}

void MainWindow::openFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open Compare Result", QString(),
                                                "JSON (*.json);;All Files (*)");
    if (path.isEmpty()) return;
    if (!openResult(path))
        QMessageBox::warning(this, "JsonDiffView", "Could not load " + path);
}

void MainWindow::nextChange() {
    if (!m_session->navigation()) return;
    QString path = m_session->navigation()->nextChange(activeFilters());
    m_pathLabel->setText(path.isNull() ? QString("No changes") : path);
}

void MainWindow::prevChange() {
    if (!m_session->navigation()) return;
    QString path = m_session->navigation()->prevChange(activeFilters());
    m_pathLabel->setText(path.isNull() ? QString("No changes") : path);
}

void MainWindow::toggleFilter() {
    DiffOptions o = m_session->options();
    o.filters = activeFilters();
    applyOptions(o);
}

void MainWindow::toggleInline(bool on) {
    DiffOptions o = m_session->options();
    o.displayMode = on ? DisplayMode::Inline : DisplayMode::SideBySide;
    applyOptions(o);
}

void MainWindow::applyOptions(const DiffOptions& opts) {
    m_session->setOptions(opts);
    opts.saveDefault();
}

QVector<DiffType> MainWindow::activeFilters() const {
    QVector<DiffType> types;
    for (int i = 0; i < m_filterActions.size(); ++i)
        if (m_filterActions[i]->isChecked())
            types.append(static_cast<DiffType>(i));
    return types;
}

void MainWindow::updateStatus() {
    if (!m_session->navigation()) {
        m_summaryLabel->clear();
        m_pathLabel->setText("Open a compare result (Ctrl+O)");
        return;
    }
    ChangeSummary s = m_session->navigation()->changeSummary();
    m_summaryLabel->setText(QString("%1 changes: %2 breaking, %3 non-breaking, %4 annotation, %5 unclassified")
                                .arg(s.total).arg(s.breaking).arg(s.nonBreaking)
                                .arg(s.annotation).arg(s.unclassified));
    m_pathLabel->clear();
}

} // namespace jdv

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("JsonDiffView");
    app.setOrganizationName("JsonDiffView");
    app.setStyle("Fusion");

    jdv::MainWindow window;
    window.show();

    const QStringList args = app.arguments();
    if (args.size() > 1 && !window.openResult(args.at(1)))
        qWarning() << "JsonDiffView: failed to load" << args.at(1);

    return app.exec();
}
