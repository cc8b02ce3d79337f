#pragma once
#include "diffview.h"
#include "session.h"
#include <QMainWindow>

class QAction;
class QLabel;

namespace jdv {

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

    bool openResult(const QString& path);

private slots:
    void openFile();
    void nextChange();
    void prevChange();
    void toggleFilter();
    void toggleInline(bool on);

private:
    void createMenus();
    void applyOptions(const DiffOptions& opts);
    void updateStatus();
    QVector<DiffType> activeFilters() const;

    DiffSession*      m_session;
    DiffView*         m_view;
    QLabel*           m_pathLabel;
    QLabel*           m_summaryLabel;
    QVector<QAction*> m_filterActions;   // indexed by DiffType
};

} // namespace jdv
