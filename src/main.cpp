#include <QApplication>
#include <QMainWindow>
#include <QScrollArea>
#include <QStatusBar>
#include <QLabel>
#include <QMenuBar>
#include <QMenu>
#include <QDebug>
#include <QDockWidget>
#include <QFileDialog>
#include <QPrintDialog>
#include <QPrinter>
#include <QMessageBox>
#include <QVBoxLayout>
#include <QDateTime>
#include "pageview.h"
#include "richtexteditor.h"
#include "paginationbar.h"
#include "pagenavigatorpanel.h"
#include "pagesetuppanel.h"
#include "pagesetupstore.h"

// Custom message handler to add timestamps
void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString formattedMsg = QString("[%1] %2").arg(timestamp, msg);

    QByteArray localMsg = formattedMsg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtInfoMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(stderr, "Critical: %s\n", localMsg.constData());
        break;
    case QtFatalMsg:
        fprintf(stderr, "Fatal: %s\n", localMsg.constData());
        abort();
    }
}

int main(int argc, char *argv[])
{
    qInstallMessageHandler(customMessageHandler);
    QApplication app(argc, argv);
    QApplication::setOrganizationName("SafhaQt");
    QApplication::setApplicationName("SafhaQt");
    qDebug() << "[Main] Application started";

    const PageSetupStore::PageSetup setup = PageSetupStore::load();

    QMainWindow window;
    window.setWindowTitle("SafhaQt");
    window.resize(1100, 800);
    window.setLayoutDirection(setup.rtl ? Qt::RightToLeft : Qt::LeftToRight);

    // Page view inside a scroll area, pagination bar underneath
    PageView *page = new PageView();
    page->setPageLayout(setup.layout);
    page->setZoom(setup.zoom);
    page->setRightToLeft(setup.rtl);

    QScrollArea *scroll = new QScrollArea();
    scroll->setWidget(page);
    scroll->setWidgetResizable(true);
    scroll->setBackgroundRole(QPalette::Dark);
    scroll->setAlignment(Qt::AlignHCenter | Qt::AlignTop);

    PaginationBar *paginationBar = new PaginationBar();

    QWidget *editorContainer = new QWidget();
    QVBoxLayout *containerLayout = new QVBoxLayout(editorContainer);
    containerLayout->setContentsMargins(0, 0, 0, 0);
    containerLayout->setSpacing(0);
    containerLayout->addWidget(scroll, 1);
    containerLayout->addWidget(paginationBar);
    window.setCentralWidget(editorContainer);

    // Side panels
    PageNavigatorPanel *navigator = new PageNavigatorPanel();
    navigator->setPageView(page);
    QDockWidget *navigatorDock = new QDockWidget(QObject::tr("Pages"), &window);
    navigatorDock->setWidget(navigator);
    window.addDockWidget(Qt::RightDockWidgetArea, navigatorDock);

    PageSetupPanel *setupPanel = new PageSetupPanel();
    setupPanel->setUnit(setup.unit);
    setupPanel->setPageView(page);
    QDockWidget *setupDock = new QDockWidget(QObject::tr("Page Setup"), &window);
    setupDock->setWidget(setupPanel);
    window.addDockWidget(Qt::LeftDockWidgetArea, setupDock);

    QLabel *statusLabel = new QLabel();
    window.statusBar()->addPermanentWidget(statusLabel);

    auto updatePageStatus = [page, paginationBar, statusLabel]() {
        paginationBar->setPageStatus(page->currentPage(), page->pageCount());
        statusLabel->setText(page->pageLabel(page->currentPage())
                             + QString("  |  %1%").arg(qRound(page->zoom() * 100)));
    };
    QObject::connect(page, &PageView::paginationChanged, updatePageStatus);
    QObject::connect(page, &PageView::currentPageChanged, updatePageStatus);
    QObject::connect(page, &PageView::zoomChanged, updatePageStatus);
    QObject::connect(paginationBar, &PaginationBar::previousRequested, page, &PageView::previousPage);
    QObject::connect(paginationBar, &PaginationBar::nextRequested, page, &PageView::nextPage);
    QObject::connect(paginationBar, &PaginationBar::goToPageRequested, page, &PageView::goToPage);
    updatePageStatus();

    // Menus
    QMenuBar *menuBar = window.menuBar();
    QMenu *fileMenu = menuBar->addMenu(QObject::tr("&File"));
    QAction *exportPdfAction = fileMenu->addAction(QObject::tr("Export to &PDF..."));
    exportPdfAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_E));
    QAction *printAction = fileMenu->addAction(QObject::tr("&Print..."));
    printAction->setShortcut(QKeySequence::Print);
    fileMenu->addSeparator();
    QAction *quitAction = fileMenu->addAction(QObject::tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);

    QMenu *insertMenu = menuBar->addMenu(QObject::tr("&Insert"));
    QAction *pageBreakAction = insertMenu->addAction(QObject::tr("Page &Break"));
    pageBreakAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Return));

    QMenu *viewMenu = menuBar->addMenu(QObject::tr("&View"));
    QAction *zoomInAction = viewMenu->addAction(QObject::tr("Zoom &In"));
    zoomInAction->setShortcut(QKeySequence::ZoomIn);
    QAction *zoomOutAction = viewMenu->addAction(QObject::tr("Zoom &Out"));
    zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    QAction *zoomResetAction = viewMenu->addAction(QObject::tr("&Reset Zoom"));
    zoomResetAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_0));
    viewMenu->addSeparator();
    QAction *prevPageAction = viewMenu->addAction(QObject::tr("&Previous Page"));
    prevPageAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_PageUp));
    QAction *nextPageAction = viewMenu->addAction(QObject::tr("&Next Page"));
    nextPageAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_PageDown));
    viewMenu->addSeparator();
    viewMenu->addAction(navigatorDock->toggleViewAction());
    viewMenu->addAction(setupDock->toggleViewAction());

    QObject::connect(pageBreakAction, &QAction::triggered, page, &PageView::insertPageBreak);
    QObject::connect(zoomInAction, &QAction::triggered, page, &PageView::zoomInView);
    QObject::connect(zoomOutAction, &QAction::triggered, page, &PageView::zoomOutView);
    QObject::connect(zoomResetAction, &QAction::triggered, page, &PageView::resetZoom);
    QObject::connect(prevPageAction, &QAction::triggered, page, &PageView::previousPage);
    QObject::connect(nextPageAction, &QAction::triggered, page, &PageView::nextPage);
    QObject::connect(quitAction, &QAction::triggered, &window, &QMainWindow::close);

    QObject::connect(exportPdfAction, &QAction::triggered, [&]() {
        QString filePath = QFileDialog::getSaveFileName(&window, QObject::tr("Export as PDF"), "",
                                                        QObject::tr("PDF Files (*.pdf)"));
        if (filePath.isEmpty()) return;

        if (page->exportToPdf(filePath)) {
            qDebug() << "[Main] Exported to PDF:" << filePath;
            QMessageBox::information(&window, QObject::tr("Export Successful"),
                                     QObject::tr("Document exported to PDF successfully."));
        } else {
            QMessageBox::warning(&window, QObject::tr("Export Error"),
                                 QObject::tr("Failed to export document to PDF."));
        }
    });

    QObject::connect(printAction, &QAction::triggered, [&]() {
        QPrinter printer(QPrinter::HighResolution);
        QPrintDialog dialog(&printer, &window);
        dialog.setWindowTitle(QObject::tr("Print Document"));
        if (dialog.exec() != QDialog::Accepted) return;

        if (page->print(&printer)) {
            qDebug() << "[Main] Printed to" << printer.printerName();
        } else {
            QMessageBox::warning(&window, QObject::tr("Print Error"),
                                 QObject::tr("Failed to print the document."));
        }
    });

    // Persist page setup on exit
    QObject::connect(&app, &QApplication::aboutToQuit, [page, setupPanel]() {
        PageSetupStore::PageSetup current;
        current.layout = page->pageLayout();
        current.unit = setupPanel->unit();
        current.zoom = page->zoom();
        current.rtl = page->isRightToLeft();
        if (!PageSetupStore::save(current)) {
            qWarning() << "[Main] Failed to save page setup";
        }
    });

    window.show();
    page->editor()->setFocus();
    qDebug() << "[Main] Window shown, entering event loop";

    return app.exec();
}
