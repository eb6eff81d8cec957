#pragma once

#include <QString>
#include <QVector>

#include "printcompositor.h"

class QPagedPaintDevice;
class QPrinter;
class QTextDocument;

namespace PdfExporter {

struct Settings {
    double pageWidthMm = 210.0;
    double pageHeightMm = 297.0;

    // Visual margins: under RTL the semantic right margin is on the left
    double marginLeftMm = 20.0;
    double marginRightMm = 20.0;
    double marginTopMm = 20.0;
    double marginBottomMm = 20.0;

    // On-screen size of the content box the document was laid out in
    double contentWidthPx = 0.0;
    double availableHeightPx = 0.0;

    int resolutionDpi = 300;
    int pageNumberFontSize = 10;
    bool drawPageNumbers = true;
};

// Paints one slice per device page. The device's page layout is replaced by
// a full-page layout of the settings' paper size.
bool paintPages(QPagedPaintDevice *device,
                QTextDocument *document,
                const Settings &settings,
                const QVector<PrintPage> &pages);

bool exportDocumentToPdf(QTextDocument *document,
                         const QString &filePath,
                         const Settings &settings,
                         const QVector<PrintPage> &pages);

bool printDocument(QTextDocument *document,
                   QPrinter *printer,
                   const Settings &settings,
                   const QVector<PrintPage> &pages);

} // namespace PdfExporter
