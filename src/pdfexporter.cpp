#include "pdfexporter.h"

#include <QAbstractTextDocumentLayout>
#include <QDebug>
#include <QMarginsF>
#include <QPainter>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <QPrinter>
#include <QTextDocument>
#include <QtMath>
#include <cmath>

namespace PdfExporter {

namespace {

double mmToDevice(double mm, int dpi)
{
    return mm / 25.4 * dpi;
}

bool isUsable(QTextDocument *document, const Settings &settings, const QVector<PrintPage> &pages)
{
    if (!document || pages.isEmpty()) {
        qWarning() << "[PdfExporter] Nothing to export";
        return false;
    }
    if (!(settings.contentWidthPx > 0.0) || !(settings.availableHeightPx > 0.0)
        || !(settings.pageWidthMm > 0.0) || !(settings.pageHeightMm > 0.0)) {
        qWarning() << "[PdfExporter] Invalid page geometry";
        return false;
    }
    return true;
}

} // namespace

bool paintPages(QPagedPaintDevice *device,
                QTextDocument *document,
                const Settings &settings,
                const QVector<PrintPage> &pages)
{
    if (!device || !isUsable(document, settings, pages)) {
        return false;
    }

    QPageLayout layout(QPageSize(QSizeF(settings.pageWidthMm, settings.pageHeightMm), QPageSize::Millimeter),
                       QPageLayout::Portrait,
                       QMarginsF(0, 0, 0, 0),
                       QPageLayout::Millimeter);
    layout.setMode(QPageLayout::FullPageMode);
    if (!device->setPageLayout(layout)) {
        qWarning() << "[PdfExporter] Device rejected the page layout, using its own";
    }

    QPainter painter;
    if (!painter.begin(device)) {
        qWarning() << "[PdfExporter] Could not start painting on the output device";
        return false;
    }

    const int dpi = device->logicalDpiY();
    const QRectF contentRect(mmToDevice(settings.marginLeftMm, dpi),
                             mmToDevice(settings.marginTopMm, dpi),
                             mmToDevice(settings.pageWidthMm - settings.marginLeftMm - settings.marginRightMm, dpi),
                             mmToDevice(settings.pageHeightMm - settings.marginTopMm - settings.marginBottomMm, dpi));

    const qreal scaleX = contentRect.width() / settings.contentWidthPx;
    const qreal scaleY = contentRect.height() / settings.availableHeightPx;
    const qreal scale = qMin(scaleX, scaleY);

    for (int i = 0; i < pages.size(); ++i) {
        const PrintPage &page = pages.at(i);
        if (i > 0 && !device->newPage()) {
            qWarning() << "[PdfExporter] Could not start page" << page.index + 1;
            painter.end();
            return false;
        }

        painter.save();
        painter.translate(contentRect.topLeft());
        painter.scale(scale, scale);
        painter.translate(0, page.translateY);
        // Never paint past the content box, even for an oversized slice
        const QRectF clipRect(0, page.startOffset, settings.contentWidthPx,
                              qMin(page.height, settings.availableHeightPx));
        painter.setClipRect(clipRect);

        QAbstractTextDocumentLayout::PaintContext context;
        context.clip = clipRect;
        context.palette.setColor(QPalette::Text, Qt::black);
        document->documentLayout()->draw(&painter, context);
        painter.restore();

        if (settings.drawPageNumbers) {
            painter.save();
            QFont pageNumFont = painter.font();
            pageNumFont.setPointSizeF(settings.pageNumberFontSize);
            painter.setFont(pageNumFont);
            painter.setPen(Qt::black);
            const QRectF topMargin(0, 0, mmToDevice(settings.pageWidthMm, dpi), contentRect.top());
            painter.drawText(topMargin, Qt::AlignCenter, QString::number(page.index + 1));
            painter.restore();
        }
    }

    painter.end();
    return true;
}

bool exportDocumentToPdf(QTextDocument *document,
                         const QString &filePath,
                         const Settings &settings,
                         const QVector<PrintPage> &pages)
{
    if (!isUsable(document, settings, pages)) {
        return false;
    }

    QPdfWriter writer(filePath);
    writer.setResolution(settings.resolutionDpi);
    if (!paintPages(&writer, document, settings, pages)) {
        qWarning() << "[PdfExporter] Could not write" << filePath;
        return false;
    }
    qDebug() << "[PdfExporter] Wrote" << pages.size() << "pages to" << filePath;
    return true;
}

bool printDocument(QTextDocument *document,
                   QPrinter *printer,
                   const Settings &settings,
                   const QVector<PrintPage> &pages)
{
    if (!printer || !printer->isValid()) {
        qWarning() << "[PdfExporter] No usable printer";
        return false;
    }
    if (!paintPages(printer, document, settings, pages)) {
        qWarning() << "[PdfExporter] Printing to" << printer->printerName() << "failed";
        return false;
    }
    qDebug() << "[PdfExporter] Sent" << pages.size() << "pages to" << printer->printerName();
    return true;
}

} // namespace PdfExporter
