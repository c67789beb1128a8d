#ifndef PAGERASTERIZER_H
#define PAGERASTERIZER_H

#include <QImage>
#include <QSizeF>
#include <QString>

/**
 * @brief Abstract page source for the canvas and exporters.
 *
 * Page indices are 0-based. Sizes are in document units (PDF points), and a
 * page rendered at magnification m is m pixels per document unit.
 */
class PageRasterizer
{
public:
    static constexpr qreal kPointsPerInch = 72.0;

    virtual ~PageRasterizer() = default;

    virtual bool isValid() const = 0;
    virtual int pageCount() const = 0;
    virtual QString filePath() const = 0;

    // Empty size for an out-of-range page
    virtual QSizeF pageSize(int page) const = 0;

    // Null image for an out-of-range page or a failed render
    virtual QImage renderPage(int page, qreal magnification) const = 0;

    bool isPageValid(int page) const { return page >= 0 && page < pageCount(); }
};

#endif // PAGERASTERIZER_H
