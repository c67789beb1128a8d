#include "MockPageRasterizer.h"

#include <QtMath>

MockPageRasterizer::MockPageRasterizer(const QVector<QSizeF>& pageSizes)
    : m_pageSizes(pageSizes)
{
}

QSizeF MockPageRasterizer::pageSize(int page) const
{
    if (!m_valid || !isPageValid(page)) {
        return QSizeF();
    }
    return m_pageSizes.at(page);
}

QImage MockPageRasterizer::renderPage(int page, qreal magnification) const
{
    m_renderCalls++;
    m_lastPage = page;
    m_lastMagnification = magnification;

    if (!m_renderSucceeds || !m_valid || !isPageValid(page) || magnification <= 0.0) {
        return QImage();
    }

    const QSizeF size = m_pageSizes.at(page) * magnification;
    QImage image(qCeil(size.width()), qCeil(size.height()), QImage::Format_RGB32);
    image.fill(m_pageColor);
    return image;
}
