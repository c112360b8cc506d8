/*
 * pagerecorder.cpp --- DrawingSurface that records pages as display lists
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagerecorder.h"

#include <QDebug>

namespace Render {

PageRecorder::PageRecorder(const QSizeF &pageSize)
{
    m_document.pageSize = pageSize;
}

int PageRecorder::addPage()
{
    m_document.pages.append(RecordedPage{});
    m_current = m_document.pages.size() - 1;
    return m_current;
}

bool PageRecorder::setPage(int index)
{
    if (index < 0 || index >= m_document.pages.size()) {
        qWarning() << "PageRecorder: no page" << index;
        return false;
    }
    m_current = index;
    return true;
}

PageDocument PageRecorder::takeDocument()
{
    PageDocument doc = std::move(m_document);
    m_document = PageDocument{};
    m_document.pageSize = doc.pageSize;
    m_current = -1;
    return doc;
}

QStringList PageRecorder::textOf(const RecordedPage &page)
{
    QStringList text;
    for (const DrawCommand &command : page.commands) {
        if (const auto *t = std::get_if<TextCommand>(&command))
            text.append(t->text);
    }
    return text;
}

void PageRecorder::record(DrawCommand command)
{
    if (m_current < 0) {
        qWarning() << "PageRecorder: drawing before the first page was added";
        return;
    }
    m_document.pages[m_current].commands.append(std::move(command));
}

void PageRecorder::drawText(const QPointF &baseline, const QString &text,
                            const FontSpec &font, const QColor &color)
{
    record(TextCommand{baseline, text, font, color});
}

void PageRecorder::drawLine(const QPointF &from, const QPointF &to,
                            const QColor &color, qreal width)
{
    record(LineCommand{from, to, color, width});
}

void PageRecorder::drawRect(const QRectF &rect, const QColor &fill,
                            const QColor &stroke, qreal strokeWidth)
{
    record(RectCommand{rect, fill, stroke, strokeWidth});
}

void PageRecorder::drawCircle(const QPointF &center, qreal radius,
                              const QColor &stroke, qreal strokeWidth)
{
    record(CircleCommand{center, radius, stroke, strokeWidth});
}

void PageRecorder::drawImage(const QRectF &rect, const QImage &image)
{
    record(ImageCommand{rect, image});
}

} // namespace Render
