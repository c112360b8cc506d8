/*
 * contentmodel.h --- Layout block types (header-only, std::variant)
 *
 * Defines the intermediate representation between the structured report
 * and the layout engine. Blocks are produced in document order and are
 * never modified afterwards; all styling is decided by the layout engine
 * from the typography configuration.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_CONTENTMODEL_H
#define REPORTPRESS_CONTENTMODEL_H

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

namespace Content {

struct Heading {
    int level = 1;   // 1 = section title, 2 = sub-title
    QString text;
};

struct Paragraph {
    QString text;
    bool pending = false;   // text is the pending-input marker
};

struct TableRow {
    QStringList cells;
    bool isHeader = false;  // emitted once per table, never repeated
    QList<bool> pending;    // per cell; a missing entry is not pending
};

struct ListItem {
    QString text;
    std::optional<int> ordinal;   // set for numbered lists
    bool checkbox = false;        // checklist item
    bool pending = false;
};

// Vertical break between blocks. rule = draw a divider (between sections),
// otherwise it is blank space (between paragraphs).
struct Separator {
    bool rule = false;
};

using LayoutBlock = std::variant<
    Heading,
    Paragraph,
    TableRow,
    ListItem,
    Separator
>;

} // namespace Content

#endif // REPORTPRESS_CONTENTMODEL_H
