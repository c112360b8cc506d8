/*
 * pdfexportoptions.h --- Document information written into exported PDFs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PDFEXPORTOPTIONS_H
#define REPORTPRESS_PDFEXPORTOPTIONS_H

#include <QString>

struct PdfExportOptions {
    QString title;
    QString creator;    // toolkit name
    int resolution = 72; // device units per inch; 72 = one unit per point
};

#endif // REPORTPRESS_PDFEXPORTOPTIONS_H
