/*
 * test_exportnaming.cpp --- Export file names
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "exportnaming.h"

using namespace ExportNaming;

TEST(ExportNamingTest, ReportFileName) {
    const Report::BrandingConfig branding;
    EXPECT_EQ(fileName(branding, Suffix::Report, QDate(2025, 3, 7)),
              QStringLiteral("2025-03-07_YBG_YourBizGuru_Mini_Dashboard_Report.pdf"));
}

TEST(ExportNamingTest, ResultModeSuffixes) {
    EXPECT_EQ(suffixString(Suffix::Report), QStringLiteral("Report"));
    EXPECT_EQ(suffixString(suffixFor(Report::ResultMode::Latest)), QStringLiteral("Latest_Result"));
    EXPECT_EQ(suffixString(suffixFor(Report::ResultMode::All)), QStringLiteral("All_Results"));

    Report::BrandingConfig branding;
    branding.brandCode = QStringLiteral("ACME");
    branding.toolkitName = QStringLiteral("Grant Finder");
    EXPECT_EQ(fileName(branding, Suffix::AllResults, QDate(2024, 12, 1)),
              QStringLiteral("2024-12-01_ACME_Grant_Finder_All_Results.pdf"));
}

TEST(ExportNamingTest, SafeNameCollapsesAndTrims) {
    EXPECT_EQ(safeName(QStringLiteral("  Grant -- Finder!! ")), QStringLiteral("Grant_Finder"));
    EXPECT_EQ(safeName(QStringLiteral("Compliance/Report v2.0")),
              QStringLiteral("Compliance_Report_v2_0"));
    EXPECT_EQ(safeName(QStringLiteral("Café Tools")), QStringLiteral("Caf_Tools"));
}

TEST(ExportNamingTest, EmptySafeNameFallsBack) {
    EXPECT_EQ(safeName(QString()), QStringLiteral("Toolkit"));
    EXPECT_EQ(safeName(QStringLiteral("!!! ---")), QStringLiteral("Toolkit"));
}
