/*
 * test_markuprenderer.cpp --- Canonical report markup
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QRegularExpression>

#include "markuprenderer.h"
#include "reportresolver.h"

static const QString kPendingSpan = QStringLiteral("<span class=\"pending\">[Pending Input]</span>");

// Markup of one <section data-section="id">...</section>.
static QString sectionMarkup(const QString &markup, const QString &id)
{
    const QString open = QStringLiteral("<section data-section=\"%1\">").arg(id);
    const int start = markup.indexOf(open);
    if (start < 0)
        return {};
    const int end = markup.indexOf(QLatin1String("</section>"), start);
    return markup.mid(start, end - start);
}

static Report::GeneratedContent fullContent()
{
    Report::GeneratedContent c;
    c.summary = QStringLiteral("Acme is current on state filings.\n\n\nOne federal item is open.");
    c.checklist = QStringList{QStringLiteral("Annual report"), QStringLiteral("BOI update")};
    Report::TimelineEntry t;
    t.milestone = QStringLiteral("File annual report");
    t.owner = QStringLiteral("Owner");
    t.dueDate = QStringLiteral("2025-04-15");
    t.notes = QStringLiteral("Online portal");
    c.timeline = QList<Report::TimelineEntry>{t};
    Report::RiskEntry r;
    r.risk = QStringLiteral("Penalty");
    r.severity = QStringLiteral("High");
    r.likelihood = QStringLiteral("Low");
    r.mitigation = QStringLiteral("File early");
    c.riskMatrix = QList<Report::RiskEntry>{r};
    c.recommendations = QStringList{QStringLiteral("Calendar the deadline")};
    c.references = QStringList{QStringLiteral("Secretary of State portal")};
    return c;
}

// MARK: - Placeholders and defaults

TEST(MarkupRendererTest, EmptyInputRendersEverySectionWithPlaceholders) {
    const QString markup = MarkupRenderer::render(Report::Payload{}, Report::GeneratedContent{});

    const QStringList ids = {
        QStringLiteral("summary"), QStringLiteral("checklist"), QStringLiteral("timeline"),
        QStringLiteral("risks"), QStringLiteral("recommendations"), QStringLiteral("references"),
    };
    for (const QString &id : ids) {
        const QString section = sectionMarkup(markup, id);
        ASSERT_FALSE(section.isEmpty()) << id.toStdString();
        EXPECT_TRUE(section.contains(kPendingSpan)) << id.toStdString();
    }

    // Subtitle + four metadata fields + six sections.
    EXPECT_EQ(markup.count(kPendingSpan), 11);
    EXPECT_TRUE(markup.contains(QLatin1String("<h1>Compliance Report</h1>")));
}

TEST(MarkupRendererTest, EmptyChecklistRendersExactlyOneItem) {
    Report::GeneratedContent content;
    content.checklist = QStringList{};

    const QString markup = MarkupRenderer::render(Report::Payload{}, content);
    const QString checklist = sectionMarkup(markup, QStringLiteral("checklist"));

    EXPECT_EQ(markup.count(QLatin1String("<li>")), 1);
    EXPECT_EQ(checklist.count(QLatin1String("<li>")), 1);
    EXPECT_TRUE(checklist.contains(QLatin1String("<ul class=\"checklist\">")));
    EXPECT_TRUE(checklist.contains(kPendingSpan));
}

TEST(MarkupRendererTest, EmptyTablesRenderDefaultRows) {
    Report::GeneratedContent content;
    content.timeline = QList<Report::TimelineEntry>{};
    content.riskMatrix = QList<Report::RiskEntry>{};

    const QString markup = MarkupRenderer::render(Report::Payload{}, content);
    const QString timeline = sectionMarkup(markup, QStringLiteral("timeline"));
    const QString risks = sectionMarkup(markup, QStringLiteral("risks"));

    EXPECT_TRUE(timeline.contains(QLatin1String("<th>Milestone</th><th>Owner</th><th>Due Date</th><th>Notes</th>")));
    EXPECT_TRUE(timeline.contains(QLatin1String("<tr class=\"placeholder\"><td>[Timeline unavailable]</td>")));
    EXPECT_EQ(timeline.count(QLatin1String("<tr")), 2);

    EXPECT_TRUE(risks.contains(QLatin1String("<td>Late filing</td><td>High</td><td>Medium</td>")));
    EXPECT_EQ(risks.count(QLatin1String("<tr")), 2);
}

TEST(MarkupRendererTest, EmptyReferencesFallBackToAgencyContact) {
    Report::GeneratedContent content;
    content.references = QStringList{};

    const QString references = sectionMarkup(
        MarkupRenderer::render(Report::Payload{}, content), QStringLiteral("references"));
    EXPECT_TRUE(references.contains(
        QLatin1String("<li>Contact your state or federal agency for official filing portals.</li>")));
    EXPECT_TRUE(references.contains(QLatin1String("<p class=\"note\">Disclaimer:")));
}

TEST(MarkupRendererTest, BlankListItemsBecomePending) {
    Report::GeneratedContent content;
    content.recommendations = QStringList{QStringLiteral("  "), QStringLiteral("File early")};

    const QString section = sectionMarkup(
        MarkupRenderer::render(Report::Payload{}, content), QStringLiteral("recommendations"));
    EXPECT_TRUE(section.contains(QStringLiteral("<ol>\n<li>%1</li>\n<li>File early</li>").arg(kPendingSpan)));
}

// MARK: - Escaping

TEST(MarkupRendererTest, EscapesInjectedMarkup) {
    Report::Payload payload;
    payload.entityName = QStringLiteral("<script>alert(\"x\")</script>");
    payload.filingType = QStringLiteral("Tom & Jerry's <b>LLC</b>");
    Report::GeneratedContent content;
    content.checklist = QStringList{QStringLiteral("<img src=x onerror=alert(1)>")};

    const QString markup = MarkupRenderer::render(payload, content);

    EXPECT_FALSE(markup.contains(QLatin1String("<script")));
    EXPECT_FALSE(markup.contains(QLatin1String("<img")));
    EXPECT_FALSE(markup.contains(QLatin1String("<b>")));
    EXPECT_TRUE(markup.contains(QLatin1String("&lt;script&gt;alert(&quot;x&quot;)&lt;/script&gt;")));
    EXPECT_TRUE(markup.contains(QLatin1String("Tom &amp; Jerry's &lt;b&gt;LLC&lt;/b&gt;")));
}

// MARK: - Structure

TEST(MarkupRendererTest, SectionsAppearInFixedOrder) {
    const QString markup = MarkupRenderer::render(Report::Payload{}, fullContent());

    const QStringList ids = {
        QStringLiteral("header"), QStringLiteral("summary"), QStringLiteral("checklist"),
        QStringLiteral("timeline"), QStringLiteral("risks"), QStringLiteral("recommendations"),
        QStringLiteral("references"),
    };
    int previous = -1;
    for (const QString &id : ids) {
        const int at = markup.indexOf(QStringLiteral("data-section=\"%1\"").arg(id));
        ASSERT_GT(at, previous) << id.toStdString();
        previous = at;
    }
}

TEST(MarkupRendererTest, SummarySplitsOnBlankLineRuns) {
    const QString summary = sectionMarkup(
        MarkupRenderer::render(Report::Payload{}, fullContent()), QStringLiteral("summary"));
    EXPECT_EQ(summary.count(QLatin1String("<p>")), 2);
    EXPECT_TRUE(summary.contains(QLatin1String("<p>One federal item is open.</p>")));
}

TEST(MarkupRendererTest, IsoDatesAreDisplayedLong) {
    Report::Payload payload;
    payload.deadline = QStringLiteral("2025-04-15");
    const QString markup = MarkupRenderer::render(payload, fullContent());

    EXPECT_TRUE(markup.contains(QLatin1String("<dt>Deadline</dt><dd>Apr 15, 2025</dd>")));
    // Timeline due dates go through the same formatting.
    EXPECT_TRUE(sectionMarkup(markup, QStringLiteral("timeline"))
                    .contains(QLatin1String("<td>Apr 15, 2025</td>")));
}

TEST(MarkupRendererTest, UnparseableDeadlineIsShownVerbatim) {
    Report::Payload payload;
    payload.deadline = QStringLiteral("end of Q2 <approx>");
    const QString markup = MarkupRenderer::render(payload, Report::GeneratedContent{});
    EXPECT_TRUE(markup.contains(QLatin1String("<dd>end of Q2 &lt;approx&gt;</dd>")));
}

TEST(MarkupRendererTest, DisplayDateHandlesDateTimes) {
    EXPECT_EQ(Report::displayDate(QStringLiteral("2024-12-01T09:30:00Z")),
              QStringLiteral("Dec 1, 2024"));
    EXPECT_EQ(Report::displayDate(QStringLiteral("soon")), QStringLiteral("soon"));
}
