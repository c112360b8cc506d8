/*
 * fingerprint.cpp --- djb2 checksum over the full markup string
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fingerprint.h"

namespace Fingerprint {

quint32 hash(QStringView text)
{
    quint32 h = kSeed;
    for (QChar c : text)
        h = h * 33u + c.unicode();
    return h;
}

QString compute(QStringView markup)
{
    return QStringLiteral("%1").arg(hash(markup), kHexWidth, 16, QLatin1Char('0'));
}

bool matches(QStringView markup, const QString &checksum)
{
    return compute(markup).compare(checksum, Qt::CaseInsensitive) == 0;
}

} // namespace Fingerprint
