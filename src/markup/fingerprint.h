/*
 * fingerprint.h --- Content checksum for canonical markup
 *
 * djb2: h = h * 33 + c over every UTF-16 code unit, seeded with 5381 and
 * reduced modulo 2^32, printed as 8 lowercase hex digits. The empty string
 * yields the seed ("00001505").
 *
 * This is an integrity hint for people and tests comparing two renderings.
 * It is NOT cryptographic: collisions are easy to construct and become
 * likely across large report collections. Changing the algorithm changes
 * every stored checksum, so any replacement must bump kAlgorithm.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_FINGERPRINT_H
#define REPORTPRESS_FINGERPRINT_H

#include <QString>
#include <QStringView>

namespace Fingerprint {

inline constexpr quint32 kSeed = 5381;
inline constexpr int kHexWidth = 8;
inline constexpr char kAlgorithm[] = "djb2-utf16-v1";

quint32 hash(QStringView text);

// Fixed-width lowercase hex of hash(markup).
QString compute(QStringView markup);

bool matches(QStringView markup, const QString &checksum);

} // namespace Fingerprint

#endif // REPORTPRESS_FINGERPRINT_H
