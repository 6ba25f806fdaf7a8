/*
 * stringdiffer.cpp — Prefix/suffix trim + Myers diff over UTF-16 code units
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stringdiffer.h"

#include <QDebug>

#include <unicode/uchar.h>

#include <utility>
#include <vector>

static constexpr QChar kNbsp(0x00A0);

// Above this edit distance the middle region is replaced wholesale
static constexpr int kMaxEditDistance = 1024;

namespace {

struct EditRun {
    int location = 0;   // absolute: old coordinates for removals, new for insertions
    int length = 0;
};

struct MiddleDiff {
    QList<EditRun> removals;
    QList<EditRun> insertions;
};

void appendIndex(QList<EditRun> &runs, int index)
{
    if (!runs.isEmpty() && runs.last().location + runs.last().length == index) {
        ++runs.last().length;
        return;
    }
    runs.append({index, 1});
}

// Myers O((N+M)D) shortest edit script between a[0,n) and b[0,m).
// Returns false when the edit distance exceeds kMaxEditDistance.
bool myersDiff(const QChar *a, int n, const QChar *b, int m, int base,
               MiddleDiff &out)
{
    const int max = qMin(n + m, kMaxEditDistance);
    // The length difference alone is a lower bound on the distance
    if (qAbs(n - m) > max)
        return false;

    const int offset = max + 1;
    std::vector<int> v(2 * max + 3, 0);
    // trace[d] keeps v on the diagonals [-(d - 1), d - 1], the only ones
    // round d reads; the trace grows with D^2 rather than D * (N + M)
    std::vector<std::vector<int>> trace;
    auto traced = [&trace](int d, int k) { return trace[d][k + d - 1]; };

    int found = -1;
    for (int d = 0; d <= max && found < 0; ++d) {
        if (d == 0)
            trace.emplace_back();
        else
            trace.emplace_back(v.begin() + offset - (d - 1), v.begin() + offset + d);
        for (int k = -d; k <= d; k += 2) {
            int x;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1]))
                x = v[offset + k + 1];
            else
                x = v[offset + k - 1] + 1;
            int y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                found = d;
                break;
            }
        }
    }
    if (found < 0)
        return false;

    // Walk the trace backwards, collecting deleted old indices and inserted
    // new indices (both in descending order).
    QList<int> deleted;
    QList<int> inserted;
    int x = n;
    int y = m;
    for (int d = found; d > 0; --d) {
        const int k = x - y;
        int prevK;
        if (k == -d || (k != d && traced(d, k - 1) < traced(d, k + 1)))
            prevK = k + 1;
        else
            prevK = k - 1;
        const int prevX = traced(d, prevK);
        const int prevY = prevX - prevK;
        while (x > prevX && y > prevY) {
            --x;
            --y;
        }
        if (x == prevX)
            inserted.append(y - 1);
        else
            deleted.append(x - 1);
        x = prevX;
        y = prevY;
    }

    for (int i = deleted.size() - 1; i >= 0; --i)
        appendIndex(out.removals, base + deleted[i]);
    for (int i = inserted.size() - 1; i >= 0; --i)
        appendIndex(out.insertions, base + inserted[i]);
    return true;
}

} // anonymous namespace

QString StringDiffer::foldWhitespace(const QString &text)
{
    QString folded = text;
    for (int i = 0; i < folded.size(); ++i) {
        const QChar c = folded.at(i);
        // White_Space code points are all in the BMP
        if (!c.isSurrogate() && u_isUWhiteSpace(static_cast<UChar32>(c.unicode())))
            folded[i] = kNbsp;
    }
    return folded;
}

bool StringDiffer::isEquivalent(const QString &a, const QString &b)
{
    if (a.size() != b.size())
        return false;
    return foldWhitespace(a) == foldWhitespace(b);
}

std::optional<StringReplacement> StringDiffer::replacement(const QString &oldText,
                                                           const QString &newText)
{
    const QString a = foldWhitespace(oldText);
    const QString b = foldWhitespace(newText);
    if (a == b)
        return std::nullopt;

    const int n = a.size();
    const int m = b.size();

    int prefix = 0;
    while (prefix < n && prefix < m && a.at(prefix) == b.at(prefix))
        ++prefix;

    // The suffix may not reach back into the prefix on either side
    int suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && a.at(n - 1 - suffix) == b.at(m - 1 - suffix))
        ++suffix;

    const int oldMiddle = n - prefix - suffix;
    const int newMiddle = m - prefix - suffix;

    // Two spaces turned into a full stop by the platform's auto-punctuation
    if (oldMiddle == 2 && newMiddle == 1
        && a.at(prefix) == kNbsp && a.at(prefix + 1) == kNbsp
        && newText.at(prefix) == QLatin1Char('.')) {
        return StringReplacement{prefix, 2, QStringLiteral("."), false};
    }

    if (oldMiddle == 0 || newMiddle == 0)
        return StringReplacement{prefix, oldMiddle, newText.mid(prefix, newMiddle), false};

    MiddleDiff diff;
    if (!myersDiff(a.constData() + prefix, oldMiddle,
                   b.constData() + prefix, newMiddle, prefix, diff)) {
        qDebug() << "StringDiffer: edit distance too large, replacing"
                 << oldMiddle << "code units at" << prefix;
        return StringReplacement{prefix, oldMiddle, newText.mid(prefix, newMiddle), false};
    }

    const bool complex = diff.removals.size() > 1 || diff.insertions.size() > 1;

    if (!diff.removals.isEmpty()) {
        const EditRun removal = diff.removals.first();
        for (const EditRun &insertion : std::as_const(diff.insertions)) {
            if (insertion.location == removal.location) {
                return StringReplacement{removal.location, removal.length,
                                         newText.mid(insertion.location, insertion.length),
                                         complex};
            }
        }
        // Plain removal; any insertion is left for the next pass
        return StringReplacement{removal.location, removal.length, QString(),
                                 complex || !diff.insertions.isEmpty()};
    }

    const EditRun insertion = diff.insertions.first();
    return StringReplacement{insertion.location, 0,
                             newText.mid(insertion.location, insertion.length), complex};
}

std::optional<QList<StringReplacement>> StringDiffer::patchSequence(const QString &oldText,
                                                                    const QString &newText,
                                                                    int maxIterations)
{
    QList<StringReplacement> patches;
    QString current = oldText;
    for (int i = 0; i < maxIterations; ++i) {
        const auto next = replacement(current, newText);
        if (!next)
            return patches;
        patches.append(*next);
        current = apply(current, *next);
        if (!next->hasMore)
            return patches;
    }

    qDebug() << "StringDiffer: no convergence after" << maxIterations << "patches";
    return std::nullopt;
}

StringReplacement StringDiffer::fullReplacement(const QString &oldText, const QString &newText)
{
    return StringReplacement{0, static_cast<int>(oldText.size()), newText, false};
}

QString StringDiffer::apply(const QString &text, const StringReplacement &replacement)
{
    QString result = text;
    result.replace(replacement.location, replacement.length, replacement.text);
    return result;
}
