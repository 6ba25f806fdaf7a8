/*
 * projectionmodel.cpp — Projection invariant checks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "projectionmodel.h"

namespace Projection {

static constexpr QChar kLineSeparator(0x2028);

QString runText(const InlineRun &run)
{
    return std::visit([](const auto &k) -> QString {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, TextRun>)
            return k.text;
        else if constexpr (std::is_same_v<T, MentionRun>)
            return k.displayText;
        else
            return QString(kLineSeparator);
    }, run.kind);
}

std::optional<ValidationError> validate(const QList<BlockProjection> &blocks)
{
    int previousEnd = -1;
    for (int b = 0; b < blocks.size(); ++b) {
        const BlockProjection &block = blocks[b];
        if (block.endUtf16 < block.startUtf16)
            return ValidationError{b, -1, QStringLiteral("block range is inverted")};
        if (block.startUtf16 < previousEnd)
            return ValidationError{b, -1, QStringLiteral("block overlaps its predecessor")};
        if (previousEnd >= 0 && block.startUtf16 - previousEnd > 1)
            return ValidationError{b, -1, QStringLiteral("gap of more than one separator before block")};
        if (block.kind.isList() && block.kind.depth < 1)
            return ValidationError{b, -1, QStringLiteral("list depth must be at least 1")};

        int cursor = block.startUtf16;
        for (int r = 0; r < block.inlineRuns.size(); ++r) {
            const InlineRun &run = block.inlineRuns[r];
            if (run.startUtf16 != cursor)
                return ValidationError{b, r, QStringLiteral("run is not contiguous with the previous run")};
            if (run.endUtf16 <= run.startUtf16)
                return ValidationError{b, r, QStringLiteral("run is empty or inverted")};
            if (const auto *text = std::get_if<TextRun>(&run.kind)) {
                if (text->text.size() != run.length())
                    return ValidationError{b, r, QStringLiteral("text length does not match run range")};
            } else if (std::holds_alternative<LineBreakRun>(run.kind) && run.length() != 1) {
                return ValidationError{b, r, QStringLiteral("line break must span one code unit")};
            }
            cursor = run.endUtf16;
        }
        if (cursor != block.endUtf16)
            return ValidationError{b, -1, QStringLiteral("runs do not cover the block range")};

        previousEnd = block.endUtf16;
    }
    return std::nullopt;
}

} // namespace Projection
