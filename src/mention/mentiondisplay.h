/*
 * mentiondisplay.h — How a mention is shown in the view
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_MENTIONDISPLAY_H
#define RICHCOMPOSER_MENTIONDISPLAY_H

#include <QString>

#include <variant>

struct PillDisplay {
    bool operator==(const PillDisplay &) const { return true; }
};

struct CustomDisplay {
    QString text;
    bool operator==(const CustomDisplay &o) const { return text == o.text; }
};

// Rendered as the run's own display text with a link anchor
struct PlainDisplay {
    bool operator==(const PlainDisplay &) const { return true; }
};

using MentionDisplay = std::variant<
    PillDisplay,
    CustomDisplay,
    PlainDisplay
>;

// Supplied by the host application. Calls may be expensive (avatar and
// member lookups); MentionDisplayCache memoizes them per session.
class MentionDisplayHandler {
public:
    virtual ~MentionDisplayHandler() = default;

    virtual MentionDisplay resolveMentionDisplay(const QString &text, const QString &url) = 0;
    virtual MentionDisplay resolveAtRoomMentionDisplay() = 0;
};

#endif // RICHCOMPOSER_MENTIONDISPLAY_H
