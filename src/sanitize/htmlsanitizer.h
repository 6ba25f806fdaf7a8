/*
 * htmlsanitizer.h — Allow-list filter for untrusted HTML
 *
 * Keeps the formatting tags the composer engine understands and strips
 * everything else. Stripped elements keep their text, except script and
 * style whose contents are dropped. Comments, doctypes and processing
 * instructions are removed. The output is well-formed: every emitted start
 * tag is closed and <br> is emitted as a void element.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_HTMLSANITIZER_H
#define RICHCOMPOSER_HTMLSANITIZER_H

#include <QString>

class HtmlSanitizer {
public:
    HtmlSanitizer() = delete;

    static QString sanitize(const QString &html);

    static bool isAllowedTag(const QString &tag);
    static bool isAllowedAttribute(const QString &tag, const QString &attribute);
    // Rejects script-capable urls (javascript:, vbscript:, data:)
    static bool isSafeHref(const QString &href);
};

#endif // RICHCOMPOSER_HTMLSANITIZER_H
