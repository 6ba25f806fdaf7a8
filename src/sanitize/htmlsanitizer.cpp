/*
 * htmlsanitizer.cpp — Allow-list filter for untrusted HTML
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmlsanitizer.h"

#include <QDebug>
#include <QHash>
#include <QList>
#include <QPair>
#include <QStringList>

#include <utility>

namespace {

struct ParsedTag {
    QString name;               // lowercased
    bool closing = false;
    QList<QPair<QString, QString>> attributes;
    int end = -1;               // index just past '>'
};

bool isNameChar(QChar c)
{
    return c.isLetterOrNumber() || c == QLatin1Char('-') || c == QLatin1Char('_')
        || c == QLatin1Char(':');
}

// Parses a tag starting at html[pos] == '<'. Returns false when there is no
// tag name or no closing '>'.
bool parseTag(const QString &html, int pos, ParsedTag &tag)
{
    const int n = html.size();
    int i = pos + 1;
    if (i < n && html.at(i) == QLatin1Char('/')) {
        tag.closing = true;
        ++i;
    }

    const int nameStart = i;
    while (i < n && html.at(i).isLetterOrNumber())
        ++i;
    if (i == nameStart)
        return false;
    tag.name = html.mid(nameStart, i - nameStart).toLower();

    while (i < n) {
        const QChar c = html.at(i);
        if (c == QLatin1Char('>')) {
            tag.end = i + 1;
            return true;
        }
        if (c.isSpace() || c == QLatin1Char('/')) {
            ++i;
            continue;
        }

        const int attrStart = i;
        while (i < n && isNameChar(html.at(i)))
            ++i;
        if (i == attrStart) {
            ++i;    // junk such as a stray quote
            continue;
        }
        const QString attrName = html.mid(attrStart, i - attrStart).toLower();

        while (i < n && html.at(i).isSpace())
            ++i;
        QString value;
        if (i < n && html.at(i) == QLatin1Char('=')) {
            ++i;
            while (i < n && html.at(i).isSpace())
                ++i;
            if (i < n && (html.at(i) == QLatin1Char('"') || html.at(i) == QLatin1Char('\''))) {
                const QChar quote = html.at(i);
                const int close = html.indexOf(quote, i + 1);
                if (close < 0)
                    return false;
                value = html.mid(i + 1, close - i - 1);
                i = close + 1;
            } else {
                const int valueStart = i;
                while (i < n && !html.at(i).isSpace() && html.at(i) != QLatin1Char('>'))
                    ++i;
                value = html.mid(valueStart, i - valueStart);
            }
        }
        tag.attributes.append({attrName, value});
    }
    return false;
}

bool isHexDigit(QChar c)
{
    return c.isDigit() || (c >= QLatin1Char('a') && c <= QLatin1Char('f'))
        || (c >= QLatin1Char('A') && c <= QLatin1Char('F'));
}

// Decodes numeric references and the named ones that can spell a url
// scheme. The trailing ';' is optional, as it is for HTML consumers.
QString decodeCharacterReferences(const QString &value)
{
    static const QHash<QString, QChar> named = {
        {QStringLiteral("amp"), QLatin1Char('&')},
        {QStringLiteral("lt"), QLatin1Char('<')},
        {QStringLiteral("gt"), QLatin1Char('>')},
        {QStringLiteral("quot"), QLatin1Char('"')},
        {QStringLiteral("apos"), QLatin1Char('\'')},
        {QStringLiteral("colon"), QLatin1Char(':')},
        {QStringLiteral("sol"), QLatin1Char('/')},
        {QStringLiteral("period"), QLatin1Char('.')},
        {QStringLiteral("Tab"), QLatin1Char('\t')},
        {QStringLiteral("NewLine"), QLatin1Char('\n')},
        {QStringLiteral("nbsp"), QChar(0x00A0)},
    };

    QString out;
    out.reserve(value.size());
    const int n = value.size();
    int i = 0;
    while (i < n) {
        if (value.at(i) != QLatin1Char('&')) {
            out.append(value.at(i++));
            continue;
        }

        int j = i + 1;
        if (j < n && value.at(j) == QLatin1Char('#')) {
            ++j;
            const bool hex = j < n && (value.at(j) == QLatin1Char('x') || value.at(j) == QLatin1Char('X'));
            if (hex)
                ++j;
            const int digitsStart = j;
            while (j < n && (hex ? isHexDigit(value.at(j)) : value.at(j).isDigit()))
                ++j;
            if (j > digitsStart) {
                bool ok = false;
                char32_t codePoint = value.mid(digitsStart, j - digitsStart).toUInt(&ok, hex ? 16 : 10);
                if (!ok || codePoint == 0 || codePoint > 0x10FFFF
                    || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
                    codePoint = 0xFFFD;
                }
                out.append(QString::fromUcs4(&codePoint, 1));
                if (j < n && value.at(j) == QLatin1Char(';'))
                    ++j;
                i = j;
                continue;
            }
        } else {
            while (j < n && value.at(j).isLetterOrNumber())
                ++j;
            const auto it = named.constFind(value.mid(i + 1, j - i - 1));
            if (it != named.cend()) {
                out.append(*it);
                if (j < n && value.at(j) == QLatin1Char(';'))
                    ++j;
                i = j;
                continue;
            }
        }
        out.append(value.at(i++));
    }
    return out;
}

// Expects a decoded value
QString escapeAttribute(const QString &value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('&'), QLatin1String("&amp;"));
    escaped.replace(QLatin1Char('"'), QLatin1String("&quot;"));
    escaped.replace(QLatin1Char('<'), QLatin1String("&lt;"));
    escaped.replace(QLatin1Char('>'), QLatin1String("&gt;"));
    return escaped;
}

} // anonymous namespace

bool HtmlSanitizer::isAllowedTag(const QString &tag)
{
    static const QStringList allowed = {
        QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("strong"),
        QStringLiteral("i"), QStringLiteral("em"), QStringLiteral("u"),
        QStringLiteral("del"), QStringLiteral("code"), QStringLiteral("ul"),
        QStringLiteral("ol"), QStringLiteral("li"), QStringLiteral("pre"),
        QStringLiteral("blockquote"), QStringLiteral("p"), QStringLiteral("br"),
    };
    return allowed.contains(tag);
}

bool HtmlSanitizer::isAllowedAttribute(const QString &tag, const QString &attribute)
{
    if (tag == QLatin1String("a")) {
        return attribute == QLatin1String("href")
            || attribute == QLatin1String("data-mention-type")
            || attribute == QLatin1String("contenteditable");
    }
    if (tag == QLatin1String("ol"))
        return attribute == QLatin1String("start");
    return false;
}

bool HtmlSanitizer::isSafeHref(const QString &href)
{
    // Browsers ignore whitespace and control characters inside the scheme
    const QString decoded = decodeCharacterReferences(href);
    QString compact;
    compact.reserve(decoded.size());
    for (const QChar c : decoded) {
        if (!c.isSpace() && c.category() != QChar::Other_Control)
            compact.append(c.toLower());
    }
    return !compact.startsWith(QLatin1String("javascript:"))
        && !compact.startsWith(QLatin1String("vbscript:"))
        && !compact.startsWith(QLatin1String("data:"));
}

QString HtmlSanitizer::sanitize(const QString &html)
{
    QString out;
    out.reserve(html.size());
    QStringList open;
    const int n = html.size();
    int i = 0;

    while (i < n) {
        const QChar c = html.at(i);
        if (c != QLatin1Char('<')) {
            out.append(c);
            ++i;
            continue;
        }

        // Comments, doctypes, processing instructions
        if (html.mid(i, 4) == QLatin1String("<!--")) {
            const int close = html.indexOf(QLatin1String("-->"), i + 4);
            i = close < 0 ? n : close + 3;
            continue;
        }
        if (i + 1 < n && (html.at(i + 1) == QLatin1Char('!') || html.at(i + 1) == QLatin1Char('?'))) {
            const int close = html.indexOf(QLatin1Char('>'), i + 2);
            i = close < 0 ? n : close + 1;
            continue;
        }

        ParsedTag tag;
        if (!parseTag(html, i, tag)) {
            out.append(QLatin1String("&lt;"));
            ++i;
            continue;
        }
        i = tag.end;

        if (!tag.closing && (tag.name == QLatin1String("script")
                             || tag.name == QLatin1String("style"))) {
            const QString closeTag = QLatin1String("</") + tag.name;
            const int close = html.indexOf(closeTag, i, Qt::CaseInsensitive);
            if (close < 0) {
                i = n;
            } else {
                const int gt = html.indexOf(QLatin1Char('>'), close);
                i = gt < 0 ? n : gt + 1;
            }
            continue;
        }

        if (!isAllowedTag(tag.name))
            continue;

        if (tag.name == QLatin1String("br")) {
            if (!tag.closing)
                out.append(QLatin1String("<br>"));
            continue;
        }

        if (tag.closing) {
            const int index = open.lastIndexOf(tag.name);
            if (index < 0)
                continue;   // nothing to close
            while (open.size() > index)
                out.append(QLatin1String("</") + open.takeLast() + QLatin1Char('>'));
            continue;
        }

        out.append(QStringLiteral("<") + tag.name);
        for (const auto &attribute : std::as_const(tag.attributes)) {
            if (!isAllowedAttribute(tag.name, attribute.first))
                continue;
            // Checked and emitted decoded, so consumers see what was checked
            const QString value = decodeCharacterReferences(attribute.second);
            if (attribute.first == QLatin1String("href") && !isSafeHref(value)) {
                qDebug() << "HtmlSanitizer: dropping unsafe href";
                continue;
            }
            if (attribute.first == QLatin1String("start")) {
                bool ok = false;
                value.trimmed().toInt(&ok);
                if (!ok)
                    continue;
            }
            out.append(QStringLiteral(" ") + attribute.first + QLatin1String("=\"")
                       + escapeAttribute(value) + QLatin1Char('"'));
        }
        out.append(QLatin1Char('>'));
        open.append(tag.name);
    }

    while (!open.isEmpty())
        out.append(QLatin1String("</") + open.takeLast() + QLatin1Char('>'));
    return out;
}
