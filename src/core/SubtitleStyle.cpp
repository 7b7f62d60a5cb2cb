#include "SubtitleStyle.h"
#include "Logger.h"

#include <QRegularExpression>
#include <QStringList>

bool SubtitleStyle::operator==(const SubtitleStyle& other) const {
    return family == other.family
        && size == other.size
        && color.compare(other.color, Qt::CaseInsensitive) == 0
        && outlineColor.compare(other.outlineColor, Qt::CaseInsensitive) == 0
        && outlineWidth == other.outlineWidth
        && bold == other.bold
        && shadow == other.shadow
        && marginV == other.marginV;
}

namespace StyleUtil {

bool isValidHexColour(const QString& hex) {
    static const QRegularExpression re("^#?[0-9A-Fa-f]{6}$");
    return re.match(hex.trimmed()).hasMatch();
}

QString hexToAssColour(const QString& hex) {
    if (!isValidHexColour(hex)) return QString();

    QString c = hex.trimmed();
    if (c.startsWith('#')) c = c.mid(1);
    c = c.toUpper();
    // ASS colours are &HAABBGGRR; alpha 00 is opaque
    return QString("&H00%1%2%3").arg(c.mid(4, 2), c.mid(2, 2), c.mid(0, 2));
}

bool validate(const SubtitleStyle& style, QString* error) {
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    if (style.family.trimmed().isEmpty())
        return fail("Font family must not be empty");

    // These characters cannot be carried through the filter/force_style syntax
    static const QRegularExpression forbidden(R"([',:\\])");
    if (style.family.contains(forbidden))
        return fail(QString("Font family contains an unsupported character: %1").arg(style.family));

    if (style.size <= 0)
        return fail(QString("Font size must be positive: %1").arg(style.size));
    if (style.outlineWidth < 0)
        return fail(QString("Outline width must not be negative: %1").arg(style.outlineWidth));
    if (style.marginV < 0)
        return fail(QString("Vertical margin must not be negative: %1").arg(style.marginV));
    if (!isValidHexColour(style.color))
        return fail(QString("Invalid font colour (expected #RRGGBB): %1").arg(style.color));
    if (!isValidHexColour(style.outlineColor))
        return fail(QString("Invalid outline colour (expected #RRGGBB): %1").arg(style.outlineColor));

    return true;
}

QString toForceStyle(const SubtitleStyle& style) {
    QStringList parts;
    if (!style.family.isEmpty())
        parts << QString("FontName=%1").arg(style.family);
    if (style.size > 0)
        parts << QString("FontSize=%1").arg(style.size);

    QString primary = hexToAssColour(style.color);
    if (!primary.isEmpty())
        parts << QString("PrimaryColour=%1").arg(primary);
    else
        qCWarning(lcSubtitle) << "Ignoring malformed font colour" << style.color;

    QString outline = hexToAssColour(style.outlineColor);
    if (!outline.isEmpty())
        parts << QString("OutlineColour=%1").arg(outline);
    else
        qCWarning(lcSubtitle) << "Ignoring malformed outline colour" << style.outlineColor;

    parts << QString("Outline=%1").arg(qMax(0, style.outlineWidth));
    parts << QString("Bold=%1").arg(style.bold ? 1 : 0);
    parts << QString("Shadow=%1").arg(style.shadow ? 1 : 0);
    parts << QString("MarginV=%1").arg(qMax(0, style.marginV));

    return parts.join(',');
}

QJsonObject toJson(const SubtitleStyle& style) {
    QJsonObject obj;
    obj["family"] = style.family;
    obj["size"] = style.size;
    obj["color"] = style.color;
    obj["outline_color"] = style.outlineColor;
    obj["outline_width"] = style.outlineWidth;
    obj["bold"] = style.bold;
    obj["shadow"] = style.shadow;
    obj["margin_v"] = style.marginV;
    return obj;
}

SubtitleStyle fromJson(const QJsonObject& obj) {
    SubtitleStyle defaults;
    SubtitleStyle style;
    style.family = obj["family"].toString(defaults.family);
    style.size = obj["size"].toInt(defaults.size);
    style.color = obj["color"].toString(defaults.color);
    style.outlineColor = obj["outline_color"].toString(defaults.outlineColor);
    style.outlineWidth = obj["outline_width"].toInt(defaults.outlineWidth);
    style.bold = obj["bold"].toBool(defaults.bold);
    style.shadow = obj["shadow"].toBool(defaults.shadow);
    style.marginV = obj["margin_v"].toInt(defaults.marginV);
    return style;
}

} // namespace StyleUtil
