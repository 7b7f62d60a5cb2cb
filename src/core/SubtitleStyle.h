#pragma once

#include <QString>
#include <QJsonObject>

struct SubtitleStyle {
    QString family = "Arial";
    int size = 32;                  // px
    QString color = "#ffffff";      // primary text colour, #RRGGBB
    QString outlineColor = "#000000";
    int outlineWidth = 2;           // px, 0 disables the outline
    bool bold = false;
    bool shadow = true;
    int marginV = 10;               // bottom margin, px

    bool operator==(const SubtitleStyle& other) const;
    bool operator!=(const SubtitleStyle& other) const { return !(*this == other); }
};

namespace StyleUtil {

// "#RRGGBB" or "RRGGBB" -> "&H00BBGGRR". Empty string if malformed.
QString hexToAssColour(const QString& hex);
bool isValidHexColour(const QString& hex);

bool validate(const SubtitleStyle& style, QString* error = nullptr);

// libass force_style value for the subtitles filter
QString toForceStyle(const SubtitleStyle& style);

QJsonObject toJson(const SubtitleStyle& style);
SubtitleStyle fromJson(const QJsonObject& obj);

} // namespace StyleUtil
