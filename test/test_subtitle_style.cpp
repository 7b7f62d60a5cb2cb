#include <cassert>
#include <cstdio>
#include "core/SubtitleStyle.h"

void test_hex_to_ass_colour() {
    assert(StyleUtil::hexToAssColour("#FF8800") == "&H000088FF");
    assert(StyleUtil::hexToAssColour("ff8800") == "&H000088FF");
    assert(StyleUtil::hexToAssColour("#ffffff") == "&H00FFFFFF");
    assert(StyleUtil::hexToAssColour("#GG0000").isEmpty());
    assert(StyleUtil::hexToAssColour("#fff").isEmpty());
    assert(!StyleUtil::isValidHexColour("red"));
    assert(StyleUtil::isValidHexColour("#00aa11"));
    printf("PASS: test_hex_to_ass_colour\n");
}

void test_validate() {
    SubtitleStyle style;
    QString error;
    assert(StyleUtil::validate(style, &error));

    SubtitleStyle badFamily;
    badFamily.family = "Ari,al";
    assert(!StyleUtil::validate(badFamily, &error));
    assert(error.contains("Font family"));

    SubtitleStyle quoted;
    quoted.family = "It's";
    assert(!StyleUtil::validate(quoted));

    SubtitleStyle badSize;
    badSize.size = 0;
    assert(!StyleUtil::validate(badSize, &error));

    SubtitleStyle badOutline;
    badOutline.outlineWidth = -1;
    assert(!StyleUtil::validate(badOutline, &error));

    SubtitleStyle badColour;
    badColour.color = "red";
    assert(!StyleUtil::validate(badColour, &error));
    assert(error.contains("red"));

    SubtitleStyle noOutline;
    noOutline.outlineWidth = 0;
    assert(StyleUtil::validate(noOutline));
    printf("PASS: test_validate\n");
}

void test_force_style() {
    SubtitleStyle style;
    assert(StyleUtil::toForceStyle(style) ==
           "FontName=Arial,FontSize=32,PrimaryColour=&H00FFFFFF,OutlineColour=&H00000000,"
           "Outline=2,Bold=0,Shadow=1,MarginV=10");

    style.family = "DejaVu Sans";
    style.size = 48;
    style.color = "#ffcc00";
    style.outlineWidth = 0;
    style.bold = true;
    style.shadow = false;
    style.marginV = 40;
    assert(StyleUtil::toForceStyle(style) ==
           "FontName=DejaVu Sans,FontSize=48,PrimaryColour=&H0000CCFF,OutlineColour=&H00000000,"
           "Outline=0,Bold=1,Shadow=0,MarginV=40");
    printf("PASS: test_force_style\n");
}

void test_json() {
    SubtitleStyle style;
    style.family = "Noto Sans";
    style.bold = true;
    style.outlineColor = "#112233";
    QJsonObject obj = StyleUtil::toJson(style);
    assert(obj["outline_color"].toString() == "#112233");
    assert(StyleUtil::fromJson(obj) == style);

    // Missing keys fall back to defaults
    QJsonObject partial;
    partial["size"] = 20;
    SubtitleStyle loaded = StyleUtil::fromJson(partial);
    assert(loaded.size == 20);
    assert(loaded.family == "Arial");
    assert(loaded.shadow);
    printf("PASS: test_json\n");
}

void test_equality_ignores_colour_case() {
    SubtitleStyle a;
    SubtitleStyle b;
    b.color = "#FFFFFF";
    assert(a == b);
    b.marginV = 11;
    assert(a != b);
    printf("PASS: test_equality_ignores_colour_case\n");
}

int main() {
    test_hex_to_ass_colour();
    test_validate();
    test_force_style();
    test_json();
    test_equality_ignores_colour_case();
    printf("All subtitle style tests passed.\n");
    return 0;
}
