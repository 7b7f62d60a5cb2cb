#pragma once

#include "SubtitleParser.h"

class SrtParser : public SubtitleParser {
public:
    QString formatName() const override { return "SRT"; }

protected:
    bool parseText(const QString& text) override;
};
