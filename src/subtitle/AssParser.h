#pragma once

#include "SubtitleParser.h"

// Reads Dialogue events from ASS/SSA scripts. Override tags in the text are
// kept verbatim; libass interprets them when burning.
class AssParser : public SubtitleParser {
public:
    QString formatName() const override { return "ASS"; }

protected:
    bool parseText(const QString& text) override;
};
