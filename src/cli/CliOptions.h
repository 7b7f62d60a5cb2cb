#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include "SettingsManager.h"

// Parsed command line of subtitle-inserter-cli. Unset options leave the
// corresponding setting untouched.
struct CliOptions {
    QString videoPath;
    QString subtitlePath;
    QString outputPath;
    QString configPath;         // empty = default settings file
    bool noCopy = false;
    bool verbose = false;
    bool helpRequested = false;
    bool versionRequested = false;

    std::optional<int> crf;
    std::optional<QString> preset;
    std::optional<QString> fontFamily;
    std::optional<int> fontSize;
    std::optional<QString> fontColor;
    std::optional<QString> outlineColor;
    std::optional<int> outlineWidth;
    bool bold = false;
    std::optional<bool> shadow;

    // Effective settings for this run. The base is never modified.
    AppSettings applyOverrides(const AppSettings& base) const;
};

namespace CliParser {

// arguments includes the program name, as QCoreApplication::arguments().
// On failure returns false with *error set. helpText is filled in either case.
bool parse(const QStringList& arguments, CliOptions& options,
           QString* error = nullptr, QString* helpText = nullptr);

} // namespace CliParser
