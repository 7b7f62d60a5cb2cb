#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "SubtitleInserter";
    inline constexpr const char* AppDisplayName = "Subtitle Inserter";
    inline constexpr const char* CliName = "subtitle-inserter-cli";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "SubtitleInserter";

    inline constexpr int DefaultWindowWidth = 900;
    inline constexpr int DefaultWindowHeight = 600;

    // Encoder defaults used when neither settings nor the command line give a value
    inline constexpr int DefaultCrf = 23;
    inline constexpr const char* DefaultPreset = "veryfast";
    inline constexpr const char* DefaultFfmpegProgram = "ffmpeg";

    // CSV rows without a usable end time are shown for this long
    inline constexpr double DefaultCueDuration = 3.0;
    inline constexpr double DefaultCsvFps = 30.0;

    // Canvas the generated ASS scripts are authored against
    inline constexpr int AssPlayResX = 1920;
    inline constexpr int AssPlayResY = 1080;

    inline constexpr const char* OutputSuffix = "_sub";
    inline constexpr const char* DefaultOutputDirName = "output";
}
