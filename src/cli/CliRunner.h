#pragma once

#include <QObject>
#include "CliOptions.h"

// Runs one burn for the command-line tool and maps the outcome to an exit code.
class CliRunner : public QObject {
    Q_OBJECT
public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitFailure = 1;   // crash or could not start
    static constexpr int ExitUsage = 2;     // bad arguments or input

    explicit CliRunner(QObject* parent = nullptr);

    // Blocks in a local event loop until the external process is done.
    // Settings are read, never written back.
    int run(const CliOptions& options);
};
