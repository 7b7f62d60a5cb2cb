#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include "media/JobRunner.h"

struct RunResult {
    int finishedCount = 0;
    bool success = false;
    int exitCode = 0;
    QString message;
    std::vector<double> progress;
    QStringList lines;
};

// Runs until finished() or a 15 s safety timeout.
static RunResult runToCompletion(JobRunner& runner, const QString& program,
                                 const QStringList& args, double duration = 0.0,
                                 int stopAfterMs = -1) {
    RunResult result;
    QEventLoop loop;

    QObject::connect(&runner, &JobRunner::progressChanged, &loop,
                     [&result](double f) { result.progress.push_back(f); });
    QObject::connect(&runner, &JobRunner::outputLine, &loop,
                     [&result](const QString& line) { result.lines << line; });
    QObject::connect(&runner, &JobRunner::finished, &loop,
                     [&](bool success, int code, const QString& message) {
        ++result.finishedCount;
        result.success = success;
        result.exitCode = code;
        result.message = message;
        loop.quit();
    });

    QTimer::singleShot(15000, &loop, &QEventLoop::quit);
    if (stopAfterMs >= 0)
        QTimer::singleShot(stopAfterMs, &runner, &JobRunner::stop);

    bool started = runner.start(program, args, duration);
    assert(started);
    if (result.finishedCount == 0)
        loop.exec();

    // Let any stray duplicate emission surface
    QCoreApplication::processEvents();
    return result;
}

void test_success_reports_progress() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/bin/sh", {"-c",
        "echo '  Duration: 00:00:10.00, start: 0.000000, bitrate: 1 kb/s' >&2;"
        "printf 'frame=  1 fps=0.0 time=00:00:05.00 bitrate=N/A\\r' >&2;"
        "exit 0"});

    assert(r.finishedCount == 1);
    assert(r.success);
    assert(r.exitCode == 0);
    assert(!r.progress.empty());
    assert(std::fabs(r.progress.front() - 0.5) < 1e-9);
    assert(r.progress.back() == 1.0);
    assert(r.lines.size() == 2);
    assert(!runner.isRunning());
    printf("PASS: test_success_reports_progress\n");
}

void test_known_duration_wins() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/bin/sh", {"-c",
        "echo 'Duration: 00:00:10.00' >&2; echo 'time=00:00:01.00' >&2"}, 4.0);
    assert(r.success);
    assert(std::fabs(r.progress.front() - 0.25) < 1e-9);
    printf("PASS: test_known_duration_wins\n");
}

void test_failure_surfaces_error_text() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/bin/sh", {"-c",
        "echo 'frame=  1 time=00:00:01.00' >&2;"
        "echo 'in.mp4: Invalid data found when processing input' >&2; exit 3"});

    assert(r.finishedCount == 1);
    assert(!r.success);
    assert(r.exitCode == 3);
    assert(r.message.startsWith("sh exited with code 3"));
    assert(r.message.contains("Invalid data found when processing input"));
    assert(!r.message.contains("frame="));
    assert(runner.recentErrorLines().size() == 1);
    printf("PASS: test_failure_surfaces_error_text\n");
}

void test_error_tail_is_bounded() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/bin/sh", {"-c",
        "i=0; while [ $i -lt 50 ]; do echo \"line $i\" >&2; i=$((i+1)); done; exit 1"});
    assert(!r.success);
    assert(r.lines.size() == 50);
    assert(runner.recentErrorLines().size() == 20);
    assert(runner.recentErrorLines().constLast() == "line 49");
    assert(!r.message.contains("line 29\n"));
    printf("PASS: test_error_tail_is_bounded\n");
}

void test_failed_to_start() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/nonexistent/dir/ffmpeg", {"-version"});
    assert(r.finishedCount == 1);
    assert(!r.success);
    assert(r.exitCode == -1);
    assert(r.message.startsWith("Failed to start"));
    printf("PASS: test_failed_to_start\n");
}

void test_stop() {
    JobRunner runner;
    RunResult r = runToCompletion(runner, "/bin/sh", {"-c", "exec sleep 30"}, 0.0, 200);
    assert(r.finishedCount == 1);
    assert(!r.success);
    assert(r.message.contains("stopped"));
    assert(!runner.isRunning());
    printf("PASS: test_stop\n");
}

void test_parse_lines() {
    assert(std::fabs(JobRunner::parseDurationLine(
        "  Duration: 00:01:40.00, start: 0.000000, bitrate: 1 kb/s") - 100.0) < 1e-9);
    assert(JobRunner::parseDurationLine("Duration: N/A, bitrate: N/A") < 0);
    assert(std::fabs(JobRunner::parseProgressLine(
        "frame=   10 fps=0.0 q=-0.0 size=0kB time=00:00:50.00 bitrate=N/A") - 50.0) < 1e-9);
    assert(JobRunner::parseProgressLine("size=N/A time=N/A bitrate=N/A") < 0);
    assert(JobRunner::parseProgressLine("Stream mapping:") < 0);
    printf("PASS: test_parse_lines\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_parse_lines();
    test_success_reports_progress();
    test_known_duration_wins();
    test_failure_surfaces_error_text();
    test_error_tail_is_bounded();
    test_failed_to_start();
    test_stop();
    printf("All job runner tests passed.\n");
    return 0;
}
