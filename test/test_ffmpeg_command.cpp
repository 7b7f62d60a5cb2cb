#include <cassert>
#include <cstdio>
#include <map>
#include "media/FfmpegCommandBuilder.h"

// Mirrors ffmpeg's av_get_token(): backslash escapes the next character,
// single quotes protect everything up to the closing quote.
static QString getToken(const QString& buf, int& pos, const QString& terminators) {
    QString out;
    while (pos < buf.size() && buf[pos].isSpace()) ++pos;
    while (pos < buf.size() && !terminators.contains(buf[pos])) {
        QChar c = buf[pos++];
        if (c == '\\' && pos < buf.size()) {
            out += buf[pos++];
        } else if (c == '\'') {
            while (pos < buf.size() && buf[pos] != '\'')
                out += buf[pos++];
            assert(pos < buf.size());   // unterminated quote
            ++pos;
        } else {
            out += c;
        }
    }
    return out;
}

struct DecodedFilter {
    QString name;
    QString filename;
    std::map<QString, QString> options;
};

// Filtergraph level first, then the filter's own option parser.
static DecodedFilter decodeFilter(const QString& expr) {
    DecodedFilter result;
    int eq = expr.indexOf('=');
    assert(eq > 0);
    result.name = expr.left(eq);

    const QString rest = expr.mid(eq + 1);
    int pos = 0;
    const QString args = getToken(rest, pos, "[],;");
    assert(pos == rest.size());

    int p = 0;
    result.filename = getToken(args, p, ":");
    while (p < args.size()) {
        assert(args[p] == ':');
        ++p;
        int keyEnd = args.indexOf('=', p);
        assert(keyEnd > p);
        QString key = args.mid(p, keyEnd - p);
        p = keyEnd + 1;
        result.options[key] = getToken(args, p, ":");
    }
    return result;
}

void test_filter_expression_plain() {
    assert(FfmpegCommandBuilder::filterExpression("/tmp/subs.srt") == "subtitles='/tmp/subs.srt'");
    printf("PASS: test_filter_expression_plain\n");
}

void test_escape_filter_path() {
    assert(FfmpegCommandBuilder::escapeFilterPath("/media/my:video/it's.srt")
           == "/media/my\\:video/it'\\\\\\''s.srt");
    printf("PASS: test_escape_filter_path\n");
}

void test_filter_expression_is_parseable() {
    const QStringList paths = {
        "/tmp/plain.srt",
        "/media/my:video/it's here.srt",
        "/data/back\\slash/x.ass",
        "/x/[weird];name,1.csv",
        "/quotes/''/a:b:c.srt",
    };

    SubtitleStyle fancy;
    fancy.family = "DejaVu Sans";
    fancy.size = 54;
    fancy.color = "#ffcc00";
    fancy.outlineColor = "#202020";
    fancy.outlineWidth = 0;
    fancy.bold = true;
    fancy.shadow = false;
    fancy.marginV = 64;
    const std::vector<SubtitleStyle> styles = {SubtitleStyle{}, fancy};

    for (const QString& path : paths) {
        DecodedFilter plain = decodeFilter(FfmpegCommandBuilder::filterExpression(path));
        assert(plain.name == "subtitles");
        assert(plain.filename == path);
        assert(plain.options.empty());

        for (const SubtitleStyle& style : styles) {
            QString error;
            assert(StyleUtil::validate(style, &error));

            DecodedFilter styled = decodeFilter(FfmpegCommandBuilder::filterExpression(path, &style));
            assert(styled.filename == path);
            assert(styled.options.size() == 1);
            assert(styled.options["force_style"] == StyleUtil::toForceStyle(style));
        }
    }
    printf("PASS: test_filter_expression_is_parseable\n");
}

void test_build_reencodes_with_filter() {
    BurnCommand cmd;
    cmd.videoPath = "in.mp4";
    cmd.subtitlePath = "subs.srt";
    cmd.outputPath = "out.mp4";

    QString error;
    QStringList args = FfmpegCommandBuilder::build(cmd, &error);
    QStringList expected = {"-y", "-i", "in.mp4", "-vf", "subtitles='subs.srt'",
                            "-c:v", "libx264", "-crf", "23", "-preset", "veryfast",
                            "-c:a", "aac", "out.mp4"};
    assert(args == expected);

    cmd.crf = 18;
    cmd.preset = "slow";
    cmd.forceStyle = true;
    args = FfmpegCommandBuilder::build(cmd, &error);
    assert(args.contains("18"));
    assert(args.contains("slow"));
    assert(args[4].startsWith("subtitles='subs.srt':force_style='FontName=Arial,"));
    printf("PASS: test_build_reencodes_with_filter\n");
}

void test_build_copy_without_filter() {
    BurnCommand cmd;
    cmd.videoPath = "in.mkv";
    cmd.outputPath = "out.mkv";
    cmd.extraOptions = {"-map", "0"};

    QStringList args = FfmpegCommandBuilder::build(cmd);
    QStringList expected = {"-y", "-i", "in.mkv", "-c:v", "copy", "-c:a", "copy",
                            "-map", "0", "out.mkv"};
    assert(args == expected);

    cmd.codecCopy = false;
    args = FfmpegCommandBuilder::build(cmd);
    assert(args.contains("libx264"));
    printf("PASS: test_build_copy_without_filter\n");
}

void test_build_requires_paths() {
    BurnCommand cmd;
    cmd.videoPath = "in.mp4";
    QString error;
    assert(FfmpegCommandBuilder::build(cmd, &error).isEmpty());
    assert(!error.isEmpty());
    printf("PASS: test_build_requires_paths\n");
}

void test_default_output_path() {
    assert(FfmpegCommandBuilder::defaultOutputPath("/videos/clip.mp4") == "/videos/clip_sub.mp4");
    assert(FfmpegCommandBuilder::defaultOutputPath("clip.mkv") == "clip_sub.mkv");
    assert(FfmpegCommandBuilder::defaultOutputPath("/v/archive.tar.mp4") == "/v/archive.tar_sub.mp4");
    assert(FfmpegCommandBuilder::defaultOutputPath("/v/noext") == "/v/noext_sub");
    assert(FfmpegCommandBuilder::defaultOutputPath("rel/dir/a b.mov") == "rel/dir/a b_sub.mov");
    assert(FfmpegCommandBuilder::defaultOutputPath("/v/.mp4") == "/v/.mp4_sub");
    assert(FfmpegCommandBuilder::defaultOutputPath("/v/.hidden.mkv") == "/v/.hidden_sub.mkv");
    assert(FfmpegCommandBuilder::defaultOutputPath("/v/trailing.") == "/v/trailing._sub");
    assert(FfmpegCommandBuilder::outputFileName("clip.mp4") == "clip_sub.mp4");
    printf("PASS: test_default_output_path\n");
}

void test_command_line_quoting() {
    assert(FfmpegCommandBuilder::commandLine("ffmpeg", {"-i", "a b.mp4"}) == "ffmpeg -i 'a b.mp4'");
    assert(FfmpegCommandBuilder::commandLine("ffmpeg", {"it's"}) == "ffmpeg 'it'\"'\"'s'");
    printf("PASS: test_command_line_quoting\n");
}

int main() {
    test_filter_expression_plain();
    test_escape_filter_path();
    test_filter_expression_is_parseable();
    test_build_reencodes_with_filter();
    test_build_copy_without_filter();
    test_build_requires_paths();
    test_default_output_path();
    test_command_line_quoting();
    printf("All ffmpeg command tests passed.\n");
    return 0;
}
