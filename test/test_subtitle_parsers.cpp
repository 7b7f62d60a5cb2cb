#include <cassert>
#include <cstdio>
#include <cmath>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "subtitle/AssParser.h"
#include "subtitle/AssWriter.h"
#include "subtitle/CsvParser.h"
#include "subtitle/SrtParser.h"
#include "subtitle/SubtitleParserFactory.h"

static QTemporaryDir* g_dir = nullptr;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

static QString writeFile(const QString& name, const QByteArray& data) {
    QString path = g_dir->filePath(name);
    QFile file(path);
    bool ok = file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    assert(ok);
    file.write(data);
    file.close();
    return path;
}

void test_srt_basic() {
    QString path = writeFile("basic.srt",
        "\xEF\xBB\xBF" "1\r\n00:00:01,000 --> 00:00:02,500\r\nHello\r\nWorld\r\n\r\n"
        "2\r\n00:00:03,000 --> 00:00:04,000\r\nSecond\r\n");

    SrtParser parser;
    assert(parser.parse(path));
    assert(parser.lines().size() == 2);
    assert(near(parser.lines()[0].start, 1.0));
    assert(near(parser.lines()[0].end, 2.5));
    assert(parser.lines()[0].text == "Hello\\NWorld");
    assert(parser.lines()[1].text == "Second");
    printf("PASS: test_srt_basic\n");
}

void test_srt_without_indices() {
    QString path = writeFile("noindex.srt",
        "00:00:01.000 --> 00:00:02.000\nOne\n\n\n00:00:05,250 --> 00:00:06,000\nTwo\n");

    SrtParser parser;
    assert(parser.parse(path));
    assert(parser.lines().size() == 2);
    assert(near(parser.lines()[1].start, 5.25));
    printf("PASS: test_srt_without_indices\n");
}

void test_srt_latin1_fallback() {
    QString path = writeFile("latin1.srt", "1\n00:00:01,000 --> 00:00:02,000\nCaf\xe9\n");

    SrtParser parser;
    assert(parser.parse(path));
    assert(parser.lines()[0].text == QString::fromUtf8("Caf\xc3\xa9"));
    printf("PASS: test_srt_latin1_fallback\n");
}

void test_srt_errors() {
    QString arrow = writeFile("bad.srt", "1\n00:00:01,000 -> 00:00:02,000\nHi\n");
    SrtParser parser;
    assert(!parser.parse(arrow));
    assert(parser.errorString().startsWith("bad.srt: line 2"));
    assert(parser.lines().empty());

    QString stamp = writeFile("stamp.srt", "1\n00:00:xx,000 --> 00:00:02,000\nHi\n");
    assert(!parser.parse(stamp));
    assert(parser.errorString().contains("malformed timestamp"));

    QString backwards = writeFile("backwards.srt", "1\n00:00:05,000 --> 00:00:02,000\nHi\n");
    assert(!parser.parse(backwards));
    assert(parser.errorString().contains("ends before it starts"));

    assert(!parser.parse(g_dir->filePath("missing.srt")));
    assert(parser.errorString().startsWith("File not found"));
    printf("PASS: test_srt_errors\n");
}

void test_ass_events() {
    QString path = writeFile("events.ass",
        "[Script Info]\nTitle: test\n\n[V4+ Styles]\nFormat: Name, Fontname\nStyle: Default,Arial\n\n"
        "[Events]\n"
        "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n"
        "Comment: 0,0:00:00.00,0:00:01.00,Default,,0,0,0,,ignored\n"
        "Dialogue: 0,0:00:01.00,0:00:02.50,Default,,0,0,0,,Hello, world\n"
        "Dialogue: 0,0:01:00.10,0:01:02.00,Default,,0,0,0,,{\\i1}Two\\Nlines\n");

    AssParser parser;
    assert(parser.parse(path));
    assert(parser.lines().size() == 2);
    assert(parser.lines()[0].text == "Hello, world");
    assert(near(parser.lines()[0].end, 2.5));
    assert(near(parser.lines()[1].start, 60.1));
    assert(parser.lines()[1].plainText() == "Two\nlines");
    printf("PASS: test_ass_events\n");
}

void test_ass_custom_format() {
    QString path = writeFile("custom.ssa",
        "[Events]\nFormat: Start, End, Text\nDialogue: 0:00:03.00,0:00:04.00,Short form\n");

    AssParser parser;
    assert(parser.parse(path));
    assert(parser.lines().size() == 1);
    assert(near(parser.lines()[0].start, 3.0));
    assert(parser.lines()[0].text == "Short form");
    printf("PASS: test_ass_custom_format\n");
}

void test_ass_errors() {
    AssParser parser;
    QString noEvents = writeFile("noevents.ass", "[Script Info]\nTitle: x\n");
    assert(!parser.parse(noEvents));
    assert(parser.errorString().contains("no [Events] section"));

    QString badTime = writeFile("badtime.ass",
        "[Events]\nDialogue: 0,0:00:xx.00,0:00:02.00,Default,,0,0,0,,Hi\n");
    assert(!parser.parse(badTime));
    assert(parser.errorString().contains("line 2"));
    printf("PASS: test_ass_errors\n");
}

void test_csv_named_columns() {
    QString path = writeFile("cues.csv",
        "start_time,end_time,text\n"
        "1.5,3,\"Hello, \"\"world\"\"\"\n"
        "\n"
        "4,,Second\n"
        "  \n"
        ",,\n"
        "6,5,\"Multi\nline\"\n"
        " , ,\n");

    auto parser = SubtitleParserFactory::createForFile(path);
    assert(parser);
    assert(parser->formatName() == "CSV");
    assert(parser->parse(path));
    const SubtitleLines& lines = parser->lines();
    assert(lines.size() == 3);
    assert(lines[0].text == "Hello, \"world\"");
    assert(near(lines[0].start, 1.5));
    assert(near(lines[0].end, 3.0));
    assert(near(lines[1].end, 7.0));     // no end time
    assert(near(lines[2].end, 9.0));     // end before start
    assert(lines[2].text == "Multi\\Nline");
    printf("PASS: test_csv_named_columns\n");
}

void test_csv_frames_mapping() {
    QString path = writeFile("frames.csv", "frame,speaker,caption\n50,A,Hi\n100,B,There\n");

    CsvMapping mapping;
    mapping.startColumn = "frame";
    mapping.textColumn = "caption";
    mapping.timeUnit = CsvTimeUnit::Frames;
    mapping.fps = 25.0;

    CsvParser parser(mapping);
    assert(parser.parse(path));
    assert(parser.lines().size() == 2);
    assert(near(parser.lines()[0].start, 2.0));
    assert(near(parser.lines()[0].end, 5.0));
    assert(parser.lines()[1].text == "There");
    printf("PASS: test_csv_frames_mapping\n");
}

void test_csv_errors() {
    QString path = writeFile("badnum.csv", "start_time,end_time,text\nabc,2,Hi\n");
    CsvParser parser(CsvParser::guessMapping({"start_time", "end_time", "text"}));
    assert(!parser.parse(path));
    assert(parser.errorString().contains("row 2"));
    assert(parser.errorString().contains("not a number"));

    CsvMapping missing;
    missing.startColumn = "begin";
    parser.setMapping(missing);
    assert(!parser.parse(path));
    assert(parser.errorString().contains("begin"));

    // Non-finite times are not numbers
    const char* nonFinite[] = {"inf", "nan", "-inf", "Infinity"};
    for (const char* value : nonFinite) {
        QString name = QString("nonfinite_%1.csv").arg(QString(value).remove('-'));
        QString bad = writeFile(name, QByteArray("start_time,end_time,text\n1,2,ok\n")
                                           + value + ",2,Hi\n");
        parser.setMapping(CsvParser::guessMapping({"start_time", "end_time", "text"}));
        assert(!parser.parse(bad));
        assert(parser.errorString().contains("row 3"));
        assert(parser.errorString().contains("not a number"));
    }

    // A non-finite end falls back to the default cue length
    QString badEnd = writeFile("infend.csv", "start_time,end_time,text\n1,inf,Hi\n");
    assert(parser.parse(badEnd));
    assert(parser.lines().size() == 1);
    assert(near(parser.lines()[0].end, 4.0));
    printf("PASS: test_csv_errors\n");
}

void test_csv_helpers() {
    CsvMapping guessed = CsvParser::guessMapping({"foo", "bar", "baz"});
    assert(guessed.startColumn == "0");
    assert(guessed.endColumn == "1");
    assert(guessed.textColumn == "2");

    QStringList header = {"start_time", "text", "3"};
    assert(CsvParser::resolveColumn(header, "text") == 1);
    assert(CsvParser::resolveColumn(header, "0") == 0);
    assert(CsvParser::resolveColumn(header, "3") == 2);   // names win over indices
    assert(CsvParser::resolveColumn(header, "9") == -1);
    assert(CsvParser::resolveColumn(header, "") == -1);

    auto records = CsvParser::splitRecords("a,b\r\n\r\n\"x\"\"y\",\n");
    assert(records.size() == 2);
    assert(records[1].size() == 2);
    assert(records[1][0] == "x\"y");
    assert(records[1][1].isEmpty());

    assert(CsvParser::isBlankRecord({"", " ", "\t"}));
    assert(!CsvParser::isBlankRecord({"", "x"}));

    QString path = writeFile("header.csv", "start_time, text \n1,a\n");
    QStringList read = CsvParser::readHeader(path);
    assert(read.size() == 2 && read[1] == "text");
    printf("PASS: test_csv_helpers\n");
}

void test_factory() {
    assert(SubtitleParserFactory::formatForPath("/x/a.SRT") == SubtitleFormat::Srt);
    assert(SubtitleParserFactory::formatForPath("a.ssa") == SubtitleFormat::Ass);
    assert(SubtitleParserFactory::formatForPath("a.csv") == SubtitleFormat::Csv);
    assert(SubtitleParserFactory::formatForPath("a.txt") == SubtitleFormat::Unknown);
    assert(!SubtitleParserFactory::isSubtitleFile("movie.mp4"));
    assert(SubtitleParserFactory::create(SubtitleFormat::Unknown) == nullptr);
    assert(SubtitleParserFactory::create(SubtitleFormat::Ass)->formatName() == "ASS");
    printf("PASS: test_factory\n");
}

void test_ass_writer() {
    SubtitleLines lines;
    lines.push_back({1.0, 2.5, "Hi"});
    lines.push_back({3.0, 4.0, "Line one\\Nline two"});

    QString script = AssWriter::render(lines, SubtitleStyle{});
    assert(script.contains("PlayResY: 1080"));
    assert(script.contains("Style: Default,Arial,32,&H00FFFFFF,&H000000FF,&H00000000,&H64000000,"
                           "0,0,0,0,100,100,0,0,1,2,3,2,10,10,10,1"));
    assert(script.contains("Dialogue: 0,0:00:01.00,0:00:02.50,Default,,0,0,0,,Hi"));

    QString path = g_dir->filePath("written.ass");
    QString error;
    assert(AssWriter::write(path, lines, SubtitleStyle{}, &error));

    AssParser parser;
    assert(parser.parse(path));
    assert(parser.lines().size() == 2);
    assert(parser.lines()[1].text == "Line one\\Nline two");

    assert(!AssWriter::write(g_dir->filePath("no/such/dir/x.ass"), lines, SubtitleStyle{}, &error));
    assert(error.startsWith("Cannot write"));
    printf("PASS: test_ass_writer\n");
}

void test_shifted() {
    SubtitleLines lines;
    lines.push_back({1.0, 2.0, "early"});
    lines.push_back({5.0, 6.0, "late"});

    SubtitleLines later = AssWriter::shifted(lines, 1.5);
    assert(later.size() == 2);
    assert(near(later[0].start, 2.5));

    SubtitleLines earlier = AssWriter::shifted(lines, -3.0);
    assert(earlier.size() == 1);
    assert(earlier[0].text == "late");
    assert(near(earlier[0].start, 2.0));

    SubtitleLines clamped = AssWriter::shifted(lines, -5.5);
    assert(clamped.size() == 1);
    assert(near(clamped[0].start, 0.0));
    assert(near(clamped[0].end, 0.5));
    printf("PASS: test_shifted\n");
}

int main() {
    QTemporaryDir dir;
    assert(dir.isValid());
    g_dir = &dir;

    test_srt_basic();
    test_srt_without_indices();
    test_srt_latin1_fallback();
    test_srt_errors();
    test_ass_events();
    test_ass_custom_format();
    test_ass_errors();
    test_csv_named_columns();
    test_csv_frames_mapping();
    test_csv_errors();
    test_csv_helpers();
    test_factory();
    test_ass_writer();
    test_shifted();
    printf("All subtitle parser tests passed.\n");
    return 0;
}
