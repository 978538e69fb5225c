#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>
#include "TestHelpers.hpp"
#include "core/Config.hpp"
#include "formats/JsonCodec.hpp"
#include "util/FileUtils.hpp"

using namespace pa;
using pa::test::why;

class TestJsonCodec : public QObject {
    Q_OBJECT

private:
    formats::JsonCodec codec_;

private slots:
    void cleanup() {
        CONFIG.reset();
    }

    void testParseAsset() {
        auto text = file::readText(pa::test::assetPath("test.json"));
        QVERIFY2(text.isOk(), why(text));

        auto words = codec_.parse(*text);
        QVERIFY2(words.isOk(), why(words));
        QCOMPARE(words->size(), usize{6});

        // Entries without "alignedWord" are silence spanning start..end
        const auto& first = words->front();
        QVERIFY(first.isSilence());
        QCOMPARE(first.size(), usize{1});
        QVERIFY(first[0] == Phoneme("sp", 0.0, 0.27));

        QCOMPARE((*words)[2].label(), std::string("MOUSE"));
        QVERIFY((*words)[2][1] == Phoneme("AW1", 0.52, 0.75));
        QVERIFY((*words)[3].isSilence());

        auto alignment = Alignment::fromWords(std::move(words).value());
        QVERIFY(alignment.isOk());
        QVERIFY(alignment->approxEquals(pa::test::sampleAlignment(), 1e-12));
    }

    void testSyntaxErrorReportsLine() {
        auto words = codec_.parse("{\n  \"words\": [\n    {,}\n  ]\n}\n");
        QVERIFY(words.isErr());
        QVERIFY(words.code() == ErrorCode::Format);
        QVERIFY2(words.error().message.find("line 3") != std::string::npos,
                 why(words));
    }

    void testRejectsNonObjectRoot() {
        auto words = codec_.parse("[1, 2, 3]");
        QVERIFY(words.code() == ErrorCode::Format);
    }

    void testMissingWords() {
        auto words = codec_.parse(R"({"segments": []})");
        QVERIFY(words.code() == ErrorCode::Format);
        QVERIFY(words.error().message.find("words") != std::string::npos);
    }

    void testBadPhonemeTriple() {
        auto words = codec_.parse(R"({"words": [
            {"alignedWord": "HI", "start": 0, "end": 0.2,
             "phonemes": [["HH", 0, 0.1], ["AY", 0.1]]}
        ]})");
        QVERIFY(words.isErr());
        QVERIFY(words.code() == ErrorCode::Format);
        QVERIFY2(words.error().message.find("words[0].phonemes[1]") !=
                         std::string::npos,
                 why(words));
    }

    void testNonNumericTime() {
        auto words = codec_.parse(R"({"words": [
            {"alignedWord": "HI", "start": 0, "end": 0.2,
             "phonemes": [["HH", "0", 0.1]]}
        ]})");
        QVERIFY(words.code() == ErrorCode::Format);
    }

    void testSilenceEntryNeedsSpan() {
        auto words = codec_.parse(R"({"words": [{"start": 0}]})");
        QVERIFY(words.code() == ErrorCode::Format);
        QVERIFY(words.error().message.find("words[0]") != std::string::npos);
    }

    void testEmptyWordList() {
        auto words = codec_.parse(R"({"words": []})");
        QVERIFY(words.isOk());
        QVERIFY(words->empty());
    }

    void testToObject() {
        auto json = pa::test::sampleAlignment().toJson();
        auto entries = json["words"].toArray();
        QCOMPARE(entries.size(), qsizetype{6});

        auto the = entries[1].toObject();
        QCOMPARE(the["alignedWord"].toString(), QString("THE"));
        QCOMPARE(the["start"].toDouble(), 0.27);
        QCOMPARE(the["end"].toDouble(), 0.44);

        auto phonemes = the["phonemes"].toArray();
        QCOMPARE(phonemes.size(), qsizetype{2});
        QCOMPARE(phonemes[0].toArray()[0].toString(), QString("DH"));
        QCOMPARE(phonemes[1].toArray()[2].toDouble(), 0.44);

        // Silence is written out as an ordinary entry
        QCOMPARE(entries[0].toObject()["alignedWord"].toString(), QString("sp"));
    }

    void testSerializeRoundTrip() {
        auto words = pa::test::sampleWords();
        auto bytes = codec_.serialize(words);
        QVERIFY(bytes.isOk());

        auto parsed = codec_.parse(*bytes);
        QVERIFY2(parsed.isOk(), why(parsed));
        QVERIFY(*parsed == words);
    }

    void testCompactOutput() {
        CONFIG.json().indent = false;
        auto bytes = codec_.serialize(pa::test::sampleWords());
        QVERIFY(bytes.isOk());
        QVERIFY(bytes->find('\n') == std::string::npos);
    }
};

int runTestJsonCodec(int argc, char** argv) {
    TestJsonCodec tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_JsonCodec.moc"
