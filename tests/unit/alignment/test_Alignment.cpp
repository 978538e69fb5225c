#include <QtTest>
#include "TestHelpers.hpp"
#include "alignment/Alignment.hpp"

using namespace pa;
using pa::test::near;
using pa::test::sampleAlignment;
using pa::test::sampleWords;
using pa::test::why;

class TestAlignment : public QObject {
    Q_OBJECT

private:
    // One word "ABC" of three 0.1s phonemes
    static Alignment threePhonemes() {
        return Alignment::fromWords({Word("ABC",
                                          {Phoneme("A", 0.0, 0.1),
                                           Phoneme("B", 0.1, 0.2),
                                           Phoneme("C", 0.2, 0.3)})})
                .value();
    }

private slots:
    void testConstruction() {
        auto alignment = sampleAlignment();
        QCOMPARE(alignment.size(), usize{6});
        QCOMPARE(alignment.phonemeCount(), usize{11});
        QVERIFY(*alignment.start() == 0.0);
        QCOMPARE(*alignment.end(), 1.6);
        QCOMPARE(*alignment.duration(), 1.6);
        QCOMPARE(alignment[1].label(), std::string("THE"));
        QCOMPARE(alignment.toText(), std::string("THE MOUSE RAN"));
    }

    void testCreateFromVariant() {
        auto fromWords = Alignment::create(sampleWords());
        QVERIFY2(fromWords.isOk(), why(fromWords));

        auto fromJson = Alignment::create(fromWords->toJson());
        QVERIFY2(fromJson.isOk(), why(fromJson));
        QVERIFY(*fromJson == *fromWords);

        auto fromPath = Alignment::create(pa::test::assetPath("test.json"));
        QVERIFY2(fromPath.isOk(), why(fromPath));
        QCOMPARE(fromPath->size(), usize{6});
    }

    void testPhonemesFlattenInOrder() {
        auto phonemes = sampleAlignment().phonemes();
        QCOMPARE(phonemes.size(), usize{11});
        QCOMPARE(phonemes[0].label(), std::string("sp"));
        QCOMPARE(phonemes[1].label(), std::string("DH"));
        QCOMPARE(phonemes[10].label(), std::string("sp"));
        for (usize i = 1; i < phonemes.size(); ++i)
            QVERIFY(phonemes[i].start() == phonemes[i - 1].end());
    }

    void testRejectsGapBetweenWords() {
        auto words = sampleWords();
        words[2] = Word("MOUSE", {Phoneme("M", 0.45, 0.93)});
        auto res = Alignment::fromWords(words);
        QVERIFY(res.isErr());
        QVERIFY(res.code() == ErrorCode::Validation);
        QVERIFY(res.error().message.find("Gap") != std::string::npos);
    }

    void testRejectsOverlapBetweenWords() {
        auto words = sampleWords();
        words[2] = Word("MOUSE", {Phoneme("M", 0.40, 0.93)});
        auto res = Alignment::fromWords(words);
        QVERIFY(res.isErr());
        QVERIFY(res.code() == ErrorCode::Validation);
    }

    void testSnapsBoundariesWithinTolerance() {
        auto words = sampleWords();
        words[2] = Word("MOUSE", {Phoneme("M", 0.44004, 0.93)});
        auto res = Alignment::fromWords(words);
        QVERIFY2(res.isOk(), why(res));
        QVERIFY((*res)[2].start() == (*res)[1].end());
    }

    void testRejectsEmptyWord() {
        auto words = sampleWords();
        words.insert(words.begin() + 1, Word("UH", {}));
        auto res = Alignment::fromWords(words);
        QVERIFY(res.isErr());
        QVERIFY(res.code() == ErrorCode::Validation);
    }

    void testEmptyAlignment() {
        Alignment empty;
        QVERIFY(empty.empty());
        QCOMPARE(empty.phonemeCount(), usize{0});
        QVERIFY(empty.start().code() == ErrorCode::Empty);
        QVERIFY(empty.end().code() == ErrorCode::Empty);
        QVERIFY(empty.duration().code() == ErrorCode::Empty);
        QVERIFY(empty.phonemeAtTime(0.0) == nullptr);
        QVERIFY(empty.wordAtTime(0.0) == nullptr);
        QCOMPARE(empty.toText(), std::string());

        auto bounds = empty.wordBounds(16000, 160);
        QVERIFY(bounds.isOk());
        QVERIFY(bounds->empty());

        auto frames =
                empty.framewisePhonemeIndices(pa::test::samplePhonemeMap(), 0.01);
        QVERIFY(frames.code() == ErrorCode::Empty);
    }

    void testAt() {
        auto alignment = sampleAlignment();
        auto word = alignment.at(4);
        QVERIFY(word.isOk());
        QCOMPARE(word->label(), std::string("RAN"));
        QVERIFY(alignment.at(6).code() == ErrorCode::Range);
    }

    void testFind() {
        auto alignment = sampleAlignment();
        QCOMPARE(alignment.find("THE MOUSE"), i64{1});
        QCOMPARE(alignment.find("MOUSE"), i64{2});
        QCOMPARE(alignment.find("RAN"), i64{4});
        // Silence between matched words is skipped
        QCOMPARE(alignment.find("MOUSE RAN"), i64{2});
        QCOMPARE(alignment.find("THE MOUSE RAN"), i64{1});
        QCOMPARE(alignment.find("  THE\tMOUSE  "), i64{1});

        QCOMPARE(alignment.find("the mouse"), i64{-1});
        QCOMPARE(alignment.find("THE RAN"), i64{-1});
        QCOMPARE(alignment.find("RAN AWAY"), i64{-1});
        QCOMPARE(alignment.find(""), i64{-1});
        QCOMPARE(alignment.find("sp"), i64{-1});
    }

    void testFindWithLeadingSilenceMatch() {
        auto alignment = Alignment::fromWords(
                                 {Word("sp", {Phoneme("sp", 0.0, 0.1)}),
                                  Word("HELLO", {Phoneme("HH", 0.1, 0.3)}),
                                  Word("sp", {Phoneme("sp", 0.3, 0.4)}),
                                  Word("WORLD", {Phoneme("W", 0.4, 0.6)})})
                                 .value();
        QCOMPARE(alignment.find("HELLO WORLD"), i64{1});
        QCOMPARE(alignment.find("WORLD"), i64{3});
    }

    void testPhonemeAtTime() {
        auto alignment = sampleAlignment();

        auto labelAt = [&](Seconds t) -> std::string {
            auto* p = alignment.phonemeAtTime(t);
            return p ? p->label() : std::string("<none>");
        };

        QCOMPARE(labelAt(0.0), std::string("sp"));
        QCOMPARE(labelAt(0.1), std::string("sp"));
        QCOMPARE(labelAt(0.3), std::string("DH"));
        QCOMPARE(labelAt(0.33), std::string("AH0"));
        QCOMPARE(labelAt(0.44), std::string("M"));
        QCOMPARE(labelAt(1.2), std::string("AE1"));
        QCOMPARE(labelAt(1.6), std::string("sp"));
        QCOMPARE(labelAt(1.7), std::string("<none>"));
        QCOMPARE(labelAt(-0.1), std::string("<none>"));
    }

    void testEveryInteriorTimeHasAPhoneme() {
        auto alignment = sampleAlignment();
        for (int ms = 0; ms <= 1600; ++ms) {
            Seconds t = ms / 1000.0;
            QVERIFY2(alignment.phonemeAtTime(t) != nullptr,
                     qPrintable(QString("no phoneme at %1").arg(t)));
        }
    }

    void testWordAtTime() {
        auto alignment = sampleAlignment();
        auto* mouse = alignment.wordAtTime(0.5);
        QVERIFY(mouse != nullptr);
        QCOMPARE(mouse->label(), std::string("MOUSE"));

        auto* ran = alignment.wordAtTime(1.05);
        QVERIFY(ran != nullptr);
        QCOMPARE(ran->label(), std::string("RAN"));

        QVERIFY(alignment.wordAtTime(2.0) == nullptr);
    }

    void testPhonemeIndexAtTime() {
        auto alignment = sampleAlignment();
        QCOMPARE(alignment.phonemeIndexAtTime(0.0).value(), usize{0});
        QCOMPARE(alignment.phonemeIndexAtTime(0.5).value(), usize{3});
        QCOMPARE(alignment.phonemeIndexAtTime(0.6).value(), usize{4});
        QCOMPARE(alignment.phonemeIndexAtTime(1.6).value(), usize{10});
        QVERIFY(!alignment.phonemeIndexAtTime(1.61).has_value());
    }

    void testSlicePreservesTimes() {
        auto alignment = sampleAlignment();
        auto slice = alignment.slice(1, 3);
        QVERIFY2(slice.isOk(), why(slice));
        QCOMPARE(slice->size(), usize{2});
        QVERIFY((*slice)[0] == alignment[1]);
        QVERIFY((*slice)[1] == alignment[2]);
        QCOMPARE(*slice->start(), 0.27);
        QCOMPARE(*slice->end(), 0.93);
        QCOMPARE(slice->toText(), std::string("THE MOUSE"));
    }

    void testSliceBounds() {
        auto alignment = sampleAlignment();
        QVERIFY(alignment.slice(0, 6).isOk());
        QVERIFY(alignment.slice(3, 3)->empty());
        QVERIFY(alignment.slice(4, 2).code() == ErrorCode::Range);
        QVERIFY(alignment.slice(0, 7).code() == ErrorCode::Range);
    }

    void testSliceIsIndependent() {
        auto alignment = sampleAlignment();
        auto slice = alignment.slice(1, 3).value();
        QVERIFY(slice.update(0, {0.5}).isOk());
        QCOMPARE(alignment[1][0].end(), 0.33);
        QVERIFY(slice != alignment.slice(1, 3).value());
    }

    void testConcatRejoinsSlices() {
        auto alignment = sampleAlignment();
        auto head = alignment.slice(0, 3).value();
        auto tail = alignment.slice(3, 6).value();
        QVERIFY((head + tail) == alignment);
    }

    void testConcatShiftsRightOperand() {
        auto alignment = sampleAlignment();
        auto the = alignment.slice(1, 2).value();
        auto twice = the + the;
        QCOMPARE(twice.size(), usize{2});
        QVERIFY(near(*twice.duration(), 2 * *the.duration()));
        QCOMPARE(*twice.start(), 0.27);
        QVERIFY(twice[1].start() == twice[0].end());
        QVERIFY(near(twice[1][1].start(), 0.44 + 0.06));
        QCOMPARE(twice.toText(), std::string("THE THE"));
    }

    void testConcatWithEmpty() {
        auto alignment = sampleAlignment();
        QVERIFY((alignment + Alignment{}) == alignment);
        QVERIFY((Alignment{} + alignment) == alignment);
        QVERIFY((Alignment{} + Alignment{}).empty());
    }

    void testReplace() {
        auto alignment = sampleAlignment();
        auto res = alignment.replace(
                1, 2, {Word("A", {Phoneme("AH0", 0.0, 0.1)})});
        QVERIFY2(res.isOk(), why(res));

        const auto& replaced = res.value();
        QCOMPARE(replaced.size(), usize{6});
        QCOMPARE(replaced.toText(), std::string("A MOUSE RAN"));
        QCOMPARE(replaced[1].start(), 0.27);
        QVERIFY(near(replaced[1].end(), 0.37));
        QVERIFY(replaced[2].start() == replaced[1].end());
        QVERIFY(near(*replaced.end(), 1.53));

        // Source untouched
        QCOMPARE(alignment.toText(), std::string("THE MOUSE RAN"));
    }

    void testReplaceInsertAndRemove() {
        auto alignment = sampleAlignment();

        auto removed = alignment.replace(3, 5, {});
        QVERIFY(removed.isOk());
        QCOMPARE(removed->toText(), std::string("THE MOUSE"));
        QVERIFY(near(*removed->end(), 0.93 + 0.11));

        auto appended = alignment.replace(
                6, 6, {Word("AWAY", {Phoneme("AH0", 0.0, 0.05), Phoneme("W", 0.05, 0.1)})});
        QVERIFY(appended.isOk());
        QCOMPARE(appended->size(), usize{7});
        QCOMPARE((*appended)[6].start(), 1.6);

        QVERIFY(alignment.replace(5, 7, {}).code() == ErrorCode::Range);
        QVERIFY(alignment.replace(1, 2, {Word("X", {})}).code() ==
                ErrorCode::Validation);
    }

    void testUpdateShiftsFollowingPhonemes() {
        auto alignment = threePhonemes();
        QVERIFY(alignment.update(1, {0.15}).isOk());

        const auto& word = alignment[0];
        QVERIFY(word[0] == Phoneme("A", 0.0, 0.1));
        QCOMPARE(word[1].start(), 0.1);
        QVERIFY(near(word[1].duration(), 0.15));
        QVERIFY(near(word[2].start(), 0.25));
        QVERIFY(near(word[2].end(), 0.35));
        QVERIFY(word[2].start() == word[1].end());
    }

    void testUpdateShrink() {
        auto alignment = threePhonemes();
        QVERIFY(alignment.update(1, {0.05}).isOk());
        QVERIFY(near(alignment[0][1].end(), 0.15));
        QVERIFY(near(*alignment.end(), 0.25));
    }

    void testUpdateWithStart() {
        auto alignment = threePhonemes();
        QVERIFY(alignment.update(0, {0.2, 0.2, 0.2}, 1.0).isOk());
        QCOMPARE(*alignment.start(), 1.0);
        QVERIFY(near(*alignment.end(), 1.6));
        QVERIFY(near(*alignment.duration(), 0.6));
    }

    void testUpdateAcrossWords() {
        auto alignment = sampleAlignment();
        // THE's phonemes and MOUSE's first phoneme
        QVERIFY(alignment.update(1, {0.1, 0.1, 0.1}).isOk());
        QCOMPARE(alignment[1].start(), 0.27);
        QVERIFY(near(alignment[1].end(), 0.47));
        QVERIFY(alignment[2].start() == alignment[1].end());
        QVERIFY(near(alignment[2][0].end(), 0.57));
        // MOUSE keeps AW1 and S durations
        QVERIFY(near(alignment[2][1].duration(), 0.23));
        QVERIFY(near(alignment[2][2].duration(), 0.18));
        QVERIFY(near(*alignment.end(), 1.6 + 0.05));
    }

    void testUpdateErrors() {
        auto alignment = threePhonemes();
        QVERIFY(alignment.update(3).code() == ErrorCode::Range);
        QVERIFY(alignment.update(2, {0.1, 0.1}).code() == ErrorCode::Range);
        QVERIFY(alignment.update(0, {-0.1}).code() == ErrorCode::Validation);
        QVERIFY(alignment.update(1, {}, 0.5).code() == ErrorCode::Validation);
        // Failed updates leave the alignment unchanged
        QVERIFY(alignment == threePhonemes());
    }

    void testEquality() {
        auto a = sampleAlignment();
        auto b = sampleAlignment();
        QVERIFY(a == b);
        QVERIFY(b.update(0, {0.2700000001}).isOk());
        QVERIFY(a != b);
        QVERIFY(a.approxEquals(b, 1e-6));
        QVERIFY(!a.approxEquals(b, 1e-12));
    }

    void testWordBounds() {
        auto alignment = sampleAlignment();
        auto bounds = alignment.wordBounds(10000, 100);
        QVERIFY2(bounds.isOk(), why(bounds));
        QCOMPARE(bounds->size(), usize{6});
        QVERIFY((*bounds)[0] == (FrameBounds{0, 27}));
        QVERIFY((*bounds)[1] == (FrameBounds{27, 44}));
        QVERIFY((*bounds)[2] == (FrameBounds{44, 93}));
        QVERIFY((*bounds)[5] == (FrameBounds{149, 160}));

        auto speech = alignment.wordBounds(10000, 100, false);
        QVERIFY(speech.isOk());
        QCOMPARE(speech->size(), usize{3});
        QVERIFY((*speech)[0] == (FrameBounds{27, 44}));
        QVERIFY((*speech)[2] == (FrameBounds{105, 149}));

        QVERIFY(alignment.wordBounds(0, 100).code() == ErrorCode::Range);
        QVERIFY(alignment.wordBounds(16000, 0).code() == ErrorCode::Range);
    }

    void testPhonemeBounds() {
        auto alignment = sampleAlignment();
        auto bounds = alignment.phonemeBounds(10000, 100, false);
        QVERIFY2(bounds.isOk(), why(bounds));
        QCOMPARE(bounds->size(), usize{8});
        QVERIFY((*bounds)[0] == (FrameBounds{27, 33}));
        QVERIFY((*bounds)[1] == (FrameBounds{33, 44}));
        QVERIFY((*bounds)[4] == (FrameBounds{75, 93}));
        QVERIFY((*bounds)[5] == (FrameBounds{105, 116}));
        QVERIFY((*bounds)[7] == (FrameBounds{137, 149}));

        // Default hopsize of one sample
        auto samples = alignment.phonemeBounds(100);
        QVERIFY(samples.isOk());
        QCOMPARE(samples->size(), usize{11});
        QCOMPARE(samples->back().end, i64{160});
    }

    void testBoundsPartitionTheAlignment() {
        auto alignment = sampleAlignment();
        const u32 rates[] = {8000, 16000, 22050, 44100};
        const u32 hops[] = {1, 128, 160, 256, 512};
        for (auto sr : rates) {
            for (auto hop : hops) {
                for (bool phonemeLevel : {false, true}) {
                    auto bounds = phonemeLevel ? alignment.phonemeBounds(sr, hop)
                                               : alignment.wordBounds(sr, hop);
                    QVERIFY(bounds.isOk());
                    QCOMPARE(bounds->front().start, i64{0});
                    QCOMPARE(bounds->back().end,
                             frames::secondsToFrameIndex(1.6, sr, hop));
                    for (usize i = 1; i < bounds->size(); ++i)
                        QCOMPARE((*bounds)[i].start, (*bounds)[i - 1].end);
                }
            }
        }
    }

    void testFramewisePhonemeIndices() {
        auto alignment = sampleAlignment();
        auto indices =
                alignment.framewisePhonemeIndices(pa::test::samplePhonemeMap(), 0.1);
        QVERIFY2(indices.isOk(), why(indices));

        const std::vector<i64> expected{0, 0, 0, 1, 2, 3, 4, 4, 5, 5, 0, 6, 7, 7, 8, 0};
        QCOMPARE(indices->size(), expected.size());
        QVERIFY(*indices == expected);
    }

    void testFramewiseAtExplicitTimes() {
        auto alignment = sampleAlignment();
        auto map = pa::test::samplePhonemeMap();

        auto indices = alignment.framewisePhonemeIndices(
                map, 0.0, std::vector<Seconds>{0.0, 0.3, 0.8, 1.6});
        QVERIFY2(indices.isOk(), why(indices));
        QVERIFY((*indices == std::vector<i64>{0, 1, 5, 0}));

        auto outside = alignment.framewisePhonemeIndices(
                map, 0.0, std::vector<Seconds>{0.5, 2.0});
        QVERIFY(outside.code() == ErrorCode::Range);
    }

    void testFramewiseMissingLabel() {
        auto alignment = sampleAlignment();
        auto map = pa::test::samplePhonemeMap();
        map.erase("N");

        auto indices = alignment.framewisePhonemeIndices(map, 0.1);
        QVERIFY(indices.isErr());
        QVERIFY(indices.code() == ErrorCode::Lookup);
        QVERIFY(indices.error().message.find("'N'") != std::string::npos);

        QVERIFY(alignment.framewisePhonemeIndices(pa::test::samplePhonemeMap(), 0.0)
                        .code() == ErrorCode::Range);
    }
};

int runTestAlignment(int argc, char** argv) {
    TestAlignment tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Alignment.moc"
