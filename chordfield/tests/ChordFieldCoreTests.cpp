#include "chordfield/ontology/ChordModel.h"
#include "chordfield/ontology/HarmonicTables.h"
#include "chordfield/theory/ChordSuggester.h"
#include "chordfield/theory/HarmonicContext.h"
#include "chordfield/theory/ModulationDetector.h"
#include "chordfield/util/Pitch.h"

#include <QCoreApplication>
#include <QSet>
#include <QStringList>
#include <QtDebug>
#include <QtGlobal>

using chordfield::ontology::ChordModel;
using chordfield::ontology::HarmonicTables;
using chordfield::ontology::Mode;
using chordfield::ontology::Quality;
using chordfield::ontology::QualityModifier;

using chordfield::theory::ChordSuggester;
using chordfield::theory::ModulationConfidence;
using chordfield::theory::ModulationDetector;
using chordfield::theory::Quadrant;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static QSet<int> pcSet(const QVector<int>& v) {
    QSet<int> s;
    for (int n : v) s.insert(chordfield::util::normalizePc(n));
    return s;
}

} // namespace

static void testPitchUtils() {
    using namespace chordfield::util;

    expectEq(normalizePc(-1), 11, "normalizePc(-1)");
    expectEq(normalizePc(25), 1, "normalizePc(25)");
    expectEq(roundHalfUp(2.5), 3, "roundHalfUp(2.5)");
    expectEq(roundHalfUp(-2.5), -2, "roundHalfUp(-2.5)");

    int pc = -1;
    expect(parsePitchClass("Bb", pc) && pc == 10, "parse Bb");
    expect(parsePitchClass("C♯", pc) && pc == 1, "parse C sharp (unicode)");
    expect(!parsePitchClass("H", pc), "parse rejects H");

    expectStrEq(midiNoteName(60), "C4", "midi 60 name");
    expectStrEq(midiNoteName(61), "C#4", "midi 61 name");
    expectStrEq(midiNoteName(21), "A0", "midi 21 name");

    expectEq(findClosest(0, 50), 48, "findClosest C near 50");
    expectEq(findClosest(4, 58), 52, "findClosest ties resolve low");
    expectEq(findNextAbove(4, 48), 52, "findNextAbove E over C3");
    expectEq(findNextAbove(0, 48), 60, "findNextAbove is strict");
    expectEq(wrapIntoRange(20, 28, 84), 32, "wrap up into range");
    expectEq(wrapIntoRange(90, 28, 84), 78, "wrap down into range");
}

static void testTables() {
    const HarmonicTables t = HarmonicTables::builtins();

    expectEq(t.allModes().size(), 7, "mode count");
    expectEq(t.allQualities().size(), 29, "quality count");
    expectEq(t.allVoicings().size(), 8, "voicing type count");

    // Brightest -> darkest, one scale tone apart.
    const auto modes = t.allModes();
    for (int i = 0; i + 1 < modes.size(); ++i) {
        int diffs = 0;
        for (int d = 0; d < 7; ++d) {
            if (modes[i]->intervals[d] != modes[i + 1]->intervals[d]) ++diffs;
        }
        expectEq(diffs, 1, QString("modes %1/%2 differ by one tone").arg(modes[i]->key, modes[i + 1]->key));
    }

    const auto* maj7 = t.qualityForKey("maj7");
    expect(maj7 != nullptr, "maj7 exists");
    if (maj7) {
        expectEq(maj7->intervals.size(), 4, "maj7 interval count");
        expectEq(maj7->intervals[3], 11, "maj7 top interval");
    }
    expect(t.qualityForKey("bogus") == nullptr, "unknown quality key");

    const auto* dom11 = t.qualityForKey("dom11");
    expect(dom11 && !dom11->intervals.contains(4), "dom11 has no 3rd");

    const auto* ionian = t.modeForKey("Ionian");
    expect(ionian && ionian->name == "Major (Ionian)", "mode lookup is case-insensitive");
    expect(t.voicingForKey("drop2") && t.voicingForKey("drop2")->name == "Drop 2", "drop2 label");

    QualityModifier m = QualityModifier::Seventh;
    expect(chordfield::ontology::modifierForKey("69", m) && m == QualityModifier::SixNine, "modifier key 69");
}

static void testGrid() {
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);

    const auto c7 = model.gridChord(2, 0, 0, Mode::Ionian);
    expectEq(c7.rootPc, 0, "grid(2,0) root");
    expect(c7.quality == Quality::Dom7, "grid(2,0) is dom7");
    expect(pcSet(c7.pitchClasses) == QSet<int>({0, 4, 7, 10}), "grid(2,0) pitch classes");

    const QVector<int> roots = model.columnRoots(0, Mode::Ionian);
    expect(roots == QVector<int>({0, 2, 4, 5, 7, 9, 11, 1}), "C ionian column roots (flat-II last)");
    expectEq(model.columnRoots(0, Mode::Ionian, 6).last(), 6, "chromatic column override");

    expect(model.gridQuality(7, 0, Mode::Ionian) == Quality::Sus2, "row 7 over major triad");
    expect(model.gridQuality(7, 1, Mode::Ionian) == Quality::Dim7, "row 7 over minor triad");
    expect(model.gridQuality(7, 6, Mode::Ionian) == Quality::Dom7Alt, "row 7 over dim triad");
    expect(model.gridQuality(7, 7, Mode::Ionian) == Quality::Dom7Alt, "row 7 chromatic column");
    expect(model.gridQuality(99, -5, Mode::Ionian) == Quality::Sus2, "row/column are bounded");

    const auto dm7 = model.gridChord(1, 1, 0, Mode::Ionian);
    expectStrEq(dm7.name, "Dm7", "ii chord name");
    expectStrEq(dm7.roman, "ii7", "ii chord roman");

    expectStrEq(model.chordName(10, Quality::Maj7), "Bbmaj7", "flat spelling");
    expectStrEq(model.chordName(6, Quality::HalfDim7), "Gbø7", "half-diminished suffix");
    expectStrEq(model.romanLabel(4, Quality::Dom7), "V7", "V7 label");
    expectStrEq(model.romanLabel(0, Quality::Maj7), "IΔ7", "IΔ7 label");
    expectStrEq(model.romanLabel(7, Quality::Maj7), "♭IIΔ7", "chromatic column label");

    expect(model.chordPitchClasses(0, "nope") == QVector<int>({0, 4, 7}), "unknown quality -> major triad");
    expect(model.chordPitchClasses(2, Quality::Min7) == QVector<int>({2, 5, 9, 0}), "Dm7 template order");

    expectEq(model.diatonicDegree(9, 0, Mode::Ionian), 5, "A is degree 6 of C");
    expectEq(model.diatonicDegree(1, 0, Mode::Ionian), -1, "Db outside C");
    expect(model.defaultQuality(2, 0, Mode::Ionian) == Quality::Min7, "default quality on ii");
    expect(model.defaultQuality(1, 0, Mode::Ionian) == Quality::Dom7, "default quality outside key");

    expect(model.applyQualityModifier(Quality::Min7, QualityModifier::Ninth) == Quality::Min9, "min7 + 9th");
    expect(model.applyQualityModifier(Quality::Dom7, QualityModifier::Triad) == Quality::Maj, "dom7 as triad");
    expect(model.applyQualityModifier(Quality::HalfDim7, QualityModifier::Ninth) == Quality::Min9b5, "ø7 + 9th");
    expect(model.applyQualityModifier(Quality::Sus2, QualityModifier::Ninth) == Quality::Sus2, "sus keeps base on 9th");
    expect(model.applyQualityModifier(Quality::Dim7, QualityModifier::Sus4) == Quality::Dim7, "dim keeps base on sus4");
    expect(model.applyQualityModifier(Quality::Maj7, QualityModifier::Seventh) == Quality::Maj7, "7th is identity");

    expect(ChordModel::cycleMode(Mode::Lydian, -1) == Mode::Locrian, "cycle brighter wraps");
    expect(ChordModel::cycleMode(Mode::Ionian, +1) == Mode::Mixolydian, "cycle darker");
    expect(ChordModel::cycleMode(Mode(42), 1) == Mode::Ionian, "cycle from invalid mode");
}

static void testGlow() {
    using namespace chordfield::theory;
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);

    const QVector<int> c7 = {0, 4, 7, 10};
    const GlowGrid g = glowGrid(model, c7, 0, Mode::Ionian);
    expectEq(g.at(2, 0), 3, "glow on the C7 cell");
    expectEq(g.at(3, 6), 0, "glow on Bm7b5 (nothing shared)");
    expectEq(g.at(0, 0), 3, "glow is capped at 3");
    expectEq(g.at(9, 9), 0, "out-of-grid cell");

    for (int i = 0; i < 64; ++i) {
        expect(g.cells[size_t(i)] >= 0 && g.cells[size_t(i)] <= 3, "glow level range");
    }

    const QVector<int> a = {0, 4, 7, 11};
    const QVector<int> b = {9, 0, 4, 7};
    expectEq(sharedNoteCount(a, b), sharedNoteCount(b, a), "shared notes are symmetric");
    expectEq(sharedNoteCount(a, b), 3, "Cmaj7 vs Am7");
    expectEq(sharedNoteCount({0, 12, 24}, {0}), 1, "shared notes count pitch classes");
}

static void testRelations() {
    using namespace chordfield::theory;
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);

    const auto v7ofG = secondaryDominant(7);
    expectEq(v7ofG.rootPc, 2, "V7/G is D7");
    expect(v7ofG.quality == Quality::Dom7, "secondary dominant is dom7");
    expectEq(tritoneSubstitution(7).rootPc, 1, "tritone sub of G7 is Db7");

    const auto borrowedMajor = modalInterchange(model, 0, Mode::Ionian);
    expectEq(borrowedMajor.size(), 3, "C ionian borrows three chords from aeolian");
    if (borrowedMajor.size() == 3) {
        expect(borrowedMajor[0].rootPc == 3 && borrowedMajor[0].quality == Quality::Maj7, "bIIImaj7");
        expect(borrowedMajor[1].rootPc == 8 && borrowedMajor[1].quality == Quality::Maj7, "bVImaj7");
        expect(borrowedMajor[2].rootPc == 10 && borrowedMajor[2].quality == Quality::Dom7, "bVII7");
        expectEq(borrowedMajor[2].degree, 6, "borrowed degree recorded");
    }

    const auto borrowedMinor = modalInterchange(model, 0, Mode::Aeolian);
    expectEq(borrowedMinor.size(), 3, "C aeolian borrows three chords from ionian");
    if (borrowedMinor.size() == 3) {
        expect(borrowedMinor[2].rootPc == 11 && borrowedMinor[2].quality == Quality::HalfDim7, "viiø7 borrowed");
    }

    const auto mediants = chromaticMediants(0);
    expectEq(mediants.size(), 4, "four mediants");
    if (mediants.size() == 4) {
        expect(mediants[0].rootPc == 4 && mediants[3].rootPc == 9 && mediants[3].quality == Quality::Min7,
               "mediant order");
    }

    const auto nrMajor = neoRiemannian(model, 0, Quality::Maj7);
    expect(nrMajor.parallel.rootPc == 0 && nrMajor.parallel.quality == Quality::Min7, "P of Cmaj7");
    expectEq(nrMajor.relative.rootPc, 9, "R of Cmaj7");
    expectEq(nrMajor.leadingTone.rootPc, 4, "L of Cmaj7");

    const auto nrMinor = neoRiemannian(model, 9, Quality::Min7);
    expect(nrMinor.parallel.rootPc == 9 && nrMinor.parallel.quality == Quality::Maj7, "P of Am7");
    expectEq(nrMinor.relative.rootPc, 0, "R of Am7");
    expectEq(nrMinor.leadingTone.rootPc, 5, "L of Am7");

    expect(isMajorLike(chordfield::ontology::QualityFamily::Sus), "sus is major-like");
    expect(!isMajorLike(chordfield::ontology::QualityFamily::Diminished), "dim is minor-like");
}

static void testSuggestions() {
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);
    const ChordSuggester s(model);

    const auto fromV = s.computeSuggestions(7, Quality::Dom7, 0, Mode::Ionian);
    expect(fromV.safe.rootPc == 0 && fromV.safe.quality == Quality::Maj7, "V resolves to Imaj7");
    expectStrEq(fromV.safe.kind, "resolution", "safe kind");
    expect(fromV.color.rootPc == 3 && fromV.color.quality == Quality::Maj7, "color picks bIIImaj7");
    expectStrEq(fromV.color.kind, "modal_interchange", "color kind");
    expect(fromV.surprise.rootPc == 8 && fromV.surprise.quality == Quality::Dom7, "surprise is Ab7");
    expectStrEq(fromV.surprise.kind, "tritone_sub", "surprise kind");
    expectStrEq(fromV.surprise.label, "Ab7", "surprise label");

    const auto avoidTri = s.computeSuggestions(7, Quality::Dom7, 0, Mode::Ionian, {8});
    expectEq(avoidTri.surprise.rootPc, 2, "recent tritone sub falls back to the secondary dominant");
    expectStrEq(avoidTri.surprise.kind, "secondary_dominant", "fallback surprise kind");

    const auto distant = s.computeSuggestions(7, Quality::Dom7, 0, Mode::Ionian, {8, 2});
    expectEq(distant.surprise.rootPc, 9, "whole step when both are recent");
    expectStrEq(distant.surprise.kind, "distant", "distant kind");

    expectEq(s.computeSuggestions(0, Quality::Maj7, 0, Mode::Ionian).safe.rootPc, 5, "I moves to IV");
    expectEq(s.computeSuggestions(2, Quality::Min7, 0, Mode::Ionian).safe.rootPc, 7, "ii moves to V");
    expectEq(s.computeSuggestions(9, Quality::Min7, 0, Mode::Ionian).safe.rootPc, 2, "vi moves down a fifth");
    expectEq(s.computeSuggestions(1, Quality::Dom7, 0, Mode::Ionian).safe.rootPc, 0, "outside chord slides down");

    for (int root = 0; root < 12; ++root) {
        const auto sg = s.computeSuggestions(root, Quality::Maj7, 0, Mode::Dorian, {root});
        expect(sg.color.rootPc != root, QString("color differs from current root %1").arg(root));
        expect(!sg.safe.label.isEmpty() && !sg.color.label.isEmpty() && !sg.surprise.label.isEmpty(),
               "suggestions are labelled");
    }
}

static void testContextChords() {
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);
    const ChordSuggester s(model);

    const auto ctx = s.computeContextChords(0, Quality::Maj7, 0, Mode::Ionian);
    expectEq(ctx.size(), 16, "sixteen context chords");
    if (ctx.size() != 16) return;

    const QStringList roles = {
        "resolution", "plagal", "deceptive", "dominant",
        "parallel", "relative", "leading_tone", "modal_borrow",
        "secondary_dominant", "tritone_sub", "secondary_dom_ii", "dominant_chain",
        "coltrane_up", "coltrane_down", "chromatic_slide", "diminished_bridge",
    };
    const QVector<int> rootsExpected = {2, 5, 9, 7, 0, 9, 4, 3, 7, 1, 9, 5, 4, 8, 1, 11};
    for (int i = 0; i < 16; ++i) {
        expectStrEq(ctx[i].role, roles[i], QString("context role %1").arg(i));
        expectEq(ctx[i].rootPc, rootsExpected[i], QString("context root %1").arg(i));
        expect(ctx[i].quadrant == Quadrant(i / 4), QString("context quadrant %1").arg(i));
    }
    expect(ctx[0].quality == Quality::Min7, "I starts a ii-V");
    expect(ctx[12].quality == Quality::Min7, "diatonic coltrane target keeps its diatonic seventh");
    expect(ctx[13].quality == Quality::Maj7, "outside coltrane target is maj7");
    expect(ctx[14].quality == Quality::Maj7, "outside chromatic slide keeps the current quality");
    expect(ctx[15].quality == Quality::Dim7, "diminished bridge");
    expectStrEq(ctx[9].label, "Db7", "tritone sub label");

    for (int key = 0; key < 12; ++key) {
        for (int m = 0; m < chordfield::ontology::kModeCount; ++m) {
            for (int q = 0; q < chordfield::ontology::kQualityCount; ++q) {
                const auto c = s.computeContextChords((key + q) % 12, Quality(q), key, Mode(m));
                if (c.size() != 16) {
                    expectEq(c.size(), 16, QString("context size key %1 mode %2 quality %3").arg(key).arg(m).arg(q));
                    return;
                }
            }
        }
    }
}

static void testInnerRing() {
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);
    const ChordSuggester s(model);

    const auto g = s.innerRingChord(1, 0, Mode::Ionian);
    expect(g.rootPc == 7 && g.quality == Quality::Dom7 && g.diatonic, "ring pad 1 is G7");
    const auto fs = s.innerRingChord(6, 0, Mode::Ionian);
    expect(fs.rootPc == 6 && fs.quality == Quality::Dom7 && !fs.diatonic, "ring pad 6 is chromatic F#");
    expectEq(s.innerRingChord(13, 0, Mode::Ionian).rootPc, 7, "ring index wraps");
    expectEq(s.innerRingChord(-1, 0, Mode::Ionian).rootPc, 5, "negative ring index wraps");
}

static void testModulation() {
    const HarmonicTables t = HarmonicTables::builtins();
    const ChordModel model(t);
    const ModulationDetector d(model);

    // Am7 -> D7 in C: ii-V of G.
    const auto toG = d.detect(9, Quality::Min7, 2, Quality::Dom7, 0, Mode::Ionian);
    expect(toG.detected, "Am7 -> D7 modulates");
    expectEq(toG.newKeyPc, 7, "Am7 -> D7 targets G");
    expect(toG.confidence == ModulationConfidence::Strong, "ii-V is strong");
    expect(!toG.evidence.isEmpty(), "evidence is recorded");

    // Abmaj7 -> Bb7 in C: IV-V of Eb.
    const auto toEb = d.detect(8, Quality::Maj7, 10, Quality::Dom7, 0, Mode::Ionian);
    expect(toEb.detected, "Abmaj7 -> Bb7 modulates");
    expectEq(toEb.newKeyPc, 3, "Abmaj7 -> Bb7 targets Eb");
    expect(toEb.confidence == ModulationConfidence::Moderate, "IV-V is moderate");

    expect(!d.detect(2, Quality::Min7, 7, Quality::Dom7, 0, Mode::Ionian).detected, "ii-V of the current key");
    expect(!d.detect(9, Quality::Min7, 2, Quality::Min7, 0, Mode::Ionian).detected, "non-dominant current chord");
    expect(!d.detect(0, Quality::Maj7, 9, Quality::Dom7, 0, Mode::Ionian).detected, "C -> A7 is V/ii only");

    expect(d.isDominantQuality(Quality::Dom11), "dom11 is dominant");
    expect(d.isDominantQuality(Quality::Dom7Sharp11), "dom7#11 is dominant");
    expect(!d.isDominantQuality(Quality::Maj7), "maj7 is not dominant");

    // No modulation whenever the target equals the current key.
    for (int q = 0; q < chordfield::ontology::kQualityCount; ++q) {
        if (!d.isDominantQuality(Quality(q))) continue;
        for (int root = 0; root < 12; ++root) {
            for (int prev = 0; prev < 12; ++prev) {
                const int key = (root + 5) % 12;
                if (d.detect(prev, Quality::Min7, root, Quality(q), key, Mode::Dorian).detected) {
                    expect(false, QString("target == key must not modulate (root %1 quality %2)").arg(root).arg(q));
                    return;
                }
            }
        }
    }
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testPitchUtils();
    testTables();
    testGrid();
    testGlow();
    testRelations();
    testSuggestions();
    testContextChords();
    testInnerRing();
    testModulation();

    if (g_failures == 0) {
        qInfo("ChordFieldCoreTests: PASS");
        return 0;
    }

    qWarning("ChordFieldCoreTests: FAIL (%d failures)", g_failures);
    return 1;
}
