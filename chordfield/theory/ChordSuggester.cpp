#include "chordfield/theory/ChordSuggester.h"

#include "chordfield/theory/HarmonicContext.h"
#include "chordfield/util/Pitch.h"

namespace chordfield::theory {
namespace {

using ontology::Mode;
using ontology::Quality;
using util::normalizePc;

static const int kCircleOfFifths[12] = {0, 7, 2, 9, 4, 11, 6, 1, 8, 3, 10, 5};

static bool hasRoot(const QVector<ContextChord>& chords, int rootPc) {
    for (const auto& c : chords) {
        if (c.rootPc == rootPc) return true;
    }
    return false;
}

} // namespace

QString quadrantKey(Quadrant q) {
    switch (q) {
    case Quadrant::Resolve: return "resolve";
    case Quadrant::Color: return "color";
    case Quadrant::Tension: return "tension";
    case Quadrant::Portal: return "portal";
    }
    return "resolve";
}

QJsonObject ContextChord::toJsonObject() const {
    QJsonObject o;
    o.insert("root", rootPc);
    o.insert("quality", qualityKey);
    o.insert("quadrant", quadrantKey(quadrant));
    o.insert("role", role);
    o.insert("label", label);
    return o;
}

QJsonObject Suggestion::toJsonObject() const {
    QJsonObject o;
    o.insert("root", rootPc);
    o.insert("quality", qualityKey);
    o.insert("kind", kind);
    o.insert("label", label);
    return o;
}

QJsonObject Suggestions::toJsonObject() const {
    QJsonObject o;
    o.insert("safe", safe.toJsonObject());
    o.insert("color", color.toJsonObject());
    o.insert("surprise", surprise.toJsonObject());
    return o;
}

QJsonObject RingChord::toJsonObject() const {
    QJsonObject o;
    o.insert("index", index);
    o.insert("root", rootPc);
    o.insert("quality", qualityKey);
    o.insert("label", label);
    o.insert("type", diatonic ? "diatonic" : "chromatic");
    return o;
}

ChordSuggester::ChordSuggester(const ontology::ChordModel& model)
    : m_model(model) {}

Suggestion ChordSuggester::makeSuggestion(int rootPc, Quality quality, const QString& kind) const {
    Suggestion s;
    s.rootPc = normalizePc(rootPc);
    s.quality = quality;
    s.qualityKey = m_model.tables().qualityKey(quality);
    s.kind = kind;
    s.label = m_model.chordName(s.rootPc, quality);
    return s;
}

ContextChord ChordSuggester::makeContext(int rootPc, Quality quality, Quadrant quadrant, const QString& role) const {
    ContextChord c;
    c.rootPc = normalizePc(rootPc);
    c.quality = quality;
    c.qualityKey = m_model.tables().qualityKey(quality);
    c.quadrant = quadrant;
    c.role = role;
    c.label = m_model.chordName(c.rootPc, quality);
    return c;
}

void ChordSuggester::resolution(int rootPc, int keyPc, Mode mode, int fromTonicDegree,
                                int& rootOut, Quality& qualityOut) const {
    const int degree = m_model.diatonicDegree(rootPc, keyPc, mode);

    int target = 0;
    if (degree == 4) {
        target = 0; // V -> I
    } else if (degree == 1) {
        target = 4; // ii -> V
    } else if (degree == 0) {
        target = fromTonicDegree;
    } else if (degree >= 0) {
        target = (degree + 3) % 7; // down a fifth in the scale
    } else {
        // Outside the key: slide down to the nearest diatonic root.
        for (int offset = 1; offset <= 6; ++offset) {
            const int tryRoot = normalizePc(rootPc - offset);
            const int tryDeg = m_model.diatonicDegree(tryRoot, keyPc, mode);
            if (tryDeg >= 0) {
                rootOut = tryRoot;
                qualityOut = m_model.diatonicSeventh(tryDeg, mode);
                return;
            }
        }
        target = 0;
    }

    rootOut = m_model.scaleRoot(target, keyPc, mode);
    qualityOut = m_model.diatonicSeventh(target, mode);
}

Suggestions ChordSuggester::computeSuggestions(int rootPc, Quality quality, int keyPc, Mode mode,
                                               const QVector<int>& recentRoots) const {
    Q_UNUSED(quality);
    rootPc = normalizePc(rootPc);
    Suggestions out;

    // Safe: V->I, ii->V, I->IV, otherwise down a fifth.
    int safeRoot = 0;
    Quality safeQuality = Quality::Maj7;
    resolution(rootPc, keyPc, mode, 3, safeRoot, safeQuality);
    out.safe = makeSuggestion(safeRoot, safeQuality, "resolution");

    // Color: borrowed chords first, then mediants.
    const QVector<RelatedChord> borrowed = modalInterchange(m_model, keyPc, mode);
    QVector<RelatedChord> candidates;
    for (const auto& c : borrowed + chromaticMediants(rootPc)) {
        if (recentRoots.contains(c.rootPc) || c.rootPc == rootPc || c.rootPc == safeRoot) continue;
        candidates.push_back(c);
    }
    if (!candidates.isEmpty()) {
        const RelatedChord& c = candidates[rootPc % candidates.size()];
        out.color = makeSuggestion(c.rootPc, c.quality, relationKey(c.kind));
    } else if (!borrowed.isEmpty()) {
        out.color = makeSuggestion(borrowed.first().rootPc, borrowed.first().quality, relationKey(borrowed.first().kind));
    } else {
        out.color = makeSuggestion(rootPc + 3, Quality::Maj7, relationKey(RelationKind::ChromaticMediant));
    }

    // Surprise: tritone sub of our dominant, else that dominant, else a whole step away.
    const RelatedChord secDom = secondaryDominant(rootPc);
    const RelatedChord triSub = tritoneSubstitution(secDom.rootPc);
    if (!recentRoots.contains(triSub.rootPc) && triSub.rootPc != rootPc) {
        out.surprise = makeSuggestion(triSub.rootPc, triSub.quality, relationKey(triSub.kind));
    } else if (!recentRoots.contains(secDom.rootPc) && secDom.rootPc != rootPc) {
        out.surprise = makeSuggestion(secDom.rootPc, secDom.quality, relationKey(secDom.kind));
    } else {
        out.surprise = makeSuggestion(rootPc + 2, Quality::Dom7, "distant");
    }

    return out;
}

QVector<ContextChord> ChordSuggester::computeContextChords(int rootPc, Quality quality, int keyPc, Mode mode) const {
    rootPc = normalizePc(rootPc);
    keyPc = normalizePc(keyPc);
    const auto root = [&](int degree) { return m_model.scaleRoot(degree, keyPc, mode); };
    const auto seventh = [&](int degree) { return m_model.diatonicSeventh(degree, mode); };

    // --- Resolve ---
    QVector<ContextChord> resolve;
    {
        int r = 0;
        Quality q = Quality::Maj7;
        resolution(rootPc, keyPc, mode, 1, r, q); // I starts a ii-V
        resolve.push_back(makeContext(r, q, Quadrant::Resolve, "resolution"));
    }

    if (root(3) != rootPc && root(3) != resolve.first().rootPc) {
        resolve.push_back(makeContext(root(3), seventh(3), Quadrant::Resolve, "plagal"));
    } else {
        resolve.push_back(makeContext(root(4), seventh(4), Quadrant::Resolve, "dominant"));
    }

    if (!hasRoot(resolve, root(5)) && root(5) != rootPc) {
        resolve.push_back(makeContext(root(5), seventh(5), Quadrant::Resolve, "deceptive"));
    } else {
        resolve.push_back(makeContext(root(2), seventh(2), Quadrant::Resolve, "mediant"));
    }

    if (keyPc != rootPc && !hasRoot(resolve, keyPc)) {
        resolve.push_back(makeContext(keyPc, seventh(0), Quadrant::Resolve, "tonic"));
    } else if (!hasRoot(resolve, root(1)) && root(1) != rootPc) {
        resolve.push_back(makeContext(root(1), seventh(1), Quadrant::Resolve, "supertonic"));
    } else {
        resolve.push_back(makeContext(root(4), seventh(4), Quadrant::Resolve, "dominant"));
    }

    // --- Color ---
    QVector<ContextChord> color;
    const NeoRiemannianSet nr = neoRiemannian(m_model, rootPc, quality);
    color.push_back(makeContext(nr.parallel.rootPc, nr.parallel.quality, Quadrant::Color, "parallel"));

    if (nr.relative.rootPc != nr.parallel.rootPc) {
        color.push_back(makeContext(nr.relative.rootPc, nr.relative.quality, Quadrant::Color, "relative"));
    } else {
        color.push_back(makeContext(rootPc + 4, quality, Quadrant::Color, "mediant_up"));
    }

    if (nr.leadingTone.rootPc != nr.parallel.rootPc && nr.leadingTone.rootPc != nr.relative.rootPc) {
        color.push_back(makeContext(nr.leadingTone.rootPc, nr.leadingTone.quality, Quadrant::Color, "leading_tone"));
    } else {
        color.push_back(makeContext(rootPc + 3, Quality::Min7, Quadrant::Color, "mediant_m3"));
    }

    {
        QVector<RelatedChord> unused;
        for (const auto& c : modalInterchange(m_model, keyPc, mode)) {
            if (c.rootPc != rootPc && !hasRoot(color, c.rootPc)) unused.push_back(c);
        }
        if (!unused.isEmpty()) {
            // iv in major / IV in minor is the most idiomatic borrow.
            const RelatedChord* chosen = &unused.first();
            for (const auto& c : unused) {
                if (c.degree == 3) {
                    chosen = &c;
                    break;
                }
            }
            color.push_back(makeContext(chosen->rootPc, chosen->quality, Quadrant::Color, "modal_borrow"));
        } else {
            color.push_back(makeContext(rootPc + 8, Quality::Maj7, Quadrant::Color, "mediant_down"));
        }
    }

    // --- Tension ---
    QVector<ContextChord> tension;
    const RelatedChord secDom = secondaryDominant(rootPc);
    tension.push_back(makeContext(secDom.rootPc, secDom.quality, Quadrant::Tension, "secondary_dominant"));

    const RelatedChord triSubV = tritoneSubstitution(root(4));
    if (triSubV.rootPc != secDom.rootPc && triSubV.rootPc != rootPc) {
        tension.push_back(makeContext(triSubV.rootPc, triSubV.quality, Quadrant::Tension, "tritone_sub"));
    } else {
        const RelatedChord triSubCurrent = tritoneSubstitution(secDom.rootPc);
        tension.push_back(makeContext(triSubCurrent.rootPc, triSubCurrent.quality, Quadrant::Tension, "tritone_sub"));
    }

    const RelatedChord secDomII = secondaryDominant(root(1));
    if (secDomII.rootPc != rootPc && !hasRoot(tension, secDomII.rootPc)) {
        tension.push_back(makeContext(secDomII.rootPc, secDomII.quality, Quadrant::Tension, "secondary_dom_ii"));
    } else {
        const RelatedChord secDomVI = secondaryDominant(root(5));
        tension.push_back(makeContext(secDomVI.rootPc, secDomVI.quality, Quadrant::Tension, "secondary_dom_vi"));
    }

    const int chainRoot = normalizePc(rootPc + 5);
    if (!hasRoot(tension, chainRoot)) {
        tension.push_back(makeContext(chainRoot, Quality::Dom7, Quadrant::Tension, "dominant_chain"));
    } else {
        tension.push_back(makeContext(rootPc + 7, Quality::Dom7, Quadrant::Tension, "dominant_chain"));
    }

    // --- Portal ---
    QVector<ContextChord> portal;
    const auto portalQuality = [&](int r, Quality outside) {
        return (m_model.diatonicDegree(r, keyPc, mode) >= 0) ? m_model.defaultQuality(r, keyPc, mode) : outside;
    };
    portal.push_back(makeContext(rootPc + 4, portalQuality(rootPc + 4, Quality::Maj7), Quadrant::Portal, "coltrane_up"));
    portal.push_back(makeContext(rootPc + 8, portalQuality(rootPc + 8, Quality::Maj7), Quadrant::Portal, "coltrane_down"));
    portal.push_back(makeContext(rootPc + 1, portalQuality(rootPc + 1, quality), Quadrant::Portal, "chromatic_slide"));
    portal.push_back(makeContext(rootPc + 11, Quality::Dim7, Quadrant::Portal, "diminished_bridge"));

    QVector<ContextChord> out;
    out.reserve(kContextChordCount);
    out += resolve;
    out += color;
    out += tension;
    out += portal;
    while (out.size() < kContextChordCount) {
        out.push_back(makeContext(rootPc + out.size(), Quality::Dom7, Quadrant::Portal, "fill"));
    }
    out.resize(kContextChordCount);
    return out;
}

RingChord ChordSuggester::innerRingChord(int index, int keyPc, Mode mode) const {
    RingChord r;
    r.index = ((index % 12) + 12) % 12;
    r.rootPc = kCircleOfFifths[r.index];
    r.quality = m_model.defaultQuality(r.rootPc, keyPc, mode);
    r.qualityKey = m_model.tables().qualityKey(r.quality);
    r.label = m_model.chordName(r.rootPc, r.quality);
    r.diatonic = m_model.diatonicDegree(r.rootPc, keyPc, mode) >= 0;
    return r;
}

} // namespace chordfield::theory
