#include <gtest/gtest.h>
#include <biotok/stem/lovins_stemmer.hpp>
#include <biotok/stem/porter_stemmer.hpp>
#include <biotok/stem/s_stemmer.hpp>
#include <biotok/stem/stemmer.hpp>

#include <utility>
#include <vector>

using namespace biotok;
using namespace biotok::stem;

// ============================================================================
// Porter
// ============================================================================

class PorterStemmerTest : public ::testing::Test {
protected:
    void expect_stems(const std::vector<std::pair<std::string, std::string>>& cases) {
        for (const auto& [word, expected] : cases) {
            EXPECT_EQ(stemmer_.stem(word), expected) << "word: " << word;
        }
    }

    PorterStemmer stemmer_;
};

TEST_F(PorterStemmerTest, Step1Plurals) {
    expect_stems({
        {"caresses", "caress"},
        {"ponies", "poni"},
        {"cats", "cat"},
    });
}

TEST_F(PorterStemmerTest, Step1PastAndProgressive) {
    expect_stems({
        {"feed", "feed"},
        {"agreed", "agre"},
        {"plastered", "plaster"},
        {"motoring", "motor"},
        {"sing", "sing"},
        {"conflated", "conflat"},
        {"sized", "size"},
        {"hopping", "hop"},
        {"tanned", "tan"},
        {"falling", "fall"},
        {"hissing", "hiss"},
        {"filing", "file"},
    });
}

TEST_F(PorterStemmerTest, TerminalY) {
    expect_stems({
        {"happy", "happi"},
        {"sky", "sky"},
    });
}

TEST_F(PorterStemmerTest, LaterSteps) {
    expect_stems({
        {"relational", "relat"},
        {"generalization", "gener"},
        {"hopeful", "hope"},
        {"goodness", "good"},
        {"adjustable", "adjust"},
        {"rate", "rate"},
        {"cease", "ceas"},
    });
}

TEST_F(PorterStemmerTest, ShortWordsUnchanged) {
    EXPECT_EQ(stemmer_.stem(""), "");
    EXPECT_EQ(stemmer_.stem("is"), "is");
    EXPECT_EQ(stemmer_.stem("as"), "as");
}

TEST_F(PorterStemmerTest, MeasurePredicates) {
    EXPECT_FALSE(PorterStemmer::measure_gt0("tr", false));
    EXPECT_TRUE(PorterStemmer::measure_gt0("trouble", false));
    EXPECT_TRUE(PorterStemmer::measure_eq1("oats", false));
    EXPECT_FALSE(PorterStemmer::measure_eq1("private", false));
    EXPECT_TRUE(PorterStemmer::measure_gt1("private", false));
    EXPECT_FALSE(PorterStemmer::contains_vowel("sk", false));
    EXPECT_TRUE(PorterStemmer::ends_cvc("hop", false));
    EXPECT_FALSE(PorterStemmer::ends_cvc("saw", false));
}

TEST_F(PorterStemmerTest, LeadingYWords) {
    expect_stems({
        {"yelled", "yell"},
        {"yearly", "yearli"},
        {"yes", "ye"},
        {"yttrium", "yttrium"},
    });
}

TEST_F(PorterStemmerTest, NotIdempotent) {
    // A stem can itself end in a removable suffix
    EXPECT_EQ(stemmer_.stem("agreed"), "agre");
    EXPECT_EQ(stemmer_.stem("agre"), "agr");

    EXPECT_EQ(stemmer_.stem("motoring"), "motor");
    EXPECT_EQ(stemmer_.stem("motor"), "motor");
}

TEST_F(PorterStemmerTest, LeadingYIsConsonant) {
    // "y" alone contributes no vowel when it starts the word
    EXPECT_FALSE(PorterStemmer::contains_vowel("y", true));
    EXPECT_TRUE(PorterStemmer::contains_vowel("ty", false));
}

// ============================================================================
// Lovins
// ============================================================================

class LovinsStemmerTest : public ::testing::Test {
protected:
    LovinsStemmer stemmer_;
};

TEST_F(LovinsStemmerTest, RemovesLongestEnding) {
    EXPECT_EQ(stemmer_.stem("nationally"), "nat");
}

TEST_F(LovinsStemmerTest, RespellsDoubledConsonant) {
    EXPECT_EQ(stemmer_.stem("sitting"), "sit");
}

TEST_F(LovinsStemmerTest, LongWordsStartPastMinimumStem) {
    // Longer than 13 characters: the first candidate ending is the last 11
    EXPECT_EQ(stemmer_.stem("internationalization"), "international");
    EXPECT_EQ(stemmer_.stem("antidisestablishment"), "antidisestablishm");
}

TEST_F(LovinsStemmerTest, FailedConditionKeepsWord) {
    // "al" needs condition BB, which rejects stems ending in met or ryst
    EXPECT_EQ(stemmer_.stem("metal"), "metal");
    EXPECT_EQ(stemmer_.stem("crystal"), "crystal");
}

TEST_F(LovinsStemmerTest, ShortWordsUnchanged) {
    EXPECT_EQ(stemmer_.stem("at"), "at");
    EXPECT_EQ(stemmer_.stem(""), "");
}

TEST_F(LovinsStemmerTest, EndingTable) {
    EXPECT_EQ(LovinsStemmer::ending_count(), 294u);

    auto ing = LovinsStemmer::find_ending("ing");
    ASSERT_TRUE(ing.has_value());
    EXPECT_EQ(*ing, LovinsStemmer::Condition::N);

    EXPECT_FALSE(LovinsStemmer::find_ending("xyz").has_value());
}

TEST_F(LovinsStemmerTest, Conditions) {
    using Condition = LovinsStemmer::Condition;

    struct Case {
        Condition condition;
        const char* stem;
        bool holds;
    };

    const std::vector<Case> cases = {
        {Condition::A, "ab", true},
        {Condition::B, "ab", false},    {Condition::B, "abc", true},
        {Condition::C, "abc", false},   {Condition::C, "abcd", true},
        {Condition::D, "abcd", false},  {Condition::D, "abcde", true},
        {Condition::E, "take", false},  {Condition::E, "tak", true},
        {Condition::F, "ab", false},    {Condition::F, "abe", false},
        {Condition::F, "abc", true},
        {Condition::G, "af", false},    {Condition::G, "abc", false},
        {Condition::G, "abf", true},
        {Condition::H, "cat", true},    {Condition::H, "call", true},
        {Condition::H, "cal", false},
        {Condition::I, "tho", false},   {Condition::I, "thi", true},
        {Condition::J, "tha", false},   {Condition::J, "tho", true},
        {Condition::K, "abl", true},    {Condition::K, "abi", true},
        {Condition::K, "uxe", true},    {Condition::K, "al", false},
        {Condition::K, "abc", false},
        {Condition::L, "abu", false},   {Condition::L, "abx", false},
        {Condition::L, "abs", false},   {Condition::L, "abos", true},
        {Condition::L, "abc", true},
        {Condition::M, "aba", false},   {Condition::M, "abm", false},
        {Condition::M, "abd", true},
        {Condition::N, "ab", false},    {Condition::N, "sit", false},
        {Condition::N, "sitt", true},   {Condition::N, "abc", true},
        {Condition::O, "abl", true},    {Condition::O, "abi", true},
        {Condition::O, "abc", false},
        {Condition::P, "abc", false},   {Condition::P, "abd", true},
        {Condition::Q, "ab", false},    {Condition::Q, "abl", false},
        {Condition::Q, "abd", true},
        {Condition::R, "abn", true},    {Condition::R, "abr", true},
        {Condition::R, "abd", false},
        {Condition::S, "abdr", true},   {Condition::S, "abt", true},
        {Condition::S, "abtt", false},  {Condition::S, "abd", false},
        {Condition::T, "abs", true},    {Condition::T, "abt", true},
        {Condition::T, "abot", false},
        {Condition::U, "abm", true},    {Condition::U, "abd", false},
        {Condition::V, "abc", true},    {Condition::V, "abd", false},
        {Condition::W, "abs", false},   {Condition::W, "abu", false},
        {Condition::W, "abd", true},
        {Condition::X, "al", true},     {Condition::X, "uxe", true},
        {Condition::X, "abc", false},
        {Condition::Y, "abin", true},   {Condition::Y, "abi", false},
        {Condition::Z, "abf", false},   {Condition::Z, "abd", true},
        {Condition::AA, "abd", true},   {Condition::AA, "abph", true},
        {Condition::AA, "abes", true},  {Condition::AA, "abt", true},
        {Condition::AA, "abc", false},
        {Condition::BB, "ab", false},   {Condition::BB, "abmet", false},
        {Condition::BB, "cryst", false}, {Condition::BB, "abc", true},
        {Condition::CC, "abl", true},   {Condition::CC, "abd", false},
    };

    for (const auto& c : cases) {
        EXPECT_EQ(LovinsStemmer::condition_holds(c.condition, c.stem), c.holds)
            << "condition " << static_cast<int>(c.condition) << " on " << c.stem;
    }
}

TEST_F(LovinsStemmerTest, Respelling) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        // doubled consonants
        {"sitt", "sit"}, {"occurr", "occur"}, {"add", "ad"}, {"plann", "plan"},
        {"fill", "fil"}, {"comm", "com"}, {"pass", "pas"}, {"begg", "beg"},
        {"stopp", "stop"}, {"grabb", "grab"},
        // final t
        {"induct", "induc"}, {"consumpt", "consum"}, {"absorpt", "absorb"},
        {"remit", "remis"}, {"convert", "convers"}, {"et", "es"},
        {"comet", "comes"}, {"planet", "planet"}, {"analyt", "analys"},
        // final r
        {"ministr", "minister"}, {"parametr", "parameter"}, {"her", "hes"},
        {"adher", "adhes"}, {"tether", "tether"},
        // final d
        {"persuad", "persuas"}, {"invad", "invas"}, {"decid", "decis"},
        {"collid", "collis"}, {"erid", "eris"}, {"expand", "expans"},
        {"extend", "extens"}, {"end", "ens"}, {"amend", "amend"},
        {"respond", "respons"}, {"conclud", "conclus"}, {"intrud", "intrus"},
        // final l
        {"modul", "modl"}, {"caul", "caul"},
        // final s, v, x, z
        {"recurs", "recur"}, {"reliev", "relief"}, {"solv", "solut"},
        {"index", "indic"}, {"vortex", "vortic"}, {"thorax", "thorac"},
        {"simplex", "simplec"}, {"matrix", "matric"}, {"flux", "fluc"},
        {"analyz", "analys"},
        // no rule
        {"nat", "nat"}, {"", ""},
    };

    for (const auto& [stem, expected] : cases) {
        EXPECT_EQ(LovinsStemmer::respell(stem), expected) << "stem: " << stem;
    }
}

// ============================================================================
// S-stemmer
// ============================================================================

class SStemmerTest : public ::testing::Test {
protected:
    SStemmer stemmer_;
};

TEST_F(SStemmerTest, Ies) {
    EXPECT_EQ(stemmer_.stem("ponies"), "pony");
    EXPECT_EQ(stemmer_.stem("ies"), "y");
    EXPECT_EQ(stemmer_.stem("aies"), "aies");
    EXPECT_EQ(stemmer_.stem("eies"), "eies");
}

TEST_F(SStemmerTest, Es) {
    EXPECT_EQ(stemmer_.stem("es"), "e");
    EXPECT_EQ(stemmer_.stem("horses"), "horse");
    EXPECT_EQ(stemmer_.stem("toes"), "toes");
    EXPECT_EQ(stemmer_.stem("trees"), "trees");
}

TEST_F(SStemmerTest, S) {
    EXPECT_EQ(stemmer_.stem("cats"), "cat");
    EXPECT_EQ(stemmer_.stem("status"), "status");
    EXPECT_EQ(stemmer_.stem("glass"), "glass");
    EXPECT_EQ(stemmer_.stem("s"), "s");
    EXPECT_EQ(stemmer_.stem("cell"), "cell");
}

TEST_F(SStemmerTest, OnlyFinalSuffix) {
    EXPECT_EQ(stemmer_.stem("iesx"), "iesx");
}

// ============================================================================
// Factory
// ============================================================================

TEST(StemmerFactoryTest, MakesEachKind) {
    EXPECT_EQ(make_stemmer(StemmerKind::NONE), nullptr);

    auto porter = make_stemmer(StemmerKind::PORTER);
    ASSERT_NE(porter, nullptr);
    EXPECT_EQ(porter->kind(), StemmerKind::PORTER);
    EXPECT_STREQ(porter->name(), "porter");

    auto lovins = make_stemmer(StemmerKind::LOVINS);
    ASSERT_NE(lovins, nullptr);
    EXPECT_EQ(lovins->kind(), StemmerKind::LOVINS);

    auto s = make_stemmer(StemmerKind::S_STEMMER);
    ASSERT_NE(s, nullptr);
    EXPECT_STREQ(s->name(), "s-stemmer");
}
