#include <biotok/stem/lovins_stemmer.hpp>

#include <unordered_map>
#include <vector>

namespace biotok::stem {

namespace {

using Condition = LovinsStemmer::Condition;

// Ending -> condition on the remaining stem, grouped by initial letter
const std::unordered_map<std::string_view, Condition> ENDINGS = {
    {"a", Condition::A}, {"ae", Condition::A}, {"al", Condition::BB},
    {"ar", Condition::X}, {"as", Condition::B}, {"acy", Condition::A},
    {"age", Condition::B}, {"aic", Condition::A}, {"als", Condition::BB},
    {"ant", Condition::B}, {"ars", Condition::O}, {"ary", Condition::F},
    {"ata", Condition::A}, {"ate", Condition::A}, {"able", Condition::A},
    {"ably", Condition::A}, {"ages", Condition::B}, {"ally", Condition::B},
    {"ance", Condition::B}, {"ancy", Condition::B}, {"ants", Condition::B},
    {"aric", Condition::A}, {"arly", Condition::K}, {"ated", Condition::I},
    {"ates", Condition::A}, {"atic", Condition::B}, {"ator", Condition::A},
    {"acies", Condition::A}, {"acity", Condition::A}, {"aging", Condition::B},
    {"aical", Condition::A}, {"alist", Condition::A}, {"alism", Condition::B},
    {"ality", Condition::A}, {"alize", Condition::A}, {"allic", Condition::BB},
    {"anced", Condition::B}, {"ances", Condition::B}, {"antic", Condition::C},
    {"arial", Condition::A}, {"aries", Condition::A}, {"arily", Condition::A},
    {"arity", Condition::B}, {"arize", Condition::A}, {"aroid", Condition::A},
    {"ately", Condition::A}, {"ating", Condition::I}, {"ation", Condition::B},
    {"ative", Condition::A}, {"ators", Condition::A}, {"atory", Condition::A},
    {"ature", Condition::E}, {"aceous", Condition::A}, {"acious", Condition::B},
    {"action", Condition::G}, {"alness", Condition::A}, {"ancial", Condition::A},
    {"ancies", Condition::A}, {"ancing", Condition::B}, {"ariser", Condition::A},
    {"arized", Condition::A}, {"arizer", Condition::A}, {"atable", Condition::A},
    {"ations", Condition::B}, {"atives", Condition::A}, {"ability", Condition::A},
    {"aically", Condition::A}, {"alistic", Condition::B}, {"alities", Condition::A},
    {"ariness", Condition::E}, {"aristic", Condition::A}, {"arizing", Condition::A},
    {"ateness", Condition::A}, {"atingly", Condition::A}, {"ational", Condition::B},
    {"atively", Condition::A}, {"ativism", Condition::A}, {"ableness", Condition::A},
    {"arizable", Condition::A}, {"allically", Condition::C}, {"antaneous", Condition::A},
    {"antiality", Condition::A}, {"arisation", Condition::A}, {"arization", Condition::A},
    {"ationally", Condition::B}, {"ativeness", Condition::A}, {"antialness", Condition::A},
    {"arisations", Condition::A}, {"arizations", Condition::A}, {"alistically", Condition::B},
    {"arizability", Condition::A},

    {"e", Condition::A}, {"ed", Condition::E}, {"en", Condition::F},
    {"es", Condition::E}, {"eal", Condition::Y}, {"ear", Condition::Y},
    {"ely", Condition::E}, {"ene", Condition::E}, {"ent", Condition::C},
    {"ery", Condition::E}, {"ese", Condition::A}, {"ealy", Condition::Y},
    {"edly", Condition::E}, {"eful", Condition::A}, {"eity", Condition::A},
    {"ence", Condition::A}, {"ency", Condition::A}, {"ened", Condition::E},
    {"enly", Condition::E}, {"eous", Condition::A}, {"early", Condition::Y},
    {"ehood", Condition::A}, {"eless", Condition::A}, {"elily", Condition::A},
    {"ement", Condition::A}, {"enced", Condition::A}, {"ences", Condition::A},
    {"eness", Condition::E}, {"ening", Condition::E}, {"ental", Condition::A},
    {"ented", Condition::C}, {"ently", Condition::A}, {"eature", Condition::Z},
    {"efully", Condition::A}, {"encies", Condition::A}, {"encing", Condition::A},
    {"ential", Condition::A}, {"enting", Condition::C}, {"entist", Condition::A},
    {"eously", Condition::A}, {"elihood", Condition::E}, {"encible", Condition::A},
    {"entally", Condition::A}, {"entials", Condition::A}, {"entiate", Condition::A},
    {"entness", Condition::A}, {"entation", Condition::A}, {"entially", Condition::A},
    {"eousness", Condition::A}, {"eableness", Condition::E}, {"entations", Condition::A},
    {"entiality", Condition::A}, {"entialize", Condition::A}, {"entiation", Condition::A},
    {"entialness", Condition::A},

    {"ful", Condition::A}, {"fully", Condition::A}, {"fulness", Condition::A},

    {"hood", Condition::A},

    {"i", Condition::A}, {"ia", Condition::A}, {"ic", Condition::A},
    {"is", Condition::A}, {"ial", Condition::A}, {"ian", Condition::A},
    {"ics", Condition::A}, {"ide", Condition::L}, {"ied", Condition::A},
    {"ier", Condition::A}, {"ies", Condition::P}, {"ily", Condition::A},
    {"ine", Condition::M}, {"ing", Condition::N}, {"ion", Condition::Q},
    {"ish", Condition::C}, {"ism", Condition::B}, {"ist", Condition::A},
    {"ite", Condition::AA}, {"ity", Condition::A}, {"ium", Condition::A},
    {"ive", Condition::A}, {"ize", Condition::F}, {"ials", Condition::A},
    {"ians", Condition::A}, {"ible", Condition::A}, {"ibly", Condition::A},
    {"ical", Condition::A}, {"ides", Condition::L}, {"iers", Condition::A},
    {"iful", Condition::A}, {"ines", Condition::M}, {"ings", Condition::N},
    {"ions", Condition::B}, {"ious", Condition::A}, {"isms", Condition::B},
    {"ists", Condition::A}, {"itic", Condition::H}, {"ized", Condition::F},
    {"izer", Condition::F}, {"ially", Condition::A}, {"icant", Condition::A},
    {"ician", Condition::A}, {"icide", Condition::A}, {"icism", Condition::A},
    {"icist", Condition::A}, {"icity", Condition::A}, {"idine", Condition::I},
    {"iedly", Condition::A}, {"ihood", Condition::A}, {"inate", Condition::A},
    {"iness", Condition::A}, {"ingly", Condition::B}, {"inism", Condition::J},
    {"inity", Condition::CC}, {"ional", Condition::A}, {"ioned", Condition::A},
    {"ished", Condition::A}, {"istic", Condition::A}, {"ities", Condition::A},
    {"itous", Condition::A}, {"ively", Condition::A}, {"ivity", Condition::A},
    {"izers", Condition::F}, {"izing", Condition::F}, {"ialist", Condition::A},
    {"iality", Condition::A}, {"ialize", Condition::A}, {"ically", Condition::A},
    {"icance", Condition::A}, {"icians", Condition::A}, {"icists", Condition::A},
    {"ifully", Condition::A}, {"ionals", Condition::A}, {"ionate", Condition::D},
    {"ioning", Condition::A}, {"ionist", Condition::A}, {"iously", Condition::A},
    {"istics", Condition::A}, {"izable", Condition::E}, {"ibility", Condition::A},
    {"icalism", Condition::A}, {"icalist", Condition::A}, {"icality", Condition::A},
    {"icalize", Condition::A}, {"ication", Condition::G}, {"icianry", Condition::A},
    {"ination", Condition::A}, {"ingness", Condition::A}, {"ionally", Condition::A},
    {"isation", Condition::A}, {"ishness", Condition::A}, {"istical", Condition::A},
    {"iteness", Condition::A}, {"iveness", Condition::A}, {"ivistic", Condition::A},
    {"ivities", Condition::A}, {"ization", Condition::F}, {"izement", Condition::A},
    {"ibleness", Condition::A}, {"icalness", Condition::A}, {"ionalism", Condition::A},
    {"ionality", Condition::A}, {"ionalize", Condition::A}, {"iousness", Condition::A},
    {"izations", Condition::A}, {"ionalness", Condition::A}, {"istically", Condition::A},
    {"itousness", Condition::A}, {"izability", Condition::A}, {"izational", Condition::A},
    {"izationally", Condition::B},

    {"ly", Condition::B}, {"less", Condition::A}, {"lily", Condition::A},
    {"lessly", Condition::A}, {"lessness", Condition::A},

    {"ness", Condition::A}, {"nesses", Condition::A},

    {"o", Condition::A}, {"on", Condition::S}, {"or", Condition::T},
    {"oid", Condition::A}, {"one", Condition::R}, {"ous", Condition::A},
    {"ogen", Condition::A}, {"oidal", Condition::A}, {"oides", Condition::A},
    {"otide", Condition::A}, {"ously", Condition::A}, {"oidism", Condition::A},
    {"oidally", Condition::A}, {"ousness", Condition::A},

    {"s", Condition::W}, {"s'", Condition::A},

    {"um", Condition::U}, {"us", Condition::V},

    {"ward", Condition::A}, {"wise", Condition::A},

    {"y", Condition::B}, {"yl", Condition::R}, {"ying", Condition::B},
    {"yish", Condition::A},

    {"'s", Condition::A},
};

// ============================================================================
// Stem predicates
// ============================================================================

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool ends_with_any(std::string_view s, std::string_view chars) {
    return !s.empty() && chars.find(s.back()) != std::string_view::npos;
}

// Last character is c and the one before it is not `not_before`
bool ends_with_unless_after(std::string_view s, char c, char not_before) {
    return s.size() >= 2 && s.back() == c && s[s.size() - 2] != not_before;
}

// (l|i|u.e)$
bool ends_li_or_u_e(std::string_view s) {
    return ends_with_any(s, "li") ||
           (s.size() >= 3 && s[s.size() - 3] == 'u' && s.back() == 'e');
}

// ============================================================================
// Phase 2 respelling
// ============================================================================

enum class Context : uint8_t {
    ANY,
    WHOLE_WORD,     // the ending is the entire stem
    NOT_PRECEDED    // the ending follows a character outside `excluded`
};

struct Respelling {
    std::string_view ending;
    std::string_view replacement;
    Context context = Context::ANY;
    std::string_view excluded = {};
};

// Keyed by the final character of the stem; the first matching rule applies
const std::unordered_map<char, std::vector<Respelling>> RESPELLINGS = {
    {'t', {{"tt", "t"}, {"uct", "uc"}, {"umpt", "um"}, {"rpt", "rb"},
           {"mit", "mis"}, {"ert", "ers"},
           {"et", "es", Context::WHOLE_WORD},
           {"et", "es", Context::NOT_PRECEDED, "n"},
           {"yt", "ys"}}},
    {'r', {{"rr", "r"}, {"istr", "ister"}, {"metr", "meter"},
           {"her", "hes", Context::WHOLE_WORD},
           {"her", "hes", Context::NOT_PRECEDED, "pt"}}},
    {'d', {{"dd", "d"}, {"uad", "uas"}, {"vad", "vas"}, {"cid", "cis"},
           {"lid", "lis"}, {"erid", "eris"}, {"pand", "pans"},
           {"end", "ens", Context::WHOLE_WORD},
           {"end", "ens", Context::NOT_PRECEDED, "sm"},
           {"ond", "ons"}, {"lud", "lus"}, {"rud", "rus"}}},
    {'n', {{"nn", "n"}}},
    {'l', {{"ll", "l"},
           {"ul", "l", Context::NOT_PRECEDED, "aio"}}},
    {'m', {{"mm", "m"}}},
    {'s', {{"ss", "s"}, {"urs", "ur"}}},
    {'g', {{"gg", "g"}}},
    {'v', {{"iev", "ief"}, {"olv", "olut"}}},
    {'p', {{"pp", "p"}}},
    {'b', {{"bb", "b"}}},
    {'x', {{"bex", "bic"}, {"dex", "dic"}, {"pex", "pic"}, {"tex", "tic"},
           {"ax", "ac"}, {"ex", "ec"}, {"ix", "ic"}, {"lux", "luc"}}},
    {'z', {{"yz", "ys"}}},
};

bool respelling_applies(const Respelling& rule, const std::string& stem) {
    if (!ends_with(stem, rule.ending)) {
        return false;
    }
    switch (rule.context) {
        case Context::ANY:
            return true;
        case Context::WHOLE_WORD:
            return stem.size() == rule.ending.size();
        case Context::NOT_PRECEDED:
            return stem.size() > rule.ending.size() &&
                   rule.excluded.find(stem[stem.size() - rule.ending.size() - 1]) ==
                       std::string_view::npos;
    }
    return false;
}

}  // namespace

std::optional<LovinsStemmer::Condition> LovinsStemmer::find_ending(std::string_view ending) {
    auto it = ENDINGS.find(ending);
    if (it == ENDINGS.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t LovinsStemmer::ending_count() {
    return ENDINGS.size();
}

bool LovinsStemmer::condition_holds(Condition condition, std::string_view stem) {
    const size_t len = stem.size();

    switch (condition) {
        case Condition::A: return true;
        case Condition::B: return len >= 3;
        case Condition::C: return len >= 4;
        case Condition::D: return len >= 5;
        case Condition::E: return !ends_with_any(stem, "e");
        case Condition::F: return len >= 3 && !ends_with_any(stem, "e");
        case Condition::G: return len >= 3 && ends_with_any(stem, "f");
        case Condition::H: return ends_with_any(stem, "t") || ends_with(stem, "ll");
        case Condition::I: return !ends_with_any(stem, "oe");
        case Condition::J: return !ends_with_any(stem, "ae");
        case Condition::K: return len >= 3 && ends_li_or_u_e(stem);
        case Condition::L:
            return !ends_with_any(stem, "ux") && !ends_with_unless_after(stem, 's', 'o');
        case Condition::M: return !ends_with_any(stem, "aecm");
        // ([^s]..|.s..)$
        case Condition::N: return len >= 3 && (stem[len - 3] != 's' || len >= 4);
        case Condition::O: return ends_with_any(stem, "li");
        case Condition::P: return !ends_with_any(stem, "c");
        case Condition::Q: return len >= 3 && !ends_with_any(stem, "ln");
        case Condition::R: return ends_with_any(stem, "nr");
        case Condition::S:
            return ends_with(stem, "dr") || ends_with_unless_after(stem, 't', 't');
        case Condition::T:
            return ends_with_any(stem, "s") || ends_with_unless_after(stem, 't', 'o');
        case Condition::U: return ends_with_any(stem, "lmnr");
        case Condition::V: return ends_with_any(stem, "c");
        case Condition::W: return !ends_with_any(stem, "su");
        case Condition::X: return ends_li_or_u_e(stem);
        case Condition::Y: return ends_with(stem, "in");
        case Condition::Z: return !ends_with_any(stem, "f");
        case Condition::AA:
            return ends_with_any(stem, "dflt") || ends_with(stem, "ph") ||
                   ends_with(stem, "th") || ends_with(stem, "er") ||
                   ends_with(stem, "or") || ends_with(stem, "es");
        case Condition::BB:
            return len >= 3 && !ends_with(stem, "met") && !ends_with(stem, "ryst");
        case Condition::CC: return ends_with_any(stem, "l");
    }
    return false;
}

std::string LovinsStemmer::respell(std::string stem) {
    if (stem.empty()) {
        return stem;
    }

    auto it = RESPELLINGS.find(stem.back());
    if (it == RESPELLINGS.end()) {
        return stem;
    }

    for (const auto& rule : it->second) {
        if (respelling_applies(rule, stem)) {
            stem.resize(stem.size() - rule.ending.size());
            stem.append(rule.replacement.data(), rule.replacement.size());
            break;
        }
    }
    return stem;
}

std::string LovinsStemmer::stem(const std::string& word) const {
    if (word.size() <= MIN_STEM_LENGTH) {
        return word;
    }

    const std::string_view view(word);
    size_t prefix_len = word.size() <= MIN_STEM_LENGTH + MAX_ENDING_LENGTH
                            ? MIN_STEM_LENGTH
                            : word.size() - MAX_ENDING_LENGTH;

    std::string result = word;
    for (; prefix_len < word.size(); ++prefix_len) {
        auto condition = find_ending(view.substr(prefix_len));
        if (condition && condition_holds(*condition, view.substr(0, prefix_len))) {
            result = word.substr(0, prefix_len);
            break;
        }
    }

    return respell(std::move(result));
}

}  // namespace biotok::stem
