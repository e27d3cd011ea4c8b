#include <biotok/stem/stemmer.hpp>
#include <biotok/stem/lovins_stemmer.hpp>
#include <biotok/stem/porter_stemmer.hpp>
#include <biotok/stem/s_stemmer.hpp>

namespace biotok::stem {

StemmerPtr make_stemmer(StemmerKind kind) {
    switch (kind) {
        case StemmerKind::PORTER:
            return std::make_unique<PorterStemmer>();
        case StemmerKind::LOVINS:
            return std::make_unique<LovinsStemmer>();
        case StemmerKind::S_STEMMER:
            return std::make_unique<SStemmer>();
        case StemmerKind::NONE:
            break;
    }
    return nullptr;
}

}  // namespace biotok::stem
