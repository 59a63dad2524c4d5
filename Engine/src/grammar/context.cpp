/**
 * @file context.cpp
 */

#include <grammar/context.hpp>
#include <grammar/language_detect.hpp>

namespace Glossa {

std::string LinContext::resolve_label(const std::string& label, std::optional<SymbolId> id) const {
    if (registry && id) {
        if (auto canonical = registry->label_of(*id)) return *canonical;
    }
    return label;
}

const Lexicon& LinContext::active_lexicon() const {
    return lexicon ? *lexicon : Lexicon::for_language(language);
}

const Lexicon& ParseContext::lexicon_for(std::string_view input) const {
    if (lexicon) return *lexicon;
    if (language != Language::Auto) return Lexicon::for_language(language);
    return Lexicon::for_language(detect_language(input).language);
}

} // namespace Glossa
