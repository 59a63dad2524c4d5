/**
 * @file lexicon.cpp
 * @brief Function-word tables for English, Russian, Arabic, French and Spanish
 */

#include <grammar/lexicon.hpp>
#include <grammar/error.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <cctype>

namespace Glossa {

namespace {

bool contains(const std::vector<std::string>& list, std::string_view word) {
    return std::find(list.begin(), list.end(), word) != list.end();
}

/// Lowercased words with edge punctuation removed; empty words dropped.
std::vector<std::string> clean_words(std::string_view input) {
    std::vector<std::string> out;
    for (const auto& w : split_words(input)) {
        std::string c = strip_edge_punctuation(w);
        if (!c.empty()) out.push_back(std::move(c));
    }
    return out;
}

std::string_view strip_question_marks(std::string_view s) {
    s = trim(s);
    for (;;) {
        if (ends_with(s, "?")) s.remove_suffix(1);
        else if (ends_with(s, "\xD8\x9F")) s.remove_suffix(2);         // ؟
        else if (ends_with(s, "\xEF\xBC\x9F")) s.remove_suffix(3);     // ？
        else break;
        s = trim(s);
    }
    return s;
}

bool is_question_mark_end(std::string_view s) {
    s = trim(s);
    return ends_with(s, "?") || ends_with(s, "\xD8\x9F") || ends_with(s, "\xEF\xBC\x9F");
}

/// First run of ASCII digits, as a count.
std::optional<size_t> first_number(std::string_view s) {
    for (const auto& w : split_words(s)) {
        if (!w.empty() && std::all_of(w.begin(), w.end(), [](unsigned char c) { return std::isdigit(c); })) {
            try {
                return static_cast<size_t>(std::stoull(w));
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

/// "prefix" alone or "prefix " followed by anything.
bool word_prefix(std::string_view text, std::string_view prefix) {
    if (text == prefix) return true;
    return text.size() > prefix.size() && starts_with(text, prefix) && text[prefix.size()] == ' ';
}

} // namespace

// =============================================================================
// Language codes
// =============================================================================

const char* language_code(Language lang) {
    switch (lang) {
        case Language::English: return "en";
        case Language::Russian: return "ru";
        case Language::Arabic:  return "ar";
        case Language::French:  return "fr";
        case Language::Spanish: return "es";
        case Language::Auto:    return "auto";
    }
    return "auto";
}

const char* language_name(Language lang) {
    switch (lang) {
        case Language::English: return "English";
        case Language::Russian: return "Russian";
        case Language::Arabic:  return "Arabic";
        case Language::French:  return "French";
        case Language::Spanish: return "Spanish";
        case Language::Auto:    return "Auto";
    }
    return "Auto";
}

Language language_from_code(std::string_view code) {
    std::string c = to_lower(trim(code));
    if (c == "en" || c == "english") return Language::English;
    if (c == "ru" || c == "russian") return Language::Russian;
    if (c == "ar" || c == "arabic")  return Language::Arabic;
    if (c == "fr" || c == "french")  return Language::French;
    if (c == "es" || c == "spanish") return Language::Spanish;
    if (c == "auto") return Language::Auto;
    throw UnsupportedLanguage(std::string(code));
}

const char* question_word_name(QuestionWord q) {
    switch (q) {
        case QuestionWord::What:  return "what";
        case QuestionWord::Who:   return "who";
        case QuestionWord::Where: return "where";
        case QuestionWord::When:  return "when";
        case QuestionWord::How:   return "how";
        case QuestionWord::Why:   return "why";
        case QuestionWord::Which: return "which";
        case QuestionWord::YesNo: return "yes-no";
    }
    return "what";
}

const char* command_kind_name(Command::Kind kind) {
    switch (kind) {
        case Command::Kind::Help:        return "help";
        case Command::Kind::ShowStatus:  return "show-status";
        case Command::Kind::RunAgent:    return "run-agent";
        case Command::Kind::RenderHiero: return "render-hiero";
        case Command::Kind::SetGoal:     return "set-goal";
    }
    return "help";
}

std::string QuestionFrame::subject() const {
    return join(content, " ");
}

// =============================================================================
// Construction
// =============================================================================

void Lexicon::add_pattern(std::string_view words, std::string label, float confidence) {
    relational_patterns_.push_back({split_words(words), std::move(label), confidence});
}

void Lexicon::add_question(std::string_view words, QuestionWord kind) {
    question_words_.push_back({split_words(words), kind});
}

void Lexicon::finish() {
    // Longest pattern first so "is part of" wins over "is a" style prefixes.
    std::stable_sort(relational_patterns_.begin(), relational_patterns_.end(),
                     [](const RelationalPattern& a, const RelationalPattern& b) {
                         return a.words.size() > b.words.size();
                     });
    std::stable_sort(question_words_.begin(), question_words_.end(),
                     [](const QuestionEntry& a, const QuestionEntry& b) {
                         return a.words.size() > b.words.size();
                     });
}

Lexicon Lexicon::english() {
    Lexicon lx(Language::English);
    lx.void_words_ = {"a", "an", "the"};

    lx.add_pattern("is similar to", "similar-to", 0.85f);
    lx.add_pattern("is located in", "located-in", 0.90f);
    lx.add_pattern("is composed of", "composed-of", 0.85f);
    lx.add_pattern("is part of", "part-of", 0.90f);
    lx.add_pattern("is made of", "composed-of", 0.85f);
    lx.add_pattern("depends on", "depends-on", 0.85f);
    lx.add_pattern("belongs to", "part-of", 0.85f);
    lx.add_pattern("is a", "is-a", 0.90f);
    lx.add_pattern("is an", "is-a", 0.90f);
    lx.add_pattern("are a", "is-a", 0.85f);
    lx.add_pattern("are an", "is-a", 0.85f);
    lx.add_pattern("has a", "has-a", 0.85f);
    lx.add_pattern("has an", "has-a", 0.85f);
    lx.add_pattern("have a", "has-a", 0.85f);
    lx.add_pattern("are", "is-a", 0.85f);
    lx.add_pattern("has", "has-a", 0.85f);
    lx.add_pattern("have", "has-a", 0.85f);
    lx.add_pattern("contains", "contains", 0.85f);
    lx.add_pattern("causes", "causes", 0.85f);
    lx.add_pattern("implements", "implements", 0.85f);
    lx.add_pattern("defines", "defines", 0.85f);

    lx.add_question("what", QuestionWord::What);
    lx.add_question("who", QuestionWord::Who);
    lx.add_question("where", QuestionWord::Where);
    lx.add_question("when", QuestionWord::When);
    lx.add_question("how", QuestionWord::How);
    lx.add_question("why", QuestionWord::Why);
    lx.add_question("which", QuestionWord::Which);
    lx.add_question("is", QuestionWord::YesNo);
    lx.add_question("does", QuestionWord::YesNo);
    lx.add_question("do", QuestionWord::YesNo);
    lx.add_question("can", QuestionWord::YesNo);

    lx.auxiliary_verbs_ = {"is", "are", "was", "were", "do", "does", "did", "can", "could",
                           "will", "would", "should", "has", "have", "may", "might", "about"};
    lx.trailing_auxiliaries_ = {"do", "does", "did", "is", "are", "was", "were", "be", "have", "has"};
    lx.capability_modals_ = {"can", "could"};

    lx.goal_verbs_ = {"find", "learn", "discover", "explore", "search",
                      "analyze", "investigate", "determine", "classify", "identify"};

    lx.commands_ = {{"help", Command::Kind::Help},
                    {"?", Command::Kind::Help},
                    {"status", Command::Kind::ShowStatus},
                    {"goals", Command::Kind::ShowStatus},
                    {"show status", Command::Kind::ShowStatus},
                    {"show goals", Command::Kind::ShowStatus},
                    {"list goals", Command::Kind::ShowStatus}};
    lx.run_words_ = {"run", "cycle"};
    lx.show_words_ = {"show", "render", "graph"};
    lx.status_words_ = {"status", "goals"};

    lx.and_words_ = {"and"};
    lx.or_words_ = {"or"};
    lx.finish();
    return lx;
}

Lexicon Lexicon::russian() {
    Lexicon lx(Language::Russian);
    // No articles.
    lx.void_words_ = {};

    lx.add_pattern("является частью", "part-of", 0.90f);
    lx.add_pattern("находится в", "located-in", 0.90f);
    lx.add_pattern("расположен в", "located-in", 0.90f);
    lx.add_pattern("похож на", "similar-to", 0.85f);
    lx.add_pattern("похожа на", "similar-to", 0.85f);
    lx.add_pattern("состоит из", "composed-of", 0.85f);
    lx.add_pattern("зависит от", "depends-on", 0.85f);
    lx.add_pattern("принадлежит", "part-of", 0.85f);
    lx.add_pattern("является", "is-a", 0.90f);
    lx.add_pattern("это", "is-a", 0.85f);
    lx.add_pattern("имеет", "has-a", 0.85f);
    lx.add_pattern("содержит", "contains", 0.85f);
    lx.add_pattern("вызывает", "causes", 0.85f);
    lx.add_pattern("реализует", "implements", 0.85f);
    lx.add_pattern("определяет", "defines", 0.85f);

    lx.add_question("что", QuestionWord::What);
    lx.add_question("кто", QuestionWord::Who);
    lx.add_question("где", QuestionWord::Where);
    lx.add_question("когда", QuestionWord::When);
    lx.add_question("как", QuestionWord::How);
    lx.add_question("почему", QuestionWord::Why);
    lx.add_question("зачем", QuestionWord::Why);
    lx.add_question("какой", QuestionWord::Which);
    lx.add_question("какая", QuestionWord::Which);
    lx.add_question("какое", QuestionWord::Which);
    lx.add_question("какие", QuestionWord::Which);
    lx.add_question("можешь", QuestionWord::YesNo);
    lx.add_question("может", QuestionWord::YesNo);

    lx.auxiliary_verbs_ = {"есть", "является", "будет", "был", "была", "были",
                           "может", "можешь", "можете", "умеешь", "умеете", "такое"};
    lx.trailing_auxiliaries_ = {"делать", "сделать", "является", "есть"};
    lx.capability_modals_ = {"может", "можешь", "можете", "умеешь", "умеете", "можно"};

    lx.goal_verbs_ = {"найти", "найди", "изучить", "изучи", "исследовать", "исследуй",
                      "узнать", "узнай", "определить", "проанализировать", "классифицировать", "выяснить"};

    lx.commands_ = {{"помощь", Command::Kind::Help},
                    {"справка", Command::Kind::Help},
                    {"?", Command::Kind::Help},
                    {"статус", Command::Kind::ShowStatus},
                    {"цели", Command::Kind::ShowStatus},
                    {"показать статус", Command::Kind::ShowStatus},
                    {"показать цели", Command::Kind::ShowStatus}};
    lx.run_words_ = {"запуск", "запустить", "цикл"};
    lx.show_words_ = {"показать", "покажи", "граф"};
    lx.status_words_ = {"статус", "цели"};

    lx.and_words_ = {"и"};
    lx.or_words_ = {"или"};
    lx.finish();
    return lx;
}

Lexicon Lexicon::arabic() {
    Lexicon lx(Language::Arabic);
    // The article is the clitic ال, never a separate word.
    lx.void_words_ = {"أن"};

    lx.add_pattern("جزء من", "part-of", 0.90f);
    lx.add_pattern("يقع في", "located-in", 0.90f);
    lx.add_pattern("تقع في", "located-in", 0.90f);
    lx.add_pattern("يتكون من", "composed-of", 0.85f);
    lx.add_pattern("تتكون من", "composed-of", 0.85f);
    lx.add_pattern("يعتمد على", "depends-on", 0.85f);
    lx.add_pattern("يحتوي على", "contains", 0.85f);
    lx.add_pattern("يشبه", "similar-to", 0.85f);
    lx.add_pattern("تشبه", "similar-to", 0.85f);
    lx.add_pattern("هو", "is-a", 0.85f);
    lx.add_pattern("هي", "is-a", 0.85f);
    lx.add_pattern("لديه", "has-a", 0.85f);
    lx.add_pattern("لديها", "has-a", 0.85f);
    lx.add_pattern("يسبب", "causes", 0.85f);
    lx.add_pattern("ينفذ", "implements", 0.85f);
    lx.add_pattern("يعرف", "defines", 0.85f);

    lx.add_question("ما", QuestionWord::What);
    lx.add_question("ماذا", QuestionWord::What);
    lx.add_question("من", QuestionWord::Who);
    lx.add_question("أين", QuestionWord::Where);
    lx.add_question("متى", QuestionWord::When);
    lx.add_question("كيف", QuestionWord::How);
    lx.add_question("لماذا", QuestionWord::Why);
    lx.add_question("أي", QuestionWord::Which);
    lx.add_question("هل", QuestionWord::YesNo);

    lx.auxiliary_verbs_ = {"هو", "هي", "يمكن", "يمكنك", "تستطيع", "يستطيع", "كان", "يكون"};
    lx.trailing_auxiliaries_ = {"تفعل", "يفعل", "تعمل"};
    lx.capability_modals_ = {"يمكن", "يمكنك", "تستطيع", "يستطيع"};

    lx.goal_verbs_ = {"ابحث", "تعلم", "اكتشف", "استكشف", "حلل", "حدد", "صنف"};

    lx.commands_ = {{"مساعدة", Command::Kind::Help},
                    {"?", Command::Kind::Help},
                    {"؟", Command::Kind::Help},
                    {"الحالة", Command::Kind::ShowStatus},
                    {"الأهداف", Command::Kind::ShowStatus}};
    lx.run_words_ = {"تشغيل", "دورة"};
    lx.show_words_ = {"اعرض", "ارسم"};
    lx.status_words_ = {"الحالة", "الأهداف"};

    lx.and_words_ = {"و"};
    lx.or_words_ = {"أو"};
    lx.finish();
    return lx;
}

Lexicon Lexicon::french() {
    Lexicon lx(Language::French);
    lx.void_words_ = {"le", "la", "les", "l'", "un", "une", "des", "du"};

    lx.add_pattern("fait partie de", "part-of", 0.90f);
    lx.add_pattern("est situé dans", "located-in", 0.90f);
    lx.add_pattern("est située dans", "located-in", 0.90f);
    lx.add_pattern("se trouve dans", "located-in", 0.90f);
    lx.add_pattern("est similaire à", "similar-to", 0.85f);
    lx.add_pattern("est composé de", "composed-of", 0.85f);
    lx.add_pattern("dépend de", "depends-on", 0.85f);
    lx.add_pattern("appartient à", "part-of", 0.85f);
    lx.add_pattern("est un", "is-a", 0.90f);
    lx.add_pattern("est une", "is-a", 0.90f);
    lx.add_pattern("sont des", "is-a", 0.85f);
    lx.add_pattern("a un", "has-a", 0.85f);
    lx.add_pattern("a une", "has-a", 0.85f);
    lx.add_pattern("ont des", "has-a", 0.85f);
    lx.add_pattern("sont", "is-a", 0.85f);
    lx.add_pattern("possède", "has-a", 0.85f);
    lx.add_pattern("contient", "contains", 0.85f);
    lx.add_pattern("cause", "causes", 0.85f);
    lx.add_pattern("implémente", "implements", 0.85f);
    lx.add_pattern("définit", "defines", 0.85f);

    lx.add_question("qu'est-ce que", QuestionWord::What);
    lx.add_question("est-ce que", QuestionWord::YesNo);
    lx.add_question("que", QuestionWord::What);
    lx.add_question("quoi", QuestionWord::What);
    lx.add_question("qui", QuestionWord::Who);
    lx.add_question("où", QuestionWord::Where);
    lx.add_question("quand", QuestionWord::When);
    lx.add_question("comment", QuestionWord::How);
    lx.add_question("pourquoi", QuestionWord::Why);
    lx.add_question("quel", QuestionWord::Which);
    lx.add_question("quelle", QuestionWord::Which);
    lx.add_question("quels", QuestionWord::Which);
    lx.add_question("quelles", QuestionWord::Which);

    lx.auxiliary_verbs_ = {"est", "sont", "peux", "peut", "pouvez", "peux-tu", "pouvez-vous",
                           "sais", "sait", "savez", "sais-tu", "fait", "a"};
    lx.trailing_auxiliaries_ = {"faire", "fais", "fait", "est", "sont"};
    lx.capability_modals_ = {"peux", "peut", "pouvez", "peux-tu", "pouvez-vous", "sais", "sait", "savez", "sais-tu"};

    lx.goal_verbs_ = {"trouver", "apprendre", "découvrir", "explorer", "chercher", "rechercher",
                      "analyser", "examiner", "déterminer", "classer", "identifier"};

    lx.commands_ = {{"aide", Command::Kind::Help},
                    {"?", Command::Kind::Help},
                    {"statut", Command::Kind::ShowStatus},
                    {"état", Command::Kind::ShowStatus},
                    {"objectifs", Command::Kind::ShowStatus},
                    {"afficher statut", Command::Kind::ShowStatus},
                    {"afficher objectifs", Command::Kind::ShowStatus}};
    lx.run_words_ = {"lancer", "exécuter", "cycle"};
    lx.show_words_ = {"afficher", "montrer", "graphe"};
    lx.status_words_ = {"statut", "état", "objectifs"};

    lx.and_words_ = {"et"};
    lx.or_words_ = {"ou"};
    lx.finish();
    return lx;
}

Lexicon Lexicon::spanish() {
    Lexicon lx(Language::Spanish);
    lx.void_words_ = {"el", "la", "los", "las", "un", "una", "unos", "unas"};

    lx.add_pattern("está ubicado en", "located-in", 0.90f);
    lx.add_pattern("está ubicada en", "located-in", 0.90f);
    lx.add_pattern("se encuentra en", "located-in", 0.90f);
    lx.add_pattern("forma parte de", "part-of", 0.90f);
    lx.add_pattern("está compuesto de", "composed-of", 0.85f);
    lx.add_pattern("es parte de", "part-of", 0.90f);
    lx.add_pattern("es similar a", "similar-to", 0.85f);
    lx.add_pattern("depende de", "depends-on", 0.85f);
    lx.add_pattern("pertenece a", "part-of", 0.85f);
    lx.add_pattern("está en", "located-in", 0.85f);
    lx.add_pattern("es un", "is-a", 0.90f);
    lx.add_pattern("es una", "is-a", 0.90f);
    lx.add_pattern("tiene un", "has-a", 0.85f);
    lx.add_pattern("tiene una", "has-a", 0.85f);
    lx.add_pattern("son", "is-a", 0.85f);
    lx.add_pattern("tiene", "has-a", 0.85f);
    lx.add_pattern("tienen", "has-a", 0.85f);
    lx.add_pattern("contiene", "contains", 0.85f);
    lx.add_pattern("causa", "causes", 0.85f);
    lx.add_pattern("implementa", "implements", 0.85f);
    lx.add_pattern("define", "defines", 0.85f);

    lx.add_question("por qué", QuestionWord::Why);
    lx.add_question("qué", QuestionWord::What);
    lx.add_question("quién", QuestionWord::Who);
    lx.add_question("quiénes", QuestionWord::Who);
    lx.add_question("dónde", QuestionWord::Where);
    lx.add_question("cuándo", QuestionWord::When);
    lx.add_question("cómo", QuestionWord::How);
    lx.add_question("cuál", QuestionWord::Which);
    lx.add_question("cuáles", QuestionWord::Which);
    lx.add_question("puedes", QuestionWord::YesNo);

    lx.auxiliary_verbs_ = {"es", "son", "está", "están", "puede", "puedes", "pueden", "puedo", "sabe", "sabes"};
    lx.trailing_auxiliaries_ = {"hacer", "hace", "haces"};
    lx.capability_modals_ = {"puede", "puedes", "pueden", "puedo", "sabe", "sabes"};

    lx.goal_verbs_ = {"buscar", "encontrar", "aprender", "descubrir", "explorar",
                      "analizar", "investigar", "determinar", "clasificar", "identificar"};

    lx.commands_ = {{"ayuda", Command::Kind::Help},
                    {"?", Command::Kind::Help},
                    {"estado", Command::Kind::ShowStatus},
                    {"objetivos", Command::Kind::ShowStatus},
                    {"mostrar estado", Command::Kind::ShowStatus},
                    {"mostrar objetivos", Command::Kind::ShowStatus}};
    lx.run_words_ = {"ejecutar", "ciclo"};
    lx.show_words_ = {"mostrar", "grafo"};
    lx.status_words_ = {"estado", "objetivos"};

    lx.and_words_ = {"y", "e"};
    lx.or_words_ = {"o", "u"};
    lx.finish();
    return lx;
}

const Lexicon& Lexicon::for_language(Language lang) {
    static const Lexicon en = english();
    static const Lexicon ru = russian();
    static const Lexicon ar = arabic();
    static const Lexicon fr = french();
    static const Lexicon es = spanish();

    switch (lang) {
        case Language::Russian: return ru;
        case Language::Arabic:  return ar;
        case Language::French:  return fr;
        case Language::Spanish: return es;
        case Language::English:
        case Language::Auto:    return en;
    }
    return en;
}

// =============================================================================
// Word classes
// =============================================================================

bool Lexicon::is_void(std::string_view word) const { return contains(void_words_, word); }
bool Lexicon::is_auxiliary_verb(std::string_view word) const { return contains(auxiliary_verbs_, word); }
bool Lexicon::is_trailing_auxiliary(std::string_view word) const { return contains(trailing_auxiliaries_, word); }
bool Lexicon::is_capability_modal(std::string_view word) const { return contains(capability_modals_, word); }
bool Lexicon::is_goal_verb(std::string_view word) const { return contains(goal_verbs_, word); }
bool Lexicon::is_and(std::string_view word) const { return contains(and_words_, word); }
bool Lexicon::is_or(std::string_view word) const { return contains(or_words_, word); }

bool Lexicon::is_question_word(std::string_view word) const {
    return question_kind(word).has_value();
}

std::optional<QuestionWord> Lexicon::question_kind(std::string_view word) const {
    for (const auto& q : question_words_) {
        if (q.words.size() == 1 && q.words[0] == word) return q.kind;
    }
    return std::nullopt;
}

// =============================================================================
// Questions
// =============================================================================

bool Lexicon::looks_like_question(std::string_view input) const {
    if (is_question_mark_end(input)) return true;
    auto words = clean_words(to_lower(input));
    if (words.size() < 2) return false;
    return is_question_word(words[0]);
}

QuestionFrame Lexicon::parse_question_frame(std::string_view input) const {
    QuestionFrame frame;
    std::string_view body = strip_question_marks(input);
    std::vector<std::string> words = clean_words(body);
    std::vector<std::string> lower;
    lower.reserve(words.size());
    for (const auto& w : words) lower.push_back(to_lower(w));

    size_t i = 0;
    for (const auto& q : question_words_) {
        if (q.words.size() > lower.size()) continue;
        if (std::equal(q.words.begin(), q.words.end(), lower.begin())) {
            frame.question_word = join(q.words, " ");
            frame.kind = q.kind;
            i = q.words.size();
            break;
        }
    }

    if (frame.question_word && i < lower.size() && is_auxiliary_verb(lower[i])) {
        frame.auxiliary = lower[i];
        ++i;
    }

    std::vector<std::string> content(words.begin() + static_cast<std::ptrdiff_t>(i), words.end());

    if (content.size() >= 2 && is_trailing_auxiliary(to_lower(content.back()))) {
        content.pop_back();
    }
    if (content.size() >= 2 && is_void(to_lower(content.front()))) {
        content.erase(content.begin());
    }

    if (content.empty() && !body.empty()) {
        content.emplace_back(body);
    }
    frame.content = std::move(content);

    frame.capability = (frame.question_word && is_capability_modal(*frame.question_word)) ||
                       (frame.auxiliary && is_capability_modal(*frame.auxiliary));
    return frame;
}

// =============================================================================
// Commands and goals
// =============================================================================

std::optional<Command> Lexicon::match_command(std::string_view input) const {
    std::string lower = to_lower(trim(input));
    if (lower.empty()) return std::nullopt;

    for (const auto& [text, kind] : commands_) {
        if (word_prefix(lower, text)) {
            return kind == Command::Kind::Help ? Command::help() : Command::show_status();
        }
    }

    for (const auto& w : run_words_) {
        if (word_prefix(lower, w)) {
            return Command::run_agent(first_number(std::string_view(lower).substr(w.size())));
        }
    }

    for (const auto& w : show_words_) {
        if (lower == w) return Command::render(std::nullopt);
        if (word_prefix(lower, w)) {
            // Keep the entity's original casing.
            std::string_view original = trim(input);
            std::string rest(trim(original.substr(std::min(original.size(), w.size()))));
            std::string rest_lower = to_lower(rest);
            if (contains(status_words_, rest_lower)) return Command::show_status();
            if (rest.empty()) return Command::render(std::nullopt);
            return Command::render(rest);
        }
    }
    return std::nullopt;
}

std::optional<std::string> Lexicon::match_goal(std::string_view input) const {
    std::string_view trimmed = trim(input);
    std::string lower = to_lower(trimmed);
    for (const auto& verb : goal_verbs_) {
        if (lower.size() > verb.size() && starts_with(lower, verb) && lower[verb.size()] == ' ') {
            return std::string(trimmed);
        }
    }
    return std::nullopt;
}

bool Lexicon::contains_assertion_pattern(std::string_view input) const {
    std::string padded = " " + to_lower(trim(input)) + " ";
    for (const auto& p : relational_patterns_) {
        std::string needle = " " + join(p.words, " ") + " ";
        auto pos = padded.find(needle);
        // Something must precede and follow the pattern.
        if (pos != std::string::npos && pos > 0 && pos + needle.size() < padded.size()) return true;
    }
    return false;
}

std::optional<std::string> Lexicon::surface_form(std::string_view predicate_label) const {
    for (const auto& p : relational_patterns_) {
        if (p.predicate_label == predicate_label) return join(p.words, " ");
    }
    return std::nullopt;
}

} // namespace Glossa
