/**
 * @file equivalences.cpp
 */

#include <grammar/equivalences.hpp>
#include <utils/unicode.hpp>

#include <unordered_map>

namespace Glossa {

const std::vector<Equivalence>& equivalence_table() {
    static const std::vector<Equivalence> table = {
        // countries and territories
        {"Algeria", {"Algérie", "Argelia", "الجزائر", "Алжир"}},
        {"Argentina", {"Argentine", "Аргентина", "الأرجنتين"}},
        {"Australia", {"Australie", "Австралия", "أستراليا"}},
        {"Austria", {"Autriche", "Австрия", "النمسا"}},
        {"Belgium", {"Belgique", "Bélgica", "Бельгия", "بلجيكا"}},
        {"Brazil", {"Brésil", "Brasil", "Бразилия", "البرازيل"}},
        {"Canada", {"Канада", "كندا"}},
        {"China", {"Chine", "Китай", "الصين"}},
        {"Cuba", {"Куба", "كوبا"}},
        {"Czech Republic", {"République tchèque", "República Checa", "Чехия", "التشيك"}},
        {"Denmark", {"Danemark", "Dinamarca", "Дания", "الدنمارك"}},
        {"Egypt", {"Égypte", "Egipto", "Египет", "مصر"}},
        {"Finland", {"Finlande", "Finlandia", "Финляндия", "فنلندا"}},
        {"France", {"Francia", "Франция", "فرنسا"}},
        {"Germany", {"Allemagne", "Alemania", "Германия", "ألمانيا"}},
        {"Greece", {"Grèce", "Grecia", "Греция", "اليونان"}},
        {"Hungary", {"Hongrie", "Hungría", "Венгрия", "المجر"}},
        {"India", {"Inde", "Индия", "الهند"}},
        {"Indonesia", {"Indonésie", "Индонезия", "إندونيسيا"}},
        {"Iran", {"Иран", "إيران"}},
        {"Iraq", {"Irak", "Ирак", "العراق"}},
        {"Ireland", {"Irlande", "Irlanda", "Ирландия", "أيرلندا"}},
        {"Israel", {"Israël", "Израиль", "إسرائيل"}},
        {"Italy", {"Italie", "Italia", "Италия", "إيطاليا"}},
        {"Japan", {"Japon", "Japón", "Япония", "اليابان"}},
        {"Jordan", {"Jordanie", "Jordania", "Иордания", "الأردن"}},
        {"Kazakhstan", {"Казахстан", "كازاخستان"}},
        {"Kuwait", {"Koweït", "Кувейт", "الكويت"}},
        {"Lebanon", {"Liban", "Líbano", "Ливан", "لبنان"}},
        {"Libya", {"Libye", "Libia", "Ливия", "ليبيا"}},
        {"Mexico", {"Mexique", "México", "Мексика", "المكسيك"}},
        {"Morocco", {"Maroc", "Marruecos", "Марокко", "المغرب"}},
        {"Netherlands", {"Pays-Bas", "Países Bajos", "Нидерланды", "هولندا"}},
        {"Nigeria", {"Nigéria", "Нигерия", "نيجيريا"}},
        {"North Korea", {"Corée du Nord", "Corea del Norte", "Северная Корея", "كوريا الشمالية"}},
        {"Norway", {"Norvège", "Noruega", "Норвегия", "النرويج"}},
        {"Pakistan", {"Пакистан", "باكستان"}},
        {"Palestine", {"Палестина", "فلسطين"}},
        {"Poland", {"Pologne", "Polonia", "Польша", "بولندا"}},
        {"Portugal", {"Португалия", "البرتغال"}},
        {"Qatar", {"Катар", "قطر"}},
        {"Romania", {"Roumanie", "Rumania", "Румыния", "رومانيا"}},
        {"Russia", {"Russie", "Rusia", "Россия", "روسيا"}},
        {"Saudi Arabia", {"Arabie saoudite", "Arabia Saudita", "Саудовская Аравия", "السعودية"}},
        {"South Korea", {"Corée du Sud", "Corea del Sur", "Южная Корея", "كوريا الجنوبية"}},
        {"Spain", {"Espagne", "España", "Испания", "إسبانيا"}},
        {"Sudan", {"Soudan", "Судан", "السودان"}},
        {"Sweden", {"Suède", "Suecia", "Швеция", "السويد"}},
        {"Switzerland", {"Suisse", "Suiza", "Швейцария", "سويسرا"}},
        {"Syria", {"Syrie", "Siria", "Сирия", "سوريا"}},
        {"Tunisia", {"Tunisie", "Túnez", "Тунис", "تونس"}},
        {"Turkey", {"Turquie", "Turquía", "Турция", "تركيا"}},
        {"Ukraine", {"Украина", "أوكرانيا"}},
        {"United Arab Emirates", {"Émirats arabes unis", "Emiratos Árabes Unidos", "ОАЭ", "الإمارات"}},
        {"United Kingdom", {"Royaume-Uni", "Reino Unido", "Великобритания", "بريطانيا", "UK", "GB"}},
        {"United States", {"États-Unis", "Estados Unidos", "США", "الولايات المتحدة", "USA", "US"}},
        {"Yemen", {"Yémen", "Йемен", "اليمن"}},
        // capitals and major cities
        {"Algiers", {"Alger", "Argel", "Алжир", "الجزائر العاصمة"}},
        {"Ankara", {"Анкара", "أنقرة"}},
        {"Baghdad", {"Bagdad", "Багдад", "بغداد"}},
        {"Beijing", {"Pékin", "Pekín", "Пекин", "بكين"}},
        {"Berlin", {"Берлин", "برلين"}},
        {"Brussels", {"Bruxelles", "Bruselas", "Брюссель", "بروكسل"}},
        {"Cairo", {"Le Caire", "El Cairo", "Каир", "القاهرة"}},
        {"Damascus", {"Damas", "Damasco", "Дамаск", "دمشق"}},
        {"Geneva", {"Genève", "Ginebra", "Женева", "جنيف"}},
        {"Istanbul", {"Стамбул", "إسطنبول"}},
        {"Jerusalem", {"Jérusalem", "Jerusalén", "Иерусалим", "القدس"}},
        {"Kiev", {"Kyiv", "Киев", "كييف"}},
        {"London", {"Londres", "Лондон", "لندن"}},
        {"Madrid", {"Мадрид", "مدريد"}},
        {"Moscow", {"Moscou", "Moscú", "Москва", "موسكو"}},
        {"Paris", {"Париж", "باريس"}},
        {"Riyadh", {"Riyad", "Riad", "Эр-Рияд", "الرياض"}},
        {"Rome", {"Roma", "Рим", "روما"}},
        {"Saint Petersburg", {"Saint-Pétersbourg", "San Petersburgo", "Санкт-Петербург", "سانت بطرسبرغ"}},
        {"Tehran", {"Téhéran", "Teherán", "Тегеран", "طهران"}},
        {"Tokyo", {"Tokio", "Токио", "طوكيو"}},
        {"Vienna", {"Vienne", "Viena", "Вена", "فيينا"}},
        {"Warsaw", {"Varsovie", "Varsovia", "Варшава", "وارسو"}},
        {"Washington", {"Вашингтон", "واشنطن"}},
        // organizations and institutions
        {"European Union", {"Union européenne", "Unión Europea", "Европейский Союз", "الاتحاد الأوروبي", "EU", "UE", "ЕС"}},
        {"NATO", {"OTAN", "НАТО", "حلف الناتو"}},
        {"United Nations", {"Nations Unies", "Naciones Unidas", "ООН", "الأمم المتحدة", "UN", "ONU"}},
        // common domain terms
        {"animal", {"животное", "حيوان", "animaux", "animal"}},
        {"city", {"город", "مدينة", "ville", "ciudad"}},
        {"computer", {"компьютер", "حاسوب", "ordinateur", "computadora", "ordenador"}},
        {"country", {"страна", "دولة", "بلد", "pays", "país"}},
        {"democracy", {"демократия", "ديمقراطية", "démocratie", "democracia"}},
        {"energy", {"энергия", "طاقة", "énergie", "energía"}},
        {"government", {"правительство", "حكومة", "gouvernement", "gobierno"}},
        {"human", {"человек", "إنسان", "humain", "humano"}},
        {"information", {"информация", "معلومات", "información"}},
        {"language", {"язык", "لغة", "langue", "idioma", "lengua"}},
        {"mammal", {"млекопитающее", "ثديي", "mammifère", "mamífero"}},
        {"military", {"военный", "عسكري", "militaire", "militar"}},
        {"oil", {"нефть", "نفط", "pétrole", "petróleo"}},
        {"organization", {"организация", "منظمة", "organisation", "organización"}},
        {"person", {"человек", "شخص", "personne", "persona"}},
        {"politics", {"политика", "سياسة", "politique", "política"}},
        {"river", {"река", "نهر", "rivière", "río"}},
        {"science", {"наука", "علم", "ciencia"}},
        {"security", {"безопасность", "أمن", "sécurité", "seguridad"}},
        {"technology", {"технология", "تكنولوجيا", "technologie", "tecnología"}},
        {"university", {"университет", "جامعة", "université", "universidad"}},
        {"war", {"война", "حرب", "guerre", "guerra"}},
        {"water", {"вода", "ماء", "eau", "agua"}},
        {"weapon", {"оружие", "سلاح", "arme", "arma"}},
    };
    return table;
}

namespace {

/// Lowercased canonical and alias forms -> index into the table. First entry wins.
const std::unordered_map<std::string, size_t>& folded_index() {
    static const std::unordered_map<std::string, size_t> index = [] {
        std::unordered_map<std::string, size_t> m;
        const auto& table = equivalence_table();
        for (size_t i = 0; i < table.size(); ++i) {
            m.emplace(to_lower(table[i].canonical), i);
            for (const auto& alias : table[i].aliases) m.emplace(to_lower(alias), i);
        }
        return m;
    }();
    return index;
}

} // namespace

std::optional<std::string> lookup_equivalence(std::string_view surface) {
    const auto& index = folded_index();
    auto it = index.find(to_lower(surface));
    if (it != index.end()) return equivalence_table()[it->second].canonical;

    for (const auto& entry : equivalence_table()) {
        for (const auto& alias : entry.aliases) {
            if (alias == surface) return entry.canonical;
        }
    }
    return std::nullopt;
}

} // namespace Glossa
