#include "builtin_profiles.h"

namespace ragchunk::language::detail {

namespace {

LanguageProfile english() {
    return LanguageProfile(
        Language::English, "en", "English", 4.0,
        {"Mr.",    "Mrs.",   "Ms.",   "Dr.",   "Prof.", "Rev.", "Gen.", "Col.", "Lt.",   "Sgt.",
         "Jr.",    "Sr.",    "Ph.D.", "M.D.",  "B.A.",  "M.A.", "B.S.", "M.S.", "etc.",  "e.g.",
         "i.e.",   "vs.",    "viz.",  "cf.",   "al.",   "Inc.", "Corp.", "Ltd.", "Co.",  "LLC.",
         "Jan.",   "Feb.",   "Mar.",  "Apr.",  "Jun.",  "Jul.", "Aug.", "Sep.", "Sept.", "Oct.",
         "Nov.",   "Dec.",   "Mon.",  "Tue.",  "Wed.",  "Thu.", "Fri.", "Sat.", "Sun.",  "St.",
         "Ave.",   "Blvd.",  "Rd.",   "Ln.",   "Ct.",   "No.",  "Vol.", "pp.",  "p.",    "ed.",
         "eds.",   "approx.", "est.", "min.",  "max.",  "avg.", "U.S.", "U.K."},
        {{"Chapter", 1}, {"Part", 1}, {"Section", 2}});
}

LanguageProfile korean() {
    return LanguageProfile(Language::Korean, "ko", "Korean", 2.0,
                           {"씨.", "님.", "님께서.", "선생님.", "박사님.", "교수님.", "Dr.", "Mr.",
                            "Mrs.", "Ms.", "Prof.", "등.", "외.", "예.", "cf.", "vs."},
                           {});
}

LanguageProfile chinese() {
    return LanguageProfile(Language::Chinese, "zh", "Chinese", 1.5, {}, {});
}

LanguageProfile japanese() {
    return LanguageProfile(Language::Japanese, "ja", "Japanese", 1.5, {}, {});
}

LanguageProfile spanish() {
    return LanguageProfile(Language::Spanish, "es", "Spanish", 4.5,
                           {"Dr.", "Dra.", "Sr.", "Sra.", "Srta.", "Prof.", "etc.", "Ej.", "pág.",
                            "págs.", "núm.", "tel.", "Ud.", "Uds.", "Vd.", "Vds.", "Av.",
                            "Avda.", "Ctra.", "S.A.", "S.L."},
                           {{"Capítulo", 1}, {"Parte", 1}, {"Sección", 2}});
}

LanguageProfile french() {
    return LanguageProfile(Language::French, "fr", "French", 4.5,
                           {"Dr.", "M.", "Mme.", "Mlle.", "Prof.", "etc.", "ex.", "p.", "pp.",
                            "vol.", "cf.", "fig.", "chap.", "éd.", "S.A.", "S.A.R.L."},
                           {{"Chapitre", 1}, {"Partie", 1}, {"Section", 2}});
}

LanguageProfile german() {
    return LanguageProfile(Language::German, "de", "German", 5.0,
                           {"Dr.", "Hr.", "Fr.", "Prof.", "z.B.", "d.h.", "u.a.", "usw.", "etc.",
                            "Nr.", "Bd.", "S.", "Aufl.", "bzw.", "ca.", "evtl.", "ggf.", "GmbH.",
                            "AG.", "e.V."},
                           {{"Kapitel", 1}, {"Teil", 1}, {"Abschnitt", 2}});
}

LanguageProfile arabic() {
    return LanguageProfile(Language::Arabic, "ar", "Arabic", 3.0, {},
                           {{"الفصل", 1}, {"الباب", 1}, {"القسم", 2}});
}

LanguageProfile hindi() {
    return LanguageProfile(Language::Hindi, "hi", "Hindi", 3.0, {},
                           {{"अध्याय", 1}, {"भाग", 1}, {"खंड", 2}});
}

LanguageProfile portuguese() {
    return LanguageProfile(Language::Portuguese, "pt", "Portuguese", 4.5,
                           {"Dr.", "Dra.", "Sr.", "Sra.", "Srta.", "Prof.", "etc.", "ex.",
                            "pág.", "págs.", "núm.", "tel.", "V.Ex.", "V.S.", "Av.", "R.",
                            "Ltda.", "S.A."},
                           {{"Capítulo", 1}, {"Parte", 1}, {"Seção", 2}});
}

LanguageProfile vietnamese() {
    return LanguageProfile(Language::Vietnamese, "vi", "Vietnamese", 4.0,
                           {"TP.", "Q.", "P.", "TX.", "TT.", "Ths.", "TS.", "PGS.", "GS.", "v.v.",
                            "vv.", "tr.", "NXB."},
                           {{"Chương", 1}, {"Phần", 1}, {"Mục", 2}, {"Điều", 3}});
}

LanguageProfile thai() {
    return LanguageProfile(Language::Thai, "th", "Thai", 2.0, {},
                           {{"บทที่", 1}, {"ภาคที่", 1}, {"ส่วนที่", 2}, {"ข้อ", 3}});
}

LanguageProfile russian() {
    return LanguageProfile(Language::Russian, "ru", "Russian", 4.0,
                           {"г.", "гг.", "др.", "проф.", "т.д.", "т.е.", "т.п.", "см.", "ср.",
                            "напр.", "ул.", "пр.", "д.", "корп.", "кв.", "ООО.", "ОАО.", "ЗАО."},
                           {{"Глава", 1}, {"Часть", 1}, {"Раздел", 2}});
}

} // namespace

std::vector<LanguageProfile> makeBuiltinProfiles() {
    std::vector<LanguageProfile> profiles;
    profiles.reserve(13);
    profiles.push_back(english());
    profiles.push_back(korean());
    profiles.push_back(chinese());
    profiles.push_back(japanese());
    profiles.push_back(spanish());
    profiles.push_back(french());
    profiles.push_back(german());
    profiles.push_back(arabic());
    profiles.push_back(hindi());
    profiles.push_back(portuguese());
    profiles.push_back(vietnamese());
    profiles.push_back(thai());
    profiles.push_back(russian());
    return profiles;
}

} // namespace ragchunk::language::detail
