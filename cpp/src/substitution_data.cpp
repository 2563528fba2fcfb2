/**
 * @file substitution_data.cpp
 * @brief Данные таблиц подмен
 *
 * Глифы хранятся в исходном виде (UTF-8). Дубликаты и порядок внутри списка
 * не важны: GlyphTables сортирует и дедуплицирует их при построении.
 */

#include "lexguard/substitution_data.hpp"

namespace lexguard {

namespace {

// clang-format off

// ===========================================================================
// Глифы-двойники для базовых символов
// ===========================================================================

constexpr std::string_view kLowerA[] = {
    "a", "@", "4", "α", "λ", "*", "Ⓐ", "Ａ", "à", "á", "â", "ã", "ä", "å", "ᴀ",
    "ɒ", "Å", "ᵃ", "ᵄ", "𝐚", "𝑎", "𝒂", "𝒶", "𝓪", "𝔞", "𝕒", "𝖆", "𝖺",
    "𝗮", "𝘢", "𝙖", "𝚊", "⒜", "ⓐ", "ａ", "ₐ", "🄰", "🅐", "🅰", "🅰️",
};
constexpr std::string_view kLowerB[] = {
    "b", "8", "6", "β", "*", "ⓑ", "Ⓑ", "ｂ", "Ｂ", "ḃ", "ḅ", "ḇ", "ʙ", "ɓ", "ß",
    "ᵇ", "𝐛", "𝑏", "𝒃", "𝒷", "𝓫", "𝔟", "𝕓", "𝖇", "𝖻", "𝗯", "𝘣", "𝙗",
    "𝚋", "⒝", "🄱", "🅑", "🅱", "🅱️",
};
constexpr std::string_view kLowerC[] = {
    "c", "(", "<", "ç", "*", "ⓒ", "Ⓒ", "ｃ", "Ｃ", "ć", "ĉ", "ċ", "ᴄ", "ɔ", "¢",
    "ᶜ", "𝐜", "𝑐", "𝒄", "𝒸", "𝓬", "𝔠", "𝕔", "𝖈", "𝖼", "𝗰", "𝘤", "𝙘",
    "𝚌", "⒞", "🄲", "🅒", "🅲",
};
constexpr std::string_view kLowerD[] = {
    "d", "|)", "ⓓ", "Ⓓ", "ｄ", "Ｄ", "đ", "ᴅ", "ɖ", "ð", "ᵈ", "𝐝", "𝑑", "𝒅",
    "𝒹", "𝓭", "𝔡", "𝕕", "𝖉", "𝖽", "𝗱", "𝘥", "𝙙", "𝚍", "⒟", "🄳", "🅓",
    "🅳",
};
constexpr std::string_view kLowerE[] = {
    "e", "3", "€", "ε", "*", "ⓔ", "Ⓔ", "ｅ", "Ｅ", "è", "é", "ê", "ë", "ē", "ĕ",
    "ė", "ę", "ě", "ᴇ", "ɘ", "£", "ℯ", "ₑ", "ᵉ", "𝐞", "𝑒", "𝒆", "𝓮", "𝔢",
    "𝕖", "𝖊", "𝖾", "𝗲", "𝘦", "𝙚", "𝚎", "⒠", "🄴", "🅔", "🅴",
};
constexpr std::string_view kLowerF[] = {
    "f", "ƒ", "ⓕ", "Ⓕ", "ｆ", "Ｆ", "ꜰ", "ʄ", "ʃ", "ᶠ", "𝐟", "𝑓", "𝒇", "𝒻",
    "𝓯", "𝔣", "𝕗", "𝖋", "𝖿", "𝗳", "𝘧", "𝙛", "𝚏", "⒡", "🄵", "🅕", "🅵",
};
constexpr std::string_view kLowerG[] = {
    "g", "9", "ⓖ", "Ⓖ", "ｇ", "Ｇ", "ğ", "ġ", "ģ", "ɢ", "ɡ", "ℊ", "𝐠", "𝑔", "𝒈",
    "𝓰", "𝔤", "𝕘", "𝖌", "𝗀", "𝗴", "𝘨", "𝙜", "𝚐", "⒢", "ᵍ", "🄶", "🅖",
    "🅶",
};
constexpr std::string_view kLowerH[] = {
    "h", "#", "ⓗ", "Ⓗ", "ｈ", "Ｈ", "ĥ", "ħ", "ʜ", "ɦ", "ₕ", "ʰ", "𝐡", "𝒉", "𝒽",
    "𝓱", "𝔥", "𝕙", "𝖍", "𝗁", "𝗵", "𝘩", "𝙝", "𝚑", "⒣", "🄷", "🅗", "🅷",
};
constexpr std::string_view kLowerI[] = {
    "i", "1", "!", "|", "ι", "*", "ⓘ", "Ⓘ", "ｉ", "Ｉ", "ì", "í", "î", "ï", "ĩ",
    "ī", "ĭ", "į", "ı", "ɪ", "ɨ", "¡", "ᵢ", "𝐢", "𝑖", "𝒊", "𝒾", "𝓲", "𝔦",
    "𝕚", "𝖎", "𝗂", "𝗶", "𝘪", "𝙞", "𝚒", "⒤", "🄸", "🅘", "🅸",
};
constexpr std::string_view kLowerJ[] = {
    "j", "ⓙ", "Ⓙ", "ｊ", "Ｊ", "ĵ", "ᴊ", "ل", "ʲ", "𝐣", "𝑗", "𝒋", "𝒿", "𝓳",
    "𝔧", "𝕛", "𝖏", "𝗃", "𝗷", "𝘫", "𝙟", "𝚓", "⒥", "ⱼ", "🄹", "🅙", "🅹",
};
constexpr std::string_view kLowerK[] = {
    "k", "ⓚ", "Ⓚ", "ｋ", "Ｋ", "ķ", "ᴋ", "κ", "ₖ", "𝐤", "𝑘", "𝒌", "𝓀", "𝓴",
    "𝔨", "𝕜", "𝖐", "𝗄", "𝗸", "𝘬", "𝙠", "𝚔", "⒦", "ᵏ", "🄺", "🅚", "🅺",
};
constexpr std::string_view kLowerL[] = {
    "l", "|", "*", "ⓛ", "ｌ", "Ｌ", "ĺ", "ļ", "ľ", "ŀ", "ł", "ʟ", "ɭ", "£", "ₗ",
    "ˡ", "1", "I", "i", "𝐥", "𝑙", "𝒍", "𝓁", "𝓵", "𝔩", "𝕝", "𝖑", "𝗅",
    "𝗹", "𝘭", "𝙡", "𝚕", "⒧", "🄻", "🅛", "🅻",
};
constexpr std::string_view kLowerM[] = {
    "m", "ⓜ", "Ⓜ", "Ｍ", "ɱ", "𝐦", "𝑚", "𝒎", "𝓂", "𝓶", "𝔪", "𝕞", "𝖒",
    "𝗆", "𝗺", "𝘮", "𝙢", "𝚖", "⒨", "ｍ", "ᵐ", "ₘ", "ᴍ", "🄼", "🅜", "🅼",
};
constexpr std::string_view kLowerN[] = {
    "n", "Ⓝ", "Ｎ", "ñ", "ń", "ņ", "ň", "ŉ", "ɴ", "ɲ", "ₙ", "𝐧", "𝑛", "𝒏",
    "𝓃", "𝓷", "𝔫", "𝕟", "𝖓", "𝗇", "𝗻", "𝘯", "𝙣", "𝚗", "⒩", "ⓝ", "ｎ",
    "🄽", "🅝", "🅽",
};
constexpr std::string_view kLowerO[] = {
    "o", "0", "()", "ο", "*", "Ⓞ", "Ｏ", "ò", "ó", "ô", "õ", "ö", "ø", "ő", "ɵ",
    "θ", "ℴ", "ₒ", "ᵒ", "𝐨", "𝑜", "𝒐", "𝓸", "𝔬", "𝕠", "𝖔", "𝗈", "𝗼",
    "𝘰", "𝙤", "𝚘", "⒪", "ⓞ", "ｏ", "ᴏ", "🄾", "🅞", "🅾", "🅾️",
};
constexpr std::string_view kLowerP[] = {
    "p", "ⓟ", "Ⓟ", "Ｐ", "ᴘ", "ƥ", "ᵖ", "𝐩", "𝑝", "𝒑", "𝓅", "𝓹", "𝔭", "𝕡",
    "𝖕", "𝗉", "𝗽", "𝘱", "𝙥", "𝚙", "⒫", "ｐ", "ₚ", "🄿", "🅟", "🅿", "🅿️",
};
constexpr std::string_view kLowerQ[] = {
    "q", "ⓠ", "Ⓠ", "ｑ", "Ｑ", "ϙ", "ʠ", "𝐪", "𝑞", "𝒒", "𝓆", "𝓺", "𝔮", "𝕢",
    "𝖖", "𝗊", "𝗾", "𝘲", "𝙦", "𝚚", "⒬", "𐞥", "ꞯ", "🅀", "🅠", "🆀",
};
constexpr std::string_view kLowerR[] = {
    "r", "ⓡ", "Ⓡ", "ｒ", "Ｒ", "ŕ", "ŗ", "ř", "ʀ", "ɹ", "ᵣ", "ʳ", "𝐫", "𝑟", "𝒓",
    "𝓇", "𝓻", "𝔯", "𝕣", "𝖗", "𝗋", "𝗿", "𝘳", "𝙧", "𝚛", "⒭", "🅁", "🅡",
    "🆁",
};
constexpr std::string_view kLowerS[] = {
    "s", "5", "$", "*", "ⓢ", "Ⓢ", "ｓ", "Ｓ", "ś", "ş", "š", "ſ", "ꜱ", "ʂ", "§",
    "ₛ", "ˢ", "𝐬", "𝑠", "𝒔", "𝓈", "𝓼", "𝔰", "𝕤", "𝖘", "𝗌", "𝘀", "𝘴",
    "𝙨", "𝚜", "⒮", "🅂", "🅢", "🆂",
};
constexpr std::string_view kLowerT[] = {
    "t", "7", "+", "τ", "*", "ⓣ", "Ⓣ", "ｔ", "Ｔ", "ţ", "ť", "ŧ", "ᴛ", "ʈ", "†",
    "ₜ", "ᵗ", "𝐭", "𝑡", "𝒕", "𝓉", "𝓽", "𝔱", "𝕥", "𝖙", "𝗍", "𝘁", "𝘵",
    "𝙩", "𝚝", "⒯", "🅃", "🅣", "🆃",
};
constexpr std::string_view kLowerU[] = {
    "u", "@", "v", "υ", "*", "ⓤ", "Ⓤ", "ｕ", "Ｕ", "ù", "ú", "û", "ü", "ũ", "ū",
    "ŭ", "ů", "ű", "ų", "ᴜ", "ʊ", "µ", "ᵤ", "ᵘ", "𝐮", "𝑢", "𝒖", "𝓊", "𝓾",
    "𝔲", "𝕦", "𝖚", "𝗎", "𝘂", "𝘶", "𝙪", "𝚞", "⒰", "🅄", "🅤", "🆄",
};
constexpr std::string_view kLowerV[] = {
    "v", "u", "*", "ⓥ", "Ⓥ", "ｖ", "Ｖ", "ᴠ", "ʋ", "ѵ", "ᵛ", "𝐯", "𝑣", "𝒗",
    "𝓋", "𝓿", "𝔳", "𝕧", "𝖛", "𝗏", "𝘃", "𝘷", "𝙫", "𝚟", "⒱", "ᵥ", "🅅",
    "🅥", "🆅",
};
constexpr std::string_view kLowerW[] = {
    "w", "ⓦ", "Ⓦ", "ｗ", "Ｗ", "ᴡ", "ω", "ʷ", "vv", "uu", "𝐰", "𝑤", "𝒘", "𝓌",
    "𝔀", "𝔴", "𝕨", "𝖜", "𝗐", "𝘄", "𝘸", "𝙬", "𝚠", "⒲", "🅆", "🅦", "🆆",
};
constexpr std::string_view kLowerX[] = {
    "x", "×", "*", "ⓧ", "ｘ", "Ｘ", "᙮", "χ", "ˣ", "><", "𝐱", "𝑥", "𝒙", "𝓍",
    "𝔁", "𝔵", "𝕩", "𝖝", "𝗑", "𝘅", "𝘹", "𝙭", "𝚡", "⒳", "ₓ", "🅇", "🅧",
    "🆇",
};
constexpr std::string_view kLowerY[] = {
    "y", "ⓨ", "ｙ", "Ｙ", "ý", "ÿ", "ŷ", "ɣ", "у", "ʸ", "𝐲", "𝑦", "𝒚", "𝓎",
    "𝔂", "𝔶", "𝕪", "𝖞", "𝗒", "𝘆", "𝘺", "𝙮", "𝚢", "⒴", "ʏ", "🅈", "🅨",
    "🆈",
};
constexpr std::string_view kLowerZ[] = {
    "z", "2", "*", "ⓩ", "ｚ", "Ｚ", "ź", "ż", "ž", "ᴢ", "ᶻ", "𝐳", "𝑧", "𝒛",
    "𝓏", "𝔃", "𝔷", "𝕫", "𝖟", "𝗓", "𝘇", "𝘻", "𝙯", "𝚣", "⒵", "🅉", "🅩",
    "🆉",
};
constexpr std::string_view kUpperA[] = {
    "A", "4", "@", "𝐀", "𝐴", "𝑨", "𝒜", "𝓐", "𝔄", "𝔸", "𝕬", "𝖠", "𝗔",
    "𝘈", "𝘼", "𝙰", "Ⓐ", "Ａ", "🄐", "🇦",
};
constexpr std::string_view kUpperB[] = {
    "B", "ℬ", "8", "6", "𝐁", "𝐵", "𝑩", "𝓑", "𝔅", "𝔹", "𝕭", "𝖡", "𝗕",
    "𝘉", "𝘽", "𝙱", "Ⓑ", "Ｂ", "🄑", "🇧",
};
constexpr std::string_view kUpperC[] = {
    "C", "ℭ", "ℂ", "(", "<", "𝐂", "𝐶", "𝑪", "𝒞", "𝓒", "𝕮", "𝖢", "𝗖",
    "𝘊", "𝘾", "𝙲", "Ⓒ", "Ｃ", "🄒", "🇨",
};
constexpr std::string_view kUpperD[] = {
    "D", "𝐃", "𝐷", "𝑫", "𝒟", "𝓓", "𝔇", "𝔻", "𝕯", "𝖣", "𝗗", "𝘋", "𝘿",
    "𝙳", "Ⓓ", "Ｄ", "🄓", "🇩",
};
constexpr std::string_view kUpperE[] = {
    "E", "ℰ", "3", "€", "𝐄", "𝐸", "𝑬", "𝓔", "𝔈", "𝔼", "𝕰", "𝖤", "𝗘",
    "𝘌", "𝙀", "𝙴", "Ⓔ", "Ｅ", "🄔", "🇪",
};
constexpr std::string_view kUpperF[] = {
    "F", "ℱ", "𝐅", "𝐹", "𝑭", "𝓕", "𝔉", "𝔽", "𝕱", "𝖥", "𝗙", "𝘍", "𝙁",
    "𝙵", "Ⓕ", "Ｆ", "🄕", "🇫",
};
constexpr std::string_view kUpperG[] = {
    "G", "9", "𝐆", "𝐺", "𝑮", "𝒢", "𝓖", "𝔊", "𝔾", "𝕲", "𝖦", "𝗚", "𝘎",
    "𝙂", "𝙶", "Ⓖ", "Ｇ", "🄖", "🇬",
};
constexpr std::string_view kUpperH[] = {
    "H", "ℋ", "ℌ", "#", "𝐇", "𝐻", "𝑯", "𝓗", "𝕳", "𝖧", "𝗛", "𝘏", "𝙃",
    "𝙷", "Ⓗ", "Ｈ", "🄗", "🇭",
};
constexpr std::string_view kUpperI[] = {
    "I", "ℑ", "1", "!", "|", "l", "i", "𝐈", "𝐼", "𝑰", "𝓘", "𝕀", "𝕴", "𝖨",
    "𝗜", "𝘐", "𝙄", "𝙸", "Ⓘ", "Ｉ", "🄘", "🇮",
};
constexpr std::string_view kUpperJ[] = {
    "J", "𝐉", "𝐽", "𝑱", "𝒥", "𝓙", "𝔍", "𝕁", "𝕵", "𝖩", "𝗝", "𝘑", "𝙅",
    "𝙹", "Ⓙ", "Ｊ", "🄙", "🇯",
};
constexpr std::string_view kUpperK[] = {
    "K", "𝐊", "𝐾", "𝑲", "𝒦", "𝓚", "𝔎", "𝕂", "𝕶", "𝖪", "𝗞", "𝘒", "𝙆",
    "𝙺", "Ⓚ", "Ｋ", "🄚", "🇰",
};
constexpr std::string_view kUpperL[] = {
    "L", "ℒ", "1", "I", "i", "|", "𝐋", "𝐿", "𝑳", "𝓛", "𝔏", "𝕃", "𝕷", "𝖫",
    "𝗟", "𝘓", "𝙇", "𝙻", "Ⓛ", "Ｌ", "🄛", "🇱",
};
constexpr std::string_view kUpperM[] = {
    "M", "ℳ", "𝐌", "𝑀", "𝑴", "𝓜", "𝔐", "𝕄", "𝕸", "𝖬", "𝗠", "𝘔", "𝙈",
    "𝙼", "Ⓜ", "Ｍ", "🄜", "🇲",
};
constexpr std::string_view kUpperN[] = {
    "N", "ℕ", "𝐍", "𝑁", "𝑵", "𝒩", "𝓝", "𝔑", "𝕹", "𝖭", "𝗡", "𝘕", "𝙉",
    "𝙽", "Ⓝ", "Ｎ", "🄝", "🇳",
};
constexpr std::string_view kUpperO[] = {
    "O", "0", "()", "𝐎", "𝑂", "𝑶", "𝒪", "𝓞", "𝔒", "𝕆", "𝕺", "𝖮", "𝗢",
    "𝘖", "𝙊", "𝙾", "Ⓞ", "Ｏ", "🄞", "🇴",
};
constexpr std::string_view kUpperP[] = {
    "P", "ℙ", "𝐏", "𝑃", "𝑷", "𝒫", "𝓟", "𝔓", "𝕻", "𝖯", "𝗣", "𝘗", "𝙋",
    "𝙿", "Ⓟ", "Ｐ", "🄟", "🇵",
};
constexpr std::string_view kUpperQ[] = {
    "Q", "ℚ", "𝐐", "𝑄", "𝑸", "𝒬", "𝓠", "𝔔", "𝕼", "𝖰", "𝗤", "𝘘", "𝙌",
    "𝚀", "Ⓠ", "Ｑ", "🄠", "🇶",
};
constexpr std::string_view kUpperR[] = {
    "R", "ℛ", "ℜ", "𝐑", "𝑅", "𝑹", "𝓡", "𝕽", "𝖱", "𝗥", "𝘙", "𝙍", "𝚁",
    "Ⓡ", "Ｒ", "🄡", "🇷",
};
constexpr std::string_view kUpperS[] = {
    "S", "5", "$", "𝐒", "𝑆", "𝑺", "𝒮", "𝓢", "𝔖", "𝕊", "𝕾", "𝖲", "𝗦",
    "𝘚", "𝙎", "𝚂", "Ⓢ", "Ｓ", "🄢", "🇸",
};
constexpr std::string_view kUpperT[] = {
    "T", "7", "+", "𝐓", "𝑇", "𝑻", "𝒯", "𝓣", "𝔗", "𝕋", "𝕿", "𝖳", "𝗧",
    "𝘛", "𝙏", "𝚃", "Ⓣ", "Ｔ", "🄣", "🇹",
};
constexpr std::string_view kUpperU[] = {
    "U", "V", "𝐔", "𝑈", "𝑼", "𝒰", "𝓤", "𝔘", "𝕌", "𝖀", "𝖴", "𝗨", "𝘜",
    "𝙐", "𝚄", "Ⓤ", "Ｕ", "🄤", "🇺",
};
constexpr std::string_view kUpperV[] = {
    "V", "U", "𝐕", "𝑉", "𝑽", "𝒱", "𝓥", "𝔙", "𝕍", "𝖁", "𝖵", "𝗩", "𝘝",
    "𝙑", "𝚅", "Ⓥ", "Ｖ", "🄥", "🇻",
};
constexpr std::string_view kUpperW[] = {
    "W", "VV", "UU", "𝐖", "𝑊", "𝑾", "𝒲", "𝓦", "𝔚", "𝕎", "𝖂", "𝖶", "𝗪",
    "𝘞", "𝙒", "𝚆", "Ⓦ", "Ｗ", "🄦", "🇼",
};
constexpr std::string_view kUpperX[] = {
    "X", "><", "𝐗", "𝑋", "𝑿", "𝒳", "𝓧", "𝔛", "𝕏", "𝖃", "𝖷", "𝗫", "𝘟",
    "𝙓", "𝚇", "Ⓧ", "Ｘ", "🄧", "🇽",
};
constexpr std::string_view kUpperY[] = {
    "Y", "𝐘", "𝑌", "𝒀", "𝒴", "𝓨", "𝔜", "𝕐", "𝖄", "𝖸", "𝗬", "𝘠", "𝙔",
    "𝚈", "Ⓨ", "Ｙ", "🄨", "🇾",
};
constexpr std::string_view kUpperZ[] = {
    "Z", "ℨ", "ℤ", "𝐙", "𝑍", "𝒁", "𝒵", "𝓩", "𝖅", "𝖹", "𝗭", "𝘡", "𝙕",
    "𝚉", "Ⓩ", "Ｚ", "🄩", "🇿",
};
constexpr std::string_view kDigit0[] = {
    "0", "⓪", "o", "O", "()", "ο", "*", "Ⓞ", "Ｏ", "ò", "ó", "ô", "õ", "ö", "ø",
    "ő", "ɵ", "θ", "𝟎", "𝟘", "𝟢", "𝟬", "𝟶", "０", "⁰", "₀", "🄋",
};
constexpr std::string_view kDigit1[] = {
    "1", "①", "１", "I", "i", "!", "|", "ι", "*", "ⓘ", "Ⓘ", "ｉ", "Ｉ", "ì", "í",
    "î", "ï", "ĩ", "ī", "ĭ", "į", "ı", "ɪ", "ɨ", "¡", "𝟏", "𝟙", "𝟣", "𝟭",
    "𝟷", "¹", "₁", "❶", "➀",
};
constexpr std::string_view kDigit2[] = {
    "2", "②", "２", "z", "Z", "*", "ⓩ", "ｚ", "Ｚ", "ź", "ż", "ž", "ᴢ", "𝟐", "𝟚",
    "𝟤", "𝟮", "𝟸", "²", "₂", "❷", "➁",
};
constexpr std::string_view kDigit3[] = {
    "3", "③", "３", "e", "E", "€", "ε", "*", "ⓔ", "Ⓔ", "ｅ", "Ｅ", "è", "é", "ê",
    "ë", "ē", "ĕ", "ė", "ę", "ě", "ᴇ", "ɘ", "£", "𝟑", "𝟛", "𝟥", "𝟯", "𝟹",
    "³", "₃", "❸", "➂",
};
constexpr std::string_view kDigit4[] = {
    "4", "④", "４", "a", "A", "@", "α", "λ", "*", "Ⓐ", "Ａ", "à", "á", "â", "ã",
    "ä", "å", "ᴀ", "ɒ", "Å", "h", "𝟒", "𝟜", "𝟦", "𝟰", "𝟺", "⁴", "₄", "❹",
    "➃",
};
constexpr std::string_view kDigit5[] = {
    "5", "⑤", "５", "s", "S", "*", "ⓢ", "Ⓢ", "ｓ", "Ｓ", "ś", "ş", "š", "ſ", "ꜱ",
    "ʂ", "§", "𝟓", "𝟝", "𝟧", "𝟱", "𝟻", "⁵", "₅", "❺", "➄",
};
constexpr std::string_view kDigit6[] = {
    "6", "⑥", "６", "b", "B", "8", "β", "*", "ⓑ", "Ⓑ", "ｂ", "Ｂ", "ḃ", "ḅ", "ḇ",
    "ʙ", "ɓ", "ß", "𝟔", "𝟞", "𝟨", "𝟲", "𝟼", "⁶", "₆", "❻", "➅",
};
constexpr std::string_view kDigit7[] = {
    "7", "⑦", "７", "t", "T", "+", "τ", "*", "ⓣ", "Ⓣ", "ｔ", "Ｔ", "ţ", "ť", "ŧ",
    "ᴛ", "ʈ", "†", "𝟕", "𝟟", "𝟩", "𝟳", "𝟽", "⁷", "₇", "❼", "➆",
};
constexpr std::string_view kDigit8[] = {
    "8", "⑧", "８", "b", "B", "6", "β", "*", "ⓑ", "Ⓑ", "ｂ", "Ｂ", "ḃ", "ḅ", "ḇ",
    "ʙ", "ɓ", "ß", "𝟖", "𝟠", "𝟪", "𝟴", "𝟾", "⁸", "₈", "❽", "➇",
};
constexpr std::string_view kDigit9[] = {
    "9", "⑨", "９", "g", "G", "ⓖ", "Ⓖ", "ｇ", "Ｇ", "ğ", "ġ", "ģ", "ɢ", "ɡ", "𝟗",
    "𝟡", "𝟫", "𝟵", "𝟿", "⁹", "₉", "❾", "➈",
};

constexpr RawSubstitution kSubstitutions[] = {
    {"a", kLowerA}, {"b", kLowerB}, {"c", kLowerC}, {"d", kLowerD},
    {"e", kLowerE}, {"f", kLowerF}, {"g", kLowerG}, {"h", kLowerH},
    {"i", kLowerI}, {"j", kLowerJ}, {"k", kLowerK}, {"l", kLowerL},
    {"m", kLowerM}, {"n", kLowerN}, {"o", kLowerO}, {"p", kLowerP},
    {"q", kLowerQ}, {"r", kLowerR}, {"s", kLowerS}, {"t", kLowerT},
    {"u", kLowerU}, {"v", kLowerV}, {"w", kLowerW}, {"x", kLowerX},
    {"y", kLowerY}, {"z", kLowerZ}, {"A", kUpperA}, {"B", kUpperB},
    {"C", kUpperC}, {"D", kUpperD}, {"E", kUpperE}, {"F", kUpperF},
    {"G", kUpperG}, {"H", kUpperH}, {"I", kUpperI}, {"J", kUpperJ},
    {"K", kUpperK}, {"L", kUpperL}, {"M", kUpperM}, {"N", kUpperN},
    {"O", kUpperO}, {"P", kUpperP}, {"Q", kUpperQ}, {"R", kUpperR},
    {"S", kUpperS}, {"T", kUpperT}, {"U", kUpperU}, {"V", kUpperV},
    {"W", kUpperW}, {"X", kUpperX}, {"Y", kUpperY}, {"Z", kUpperZ},
    {"0", kDigit0}, {"1", kDigit1}, {"2", kDigit2}, {"3", kDigit3},
    {"4", kDigit4}, {"5", kDigit5}, {"6", kDigit6}, {"7", kDigit7},
    {"8", kDigit8}, {"9", kDigit9},
};

// ===========================================================================
// Гомоглифы
// ===========================================================================

constexpr RawHomoglyph kHomoglyphs[] = {
    // Кириллица
    {U'ѕ', 's'}, {U'с', 'c'}, {U'е', 'e'}, {U'а', 'a'}, {U'р', 'p'},
    {U'о', 'o'}, {U'і', 'i'}, {U'ԁ', 'd'}, {U'ӏ', 'l'}, {U'һ', 'h'},
    {U'ԛ', 'q'}, {U'н', 'h'}, {U'х', 'x'}, {U'у', 'y'}, {U'ј', 'j'},
    {U'А', 'a'}, {U'В', 'b'}, {U'Е', 'e'}, {U'К', 'k'}, {U'М', 'm'},
    {U'Н', 'h'}, {U'О', 'o'}, {U'Р', 'p'}, {U'С', 'c'}, {U'Т', 't'},
    {U'Х', 'x'}, {U'У', 'y'}, {U'Ѕ', 's'}, {U'І', 'i'}, {U'Ј', 'j'},
    // Греческие заглавные
    {U'Α', 'a'}, {U'Β', 'b'}, {U'Ε', 'e'}, {U'Ζ', 'z'}, {U'Η', 'h'},
    {U'Ι', 'i'}, {U'Κ', 'k'}, {U'Μ', 'm'}, {U'Ν', 'n'}, {U'Ο', 'o'},
    {U'Ρ', 'p'}, {U'Τ', 't'}, {U'Υ', 'y'}, {U'Χ', 'x'}, {U'ο', 'o'},
    // Малые капители
    {U'ᴀ', 'a'}, {U'ʙ', 'b'}, {U'ᴄ', 'c'}, {U'ᴅ', 'd'}, {U'ᴇ', 'e'},
    {U'ғ', 'f'}, {U'ɢ', 'g'}, {U'ɪ', 'i'}, {U'ᴊ', 'j'}, {U'ᴋ', 'k'},
    {U'ʟ', 'l'}, {U'ᴍ', 'm'}, {U'ɴ', 'n'}, {U'ᴏ', 'o'}, {U'ᴘ', 'p'},
    {U'ǫ', 'q'}, {U'ʀ', 'r'}, {U'ᴛ', 't'}, {U'ᴜ', 'u'}, {U'ᴠ', 'v'},
    {U'ᴡ', 'w'}, {U'ʏ', 'y'}, {U'ᴢ', 'z'},
};

// ===========================================================================
// Невидимые разделители
// ===========================================================================

constexpr char32_t kHiddenSeparators[] = {
    0x200B, // ZERO WIDTH SPACE
    0x200C, // ZERO WIDTH NON-JOINER
    0x200D, // ZERO WIDTH JOINER
    0x2060, // WORD JOINER
    0x034F, // COMBINING GRAPHEME JOINER
    0x180E, // MONGOLIAN VOWEL SEPARATOR
    0xFEFF, // ZERO WIDTH NO-BREAK SPACE
    0x00AD, // SOFT HYPHEN
    0x17B5, // KHMER VOWEL INHERENT AA
    0x17B6, // KHMER VOWEL SIGN AA
    0x2028, // LINE SEPARATOR
    0x2029, // PARAGRAPH SEPARATOR
    0x1160, // HANGUL JUNGSEONG FILLER
    0x3164, // HANGUL FILLER
};

// ===========================================================================
// Словари
// ===========================================================================

constexpr std::string_view kSafeWords[] = {
    // Топонимы
    "penistone", "lightwater", "cockburn", "mianus", "tatsuki", "cumming",
    "clitheroe", "twatt", "assington", "bitchfield", "titcomb", "shitterton",
    "prickwillow", "cockermouth", "cockbridge",
    // Обычные слова
    "hello", "fanny", "rape", "whale", "beaver", "cocktail", "passage",
    "classic", "grassland", "bassist", "butterfly", "shipment", "shooting",
    "language", "counting", "cluster", "glassware", "pascal",
    // Медицина и наука
    "testes", "scrotum", "vaginal", "urethra", "mastectomy", "vasectomy",
    "nucleus", "molecular", "vascular", "fascial",
};

constexpr std::string_view kShortForms[] = {
    "fx",  "fk",  "sht", "wtf", "ffs", "ngr", "bch", "cnt", "dck",
    "fck", "sh1", "5ht", "vgn", "prn", "f4n", "n1g", "k3k", "fku",
    "ass", "fuk", "fuc", "fgs", "wth", "dmn", "prk", "twt",
};

// ===========================================================================
// Контекстный белый список
// ===========================================================================

constexpr std::string_view kCuntContexts[] = {
    R"(\bcunt(?:ry|ries|ing|ed|ious|ure|ship)\b)",
    R"(\b(?:dis|re)cunt\b)",
    R"(\bcount\b)",
    R"(\baccount\b)",
};

constexpr std::string_view kAssContexts[] = {
    R"(\bass\s*(?:ignment|essment|ociation|embly|ets|ist|uming|ert))",
    R"(\b(?:cl|gr|m|p)ass\b)",
    R"(\b(?:embr|harr)ass)",
};

constexpr std::string_view kCockContexts[] = {
    R"(\bcock(?:tail|atoo|pit|roach))",
    R"(\bpea(?:cock)\b)",
    R"(\bhancock\b)",
    R"(\bshuttle(?:cock)\b)",
};

constexpr std::string_view kHellContexts[] = {
    R"(\bhell(?:o|icopter|met|ium|enic))",
    R"(\bshell\b)",
    R"(\bothello\b)",
};

constexpr RawWhitelistRule kWhitelistRules[] = {
    {"cunt", kCuntContexts},
    {"ass", kAssContexts},
    {"cock", kCockContexts},
    {"hell", kHellContexts},
};

// clang-format on

} // namespace

std::span<const RawSubstitution> raw_substitutions() noexcept {
  return kSubstitutions;
}

std::span<const RawHomoglyph> raw_homoglyphs() noexcept { return kHomoglyphs; }

std::span<const char32_t> hidden_separators() noexcept {
  return kHiddenSeparators;
}

std::span<const std::string_view> builtin_safe_words() noexcept {
  return kSafeWords;
}

std::span<const std::string_view> short_form_terms() noexcept {
  return kShortForms;
}

std::span<const RawWhitelistRule> builtin_whitelist_rules() noexcept {
  return kWhitelistRules;
}

} // namespace lexguard
