#include "text_features.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

// -------------------------------------------------------------
// Stop words
// -------------------------------------------------------------
const std::unordered_set<std::string> STOP_WORDS = {
    // English
    "i","me","my","myself","we","our","ours","ourselves","you","your","yours",
    "yourself","yourselves","he","him","his","himself","she","her","hers",
    "herself","it","its","itself","they","them","their","theirs","themselves",
    "what","which","who","whom","this","that","these","those","am","is","are",
    "was","were","be","been","being","have","has","had","having","do","does",
    "did","doing","a","an","the","and","but","if","or","because","as","until",
    "while","of","at","by","for","with","about","against","between","through",
    "during","before","after","above","below","to","from","up","down","in",
    "out","on","off","over","under","again","further","then","once","here",
    "there","when","where","why","how","all","both","each","few","more","most",
    "other","some","such","no","nor","not","only","own","same","so","than",
    "too","very","s","t","can","will","just","don","should","now","d","ll",
    "m","o","re","ve","y","ain","aren","couldn","didn","doesn","hadn","hasn",
    "haven","isn","ma","mightn","mustn","needn","shan","shouldn","wasn",
    "weren","won","wouldn","ok","yes","yeah","yep","nah","nope","oh",
    "ah","um","uh","like","lol","haha","hahaha","xd","xdd",

    // Polish
    "w","z","na","je","się","nie","że","co","tak","za","ale",
    "od","po","jak","już","mi","ty","ja","ten","ta","te","go","mu","czy",
    "jest","są","był","była","było","być","mam","masz","si","tu",
    "tam","też","tym","tego","tej","tych","bo","ze","sobie","tylko","jeszcze",
    "może","trzeba","bardzo","teraz","kiedy","gdzie","dlaczego","bez","przy",
    "nad","pod","przed","przez","dla","ani","albo","u","ku","aż",
    "juz","sie","moze","tez","wiec","czyli","dobra"
};

// -------------------------------------------------------------
// UTF-8 helpers
// -------------------------------------------------------------

// Decodes the code point starting at s[i] and advances i past it.
// Invalid or truncated sequences yield the lead byte as-is.
static char32_t decodeNext(const std::string& s, std::size_t& i)
{
    const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();
    unsigned char c = p[i];

    int extra = 0;
    char32_t cp = 0;
    if (c < 0x80)                { cp = c;        extra = 0; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else
    {
        ++i;
        return c;
    }

    for (int k = 1; k <= extra; ++k)
    {
        if (i + k >= n || (p[i + k] & 0xC0) != 0x80)
        {
            ++i;
            return c;
        }
        cp = (cp << 6) | (p[i + k] & 0x3F);
    }

    i += static_cast<std::size_t>(extra) + 1;
    return cp;
}

static void appendUtf8(std::string& out, char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static bool isUnicodeSpace(char32_t cp)
{
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D))
        return true;
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
           cp == 0x205F || cp == 0x3000 || cp == 0xFEFF;
}

static bool isTokenDelimiter(char32_t cp)
{
    if (isUnicodeSpace(cp))
        return true;
    if (cp >= 0x80)
        return false;

    switch (static_cast<char>(cp))
    {
        case '.': case ',': case '!': case '?': case ';': case ':':
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '"': case '\'': case '-': case '/': case '\\': case '<':
        case '>': case '@': case '#': case '$': case '%': case '^':
        case '&': case '*': case '+': case '=': case '|': case '~':
        case '`':
            return true;
        default:
            return false;
    }
}

static char32_t lowerCodepoint(char32_t cp)
{
    if (cp >= 'A' && cp <= 'Z')
        return cp + 0x20;
    if (cp < 0xC0)
        return cp;

    // Latin-1 supplement
    if (cp <= 0xDE)
        return cp == 0xD7 ? cp : cp + 0x20;

    // Latin Extended-A: alternating upper/lower pairs
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177))
        return (cp % 2 == 0) ? cp + 1 : cp;
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E))
        return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp == 0x178)
        return 0xFF;

    // Greek
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2)
        return cp + 0x20;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F)
        return cp + 0x50;
    if (cp >= 0x410 && cp <= 0x42F)
        return cp + 0x20;

    return cp;
}

// Emoji_Presentation + Extended_Pictographic, merged into inclusive ranges.
struct CodepointRange
{
    char32_t first;
    char32_t last;
};

static const CodepointRange EMOJI_RANGES[] = {
    {0x00A9, 0x00A9}, {0x00AE, 0x00AE}, {0x203C, 0x203C}, {0x2049, 0x2049},
    {0x2122, 0x2122}, {0x2139, 0x2139}, {0x2194, 0x2199}, {0x21A9, 0x21AA},
    {0x231A, 0x231B}, {0x2328, 0x2328}, {0x2388, 0x2388}, {0x23CF, 0x23CF},
    {0x23E9, 0x23F3}, {0x23F8, 0x23FA}, {0x24C2, 0x24C2}, {0x25AA, 0x25AB},
    {0x25B6, 0x25B6}, {0x25C0, 0x25C0}, {0x25FB, 0x25FE}, {0x2600, 0x2605},
    {0x2607, 0x2612}, {0x2614, 0x2685}, {0x2690, 0x2705}, {0x2708, 0x2712},
    {0x2714, 0x2714}, {0x2716, 0x2716}, {0x271D, 0x271D}, {0x2721, 0x2721},
    {0x2728, 0x2728}, {0x2733, 0x2734}, {0x2744, 0x2744}, {0x2747, 0x2747},
    {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755}, {0x2757, 0x2757},
    {0x2763, 0x2767}, {0x2795, 0x2797}, {0x27A1, 0x27A1}, {0x27B0, 0x27B0},
    {0x27BF, 0x27BF}, {0x2934, 0x2935}, {0x2B05, 0x2B07}, {0x2B1B, 0x2B1C},
    {0x2B50, 0x2B50}, {0x2B55, 0x2B55}, {0x3030, 0x3030}, {0x303D, 0x303D},
    {0x3297, 0x3297}, {0x3299, 0x3299},
    {0x1F000, 0x1F0FF}, {0x1F10D, 0x1F10F}, {0x1F12F, 0x1F12F},
    {0x1F16C, 0x1F171}, {0x1F17E, 0x1F17F}, {0x1F18E, 0x1F18E},
    {0x1F191, 0x1F1FF}, {0x1F201, 0x1F20F}, {0x1F21A, 0x1F21A},
    {0x1F22F, 0x1F22F}, {0x1F232, 0x1F23A}, {0x1F23C, 0x1F23F},
    {0x1F249, 0x1F53D}, {0x1F546, 0x1F64F}, {0x1F680, 0x1F6FF},
    {0x1F774, 0x1F77F}, {0x1F7D5, 0x1F7FF}, {0x1F80C, 0x1F80F},
    {0x1F848, 0x1F84F}, {0x1F85A, 0x1F85F}, {0x1F888, 0x1F88F},
    {0x1F8AE, 0x1F8FF}, {0x1F90C, 0x1F93A}, {0x1F93C, 0x1F945},
    {0x1F947, 0x1FAFF}, {0x1FC00, 0x1FFFD}
};

bool isEmojiCodepoint(char32_t cp)
{
    if (cp < 0xA9)
        return false;

    auto it = std::upper_bound(
        std::begin(EMOJI_RANGES), std::end(EMOJI_RANGES), cp,
        [](char32_t value, const CodepointRange& r) { return value < r.first; });
    if (it == std::begin(EMOJI_RANGES))
        return false;
    --it;
    return cp <= it->last;
}

// -------------------------------------------------------------
// Feature extractors
// -------------------------------------------------------------

long long countWords(const std::string& text)
{
    long long words = 0;
    bool inWord = false;

    std::size_t i = 0;
    while (i < text.size())
    {
        char32_t cp = decodeNext(text, i);
        if (isUnicodeSpace(cp))
        {
            inWord = false;
        }
        else if (!inWord)
        {
            inWord = true;
            ++words;
        }
    }
    return words;
}

std::size_t codepointLength(const std::string& text)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        decodeNext(text, i);
        ++count;
    }
    return count;
}

bool isBlank(const std::string& text)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        if (!isUnicodeSpace(decodeNext(text, i)))
            return false;
    }
    return true;
}

std::vector<std::string> extractEmojis(const std::string& text)
{
    std::vector<std::string> emojis;

    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t start = i;
        char32_t cp = decodeNext(text, i);
        if (isEmojiCodepoint(cp))
            emojis.push_back(text.substr(start, i - start));
    }
    return emojis;
}

std::string toLowerUtf8(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t start = i;
        char32_t cp = decodeNext(text, i);
        char32_t lower = lowerCodepoint(cp);
        if (lower == cp)
            out.append(text, start, i - start);
        else
            appendUtf8(out, lower);
    }
    return out;
}

std::vector<std::string> tokenizeWords(const std::string& text)
{
    std::vector<std::string> tokens;

    std::string current;
    std::size_t currentLen = 0;
    bool currentHasLetter  = false;

    auto flush = [&]() {
        if (currentLen >= 2 && currentHasLetter &&
            STOP_WORDS.find(current) == STOP_WORDS.end())
        {
            tokens.push_back(current);
        }
        current.clear();
        currentLen = 0;
        currentHasLetter = false;
    };

    const std::string lowered = toLowerUtf8(text);

    std::size_t i = 0;
    while (i < lowered.size())
    {
        char32_t cp = decodeNext(lowered, i);

        // Emoji are dropped without splitting the surrounding word.
        if (isEmojiCodepoint(cp) || cp == 0xFE0F || cp == 0x200D)
            continue;

        if (isTokenDelimiter(cp))
        {
            flush();
            continue;
        }

        appendUtf8(current, cp);
        ++currentLen;
        if ((cp >= 'a' && cp <= 'z') || cp >= 0xC0)
            currentHasLetter = true;
    }
    flush();

    return tokens;
}

std::vector<std::string> adjacentBigrams(const std::vector<std::string>& tokens)
{
    std::vector<std::string> out;
    for (std::size_t j = 0; j + 1 < tokens.size(); ++j)
        out.push_back(tokens[j] + " " + tokens[j + 1]);
    return out;
}

std::vector<std::string> adjacentTrigrams(const std::vector<std::string>& tokens)
{
    std::vector<std::string> out;
    for (std::size_t j = 0; j + 2 < tokens.size(); ++j)
        out.push_back(tokens[j] + " " + tokens[j + 1] + " " + tokens[j + 2]);
    return out;
}

bool containsQuestion(const std::string& text)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t http = text.find("http", pos);
        std::size_t limit = (http == std::string::npos) ? text.size() : http;

        if (text.find('?', pos) < limit)
            return true;
        if (http == std::string::npos)
            return false;

        bool isUrl = text.compare(http, 7, "http://") == 0 ||
                     text.compare(http, 8, "https://") == 0;
        if (!isUrl)
        {
            pos = http + 4;
            continue;
        }

        // Skip the URL up to the next whitespace.
        pos = http;
        while (pos < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
    }
    return false;
}
