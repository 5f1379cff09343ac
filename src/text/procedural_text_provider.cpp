#include "procedural_text_provider.h"
#include "../utils/logging.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <vector>

namespace {

const std::vector<std::string> kStructures = {
    "The {adj} {noun} {verb} {adv} {prep} the {adj} {noun}.",
    "{det} {adj} {noun} {verb} {det} {adj} {noun} {prep} {det} {adj} {noun}.",
    "{pronoun} {adv} {verb} that {det} {noun} {verb} {adv} {prep} {det} {noun}.",
    "When {det} {adj} {noun} {verb} {adv}, {det} {adj} {noun} {verb} {prep} {det} {noun}.",
    "If {pronoun} {verb} {det} {adj} {noun}, {pronoun} will {verb} {det} {adj} {noun} {adv}.",
    "{det} {adj} {noun} {verb} to {verb} {prep} {det} {adj} {noun} {prep} {det} {noun}.",
    "{det} {noun} {verb} {adv}, but {det} {adj} {noun} {verb} {prep} {det} {adj} {noun}.",
    "Although {det} {noun} {verb} {adv}, {det} {adj} {noun} {verb} {prep} {det} {adj} {noun}.",
    "Not only {verb} {det} {adj} {noun} {adv}, but it also {verb} {prep} {det} {adj} {noun}.",
    "During {det} {adj} {noun}, {det} {adj} {noun} {verb} {adv} {prep} {det} {noun}.",
    "{det} {adj} {noun} {verb} {adv} because {det} {adj} {noun} {verb} {prep} {det} {noun}.",
    "{det} {noun} that {verb} {prep} {det} {adj} {noun} {adv} {verb} {det} {adj} {noun}.",
    "Why {verb} {det} {adj} {noun} {adv} {prep} {det} {adj} {noun}?",
    "How {adv} {verb} {det} {adj} {noun} {prep} {det} {adj} {noun}?",
};

// Templates that splice a multi-word phrase in verbatim
const std::vector<std::string> kPhraseStructures = {
    "The {adj} {noun} {phrase} {prep} {det} {adj} {noun}.",
    "{det} {adj} {noun} {adv} {phrase} {prep} {det} {noun}.",
    "When {phrase}, {det} {adj} {noun} {verb} {adv} {prep} {det} {noun}.",
    "{pronoun} {verb} that {phrase} {verb} {adv} {prep} {det} {adj} {noun}.",
    "Because of {phrase}, {det} {adj} {noun} {verb} {adv} {prep} {det} {noun}.",
    "Although {det} {adj} {noun} {verb} {adv}, {phrase} {verb} {prep} {det} {adj} {noun}.",
};

const std::map<std::string, std::vector<std::string>> kWords = {
    {"noun", {"time", "person", "year", "way", "day", "thing", "world", "life",
              "hand", "part", "child", "eye", "place", "work", "week", "case",
              "company", "system", "program", "question", "government", "number",
              "night", "point", "home", "water", "room", "mother", "area", "money",
              "story", "fact", "month", "lot", "right", "study", "book", "word", "business"}},
    {"verb", {"is", "was", "has", "had", "does", "did", "makes", "made",
              "knows", "thinks", "takes", "goes", "comes", "uses", "finds", "gives",
              "tells", "works", "likes", "needs", "feels", "becomes", "leaves",
              "puts", "means", "keeps", "lets", "begins", "seems", "helps", "shows", "plays"}},
    {"adj", {"good", "new", "first", "last", "long", "great", "little", "own",
             "other", "old", "right", "big", "high", "different", "small", "large",
             "early", "young", "important", "few", "public", "same", "able",
             "best", "better", "low", "certain", "special", "hard", "major", "personal",
             "current", "national", "natural", "physical", "strong", "possible", "clear"}},
    {"adv", {"quickly", "slowly", "carefully", "happily", "sadly", "really",
             "very", "extremely", "quite", "rather", "almost", "nearly", "too",
             "also", "then", "however", "again", "still", "sometimes", "often",
             "usually", "always", "never", "ever", "perhaps", "especially",
             "actually", "clearly", "certainly", "absolutely", "completely"}},
    {"prep", {"in", "on", "with", "at", "by", "for", "from", "to", "of", "about",
              "between", "among", "through", "without", "before", "after",
              "during", "around", "beyond", "under", "over", "into", "against",
              "despite", "throughout", "within", "along", "upon", "beside"}},
    {"pronoun", {"I", "you", "he", "she", "it", "we", "they"}},
    {"det", {"the", "a", "this", "that", "my", "your", "his", "her", "its", "our",
             "their", "some", "any", "each", "every", "another", "one", "no"}},
};

const std::vector<std::string> kTrailingClauses = {
    " in the most unexpected way",
    " as we had anticipated earlier",
    " according to recent observations",
    " with remarkable precision and detail",
    " throughout the entire process",
    " despite previous contradicting evidence",
    " in this particular context",
    " indeed",
    " for sure",
    " without doubt",
    " as expected",
};

// Short words only, so a filler line can always stop inside the band
const std::vector<std::string> kFillerWords = {
    "the", "quiet", "room", "holds", "every", "small", "story", "of", "time",
    "and", "light", "moves", "over", "old", "paper", "while", "words", "drift",
    "far", "away", "from", "home", "into", "night", "again",
};

const std::vector<std::string> kFillerLeads = {
    "Meanwhile", "Later", "Still", "Elsewhere", "Again", "Slowly",
};

const std::vector<std::string>& wordsFor(const std::string& slot) {
    auto it = kWords.find(slot);
    if (it == kWords.end()) {
        throw std::logic_error("unknown template slot {" + slot + "}");
    }
    return it->second;
}

bool tailContains(const std::string& text, const std::string& needle) {
    if (needle.empty() || text.size() < needle.size()) return false;
    return text.find(needle, text.size() - needle.size()) != std::string::npos;
}

char terminalOf(const std::string& line) {
    if (!line.empty() && (line.back() == '.' || line.back() == '!' || line.back() == '?')) {
        return line.back();
    }
    return '\0';
}

std::string capitalizeFirst(const std::string& line) {
    std::string result = line;
    if (!result.empty() && std::islower(static_cast<unsigned char>(result[0]))) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

}  // namespace

ProceduralTextProvider::ProceduralTextProvider(RandomSource& rng, int min_chars, int max_chars)
    : rng_(rng), min_chars_(min_chars), max_chars_(max_chars) {}

std::string ProceduralTextProvider::fillTemplate(const std::string& structure,
                                                 const std::string& avoid,
                                                 const std::string& phrase,
                                                 const std::string& special_slot,
                                                 const std::string& special_word) {
    std::string out;
    bool special_used = special_word.empty();
    size_t i = 0;
    while (i < structure.size()) {
        if (structure[i] != '{') {
            out += structure[i++];
            if (!avoid.empty() && tailContains(out, avoid)) return "";
            continue;
        }

        size_t close = structure.find('}', i);
        if (close == std::string::npos) {
            throw std::logic_error("unterminated slot in template: " + structure);
        }
        const std::string slot = structure.substr(i + 1, close - i - 1);
        i = close + 1;

        if (slot == "phrase") {
            out += phrase;
            continue;
        }
        if (!special_used && slot == special_slot) {
            out += special_word;
            special_used = true;
            continue;
        }

        const auto& words = wordsFor(slot);
        const int count = static_cast<int>(words.size());
        const int start = rng_.nextInt(0, count - 1);
        bool placed = false;
        for (int k = 0; k < count; k++) {
            const std::string& word = words[static_cast<size_t>((start + k) % count)];
            if (!avoid.empty() && (out + word).find(avoid) != std::string::npos) {
                continue;
            }
            out += word;
            placed = true;
            break;
        }
        if (!placed) return "";
    }
    return out;
}

std::string ProceduralTextProvider::fitToBand(const std::string& line, size_t protected_end, const std::string& avoid) {
    const size_t min_len = static_cast<size_t>(min_chars_);
    const size_t max_len = static_cast<size_t>(max_chars_);

    std::string body = line;
    char terminal = terminalOf(body);
    if (terminal != '\0') {
        body.pop_back();
    } else {
        terminal = '.';
    }

    for (int iteration = 0; iteration < 16; iteration++) {
        const size_t length = body.size() + 1;

        if (length < min_len) {
            const int count = static_cast<int>(kTrailingClauses.size());
            const int start = rng_.nextInt(0, count - 1);
            bool padded = false;
            for (int k = 0; k < count; k++) {
                const std::string& clause = kTrailingClauses[static_cast<size_t>((start + k) % count)];
                if (!avoid.empty() && (body + clause).find(avoid) != std::string::npos) {
                    continue;
                }
                body += clause;
                padded = true;
                break;
            }
            if (!padded) return "";
            continue;
        }

        if (length > max_len) {
            size_t cut = body.rfind(' ', max_len - 1);
            if (cut == std::string::npos || cut < protected_end) return "";
            body.resize(cut);
            while (!body.empty() && (body.back() == ',' || body.back() == ';' || body.back() == ':' || body.back() == ' ')) {
                body.pop_back();
            }
            if (body.size() < protected_end) return "";
            continue;
        }

        return body + terminal;
    }
    return "";
}

std::string ProceduralTextProvider::buildFillerLine(const std::string& lead, const std::string& avoid) {
    const size_t min_len = static_cast<size_t>(min_chars_);
    const size_t max_len = static_cast<size_t>(max_chars_);

    std::string body = lead;
    while (body.size() + 1 < min_len) {
        const int count = static_cast<int>(kFillerWords.size());
        const int start = rng_.nextInt(0, count - 1);
        bool placed = false;
        for (int k = 0; k < count; k++) {
            const std::string& word = kFillerWords[static_cast<size_t>((start + k) % count)];
            std::string candidate = body.empty() ? word : body + " " + word;
            if (!avoid.empty() && candidate.find(avoid) != std::string::npos) {
                continue;
            }
            body = candidate;
            placed = true;
            break;
        }
        if (!placed) {
            throw std::logic_error("no filler word avoids the phrase \"" + avoid + "\"");
        }
    }
    if (body.size() + 1 > max_len) {
        throw std::logic_error("filler line exceeds " + std::to_string(max_chars_) + " characters: " + body);
    }
    return capitalizeFirst(body) + ".";
}

std::string ProceduralTextProvider::buildLine(const std::string& avoid) {
    for (int attempt = 0; attempt < 8; attempt++) {
        std::string sentence = fillTemplate(rng_.pick(kStructures), avoid, "", "", "");
        if (sentence.empty()) continue;

        std::string capitalized = capitalizeFirst(sentence);
        if (avoid.empty() || capitalized.find(avoid) == std::string::npos) {
            sentence = capitalized;
        }

        std::string fitted = fitToBand(sentence, 0, avoid);
        if (!fitted.empty() && (avoid.empty() || fitted.find(avoid) == std::string::npos)) {
            return fitted;
        }
    }

    LOG_DEBUG("Template lines kept colliding with \"" << avoid << "\", using filler words");
    std::string lead;
    for (const auto& candidate : kFillerLeads) {
        if (avoid.empty() || candidate.find(avoid) == std::string::npos) {
            lead = candidate;
            break;
        }
    }
    return buildFillerLine(lead, avoid);
}

std::string ProceduralTextProvider::buildHighlightLine(const std::string& highlight) {
    const bool multi_word = highlight.find(' ') != std::string::npos;

    for (int attempt = 0; attempt < 8; attempt++) {
        std::string sentence;
        if (multi_word) {
            sentence = fillTemplate(rng_.pick(kPhraseStructures), "", highlight, "", "");
        } else {
            // Single word: substitute it for a noun, verb or adjective
            static const std::vector<std::string> kSlots = {"noun", "verb", "adj"};
            const std::string& slot = rng_.pick(kSlots);
            std::vector<std::string> candidates;
            for (const auto& structure : kStructures) {
                if (structure.find("{" + slot + "}") != std::string::npos) {
                    candidates.push_back(structure);
                }
            }
            sentence = fillTemplate(rng_.pick(candidates), "", "", slot, highlight);
        }

        size_t position = sentence.find(highlight);
        if (position == std::string::npos) continue;
        if (position > 0) {
            sentence = capitalizeFirst(sentence);
            position = sentence.find(highlight);
            if (position == std::string::npos) continue;
        }

        std::string fitted = fitToBand(sentence, position + highlight.size(), "");
        if (!fitted.empty() && fitted.find(highlight) != std::string::npos) {
            return fitted;
        }
    }

    LOG_DEBUG("Highlight templates did not fit the line band, using filler words");
    return buildFillerLine("When " + highlight + ",", "");
}

TextGenerationResult ProceduralTextProvider::generate(const std::string& highlight, int min_lines, int max_lines) {
    if (highlight.empty()) {
        throw std::logic_error("procedural text requested for an empty highlight phrase");
    }

    const int lo = std::max(1, min_lines);
    const int hi = std::max(lo, max_lines);
    const int num_lines = rng_.nextInt(lo, hi);
    const int highlight_index = rng_.nextInt(0, num_lines - 1);

    TextGenerationResult result;
    result.snippet.highlight_line_index = highlight_index;
    for (int i = 0; i < num_lines; i++) {
        result.snippet.lines.push_back(i == highlight_index ? buildHighlightLine(highlight) : buildLine(highlight));
    }

    TextBounds bounds;
    bounds.min_lines = lo;
    bounds.max_lines = hi;
    bounds.min_chars = min_chars_;
    bounds.max_chars = max_chars_;
    std::string errorMsg;
    if (!validateSnippet(result.snippet, highlight, bounds, errorMsg)) {
        throw std::logic_error("procedural generator produced an invalid snippet: " + errorMsg);
    }
    return result;
}
