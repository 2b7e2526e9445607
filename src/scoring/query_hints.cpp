#include "facet/scoring/query_hints.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <utility>
#include <vector>

namespace facet::scoring {

namespace {

struct Lexeme {
    std::string_view canonical;
    std::array<std::string_view, 6> keywords;
};

constexpr std::array<Lexeme, 4> kMetals{{
    {"platinum", {"platinum", "pt"}},
    {"white gold", {"white gold", "whitegold", "18k white", "18k white gold"}},
    {"yellow gold", {"yellow gold", "yellowgold", "18k yellow", "18k yellow gold"}},
    {"rose gold", {"rose gold", "rosegold", "pink gold", "pinkgold", "18k rose", "18k pink"}},
}};

constexpr std::array<Lexeme, 10> kShapes{{
    {"Round", {"round", "circle", "circular"}},
    {"Princess", {"princess", "square"}},
    {"Cushion", {"cushion", "pillow"}},
    {"Oval", {"oval", "elliptical"}},
    {"Emerald", {"emerald", "rectangular"}},
    {"Pear", {"pear", "teardrop"}},
    {"Marquise", {"marquise", "navette"}},
    {"Asscher", {"asscher", "square step"}},
    {"Radiant", {"radiant"}},
    {"Heart", {"heart"}},
}};

constexpr std::string_view kGrades = "DEFGHIJKLMN";

// " a b c " with every non-alphanumeric run collapsed to one space, so that
// keywords can be matched on word boundaries with " kw ".
auto padded_words(std::string_view text) -> std::string {
    std::string out = " ";
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (out.back() != ' ') {
            out.push_back(' ');
        }
    }
    if (out.back() != ' ') out.push_back(' ');
    return out;
}

auto tokens(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            cur.push_back(static_cast<char>(c));
        } else if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

template <std::size_t N>
auto match_lexicon(const std::string& words, const std::array<Lexeme, N>& lexicon)
    -> std::optional<std::string> {
    for (const auto& lex : lexicon) {
        for (auto kw : lex.keywords) {
            if (kw.empty()) continue;
            std::string needle = " ";
            needle.append(kw);
            needle.push_back(' ');
            if (words.find(needle) != std::string::npos) return std::string(lex.canonical);
        }
    }
    return std::nullopt;
}

auto is_color_word(const std::string& t) -> bool {
    const auto l = to_lower(t);
    return l == "color" || l == "colour" || l == "grade";
}

auto match_grade(const std::vector<std::string>& toks) -> std::optional<std::string> {
    for (char grade : kGrades) {
        for (std::size_t i = 0; i < toks.size(); ++i) {
            const auto& t = toks[i];
            if (t.size() != 1 || std::toupper(static_cast<unsigned char>(t[0])) != grade) continue;
            const bool near_color = (i > 0 && is_color_word(toks[i - 1])) ||
                                    (i + 1 < toks.size() && is_color_word(toks[i + 1]));
            const bool upper = t[0] == grade && grade != 'I';
            if (near_color || upper) return std::string(1, grade);
        }
    }
    return std::nullopt;
}

auto capitalize(std::string s) -> std::string {
    s = to_lower(s);
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

// Most frequent value, first-seen wins ties.
auto majority(const std::vector<std::string>& votes) -> std::optional<std::string> {
    std::optional<std::string> best;
    std::size_t best_count = 0;
    for (std::size_t i = 0; i < votes.size(); ++i) {
        if (std::find(votes.begin(), votes.begin() + static_cast<std::ptrdiff_t>(i), votes[i]) !=
            votes.begin() + static_cast<std::ptrdiff_t>(i)) {
            continue;
        }
        const auto count = static_cast<std::size_t>(std::count(votes.begin(), votes.end(), votes[i]));
        if (count > best_count) {
            best = votes[i];
            best_count = count;
        }
    }
    return best;
}

auto collect(std::span<const metadata::Item* const> items, std::size_t top_n,
             std::string_view attribute) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < items.size() && i < top_n; ++i) {
        if (!items[i]) continue;
        if (auto v = metadata::text(*items[i], attribute); v && !v->empty()) out.push_back(*v);
    }
    return out;
}

} // namespace

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto to_upper(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto extract_query_hints(std::string_view text) -> QueryHints {
    QueryHints h;
    if (text.empty()) return h;
    const auto words = padded_words(text);
    h.metal = match_lexicon(words, kMetals);
    // A bare "gold" only means yellow gold when no qualified metal matched.
    if (!h.metal && words.find(" gold ") != std::string::npos) h.metal = "yellow gold";
    h.metal_explicit = h.metal.has_value();
    if ((h.color = match_grade(tokens(text)))) h.color_explicit = true;
    if ((h.shape = match_lexicon(words, kShapes))) h.shape_explicit = true;
    return h;
}

auto infer_hints(QueryHints hints,
                 std::span<const metadata::Item* const> top_diamonds,
                 std::span<const metadata::Item* const> top_settings,
                 std::size_t top_n) -> QueryHints {
    if (!hints.metal) {
        auto votes = collect(top_settings, top_n, metadata::attr::metal);
        for (auto& v : votes) v = to_lower(v);
        hints.metal = majority(votes);
    }
    if (!hints.color) {
        auto votes = collect(top_diamonds, top_n, metadata::attr::color);
        for (auto& v : votes) v = to_upper(v);
        hints.color = majority(votes);
    }
    if (!hints.shape) {
        auto votes = collect(top_diamonds, top_n, metadata::attr::shape);
        for (auto& v : votes) v = capitalize(v);
        hints.shape = majority(votes);
    }
    return hints;
}

} // namespace facet::scoring
