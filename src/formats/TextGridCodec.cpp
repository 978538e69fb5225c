#include "TextGridCodec.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace pa::formats {

namespace {

// Values of a TextGrid file with the "key =" decoration stripped. Both the
// long and the short layout reduce to the same token sequence.
struct Token {
    enum class Kind { Number, String, Flag };

    Kind kind{Kind::Number};
    std::string text;
    f64 number{0.0};
    usize line{0};
};

struct Interval {
    f64 xmin{0.0};
    f64 xmax{0.0};
    std::string mark;
    usize line{0};
};

struct Tier {
    std::string cls;
    std::string name;
    std::vector<Interval> intervals;
};

template <typename T>
Result<T> lineError(usize line, std::string_view what) {
    return Result<T>::err(ErrorCode::Format,
                          fmt::format("TextGrid line {}: {}", line, what));
}

bool isNumberStart(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' ||
           c == '+' || c == '.';
}

Result<std::vector<Token>> tokenize(std::string_view text) {
    using R = Result<std::vector<Token>>;
    std::vector<Token> tokens;
    usize line = 1;
    usize i = 0;

    while (i < text.size()) {
        char c = text[i];

        if (c == '\n') {
            ++line;
            ++i;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '"') {
            Token tok{Token::Kind::String, {}, 0.0, line};
            ++i;
            bool closed = false;
            while (i < text.size()) {
                if (text[i] == '"') {
                    if (i + 1 < text.size() && text[i + 1] == '"') {
                        tok.text += '"';
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                if (text[i] == '\n')
                    ++line;
                tok.text += text[i++];
            }
            if (!closed)
                return lineError<std::vector<Token>>(tok.line,
                                                     "unterminated string");
            tokens.push_back(std::move(tok));
        } else if (c == '!') {
            // Comment until end of line (short layout)
            while (i < text.size() && text[i] != '\n')
                ++i;
        } else if (c == '<') {
            auto close = text.find('>', i);
            if (close == std::string_view::npos)
                return lineError<std::vector<Token>>(line, "unterminated flag");
            tokens.push_back({Token::Kind::Flag,
                              std::string(text.substr(i, close - i + 1)),
                              0.0,
                              line});
            i = close + 1;
        } else if (c == '[') {
            auto close = text.find(']', i);
            if (close == std::string_view::npos)
                return lineError<std::vector<Token>>(line, "unterminated '['");
            i = close + 1;
        } else if (isNumberStart(c)) {
            usize end = i;
            while (end < text.size() &&
                   !std::isspace(static_cast<unsigned char>(text[end])))
                ++end;
            auto field = text.substr(i, end - i);
            auto digits = field;
            if (!digits.empty() && digits.front() == '+')
                digits.remove_prefix(1);

            f64 value = 0.0;
            auto [ptr, ec] = std::from_chars(
                    digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc() || ptr != digits.data() + digits.size() ||
                !std::isfinite(value)) {
                return lineError<std::vector<Token>>(
                        line, fmt::format("bad number '{}'", field));
            }
            tokens.push_back({Token::Kind::Number, std::string(field), value, line});
            i = end;
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            // Key names ("xmin", "intervals", "size", ...)
            while (i < text.size() &&
                   (std::isalnum(static_cast<unsigned char>(text[i])) ||
                    text[i] == '_'))
                ++i;
        } else if (c == '=' || c == ':' || c == '?' || c == ']') {
            ++i;
        } else {
            return lineError<std::vector<Token>>(
                    line, fmt::format("unexpected character '{}'", c));
        }
    }
    return R::ok(std::move(tokens));
}

class TokenReader {
public:
    explicit TokenReader(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    }

    bool atEnd() const {
        return pos_ >= tokens_.size();
    }
    usize line() const {
        if (tokens_.empty())
            return 1;
        return atEnd() ? tokens_.back().line : tokens_[pos_].line;
    }

    Result<std::string> string(std::string_view what) {
        if (atEnd() || tokens_[pos_].kind != Token::Kind::String)
            return unexpected<std::string>(what);
        return Result<std::string>::ok(tokens_[pos_++].text);
    }

    Result<f64> number(std::string_view what) {
        if (atEnd() || tokens_[pos_].kind != Token::Kind::Number)
            return unexpected<f64>(what);
        return Result<f64>::ok(tokens_[pos_++].number);
    }

    Result<usize> count(std::string_view what) {
        auto value = number(what);
        if (!value)
            return Result<usize>::err(value.error());
        if (*value < 0.0 || *value != std::floor(*value)) {
            return lineError<usize>(tokens_[pos_ - 1].line,
                                    fmt::format("{} must be a non-negative "
                                                "integer, got {}",
                                                what,
                                                *value));
        }
        return Result<usize>::ok(static_cast<usize>(*value));
    }

    Result<std::string> flag(std::string_view what) {
        if (atEnd() || tokens_[pos_].kind != Token::Kind::Flag)
            return unexpected<std::string>(what);
        return Result<std::string>::ok(tokens_[pos_++].text);
    }

private:
    template <typename T>
    Result<T> unexpected(std::string_view what) {
        if (atEnd())
            return lineError<T>(line(),
                                fmt::format("expected {}, got end of file", what));
        return lineError<T>(tokens_[pos_].line,
                            fmt::format("expected {}, got '{}'",
                                        what,
                                        tokens_[pos_].text));
    }

    std::vector<Token> tokens_;
    usize pos_{0};
};

Result<std::vector<Tier>> readTiers(std::string_view bytes) {
    using R = Result<std::vector<Tier>>;

    auto tokens = tokenize(bytes);
    if (!tokens)
        return R::err(tokens.error());
    TokenReader in(std::move(tokens).value());

    auto fileType = in.string("file type");
    if (!fileType)
        return R::err(fileType.error());
    if (!fileType->starts_with("ooTextFile")) {
        return lineError<std::vector<Tier>>(
                1, fmt::format("unsupported file type '{}'", *fileType));
    }
    auto objectClass = in.string("object class");
    if (!objectClass)
        return R::err(objectClass.error());
    if (!objectClass->starts_with("TextGrid")) {
        return lineError<std::vector<Tier>>(
                in.line(), fmt::format("object class '{}' is not a TextGrid",
                                       *objectClass));
    }

    // Grid extent is implied by the intervals
    for (auto what : {"grid xmin", "grid xmax"}) {
        auto bound = in.number(what);
        if (!bound)
            return R::err(bound.error());
    }

    std::vector<Tier> tiers;
    auto exists = in.flag("<exists> or <absent>");
    if (!exists)
        return R::err(exists.error());
    if (*exists != "<exists>") {
        if (!in.atEnd())
            return lineError<std::vector<Tier>>(in.line(), "trailing content");
        return R::ok(std::move(tiers));
    }

    auto tierCount = in.count("tier count");
    if (!tierCount)
        return R::err(tierCount.error());
    for (usize t = 0; t < *tierCount; ++t) {
        Tier tier;
        auto cls = in.string("tier class");
        if (!cls)
            return R::err(cls.error());
        auto name = in.string("tier name");
        if (!name)
            return R::err(name.error());
        for (auto what : {"tier xmin", "tier xmax"}) {
            auto bound = in.number(what);
            if (!bound)
                return R::err(bound.error());
        }
        tier.cls = std::move(cls).value();
        tier.name = std::move(name).value();

        if (tier.cls == "IntervalTier") {
            auto n = in.count("interval count");
            if (!n)
                return R::err(n.error());
            tier.intervals.reserve(*n);
            for (usize k = 0; k < *n; ++k) {
                Interval interval;
                interval.line = in.line();
                auto imin = in.number("interval xmin");
                if (!imin)
                    return R::err(imin.error());
                auto imax = in.number("interval xmax");
                if (!imax)
                    return R::err(imax.error());
                auto mark = in.string("interval text");
                if (!mark)
                    return R::err(mark.error());
                if (*imax < *imin) {
                    return lineError<std::vector<Tier>>(
                            interval.line,
                            fmt::format("interval ends ({}) before it starts "
                                        "({})",
                                        *imax,
                                        *imin));
                }
                if (*imax == *imin)
                    continue;
                interval.xmin = *imin;
                interval.xmax = *imax;
                interval.mark = std::move(mark).value();
                tier.intervals.push_back(std::move(interval));
            }
        } else if (tier.cls == "TextTier") {
            auto n = in.count("point count");
            if (!n)
                return R::err(n.error());
            for (usize k = 0; k < *n; ++k) {
                auto time = in.number("point time");
                if (!time)
                    return R::err(time.error());
                auto mark = in.string("point mark");
                if (!mark)
                    return R::err(mark.error());
            }
        } else {
            return lineError<std::vector<Tier>>(
                    in.line(), fmt::format("unknown tier class '{}'", tier.cls));
        }
        tiers.push_back(std::move(tier));
    }

    if (!in.atEnd())
        return lineError<std::vector<Tier>>(in.line(), "trailing content");
    return R::ok(std::move(tiers));
}

const Tier* findTier(const std::vector<Tier>& tiers, std::string_view key) {
    for (const auto& tier : tiers) {
        if (tier.cls == "IntervalTier" &&
            file::toLower(tier.name).find(key) != std::string::npos)
            return &tier;
    }
    return nullptr;
}

std::string formatNumber(f64 value) {
    return fmt::format("{}", value);
}

std::string escape(const std::string& mark) {
    std::string out;
    out.reserve(mark.size());
    for (char c : mark) {
        if (c == '"')
            out += '"';
        out += c;
    }
    return out;
}

void writeTier(std::string& out,
               usize index,
               std::string_view name,
               f64 xmin,
               f64 xmax,
               const std::vector<Interval>& intervals) {
    out += fmt::format("    item [{}]:\n", index);
    out += "        class = \"IntervalTier\"\n";
    out += fmt::format("        name = \"{}\"\n", name);
    out += fmt::format("        xmin = {}\n", formatNumber(xmin));
    out += fmt::format("        xmax = {}\n", formatNumber(xmax));
    out += fmt::format("        intervals: size = {}\n", intervals.size());
    for (usize i = 0; i < intervals.size(); ++i) {
        out += fmt::format("        intervals [{}]:\n", i + 1);
        out += fmt::format("            xmin = {}\n",
                           formatNumber(intervals[i].xmin));
        out += fmt::format("            xmax = {}\n",
                           formatNumber(intervals[i].xmax));
        out += fmt::format("            text = \"{}\"\n",
                           escape(intervals[i].mark));
    }
}

} // namespace

Result<std::vector<Word>> TextGridCodec::parse(std::string_view bytes) const {
    using R = Result<std::vector<Word>>;

    auto tiers = readTiers(bytes);
    if (!tiers)
        return R::err(tiers.error());

    const auto* wordTier = findTier(tiers.value(), "word");
    const auto* phoneTier = findTier(tiers.value(), "phon");
    if (wordTier == nullptr || phoneTier == nullptr) {
        return R::err(ErrorCode::Format,
                      "Cannot determine which TextGrid tiers correspond to "
                      "words and phonemes");
    }

    const auto& config = std::as_const(CONFIG);
    const Seconds tol = config.alignment().contiguityTolerance;
    const auto& silenceMark = config.textgrid().silenceMark;
    const auto& phones = phoneTier->intervals;

    std::vector<Word> words;
    words.reserve(wordTier->intervals.size());
    usize phoneIdx = 0;

    for (const auto& interval : wordTier->intervals) {
        std::vector<Phoneme> phonemes;
        while (phoneIdx < phones.size() &&
               phones[phoneIdx].xmax <= interval.xmax + tol) {
            const auto& phone = phones[phoneIdx++];
            bool silent = phone.mark.empty() || phone.mark == silenceMark;
            phonemes.emplace_back(silent ? std::string(kSilence) : phone.mark,
                                  phone.xmin,
                                  phone.xmax);
        }

        if (phonemes.empty()) {
            return R::err(ErrorCode::Validation,
                          fmt::format("TextGrid line {}: word '{}' [{}, {}] "
                                      "contains no phone intervals",
                                      interval.line,
                                      interval.mark,
                                      interval.xmin,
                                      interval.xmax));
        }
        if (std::abs(phonemes.front().start() - interval.xmin) > tol) {
            return R::err(ErrorCode::Validation,
                          fmt::format("TextGrid line {}: word '{}' starts at "
                                      "{} but its first phone starts at {}",
                                      interval.line,
                                      interval.mark,
                                      interval.xmin,
                                      phonemes.front().start()));
        }
        if (std::abs(phonemes.back().end() - interval.xmax) > tol) {
            return R::err(ErrorCode::Validation,
                          fmt::format("TextGrid line {}: word '{}' ends at {} "
                                      "but its last phone ends at {}",
                                      interval.line,
                                      interval.mark,
                                      interval.xmax,
                                      phonemes.back().end()));
        }

        auto label = interval.mark.empty() ? std::string(kSilence)
                                           : interval.mark;
        words.emplace_back(std::move(label), std::move(phonemes));
    }

    if (phoneIdx < phones.size()) {
        const auto& stray = phones[phoneIdx];
        return R::err(ErrorCode::Validation,
                      fmt::format("TextGrid line {}: phone '{}' [{}, {}] lies "
                                  "outside every word",
                                  stray.line,
                                  stray.mark,
                                  stray.xmin,
                                  stray.xmax));
    }

    LOG_TRACE("TextGridCodec: Parsed {} words from tiers '{}' and '{}'",
              words.size(),
              wordTier->name,
              phoneTier->name);
    return R::ok(std::move(words));
}

Result<std::string> TextGridCodec::serialize(
        const std::vector<Word>& words) const {
    using R = Result<std::string>;
    const auto& silenceMark = std::as_const(CONFIG).textgrid().silenceMark;

    // The reader drops empty intervals and maps empty or silence marks to
    // kSilence, so anything that would come back different is refused here.
    for (const auto& word : words) {
        if (word.label().empty()) {
            return R::err(ErrorCode::Format,
                          fmt::format("TextGrid cannot store an empty word "
                                      "label at {}s",
                                      word.start()));
        }
        for (const auto& phoneme : word.phonemes()) {
            if (phoneme.duration() == 0.0) {
                return R::err(ErrorCode::Format,
                              fmt::format("TextGrid cannot store zero-length "
                                          "phoneme '{}' at {}s in word '{}'",
                                          phoneme.label(),
                                          phoneme.start(),
                                          word.label()));
            }
            if (!phoneme.isSilence() &&
                (phoneme.label().empty() || phoneme.label() == silenceMark)) {
                return R::err(ErrorCode::Format,
                              fmt::format("TextGrid cannot store phoneme label "
                                          "'{}' in word '{}': it reads back as "
                                          "silence",
                                          phoneme.label(),
                                          word.label()));
            }
        }
    }

    std::vector<Interval> phoneIntervals;
    std::vector<Interval> wordIntervals;
    wordIntervals.reserve(words.size());
    for (const auto& word : words) {
        wordIntervals.push_back({word.start(), word.end(), word.label(), 0});
        for (const auto& phoneme : word.phonemes()) {
            phoneIntervals.push_back(
                    {phoneme.start(),
                     phoneme.end(),
                     phoneme.isSilence() ? silenceMark : phoneme.label(),
                     0});
        }
    }

    const f64 xmin = words.empty() ? 0.0 : words.front().start();
    const f64 xmax = words.empty() ? 0.0 : words.back().end();

    std::string out;
    out += "File type = \"ooTextFile\"\n";
    out += "Object class = \"TextGrid\"\n\n";
    out += fmt::format("xmin = {}\n", formatNumber(xmin));
    out += fmt::format("xmax = {}\n", formatNumber(xmax));
    out += "tiers? <exists>\n";
    out += "size = 2\n";
    out += "item []:\n";
    writeTier(out, 1, "phone", xmin, xmax, phoneIntervals);
    writeTier(out, 2, "word", xmin, xmax, wordIntervals);

    return R::ok(std::move(out));
}

} // namespace pa::formats
