#include "MlfCodec.hpp"
#include <charconv>
#include <cmath>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include "core/Logger.hpp"

namespace pa::formats {

namespace {

using WordsResult = Result<std::vector<Word>>;

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    usize pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
            ++pos;
        if (pos >= line.size())
            break;
        usize end = pos;
        while (end < line.size() && line[end] != ' ' && line[end] != '\t')
            ++end;
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return fields;
}

std::optional<i64> parseTicks(std::string_view field) {
    i64 value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size())
        return std::nullopt;
    return value;
}

WordsResult lineError(usize lineNo, std::string_view line, std::string_view what) {
    return WordsResult::err(ErrorCode::Format,
                            fmt::format("MLF line {}: {} ('{}')",
                                        lineNo,
                                        what,
                                        line));
}

} // namespace

Result<std::vector<Word>> MlfCodec::parse(std::string_view bytes) const {
    std::vector<Word> words;
    std::optional<std::string> wordLabel;
    std::vector<Phoneme> phonemes;

    auto flush = [&]() {
        if (wordLabel && !phonemes.empty())
            words.emplace_back(*wordLabel, std::move(phonemes));
        phonemes.clear();
    };

    bool inBlock = false;
    bool sawBlock = false;
    usize lineNo = 0;
    usize pos = 0;

    while (pos <= bytes.size()) {
        auto next = bytes.find('\n', pos);
        if (next == std::string_view::npos)
            next = bytes.size();
        auto line = bytes.substr(pos, next - pos);
        pos = next + 1;
        ++lineNo;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        auto fields = splitFields(line);
        if (fields.empty())
            continue;

        if (fields[0] == "#!MLF!#")
            continue;

        if (fields[0].front() == '"') {
            if (sawBlock)
                return lineError(lineNo, line, "more than one utterance");
            inBlock = true;
            sawBlock = true;
            continue;
        }

        if (fields.size() == 1 && fields[0] == ".") {
            inBlock = false;
            continue;
        }

        if (sawBlock && !inBlock)
            return lineError(lineNo, line, "label outside an utterance block");

        if (fields.size() < 3 || fields.size() > 5) {
            return lineError(lineNo,
                             line,
                             fmt::format("expected 'start end phone [score "
                                         "[word]]', got {} fields",
                                         fields.size()));
        }

        auto startTicks = parseTicks(fields[0]);
        auto endTicks = parseTicks(fields[1]);
        if (!startTicks || !endTicks)
            return lineError(lineNo, line, "times must be integer ticks");
        if (*startTicks < 0)
            return lineError(lineNo, line, "negative start time");
        if (*endTicks < *startTicks)
            return lineError(lineNo, line, "end time precedes start time");

        std::string phone(fields[2]);
        std::optional<std::string> startsWord;
        if (fields.size() == 5)
            startsWord = std::string(fields[4]);

        if (*startTicks == *endTicks &&
            (!startsWord || *startsWord == kSilence)) {
            LOG_DEBUG("MlfCodec: Dropping zero-length '{}' on line {}",
                      phone,
                      lineNo);
            continue;
        }

        if (startsWord) {
            flush();
            wordLabel = std::move(startsWord);
        } else if (!wordLabel) {
            return lineError(lineNo, line, "phoneme precedes the first word");
        }

        phonemes.emplace_back(std::move(phone),
                              static_cast<f64>(*startTicks) / kTicksPerSecond,
                              static_cast<f64>(*endTicks) / kTicksPerSecond);
    }
    flush();

    LOG_TRACE("MlfCodec: Parsed {} words", words.size());
    return WordsResult::ok(std::move(words));
}

Result<std::string> MlfCodec::serialize(const std::vector<Word>& words) const {
    auto unwritable = [](const std::string& label) {
        return label.empty() ||
               label.find_first_of(" \t\r\n") != std::string::npos;
    };
    for (const auto& word : words) {
        if (unwritable(word.label())) {
            return Result<std::string>::err(
                    ErrorCode::Format,
                    fmt::format("MLF cannot store word label '{}'",
                                word.label()));
        }
        for (const auto& phoneme : word.phonemes()) {
            if (unwritable(phoneme.label())) {
                return Result<std::string>::err(
                        ErrorCode::Format,
                        fmt::format("MLF cannot store phoneme label '{}'",
                                    phoneme.label()));
            }
        }
    }

    std::string out = "#!MLF!#\n\"*/alignment.lab\"\n";
    for (const auto& word : words) {
        bool first = true;
        for (const auto& phoneme : word.phonemes()) {
            auto start = std::llround(phoneme.start() * kTicksPerSecond);
            auto end = std::llround(phoneme.end() * kTicksPerSecond);
            if (first) {
                out += fmt::format("{} {} {} 0 {}\n",
                                   start,
                                   end,
                                   phoneme.label(),
                                   word.label());
                first = false;
            } else {
                out += fmt::format("{} {} {} 0\n", start, end, phoneme.label());
            }
        }
    }
    out += ".\n";
    return Result<std::string>::ok(std::move(out));
}

} // namespace pa::formats
