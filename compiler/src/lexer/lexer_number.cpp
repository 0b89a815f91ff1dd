//! # Lexer - Numbers and Legal Values
//!
//! Every literal that starts with a digit (or a currency prefix).
//!
//! ## Literal Forms
//!
//! | Form     | Example               | Token             |
//! |----------|-----------------------|-------------------|
//! | Integer  | `42`                  | `IntLiteral`      |
//! | Float    | `3.75`                | `FloatLiteral`    |
//! | Percent  | `15%`, `2.5%`         | `PercentLiteral`  |
//! | Date     | `2024-01-31`          | `DateLiteral`     |
//! | Duration | `3 years, 2 months`   | `DurationLiteral` |
//! | Money    | `$1,000.50`, `SGD500` | `MoneyLiteral`    |
//!
//! ## Longest Match
//!
//! A date is tried before the plain integer, a `%` directly after a number
//! makes a percentage unless an operand follows (`10%3` stays modulo), and
//! a duration swallows as many `INT UNIT` pairs as it can.
//!
//! ## Dates
//!
//! Only ISO `YYYY-MM-DD` is accepted and the calendar is validated. The
//! `DD-MM-YYYY` shape is a hard error rather than a second accepted form.

#include "lexer/lexer.hpp"

#include <charconv>
#include <limits>

namespace yuho::lexer {

namespace {

enum class DurationUnit { Year, Month, Week, Day, Hour, Minute, Second };

struct UnitSpelling {
    std::string_view singular;
    std::string_view plural;
    DurationUnit unit;
};

constexpr UnitSpelling UNITS[] = {
    {"year", "years", DurationUnit::Year},       {"month", "months", DurationUnit::Month},
    {"week", "weeks", DurationUnit::Week},       {"day", "days", DurationUnit::Day},
    {"hour", "hours", DurationUnit::Hour},       {"minute", "minutes", DurationUnit::Minute},
    {"second", "seconds", DurationUnit::Second},
};

auto is_word_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

/// Matches a whole-word duration unit at `pos`.
auto match_unit(const Source& source, size_t pos) -> std::optional<std::pair<size_t, DurationUnit>> {
    size_t end = pos;
    while (end < source.length() && is_word_char(source.at(end))) {
        ++end;
    }
    auto word = source.slice(pos, end);
    for (const auto& spelling : UNITS) {
        if (word == spelling.singular || word == spelling.plural) {
            return std::make_pair(end - pos, spelling.unit);
        }
    }
    return std::nullopt;
}

void add_component(DurationValue& value, DurationUnit unit, int64_t amount) {
    switch (unit) {
    case DurationUnit::Year:
        value.years += amount;
        break;
    case DurationUnit::Month:
        value.months += amount;
        break;
    case DurationUnit::Week:
        value.weeks += amount;
        break;
    case DurationUnit::Day:
        value.days += amount;
        break;
    case DurationUnit::Hour:
        value.hours += amount;
        break;
    case DurationUnit::Minute:
        value.minutes += amount;
        break;
    case DurationUnit::Second:
        value.seconds += amount;
        break;
    }
}

auto skip_blanks(const Source& source, size_t pos) -> size_t {
    while (source.at(pos) == ' ' || source.at(pos) == '\t') {
        ++pos;
    }
    return pos;
}

auto count_digits(const Source& source, size_t pos) -> size_t {
    size_t n = 0;
    while (source.at(pos + n) >= '0' && source.at(pos + n) <= '9') {
        ++n;
    }
    return n;
}

auto parse_int(std::string_view digits) -> std::optional<int64_t> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto days_in_month(int32_t year, int month) -> int {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : DAYS[month - 1];
}

} // namespace

auto Lexer::lex_number() -> Token {
    if (auto date = try_lex_date()) {
        return std::move(*date);
    }

    while (is_digit(peek())) {
        advance();
    }

    bool is_float = false;
    if (peek() == '.' && is_digit(peek_next())) {
        is_float = true;
        advance();
        while (is_digit(peek())) {
            advance();
        }
    }

    auto text = source_.slice(token_start_, pos_);

    // `15%` is a percentage; `10%3` and `x%y` stay remainders.
    if (peek() == '%' && !is_identifier_continue(peek_next()) && peek_next() != '(') {
        advance();
        double value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{}) {
            return make_error_token("invalid percentage", ErrorCodes::LEX_INVALID_NUMBER);
        }
        auto token = make_token(TokenKind::PercentLiteral);
        token.value = PercentValue{value};
        return token;
    }

    if (is_float) {
        double value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{}) {
            return make_error_token("invalid float literal", ErrorCodes::LEX_INVALID_NUMBER);
        }
        auto token = make_token(TokenKind::FloatLiteral);
        token.value = FloatValue{value};
        return token;
    }

    auto value = parse_int(text);
    if (!value) {
        return make_error_token("integer literal '" + std::string(text) + "' is too large",
                                ErrorCodes::LEX_INVALID_NUMBER);
    }

    if (auto duration = try_lex_duration(*value)) {
        return std::move(*duration);
    }

    auto token = make_token(TokenKind::IntLiteral);
    token.value = IntValue{*value};
    return token;
}

auto Lexer::try_lex_date() -> std::optional<Token> {
    size_t start = token_start_;
    size_t first = count_digits(source_, start);

    // DD-MM-YYYY: recognised only to reject it.
    if (first == 2 && source_.at(start + 2) == '-' && count_digits(source_, start + 3) == 2 &&
        source_.at(start + 5) == '-' && count_digits(source_, start + 6) == 4) {
        pos_ = start + 10;
        return make_error_token("dates must be written YYYY-MM-DD, found '" +
                                    std::string(source_.slice(start, pos_)) + "'",
                                ErrorCodes::LEX_INVALID_DATE);
    }

    if (first != 4 || source_.at(start + 4) != '-' || count_digits(source_, start + 5) != 2 ||
        source_.at(start + 7) != '-' || count_digits(source_, start + 8) != 2) {
        return std::nullopt;
    }

    pos_ = start + 10;
    auto year = static_cast<int32_t>(*parse_int(source_.slice(start, start + 4)));
    auto month = static_cast<int>(*parse_int(source_.slice(start + 5, start + 7)));
    auto day = static_cast<int>(*parse_int(source_.slice(start + 8, start + 10)));

    if (month < 1 || month > 12) {
        return make_error_token("invalid month " + std::to_string(month) + " in date",
                                ErrorCodes::LEX_INVALID_DATE);
    }
    if (day < 1 || day > days_in_month(year, month)) {
        return make_error_token("invalid day " + std::to_string(day) + " for month " +
                                    std::to_string(month) + " of " + std::to_string(year),
                                ErrorCodes::LEX_INVALID_DATE);
    }

    auto token = make_token(TokenKind::DateLiteral);
    token.value =
        DateValue{.year = year, .month = static_cast<uint8_t>(month), .day = static_cast<uint8_t>(day)};
    return token;
}

auto Lexer::try_lex_duration(int64_t first_amount) -> std::optional<Token> {
    size_t unit_pos = skip_blanks(source_, pos_);
    auto unit = match_unit(source_, unit_pos);
    if (!unit) {
        return std::nullopt;
    }

    DurationValue value;
    add_component(value, unit->second, first_amount);
    pos_ = unit_pos + unit->first;

    // Further `[,] INT UNIT` groups; backtrack if a group is incomplete.
    for (;;) {
        size_t p = skip_blanks(source_, pos_);
        if (source_.at(p) == ',') {
            p = skip_blanks(source_, p + 1);
        }
        size_t digits = count_digits(source_, p);
        if (digits == 0) {
            break;
        }
        auto amount = parse_int(source_.slice(p, p + digits));
        size_t next_unit_pos = skip_blanks(source_, p + digits);
        auto next_unit = match_unit(source_, next_unit_pos);
        if (!amount || !next_unit) {
            break;
        }
        add_component(value, next_unit->second, *amount);
        pos_ = next_unit_pos + next_unit->first;
    }

    auto token = make_token(TokenKind::DurationLiteral);
    token.value = value;
    return token;
}

auto Lexer::lex_money(std::string currency) -> Token {
    size_t digits_start = pos_;
    size_t run = count_digits(source_, pos_);
    pos_ += run;

    std::string whole(source_.slice(digits_start, pos_));

    if (peek() == ',' && is_digit(peek_next())) {
        if (run > 3) {
            while (peek() == ',' || is_digit(peek())) {
                advance();
            }
            return make_error_token("malformed digit grouping in money literal",
                                    ErrorCodes::LEX_INVALID_NUMBER);
        }
        while (peek() == ',' && is_digit(peek_next())) {
            advance();
            size_t group = count_digits(source_, pos_);
            pos_ += group;
            if (group != 3) {
                return make_error_token("digit groups in money literals must have three digits",
                                        ErrorCodes::LEX_INVALID_NUMBER);
            }
            whole += std::string(source_.slice(pos_ - 3, pos_));
        }
    }

    int64_t cents = 0;
    if (peek() == '.' && is_digit(peek_next())) {
        advance();
        size_t frac = count_digits(source_, pos_);
        pos_ += frac;
        if (frac != 2) {
            return make_error_token("money amounts take exactly two decimal places",
                                    ErrorCodes::LEX_INVALID_NUMBER);
        }
        cents = *parse_int(source_.slice(pos_ - 2, pos_));
    }

    auto units = parse_int(whole);
    constexpr auto max_units = std::numeric_limits<int64_t>::max() / 100 - 1;
    if (!units || *units > max_units) {
        return make_error_token("money amount is too large", ErrorCodes::LEX_INVALID_NUMBER);
    }

    auto token = make_token(TokenKind::MoneyLiteral);
    token.value = MoneyValue{.minor_units = *units * 100 + cents, .currency = std::move(currency)};
    return token;
}

} // namespace yuho::lexer
