#include "common/diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace yuho {

auto severity_to_string(DiagnosticSeverity severity) -> std::string_view {
    switch (severity) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    case DiagnosticSeverity::Help:
        return "help";
    }
    return "unknown";
}

auto diagnostic_kind_to_string(DiagnosticKind kind) -> std::string_view {
    switch (kind) {
    case DiagnosticKind::LexError:
        return "LexError";
    case DiagnosticKind::ParseError:
        return "ParseError";
    case DiagnosticKind::ResolveError:
        return "ResolveError";
    case DiagnosticKind::TypeError:
        return "TypeError";
    case DiagnosticKind::UnresolvedReference:
        return "UnresolvedReferenceError";
    case DiagnosticKind::DuplicateDeclaration:
        return "DuplicateDeclarationError";
    case DiagnosticKind::CyclicDefinition:
        return "CyclicDefinitionError";
    case DiagnosticKind::UnreachableArm:
        return "UnreachableArm";
    case DiagnosticKind::InexhaustiveMatch:
        return "InexhaustiveMatch";
    }
    return "Unknown";
}

auto Diagnostic::operator==(const Diagnostic& other) const -> bool {
    if (severity != other.severity || kind != other.kind || code != other.code ||
        message != other.message || file != other.file || primary_span != other.primary_span ||
        notes != other.notes || help != other.help || labels.size() != other.labels.size()) {
        return false;
    }
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].span != other.labels[i].span ||
            labels[i].message != other.labels[i].message ||
            labels[i].is_primary != other.labels[i].is_primary) {
            return false;
        }
    }
    return true;
}

auto make_error(DiagnosticKind kind, const char* code, std::string message, const SourceSpan& span)
    -> Diagnostic {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Error;
    diag.kind = kind;
    diag.code = code;
    diag.message = std::move(message);
    diag.file = std::string(span.start.file);
    diag.primary_span = span;
    return diag;
}

auto make_warning(DiagnosticKind kind, const char* code, std::string message,
                  const SourceSpan& span) -> Diagnostic {
    auto diag = make_error(kind, code, std::move(message), span);
    diag.severity = DiagnosticSeverity::Warning;
    return diag;
}

auto escape_json(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

auto has_errors(const std::vector<Diagnostic>& diagnostics) -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.is_error(); });
}

void apply_warning_policy(std::vector<Diagnostic>& diagnostics) {
    if (CompilerOptions::warning_level == WarningLevel::None) {
        std::erase_if(diagnostics, [](const Diagnostic& d) { return d.is_warning(); });
        return;
    }
    if (CompilerOptions::warnings_as_errors) {
        for (auto& diag : diagnostics) {
            if (diag.is_warning()) {
                diag.severity = DiagnosticSeverity::Error;
            }
        }
    }
}

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));
            size_t cost = (c1 == c2) ? 0 : 1;
            curr_row[j] = std::min({prev_row[j] + 1, curr_row[j - 1] + 1, prev_row[j - 1] + cost});
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

auto find_similar_candidates(std::string_view input, const std::vector<std::string>& candidates,
                             size_t max_results, size_t max_distance) -> std::vector<std::string> {
    if (input.empty() || candidates.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    for (const auto& candidate : candidates) {
        if (candidate == input) {
            continue;
        }
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }
        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    });
    scored.erase(std::unique(scored.begin(), scored.end()), scored.end());

    std::vector<std::string> result;
    for (size_t i = 0; i < max_results && i < scored.size(); ++i) {
        result.push_back(scored[i].first);
    }
    return result;
}

auto did_you_mean(const std::vector<std::string>& suggestions) -> std::string {
    if (suggestions.empty()) {
        return "";
    }
    std::string text = "did you mean ";
    for (size_t i = 0; i < suggestions.size(); ++i) {
        if (i > 0) {
            text += i + 1 == suggestions.size() ? " or " : ", ";
        }
        text += "`" + suggestions[i] + "`";
    }
    text += "?";
    return text;
}

} // namespace yuho
