#include "analytics/sql_normalizer.h"

#include <absl/strings/match.h>

namespace pglogstats::analytics {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentChar(char c) { return IsIdentStart(c) || IsDigit(c) || c == '$'; }

/// Skip a single-quoted literal starting at the opening quote
size_t SkipStringLiteral(std::string_view sql, size_t quote, bool backslash_escapes) {
    size_t i = quote + 1;
    while (i < sql.size()) {
        const char c = sql[i];
        if (backslash_escapes && c == '\\') {
            i += 2;
            continue;
        }
        if (c == '\'') {
            if (i + 1 < sql.size() && sql[i + 1] == '\'') {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

/// Skip digits, an optional fraction and an optional exponent
size_t SkipNumber(std::string_view sql, size_t start) {
    size_t i = start;
    while (i < sql.size() && IsDigit(sql[i])) ++i;
    if (i < sql.size() && sql[i] == '.') {
        ++i;
        while (i < sql.size() && IsDigit(sql[i])) ++i;
    }
    if (i < sql.size() && (sql[i] == 'e' || sql[i] == 'E')) {
        size_t exp = i + 1;
        if (exp < sql.size() && (sql[exp] == '+' || sql[exp] == '-')) ++exp;
        if (exp < sql.size() && IsDigit(sql[exp])) {
            i = exp;
            while (i < sql.size() && IsDigit(sql[i])) ++i;
        }
    }
    return i;
}

}  // namespace

std::string_view QueryTypeToString(QueryType type) {
    switch (type) {
        case QueryType::kSelect: return "SELECT";
        case QueryType::kInsert: return "INSERT";
        case QueryType::kUpdate: return "UPDATE";
        case QueryType::kDelete: return "DELETE";
        case QueryType::kDdl:    return "DDL";
        case QueryType::kOther:  return "OTHER";
    }
    return "OTHER";
}

QueryType ClassifyQuery(std::string_view sql) {
    size_t begin = 0;
    while (begin < sql.size() && IsSpace(sql[begin])) ++begin;
    size_t end = begin;
    while (end < sql.size() && IsIdentStart(sql[end])) ++end;

    const std::string_view keyword = sql.substr(begin, end - begin);

    if (absl::EqualsIgnoreCase(keyword, "SELECT")) return QueryType::kSelect;
    if (absl::EqualsIgnoreCase(keyword, "INSERT")) return QueryType::kInsert;
    if (absl::EqualsIgnoreCase(keyword, "UPDATE")) return QueryType::kUpdate;
    if (absl::EqualsIgnoreCase(keyword, "DELETE")) return QueryType::kDelete;
    if (absl::EqualsIgnoreCase(keyword, "CREATE") ||
        absl::EqualsIgnoreCase(keyword, "ALTER") ||
        absl::EqualsIgnoreCase(keyword, "DROP") ||
        absl::EqualsIgnoreCase(keyword, "TRUNCATE")) {
        return QueryType::kDdl;
    }
    return QueryType::kOther;
}

std::string NormalizeQuery(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    bool pending_space = false;
    auto emit = [&](std::string_view token) {
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        out.append(token.data(), token.size());
    };

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        if (IsSpace(c)) {
            pending_space = true;
            ++i;
            continue;
        }

        if (c == '"') {
            size_t end = i + 1;
            while (end < sql.size()) {
                if (sql[end] == '"') {
                    if (end + 1 < sql.size() && sql[end + 1] == '"') {
                        end += 2;
                        continue;
                    }
                    ++end;
                    break;
                }
                ++end;
            }
            emit(sql.substr(i, end - i));
            i = end;
            continue;
        }

        if (c == '\'') {
            emit("S");
            i = SkipStringLiteral(sql, i, false);
            continue;
        }

        if (IsIdentStart(c)) {
            if ((c == 'E' || c == 'e') && i + 1 < sql.size() && sql[i + 1] == '\'') {
                emit("S");
                i = SkipStringLiteral(sql, i + 1, true);
                continue;
            }
            size_t end = i + 1;
            while (end < sql.size() && IsIdentChar(sql[end])) ++end;
            emit(sql.substr(i, end - i));
            i = end;
            continue;
        }

        if (c == '$' && i + 1 < sql.size() && IsDigit(sql[i + 1])) {
            size_t end = i + 1;
            while (end < sql.size() && IsDigit(sql[end])) ++end;
            emit("?");
            i = end;
            continue;
        }

        const bool leading_dot = c == '.' && i + 1 < sql.size() && IsDigit(sql[i + 1]) &&
                                 (i == 0 || !(IsIdentChar(sql[i - 1]) || sql[i - 1] == '"' ||
                                              sql[i - 1] == ')'));
        if (IsDigit(c) || leading_dot) {
            emit("N");
            i = SkipNumber(sql, leading_dot ? i + 1 : i);
            continue;
        }

        emit(sql.substr(i, 1));
        ++i;
    }

    return out;
}

}  // namespace pglogstats::analytics
