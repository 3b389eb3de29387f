// ============================================================================
// rules.cpp — Rule construction, loading, and the rule-file format
// ============================================================================

#include "pdm/rules.hpp"
#include "pdm/errors.hpp"
#include "pdm/parser.hpp"
#include "pdm/utils.hpp"

#include <array>
#include <sstream>

namespace pdm {

namespace {

constexpr std::array<const char*, 4> kRecordKeys = {"id", "premise", "conclusion", "text"};

bool is_record_key(const std::string& key) {
    for (const char* k : kRecordKeys) {
        if (key == k) return true;
    }
    return false;
}

const std::string& required(const RuleRecord& record, const std::string& key,
                            std::size_t index) {
    auto it = record.find(key);
    if (it == record.end()) {
        auto id = record.find("id");
        std::string who = id != record.end() ? "rule '" + id->second + "'"
                                             : "rule #" + std::to_string(index + 1);
        throw RuleLoadError(who + " is missing required field '" + key + "'");
    }
    return it->second;
}

// ── value escaping ──────────────────────────────────────────────────────────
// '#' starts a comment and a record value lives on one line, so the writer
// escapes '\\', '#', CR and LF and the reader undoes it.

std::string escape_value(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '#':  out += "\\#";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

// Unknown escapes are kept verbatim so hand-written files with a stray
// backslash still load.
std::string unescape_value(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] != '\\' || i + 1 == v.size()) {
            out += v[i];
            continue;
        }
        char e = v[++i];
        switch (e) {
            case '\\': out += '\\'; break;
            case '#':  out += '#';  break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            default:   out += '\\'; out += e; break;
        }
    }
    return out;
}

// Like strip_comment, but a '#' preceded by a backslash is data.
std::string strip_rule_comment(const std::string& line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
        } else if (line[i] == '#') {
            return trim(line.substr(0, i));
        }
    }
    return trim(line);
}

}  // namespace

// ── make_rule ───────────────────────────────────────────────────────────────

Rule make_rule(const std::string& id, const std::string& premise,
               const std::string& conclusion, const std::string& description,
               FormulaFactory& factory) {
    Rule r;
    r.id = id;
    r.premise = parse_formula(premise, factory);
    r.conclusion = parse_formula(conclusion, factory);
    r.description = description;
    return r;
}

// ── RuleBook ────────────────────────────────────────────────────────────────

void RuleBook::add(const std::string& domain, RuleRecord record) {
    auto it = records.find(domain);
    if (it == records.end()) {
        domains.push_back(domain);
        it = records.emplace(domain, std::vector<RuleRecord>{}).first;
    }
    it->second.push_back(std::move(record));
}

// ── load_rules ──────────────────────────────────────────────────────────────
// All keys are checked before any formula is parsed, so a record either
// loads completely or not at all.

RuleList load_rules(const std::vector<RuleRecord>& records, FormulaFactory& factory) {
    RuleList rules;
    rules.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        const RuleRecord& rec = records[i];
        const std::string& id = required(rec, "id", i);
        const std::string& premise = required(rec, "premise", i);
        const std::string& conclusion = required(rec, "conclusion", i);
        const std::string& text = required(rec, "text", i);

        Rule r;
        r.id = id;
        r.description = text;
        try {
            r.premise = parse_formula(premise, factory);
        } catch (const SyntaxError& e) {
            throw RuleLoadError("rule '" + id + "': premise: " + e.what());
        }
        try {
            r.conclusion = parse_formula(conclusion, factory);
        } catch (const SyntaxError& e) {
            throw RuleLoadError("rule '" + id + "': conclusion: " + e.what());
        }
        rules.push_back(std::move(r));
    }
    return rules;
}

RuleList load_rule_set(const RuleBook& book, const std::string& domain,
                       FormulaFactory& factory) {
    auto it = book.records.find(domain);
    if (it == book.records.end()) {
        return {};
    }
    return load_rules(it->second, factory);
}

RuleRecord to_record(const Rule& rule, const FormulaFactory& factory) {
    return RuleRecord{
        {"id", rule.id},
        {"premise", factory.to_string(rule.premise)},
        {"conclusion", factory.to_string(rule.conclusion)},
        {"text", rule.description},
    };
}

AtomSet rule_atoms(const RuleList& rules, const FormulaFactory& factory) {
    AtomSet out;
    for (const auto& r : rules) {
        AtomSet p = r.premise_atoms(factory);
        AtomSet c = r.conclusion_atoms(factory);
        out.insert(p.begin(), p.end());
        out.insert(c.begin(), c.end());
    }
    return out;
}

// ── parse_rule_book ─────────────────────────────────────────────────────────

RuleBook parse_rule_book(const std::vector<std::string>& lines) {
    RuleBook book;
    std::string domain = "default";
    RuleRecord current;
    bool open = false;

    auto flush = [&]() {
        if (open) {
            book.add(domain, std::move(current));
            current.clear();
            open = false;
        }
    };
    auto fail = [](std::size_t line_no, const std::string& msg) {
        throw RuleLoadError("line " + std::to_string(line_no) + ": " + msg);
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::size_t line_no = i + 1;
        std::string content = strip_rule_comment(lines[i]);
        if (content.empty()) continue;

        if (content.front() == '[') {
            if (content.back() != ']') {
                fail(line_no, "unterminated domain header '" + content + "'");
            }
            std::string name = trim(content.substr(1, content.size() - 2));
            if (name.empty()) {
                fail(line_no, "empty domain name");
            }
            flush();
            domain = name;
            if (!book.has_domain(domain)) {
                book.domains.push_back(domain);
                book.records[domain];
            }
            continue;
        }

        auto eq = content.find('=');
        if (eq == std::string::npos) {
            fail(line_no, "expected 'key = value', got '" + content + "'");
        }
        std::string key = trim(content.substr(0, eq));
        std::string value = unescape_value(trim(content.substr(eq + 1)));

        if (!is_record_key(key)) {
            fail(line_no, "unknown key '" + key + "'");
        }
        if (key == "id") {
            flush();
        }
        if (current.count(key) > 0) {
            fail(line_no, "duplicate key '" + key + "'");
        }
        current[key] = value;
        open = true;
    }
    flush();
    return book;
}

RuleBook read_rule_file(const std::string& path) {
    return parse_rule_book(read_lines(path));
}

// ── format_rule_book ────────────────────────────────────────────────────────

std::string format_rule_book(const RuleBook& book) {
    std::ostringstream oss;
    bool first_domain = true;
    for (const auto& domain : book.domains) {
        if (!first_domain) oss << "\n";
        first_domain = false;
        if (domain.empty() || domain.find_first_of("#[]\r\n") != std::string::npos) {
            throw RuleLoadError("domain name '" + domain + "' cannot be written to a rule file");
        }
        oss << "[" << domain << "]\n";

        const auto& records = book.records.at(domain);
        for (std::size_t i = 0; i < records.size(); ++i) {
            if (i > 0) oss << "\n";
            for (const char* key : kRecordKeys) {
                auto it = records[i].find(key);
                if (it == records[i].end()) continue;
                std::string k = key;
                oss << k << std::string(10 - k.size(), ' ') << " = "
                    << escape_value(it->second) << "\n";
            }
        }
    }
    return oss.str();
}

}  // namespace pdm
