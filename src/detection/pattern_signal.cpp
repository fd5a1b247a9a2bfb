#include "detection/pattern_signal.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace ipishield::detection {

namespace {

constexpr std::string_view kEncodedPayloadType = "encoded-payload";

PatternRule Rule(std::string pattern, std::optional<int> severity = std::nullopt,
                 std::string description = "") {
    return PatternRule{std::move(pattern), severity, std::move(description)};
}

bool SeverityInRange(int severity) {
    return severity >= 0 && severity <= 100;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string DecodeHex(std::string_view input) {
    if (input.size() >= 2 && input[0] == '0' && (input[1] == 'x' || input[1] == 'X')) {
        input.remove_prefix(2);
    }
    std::string output;
    output.reserve(input.size() / 2);
    for (size_t i = 0; i + 1 < input.size(); i += 2) {
        const int hi = HexValue(input[i]);
        const int lo = HexValue(input[i + 1]);
        if (hi < 0 || lo < 0) {
            return {};
        }
        output.push_back(static_cast<char>((hi << 4) | lo));
    }
    return output;
}

bool LooksPrintable(std::string_view decoded, double min_ratio) {
    if (decoded.size() < 8) {
        return false;
    }
    size_t printable = 0;
    for (char c : decoded) {
        const auto uc = static_cast<unsigned char>(c);
        if (absl::ascii_isprint(uc) || uc == '\n' || uc == '\r' || uc == '\t') {
            ++printable;
        }
    }
    return static_cast<double>(printable) / static_cast<double>(decoded.size()) >= min_ratio;
}

// Base64 runs must mix letter case or digits to be worth decoding
bool LooksLikeBase64(std::string_view run) {
    bool upper = false;
    bool lower = false;
    bool digit = false;
    for (char c : run) {
        upper |= absl::ascii_isupper(static_cast<unsigned char>(c));
        lower |= absl::ascii_islower(static_cast<unsigned char>(c));
        digit |= absl::ascii_isdigit(static_cast<unsigned char>(c));
    }
    return (upper && lower) || ((upper || lower) && digit);
}

}  // namespace

// ===== Rule table =====

std::vector<PatternCategory> DefaultPatternCategories() {
    std::vector<PatternCategory> categories;

    categories.push_back({"jailbreak", 95, {
        Rule(R"(\bignore\b[^.\n]{0,40}?\b(previous|prior|above|earlier|preceding)\b[^.\n]{0,20}?\b(instructions?|prompts?|rules|directions|context)\b)",
             std::nullopt, "instruction to ignore earlier instructions"),
        Rule(R"(\b(disregard|forget)\b[^.\n]{0,40}?\b(safety|rules?|guidelines?|instructions?|polic(y|ies))\b)",
             std::nullopt, "instruction to drop safety rules"),
        Rule(R"(\bjailbr(oken|eak(ing)?)\b)", 100, "explicit jailbreak"),
        Rule(R"(\bdan\s*mode\b)", 100, "DAN mode"),
        Rule(R"(\bdo anything now\b)", 90, "DAN phrasing"),
        Rule(R"(\bbypass\b[^.\n]{0,30}?\b(safety|content|filters?|restrictions?|guardrails?|moderation)\b)",
             90, "filter bypass"),
        Rule(R"(\b(developer|god)\s*mode\b)", 85, "privileged mode request"),
    }});

    categories.push_back({"role-override", 80, {
        Rule(R"(\byou are now\b)", 80, "identity reassignment"),
        Rule(R"(\bforget (everything|all)\b)", 90, "context wipe"),
        Rule(R"(\bact as\b[^.\n]{0,40}?\bwithout\b)", 80, "unrestricted persona"),
        Rule(R"(\byou are an ai that can\b)", 75, "capability reassignment"),
        Rule(R"(\bpretend (to be|you are|you have)\b[^.\n]{0,40}?\b(no|unrestricted|unfiltered|different)\b)",
             80, "pretend persona"),
        Rule(R"(\bfrom now on,? you\b)", 75, "persistent behaviour change"),
    }});

    categories.push_back({"instruction-hijack", 85, {
        Rule(R"(\bnew instructions?\b)", 75, "replacement instructions"),
        Rule(R"(\boverride\b[^.\n]{0,30}?\b(previous|prior|existing|original)\b)", 85,
             "override of earlier instructions"),
        Rule(R"(\b(admin|system|developer)\s*:?\s*override\b[^.\n]{0,200})", 95,
             "privileged override directive"),
        Rule(R"(\bimportant\s*:\s*ignore\b)", 80, "urgent ignore directive"),
        Rule(R"(<\|im_(start|end)\|>|\[/?inst\]|</?system>)", 85, "chat role delimiter"),
    }});

    categories.push_back({"system-prompt-leak", 85, {
        Rule(R"(\brepeat\b[^.\n]{0,40}?\bsystem prompt\b)", 95, "system prompt extraction"),
        Rule(R"(\b(show|reveal|display|output)\b[^.\n]{0,30}?\b(hidden|system|secret|initial|original)\s+(prompt|instructions)\b)",
             95, "hidden prompt extraction"),
        Rule(R"(\bprint\b[^.\n]{0,30}?\binstructions\b)", 85, "instruction dump"),
    }});

    categories.push_back({"context-manipulation", 70, {
        Rule(R"(\bwhen you (read|see|process) this\b)", std::nullopt, "reader-targeted trigger"),
        Rule(R"(\bif you are (a |an )?(ai|llm|language model|assistant)\b)", std::nullopt,
             "model-targeted condition"),
        Rule(R"(\battention[,:]?\s+(ai|assistant|model|llm)\b)", std::nullopt,
             "model-targeted address"),
    }});

    return categories;
}

absl::StatusOr<std::vector<PatternCategory>> ParsePatternCategories(
    const YAML::Node& root, std::vector<PatternCategory> base) {
    try {
        if (!root || !root.IsMap()) {
            return ConfigurationError("pattern rule table must be a mapping");
        }

        const std::string mode = root["mode"] ? root["mode"].as<std::string>() : "extend";
        if (mode == "replace") {
            base.clear();
        } else if (mode != "extend") {
            return ConfigurationError(absl::StrCat("unknown rule table mode '", mode, "'"));
        }

        const YAML::Node categories = root["categories"];
        if (!categories || !categories.IsMap()) {
            return ConfigurationError("pattern rule table needs a 'categories' mapping");
        }

        for (const auto& kv : categories) {
            PatternCategory category;
            category.name = kv.first.as<std::string>();
            const YAML::Node& body = kv.second;
            if (!body.IsMap()) {
                return ConfigurationError(
                    absl::StrCat("category '", category.name, "' must be a mapping"));
            }
            category.severity = body["severity"] ? body["severity"].as<int>() : 50;

            const YAML::Node rules = body["rules"];
            if (!rules || !rules.IsSequence() || rules.size() == 0) {
                return ConfigurationError(
                    absl::StrCat("category '", category.name, "' has no rules"));
            }
            for (const auto& item : rules) {
                PatternRule rule;
                if (item.IsScalar()) {
                    rule.pattern = item.as<std::string>();
                } else if (item.IsMap() && item["pattern"]) {
                    rule.pattern = item["pattern"].as<std::string>();
                    if (item["severity"]) {
                        rule.severity = item["severity"].as<int>();
                    }
                    if (item["description"]) {
                        rule.description = item["description"].as<std::string>();
                    }
                } else {
                    return ConfigurationError(absl::StrCat(
                        "category '", category.name, "' has a rule without a pattern"));
                }
                category.rules.push_back(std::move(rule));
            }

            // Extending an existing category appends its rules
            auto existing = std::find_if(base.begin(), base.end(),
                [&](const PatternCategory& c) { return c.name == category.name; });
            if (existing != base.end()) {
                if (body["severity"]) {
                    existing->severity = category.severity;
                }
                for (auto& rule : category.rules) {
                    existing->rules.push_back(std::move(rule));
                }
            } else {
                base.push_back(std::move(category));
            }
        }
        return base;
    } catch (const YAML::Exception& e) {
        return ConfigurationError(absl::StrCat("malformed pattern rule table: ", e.what()));
    }
}

absl::StatusOr<std::vector<PatternCategory>> LoadPatternCategories(
    const std::filesystem::path& path, std::vector<PatternCategory> base) {
    if (!std::filesystem::exists(path)) {
        return ConfigurationError(absl::StrCat("pattern rule file not found: ", path.string()));
    }
    try {
        return ParsePatternCategories(YAML::LoadFile(path.string()), std::move(base));
    } catch (const YAML::Exception& e) {
        return ConfigurationError(
            absl::StrCat("failed to parse pattern rule file ", path.string(), ": ", e.what()));
    }
}

// ===== PatternSignal =====

absl::StatusOr<std::unique_ptr<PatternSignal>> PatternSignal::Create(PatternSignalConfig config) {
    std::vector<CompiledRule> rules;

    for (const auto& category : config.categories) {
        if (category.name.empty()) {
            return ConfigurationError("pattern category without a name");
        }
        if (!SeverityInRange(category.severity)) {
            return ConfigurationError(absl::StrCat(
                "category '", category.name, "' severity ", category.severity,
                " is outside [0, 100]"));
        }
        for (const auto& rule : category.rules) {
            const int severity = rule.severity.value_or(category.severity);
            if (!SeverityInRange(severity)) {
                return ConfigurationError(absl::StrCat(
                    "rule '", rule.pattern, "' severity ", severity, " is outside [0, 100]"));
            }
            try {
                rules.push_back(CompiledRule{
                    category.name, severity, rule.description,
                    std::regex(rule.pattern,
                               std::regex::ECMAScript | std::regex::icase | std::regex::optimize)});
            } catch (const std::regex_error& e) {
                return ConfigurationError(absl::StrCat(
                    "invalid regex in category '", category.name, "': '", rule.pattern,
                    "': ", e.what()));
            }
        }
    }

    if (config.min_base64_run == 0 || config.min_hex_run == 0) {
        return ConfigurationError("encoded payload run lengths must be positive");
    }

    IPISHIELD_LOG_DEBUG("Pattern signal compiled {} rules in {} categories",
                        rules.size(), config.categories.size());
    return std::unique_ptr<PatternSignal>(new PatternSignal(std::move(config), std::move(rules)));
}

PatternSignal::PatternSignal(PatternSignalConfig config, std::vector<CompiledRule> rules)
    : config_(std::move(config)), rules_(std::move(rules)) {}

absl::StatusOr<std::vector<PatternMatch>> PatternSignal::Match(const NormalizedText& text) const {
    std::vector<PatternMatch> matches;
    try {
        for (const auto& rule : rules_) {
            auto begin = std::sregex_iterator(text.text.begin(), text.text.end(), rule.regex);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const auto& m = *it;
                if (m.length() == 0) {
                    continue;
                }
                const size_t start = static_cast<size_t>(m.position());
                const size_t stop = start + static_cast<size_t>(m.length());
                // A placeholder inside the match does not hide it; only the
                // text around the placeholder is reported
                for (const auto& [piece_begin, piece_end] : text.UnmaskedPieces(start, stop)) {
                    matches.push_back({rule.category, rule.severity, piece_begin, piece_end});
                }
            }
        }
    } catch (const std::regex_error& e) {
        return MakeError(ErrorCode::kSignalFailure,
                         absl::StrCat("pattern matching failed: ", e.what()));
    }
    return matches;
}

absl::StatusOr<SignalResult> PatternSignal::Analyze(const SignalInput& input) const {
    SignalResult result;
    result.signal_name = Name();
    result.available = true;

    IPISHIELD_ASSIGN_OR_RETURN(auto matches, Match(input.normalized));

    int best = 0;
    for (const auto& match : matches) {
        auto [begin, end] = input.normalized.ToOriginal(match.begin, match.end);
        if (begin >= end) {
            continue;
        }

        FlaggedSegment segment;
        segment.text = input.content.substr(begin, end - begin);
        segment.begin = begin;
        segment.end = end;
        segment.pattern_type = match.category;
        segment.confidence = match.severity / 100.0;
        segment.reason = absl::StrCat("matched ", match.category, " rule");
        result.segments.push_back(std::move(segment));

        best = std::max(best, match.severity);
    }

    if (config_.detect_encoded_payloads) {
        IPISHIELD_ASSIGN_OR_RETURN(auto encoded, DetectEncodedPayloads(input.content));
        for (auto& segment : encoded) {
            best = std::max(best, static_cast<int>(segment.confidence * 100.0 + 0.5));
            result.segments.push_back(std::move(segment));
        }
    }

    result.score = std::min(best, 100);
    return result;
}

absl::StatusOr<std::vector<FlaggedSegment>> PatternSignal::DetectEncodedPayloads(
    const std::string& content) const {
    std::vector<FlaggedSegment> segments;

    struct Candidate {
        size_t begin;
        size_t end;
        std::string decoded;
        std::string_view encoding;
    };
    std::vector<Candidate> candidates;

    // Scan for maximal runs of base64 / hex alphabet characters
    auto is_b64 = [](char c) {
        return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    };
    size_t i = 0;
    while (i < content.size()) {
        if (!is_b64(content[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        bool all_hex = true;
        while (j < content.size() && is_b64(content[j])) {
            all_hex &= absl::ascii_isxdigit(static_cast<unsigned char>(content[j])) != 0;
            ++j;
        }
        size_t run_end = j;
        while (run_end < content.size() && run_end - j < 2 && content[run_end] == '=') {
            ++run_end;
        }

        const std::string_view run(content.data() + i, j - i);
        if (all_hex && run.size() >= config_.min_hex_run && run.size() % 2 == 0) {
            candidates.push_back({i, run_end, DecodeHex(run), "hex"});
        } else if (run.size() >= config_.min_base64_run && LooksLikeBase64(run)) {
            std::string decoded;
            if (absl::Base64Unescape(std::string(content.data() + i, run_end - i),
                                     &decoded)) {
                candidates.push_back({i, run_end, std::move(decoded), "base64"});
            }
        }
        i = run_end;
    }

    for (const auto& candidate : candidates) {
        if (!LooksPrintable(candidate.decoded, config_.min_printable_ratio)) {
            continue;
        }
        const NormalizedText decoded = Normalize(candidate.decoded);
        IPISHIELD_ASSIGN_OR_RETURN(auto matches, Match(decoded));
        if (matches.empty()) {
            continue;
        }
        auto top = std::max_element(matches.begin(), matches.end(),
            [](const PatternMatch& a, const PatternMatch& b) { return a.severity < b.severity; });

        FlaggedSegment segment;
        segment.text = content.substr(candidate.begin, candidate.end - candidate.begin);
        segment.begin = candidate.begin;
        segment.end = candidate.end;
        segment.pattern_type = std::string(kEncodedPayloadType);
        segment.confidence = top->severity / 100.0;
        segment.reason = absl::StrCat(std::string(candidate.encoding), " payload decodes to ",
                                      top->category, " instruction");
        segments.push_back(std::move(segment));
    }

    return segments;
}

}  // namespace ipishield::detection
