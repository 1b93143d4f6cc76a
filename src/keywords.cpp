#include "mailjmap/keywords.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_utils.hpp"

bool operator==(const KeywordFlags & a, const KeywordFlags & b) {
    return a.isSeen == b.isSeen && a.isFlagged == b.isFlagged && a.isAnswered == b.isAnswered && a.isDraft == b.isDraft;
}

bool operator!=(const KeywordFlags & a, const KeywordFlags & b) {
    return !(a == b);
}

std::string Keywords::normalizeKeywordName(std::string keyword) {
    return MailUtils::toLower(keyword);
}

bool Keywords::isValidCustomKeyword(std::string keyword) {
    if (keyword.size() == 0 || keyword.size() > JMAP_MAX_KEYWORD_LENGTH) {
        return false;
    }
    for (char c : keyword) {
        if (c < 0x21 || c > 0x7e) {
            return false;
        }
        if (c == '(' || c == ')' || c == '{' || c == ']' || c == '%' || c == '*' || c == '"' || c == '\\') {
            return false;
        }
    }
    return true;
}

KeywordFlags Keywords::applyOne(std::string keyword, bool value, KeywordFlags base, std::map<std::string, bool> & custom) {
    std::string normalized = normalizeKeywordName(keyword);

    if (normalized == "$seen" || normalized == "\\seen") {
        base.isSeen = value;
    } else if (normalized == "$flagged" || normalized == "\\flagged") {
        base.isFlagged = value;
    } else if (normalized == "$answered" || normalized == "\\answered") {
        base.isAnswered = value;
    } else if (normalized == "$draft" || normalized == "\\draft") {
        base.isDraft = value;
    } else {
        if (!isValidCustomKeyword(normalized)) {
            throw JMAPError("invalidProperties", "Invalid keyword: " + keyword, {"keywords"});
        }
        custom[normalized] = value;
    }
    return base;
}

KeywordFlags Keywords::split(const nlohmann::json & patch, KeywordFlags base, std::map<std::string, bool> & custom) {
    if (patch.is_null()) {
        return base;
    }
    if (!patch.is_object()) {
        throw JMAPError("invalidProperties", "keywords must be an object", {"keywords"});
    }
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (!it.value().is_boolean()) {
            throw JMAPError("invalidProperties", "keywords values must be booleans", {"keywords"});
        }
        base = applyOne(it.key(), it.value().get<bool>(), base, custom);
    }
    return base;
}

nlohmann::json Keywords::toJMAP(KeywordFlags flags, const std::vector<std::string> & custom) {
    nlohmann::json keywords = nlohmann::json::object();
    if (flags.isSeen) keywords["$seen"] = true;
    if (flags.isFlagged) keywords["$flagged"] = true;
    if (flags.isAnswered) keywords["$answered"] = true;
    if (flags.isDraft) keywords["$draft"] = true;
    for (const auto & kw : custom) {
        keywords[kw] = true;
    }
    return keywords;
}
